#include "../libanvil/include/quality_metrics.hpp"
#include "../libanvil/include/errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace anvil;
using namespace anvil::test;

TEST(QualityMetrics, IdenticalGridsArePerfect) {
    const auto grid = pattern_grid(64, 48);
    const auto m = compute_quality_metrics(grid, grid);
    EXPECT_DOUBLE_EQ(m.ssim, 1.0);
    EXPECT_TRUE(std::isinf(m.psnr));
    EXPECT_GT(m.psnr, 0.0);
    EXPECT_DOUBLE_EQ(m.delta_e, 0.0);
    EXPECT_DOUBLE_EQ(m.edge_preservation, 1.0);
}

TEST(QualityMetrics, IdenticalSolidGridsArePerfect) {
    // no edges at all: edge preservation is still 1
    const auto grid = solid_grid(20, 20, 10, 200, 30);
    const auto m = compute_quality_metrics(grid, grid);
    EXPECT_DOUBLE_EQ(m.ssim, 1.0);
    EXPECT_DOUBLE_EQ(m.edge_preservation, 1.0);
}

TEST(QualityMetrics, DimensionMismatchThrows) {
    const auto a = solid_grid(10, 10, 0, 0, 0);
    const auto b = solid_grid(10, 11, 0, 0, 0);
    EXPECT_THROW((void)compute_ssim(a, b), DimensionMismatchError);
    EXPECT_THROW((void)compute_psnr(a, b), DimensionMismatchError);
    EXPECT_THROW((void)compute_delta_e(a, b), DimensionMismatchError);
    EXPECT_THROW((void)compute_edge_preservation(a, b), DimensionMismatchError);
}

TEST(QualityMetrics, InconsistentBufferThrows) {
    auto a = solid_grid(10, 10, 0, 0, 0);
    auto b = a;
    b.rgba.pop_back();
    EXPECT_THROW((void)compute_quality_metrics(a, b), DimensionMismatchError);
}

TEST(QualityMetrics, ValuesStayInRangeForDifferentImages) {
    const auto ref = pattern_grid(64, 64);
    const auto black = solid_grid(64, 64, 0, 0, 0);
    const auto m = compute_quality_metrics(ref, black);
    EXPECT_GE(m.ssim, 0.0);
    EXPECT_LE(m.ssim, 1.0);
    EXPECT_GE(m.psnr, 0.0);
    EXPECT_FALSE(std::isinf(m.psnr));
    EXPECT_GT(m.delta_e, 0.0);
    EXPECT_GE(m.edge_preservation, 0.0);
    EXPECT_LE(m.edge_preservation, 1.0);
    EXPECT_LT(m.edge_preservation, 0.5);
}

TEST(QualityMetrics, LargerDistortionScoresWorse) {
    const auto ref = pattern_grid(64, 64);
    const auto mild = compute_quality_metrics(ref, perturbed(ref, 2));
    const auto heavy = compute_quality_metrics(ref, perturbed(ref, 20));
    EXPECT_GT(mild.ssim, heavy.ssim);
    EXPECT_GT(mild.psnr, heavy.psnr);
    EXPECT_LT(mild.delta_e, heavy.delta_e);
}

TEST(QualityMetrics, PsnrOfUniformOffset) {
    // every channel off by 10: MSE = 100, PSNR = 10 log10(255^2 / 100)
    const auto a = solid_grid(16, 16, 100, 100, 100);
    const auto b = solid_grid(16, 16, 110, 110, 110);
    EXPECT_NEAR(compute_psnr(a, b), 10.0 * std::log10(255.0 * 255.0 / 100.0), 1e-9);
}

TEST(QualityMetrics, DeltaEIsZeroForIdenticalFramesAtAnyStride) {
    const auto grid = pattern_grid(37, 23);
    for (const std::size_t stride : {1u, 2u, 7u, 100u, 5000u}) {
        EXPECT_EQ(compute_delta_e(grid, grid, stride), 0.0) << "stride " << stride;
    }
}

TEST(QualityMetrics, SsimHandlesGridsSmallerThanABlock) {
    const auto a = pattern_grid(5, 3);
    EXPECT_DOUBLE_EQ(compute_ssim(a, a), 1.0);
    const auto b = solid_grid(5, 3, 255, 255, 255);
    const double s = compute_ssim(a, b);
    EXPECT_GE(s, 0.0);
    EXPECT_LT(s, 1.0);
}

TEST(QualityMetrics, LabOfWhiteAndBlack) {
    const Lab white = srgb_to_lab(255, 255, 255);
    EXPECT_NEAR(white.l, 100.0, 0.05);
    EXPECT_NEAR(white.a, 0.0, 0.05);
    EXPECT_NEAR(white.b, 0.0, 0.05);

    const Lab black = srgb_to_lab(0, 0, 0);
    EXPECT_NEAR(black.l, 0.0, 1e-9);
}
