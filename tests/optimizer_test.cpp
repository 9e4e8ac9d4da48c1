#include "../libanvil/include/optimizer.hpp"
#include "../libanvil/include/errors.hpp"
#include "../libanvil/include/events.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace anvil;
using namespace anvil::test;

class OptimizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        decoder.reference = pattern_grid(64, 48);
        for (int i = 0; i < 5; ++i) {
            decoder.source_frames.emplace_back(DecodedFrame{decoder.reference, 100});
        }
        gif = make_gif(64, 48, 5);
        options.threads = 2;
    }

    FakeCodec codec;
    FakeDecoder decoder;
    OptimizerOptions options;
    std::vector<uint8_t> gif;
};

TEST_F(OptimizerTest, QualityModeProducesAQualifiedWinner) {
    Optimizer optimizer(codec, decoder, options);
    const auto result = optimizer.optimize(gif, OptimizationMode::QualityPreserving);

    EXPECT_FALSE(result.buffer.empty());
    EXPECT_FALSE(result.fallback);
    EXPECT_EQ(result.configurations, 9u);
    EXPECT_EQ(result.evaluations.size(), result.configurations);
    EXPECT_EQ(result.metadata.frame_count, 5u);
    EXPECT_EQ(result.metadata.width, 64u);
    EXPECT_GE(result.metrics.ssim, kRelaxedSsimThreshold);

    const auto winner = std::ranges::find_if(result.evaluations, [&result](const CandidateEvaluation& e) {
        return e.index == result.winner_index;
    });
    ASSERT_NE(winner, result.evaluations.end());
    EXPECT_TRUE(winner->qualified);
    for (const auto& e : result.evaluations) {
        if (e.qualified) EXPECT_LE(e.score, winner->score);
    }

    EXPECT_NEAR(result.stats.compressed_size_kb, static_cast<double>(result.buffer.size()) / 1024.0, 1e-9);
    EXPECT_EQ(codec.buffer_count(), 0u);
}

TEST_F(OptimizerTest, SizeModeUsesPalettes) {
    Optimizer optimizer(codec, decoder, options);
    const auto result = optimizer.optimize(gif, OptimizationMode::SizePreserving);

    EXPECT_EQ(result.configurations, kSizeModeCap);
    EXPECT_TRUE(result.config.use_palette);
    bool generated_palette = false;
    for (const auto& inv : codec.invocations()) {
        if (inv.params.format == OutputFormat::PalettePng) generated_palette = true;
    }
    EXPECT_TRUE(generated_palette);
    EXPECT_EQ(codec.buffer_count(), 0u);
}

TEST_F(OptimizerTest, DuplicateFramesEnableFrameReduction) {
    Optimizer optimizer(codec, decoder, options);
    const auto result = optimizer.optimize(gif, OptimizationMode::QualityPreserving);

    ASSERT_TRUE(result.dedup.has_value());
    EXPECT_EQ(result.dedup->frames_to_keep, std::vector<uint32_t>{0});
    EXPECT_EQ(result.dedup->duplicate_frames, 4u);
    EXPECT_TRUE(result.config.remove_duplicates);
    EXPECT_TRUE(result.config.delta_encoding);
}

TEST_F(OptimizerTest, DedupCanBeDisabled) {
    options.enable_dedup = false;
    Optimizer optimizer(codec, decoder, options);
    const auto result = optimizer.optimize(gif, OptimizationMode::QualityPreserving);
    EXPECT_FALSE(result.dedup.has_value());
    EXPECT_FALSE(result.config.remove_duplicates);
}

TEST_F(OptimizerTest, RejectsNonGifInput) {
    Optimizer optimizer(codec, decoder, options);
    const auto png = make_png_header(64, 48, 6);
    EXPECT_THROW((void)optimizer.optimize(png, OptimizationMode::QualityPreserving), InputError);
    EXPECT_THROW((void)optimizer.optimize(std::span<const uint8_t>{}, OptimizationMode::QualityPreserving),
                 InputError);
    EXPECT_EQ(codec.runs(), 0u);
    EXPECT_EQ(codec.buffer_count(), 0u);
}

TEST_F(OptimizerTest, NoEncodableConfiguration) {
    for (std::size_t i = 0; i < kMaxCandidates; ++i) codec.failing.insert(i);
    Optimizer optimizer(codec, decoder, options);
    EXPECT_THROW((void)optimizer.optimize(gif, OptimizationMode::QualityPreserving), OptimizationFailed);
    EXPECT_EQ(codec.buffer_count(), 0u);
}

TEST_F(OptimizerTest, FallbackWhenEveryCandidateIsPoor) {
    // only the two optimized-lossy configurations reach the codec, and q92 cannot be decoded
    for (std::size_t i = 0; i < 7; ++i) codec.failing.insert(i);
    decoder.undecodable_qualities = {92};
    // on a flat reference the q85 noise pulls SSIM far below every threshold
    decoder.reference = solid_grid(64, 48, 128, 128, 128);

    Optimizer optimizer(codec, decoder, options);
    const auto result = optimizer.optimize(gif, OptimizationMode::QualityPreserving);
    EXPECT_TRUE(result.fallback);
    EXPECT_EQ(result.winner_index, 8u);
    EXPECT_EQ(result.config.quality, 85);
    ASSERT_EQ(result.evaluations.size(), 2u);
    EXPECT_EQ(codec.buffer_count(), 0u);
}

TEST_F(OptimizerTest, StopDuringEncodingCancels) {
    Optimizer optimizer(codec, decoder, options);
    EventBus bus;
    bus.subscribe<ProgressEvent>([&optimizer](const ProgressEvent& e) {
        if (e.phase == ProgressPhase::Encoding) optimizer.request_stop();
    });
    EXPECT_THROW((void)optimizer.optimize(gif, OptimizationMode::QualityPreserving, &bus), OptimizationCancelled);
    EXPECT_EQ(codec.buffer_count(), 0u);

    // the next run starts with a fresh stop state
    const auto result = optimizer.optimize(gif, OptimizationMode::QualityPreserving);
    EXPECT_FALSE(result.buffer.empty());
}

TEST_F(OptimizerTest, StopRequestedBeforeTheRunIsNotLost) {
    Optimizer optimizer(codec, decoder, options);
    optimizer.request_stop();
    EXPECT_THROW((void)optimizer.optimize(gif, OptimizationMode::QualityPreserving), OptimizationCancelled);
    EXPECT_EQ(codec.runs(), 0u);
    EXPECT_EQ(codec.buffer_count(), 0u);

    // the request is consumed by the run it cancelled
    const auto result = optimizer.optimize(gif, OptimizationMode::QualityPreserving);
    EXPECT_FALSE(result.buffer.empty());
}

TEST_F(OptimizerTest, ReportsCompletion) {
    Optimizer optimizer(codec, decoder, options);
    EventBus bus;
    std::optional<OptimizationCompleteEvent> complete;
    double last_percent = -1.0;
    bus.subscribe<OptimizationCompleteEvent>([&complete](const OptimizationCompleteEvent& e) { complete = e; });
    bus.subscribe<ProgressEvent>([&last_percent](const ProgressEvent& e) { last_percent = e.percent; });

    const auto result = optimizer.optimize(gif, OptimizationMode::QualityPreserving, &bus);
    ASSERT_TRUE(complete.has_value());
    EXPECT_EQ(complete->winner_index, result.winner_index);
    EXPECT_EQ(complete->original_size, gif.size());
    EXPECT_EQ(complete->new_size, result.buffer.size());
    EXPECT_DOUBLE_EQ(last_percent, 100.0);
}
