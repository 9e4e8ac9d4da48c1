/**
 * @file quality_metrics.hpp
 * @brief Perceptual comparison of a candidate frame against its reference.
 *
 * Every function requires two grids of identical width and height and
 * throws DimensionMismatchError otherwise. A mismatch is a precondition
 * failure, never a score of zero.
 */

#ifndef ANVIL_QUALITY_METRICS_HPP
#define ANVIL_QUALITY_METRICS_HPP

#include "pixel_grid.hpp"
#include <cstddef>

namespace anvil {

/**
 * @brief The four similarity/difference scores of one comparison.
 */
struct QualityMetrics {
    double ssim = 0.0;             ///< Structural similarity, [0, 1]
    double psnr = 0.0;             ///< Peak signal-to-noise ratio in dB, >= 0 or +inf
    double delta_e = 0.0;          ///< Mean CIE76 colour difference, >= 0
    double edge_preservation = 0.0;///< Share of edge pixels kept, [0, 1]
};

/// Block edge used by compute_ssim().
inline constexpr std::size_t kSsimBlockSize = 8;
/// (0.01 * 255)^2
inline constexpr double kSsimC1 = 6.5025;
/// (0.03 * 255)^2
inline constexpr double kSsimC2 = 58.5225;
/// Every n-th pixel is sampled by compute_delta_e().
inline constexpr std::size_t kDeltaESamplingStride = 100;
/// Normalized Sobel magnitude above which a pixel counts as an edge.
inline constexpr double kEdgeThreshold = 0.1;

/**
 * @brief Block SSIM over BT.601 luma.
 *
 * Non-overlapping 8x8 blocks; blocks that do not fit entirely inside the
 * image are dropped. An image with no complete block is scored as one
 * block spanning the whole image. The mean is clamped to [0, 1].
 */
[[nodiscard]] double compute_ssim(const PixelGrid& reference, const PixelGrid& candidate);

/**
 * @brief PSNR over the R, G and B channels; +infinity for identical images.
 */
[[nodiscard]] double compute_psnr(const PixelGrid& reference, const PixelGrid& candidate);

/**
 * @brief Mean colour difference in CIE L*a*b* (D65).
 *
 * This is the Euclidean CIE76 distance on sampled pixels, an
 * approximation of CIEDE2000; the acceptance thresholds are calibrated
 * against this approximation.
 *
 * @param stride Sample every stride-th pixel (0 is treated as 1).
 */
[[nodiscard]] double compute_delta_e(const PixelGrid& reference, const PixelGrid& candidate,
                                     std::size_t stride = kDeltaESamplingStride);

/**
 * @brief Fraction of edge pixels whose Sobel magnitude is preserved.
 *
 * A pixel is an edge if either image's magnitude/255 exceeds 0.1; it is
 * preserved if the two magnitudes differ by less than 0.1. Returns 1
 * when neither image has an edge.
 */
[[nodiscard]] double compute_edge_preservation(const PixelGrid& reference, const PixelGrid& candidate);

/**
 * @brief Runs all four metrics.
 * @throws DimensionMismatchError if the grids differ in geometry.
 */
[[nodiscard]] QualityMetrics compute_quality_metrics(const PixelGrid& reference, const PixelGrid& candidate);

/**
 * @brief sRGB (8-bit) to CIE L*a*b* under D65.
 */
struct Lab {
    double l = 0.0;
    double a = 0.0;
    double b = 0.0;
};

[[nodiscard]] Lab srgb_to_lab(uint8_t r, uint8_t g, uint8_t b) noexcept;

} // namespace anvil

#endif // ANVIL_QUALITY_METRICS_HPP
