/**
 * @file frame_filters.hpp
 * @brief Pixel-level implementations of the filter steps.
 *
 * Each function works on fully composited frames; all frames of a sequence
 * share the same geometry.
 */

#ifndef ANVIL_FRAME_FILTERS_HPP
#define ANVIL_FRAME_FILTERS_HPP

#include "encoding_config.hpp"
#include "pixel_grid.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace anvil {

/// mpdecimate defaults: 8x8 block SAD limits and the tolerated fraction.
inline constexpr int kDecimateHi = 64 * 12;
inline constexpr int kDecimateLo = 64 * 5;
inline constexpr double kDecimateFrac = 0.33;

/**
 * @brief Smooths a frame with a 3x3 box filter.
 * @param strength 0..100, blend factor between the original and the blur.
 */
void denoise(PixelGrid& grid, int strength);

/**
 * @brief Keeps only the listed frames.
 *
 * A dropped frame's delay is added to the closest kept frame before it,
 * so the animation's total duration does not change. Indices past the
 * end are ignored.
 */
[[nodiscard]] std::vector<DecodedFrame> select_frames(std::vector<DecodedFrame> frames,
                                                      std::span<const uint32_t> keep);

/**
 * @brief Drops frames that barely differ from the last kept one.
 *
 * A frame is dropped when no 8x8 block differs by more than kDecimateHi
 * (sum of absolute differences) and at most kDecimateFrac of the blocks
 * differ by more than kDecimateLo.
 */
[[nodiscard]] std::vector<DecodedFrame> decimate(std::vector<DecodedFrame> frames);

/**
 * @brief Resamples the timeline to a constant rate.
 *
 * Output ticks that show the same source frame are merged into one frame
 * whose delay covers them all.
 */
[[nodiscard]] std::vector<DecodedFrame> retime(const std::vector<DecodedFrame>& frames, double fps);

/**
 * @brief Resizes to @p width, height following the aspect ratio, with libswscale.
 * Returns an unchanged copy when the width already matches.
 * @throws CodecError on an empty source or target, or if swscale fails.
 */
[[nodiscard]] PixelGrid scale(const PixelGrid& grid, uint32_t width, ScaleFilter filter);

/**
 * @brief Makes every pixel opaque (yuv420p has no alpha plane).
 */
void flatten_alpha(PixelGrid& grid) noexcept;

} // namespace anvil

#endif // ANVIL_FRAME_FILTERS_HPP
