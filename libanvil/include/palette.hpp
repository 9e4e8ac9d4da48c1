/**
 * @file palette.hpp
 * @brief Palette generation and palette mapping for the palette-use filter,
 * both delegated to libimagequant.
 */

#ifndef ANVIL_PALETTE_HPP
#define ANVIL_PALETTE_HPP

#include "encoding_config.hpp"
#include "pixel_grid.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace anvil {

using PaletteColor = std::array<uint8_t, 3>;

/**
 * @brief Up to 256 opaque RGB colors.
 */
struct Palette {
    std::vector<PaletteColor> colors;
};

/// Pixels at or below this alpha are transparent: not counted, not remapped.
inline constexpr uint8_t kPaletteAlphaThreshold = 127;

/**
 * @brief Quantizes the colors of a frame sequence.
 *
 * The opaque pixels of all frames are fed to one libimagequant histogram.
 *
 * @param frames Frames whose pixels are counted.
 * @param max_colors 1..256.
 * @param diff_stats Count only pixels that differ from the previous frame
 *        (all pixels of the first frame are counted).
 * @throws CodecError if libimagequant rejects the histogram.
 */
[[nodiscard]] Palette generate_palette(std::span<const DecodedFrame> frames,
                                       uint32_t max_colors = 256,
                                       bool diff_stats = true);

/**
 * @brief Stores a palette as a 16x16 PNG, one pixel per entry.
 * Unused cells repeat the last color.
 * @throws CodecError if the palette is empty.
 */
[[nodiscard]] std::vector<uint8_t> encode_palette_png(const Palette& palette);

/**
 * @brief Reads a palette image back; distinct colors in raster order.
 * @throws DecodeError on malformed input.
 */
[[nodiscard]] Palette decode_palette_png(std::span<const uint8_t> data);

/**
 * @brief libimagequant dithering level for a dither setting.
 *
 * None is 0 and FloydSteinberg is 1. libimagequant has no ordered dither,
 * so Bayer maps to a partial level that weakens as @p bayer_scale (0..5)
 * grows, like the amplitude of ffmpeg's Bayer matrix.
 */
[[nodiscard]] float dithering_level(DitherMethod dither, int bayer_scale) noexcept;

/**
 * @brief Remaps every opaque pixel of @p grid onto the palette.
 * @throws CodecError if libimagequant fails.
 */
void apply_palette(PixelGrid& grid, const Palette& palette, DitherMethod dither, int bayer_scale = 2);

} // namespace anvil

#endif // ANVIL_PALETTE_HPP
