#ifndef ANVIL_PNG_IO_HPP
#define ANVIL_PNG_IO_HPP

#include "pixel_grid.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace anvil {

/**
 * @brief Encodes a grid as an 8-bit PNG held in memory.
 *
 * Opaque grids are written as RGB (color type 2), grids with any
 * transparency as RGBA (color type 6).
 *
 * @throws CodecError on libpng failure.
 */
[[nodiscard]] std::vector<uint8_t> encode_png(const PixelGrid& grid);

/**
 * @brief Decodes any PNG into 8-bit RGBA.
 * @throws DecodeError on malformed input.
 */
[[nodiscard]] PixelGrid decode_png(std::span<const uint8_t> data);

/**
 * @brief True if @p data starts with the PNG signature.
 */
[[nodiscard]] bool is_png(std::span<const uint8_t> data) noexcept;

} // namespace anvil

#endif // ANVIL_PNG_IO_HPP
