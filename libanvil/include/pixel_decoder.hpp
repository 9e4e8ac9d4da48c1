#ifndef ANVIL_PIXEL_DECODER_HPP
#define ANVIL_PIXEL_DECODER_HPP

#include "pixel_grid.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace anvil {

/**
 * @brief Turns an encoded image buffer into RGBA pixels.
 */
class IPixelDecoder {
public:
    virtual ~IPixelDecoder() = default;

    /**
     * @brief Decodes the first (or only) frame, composited on the full canvas.
     * @throws DecodeError if the buffer cannot be decoded.
     */
    [[nodiscard]] virtual PixelGrid decode_first_frame(std::span<const uint8_t> data) const = 0;

    /**
     * @brief Decodes every frame of an animation.
     *
     * Frames that fail individually are returned as std::nullopt, so the
     * result keeps one entry per source frame.
     *
     * @throws DecodeError if the container itself cannot be read.
     */
    [[nodiscard]] virtual std::vector<std::optional<DecodedFrame>> decode_frames(std::span<const uint8_t> data) const = 0;
};

} // namespace anvil

#endif // ANVIL_PIXEL_DECODER_HPP
