#ifndef ANVIL_IMAGE_DECODER_HPP
#define ANVIL_IMAGE_DECODER_HPP

#include "pixel_decoder.hpp"

namespace anvil {

/// GIF delays below this are played back as kDefaultGifDelayMs by browsers.
inline constexpr uint32_t kMinGifDelayMs = 20;
inline constexpr uint32_t kDefaultGifDelayMs = 100;

/**
 * @brief IPixelDecoder for the formats anvil handles: GIF (stb_image),
 *        PNG (libpng) and still or animated WebP (libwebp demux).
 *
 * The format is sniffed from the buffer signature. Stateless and safe to
 * share between threads.
 */
class ImageDecoder final : public IPixelDecoder {
public:
    [[nodiscard]] PixelGrid decode_first_frame(std::span<const uint8_t> data) const override;

    /**
     * @brief Decodes every frame. GIF and WebP containers decode as a
     *        whole, so a corrupt stream fails the call instead of yielding
     *        per-frame gaps.
     */
    [[nodiscard]] std::vector<std::optional<DecodedFrame>> decode_frames(std::span<const uint8_t> data) const override;

    /// True for a RIFF/WEBP signature.
    [[nodiscard]] static bool is_webp(std::span<const uint8_t> data) noexcept;
};

} // namespace anvil

#endif // ANVIL_IMAGE_DECODER_HPP
