/**
 * @file webp_codec_service.hpp
 * @brief In-process codec service backed by libwebp.
 */

#ifndef ANVIL_WEBP_CODEC_SERVICE_HPP
#define ANVIL_WEBP_CODEC_SERVICE_HPP

#include "codec_service.hpp"
#include "image_decoder.hpp"
#include "pixel_grid.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace anvil {

/**
 * @brief ICodecService that runs filter chains on decoded frames and encodes
 *        with WebPAnimEncoder (animations) or libpng (snapshots, palettes).
 *
 * Decoded inputs are cached per scratch name until the buffer is replaced
 * or removed, so the candidates of one run decode the source only once.
 */
class WebpCodecService final : public ICodecService {
public:
    WebpCodecService() = default;

    WebpCodecService(const WebpCodecService&) = delete;
    WebpCodecService& operator=(const WebpCodecService&) = delete;

    void write_buffer(const std::string& name, std::vector<uint8_t> data) override;
    [[nodiscard]] std::vector<uint8_t> read_buffer(const std::string& name) const override;
    void remove_buffer(const std::string& name) override;
    [[nodiscard]] bool has_buffer(const std::string& name) const override;

    void run(const CodecInvocation& invocation, std::stop_token st = {}) override;

    /// Number of buffers currently held (for leak checks).
    [[nodiscard]] std::size_t buffer_count() const { return scratch_.size(); }

    /**
     * @brief Encodes frames as an animated WebP.
     * @throws CodecError on invalid parameters, encoder failure or stop request.
     */
    [[nodiscard]] static std::vector<uint8_t> encode_animation(const std::vector<DecodedFrame>& frames,
                                                               const OutputParams& params,
                                                               std::stop_token st = {});

private:
    using FrameList = std::vector<DecodedFrame>;

    [[nodiscard]] std::shared_ptr<const FrameList> frames_of(const std::string& name) const;
    void invalidate(const std::string& name);

    ScratchSpace scratch_;
    ImageDecoder decoder_;

    mutable std::mutex cache_mtx_;
    mutable std::map<std::string, std::shared_ptr<const FrameList>> decoded_;
};

} // namespace anvil

#endif // ANVIL_WEBP_CODEC_SERVICE_HPP
