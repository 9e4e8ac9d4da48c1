#include "../../include/image_decoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/metadata_analyzer.hpp"
#include "../../include/png_io.hpp"
#include <webp/decode.h>
#include <webp/demux.h>
#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_GIF
#include <stb_image.h>

namespace anvil {

namespace {
    struct StbFree {
        void operator()(void* p) const noexcept { stbi_image_free(p); }
    };
    using StbPixels = std::unique_ptr<stbi_uc, StbFree>;
    using StbDelays = std::unique_ptr<int, StbFree>;

    struct AnimDecoderDelete {
        void operator()(WebPAnimDecoder* d) const noexcept { WebPAnimDecoderDelete(d); }
    };
    using AnimDecoderPtr = std::unique_ptr<WebPAnimDecoder, AnimDecoderDelete>;

    int checked_length(const std::span<const uint8_t> data) {
        if (data.size() > static_cast<std::size_t>(INT_MAX)) {
            throw DecodeError("buffer too large to decode");
        }
        return static_cast<int>(data.size());
    }

    uint32_t gif_delay(const int ms) noexcept {
        return ms < static_cast<int>(kMinGifDelayMs) ? kDefaultGifDelayMs : static_cast<uint32_t>(ms);
    }

    std::vector<DecodedFrame> decode_gif(const std::span<const uint8_t> data) {
        int* raw_delays = nullptr;
        int width = 0, height = 0, layers = 0, channels = 0;
        StbPixels pixels(stbi_load_gif_from_memory(data.data(), checked_length(data), &raw_delays,
                                                   &width, &height, &layers, &channels, 4));
        StbDelays delays(raw_delays);
        if (!pixels) {
            const char* reason = stbi_failure_reason();
            Logger::log(LogLevel::Debug, std::string("stb_image: ") + (reason ? reason : "unknown error"), "image_decoder");
            throw DecodeError(std::string("GIF decode failed: ") + (reason ? reason : "unknown error"));
        }
        if (width <= 0 || height <= 0 || layers <= 0) {
            throw DecodeError("GIF has no frames");
        }

        const std::size_t frame_bytes = static_cast<std::size_t>(width) * height * 4;
        std::vector<DecodedFrame> frames;
        frames.reserve(static_cast<std::size_t>(layers));
        for (int i = 0; i < layers; ++i) {
            DecodedFrame f;
            f.grid = PixelGrid(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
            std::memcpy(f.grid.rgba.data(), pixels.get() + frame_bytes * i, frame_bytes);
            f.delay_ms = delays ? gif_delay(delays.get()[i]) : kDefaultGifDelayMs;
            frames.push_back(std::move(f));
        }
        return frames;
    }

    PixelGrid decode_gif_first(const std::span<const uint8_t> data) {
        int width = 0, height = 0, channels = 0;
        // stbi_load on a GIF yields its first frame
        StbPixels pixels(stbi_load_from_memory(data.data(), checked_length(data), &width, &height, &channels, 4));
        if (!pixels) {
            const char* reason = stbi_failure_reason();
            throw DecodeError(std::string("GIF decode failed: ") + (reason ? reason : "unknown error"));
        }
        PixelGrid grid(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
        std::memcpy(grid.rgba.data(), pixels.get(), grid.rgba.size());
        return grid;
    }

    // decodes up to max_frames frames of a still or animated WebP
    std::vector<DecodedFrame> decode_webp(const std::span<const uint8_t> data, const std::size_t max_frames) {
        WebPAnimDecoderOptions opts;
        if (!WebPAnimDecoderOptionsInit(&opts)) {
            throw DecodeError("WebPAnimDecoderOptionsInit failed");
        }
        opts.color_mode = MODE_RGBA;
        opts.use_threads = 0;

        const WebPData webp_data{data.data(), data.size()};
        const AnimDecoderPtr dec(WebPAnimDecoderNew(&webp_data, &opts));
        if (!dec) {
            throw DecodeError("WebP demux failed (malformed container)");
        }
        WebPAnimInfo info;
        if (!WebPAnimDecoderGetInfo(dec.get(), &info)) {
            throw DecodeError("WebPAnimDecoderGetInfo failed");
        }

        std::vector<DecodedFrame> frames;
        const std::size_t frame_bytes = static_cast<std::size_t>(info.canvas_width) * info.canvas_height * 4;
        int previous = 0;
        while (frames.size() < max_frames && WebPAnimDecoderHasMoreFrames(dec.get())) {
            uint8_t* buf = nullptr;
            int timestamp = 0;
            if (!WebPAnimDecoderGetNext(dec.get(), &buf, &timestamp)) {
                throw DecodeError("WebP frame " + std::to_string(frames.size()) + " failed to decode");
            }
            DecodedFrame f;
            f.grid = PixelGrid(info.canvas_width, info.canvas_height);
            std::memcpy(f.grid.rgba.data(), buf, frame_bytes);
            f.delay_ms = static_cast<uint32_t>(std::max(0, timestamp - previous));
            previous = timestamp;
            frames.push_back(std::move(f));
        }
        if (frames.empty()) {
            throw DecodeError("WebP has no frames");
        }
        return frames;
    }
}

bool ImageDecoder::is_webp(const std::span<const uint8_t> data) noexcept {
    return data.size() >= 12 && std::memcmp(data.data(), "RIFF", 4) == 0 &&
           std::memcmp(data.data() + 8, "WEBP", 4) == 0;
}

PixelGrid ImageDecoder::decode_first_frame(const std::span<const uint8_t> data) const {
    if (data.empty()) {
        throw DecodeError("empty buffer");
    }
    if (is_webp(data)) {
        return std::move(decode_webp(data, 1).front().grid);
    }
    if (is_png(data)) {
        return decode_png(data);
    }
    if (is_gif(data)) {
        return decode_gif_first(data);
    }
    throw DecodeError("unrecognized image signature");
}

std::vector<std::optional<DecodedFrame>> ImageDecoder::decode_frames(const std::span<const uint8_t> data) const {
    std::vector<DecodedFrame> frames;
    if (is_gif(data)) {
        frames = decode_gif(data);
    } else if (is_webp(data)) {
        frames = decode_webp(data, SIZE_MAX);
    } else if (is_png(data)) {
        DecodedFrame f;
        f.grid = decode_png(data);
        frames.push_back(std::move(f));
    } else {
        throw DecodeError("unrecognized image signature");
    }

    Logger::log(LogLevel::Debug, "Decoded " + std::to_string(frames.size()) + " frames", "image_decoder");
    std::vector<std::optional<DecodedFrame>> out;
    out.reserve(frames.size());
    for (auto& f : frames) {
        out.emplace_back(std::move(f));
    }
    return out;
}

} // namespace anvil
