#ifndef ANVIL_TEST_SUPPORT_HPP
#define ANVIL_TEST_SUPPORT_HPP

#include "../libanvil/include/codec_service.hpp"
#include "../libanvil/include/errors.hpp"
#include "../libanvil/include/pixel_decoder.hpp"
#include "../libanvil/include/pixel_grid.hpp"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace anvil::test {

inline PixelGrid solid_grid(const uint32_t w, const uint32_t h,
                            const uint8_t r, const uint8_t g, const uint8_t b, const uint8_t a = 255) {
    PixelGrid grid(w, h);
    for (std::size_t i = 0; i < grid.rgba.size(); i += 4) {
        grid.rgba[i] = r;
        grid.rgba[i + 1] = g;
        grid.rgba[i + 2] = b;
        grid.rgba[i + 3] = a;
    }
    return grid;
}

// diagonal gradient with a sharp vertical bar, so the image has both texture and edges
inline PixelGrid pattern_grid(const uint32_t w, const uint32_t h) {
    PixelGrid grid(w, h);
    for (uint32_t y = 0; y < h; ++y) {
        for (uint32_t x = 0; x < w; ++x) {
            uint8_t* p = grid.pixel(x, y);
            const bool bar = x >= w / 3 && x < w / 3 + std::max(1u, w / 8);
            p[0] = bar ? 250 : static_cast<uint8_t>((x * 255) / std::max(1u, w - 1));
            p[1] = bar ? 20 : static_cast<uint8_t>((y * 255) / std::max(1u, h - 1));
            p[2] = bar ? 20 : static_cast<uint8_t>(((x + y) * 127) / std::max(1u, w + h - 2));
            p[3] = 255;
        }
    }
    return grid;
}

// adds a +/-amount checkerboard offset to every color channel
inline PixelGrid perturbed(PixelGrid grid, const int amount) {
    for (uint32_t y = 0; y < grid.height; ++y) {
        for (uint32_t x = 0; x < grid.width; ++x) {
            uint8_t* p = grid.pixel(x, y);
            const int d = ((x + y) % 2 == 0) ? amount : -amount;
            for (int c = 0; c < 3; ++c) {
                p[c] = static_cast<uint8_t>(std::clamp(p[c] + d, 0, 255));
            }
        }
    }
    return grid;
}

/**
 * @brief Structurally valid GIF89a skeleton: header, optional global color
 * table, then one graphic control extension and one image block per frame.
 * The image data is a single empty sub-block chain, enough for block walks.
 */
inline std::vector<uint8_t> make_gif(const uint16_t width, const uint16_t height, const std::size_t frames,
                                     const uint16_t delay_cs = 10, const int palette_bits = 8) {
    std::vector<uint8_t> gif = {'G', 'I', 'F', '8', '9', 'a'};
    gif.push_back(static_cast<uint8_t>(width & 0xFF));
    gif.push_back(static_cast<uint8_t>(width >> 8));
    gif.push_back(static_cast<uint8_t>(height & 0xFF));
    gif.push_back(static_cast<uint8_t>(height >> 8));
    const uint8_t packed = palette_bits > 0 ? static_cast<uint8_t>(0x80 | ((palette_bits - 1) & 0x07)) : 0;
    gif.push_back(packed);
    gif.push_back(0); // background
    gif.push_back(0); // aspect
    if (palette_bits > 0) {
        gif.insert(gif.end(), 3u * (1u << palette_bits), 0x7F);
    }
    for (std::size_t i = 0; i < frames; ++i) {
        // graphic control extension
        gif.insert(gif.end(), {0x21, 0xF9, 0x04, 0x00,
                               static_cast<uint8_t>(delay_cs & 0xFF), static_cast<uint8_t>(delay_cs >> 8),
                               0x00, 0x00});
        // image descriptor, no local table
        gif.insert(gif.end(), {0x2C, 0, 0, 0, 0,
                               static_cast<uint8_t>(width & 0xFF), static_cast<uint8_t>(width >> 8),
                               static_cast<uint8_t>(height & 0xFF), static_cast<uint8_t>(height >> 8),
                               0x00});
        gif.push_back(0x08);                          // LZW minimum code size
        gif.insert(gif.end(), {0x02, 0x4C, 0x01, 0x00}); // one data sub-block + terminator
    }
    gif.push_back(0x3B);
    return gif;
}

/// PNG signature plus an IHDR chunk, as read by read_png_header().
inline std::vector<uint8_t> make_png_header(const uint32_t w, const uint32_t h, const uint8_t color_type) {
    std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n',
                                0, 0, 0, 13, 'I', 'H', 'D', 'R'};
    for (const uint32_t v : {w, h}) {
        png.push_back(static_cast<uint8_t>(v >> 24));
        png.push_back(static_cast<uint8_t>(v >> 16));
        png.push_back(static_cast<uint8_t>(v >> 8));
        png.push_back(static_cast<uint8_t>(v));
    }
    png.insert(png.end(), {8, color_type, 0, 0, 0, 0, 0, 0, 0});
    return png;
}

inline constexpr char kFakeWebpTag[] = "FAKEWEBP";

/**
 * @brief Scratch-space codec that fabricates outputs instead of encoding.
 *
 * Snapshots are PNG headers for the first `frames` frames. Animated
 * outputs are tagged buffers carrying quality and lossless flag, sized by
 * `size_of`. Candidates whose generation index is in `failing` throw.
 */
class FakeCodec final : public ICodecService {
public:
    uint32_t frames = 5;
    uint32_t width = 64;
    uint32_t height = 48;
    uint8_t color_type = 2;
    std::set<std::size_t> failing;
    std::function<std::size_t(const OutputParams&)> size_of = [](const OutputParams& p) {
        return static_cast<std::size_t>(p.lossless ? 8000 : 400 + p.quality * 40);
    };

    void write_buffer(const std::string& name, std::vector<uint8_t> data) override {
        std::lock_guard lock(mtx_);
        buffers_[name] = std::move(data);
    }

    std::vector<uint8_t> read_buffer(const std::string& name) const override {
        std::lock_guard lock(mtx_);
        const auto it = buffers_.find(name);
        if (it == buffers_.end()) throw CodecError("no buffer " + name);
        return it->second;
    }

    void remove_buffer(const std::string& name) override {
        std::lock_guard lock(mtx_);
        buffers_.erase(name);
    }

    bool has_buffer(const std::string& name) const override {
        std::lock_guard lock(mtx_);
        return buffers_.contains(name);
    }

    void run(const CodecInvocation& inv, const std::stop_token st) override {
        ++runs_;
        {
            std::lock_guard lock(mtx_);
            invocations_.push_back(inv);
            for (const auto& in : inv.inputs) {
                if (!buffers_.contains(in)) throw CodecError("missing input " + in);
            }
        }
        if (st.stop_requested()) throw CodecError("cancelled");

        std::vector<uint8_t> out;
        switch (inv.params.format) {
            case OutputFormat::Png: {
                uint32_t index = 0;
                for (const auto& step : inv.filters.steps()) {
                    if (const auto* s = std::get_if<SelectFrameStep>(&step)) index = s->index;
                }
                if (index >= frames) throw CodecError("frame out of range");
                out = make_png_header(width, height, color_type);
                break;
            }
            case OutputFormat::PalettePng:
                out = make_png_header(16, 16, 2);
                break;
            case OutputFormat::AnimatedWebp: {
                const auto pos = inv.output.find(".cand");
                if (pos != std::string::npos) {
                    const std::size_t index = std::stoul(inv.output.substr(pos + 5));
                    if (failing.contains(index)) throw CodecError("simulated encoder failure");
                }
                out.assign(kFakeWebpTag, kFakeWebpTag + 8);
                out.push_back(static_cast<uint8_t>(inv.params.quality));
                out.push_back(inv.params.lossless ? 1 : 0);
                out.resize(std::max<std::size_t>(out.size(), size_of(inv.params)), 0);
                break;
            }
        }
        write_buffer(inv.output, std::move(out));
    }

    [[nodiscard]] std::size_t buffer_count() const {
        std::lock_guard lock(mtx_);
        return buffers_.size();
    }

    [[nodiscard]] std::vector<CodecInvocation> invocations() const {
        std::lock_guard lock(mtx_);
        return invocations_;
    }

    [[nodiscard]] std::size_t runs() const { return runs_.load(); }

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::vector<uint8_t>> buffers_;
    std::vector<CodecInvocation> invocations_;
    std::atomic<std::size_t> runs_{0};
};

/**
 * @brief Decoder that reconstructs FakeCodec candidates from `reference`.
 *
 * Lossless candidates decode to the reference itself; lossy ones to the
 * reference perturbed by (100 - quality) / 3. GIF sources decode to
 * `source_frames`.
 */
class FakeDecoder final : public IPixelDecoder {
public:
    PixelGrid reference;
    std::vector<std::optional<DecodedFrame>> source_frames;
    std::set<uint8_t> undecodable_qualities;
    bool wrong_size = false;

    PixelGrid decode_first_frame(const std::span<const uint8_t> data) const override {
        if (data.size() >= 6 && std::memcmp(data.data(), "GIF", 3) == 0) {
            return reference;
        }
        if (data.size() < 10 || std::memcmp(data.data(), kFakeWebpTag, 8) != 0) {
            throw DecodeError("not a fake webp");
        }
        const uint8_t quality = data[8];
        if (undecodable_qualities.contains(quality)) throw DecodeError("simulated corrupt candidate");
        if (wrong_size) return solid_grid(reference.width + 1, reference.height, 0, 0, 0);
        if (data[9]) return reference;
        return perturbed(reference, (100 - quality) / 3);
    }

    std::vector<std::optional<DecodedFrame>> decode_frames(const std::span<const uint8_t>) const override {
        return source_frames;
    }
};

} // namespace anvil::test

#endif // ANVIL_TEST_SUPPORT_HPP
