#include "../../include/webp_codec_service.hpp"
#include "../../include/errors.hpp"
#include "../../include/frame_filters.hpp"
#include "../../include/logger.hpp"
#include "../../include/palette.hpp"
#include "../../include/png_io.hpp"
#include <webp/encode.h>
#include <webp/mux.h>
#include <algorithm>
#include <optional>
#include <variant>

namespace anvil {

namespace {
    template<class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    struct AnimEncoderDelete {
        void operator()(WebPAnimEncoder* e) const noexcept { WebPAnimEncoderDelete(e); }
    };
    using AnimEncoderPtr = std::unique_ptr<WebPAnimEncoder, AnimEncoderDelete>;

    /**
     * @brief RAII wrapper for a WebPPicture.
     */
    struct PictureGuard {
        WebPPicture pic{};
        bool initialized = false;

        ~PictureGuard() {
            if (initialized) WebPPictureFree(&pic);
        }
    };

    void throw_if_stopped(const std::stop_token& st) {
        if (st.stop_requested()) {
            throw CodecError("invocation cancelled");
        }
    }

    std::string anim_error(WebPAnimEncoder* enc) {
        const char* msg = WebPAnimEncoderGetError(enc);
        return msg ? msg : "unknown libwebp error";
    }
}

void WebpCodecService::write_buffer(const std::string& name, std::vector<uint8_t> data) {
    scratch_.put(name, std::move(data));
    invalidate(name);
}

std::vector<uint8_t> WebpCodecService::read_buffer(const std::string& name) const {
    return scratch_.get(name);
}

void WebpCodecService::remove_buffer(const std::string& name) {
    scratch_.erase(name);
    invalidate(name);
}

bool WebpCodecService::has_buffer(const std::string& name) const {
    return scratch_.contains(name);
}

void WebpCodecService::invalidate(const std::string& name) {
    std::lock_guard lock(cache_mtx_);
    decoded_.erase(name);
}

std::shared_ptr<const WebpCodecService::FrameList> WebpCodecService::frames_of(const std::string& name) const {
    {
        std::lock_guard lock(cache_mtx_);
        if (const auto it = decoded_.find(name); it != decoded_.end()) {
            return it->second;
        }
    }

    const auto bytes = scratch_.get(name);
    auto frames = std::make_shared<FrameList>();
    try {
        for (auto& f : decoder_.decode_frames(bytes)) {
            if (f) frames->push_back(std::move(*f));
        }
    } catch (const DecodeError& e) {
        throw CodecError("cannot decode input '" + name + "': " + e.what());
    }
    if (frames->empty()) {
        throw CodecError("input '" + name + "' has no decodable frames");
    }
    Logger::log(LogLevel::Debug, "Decoded '" + name + "': " + std::to_string(frames->size()) + " frames",
                "webp_codec");

    std::lock_guard lock(cache_mtx_);
    // another thread may have decoded it meanwhile, keep the first one
    const auto [it, inserted] = decoded_.emplace(name, std::move(frames));
    return it->second;
}

void WebpCodecService::run(const CodecInvocation& invocation, const std::stop_token st) {
    if (invocation.inputs.empty()) {
        throw CodecError("invocation has no input");
    }
    if (invocation.output.empty()) {
        throw CodecError("invocation has no output name");
    }
    throw_if_stopped(st);

    const auto source = frames_of(invocation.inputs.front());
    // frames are read from the decode cache until a step changes them
    const FrameList* view = source.get();
    FrameList owned;
    auto take = [&]() -> FrameList {
        if (view == &owned) return std::move(owned);
        return *view;
    };
    auto replace = [&](FrameList next) {
        owned = std::move(next);
        view = &owned;
    };
    auto writable = [&]() -> FrameList& {
        if (view != &owned) replace(*view);
        return owned;
    };
    std::optional<Palette> generated;

    for (const auto& step : invocation.filters.steps()) {
        throw_if_stopped(st);
        std::visit(overloaded{
            [&](const DenoiseStep& s) {
                for (auto& f : writable()) denoise(f.grid, s.strength);
            },
            [&](const DecimateStep& s) {
                replace(s.frames_to_keep.empty() ? decimate(take()) : select_frames(take(), s.frames_to_keep));
            },
            [&](const FpsStep& s) {
                replace(retime(*view, s.fps));
            },
            [&](const ScaleStep& s) {
                for (auto& f : writable()) {
                    throw_if_stopped(st);
                    f.grid = scale(f.grid, s.width, s.filter);
                }
            },
            [&](const PaletteGenStep& s) {
                generated = generate_palette(*view, s.max_colors, s.diff_stats);
            },
            [&](const PaletteUseStep& s) {
                if (std::find(invocation.inputs.begin(), invocation.inputs.end(), s.palette) == invocation.inputs.end()) {
                    throw CodecError("palette '" + s.palette + "' is not an input of the invocation");
                }
                Palette palette;
                try {
                    palette = decode_palette_png(scratch_.get(s.palette));
                } catch (const DecodeError& e) {
                    throw CodecError("cannot read palette '" + s.palette + "': " + e.what());
                }
                for (auto& f : writable()) {
                    throw_if_stopped(st);
                    apply_palette(f.grid, palette, s.dither, s.bayer_scale);
                }
            },
            [&](const FormatStep& s) {
                if (s.format == PixelFormat::Yuv420p) {
                    for (auto& f : writable()) flatten_alpha(f.grid);
                }
            },
            [&](const SelectFrameStep& s) {
                if (s.index >= view->size()) {
                    throw CodecError("frame " + std::to_string(s.index) + " out of range (" +
                                     std::to_string(view->size()) + " frames)");
                }
                // only the picked frame is copied out of the cache
                FrameList picked;
                if (view == &owned) {
                    picked.push_back(std::move(owned[s.index]));
                } else {
                    picked.push_back((*view)[s.index]);
                }
                replace(std::move(picked));
            }
        }, step);
    }

    const FrameList& frames = *view;
    if (frames.empty()) {
        throw CodecError("filter chain left no frames");
    }
    throw_if_stopped(st);

    std::vector<uint8_t> out;
    switch (invocation.params.format) {
        case OutputFormat::Png:
            out = encode_png(frames.front().grid);
            break;
        case OutputFormat::PalettePng:
            if (!generated) generated = generate_palette(frames);
            out = encode_palette_png(*generated);
            break;
        case OutputFormat::AnimatedWebp:
            out = encode_animation(frames, invocation.params, st);
            break;
    }

    scratch_.put(invocation.output, std::move(out));
    invalidate(invocation.output);
}

std::vector<uint8_t> WebpCodecService::encode_animation(const std::vector<DecodedFrame>& frames,
                                                        const OutputParams& params,
                                                        const std::stop_token st) {
    if (frames.empty()) {
        throw CodecError("no frames to encode");
    }
    const int width = static_cast<int>(frames.front().grid.width);
    const int height = static_cast<int>(frames.front().grid.height);

    WebPAnimEncoderOptions enc_opts;
    if (!WebPAnimEncoderOptionsInit(&enc_opts)) {
        Logger::log(LogLevel::Error, "WebPAnimEncoderOptionsInit failed", "webp_codec");
        throw CodecError("WebPAnimEncoderOptionsInit failed");
    }
    enc_opts.anim_params.loop_count = params.loop_count;
    enc_opts.allow_mixed = params.allow_mixed ? 1 : 0;
    enc_opts.kmin = params.kmin;
    enc_opts.kmax = params.kmax;

    const AnimEncoderPtr enc(WebPAnimEncoderNew(width, height, &enc_opts));
    if (!enc) {
        Logger::log(LogLevel::Error, "WebPAnimEncoderNew failed", "webp_codec");
        throw CodecError("WebPAnimEncoderNew failed");
    }

    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        Logger::log(LogLevel::Error, "WebPConfigInit failed", "webp_codec");
        throw CodecError("WebPConfigInit failed");
    }
    config.lossless = params.lossless ? 1 : 0;
    config.quality = static_cast<float>(std::clamp(params.quality, 0, 100));
    config.method = std::clamp(params.method, 0, 6);
    config.near_lossless = std::clamp(params.near_lossless, 0, 100);
    config.use_sharp_yuv = params.sharp_yuv ? 1 : 0;
    if (!params.keep_alpha) {
        config.alpha_compression = 0;
    }
    if (!WebPValidateConfig(&config)) {
        throw CodecError("invalid WebP configuration (" + params.describe() + ")");
    }

    int timestamp = 0;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        throw_if_stopped(st);
        const PixelGrid& grid = frames[i].grid;
        if (static_cast<int>(grid.width) != width || static_cast<int>(grid.height) != height) {
            throw CodecError("frame " + std::to_string(i) + " does not match the canvas size");
        }

        PictureGuard picture;
        if (!WebPPictureInit(&picture.pic)) {
            throw CodecError("WebPPictureInit failed");
        }
        picture.initialized = true;
        picture.pic.use_argb = 1;
        picture.pic.width = width;
        picture.pic.height = height;
        if (!WebPPictureImportRGBA(&picture.pic, grid.rgba.data(), width * 4)) {
            throw CodecError("WebPPictureImportRGBA failed on frame " + std::to_string(i));
        }
        if (!WebPAnimEncoderAdd(enc.get(), &picture.pic, timestamp, &config)) {
            throw CodecError("WebPAnimEncoderAdd failed on frame " + std::to_string(i) + ": " + anim_error(enc.get()));
        }
        timestamp += static_cast<int>(frames[i].delay_ms);
    }

    // a NULL frame flushes and fixes the duration of the last one
    if (!WebPAnimEncoderAdd(enc.get(), nullptr, timestamp, nullptr)) {
        throw CodecError("WebPAnimEncoderAdd(flush) failed: " + anim_error(enc.get()));
    }

    WebPData data;
    WebPDataInit(&data);
    if (!WebPAnimEncoderAssemble(enc.get(), &data)) {
        WebPDataClear(&data);
        throw CodecError("WebPAnimEncoderAssemble failed: " + anim_error(enc.get()));
    }
    std::vector<uint8_t> out(data.bytes, data.bytes + data.size);
    WebPDataClear(&data);
    return out;
}

} // namespace anvil
