#include "../../include/frame_filters.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <string>

extern "C" {
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace anvil {

namespace {
    constexpr uint32_t kBlock = 8;

    int luma(const uint8_t* p) noexcept {
        return (299 * p[0] + 587 * p[1] + 114 * p[2]) / 1000;
    }

    bool same_geometry(const PixelGrid& a, const PixelGrid& b) noexcept {
        return a.width == b.width && a.height == b.height;
    }

    // true when `cur` is close enough to `ref` to be dropped
    bool is_near_duplicate(const PixelGrid& ref, const PixelGrid& cur) {
        if (!same_geometry(ref, cur)) return false;
        const uint32_t bx_count = (cur.width + kBlock - 1) / kBlock;
        const uint32_t by_count = (cur.height + kBlock - 1) / kBlock;
        const std::size_t total = static_cast<std::size_t>(bx_count) * by_count;
        if (total == 0) return true;

        const auto limit = static_cast<std::size_t>(kDecimateFrac * static_cast<double>(total));
        std::size_t over_lo = 0;
        for (uint32_t by = 0; by < by_count; ++by) {
            for (uint32_t bx = 0; bx < bx_count; ++bx) {
                int sad = 0;
                const uint32_t y_end = std::min(cur.height, (by + 1) * kBlock);
                const uint32_t x_end = std::min(cur.width, (bx + 1) * kBlock);
                for (uint32_t y = by * kBlock; y < y_end; ++y) {
                    for (uint32_t x = bx * kBlock; x < x_end; ++x) {
                        const uint8_t* a = ref.pixel(x, y);
                        const uint8_t* b = cur.pixel(x, y);
                        sad += std::abs(luma(a) - luma(b)) + std::abs(static_cast<int>(a[3]) - b[3]);
                    }
                }
                if (sad > kDecimateHi) return false;
                if (sad > kDecimateLo && ++over_lo > limit) return false;
            }
        }
        return true;
    }

    struct SwsContextDelete {
        void operator()(SwsContext* ctx) const noexcept { sws_freeContext(ctx); }
    };
    using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDelete>;

    int sws_flags_for(const ScaleFilter f) noexcept {
        switch (f) {
            case ScaleFilter::Neighbor: return SWS_POINT;
            case ScaleFilter::Bilinear: return SWS_BILINEAR;
            case ScaleFilter::Bicubic:  return SWS_BICUBIC;
            case ScaleFilter::Spline:   return SWS_SPLINE;
            case ScaleFilter::Lanczos:  return SWS_LANCZOS;
        }
        return SWS_BILINEAR;
    }
}

void denoise(PixelGrid& grid, int strength) {
    strength = std::clamp(strength, 0, 100);
    if (strength == 0 || grid.pixel_count() == 0) return;

    const PixelGrid src = grid;
    const double blend = strength / 100.0;
    for (uint32_t y = 0; y < grid.height; ++y) {
        for (uint32_t x = 0; x < grid.width; ++x) {
            int sum[3] = {0, 0, 0};
            int n = 0;
            const uint32_t y0 = y > 0 ? y - 1 : 0;
            const uint32_t y1 = std::min(grid.height - 1, y + 1);
            const uint32_t x0 = x > 0 ? x - 1 : 0;
            const uint32_t x1 = std::min(grid.width - 1, x + 1);
            for (uint32_t yy = y0; yy <= y1; ++yy) {
                for (uint32_t xx = x0; xx <= x1; ++xx) {
                    const uint8_t* p = src.pixel(xx, yy);
                    sum[0] += p[0];
                    sum[1] += p[1];
                    sum[2] += p[2];
                    ++n;
                }
            }
            uint8_t* out = grid.pixel(x, y);
            const uint8_t* orig = src.pixel(x, y);
            for (int c = 0; c < 3; ++c) {
                const double blurred = static_cast<double>(sum[c]) / n;
                out[c] = static_cast<uint8_t>(std::lround(orig[c] + (blurred - orig[c]) * blend));
            }
        }
    }
}

std::vector<DecodedFrame> select_frames(std::vector<DecodedFrame> frames, const std::span<const uint32_t> keep) {
    std::vector<bool> wanted(frames.size(), false);
    for (const uint32_t idx : keep) {
        if (idx < frames.size()) wanted[idx] = true;
    }

    std::vector<DecodedFrame> out;
    uint32_t leading_delay = 0;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (wanted[i]) {
            out.push_back(std::move(frames[i]));
            if (out.size() == 1) {
                out.back().delay_ms += leading_delay;
            }
        } else if (!out.empty()) {
            out.back().delay_ms += frames[i].delay_ms;
        } else {
            leading_delay += frames[i].delay_ms;
        }
    }
    return out;
}

std::vector<DecodedFrame> decimate(std::vector<DecodedFrame> frames) {
    std::vector<DecodedFrame> out;
    out.reserve(frames.size());
    for (auto& frame : frames) {
        if (!out.empty() && is_near_duplicate(out.back().grid, frame.grid)) {
            out.back().delay_ms += frame.delay_ms;
            continue;
        }
        out.push_back(std::move(frame));
    }
    return out;
}

std::vector<DecodedFrame> retime(const std::vector<DecodedFrame>& frames, const double fps) {
    if (frames.empty() || !(fps > 0.0)) return frames;

    // start time of every source frame
    std::vector<uint64_t> starts(frames.size());
    uint64_t total_ms = 0;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        starts[i] = total_ms;
        total_ms += frames[i].delay_ms;
    }

    const double tick_ms = 1000.0 / fps;
    const auto ticks = std::max<uint64_t>(1, static_cast<uint64_t>(std::llround(static_cast<double>(total_ms) / tick_ms)));

    std::vector<DecodedFrame> out;
    std::size_t src = 0;
    std::size_t run_src = 0;
    uint64_t run_start_tick = 0;
    auto flush = [&](const uint64_t end_tick) {
        const auto from = std::llround(static_cast<double>(run_start_tick) * tick_ms);
        const auto to = std::llround(static_cast<double>(end_tick) * tick_ms);
        DecodedFrame f;
        f.grid = frames[run_src].grid;
        f.delay_ms = static_cast<uint32_t>(std::max<long long>(1, to - from));
        out.push_back(std::move(f));
    };

    for (uint64_t k = 0; k < ticks; ++k) {
        const double t = static_cast<double>(k) * tick_ms;
        while (src + 1 < frames.size() && static_cast<double>(starts[src + 1]) <= t) {
            ++src;
        }
        if (k == 0) {
            run_src = src;
        } else if (src != run_src) {
            flush(k);
            run_src = src;
            run_start_tick = k;
        }
    }
    flush(ticks);
    return out;
}

PixelGrid scale(const PixelGrid& grid, const uint32_t width, const ScaleFilter filter) {
    if (width == 0) {
        throw CodecError("scale: target width must be positive");
    }
    if (grid.width == 0 || grid.height == 0) {
        throw CodecError("scale: empty source frame");
    }
    if (width == grid.width) return grid;

    const auto height = static_cast<uint32_t>(std::max<long long>(
        1, std::llround(static_cast<double>(grid.height) * width / grid.width)));

    const SwsContextPtr ctx(sws_getContext(
        static_cast<int>(grid.width), static_cast<int>(grid.height), AV_PIX_FMT_RGBA,
        static_cast<int>(width), static_cast<int>(height), AV_PIX_FMT_RGBA,
        sws_flags_for(filter) | SWS_ACCURATE_RND, nullptr, nullptr, nullptr));
    if (!ctx) {
        Logger::log(LogLevel::Error, "sws_getContext failed for " + std::to_string(grid.width) + "x" +
                    std::to_string(grid.height) + " -> " + std::to_string(width) + "x" +
                    std::to_string(height), "webp_codec");
        throw CodecError("scale: cannot create scaling context");
    }

    PixelGrid out(width, height);
    const uint8_t* const src_slice[1] = {grid.rgba.data()};
    const int src_stride[1] = {static_cast<int>(grid.width * 4)};
    uint8_t* const dst_slice[1] = {out.rgba.data()};
    const int dst_stride[1] = {static_cast<int>(width * 4)};
    const int rows = sws_scale(ctx.get(), src_slice, src_stride, 0, static_cast<int>(grid.height),
                               dst_slice, dst_stride);
    if (rows != static_cast<int>(height)) {
        throw CodecError("scale: sws_scale wrote " + std::to_string(rows) + " of " +
                         std::to_string(height) + " rows");
    }
    return out;
}

void flatten_alpha(PixelGrid& grid) noexcept {
    for (std::size_t i = 3; i < grid.rgba.size(); i += 4) {
        grid.rgba[i] = 255;
    }
}

} // namespace anvil
