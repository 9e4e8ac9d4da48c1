#include "../../include/codec_service.hpp"
#include "../../include/errors.hpp"
#include <cmath>
#include <sstream>

namespace anvil {

namespace {
    // helper for std::visit with a set of lambdas
    template<class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    std::string format_fps(const double fps) {
        if (std::floor(fps) == fps) {
            return std::to_string(static_cast<long long>(fps));
        }
        std::ostringstream os;
        os << fps;
        return os.str();
    }

    std::string frame_select_expr(const std::vector<uint32_t>& frames) {
        std::string expr = "select='";
        for (std::size_t i = 0; i < frames.size(); ++i) {
            if (i > 0) expr += "+";
            expr += "eq(n\\," + std::to_string(frames[i]) + ")";
        }
        expr += "'";
        return expr;
    }
}

std::string FilterChain::describe() const {
    std::string out;
    for (const auto& step : steps_) {
        if (!out.empty()) out += ",";
        out += std::visit(overloaded{
            [](const DenoiseStep& s) { return "hqdn3d=" + std::to_string(s.strength); },
            [](const DecimateStep& s) {
                return s.frames_to_keep.empty() ? std::string("mpdecimate") : frame_select_expr(s.frames_to_keep);
            },
            [](const FpsStep& s) { return "fps=" + format_fps(s.fps); },
            [](const ScaleStep& s) {
                return "scale=" + std::to_string(s.width) + ":-1:flags=" + std::string(to_string(s.filter));
            },
            [](const PaletteGenStep& s) {
                return "palettegen=max_colors=" + std::to_string(s.max_colors) + (s.diff_stats ? ":stats_mode=diff" : "");
            },
            [](const PaletteUseStep& s) {
                std::string r = "paletteuse=dither=" + std::string(to_string(s.dither));
                if (s.dither == DitherMethod::Bayer) r += ":bayer_scale=" + std::to_string(s.bayer_scale);
                return r;
            },
            [](const FormatStep& s) { return "format=" + std::string(to_string(s.format)); },
            [](const SelectFrameStep& s) { return "select='eq(n\\," + std::to_string(s.index) + ")'"; }
        }, step);
    }
    return out;
}

std::string OutputParams::describe() const {
    switch (format) {
        case OutputFormat::Png:        return "-c:v png -frames:v 1";
        case OutputFormat::PalettePng: return "-c:v png (palette)";
        case OutputFormat::AnimatedWebp: break;
    }
    std::string out = "-c:v libwebp_anim";
    out += " -lossless " + std::string(lossless ? "1" : "0");
    out += " -quality " + std::to_string(quality);
    out += " -compression_level " + std::to_string(method);
    if (lossless && near_lossless < 100) out += " -near_lossless " + std::to_string(near_lossless);
    if (sharp_yuv) out += " -sharp_yuv 1";
    if (allow_mixed) out += " -allow_mixed 1";
    out += " -kmin " + std::to_string(kmin) + " -kmax " + std::to_string(kmax);
    out += " -alpha " + std::string(keep_alpha ? "keep" : "drop");
    out += " -loop " + std::to_string(loop_count);
    return out;
}

void ScratchSpace::put(const std::string& name, std::vector<uint8_t> data) {
    std::lock_guard lock(mtx_);
    buffers_[name] = std::move(data);
}

std::vector<uint8_t> ScratchSpace::get(const std::string& name) const {
    std::lock_guard lock(mtx_);
    const auto it = buffers_.find(name);
    if (it == buffers_.end()) {
        throw CodecError("no scratch buffer named '" + name + "'");
    }
    return it->second;
}

void ScratchSpace::erase(const std::string& name) {
    std::lock_guard lock(mtx_);
    buffers_.erase(name);
}

bool ScratchSpace::contains(const std::string& name) const {
    std::lock_guard lock(mtx_);
    return buffers_.contains(name);
}

std::size_t ScratchSpace::size() const {
    std::lock_guard lock(mtx_);
    return buffers_.size();
}

} // namespace anvil
