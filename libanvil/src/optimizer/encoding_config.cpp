#include "../../include/encoding_config.hpp"

namespace anvil {

std::string_view to_string(const ScaleFilter f) {
    switch (f) {
        case ScaleFilter::Neighbor: return "neighbor";
        case ScaleFilter::Bilinear: return "bilinear";
        case ScaleFilter::Bicubic:  return "bicubic";
        case ScaleFilter::Spline:   return "spline";
        case ScaleFilter::Lanczos:  return "lanczos";
    }
    return "";
}

std::string_view to_string(const DitherMethod d) {
    switch (d) {
        case DitherMethod::None:           return "none";
        case DitherMethod::Bayer:          return "bayer";
        case DitherMethod::FloydSteinberg: return "floyd_steinberg";
    }
    return "";
}

std::string_view to_string(const PixelFormat p) {
    switch (p) {
        case PixelFormat::Yuv420p:  return "yuv420p";
        case PixelFormat::Yuva420p: return "yuva420p";
    }
    return "";
}

std::string_view to_string(const Strategy s) {
    switch (s) {
        case Strategy::PureLossless:   return "pure-lossless";
        case Strategy::NearLossless:   return "near-lossless";
        case Strategy::Hybrid:         return "hybrid";
        case Strategy::OptimizedLossy: return "optimized-lossy";
    }
    return "";
}

std::string EncodingConfig::describe() const {
    std::string out(to_string(strategy));
    out += " q" + std::to_string(quality);
    out += " m" + std::to_string(compression_effort);
    if (lossless) out += " lossless";
    if (near_lossless) out += " nl" + std::to_string(*near_lossless);
    if (sharp_yuv) out += " sharp";
    if (use_palette) {
        out += " palette:";
        out += to_string(dither);
        if (dither == DitherMethod::Bayer) out += std::to_string(bayer_scale);
    }
    if (denoise) out += " denoise" + std::to_string(*denoise);
    if (remove_duplicates) out += " dedup";
    if (delta_encoding) out += " delta";
    out += " ";
    out += to_string(scale_filter);
    out += " ";
    out += to_string(pixel_format);
    return out;
}

} // namespace anvil
