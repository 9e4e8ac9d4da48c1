#include "../../include/candidate_generator.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>

namespace anvil {

namespace {
    struct QualityPreset {
        Strategy strategy;
        bool lossless;
        std::optional<int> near_lossless;
        int quality;
        int effort;
        bool sharp_yuv;
    };

    // strictest first
    constexpr std::array<QualityPreset, 9> kQualityPresets{{
        {Strategy::PureLossless,   true,  0,            100, 6, false},
        {Strategy::PureLossless,   true,  0,            75,  4, false},
        {Strategy::NearLossless,   true,  20,           100, 6, false},
        {Strategy::NearLossless,   true,  40,           100, 6, false},
        {Strategy::NearLossless,   true,  60,           90,  5, false},
        {Strategy::Hybrid,         false, std::nullopt, 95,  6, true},
        {Strategy::Hybrid,         false, std::nullopt, 90,  6, true},
        {Strategy::OptimizedLossy, false, std::nullopt, 92,  6, true},
        {Strategy::OptimizedLossy, false, std::nullopt, 85,  5, true},
    }};

    constexpr std::array<int, 3> kSizeQualities{90, 80, 70};
    constexpr std::array<int, 3> kSizeEfforts{4, 5, 6};

    PixelFormat format_for(const SourceMetadata& meta) {
        return meta.has_alpha ? PixelFormat::Yuva420p : PixelFormat::Yuv420p;
    }
}

const char* to_string(const OptimizationMode mode) {
    switch (mode) {
        case OptimizationMode::QualityPreserving: return "quality";
        case OptimizationMode::SizePreserving:    return "size";
    }
    return "";
}

CandidateGenerator::CandidateGenerator(const std::size_t max_candidates)
    : max_candidates_(std::clamp<std::size_t>(max_candidates, 1, kMaxCandidates)) {}

bool CandidateGenerator::wants_frame_reduction(const SourceMetadata& meta,
                                               const std::optional<std::vector<uint32_t>>& frames_to_keep) {
    if (meta.frame_count > kDedupFrameThreshold) {
        return true;
    }
    if (frames_to_keep && meta.frame_count > 0) {
        const double kept = static_cast<double>(frames_to_keep->size()) / static_cast<double>(meta.frame_count);
        return kept < kDedupKeepRatio;
    }
    return false;
}

std::vector<EncodingConfig> CandidateGenerator::quality_preserving(const SourceMetadata& meta) {
    std::vector<EncodingConfig> configs;
    configs.reserve(kQualityPresets.size());
    for (const auto& p : kQualityPresets) {
        EncodingConfig c;
        c.strategy = p.strategy;
        c.lossless = p.lossless;
        c.near_lossless = p.near_lossless;
        c.quality = p.quality;
        c.compression_effort = p.effort;
        c.sharp_yuv = p.sharp_yuv;
        c.scale_filter = ScaleFilter::Lanczos;
        c.dither = DitherMethod::None;
        c.use_palette = false;
        c.pixel_format = format_for(meta);
        configs.push_back(c);
    }
    return configs;
}

std::vector<EncodingConfig> CandidateGenerator::size_preserving(const SourceMetadata& meta) {
    const bool palette = meta.palette_size > 0 && meta.palette_size <= 256;

    std::vector<EncodingConfig> configs;
    for (const int quality : kSizeQualities) {
        for (const int effort : kSizeEfforts) {
            if (configs.size() == kSizeModeCap) return configs;
            EncodingConfig c;
            c.strategy = Strategy::OptimizedLossy;
            c.lossless = false;
            c.quality = quality;
            c.compression_effort = effort;
            c.use_palette = palette;
            c.dither = DitherMethod::Bayer;
            c.bayer_scale = quality >= 85 ? 2 : 3;
            c.scale_filter = quality >= 80 ? ScaleFilter::Lanczos : ScaleFilter::Spline;
            c.pixel_format = format_for(meta);
            configs.push_back(c);
        }
    }
    return configs;
}

std::vector<EncodingConfig> CandidateGenerator::generate(const SourceMetadata& meta,
                                                         const OptimizationMode mode,
                                                         const std::optional<std::vector<uint32_t>>& frames_to_keep) const {
    auto configs = mode == OptimizationMode::QualityPreserving ? quality_preserving(meta) : size_preserving(meta);

    if (wants_frame_reduction(meta, frames_to_keep)) {
        for (auto& c : configs) {
            c.remove_duplicates = true;
            c.delta_encoding = true;
        }
    }

    if (configs.size() > max_candidates_) {
        configs.resize(max_candidates_);
    }

    Logger::log(LogLevel::Debug, "Generated " + std::to_string(configs.size()) + " configurations (" +
                to_string(mode) + " mode)", "candidate_generator");
    return configs;
}

} // namespace anvil
