#include "../../include/candidate_encoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/scratch_guard.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <chrono>
#include <future>
#include <memory>

namespace anvil {

namespace {
    // encoding spans 30% .. 75% of the run
    double encode_progress(const std::size_t done, const std::size_t total) {
        return 30.0 + 45.0 * (total > 0 ? static_cast<double>(done) / static_cast<double>(total) : 1.0);
    }
}

FilterChain CandidateEncoder::build_filter_chain(const EncodingConfig& config,
                                                 const EncodeSource& source,
                                                 const std::string& palette) {
    FilterChain chain;
    if (config.denoise && *config.denoise > 0) {
        chain.add(DenoiseStep{*config.denoise});
    }
    if (config.remove_duplicates) {
        chain.add(DecimateStep{source.frames_to_keep.value_or(std::vector<uint32_t>{})});
    }
    chain.add(FpsStep{source.metadata.fps});
    chain.add(ScaleStep{source.metadata.width, config.scale_filter});
    if (config.use_palette && !palette.empty()) {
        chain.add(PaletteUseStep{palette, config.dither, config.bayer_scale});
    }
    chain.add(FormatStep{config.pixel_format});
    return chain;
}

OutputParams CandidateEncoder::build_output_params(const EncodingConfig& config) {
    OutputParams p;
    p.format = OutputFormat::AnimatedWebp;
    p.quality = config.quality;
    p.method = config.compression_effort;
    p.lossless = config.lossless;
    // 0 means exact reproduction, which libwebp spells as 100
    p.near_lossless = config.near_lossless ? 100 - std::clamp(*config.near_lossless, 0, 100) : 100;
    p.sharp_yuv = config.sharp_yuv;
    p.keep_alpha = config.pixel_format == PixelFormat::Yuva420p;
    p.allow_mixed = config.strategy == Strategy::Hybrid;
    if (config.delta_encoding) {
        p.kmin = kDeltaKeyframeMin;
        p.kmax = kDeltaKeyframeMax;
    } else {
        p.kmin = 0;
        p.kmax = 1;
    }
    p.loop_count = 0;
    return p;
}

std::optional<Candidate> CandidateEncoder::encode_one(const std::size_t index,
                                                      const EncodingConfig& config,
                                                      const EncodeSource& source,
                                                      EventBus* bus,
                                                      const std::stop_token st) const {
    const auto start = std::chrono::steady_clock::now();
    ScratchGuard guard(codec_);
    const std::string tag = source.scratch_name + ".cand" + std::to_string(index);

    std::string palette;
    FilterChain chain;
    try {
        if (config.use_palette) {
            palette = guard.own(source.scratch_name + ".palette_" + std::to_string(index) + ".png");

            // palette statistics come from the frames as they will be encoded
            EncodingConfig pre = config;
            pre.use_palette = false;
            FilterChain gen = build_filter_chain(pre, source);
            gen.add(PaletteGenStep{});

            CodecInvocation palette_inv;
            palette_inv.inputs = {source.scratch_name};
            palette_inv.filters = std::move(gen);
            palette_inv.params.format = OutputFormat::PalettePng;
            palette_inv.output = palette;
            codec_.run(palette_inv, st);
        }

        chain = build_filter_chain(config, source, palette);
        const std::string output = guard.own(tag + ".webp");

        CodecInvocation inv;
        inv.inputs = {source.scratch_name};
        if (!palette.empty()) inv.inputs.push_back(palette);
        inv.filters = chain;
        inv.params = build_output_params(config);
        inv.output = output;

        Logger::log(LogLevel::Debug, "Candidate " + std::to_string(index) + ": " + chain.describe() + " " +
                    inv.params.describe(), "candidate_encoder");
        codec_.run(inv, st);

        Candidate c;
        c.index = index;
        c.config = config;
        c.buffer = codec_.read_buffer(output);
        c.size_kb = static_cast<double>(c.buffer.size()) / 1024.0;
        c.filter_chain = chain.describe();

        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        Logger::log(LogLevel::Info, "Candidate " + std::to_string(index) + " (" + config.describe() + "): " +
                    std::to_string(c.size_kb) + " KB", "candidate_encoder");
        publish_if(bus, CandidateEncodedEvent{index, std::string(to_string(config.strategy)), c.size_kb, duration});
        return c;
    } catch (const CodecError& e) {
        const std::string described = chain.empty() ? build_filter_chain(config, source, palette).describe()
                                                    : chain.describe();
        Logger::log(LogLevel::Warning, "Candidate " + std::to_string(index) + " failed [" + described + "]: " +
                    e.what(), "candidate_encoder");
        publish_if(bus, CandidateFailedEvent{index, described, e.what()});
        return std::nullopt;
    }
}

std::vector<Candidate> CandidateEncoder::encode_all(const std::vector<EncodingConfig>& configs,
                                                    const EncodeSource& source,
                                                    EventBus* bus,
                                                    const std::stop_token st) const {
    const std::size_t total = configs.size();
    publish_if(bus, ProgressEvent{ProgressPhase::Encoding, encode_progress(0, total),
                                  "encoding " + std::to_string(total) + " candidates", std::nullopt, std::nullopt});

    auto done = std::make_shared<std::atomic<std::size_t>>(0);
    std::vector<std::future<std::optional<Candidate>>> futures;
    futures.reserve(total);
    for (std::size_t i = 0; i < total; ++i) {
        futures.push_back(pool_.enqueue([this, i, &configs, &source, bus, st, done, total](const std::stop_token& pool_st) {
            if (st.stop_requested() || pool_st.stop_requested()) {
                return std::optional<Candidate>{};
            }
            auto result = encode_one(i, configs[i], source, bus, st);
            const std::size_t finished = ++*done;
            publish_if(bus, ProgressEvent{ProgressPhase::Encoding, encode_progress(finished, total),
                                          "encoded " + std::to_string(finished) + "/" + std::to_string(total),
                                          std::nullopt, std::nullopt});
            return result;
        }));
    }

    // collect in generation order; every future is awaited before anything
    // is rethrown, the tasks reference configs and source
    std::vector<Candidate> candidates;
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            if (auto c = f.get()) {
                candidates.push_back(std::move(*c));
            }
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (st.stop_requested()) {
        throw OptimizationCancelled();
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
    if (candidates.empty()) {
        Logger::log(LogLevel::Error, "All " + std::to_string(total) + " configurations failed to encode",
                    "candidate_encoder");
        throw OptimizationFailed("no viable candidate: all " + std::to_string(total) + " configurations failed");
    }
    return candidates;
}

} // namespace anvil
