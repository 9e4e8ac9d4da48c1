#include "../../include/optimizer.hpp"
#include "../../include/candidate_encoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/metadata_analyzer.hpp"
#include "../../include/random_utils.hpp"
#include "../../include/scratch_guard.hpp"
#include <exception>
#include <string>

namespace anvil {

namespace {
    void throw_if_stopped(const std::stop_token& st) {
        if (st.stop_requested()) {
            Logger::log(LogLevel::Info, "Optimization cancelled", "optimizer");
            throw OptimizationCancelled();
        }
    }
}

Optimizer::Optimizer(ICodecService& codec, const IPixelDecoder& decoder, OptimizerOptions options)
    : codec_(codec),
      decoder_(decoder),
      options_(options),
      pool_(options.threads) {}

void Optimizer::request_stop() {
    std::lock_guard lock(stop_mutex_);
    stop_source_.request_stop();
}

OptimizationResult Optimizer::optimize(const std::span<const uint8_t> source,
                                       const OptimizationMode mode,
                                       EventBus* bus) {
    const auto start = std::chrono::steady_clock::now();
    std::stop_token st;
    {
        std::lock_guard lock(stop_mutex_);
        st = stop_source_.get_token();
    }
    // the next run starts with a fresh stop state, however this one ends
    struct StopReset {
        Optimizer& self;
        ~StopReset() {
            std::lock_guard lock(self.stop_mutex_);
            self.stop_source_ = std::stop_source{};
        }
    } reset_stop{*this};
    throw_if_stopped(st);

    publish_if(bus, ProgressEvent{ProgressPhase::Loading, 0.0, "loading source", std::nullopt, std::nullopt});

    if (source.empty()) {
        Logger::log(LogLevel::Error, "Empty source buffer", "optimizer");
        throw InputError("source buffer is empty");
    }
    if (!is_gif(source)) {
        Logger::log(LogLevel::Error, "Source is not a GIF (bad signature or truncated header)", "optimizer");
        throw InputError("source is not a GIF image");
    }

    ScratchGuard guard(codec_);
    const std::string source_name = guard.own("src_" + RandomUtils::random_suffix() + ".gif");
    codec_.write_buffer(source_name, std::vector<uint8_t>(source.begin(), source.end()));

    publish_if(bus, ProgressEvent{ProgressPhase::Loading, 5.0, "source loaded (" +
                                  std::to_string(source.size() / 1024) + " KB)", std::nullopt, std::nullopt});

    // frame analysis runs beside the metadata analyzer
    std::optional<DedupResult> dedup;
    std::exception_ptr dedup_error;
    std::jthread dedup_worker;
    if (options_.enable_dedup) {
        dedup_worker = std::jthread([this, source, bus, &dedup, &dedup_error](const std::stop_token& worker_st) {
            try {
                const auto frames = decoder_.decode_frames(source);
                const FrameDedupAnalyzer analyzer(options_.dedup_threshold, 20.0, 30.0);
                dedup = analyzer.analyze(frames, bus, worker_st);
            } catch (...) {
                dedup_error = std::current_exception();
            }
        });
    }
    // a run-level stop also interrupts the worker
    std::stop_callback forward_stop(st, [&dedup_worker] { dedup_worker.request_stop(); });

    const MetadataAnalyzer metadata_analyzer(codec_);
    const SourceMetadata meta = metadata_analyzer.analyze(source_name, source, bus, st);

    if (dedup_worker.joinable()) {
        dedup_worker.join();
    }
    throw_if_stopped(st);
    if (dedup_error) {
        try {
            std::rethrow_exception(dedup_error);
        } catch (const OptimizationFailed&) {
            throw;
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning, std::string("Frame analysis failed, continuing without it: ") + e.what(),
                        "optimizer");
            dedup.reset();
        }
    }

    std::optional<std::vector<uint32_t>> frames_to_keep;
    if (dedup) {
        frames_to_keep = dedup->frames_to_keep;
    }

    const CandidateGenerator generator(options_.max_candidates);
    const auto configs = generator.generate(meta, mode, frames_to_keep);
    throw_if_stopped(st);

    const CandidateEncoder encoder(codec_, pool_);
    const EncodeSource encode_source{source_name, meta, frames_to_keep};
    auto candidates = encoder.encode_all(configs, encode_source, bus, st);
    throw_if_stopped(st);

    PixelGrid reference;
    try {
        reference = decoder_.decode_first_frame(source);
    } catch (const DecodeError& e) {
        Logger::log(LogLevel::Error, std::string("Cannot decode the first source frame: ") + e.what(), "optimizer");
        throw InputError(std::string("cannot decode the first source frame: ") + e.what());
    }

    const SelectionPolicy policy(decoder_, pool_, mode);
    Selection selection = policy.select(candidates, reference, bus, st);

    Candidate& winner = candidates[selection.position];

    OptimizationResult result;
    result.stats = compute_compression_stats(source.size(), winner.buffer.size(), meta);
    result.buffer = std::move(winner.buffer);
    result.config = winner.config;
    result.metrics = selection.metrics;
    result.metadata = meta;
    result.dedup = std::move(dedup);
    result.evaluations = std::move(selection.evaluations);
    result.winner_index = winner.index;
    result.fallback = selection.fallback;
    result.configurations = configs.size();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    if (result.stats.is_larger_than_original) {
        Logger::log(LogLevel::Warning, "Best candidate is larger than the source", "optimizer");
    }
    Logger::log(LogLevel::Info, "Optimized " + std::to_string(source.size()) + " -> " +
                std::to_string(result.buffer.size()) + " bytes (" + std::to_string(result.stats.savings_percent) +
                "% saved) in " + std::to_string(result.elapsed.count()) + " ms", "optimizer");

    publish_if(bus, OptimizationCompleteEvent{result.winner_index, result.fallback,
                                              source.size(), result.buffer.size(), result.elapsed});
    publish_if(bus, ProgressEvent{ProgressPhase::Complete, 100.0, "done", std::nullopt, std::nullopt});
    return result;
}

} // namespace anvil
