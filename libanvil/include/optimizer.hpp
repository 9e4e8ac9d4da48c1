/**
 * @file optimizer.hpp
 * @brief Orchestrates one GIF to WebP optimization run.
 */

#ifndef ANVIL_OPTIMIZER_HPP
#define ANVIL_OPTIMIZER_HPP

#include "candidate_generator.hpp"
#include "codec_service.hpp"
#include "compression_stats.hpp"
#include "encoding_config.hpp"
#include "event_bus.hpp"
#include "frame_dedup.hpp"
#include "pixel_decoder.hpp"
#include "quality_metrics.hpp"
#include "selection_policy.hpp"
#include "source_metadata.hpp"
#include "thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <thread>
#include <vector>

namespace anvil {

/**
 * @brief Library-level tuning of an Optimizer.
 */
struct OptimizerOptions {
    unsigned threads = std::max(1u, std::thread::hardware_concurrency() / 2); ///< Pool size
    bool enable_dedup = true;                         ///< Run the frame deduplication analyzer
    std::size_t dedup_threshold = kDefaultDedupThreshold; ///< Hamming distance threshold
    std::size_t max_candidates = kMaxCandidates;      ///< Truncation of the generated list
};

/**
 * @brief Everything a successful run produces.
 */
struct OptimizationResult {
    std::vector<uint8_t> buffer;                  ///< Winning animated WebP
    EncodingConfig config;                        ///< Its configuration
    QualityMetrics metrics;                       ///< Its metrics against the first source frame
    SourceMetadata metadata;                      ///< Source description
    CompressionStats stats;                       ///< Size comparison
    std::optional<DedupResult> dedup;             ///< Frame analysis, when it ran
    std::vector<CandidateEvaluation> evaluations; ///< One per encoded candidate
    std::size_t winner_index = 0;                 ///< Generation index of the winner
    bool fallback = false;                        ///< Winner chosen by the fallback rule
    std::size_t configurations = 0;               ///< Configurations generated
    std::chrono::milliseconds elapsed{0};         ///< Wall time of the run
};

/**
 * @brief Quality-guided optimizer.
 *
 * @details Pipeline: validate, stage the source in the codec scratch
 * space, analyze frames on a worker thread while the metadata analyzer
 * runs, generate configurations, encode them on the pool, compare each
 * candidate with the first source frame and select the winner.
 *
 * No state survives between runs except the thread pool. Every scratch
 * buffer a run creates is removed before optimize() returns or throws.
 */
class Optimizer {
public:
    Optimizer(ICodecService& codec, const IPixelDecoder& decoder, OptimizerOptions options = {});

    Optimizer(const Optimizer&) = delete;
    Optimizer& operator=(const Optimizer&) = delete;

    /**
     * @brief Runs the full search.
     * @param source Raw GIF bytes.
     * @param mode Quality- or size-preserving search.
     * @param bus Optional progress and candidate event bus.
     * @throws InputError if the source is unusable.
     * @throws OptimizationCancelled if request_stop() was called.
     * @throws OptimizationFailed if no candidate could be produced or evaluated.
     */
    [[nodiscard]] OptimizationResult optimize(std::span<const uint8_t> source,
                                              OptimizationMode mode,
                                              EventBus* bus = nullptr);

    /**
     * @brief Asks the running optimize() call to stop. Thread-safe.
     *
     * A request made while no run is active cancels the next one. Every run
     * clears the request when it returns.
     */
    void request_stop();

    [[nodiscard]] const OptimizerOptions& options() const noexcept { return options_; }

private:
    ICodecService& codec_;
    const IPixelDecoder& decoder_;
    OptimizerOptions options_;
    ThreadPool pool_;

    std::mutex stop_mutex_;
    std::stop_source stop_source_;
};

} // namespace anvil

#endif // ANVIL_OPTIMIZER_HPP
