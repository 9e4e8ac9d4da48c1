#ifndef ANVIL_EVENTS_HPP
#define ANVIL_EVENTS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace anvil {

/**
 * @brief Events published on the EventBus during an optimization run.
 *
 * These are plain data carriers. Consumers may ignore any of them without
 * affecting the result of the run.
 */

/**
 * @brief Coarse phase of the run a ProgressEvent belongs to.
 */
enum class ProgressPhase {
    Loading,    ///< Reading and validating the source
    Extracting, ///< Decoding frames / snapshots
    Analyzing,  ///< Metadata analysis and frame deduplication
    Encoding,   ///< Candidate encodes
    Evaluating, ///< Quality metrics and selection
    Complete    ///< Run finished
};

/**
 * @return Lower-case phase name ("loading", "analyzing", ...).
 */
inline std::string_view to_string(const ProgressPhase phase) {
    switch (phase) {
        case ProgressPhase::Loading:    return "loading";
        case ProgressPhase::Extracting: return "extracting";
        case ProgressPhase::Analyzing:  return "analyzing";
        case ProgressPhase::Encoding:   return "encoding";
        case ProgressPhase::Evaluating: return "evaluating";
        case ProgressPhase::Complete:   return "complete";
    }
    return "";
}

/**
 * @brief Incremental progress update.
 */
struct ProgressEvent {
    ProgressPhase phase = ProgressPhase::Loading; ///< Current phase
    double percent = 0.0;                         ///< Overall progress in [0, 100]
    std::string message;                          ///< Human-readable status line
    std::optional<uint32_t> current_frame;        ///< Frame being processed, when frame-based
    std::optional<uint32_t> total_frames;         ///< Total frames, when frame-based
};

// --- Candidates ---

/**
 * @brief Emitted when a configuration produced a candidate buffer.
 */
struct CandidateEncodedEvent {
    std::size_t index = 0;                 ///< Generation index of the configuration
    std::string strategy;                  ///< Strategy tag of the configuration
    double size_kb = 0.0;                  ///< Size of the encoded candidate
    std::chrono::milliseconds duration{0}; ///< Encode duration
};

/**
 * @brief Emitted when the codec rejected a configuration.
 */
struct CandidateFailedEvent {
    std::size_t index = 0;     ///< Generation index of the configuration
    std::string filter_chain;  ///< Filter chain that was attempted
    std::string error_message; ///< Codec error description
};

/**
 * @brief Emitted after a candidate has been scored (or excluded).
 */
struct CandidateEvaluatedEvent {
    std::size_t index = 0;     ///< Generation index of the candidate
    bool evaluated = false;    ///< False when decoding or comparison failed
    bool qualified = false;    ///< Met its strategy thresholds or the relaxed one
    double ssim = 0.0;         ///< SSIM against the reference (if evaluated)
    double score = 0.0;        ///< Weighted score (qualified candidates only)
};

// --- Completion ---

/**
 * @brief Emitted once a winner has been selected.
 */
struct OptimizationCompleteEvent {
    std::size_t winner_index = 0;          ///< Generation index of the winner
    bool fallback = false;                 ///< True if no candidate qualified
    uintmax_t original_size = 0;           ///< Source size in bytes
    uintmax_t new_size = 0;                ///< Winner size in bytes
    std::chrono::milliseconds duration{0}; ///< Total run duration
};

} // namespace anvil

#endif // ANVIL_EVENTS_HPP
