/**
 * @file selection_policy.hpp
 * @brief Scores candidates against the source and picks the winner.
 */

#ifndef ANVIL_SELECTION_POLICY_HPP
#define ANVIL_SELECTION_POLICY_HPP

#include "candidate_encoder.hpp"
#include "candidate_generator.hpp"
#include "event_bus.hpp"
#include "pixel_decoder.hpp"
#include "quality_metrics.hpp"
#include "thread_pool.hpp"
#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace anvil {

/**
 * @brief Acceptance thresholds of one strategy. Unset bounds are not checked.
 */
struct StrategyThresholds {
    double min_ssim = 0.0;
    std::optional<double> max_delta_e;
    std::optional<double> min_edge_preservation;
};

/// SSIM at or above which any candidate qualifies, whatever its strategy.
inline constexpr double kRelaxedSsimThreshold = 0.92;
/// Delta E at which the colour term of the quality score reaches zero.
inline constexpr double kDeltaENormalization = 10.0;

/**
 * @brief Weights of the final score.
 */
struct ScoreWeights {
    double quality = 0.7;
    double size = 0.3;
};

[[nodiscard]] StrategyThresholds thresholds_for(Strategy strategy);

/**
 * @return (0.5, 0.5) in quality-preserving mode, (0.7, 0.3) otherwise.
 */
[[nodiscard]] ScoreWeights weights_for(OptimizationMode mode);

/**
 * @brief 0.4 ssim + 0.3 (1 - min(deltaE / 10, 1)) + 0.3 edgePreservation.
 */
[[nodiscard]] double quality_score(const QualityMetrics& m);

/**
 * @brief quality_score * wq + (1 / size_kb) * ws.
 */
[[nodiscard]] double candidate_score(const QualityMetrics& m, double size_kb, const ScoreWeights& w);

/**
 * @brief True if the metrics satisfy every bound of the strategy.
 */
[[nodiscard]] bool meets_thresholds(Strategy strategy, const QualityMetrics& m);

/**
 * @brief Outcome of scoring one candidate.
 */
struct CandidateEvaluation {
    std::size_t index = 0;                 ///< Generation index
    EncodingConfig config;                 ///< Configuration of the candidate
    double size_kb = 0.0;                  ///< Encoded size
    std::string filter_chain;              ///< Filter chain it was encoded with
    std::optional<QualityMetrics> metrics; ///< Unset if the candidate could not be compared
    bool strategy_passed = false;          ///< Met its own strategy thresholds
    bool qualified = false;                ///< strategy_passed or SSIM >= kRelaxedSsimThreshold
    double score = 0.0;                    ///< Weighted score (0 if not evaluated)
    std::string exclusion_reason;          ///< Why metrics are missing

    [[nodiscard]] bool evaluated() const noexcept { return metrics.has_value(); }
};

/**
 * @brief Winner position in a list of evaluations.
 */
struct WinnerChoice {
    std::size_t position = 0; ///< Index into the evaluation list
    bool fallback = false;    ///< True if no candidate qualified
};

/**
 * @brief Applies the winner rule to finished evaluations.
 *
 * Highest score among qualifying candidates, earlier position on ties.
 * Without a qualifier: the evaluated candidate with the highest
 * configured quality, earlier position on ties.
 *
 * @return std::nullopt if nothing was evaluated.
 */
[[nodiscard]] std::optional<WinnerChoice> choose_winner(const std::vector<CandidateEvaluation>& evaluations);

/**
 * @brief Result of a selection pass.
 */
struct Selection {
    std::size_t position = 0;                     ///< Position of the winner in the candidate list
    bool fallback = false;                        ///< Winner picked by the fallback rule
    QualityMetrics metrics;                       ///< Metrics recomputed for the winner
    std::vector<CandidateEvaluation> evaluations; ///< One per candidate, in candidate order
};

/**
 * @brief Selection Policy.
 *
 * @details Decodes the first frame of every candidate, compares it with
 * the reference frame (concurrently on the pool), applies the strategy
 * thresholds and the scoring rule, and falls back to the highest
 * configured quality when nothing qualifies.
 */
class SelectionPolicy {
public:
    SelectionPolicy(const IPixelDecoder& decoder, ThreadPool& pool, OptimizationMode mode)
        : decoder_(decoder), pool_(pool), weights_(weights_for(mode)) {}

    /**
     * @brief Scores a single candidate. Decode failures and geometry
     * mismatches are recorded in the evaluation, never thrown.
     */
    [[nodiscard]] CandidateEvaluation evaluate(const Candidate& candidate, const PixelGrid& reference) const;

    /**
     * @brief Evaluates every candidate and picks the winner.
     * @throws OptimizationFailed if no candidate could be evaluated.
     * @throws OptimizationCancelled if @p st was signalled.
     */
    [[nodiscard]] Selection select(const std::vector<Candidate>& candidates,
                                   const PixelGrid& reference,
                                   EventBus* bus = nullptr,
                                   std::stop_token st = {}) const;

private:
    const IPixelDecoder& decoder_;
    ThreadPool& pool_;
    ScoreWeights weights_;
};

} // namespace anvil

#endif // ANVIL_SELECTION_POLICY_HPP
