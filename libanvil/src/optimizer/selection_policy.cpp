#include "../../include/selection_policy.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <memory>

namespace anvil {

namespace {
    // evaluating spans 75% .. 95% of the run
    double evaluate_progress(const std::size_t done, const std::size_t total) {
        return 75.0 + 20.0 * (total > 0 ? static_cast<double>(done) / static_cast<double>(total) : 1.0);
    }
}

StrategyThresholds thresholds_for(const Strategy strategy) {
    switch (strategy) {
        case Strategy::PureLossless:   return {0.99, std::nullopt, std::nullopt};
        case Strategy::NearLossless:   return {0.97, 3.0, 0.93};
        case Strategy::Hybrid:         return {0.96, 4.0, 0.92};
        case Strategy::OptimizedLossy: return {0.95, 5.0, 0.90};
    }
    return {};
}

ScoreWeights weights_for(const OptimizationMode mode) {
    return mode == OptimizationMode::QualityPreserving ? ScoreWeights{0.5, 0.5} : ScoreWeights{0.7, 0.3};
}

double quality_score(const QualityMetrics& m) {
    return 0.4 * m.ssim +
           0.3 * (1.0 - std::min(m.delta_e / kDeltaENormalization, 1.0)) +
           0.3 * m.edge_preservation;
}

double candidate_score(const QualityMetrics& m, const double size_kb, const ScoreWeights& w) {
    const double size_score = size_kb > 0.0 ? 1.0 / size_kb : 0.0;
    return quality_score(m) * w.quality + size_score * w.size;
}

bool meets_thresholds(const Strategy strategy, const QualityMetrics& m) {
    const auto t = thresholds_for(strategy);
    if (m.ssim < t.min_ssim) return false;
    if (t.max_delta_e && m.delta_e > *t.max_delta_e) return false;
    if (t.min_edge_preservation && m.edge_preservation < *t.min_edge_preservation) return false;
    return true;
}

std::optional<WinnerChoice> choose_winner(const std::vector<CandidateEvaluation>& evaluations) {
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < evaluations.size(); ++i) {
        const auto& e = evaluations[i];
        if (!e.evaluated() || !e.qualified) continue;
        if (!best || e.score > evaluations[*best].score) {
            best = i;
        }
    }
    if (best) {
        return WinnerChoice{*best, false};
    }

    // nothing qualified: highest configured quality among evaluated ones
    for (std::size_t i = 0; i < evaluations.size(); ++i) {
        const auto& e = evaluations[i];
        if (!e.evaluated()) continue;
        if (!best || e.config.quality > evaluations[*best].config.quality) {
            best = i;
        }
    }
    if (best) {
        return WinnerChoice{*best, true};
    }
    return std::nullopt;
}

CandidateEvaluation SelectionPolicy::evaluate(const Candidate& candidate, const PixelGrid& reference) const {
    CandidateEvaluation e;
    e.index = candidate.index;
    e.config = candidate.config;
    e.size_kb = candidate.size_kb;
    e.filter_chain = candidate.filter_chain;

    try {
        const PixelGrid decoded = decoder_.decode_first_frame(candidate.buffer);
        e.metrics = compute_quality_metrics(reference, decoded);
    } catch (const DecodeError& ex) {
        e.exclusion_reason = std::string("decode failed: ") + ex.what();
    } catch (const DimensionMismatchError& ex) {
        e.exclusion_reason = std::string("dimension mismatch: ") + ex.what();
    }

    if (!e.metrics) {
        Logger::log(LogLevel::Warning, "Candidate " + std::to_string(e.index) + " excluded, " + e.exclusion_reason,
                    "selection");
        return e;
    }

    e.strategy_passed = meets_thresholds(e.config.strategy, *e.metrics);
    e.qualified = e.strategy_passed || e.metrics->ssim >= kRelaxedSsimThreshold;
    e.score = candidate_score(*e.metrics, e.size_kb, weights_);

    Logger::log(LogLevel::Debug, "Candidate " + std::to_string(e.index) +
                ": ssim=" + std::to_string(e.metrics->ssim) +
                " psnr=" + std::to_string(e.metrics->psnr) +
                " dE=" + std::to_string(e.metrics->delta_e) +
                " edge=" + std::to_string(e.metrics->edge_preservation) +
                " score=" + std::to_string(e.score) +
                (e.qualified ? " qualified" : ""), "selection");
    return e;
}

Selection SelectionPolicy::select(const std::vector<Candidate>& candidates,
                                  const PixelGrid& reference,
                                  EventBus* bus,
                                  const std::stop_token st) const {
    const std::size_t total = candidates.size();
    publish_if(bus, ProgressEvent{ProgressPhase::Evaluating, evaluate_progress(0, total),
                                  "evaluating " + std::to_string(total) + " candidates", std::nullopt, std::nullopt});

    auto done = std::make_shared<std::atomic<std::size_t>>(0);
    std::vector<std::future<std::optional<CandidateEvaluation>>> futures;
    futures.reserve(total);
    for (const auto& candidate : candidates) {
        futures.push_back(pool_.enqueue([this, &candidate, &reference, bus, st, done, total](const std::stop_token& pool_st) {
            if (st.stop_requested() || pool_st.stop_requested()) {
                return std::optional<CandidateEvaluation>{};
            }
            auto e = evaluate(candidate, reference);
            publish_if(bus, CandidateEvaluatedEvent{e.index, e.evaluated(), e.qualified,
                                                    e.metrics ? e.metrics->ssim : 0.0, e.score});
            const std::size_t finished = ++*done;
            publish_if(bus, ProgressEvent{ProgressPhase::Evaluating, evaluate_progress(finished, total),
                                          "evaluated " + std::to_string(finished) + "/" + std::to_string(total),
                                          std::nullopt, std::nullopt});
            return std::optional<CandidateEvaluation>{std::move(e)};
        }));
    }

    Selection selection;
    selection.evaluations.reserve(total);
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            if (auto e = f.get()) {
                selection.evaluations.push_back(std::move(*e));
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
    if (selection.evaluations.size() != total) {
        throw OptimizationCancelled();
    }

    const auto choice = choose_winner(selection.evaluations);
    if (!choice) {
        Logger::log(LogLevel::Error, "None of the " + std::to_string(total) + " candidates could be evaluated",
                    "selection");
        throw OptimizationFailed("no candidate could be evaluated against the source");
    }

    selection.position = choice->position;
    selection.fallback = choice->fallback;

    // final metrics for the winner
    const Candidate& winner = candidates[selection.position];
    try {
        selection.metrics = compute_quality_metrics(reference, decoder_.decode_first_frame(winner.buffer));
    } catch (const DecodeError& ex) {
        Logger::log(LogLevel::Warning, std::string("Re-evaluating the winner failed, keeping its first metrics: ") +
                    ex.what(), "selection");
        selection.metrics = *selection.evaluations[selection.position].metrics;
    }

    if (selection.fallback) {
        Logger::log(LogLevel::Warning, "No candidate met its quality thresholds, falling back to candidate " +
                    std::to_string(winner.index) + " (q" + std::to_string(winner.config.quality) + ")", "selection");
    } else {
        Logger::log(LogLevel::Info, "Selected candidate " + std::to_string(winner.index) + " (" +
                    winner.config.describe() + ")", "selection");
    }
    return selection;
}

} // namespace anvil
