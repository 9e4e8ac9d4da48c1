/**
 * @file candidate_generator.hpp
 * @brief Produces the ordered list of encoding configurations to try.
 */

#ifndef ANVIL_CANDIDATE_GENERATOR_HPP
#define ANVIL_CANDIDATE_GENERATOR_HPP

#include "encoding_config.hpp"
#include "source_metadata.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace anvil {

/// Hard upper bound on configurations per run.
inline constexpr std::size_t kMaxCandidates = 10;
/// Configurations kept in size-preserving mode.
inline constexpr std::size_t kSizeModeCap = 6;
/// Animations longer than this always get duplicate removal and delta encoding.
inline constexpr uint32_t kDedupFrameThreshold = 20;
/// A keep list retaining less than this share of frames enables duplicate removal.
inline constexpr double kDedupKeepRatio = 0.9;

/**
 * @brief What the search optimizes for.
 */
enum class OptimizationMode {
    QualityPreserving, ///< Lossless and near-lossless first
    SizePreserving     ///< Lossy with palette reduction
};

[[nodiscard]] const char* to_string(OptimizationMode mode);

/**
 * @brief Deterministic candidate configuration generator.
 *
 * @details The list depends only on the metadata, the mode and the keep
 * list. It is never empty and never longer than the configured maximum
 * (itself capped at kMaxCandidates). Within a list, earlier entries win
 * score ties during selection.
 */
class CandidateGenerator {
public:
    /**
     * @param max_candidates Truncation length, clamped to [1, kMaxCandidates].
     */
    explicit CandidateGenerator(std::size_t max_candidates = kMaxCandidates);

    /**
     * @param meta Source description.
     * @param mode Search mode.
     * @param frames_to_keep Result of frame deduplication, if it ran.
     */
    [[nodiscard]] std::vector<EncodingConfig> generate(const SourceMetadata& meta,
                                                       OptimizationMode mode,
                                                       const std::optional<std::vector<uint32_t>>& frames_to_keep = std::nullopt) const;

    /**
     * @brief Whether duplicate removal and delta encoding are worth enabling.
     */
    [[nodiscard]] static bool wants_frame_reduction(const SourceMetadata& meta,
                                                    const std::optional<std::vector<uint32_t>>& frames_to_keep);

private:
    [[nodiscard]] static std::vector<EncodingConfig> quality_preserving(const SourceMetadata& meta);
    [[nodiscard]] static std::vector<EncodingConfig> size_preserving(const SourceMetadata& meta);

    std::size_t max_candidates_;
};

} // namespace anvil

#endif // ANVIL_CANDIDATE_GENERATOR_HPP
