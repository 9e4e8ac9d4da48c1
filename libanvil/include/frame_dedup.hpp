/**
 * @file frame_dedup.hpp
 * @brief Perceptual-hash based collapsing of near-identical consecutive frames.
 */

#ifndef ANVIL_FRAME_DEDUP_HPP
#define ANVIL_FRAME_DEDUP_HPP

#include "event_bus.hpp"
#include "pixel_grid.hpp"
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <vector>

namespace anvil {

/// Cells per side of the hash grid; the hash has kHashGrid^2 bits.
inline constexpr uint32_t kHashGrid = 16;
/// Frames whose Hamming distance to the anchor is at most this are duplicates.
inline constexpr std::size_t kDefaultDedupThreshold = 3;
/// Delay assumed for frames that carry none.
inline constexpr uint32_t kDefaultFrameDelayMs = 100;

using PerceptualHash = std::bitset<kHashGrid * kHashGrid>;

/**
 * @brief Hash and geometry of one decoded frame.
 */
struct FrameRecord {
    uint32_t index = 0;     ///< Position in the source animation
    PerceptualHash hash;    ///< 256-bit average hash
    uint32_t width = 0;     ///< Frame width
    uint32_t height = 0;    ///< Frame height
    uint32_t delay_ms = 0;  ///< Display duration
};

/**
 * @brief Outcome of a deduplication pass.
 */
struct DedupResult {
    std::vector<uint32_t> frames_to_keep{0}; ///< Strictly increasing, always starts with 0
    uint32_t total_frames = 0;               ///< Frames in the source (decodable or not)
    uint32_t unique_frames = 1;              ///< frames_to_keep.size()
    uint32_t duplicate_frames = 0;           ///< total_frames - unique_frames
    double compression_ratio = 1.0;          ///< unique_frames / total_frames
    double avg_delay_ms = kDefaultFrameDelayMs; ///< Mean delay of decodable frames
    double fps = 10.0;                       ///< round(1000 / avg_delay_ms)
    bool has_alpha = false;                  ///< First decodable frame has transparency
};

/**
 * @brief Computes the 16x16 average hash of a frame.
 *
 * Each cell averages (R+G+B)/3 over all of its pixels; the bit is set if
 * that gray level is above 128. Images narrower or shorter than 16 pixels
 * use one-pixel cells.
 */
[[nodiscard]] PerceptualHash compute_perceptual_hash(const PixelGrid& frame);

/**
 * @brief Number of differing bits.
 */
[[nodiscard]] inline std::size_t hamming_distance(const PerceptualHash& a, const PerceptualHash& b) noexcept {
    return (a ^ b).count();
}

/**
 * @brief Greedy forward pass over hashed frames.
 *
 * The last kept frame is the anchor; a frame is kept when its distance
 * to the anchor exceeds @p threshold. Entries without a value (frames
 * that failed to decode) are never kept. Index 0 is always kept.
 *
 * @param records One entry per source frame, in order.
 * @param threshold Maximum Hamming distance still considered a duplicate.
 */
[[nodiscard]] std::vector<uint32_t> select_frames_to_keep(const std::vector<std::optional<FrameRecord>>& records,
                                                          std::size_t threshold = kDefaultDedupThreshold);

/**
 * @brief Runs hashing and duplicate detection over a decoded animation.
 *
 * @details Designed to run on its own thread: it only reads the frames it
 * is given, reports progress through the optional bus in the `analyzing`
 * phase, and returns early (with what it has) when @p st is signalled.
 */
class FrameDedupAnalyzer {
public:
    /**
     * @param threshold Hamming distance threshold.
     * @param progress_from Overall percent reported at the start.
     * @param progress_to Overall percent reported at the end.
     */
    explicit FrameDedupAnalyzer(std::size_t threshold = kDefaultDedupThreshold,
                                double progress_from = 0.0,
                                double progress_to = 100.0);

    /**
     * @brief Analyze a sequence of decode results.
     * @param frames One entry per source frame; std::nullopt marks a decode failure.
     * @param bus Optional bus receiving ProgressEvent updates.
     * @param st Stop token checked between frames.
     */
    [[nodiscard]] DedupResult analyze(const std::vector<std::optional<DecodedFrame>>& frames,
                                      EventBus* bus = nullptr,
                                      std::stop_token st = {}) const;

private:
    [[nodiscard]] double scaled(double fraction) const noexcept;

    std::size_t threshold_;
    double progress_from_;
    double progress_to_;
};

} // namespace anvil

#endif // ANVIL_FRAME_DEDUP_HPP
