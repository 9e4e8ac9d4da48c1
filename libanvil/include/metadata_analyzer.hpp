/**
 * @file metadata_analyzer.hpp
 * @brief Extracts frame count, timing, geometry, alpha and palette size from a GIF.
 */

#ifndef ANVIL_METADATA_ANALYZER_HPP
#define ANVIL_METADATA_ANALYZER_HPP

#include "codec_service.hpp"
#include "event_bus.hpp"
#include "source_metadata.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace anvil {

/// Upper bound on the number of frames probed.
inline constexpr uint32_t kMaxProbedFrames = 1000;
/// Frame rate assumed when the source carries no delays.
inline constexpr double kDefaultFps = 10.0;
/// Length of the GIF header plus logical screen descriptor.
inline constexpr std::size_t kGifHeaderSize = 13;

/**
 * @brief Fields of a PNG IHDR chunk.
 */
struct PngHeader {
    uint32_t width = 0;
    uint32_t height = 0;
    uint8_t color_type = 0;

    /// Color types 4 (gray+alpha) and 6 (RGBA).
    [[nodiscard]] bool has_alpha() const noexcept { return color_type == 4 || color_type == 6; }
};

/**
 * @brief True if @p data starts with "GIF87a" or "GIF89a" and holds a full screen descriptor.
 */
[[nodiscard]] bool is_gif(std::span<const uint8_t> data) noexcept;

/**
 * @brief Global color table size from the logical screen descriptor.
 * @return 2^(N+1) when the table flag is set, 0 otherwise.
 */
[[nodiscard]] uint32_t gif_palette_size(std::span<const uint8_t> data) noexcept;

/**
 * @brief Frame delays (in ms) found in the Graphic Control Extensions.
 *
 * Delays below 2 centiseconds are counted as 10 centiseconds, the way
 * browsers play them. The walk stops quietly at the trailer or at the
 * first truncated block.
 */
[[nodiscard]] std::vector<uint32_t> gif_frame_delays(std::span<const uint8_t> data);

/**
 * @brief Reads the IHDR of a PNG buffer.
 * @return std::nullopt if the buffer is not a PNG.
 */
[[nodiscard]] std::optional<PngHeader> read_png_header(std::span<const uint8_t> data) noexcept;

/**
 * @brief Builds a SourceMetadata record for a source stored in the codec scratch space.
 *
 * @details The frame count is established by asking the codec for a
 * lossless PNG snapshot of each frame until the first failure (or
 * kMaxProbedFrames). Snapshots are removed right after they are checked.
 */
class MetadataAnalyzer {
public:
    explicit MetadataAnalyzer(ICodecService& codec) : codec_(codec) {}

    /**
     * @param source_name Scratch name the source was written to.
     * @param source The same bytes, for header parsing.
     * @param bus Optional progress bus (`extracting` phase).
     * @param st Checked between snapshots.
     * @throws InputError if the source is not a GIF or yields no frame.
     * @throws OptimizationCancelled if @p st is signalled.
     */
    [[nodiscard]] SourceMetadata analyze(const std::string& source_name,
                                         std::span<const uint8_t> source,
                                         EventBus* bus = nullptr,
                                         std::stop_token st = {}) const;

private:
    ICodecService& codec_;
};

} // namespace anvil

#endif // ANVIL_METADATA_ANALYZER_HPP
