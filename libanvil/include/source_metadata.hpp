#ifndef ANVIL_SOURCE_METADATA_HPP
#define ANVIL_SOURCE_METADATA_HPP

#include <cstddef>
#include <cstdint>

namespace anvil {

/**
 * @brief Descriptive facts about the source animation.
 *
 * Produced once by the MetadataAnalyzer and read-only afterwards.
 */
struct SourceMetadata {
    uint32_t frame_count = 0;    ///< Frames the codec could extract
    double fps = 10.0;           ///< 1000 / average frame delay
    uint32_t width = 0;          ///< Canvas width
    uint32_t height = 0;         ///< Canvas height
    bool has_alpha = false;      ///< First snapshot carries an alpha channel
    uint32_t palette_size = 0;   ///< Global color table entries, 0 if absent
    uint64_t duration_ms = 0;    ///< Sum of frame delays
    std::size_t source_bytes = 0;///< Size of the source buffer
    double avg_bitrate_kbps = 0.0; ///< source_bytes * 8 / duration, in kbit/s
};

} // namespace anvil

#endif // ANVIL_SOURCE_METADATA_HPP
