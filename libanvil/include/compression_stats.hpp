#ifndef ANVIL_COMPRESSION_STATS_HPP
#define ANVIL_COMPRESSION_STATS_HPP

#include "source_metadata.hpp"
#include <cstddef>

namespace anvil {

/**
 * @brief Rough classification of bits per pixel.
 */
enum class CompressionGrade {
    Excellent, ///< < 1.0 bpp
    Good,      ///< < 2.0 bpp
    Fair,      ///< < 3.0 bpp
    Poor
};

[[nodiscard]] const char* to_string(CompressionGrade grade);

/**
 * @brief Size comparison between the source and the winning candidate.
 */
struct CompressionStats {
    double original_size_kb = 0.0;
    double compressed_size_kb = 0.0;
    double savings_kb = 0.0;          ///< May be negative
    double savings_percent = 0.0;     ///< savings / original * 100
    double compression_ratio = 0.0;   ///< compressed / original
    double bits_per_pixel = 0.0;      ///< compressed bits / (width * height * frames)
    bool is_larger_than_original = false;

    [[nodiscard]] CompressionGrade grade() const noexcept;
};

/**
 * @brief Computes the statistics of a run.
 *
 * Sizes are converted to KB (bytes / 1024) first; bits per pixel is
 * derived from the KB figure, `KB * 1024 * 8 / (w * h * frames)`, and is
 * 0 when the geometry is unknown.
 */
[[nodiscard]] CompressionStats compute_compression_stats(std::size_t original_bytes,
                                                         std::size_t compressed_bytes,
                                                         const SourceMetadata& meta);

/**
 * @brief Same computation from sizes already expressed in KB.
 */
[[nodiscard]] CompressionStats compute_compression_stats_kb(double original_kb,
                                                            double compressed_kb,
                                                            const SourceMetadata& meta);

} // namespace anvil

#endif // ANVIL_COMPRESSION_STATS_HPP
