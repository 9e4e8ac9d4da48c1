#include "../../include/compression_stats.hpp"

namespace anvil {

const char* to_string(const CompressionGrade grade) {
    switch (grade) {
        case CompressionGrade::Excellent: return "excellent";
        case CompressionGrade::Good:      return "good";
        case CompressionGrade::Fair:      return "fair";
        case CompressionGrade::Poor:      return "poor";
    }
    return "";
}

CompressionGrade CompressionStats::grade() const noexcept {
    if (bits_per_pixel < 1.0) return CompressionGrade::Excellent;
    if (bits_per_pixel < 2.0) return CompressionGrade::Good;
    if (bits_per_pixel < 3.0) return CompressionGrade::Fair;
    return CompressionGrade::Poor;
}

CompressionStats compute_compression_stats_kb(const double original_kb,
                                              const double compressed_kb,
                                              const SourceMetadata& meta) {
    CompressionStats s;
    s.original_size_kb = original_kb;
    s.compressed_size_kb = compressed_kb;
    s.savings_kb = original_kb - compressed_kb;
    s.savings_percent = original_kb > 0.0 ? s.savings_kb / original_kb * 100.0 : 0.0;
    s.compression_ratio = original_kb > 0.0 ? compressed_kb / original_kb : 0.0;
    s.is_larger_than_original = compressed_kb > original_kb;

    const double pixels = static_cast<double>(meta.width) * meta.height * meta.frame_count;
    s.bits_per_pixel = pixels > 0.0 ? compressed_kb * 1024.0 * 8.0 / pixels : 0.0;
    return s;
}

CompressionStats compute_compression_stats(const std::size_t original_bytes,
                                           const std::size_t compressed_bytes,
                                           const SourceMetadata& meta) {
    return compute_compression_stats_kb(static_cast<double>(original_bytes) / 1024.0,
                                        static_cast<double>(compressed_bytes) / 1024.0,
                                        meta);
}

} // namespace anvil
