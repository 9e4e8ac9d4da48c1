#include "../../include/metadata_analyzer.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/scratch_guard.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <numeric>

namespace anvil {

namespace {
    constexpr uint8_t kExtensionIntroducer = 0x21;
    constexpr uint8_t kImageSeparator = 0x2C;
    constexpr uint8_t kTrailer = 0x3B;
    constexpr uint8_t kGraphicControlLabel = 0xF9;
    constexpr uint32_t kMinDelayCs = 2;
    constexpr uint32_t kBrowserDelayCs = 10;

    constexpr std::array<uint8_t, 8> kPngSignature{0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

    uint32_t read_be32(const uint8_t* p) noexcept {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }

    // skips a chain of data sub-blocks starting at pos; returns false on truncation
    bool skip_sub_blocks(const std::span<const uint8_t> data, std::size_t& pos) {
        while (pos < data.size()) {
            const uint8_t len = data[pos++];
            if (len == 0) return true;
            pos += len;
        }
        return false;
    }

    uint32_t color_table_bytes(const uint8_t packed) noexcept {
        return (packed & 0x80) ? 3u * (1u << ((packed & 0x07) + 1)) : 0u;
    }

    double progress(const uint32_t done, const uint32_t expected) {
        // extracting spans 5% .. 20% of the run
        const double fraction = expected > 0 ? std::min(1.0, static_cast<double>(done) / expected) : 0.0;
        return 5.0 + 15.0 * fraction;
    }
}

bool is_gif(const std::span<const uint8_t> data) noexcept {
    if (data.size() < kGifHeaderSize) return false;
    return std::memcmp(data.data(), "GIF87a", 6) == 0 || std::memcmp(data.data(), "GIF89a", 6) == 0;
}

uint32_t gif_palette_size(const std::span<const uint8_t> data) noexcept {
    if (data.size() < kGifHeaderSize) return 0;
    const uint8_t packed = data[10];
    if ((packed & 0x80) == 0) return 0;
    return 1u << ((packed & 0x07) + 1);
}

std::vector<uint32_t> gif_frame_delays(const std::span<const uint8_t> data) {
    std::vector<uint32_t> delays;
    if (!is_gif(data)) return delays;

    std::size_t pos = kGifHeaderSize + color_table_bytes(data[10]);
    while (pos < data.size()) {
        const uint8_t block = data[pos++];
        if (block == kTrailer) break;

        if (block == kExtensionIntroducer) {
            if (pos >= data.size()) break;
            const uint8_t label = data[pos++];
            if (label == kGraphicControlLabel && pos + 5 <= data.size() && data[pos] == 4) {
                uint32_t delay_cs = data[pos + 2] | (static_cast<uint32_t>(data[pos + 3]) << 8);
                if (delay_cs < kMinDelayCs) delay_cs = kBrowserDelayCs;
                delays.push_back(delay_cs * 10);
            }
            if (!skip_sub_blocks(data, pos)) break;
        } else if (block == kImageSeparator) {
            // left, top, width, height (2 bytes each) + packed
            if (pos + 9 > data.size()) break;
            const uint8_t packed = data[pos + 8];
            pos += 9 + color_table_bytes(packed);
            // LZW minimum code size
            if (pos >= data.size()) break;
            ++pos;
            if (!skip_sub_blocks(data, pos)) break;
        } else {
            Logger::log(LogLevel::Debug, "Unknown GIF block " + std::to_string(block) + ", stopping timing scan",
                        "metadata");
            break;
        }
    }
    return delays;
}

std::optional<PngHeader> read_png_header(const std::span<const uint8_t> data) noexcept {
    // signature (8) + length (4) + "IHDR" (4) + width (4) + height (4) + depth (1) + color type (1)
    if (data.size() < 26) return std::nullopt;
    if (!std::equal(kPngSignature.begin(), kPngSignature.end(), data.begin())) return std::nullopt;
    if (std::memcmp(data.data() + 12, "IHDR", 4) != 0) return std::nullopt;

    PngHeader header;
    header.width = read_be32(data.data() + 16);
    header.height = read_be32(data.data() + 20);
    header.color_type = data[25];
    return header;
}

SourceMetadata MetadataAnalyzer::analyze(const std::string& source_name,
                                         const std::span<const uint8_t> source,
                                         EventBus* bus,
                                         const std::stop_token st) const {
    if (!is_gif(source)) {
        Logger::log(LogLevel::Error, "Source is not a GIF (bad signature or truncated header)", "metadata");
        throw InputError("source is not a GIF image");
    }

    SourceMetadata meta;
    meta.source_bytes = source.size();
    meta.palette_size = gif_palette_size(source);

    const auto delays = gif_frame_delays(source);
    const auto expected = static_cast<uint32_t>(std::min<std::size_t>(
        delays.empty() ? kMaxProbedFrames : delays.size(), kMaxProbedFrames));

    publish_if(bus, ProgressEvent{ProgressPhase::Extracting, progress(0, expected),
                                  "extracting frames", std::nullopt, std::nullopt});

    // probe frames one snapshot at a time until the codec refuses
    uint32_t count = 0;
    for (uint32_t i = 0; i < kMaxProbedFrames; ++i) {
        if (st.stop_requested()) {
            throw OptimizationCancelled();
        }

        ScratchGuard guard(codec_);
        const std::string snapshot = guard.own(source_name + ".frame" + std::to_string(i) + ".png");

        CodecInvocation inv;
        inv.inputs = {source_name};
        inv.filters.add(SelectFrameStep{i});
        inv.params.format = OutputFormat::Png;
        inv.output = snapshot;

        try {
            codec_.run(inv, st);
        } catch (const CodecError& e) {
            Logger::log(LogLevel::Debug, "Snapshot " + std::to_string(i) + " unavailable: " + e.what(), "metadata");
            break;
        }
        if (!codec_.has_buffer(snapshot)) break;

        if (i == 0) {
            const auto png = codec_.read_buffer(snapshot);
            const auto header = read_png_header(png);
            if (!header) {
                Logger::log(LogLevel::Error, "First frame snapshot is not a PNG", "metadata");
                throw InputError("first frame snapshot is not a PNG image");
            }
            meta.width = header->width;
            meta.height = header->height;
            meta.has_alpha = header->has_alpha();
        }
        ++count;

        if (count % 10 == 0) {
            publish_if(bus, ProgressEvent{ProgressPhase::Extracting, progress(count, expected),
                                          "extracted " + std::to_string(count) + " frames", count, expected});
        }
    }

    if (st.stop_requested()) {
        throw OptimizationCancelled();
    }
    if (count == 0) {
        Logger::log(LogLevel::Error, "No frame could be extracted from the source", "metadata");
        throw InputError("source contains no decodable frame");
    }
    meta.frame_count = count;

    if (!delays.empty()) {
        const uint64_t total = std::accumulate(delays.begin(), delays.end(), uint64_t{0});
        const double avg = static_cast<double>(total) / static_cast<double>(delays.size());
        meta.fps = 1000.0 / avg;
        meta.duration_ms = total;
    } else {
        meta.fps = kDefaultFps;
        meta.duration_ms = static_cast<uint64_t>(count) * static_cast<uint64_t>(1000.0 / kDefaultFps);
    }
    if (meta.duration_ms > 0) {
        meta.avg_bitrate_kbps = static_cast<double>(meta.source_bytes) * 8.0 /
                                (static_cast<double>(meta.duration_ms) / 1000.0) / 1000.0;
    }

    publish_if(bus, ProgressEvent{ProgressPhase::Extracting, progress(1, 1),
                                  "extracted " + std::to_string(count) + " frames", count, count});

    Logger::log(LogLevel::Info, "Source: " + std::to_string(meta.width) + "x" + std::to_string(meta.height) + ", " +
                std::to_string(meta.frame_count) + " frames, " + std::to_string(meta.fps) + " fps, palette " +
                std::to_string(meta.palette_size) + (meta.has_alpha ? ", alpha" : ""), "metadata");
    return meta;
}

} // namespace anvil
