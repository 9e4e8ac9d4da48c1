#include "../../include/frame_dedup.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace anvil {

namespace {
    constexpr uint32_t kProgressEvery = 10;

    // half-open pixel span [begin, end) covered by cell i of n along a side of `extent` pixels
    std::pair<uint32_t, uint32_t> cell_span(const uint32_t i, const uint32_t extent) {
        if (extent < kHashGrid) {
            const uint32_t p = std::min(i, extent - 1);
            return {p, p + 1};
        }
        const auto begin = static_cast<uint32_t>(static_cast<uint64_t>(i) * extent / kHashGrid);
        const auto end = static_cast<uint32_t>(static_cast<uint64_t>(i + 1) * extent / kHashGrid);
        return {begin, std::max(end, begin + 1)};
    }
}

PerceptualHash compute_perceptual_hash(const PixelGrid& frame) {
    PerceptualHash hash;
    if (frame.width == 0 || frame.height == 0 || !frame.is_consistent()) {
        return hash;
    }

    for (uint32_t cy = 0; cy < kHashGrid; ++cy) {
        const auto [y0, y1] = cell_span(cy, frame.height);
        for (uint32_t cx = 0; cx < kHashGrid; ++cx) {
            const auto [x0, x1] = cell_span(cx, frame.width);
            uint64_t sum = 0;
            for (uint32_t y = y0; y < y1; ++y) {
                for (uint32_t x = x0; x < x1; ++x) {
                    const uint8_t* p = frame.pixel(x, y);
                    sum += static_cast<uint64_t>(p[0]) + p[1] + p[2];
                }
            }
            const uint64_t cells = static_cast<uint64_t>(y1 - y0) * (x1 - x0);
            const double gray = static_cast<double>(sum) / (3.0 * static_cast<double>(cells));
            hash.set(static_cast<std::size_t>(cy) * kHashGrid + cx, gray > 128.0);
        }
    }
    return hash;
}

std::vector<uint32_t> select_frames_to_keep(const std::vector<std::optional<FrameRecord>>& records,
                                            const std::size_t threshold) {
    std::vector<uint32_t> keep{0};
    const FrameRecord* anchor = nullptr;
    if (!records.empty() && records.front()) {
        anchor = &*records.front();
    }

    for (std::size_t i = 1; i < records.size(); ++i) {
        if (!records[i]) continue;
        const FrameRecord& current = *records[i];
        if (anchor == nullptr || hamming_distance(current.hash, anchor->hash) > threshold) {
            keep.push_back(static_cast<uint32_t>(i));
            anchor = &current;
        }
    }
    return keep;
}

FrameDedupAnalyzer::FrameDedupAnalyzer(const std::size_t threshold,
                                       const double progress_from,
                                       const double progress_to)
    : threshold_(threshold),
      progress_from_(progress_from),
      progress_to_(progress_to) {}

double FrameDedupAnalyzer::scaled(const double fraction) const noexcept {
    return progress_from_ + (progress_to_ - progress_from_) * std::clamp(fraction, 0.0, 1.0);
}

DedupResult FrameDedupAnalyzer::analyze(const std::vector<std::optional<DecodedFrame>>& frames,
                                        EventBus* bus,
                                        const std::stop_token st) const {
    const auto total = static_cast<uint32_t>(frames.size());
    DedupResult result;
    result.total_frames = total;

    publish_if(bus, ProgressEvent{ProgressPhase::Analyzing, scaled(0.0),
                                  "hashing " + std::to_string(total) + " frames", std::nullopt, total});

    // hashing: 0% .. 60% of the window
    std::vector<std::optional<FrameRecord>> records(frames.size());
    double delay_sum = 0.0;
    uint32_t decodable = 0;
    bool alpha_known = false;
    for (uint32_t i = 0; i < total; ++i) {
        if (st.stop_requested()) {
            Logger::log(LogLevel::Debug, "Frame analysis interrupted at frame " + std::to_string(i), "dedup");
            break;
        }
        const auto& frame = frames[i];
        if (!frame || !frame->grid.is_consistent()) {
            Logger::log(LogLevel::Warning, "Frame " + std::to_string(i) + " could not be decoded, skipped", "dedup");
        } else {
            const uint32_t delay = frame->delay_ms > 0 ? frame->delay_ms : kDefaultFrameDelayMs;
            records[i] = FrameRecord{i, compute_perceptual_hash(frame->grid),
                                     frame->grid.width, frame->grid.height, delay};
            delay_sum += delay;
            ++decodable;
            if (!alpha_known) {
                result.has_alpha = frame->grid.has_transparency();
                alpha_known = true;
            }
        }

        if ((i + 1) % kProgressEvery == 0 || i + 1 == total) {
            publish_if(bus, ProgressEvent{ProgressPhase::Analyzing,
                                          scaled(0.6 * (i + 1) / static_cast<double>(total)),
                                          "hashing frames " + std::to_string(i + 1) + "/" + std::to_string(total),
                                          i + 1, total});
        }
    }

    publish_if(bus, ProgressEvent{ProgressPhase::Analyzing, scaled(0.7),
                                  "detecting duplicate frames", std::nullopt, total});

    result.frames_to_keep = select_frames_to_keep(records, threshold_);
    result.unique_frames = static_cast<uint32_t>(result.frames_to_keep.size());
    result.duplicate_frames = total > result.unique_frames ? total - result.unique_frames : 0;
    result.compression_ratio = total > 0 ? static_cast<double>(result.unique_frames) / total : 1.0;
    if (decodable > 0) {
        result.avg_delay_ms = delay_sum / decodable;
    }
    result.fps = std::round(1000.0 / result.avg_delay_ms);

    Logger::log(LogLevel::Info, "Frame analysis: keeping " + std::to_string(result.unique_frames) + "/" +
                std::to_string(total) + " frames", "dedup");

    publish_if(bus, ProgressEvent{ProgressPhase::Analyzing, scaled(1.0),
                                  "keeping " + std::to_string(result.unique_frames) + "/" +
                                  std::to_string(total) + " frames", total, total});
    return result;
}

} // namespace anvil
