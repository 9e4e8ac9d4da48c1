#include "../libanvil/include/frame_dedup.hpp"
#include "../libanvil/include/events.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace anvil;
using namespace anvil::test;

namespace {
    std::optional<DecodedFrame> frame(PixelGrid grid, const uint32_t delay = 100) {
        return DecodedFrame{std::move(grid), delay};
    }

    // left half white, right half black (or mirrored)
    PixelGrid halves(const bool white_left) {
        PixelGrid g(32, 32);
        for (uint32_t y = 0; y < 32; ++y) {
            for (uint32_t x = 0; x < 32; ++x) {
                const uint8_t v = (x < 16) == white_left ? 255 : 0;
                uint8_t* p = g.pixel(x, y);
                p[0] = p[1] = p[2] = v;
                p[3] = 255;
            }
        }
        return g;
    }

    PerceptualHash hash_with_bits(const std::initializer_list<std::size_t> bits) {
        PerceptualHash h;
        for (const auto b : bits) h.set(b);
        return h;
    }
}

TEST(PerceptualHash, BrightAndDarkCells) {
    EXPECT_TRUE(compute_perceptual_hash(solid_grid(32, 32, 255, 255, 255)).all());
    EXPECT_TRUE(compute_perceptual_hash(solid_grid(32, 32, 0, 0, 0)).none());
    // exactly 128 is not brighter than the midpoint
    EXPECT_TRUE(compute_perceptual_hash(solid_grid(32, 32, 128, 128, 128)).none());
}

TEST(PerceptualHash, HalvesDifferInEveryCell) {
    const auto a = compute_perceptual_hash(halves(true));
    const auto b = compute_perceptual_hash(halves(false));
    EXPECT_EQ(a.count(), 128u);
    EXPECT_EQ(hamming_distance(a, b), 256u);
}

TEST(PerceptualHash, ImagesSmallerThanTheGrid) {
    const auto h = compute_perceptual_hash(solid_grid(3, 2, 255, 255, 255));
    EXPECT_TRUE(h.all());
}

TEST(FramesToKeep, FewerThanTwoFramesKeepsFirst) {
    EXPECT_EQ(select_frames_to_keep({}), std::vector<uint32_t>{0});
    std::vector<std::optional<FrameRecord>> one(1);
    one[0] = FrameRecord{0, {}, 1, 1, 100};
    EXPECT_EQ(select_frames_to_keep(one), std::vector<uint32_t>{0});
}

TEST(FramesToKeep, ComparesAgainstLastKeptFrame) {
    std::vector<std::optional<FrameRecord>> records(4);
    records[0] = FrameRecord{0, hash_with_bits({}), 1, 1, 100};
    records[1] = FrameRecord{1, hash_with_bits({1, 2}), 1, 1, 100};        // 2 from anchor: dropped
    records[2] = FrameRecord{2, hash_with_bits({1, 2, 3, 4}), 1, 1, 100};  // 4 from anchor: kept
    records[3] = FrameRecord{3, hash_with_bits({1, 2, 3, 4, 5}), 1, 1, 100}; // 1 from new anchor: dropped
    EXPECT_EQ(select_frames_to_keep(records, 3), (std::vector<uint32_t>{0, 2}));
}

TEST(FramesToKeep, ThresholdIsExclusive) {
    std::vector<std::optional<FrameRecord>> records(2);
    records[0] = FrameRecord{0, hash_with_bits({}), 1, 1, 100};
    records[1] = FrameRecord{1, hash_with_bits({7, 8, 9}), 1, 1, 100};
    EXPECT_EQ(select_frames_to_keep(records, 3), std::vector<uint32_t>{0});
    EXPECT_EQ(select_frames_to_keep(records, 2), (std::vector<uint32_t>{0, 1}));
}

TEST(FramesToKeep, UndecodableFirstFrameStillListed) {
    std::vector<std::optional<FrameRecord>> records(3);
    records[1] = FrameRecord{1, hash_with_bits({}), 1, 1, 100};
    records[2] = FrameRecord{2, hash_with_bits({}), 1, 1, 100};
    const auto keep = select_frames_to_keep(records);
    EXPECT_EQ(keep, (std::vector<uint32_t>{0, 1}));
}

TEST(FrameDedupAnalyzer, CollapsesRunsOfDuplicates) {
    std::vector<std::optional<DecodedFrame>> frames;
    frames.push_back(frame(halves(true), 50));
    frames.push_back(frame(halves(true), 50));
    frames.push_back(frame(halves(false), 100));
    frames.push_back(frame(halves(false), 100));
    frames.push_back(frame(halves(true), 200));

    const FrameDedupAnalyzer analyzer;
    const auto r = analyzer.analyze(frames);
    EXPECT_EQ(r.frames_to_keep, (std::vector<uint32_t>{0, 2, 4}));
    EXPECT_EQ(r.total_frames, 5u);
    EXPECT_EQ(r.unique_frames, 3u);
    EXPECT_EQ(r.duplicate_frames, 2u);
    EXPECT_DOUBLE_EQ(r.compression_ratio, 0.6);
    EXPECT_DOUBLE_EQ(r.avg_delay_ms, 100.0);
    EXPECT_DOUBLE_EQ(r.fps, 10.0);
    EXPECT_FALSE(r.has_alpha);
}

TEST(FrameDedupAnalyzer, KeepListIsStrictlyIncreasingAndStartsAtZero) {
    std::vector<std::optional<DecodedFrame>> frames;
    for (int i = 0; i < 30; ++i) {
        frames.push_back(frame(halves(i % 3 == 0)));
    }
    const auto r = FrameDedupAnalyzer().analyze(frames);
    ASSERT_FALSE(r.frames_to_keep.empty());
    EXPECT_EQ(r.frames_to_keep.front(), 0u);
    for (std::size_t i = 1; i < r.frames_to_keep.size(); ++i) {
        EXPECT_LT(r.frames_to_keep[i - 1], r.frames_to_keep[i]);
    }
}

TEST(FrameDedupAnalyzer, UndecodableFramesAreSkipped) {
    std::vector<std::optional<DecodedFrame>> frames;
    frames.push_back(frame(solid_grid(8, 8, 0, 0, 0, 0), 40));
    frames.push_back(std::nullopt);
    frames.push_back(frame(solid_grid(8, 8, 255, 255, 255), 60));

    const auto r = FrameDedupAnalyzer().analyze(frames);
    EXPECT_EQ(r.frames_to_keep, (std::vector<uint32_t>{0, 2}));
    EXPECT_EQ(r.total_frames, 3u);
    EXPECT_DOUBLE_EQ(r.avg_delay_ms, 50.0);
    EXPECT_DOUBLE_EQ(r.fps, 20.0);
    EXPECT_TRUE(r.has_alpha);
}

TEST(FrameDedupAnalyzer, EmptyInputKeepsFrameZero) {
    const auto r = FrameDedupAnalyzer().analyze({});
    EXPECT_EQ(r.frames_to_keep, std::vector<uint32_t>{0});
    EXPECT_EQ(r.total_frames, 0u);
    EXPECT_DOUBLE_EQ(r.compression_ratio, 1.0);
    EXPECT_DOUBLE_EQ(r.fps, 10.0);
}

TEST(FrameDedupAnalyzer, ReportsProgressInsideItsWindow) {
    std::vector<std::optional<DecodedFrame>> frames;
    for (int i = 0; i < 25; ++i) frames.push_back(frame(halves(true)));

    EventBus bus;
    std::vector<ProgressEvent> events;
    bus.subscribe<ProgressEvent>([&events](const ProgressEvent& e) { events.push_back(e); });

    const FrameDedupAnalyzer analyzer(kDefaultDedupThreshold, 20.0, 30.0);
    (void)analyzer.analyze(frames, &bus);

    ASSERT_FALSE(events.empty());
    for (const auto& e : events) {
        EXPECT_EQ(e.phase, ProgressPhase::Analyzing);
        EXPECT_GE(e.percent, 20.0);
        EXPECT_LE(e.percent, 30.0);
    }
    EXPECT_DOUBLE_EQ(events.back().percent, 30.0);
}

TEST(FrameDedupAnalyzer, StopRequestEndsHashingEarly) {
    std::vector<std::optional<DecodedFrame>> frames;
    for (int i = 0; i < 5; ++i) frames.push_back(frame(halves(i % 2 == 0)));

    std::stop_source src;
    src.request_stop();
    const auto r = FrameDedupAnalyzer().analyze(frames, nullptr, src.get_token());
    EXPECT_EQ(r.frames_to_keep, std::vector<uint32_t>{0});
}
