#include "../libanvil/include/metadata_analyzer.hpp"
#include "../libanvil/include/errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace anvil;
using namespace anvil::test;

TEST(GifHeader, Signature) {
    EXPECT_TRUE(is_gif(make_gif(4, 4, 1)));
    auto gif87 = make_gif(4, 4, 1);
    gif87[4] = '7';
    EXPECT_TRUE(is_gif(gif87));

    const std::vector<uint8_t> png = make_png_header(4, 4, 6);
    EXPECT_FALSE(is_gif(png));
    const std::vector<uint8_t> truncated = {'G', 'I', 'F', '8', '9', 'a', 1, 0};
    EXPECT_FALSE(is_gif(truncated));
}

TEST(GifHeader, PaletteSize) {
    EXPECT_EQ(gif_palette_size(make_gif(4, 4, 1, 10, 8)), 256u);
    EXPECT_EQ(gif_palette_size(make_gif(4, 4, 1, 10, 1)), 2u);
    EXPECT_EQ(gif_palette_size(make_gif(4, 4, 1, 10, 0)), 0u);
}

TEST(GifHeader, FrameDelays) {
    const auto delays = gif_frame_delays(make_gif(4, 4, 3, 7));
    EXPECT_EQ(delays, (std::vector<uint32_t>{70, 70, 70}));

    // 0 and 1 centiseconds play as 10
    const auto fast = gif_frame_delays(make_gif(4, 4, 2, 1));
    EXPECT_EQ(fast, (std::vector<uint32_t>{100, 100}));
}

TEST(GifHeader, TruncatedStreamStopsQuietly) {
    auto gif = make_gif(4, 4, 3, 5);
    // cut inside the third frame's graphic control extension
    gif.resize(gif.size() - 20);
    const auto delays = gif_frame_delays(gif);
    EXPECT_EQ(delays.size(), 2u);
}

TEST(PngHeader, ReadsIhdr) {
    const auto header = read_png_header(make_png_header(640, 480, 6));
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->width, 640u);
    EXPECT_EQ(header->height, 480u);
    EXPECT_TRUE(header->has_alpha());

    EXPECT_FALSE(read_png_header(make_png_header(1, 1, 2))->has_alpha());
    EXPECT_FALSE(read_png_header(make_gif(4, 4, 1)).has_value());
}

TEST(MetadataAnalyzer, DescribesTheSource) {
    FakeCodec codec;
    codec.frames = 5;
    codec.width = 64;
    codec.height = 48;
    const auto gif = make_gif(64, 48, 5, 10, 7);
    codec.write_buffer("src", gif);

    const auto meta = MetadataAnalyzer(codec).analyze("src", gif);
    EXPECT_EQ(meta.frame_count, 5u);
    EXPECT_EQ(meta.width, 64u);
    EXPECT_EQ(meta.height, 48u);
    EXPECT_FALSE(meta.has_alpha);
    EXPECT_EQ(meta.palette_size, 128u);
    EXPECT_DOUBLE_EQ(meta.fps, 10.0);
    EXPECT_EQ(meta.duration_ms, 500u);
    EXPECT_EQ(meta.source_bytes, gif.size());
    EXPECT_DOUBLE_EQ(meta.avg_bitrate_kbps, static_cast<double>(gif.size()) * 8.0 / 0.5 / 1000.0);

    // only the source is left in the scratch space
    EXPECT_EQ(codec.buffer_count(), 1u);
}

TEST(MetadataAnalyzer, AlphaComesFromTheFirstSnapshot) {
    FakeCodec codec;
    codec.color_type = 6;
    const auto gif = make_gif(64, 48, 5);
    codec.write_buffer("src", gif);
    EXPECT_TRUE(MetadataAnalyzer(codec).analyze("src", gif).has_alpha);
}

TEST(MetadataAnalyzer, FrameCountComesFromTheCodec) {
    FakeCodec codec;
    codec.frames = 3;
    const auto gif = make_gif(64, 48, 8, 4);
    codec.write_buffer("src", gif);
    const auto meta = MetadataAnalyzer(codec).analyze("src", gif);
    EXPECT_EQ(meta.frame_count, 3u);
    // timing still uses every delay in the stream
    EXPECT_DOUBLE_EQ(meta.fps, 25.0);
}

TEST(MetadataAnalyzer, RejectsNonGif) {
    FakeCodec codec;
    const auto png = make_png_header(8, 8, 2);
    codec.write_buffer("src", png);
    EXPECT_THROW((void)MetadataAnalyzer(codec).analyze("src", png), InputError);
    EXPECT_EQ(codec.runs(), 0u);
}

TEST(MetadataAnalyzer, NoFramesIsAnInputError) {
    FakeCodec codec;
    codec.frames = 0;
    const auto gif = make_gif(64, 48, 2);
    codec.write_buffer("src", gif);
    EXPECT_THROW((void)MetadataAnalyzer(codec).analyze("src", gif), InputError);
    EXPECT_EQ(codec.buffer_count(), 1u);
}

TEST(MetadataAnalyzer, StopRequestCancels) {
    FakeCodec codec;
    const auto gif = make_gif(64, 48, 2);
    codec.write_buffer("src", gif);
    std::stop_source src;
    src.request_stop();
    EXPECT_THROW((void)MetadataAnalyzer(codec).analyze("src", gif, nullptr, src.get_token()),
                 OptimizationCancelled);
}
