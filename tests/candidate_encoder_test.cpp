#include "../libanvil/include/candidate_encoder.hpp"
#include "../libanvil/include/candidate_generator.hpp"
#include "../libanvil/include/errors.hpp"
#include "../libanvil/include/events.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace anvil;
using namespace anvil::test;

namespace {
    EncodeSource make_source(const std::optional<std::vector<uint32_t>>& keep = std::nullopt) {
        EncodeSource s;
        s.scratch_name = "src";
        s.metadata.frame_count = 5;
        s.metadata.width = 64;
        s.metadata.height = 48;
        s.metadata.fps = 12.5;
        s.metadata.palette_size = 256;
        s.frames_to_keep = keep;
        return s;
    }

    template <typename Step>
    std::size_t position_of(const FilterChain& chain) {
        const auto& steps = chain.steps();
        for (std::size_t i = 0; i < steps.size(); ++i) {
            if (std::holds_alternative<Step>(steps[i])) return i;
        }
        return steps.size();
    }

    class CandidateEncoderTest : public ::testing::Test {
    protected:
        void SetUp() override {
            codec.write_buffer("src", make_gif(64, 48, 5));
        }

        FakeCodec codec;
        ThreadPool pool{2};
    };
}

TEST(CandidateEncoderChain, FixedStepOrder) {
    EncodingConfig c;
    c.denoise = 30;
    c.remove_duplicates = true;
    c.use_palette = true;
    c.dither = DitherMethod::Bayer;
    c.bayer_scale = 3;
    c.scale_filter = ScaleFilter::Spline;
    c.pixel_format = PixelFormat::Yuva420p;

    const auto chain = CandidateEncoder::build_filter_chain(c, make_source(std::vector<uint32_t>{0, 2}), "pal.png");
    ASSERT_EQ(chain.steps().size(), 6u);
    EXPECT_EQ(position_of<DenoiseStep>(chain), 0u);
    EXPECT_EQ(position_of<DecimateStep>(chain), 1u);
    EXPECT_EQ(position_of<FpsStep>(chain), 2u);
    EXPECT_EQ(position_of<ScaleStep>(chain), 3u);
    EXPECT_EQ(position_of<PaletteUseStep>(chain), 4u);
    EXPECT_EQ(position_of<FormatStep>(chain), 5u);
    EXPECT_EQ(chain.describe(),
              "hqdn3d=30,select='eq(n\\,0)+eq(n\\,2)',fps=12.5,scale=64:-1:flags=spline,"
              "paletteuse=dither=bayer:bayer_scale=3,format=yuva420p");
}

TEST(CandidateEncoderChain, MinimalChain) {
    const EncodingConfig c;
    const auto chain = CandidateEncoder::build_filter_chain(c, make_source());
    EXPECT_EQ(chain.describe(), "fps=12.5,scale=64:-1:flags=lanczos,format=yuv420p");
}

TEST(CandidateEncoderChain, DecimateWithoutKeepList) {
    EncodingConfig c;
    c.remove_duplicates = true;
    const auto chain = CandidateEncoder::build_filter_chain(c, make_source());
    EXPECT_EQ(chain.describe().rfind("mpdecimate,", 0), 0u);
}

TEST(CandidateEncoderParams, LosslessAndNearLossless) {
    EncodingConfig exact;
    exact.lossless = true;
    exact.near_lossless = 0;
    EXPECT_EQ(CandidateEncoder::build_output_params(exact).near_lossless, 100);

    EncodingConfig near = exact;
    near.near_lossless = 40;
    const auto p = CandidateEncoder::build_output_params(near);
    EXPECT_TRUE(p.lossless);
    EXPECT_EQ(p.near_lossless, 60);
    EXPECT_EQ(p.format, OutputFormat::AnimatedWebp);
    EXPECT_EQ(p.loop_count, 0);
}

TEST(CandidateEncoderParams, KeyframesAlphaAndMixed) {
    EncodingConfig c;
    c.quality = 88;
    c.compression_effort = 5;
    c.strategy = Strategy::Hybrid;
    c.pixel_format = PixelFormat::Yuva420p;
    c.sharp_yuv = true;
    auto p = CandidateEncoder::build_output_params(c);
    EXPECT_EQ(p.quality, 88);
    EXPECT_EQ(p.method, 5);
    EXPECT_TRUE(p.keep_alpha);
    EXPECT_TRUE(p.allow_mixed);
    EXPECT_TRUE(p.sharp_yuv);
    EXPECT_EQ(p.kmin, 0);
    EXPECT_EQ(p.kmax, 1);

    c.delta_encoding = true;
    c.strategy = Strategy::OptimizedLossy;
    p = CandidateEncoder::build_output_params(c);
    EXPECT_FALSE(p.allow_mixed);
    EXPECT_EQ(p.kmin, kDeltaKeyframeMin);
    EXPECT_EQ(p.kmax, kDeltaKeyframeMax);
}

TEST_F(CandidateEncoderTest, EncodesEveryConfigurationInOrder) {
    SourceMetadata meta = make_source().metadata;
    const auto configs = CandidateGenerator().generate(meta, OptimizationMode::QualityPreserving);
    const CandidateEncoder encoder(codec, pool);

    const auto candidates = encoder.encode_all(configs, make_source());
    ASSERT_EQ(candidates.size(), configs.size());
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        EXPECT_EQ(candidates[i].index, i);
        EXPECT_FALSE(candidates[i].buffer.empty());
        EXPECT_DOUBLE_EQ(candidates[i].size_kb, static_cast<double>(candidates[i].buffer.size()) / 1024.0);
        EXPECT_FALSE(candidates[i].filter_chain.empty());
    }
    EXPECT_EQ(codec.buffer_count(), 1u);
}

TEST_F(CandidateEncoderTest, FailingConfigurationIsSkipped) {
    codec.failing = {1, 3};
    const auto configs = CandidateGenerator().generate(make_source().metadata, OptimizationMode::QualityPreserving);
    const CandidateEncoder encoder(codec, pool);

    EventBus bus;
    std::vector<std::size_t> failed;
    std::mutex mtx;
    bus.subscribe<CandidateFailedEvent>([&](const CandidateFailedEvent& e) {
        std::lock_guard lock(mtx);
        failed.push_back(e.index);
    });

    const auto candidates = encoder.encode_all(configs, make_source(), &bus);
    EXPECT_EQ(candidates.size(), configs.size() - 2);
    for (const auto& c : candidates) {
        EXPECT_NE(c.index, 1u);
        EXPECT_NE(c.index, 3u);
    }
    std::ranges::sort(failed);
    EXPECT_EQ(failed, (std::vector<std::size_t>{1, 3}));
    // no retry: one run per configuration
    EXPECT_EQ(codec.runs(), configs.size());
    EXPECT_EQ(codec.buffer_count(), 1u);
}

TEST_F(CandidateEncoderTest, AllFailingIsTerminal) {
    const auto configs = CandidateGenerator(3).generate(make_source().metadata, OptimizationMode::QualityPreserving);
    codec.failing = {0, 1, 2};
    const CandidateEncoder encoder(codec, pool);
    EXPECT_THROW((void)encoder.encode_all(configs, make_source()), OptimizationFailed);
    EXPECT_EQ(codec.buffer_count(), 1u);
}

TEST_F(CandidateEncoderTest, PaletteIsGeneratedThenUsed) {
    const auto configs = CandidateGenerator(1).generate(make_source().metadata, OptimizationMode::SizePreserving);
    ASSERT_TRUE(configs.front().use_palette);
    const CandidateEncoder encoder(codec, pool);

    const auto candidate = encoder.encode_one(0, configs.front(), make_source());
    ASSERT_TRUE(candidate.has_value());

    const auto invocations = codec.invocations();
    ASSERT_EQ(invocations.size(), 2u);
    EXPECT_EQ(invocations[0].params.format, OutputFormat::PalettePng);
    EXPECT_TRUE(std::holds_alternative<PaletteGenStep>(invocations[0].filters.steps().back()));
    EXPECT_EQ(invocations[1].inputs.size(), 2u);
    EXPECT_EQ(invocations[1].inputs[1], invocations[0].output);
    EXPECT_LT(position_of<PaletteUseStep>(invocations[1].filters), invocations[1].filters.steps().size());
    EXPECT_EQ(codec.buffer_count(), 1u);
}

TEST_F(CandidateEncoderTest, PaletteIsRemovedWhenTheEncodeFails) {
    const auto configs = CandidateGenerator(2).generate(make_source().metadata, OptimizationMode::SizePreserving);
    ASSERT_TRUE(configs.front().use_palette);
    // palette generation succeeds, the webp pass of candidate 0 fails
    codec.failing = {0};
    const CandidateEncoder encoder(codec, pool);

    EventBus bus;
    std::vector<std::size_t> failed;
    std::mutex mtx;
    bus.subscribe<CandidateFailedEvent>([&](const CandidateFailedEvent& e) {
        std::lock_guard lock(mtx);
        failed.push_back(e.index);
    });

    const auto candidate = encoder.encode_one(0, configs.front(), make_source(), &bus);
    EXPECT_FALSE(candidate.has_value());
    EXPECT_EQ(failed, (std::vector<std::size_t>{0}));

    const auto invocations = codec.invocations();
    ASSERT_EQ(invocations.size(), 2u);
    EXPECT_EQ(invocations[0].params.format, OutputFormat::PalettePng);
    EXPECT_FALSE(codec.has_buffer(invocations[0].output));
    EXPECT_EQ(codec.buffer_count(), 1u);

    // the other configuration still goes through
    const auto candidates = encoder.encode_all(configs, make_source(), &bus);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates.front().index, 1u);
    EXPECT_EQ(codec.buffer_count(), 1u);
}

TEST_F(CandidateEncoderTest, StopRequestCancels) {
    const auto configs = CandidateGenerator().generate(make_source().metadata, OptimizationMode::QualityPreserving);
    const CandidateEncoder encoder(codec, pool);
    std::stop_source src;
    src.request_stop();
    EXPECT_THROW((void)encoder.encode_all(configs, make_source(), nullptr, src.get_token()), OptimizationCancelled);
    EXPECT_EQ(codec.buffer_count(), 1u);
}
