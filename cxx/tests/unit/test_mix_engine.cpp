#include <gtest/gtest.h>
#include "MixEngine.hpp"
#include "TestHelper.hpp"
#include <algorithm>
#include <random>
#include <vector>

using namespace megaphone;

namespace {

VoiceFrame voice(const std::vector<Sample>& samples, float gain = 1.0f) {
    return VoiceFrame{1, gain, std::span<const Sample>(samples)};
}

} // namespace

TEST(MixFramesTest, SumIsIndependentOfVoiceOrder) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<Sample> sample(-20000, 20000);
    const float gains[] = {0.25f, 0.5f, 1.0f, 2.0f};
    const SampleRange range = SampleRange::for_bit_depth(16);

    for (int trial = 0; trial < 50; ++trial) {
        constexpr size_t kLen = 64;
        std::vector<Sample> mic(kLen);
        std::generate(mic.begin(), mic.end(), [&]() { return sample(rng); });

        std::vector<std::vector<Sample>> buffers(4, std::vector<Sample>(kLen));
        std::vector<VoiceFrame> voices;
        for (size_t v = 0; v < buffers.size(); ++v) {
            std::generate(buffers[v].begin(), buffers[v].end(), [&]() { return sample(rng); });
            voices.push_back(VoiceFrame{static_cast<VoiceId>(v + 1), gains[(trial + v) % 4],
                                        std::span<const Sample>(buffers[v])});
        }

        std::vector<Sample> reference(kLen);
        const size_t reference_clipped = MixEngine::mix_frames(mic, 1.0f, voices, 0.5f, range, reference);

        std::sort(voices.begin(), voices.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
        do {
            std::vector<Sample> out(kLen);
            const size_t clipped = MixEngine::mix_frames(mic, 1.0f, voices, 0.5f, range, out);
            ASSERT_EQ(out, reference);
            ASSERT_EQ(clipped, reference_clipped);
        } while (std::next_permutation(voices.begin(), voices.end(),
                                       [](const auto& a, const auto& b) { return a.id < b.id; }));
    }
}

TEST(MixFramesTest, SaturatesInsteadOfWrapping16Bit) {
    const SampleRange range = SampleRange::for_bit_depth(16);
    const std::vector<Sample> mic{30000, -30000, 100};
    const std::vector<Sample> clip{30000, -30000, 100};
    const std::vector<VoiceFrame> voices{voice(clip)};

    std::vector<Sample> out(3);
    const size_t clipped = MixEngine::mix_frames(mic, 1.0f, voices, 1.0f, range, out);
    EXPECT_EQ(out, (std::vector<Sample>{32767, -32768, 200}));
    EXPECT_EQ(clipped, 2u);
}

TEST(MixFramesTest, SaturatesAtEveryBitDepth) {
    {
        const SampleRange range = SampleRange::for_bit_depth(8);
        const std::vector<Sample> a{100, -100};
        const std::vector<VoiceFrame> voices{voice(a)};
        std::vector<Sample> out(2);
        MixEngine::mix_frames(a, 1.0f, voices, 1.0f, range, out);
        EXPECT_EQ(out, (std::vector<Sample>{127, -128}));
    }
    {
        const SampleRange range = SampleRange::for_bit_depth(32);
        const std::vector<Sample> a{INT32_MAX, INT32_MIN};
        const std::vector<VoiceFrame> voices{voice(a)};
        std::vector<Sample> out(2);
        MixEngine::mix_frames(a, 1.0f, voices, 1.0f, range, out);
        EXPECT_EQ(out, (std::vector<Sample>{INT32_MAX, INT32_MIN}));
    }
}

TEST(MixFramesTest, AppliesGainsAndRoundsToNearest) {
    const SampleRange range = SampleRange::for_bit_depth(16);
    const std::vector<Sample> mic{1000, 3, -3};
    const std::vector<Sample> clip{400, 0, 0};
    const std::vector<VoiceFrame> voices{voice(clip, 0.5f)};

    std::vector<Sample> out(3);
    const size_t clipped = MixEngine::mix_frames(mic, 0.5f, voices, 0.5f, range, out);
    // 1000*0.5 + 400*0.5*0.5, then 1.5 and -1.5 round away from zero
    EXPECT_EQ(out, (std::vector<Sample>{600, 2, -2}));
    EXPECT_EQ(clipped, 0u);
}

TEST(MixFramesTest, MicOnlyIsPassthrough) {
    const SampleRange range = SampleRange::for_bit_depth(16);
    const std::vector<Sample> mic{1, -2, 32767, -32768};
    std::vector<Sample> out(4);
    EXPECT_EQ(MixEngine::mix_frames(mic, 1.0f, {}, 1.0f, range, out), 0u);
    EXPECT_EQ(out, mic);
}

class MixEngineTest : public ::testing::Test {
protected:
    StreamFormat format{48000, 1, 16, 4};
    FrameRingBuffer ring{4, 4};
    VoicePool voices{4, 1, 4};
    VoiceCommandQueue commands;
    MixEngine mixer{format, ring, voices, commands};
};

TEST_F(MixEngineTest, UnderrunRendersSilenceAndIsCounted) {
    std::vector<Sample> out(4, 7);
    mixer.render(out);
    EXPECT_EQ(out, (std::vector<Sample>{0, 0, 0, 0}));
    EXPECT_EQ(mixer.underruns(), 1u);
    EXPECT_EQ(mixer.ticks(), 1u);
}

TEST_F(MixEngineTest, TriggerCommandIsAppliedOnNextTick) {
    const std::vector<Sample> mic{10, 10, 10, 10};
    ring.push(mic);

    VoiceCommand command;
    command.type = VoiceCommand::Type::Trigger;
    command.voice = voices.allocate_id();
    command.asset = test::make_asset({1, 2, 3, 4, 5, 6});
    const VoiceId id = command.voice;
    ASSERT_TRUE(commands.push(std::move(command)));

    std::vector<Sample> out(4);
    mixer.render(out);
    EXPECT_EQ(out, (std::vector<Sample>{11, 12, 13, 14}));
    EXPECT_TRUE(voices.is_active(id));
    EXPECT_EQ(mixer.active_voices(), 1u);
    EXPECT_EQ(mixer.underruns(), 0u);

    VoiceCommand stop;
    stop.type = VoiceCommand::Type::Stop;
    stop.voice = id;
    ASSERT_TRUE(commands.push(std::move(stop)));

    mixer.render(out);
    EXPECT_EQ(out, (std::vector<Sample>{0, 0, 0, 0}));
    EXPECT_FALSE(voices.is_active(id));
    EXPECT_EQ(mixer.active_voices(), 0u);
}

TEST_F(MixEngineTest, ClippedSamplesAreCounted) {
    mixer.set_mic_gain(4.0f);
    ring.push(std::vector<Sample>{10000, -10000, 1, 0});

    std::vector<Sample> out(4);
    mixer.render(out);
    EXPECT_EQ(out, (std::vector<Sample>{32767, -32768, 4, 0}));
    EXPECT_EQ(mixer.clipped_samples(), 2u);

    mixer.reset_stats();
    EXPECT_EQ(mixer.clipped_samples(), 0u);
    EXPECT_EQ(mixer.ticks(), 0u);
}
