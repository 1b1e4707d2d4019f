#include <gtest/gtest.h>
#include "VoicePool.hpp"
#include "TestHelper.hpp"
#include <numeric>
#include <vector>

using namespace megaphone;
using test::make_asset;

namespace {

std::vector<Sample> ramp(size_t n, Sample start = 1) {
    std::vector<Sample> samples(n);
    std::iota(samples.begin(), samples.end(), start);
    return samples;
}

} // namespace

TEST(VoicePoolTest, ExactLengthDeactivatesAfterOneAdvance) {
    VoicePool pool(4, 1, 480);
    const VoiceId id = pool.trigger(make_asset(ramp(480)));
    ASSERT_NE(id, kInvalidVoiceId);

    const auto& frames = pool.advance_all(480);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].samples.size(), 480u);
    EXPECT_EQ(frames[0].samples[479], 480);
    EXPECT_FALSE(pool.is_active(id));

    EXPECT_TRUE(pool.advance_all(480).empty());
    EXPECT_EQ(pool.size(), 0u);
}

TEST(VoicePoolTest, OneSampleShortStaysActive) {
    VoicePool pool(4, 1, 480);
    const VoiceId id = pool.trigger(make_asset(ramp(481)));

    pool.advance_all(480);
    EXPECT_TRUE(pool.is_active(id));

    const auto& frames = pool.advance_all(480);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].samples[0], 481);
    EXPECT_EQ(frames[0].samples[1], 0);
    EXPECT_EQ(frames[0].samples[479], 0);
    EXPECT_FALSE(pool.is_active(id));
}

TEST(VoicePoolTest, RetriggerStartsIndependentVoice) {
    VoicePool pool(4, 1, 2);
    auto asset = make_asset({1, 2, 3, 4});

    const VoiceId first = pool.trigger(asset);
    pool.advance_all(2);
    const VoiceId second = pool.trigger(asset);
    ASSERT_NE(first, second);

    const auto& frames = pool.advance_all(2);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].id, first);
    EXPECT_EQ(frames[0].samples[0], 3);
    EXPECT_EQ(frames[1].id, second);
    EXPECT_EQ(frames[1].samples[0], 1);

    EXPECT_FALSE(pool.is_active(first));
    EXPECT_TRUE(pool.is_active(second));
}

TEST(VoicePoolTest, StopIsImmediateAndIdempotent) {
    VoicePool pool(4, 1, 2);
    auto asset = make_asset(ramp(100));
    const VoiceId a = pool.trigger(asset);
    const VoiceId b = pool.trigger(asset);

    pool.stop(a);
    pool.stop(a);
    pool.stop(9999);
    EXPECT_FALSE(pool.is_active(a));
    EXPECT_TRUE(pool.is_active(b));

    const auto& frames = pool.advance_all(2);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, b);
    EXPECT_EQ(pool.active_count(), 1u);
}

TEST(VoicePoolTest, StealsOldestVoiceWhenFull) {
    VoicePool pool(2, 1, 2);
    auto asset = make_asset(ramp(100));
    const VoiceId a = pool.trigger(asset);
    const VoiceId b = pool.trigger(asset);
    const VoiceId c = pool.trigger(asset);

    EXPECT_NE(c, kInvalidVoiceId);
    EXPECT_FALSE(pool.is_active(a));
    EXPECT_TRUE(pool.is_active(b));
    EXPECT_TRUE(pool.is_active(c));
    EXPECT_EQ(pool.size(), 2u);
}

TEST(VoicePoolTest, RejectsNullAndMismatchedAssets) {
    VoicePool pool(2, 1, 2);
    EXPECT_EQ(pool.trigger(nullptr), kInvalidVoiceId);
    EXPECT_EQ(pool.trigger(make_asset({1, 2, 3, 4}, 2)), kInvalidVoiceId);
    EXPECT_EQ(pool.size(), 0u);
}

TEST(VoicePoolTest, PreallocatedIdIsKept) {
    VoicePool pool(2, 1, 2);
    const VoiceId id = pool.allocate_id();
    EXPECT_EQ(pool.trigger(make_asset({1, 2, 3}), 0.5f, id), id);

    const auto& frames = pool.advance_all(2);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].id, id);
    EXPECT_FLOAT_EQ(frames[0].gain, 0.5f);
}

TEST(VoicePoolTest, FinishedVoiceReleasesAsset) {
    VoicePool pool(2, 1, 2);
    auto asset = make_asset({1, 2});
    pool.trigger(asset);
    EXPECT_EQ(asset.use_count(), 2);

    pool.advance_all(2); // reaches the end
    EXPECT_EQ(pool.assets_released(), 0u);
    pool.reclaim();
    EXPECT_EQ(asset.use_count(), 1);
    EXPECT_EQ(pool.assets_released(), 1u);

    pool.reclaim();
    EXPECT_EQ(pool.assets_released(), 1u);
}

TEST(VoicePoolTest, StereoFramesAreInterleaved) {
    VoicePool pool(2, 2, 2);
    pool.trigger(make_asset({1, -1, 2, -2, 3, -3}, 2));

    const auto& frames = pool.advance_all(2);
    ASSERT_EQ(frames.size(), 1u);
    ASSERT_EQ(frames[0].samples.size(), 4u);
    EXPECT_EQ(frames[0].samples[3], -2);

    const auto& tail = pool.advance_all(2);
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(tail[0].samples[0], 3);
    EXPECT_EQ(tail[0].samples[1], -3);
    EXPECT_EQ(tail[0].samples[2], 0);
}

TEST(VoicePoolTest, ClearDropsEverything) {
    VoicePool pool(4, 1, 2);
    auto asset = make_asset(ramp(10));
    pool.trigger(asset);
    pool.trigger(asset);
    pool.clear();
    EXPECT_EQ(pool.size(), 0u);
    EXPECT_EQ(pool.active_count(), 0u);
    EXPECT_EQ(asset.use_count(), 1);
}
