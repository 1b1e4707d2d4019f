#include <gtest/gtest.h>
#include "megaphone/CInterface.h"
#include <cstring>
#include <string>
#include <vector>

namespace {

int deny_permission(void* user_data) {
    ++*static_cast<int*>(user_data);
    return 0;
}

} // namespace

class BridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = megaphone_create();
        ASSERT_NE(engine, nullptr);
    }

    void TearDown() override {
        megaphone_destroy(engine);
    }

    MegaphoneHandle engine = nullptr;
};

TEST_F(BridgeTest, StartsIdle) {
    MegaphoneSessionState state;
    ASSERT_EQ(megaphone_get_state(engine, &state), MEGAPHONE_OK);
    EXPECT_EQ(state.state, MEGAPHONE_STATE_IDLE);
    EXPECT_EQ(state.capture_active, 0);
    EXPECT_EQ(state.output_active, 0);
    EXPECT_EQ(state.sample_rate, 48000);
    EXPECT_EQ(state.frame_samples, 480u);
    EXPECT_EQ(state.last_error, MEGAPHONE_OK);

    EXPECT_EQ(megaphone_stop_broadcast(engine), MEGAPHONE_OK);
    EXPECT_EQ(megaphone_reset(engine), MEGAPHONE_ERR_INVALID_STATE);
}

TEST_F(BridgeTest, PermissionDenialStopsStart) {
    int asked = 0;
    ASSERT_EQ(megaphone_set_permission(engine, deny_permission, &asked), MEGAPHONE_OK);

    EXPECT_EQ(megaphone_start_broadcast(engine), MEGAPHONE_ERR_PERMISSION_DENIED);
    EXPECT_EQ(asked, 1);

    MegaphoneSessionState state;
    ASSERT_EQ(megaphone_get_state(engine, &state), MEGAPHONE_OK);
    EXPECT_EQ(state.state, MEGAPHONE_STATE_IDLE);
    EXPECT_EQ(state.last_error, MEGAPHONE_ERR_PERMISSION_DENIED);
}

TEST_F(BridgeTest, AssetLifecycle) {
    const std::vector<int32_t> pcm{100, 100, 100};
    const int64_t id = megaphone_add_pcm_asset(engine, "beep", pcm.data(), pcm.size(), 48000, 1, 16);
    ASSERT_GT(id, 0);
    EXPECT_EQ(megaphone_asset_count(engine), 1);

    MegaphoneAssetInfo info;
    ASSERT_EQ(megaphone_asset_info(engine, 0, &info), MEGAPHONE_OK);
    EXPECT_EQ(info.id, static_cast<uint32_t>(id));
    EXPECT_STREQ(info.name, "beep");
    EXPECT_STREQ(info.source_path, "");
    EXPECT_EQ(info.frame_count, 3u);
    EXPECT_EQ(megaphone_asset_info(engine, 1, &info), MEGAPHONE_ERR_NOT_FOUND);

    // Not broadcasting yet
    EXPECT_EQ(megaphone_trigger_asset(engine, static_cast<uint32_t>(id)), MEGAPHONE_ERR_INVALID_STATE);
    EXPECT_EQ(megaphone_trigger_asset(engine, 9999), MEGAPHONE_ERR_NOT_FOUND);

    EXPECT_EQ(megaphone_remove_asset(engine, static_cast<uint32_t>(id)), MEGAPHONE_OK);
    EXPECT_EQ(megaphone_remove_asset(engine, static_cast<uint32_t>(id)), MEGAPHONE_ERR_NOT_FOUND);
    EXPECT_EQ(megaphone_asset_count(engine), 0);
}

TEST_F(BridgeTest, DecodeErrorsAreReported) {
    EXPECT_EQ(megaphone_add_asset(engine, "/nonexistent/clip.wav", nullptr), MEGAPHONE_ERR_DECODE);
    const int32_t pcm[] = {1, 2, 3};
    EXPECT_EQ(megaphone_add_pcm_asset(engine, "odd", pcm, 3, 48000, 2, 16), MEGAPHONE_ERR_DECODE);
    EXPECT_EQ(megaphone_asset_count(engine), 0);
}

TEST_F(BridgeTest, QueryAndVoiceCallsReturnCodes) {
    MegaphoneAssetInfo info;
    EXPECT_EQ(megaphone_get_state(engine, nullptr), MEGAPHONE_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(megaphone_asset_info(engine, -1, &info), MEGAPHONE_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(megaphone_asset_info(engine, 0, nullptr), MEGAPHONE_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(megaphone_asset_info(engine, 0, &info), MEGAPHONE_ERR_NOT_FOUND);
    EXPECT_EQ(megaphone_asset_count(engine), 0);
    EXPECT_EQ(megaphone_trigger_asset(engine, 1), MEGAPHONE_ERR_NOT_FOUND);
    EXPECT_EQ(megaphone_stop_voice(engine, 1), MEGAPHONE_OK);
    EXPECT_EQ(megaphone_set_permission(engine, nullptr, nullptr), MEGAPHONE_OK);
}

TEST(BridgeApiTest, NullHandlesAreRejected) {
    MegaphoneSessionState state;
    EXPECT_EQ(megaphone_start_broadcast(nullptr), MEGAPHONE_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(megaphone_get_state(nullptr, &state), MEGAPHONE_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(megaphone_asset_count(nullptr), MEGAPHONE_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(megaphone_trigger_asset(nullptr, 1), MEGAPHONE_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(megaphone_stop_voice(nullptr, 1), MEGAPHONE_ERR_INVALID_ARGUMENT);
    MegaphoneAssetInfo info;
    EXPECT_EQ(megaphone_asset_info(nullptr, 0, &info), MEGAPHONE_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(megaphone_set_permission(nullptr, nullptr, nullptr), MEGAPHONE_ERR_INVALID_ARGUMENT);
    megaphone_destroy(nullptr);
}

TEST(BridgeApiTest, MissingConfigFileFailsCreation) {
    EXPECT_EQ(megaphone_create_from_config("/nonexistent/megaphone.json"), nullptr);
    EXPECT_EQ(megaphone_create_from_config(nullptr), nullptr);
}

TEST(BridgeApiTest, ErrorStrings) {
    EXPECT_STREQ(megaphone_error_string(MEGAPHONE_OK), "Ok");
    EXPECT_STREQ(megaphone_error_string(MEGAPHONE_ERR_NOT_FOUND), "NotFound");
    EXPECT_STREQ(megaphone_error_string(MEGAPHONE_ERR_DEVICE_LOST), "DeviceLost");
    EXPECT_STREQ(megaphone_error_string(MEGAPHONE_ERR_INVALID_ARGUMENT), "InvalidArgument");
    EXPECT_STREQ(megaphone_error_string(-42), "Unknown");
}
