#include <gtest/gtest.h>
#include "SessionConfig.hpp"
#include "TestHelper.hpp"
#include <fstream>
#include <string>

using namespace megaphone;

TEST(SessionConfigTest, DefaultsAreValid) {
    SessionConfig config;
    std::string reason;
    EXPECT_EQ(config.validate(&reason), ErrorCode::Ok) << reason;
    EXPECT_EQ(config.ring_capacity(), 4u); // 40 ms of 10 ms frames
    EXPECT_EQ(config.format().frame_length(), 480u);
    EXPECT_DOUBLE_EQ(config.format().frame_duration_ms(), 10.0);
}

TEST(SessionConfigTest, RejectsUnsupportedValues) {
    auto expect_invalid = [](const SessionConfig& config) {
        std::string reason;
        EXPECT_EQ(config.validate(&reason), ErrorCode::ConfigError);
        EXPECT_FALSE(reason.empty());
    };

    SessionConfig config;
    config.bit_depth = 24;
    expect_invalid(config);

    config = SessionConfig{};
    config.channels = 3;
    expect_invalid(config);

    config = SessionConfig{};
    config.sample_rate = 4000;
    expect_invalid(config);

    config = SessionConfig{};
    config.frame_samples = 2;
    expect_invalid(config);

    config = SessionConfig{};
    config.mic_gain = -1.0f;
    expect_invalid(config);

    config = SessionConfig{};
    config.playback_device.clear();
    expect_invalid(config);

    config = SessionConfig{};
    config.max_voices = 0;
    expect_invalid(config);
}

TEST(SessionConfigTest, LatencyBudgetMustHoldOneToSixtyFourFrames) {
    SessionConfig config;
    config.latency_budget_ms = 5; // shorter than one 10 ms frame
    EXPECT_EQ(config.ring_capacity(), 0u);
    EXPECT_EQ(config.validate(), ErrorCode::ConfigError);

    config.latency_budget_ms = 10;
    EXPECT_EQ(config.ring_capacity(), 1u);
    EXPECT_EQ(config.validate(), ErrorCode::Ok);

    config.latency_budget_ms = 1000;
    EXPECT_EQ(config.validate(), ErrorCode::ConfigError);
}

TEST(SessionConfigStoreTest, SerializeRoundTrip) {
    SessionConfig config;
    config.sample_rate = 44100;
    config.channels = 2;
    config.frame_samples = 441;
    config.capture_device = "hw:1,0";
    config.mic_gain = 0.5f;

    SessionConfig loaded;
    ASSERT_EQ(SessionConfigStore::deserialize(loaded, SessionConfigStore::serialize(config)), ErrorCode::Ok);
    EXPECT_EQ(loaded, config);
}

TEST(SessionConfigStoreTest, MissingKeysKeepDefaultsAndUnknownKeysAreIgnored) {
    SessionConfig loaded;
    ASSERT_EQ(SessionConfigStore::deserialize(loaded, R"({"bit_depth": 32, "theme": "dark"})"), ErrorCode::Ok);
    EXPECT_EQ(loaded.bit_depth, 32);
    EXPECT_EQ(loaded.sample_rate, 48000);
    EXPECT_EQ(loaded.capture_device, "default");
}

TEST(SessionConfigStoreTest, InvalidDocumentsAreConfigErrors) {
    SessionConfig config;
    config.sample_rate = 22050;

    EXPECT_EQ(SessionConfigStore::deserialize(config, "{ broken"), ErrorCode::ConfigError);
    EXPECT_EQ(SessionConfigStore::deserialize(config, "[1, 2]"), ErrorCode::ConfigError);
    EXPECT_EQ(SessionConfigStore::deserialize(config, R"({"sample_rate": "fast"})"), ErrorCode::ConfigError);
    EXPECT_EQ(SessionConfigStore::deserialize(config, R"({"bit_depth": 12})"), ErrorCode::ConfigError);

    // Target untouched on failure
    EXPECT_EQ(config.sample_rate, 22050);
}

TEST(SessionConfigStoreTest, SaveAndLoadFile) {
    test::TempDir dir;
    const std::string path = dir.file("megaphone.json");

    SessionConfig config;
    config.max_voices = 8;
    ASSERT_TRUE(SessionConfigStore::save_to_file(config, path));

    SessionConfig loaded;
    ASSERT_EQ(SessionConfigStore::load_from_file(loaded, path), ErrorCode::Ok);
    EXPECT_EQ(loaded.max_voices, 8);

    EXPECT_EQ(SessionConfigStore::load_from_file(loaded, dir.file("missing.json")), ErrorCode::ConfigError);
}
