#include "SessionConfig.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <cmath>

namespace megaphone {

namespace {

constexpr size_t kMaxRingFrames = 64;

bool fail(std::string* error, const std::string& reason) {
    if (error) *error = reason;
    return false;
}

bool check_fields(const SessionConfig& c, std::string* error) {
    if (c.sample_rate < 8000 || c.sample_rate > 192000)
        return fail(error, "sample_rate must be within 8000..192000 Hz");
    if (c.channels < 1 || c.channels > 2)
        return fail(error, "channels must be 1 (mono) or 2 (stereo)");
    if (!is_supported_bit_depth(c.bit_depth))
        return fail(error, "bit_depth must be 8, 16 or 32");
    if (c.frame_samples < 16 || c.frame_samples > 8192)
        return fail(error, "frame_samples must be within 16..8192");
    if (c.latency_budget_ms <= 0)
        return fail(error, "latency_budget_ms must be positive");
    if (c.capture_device.empty() || c.playback_device.empty())
        return fail(error, "device names must not be empty");
    if (c.device_timeout_ms < 100 || c.device_timeout_ms > 30000)
        return fail(error, "device_timeout_ms must be within 100..30000");
    if (!std::isfinite(c.mic_gain) || c.mic_gain < 0.0f || c.mic_gain > 8.0f)
        return fail(error, "mic_gain must be within 0..8");
    if (!std::isfinite(c.voice_gain) || c.voice_gain < 0.0f || c.voice_gain > 8.0f)
        return fail(error, "voice_gain must be within 0..8");
    if (c.max_voices < 1 || c.max_voices > 256)
        return fail(error, "max_voices must be within 1..256");
    if (c.realtime_priority < 0 || c.realtime_priority > 99)
        return fail(error, "realtime_priority must be within 0..99");

    const size_t capacity = c.ring_capacity();
    if (capacity == 0)
        return fail(error, "latency_budget_ms is shorter than one frame");
    if (capacity > kMaxRingFrames)
        return fail(error, "latency_budget_ms holds more than 64 frames");
    return true;
}

} // namespace

size_t SessionConfig::ring_capacity() const {
    const double frame_ms = format().frame_duration_ms();
    if (frame_ms <= 0.0) return 0;
    return static_cast<size_t>(std::floor(static_cast<double>(latency_budget_ms) / frame_ms + 1e-9));
}

ErrorCode SessionConfig::validate(std::string* error) const {
    return check_fields(*this, error) ? ErrorCode::Ok : ErrorCode::ConfigError;
}

void to_json(json& j, const SessionConfig& c) {
    j = json{
        {"sample_rate", c.sample_rate},
        {"channels", c.channels},
        {"bit_depth", c.bit_depth},
        {"frame_samples", c.frame_samples},
        {"latency_budget_ms", c.latency_budget_ms},
        {"capture_device", c.capture_device},
        {"playback_device", c.playback_device},
        {"device_timeout_ms", c.device_timeout_ms},
        {"mic_gain", c.mic_gain},
        {"voice_gain", c.voice_gain},
        {"max_voices", c.max_voices},
        {"realtime_priority", c.realtime_priority}
    };
}

void from_json(const json& j, SessionConfig& c) {
    const SessionConfig defaults;
    c.sample_rate = j.value("sample_rate", defaults.sample_rate);
    c.channels = j.value("channels", defaults.channels);
    c.bit_depth = j.value("bit_depth", defaults.bit_depth);
    c.frame_samples = j.value("frame_samples", defaults.frame_samples);
    c.latency_budget_ms = j.value("latency_budget_ms", defaults.latency_budget_ms);
    c.capture_device = j.value("capture_device", defaults.capture_device);
    c.playback_device = j.value("playback_device", defaults.playback_device);
    c.device_timeout_ms = j.value("device_timeout_ms", defaults.device_timeout_ms);
    c.mic_gain = j.value("mic_gain", defaults.mic_gain);
    c.voice_gain = j.value("voice_gain", defaults.voice_gain);
    c.max_voices = j.value("max_voices", defaults.max_voices);
    c.realtime_priority = j.value("realtime_priority", defaults.realtime_priority);
}

std::string SessionConfigStore::serialize(const SessionConfig& config) {
    json j = config;
    return j.dump(4);
}

ErrorCode SessionConfigStore::deserialize(SessionConfig& config, const std::string& data) {
    SessionConfig parsed;
    try {
        json j = json::parse(data);
        if (!j.is_object()) {
            std::cerr << "[SessionConfig] Top-level JSON value must be an object" << std::endl;
            return ErrorCode::ConfigError;
        }
        parsed = j.get<SessionConfig>();
    } catch (const json::exception& e) {
        std::cerr << "[SessionConfig] Invalid JSON: " << e.what() << std::endl;
        return ErrorCode::ConfigError;
    }

    std::string reason;
    if (parsed.validate(&reason) != ErrorCode::Ok) {
        std::cerr << "[SessionConfig] Rejected: " << reason << std::endl;
        return ErrorCode::ConfigError;
    }
    config = parsed;
    return ErrorCode::Ok;
}

bool SessionConfigStore::save_to_file(const SessionConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[SessionConfig] Failed to open for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

ErrorCode SessionConfigStore::load_from_file(SessionConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[SessionConfig] Failed to open file: " << path << std::endl;
        return ErrorCode::ConfigError;
    }
    std::stringstream content;
    content << file.rdbuf();
    const ErrorCode result = deserialize(config, content.str());
    if (result == ErrorCode::Ok) {
        std::cout << "[SessionConfig] Loaded " << path << std::endl;
    }
    return result;
}

} // namespace megaphone
