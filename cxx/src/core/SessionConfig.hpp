/**
 * @file SessionConfig.hpp
 * @brief Validated session configuration and its JSON persistence.
 */

#ifndef MEGAPHONE_SESSION_CONFIG_HPP
#define MEGAPHONE_SESSION_CONFIG_HPP

#include <string>
#include <chrono>
#include <nlohmann/json.hpp>
#include "PcmFormat.hpp"
#include "Errors.hpp"

namespace megaphone {

using json = nlohmann::json;

/**
 * @brief Everything a session needs to know before acquiring devices.
 *
 * Checked once by validate() at start_broadcast time; an invalid combination
 * fails with ErrorCode::ConfigError before any device is touched.
 */
struct SessionConfig {
    int sample_rate = 48000;
    int channels = 1;
    int bit_depth = 16;
    int frame_samples = 480;
    int latency_budget_ms = 40;

    std::string capture_device = "default";
    std::string playback_device = "default";
    int device_timeout_ms = 2000;

    float mic_gain = 1.0f;
    float voice_gain = 1.0f;
    int max_voices = 32;

    // SCHED_FIFO priority for the driver threads, 0 leaves the default policy
    int realtime_priority = 80;

    StreamFormat format() const {
        return StreamFormat{sample_rate, channels, bit_depth, static_cast<size_t>(frame_samples)};
    }

    std::chrono::milliseconds device_timeout() const {
        return std::chrono::milliseconds(device_timeout_ms);
    }

    /**
     * @brief Ring buffer capacity in frames: latency budget / frame duration.
     */
    size_t ring_capacity() const;

    /**
     * @brief Check every field and the combination of fields.
     *
     * @param error Receives a human-readable reason when invalid (may be null).
     * @return ErrorCode::Ok or ErrorCode::ConfigError.
     */
    ErrorCode validate(std::string* error = nullptr) const;

    bool operator==(const SessionConfig&) const = default;
};

void to_json(json& j, const SessionConfig& config);
void from_json(const json& j, SessionConfig& config);

/**
 * @brief Loads and saves SessionConfig as human-readable JSON.
 */
class SessionConfigStore {
public:
    static bool save_to_file(const SessionConfig& config, const std::string& path);

    /**
     * @brief Load and validate. Missing keys keep their defaults.
     */
    static ErrorCode load_from_file(SessionConfig& config, const std::string& path);

    static std::string serialize(const SessionConfig& config);
    static ErrorCode deserialize(SessionConfig& config, const std::string& data);
};

} // namespace megaphone

#endif // MEGAPHONE_SESSION_CONFIG_HPP
