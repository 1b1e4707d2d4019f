/**
 * @file SessionController.hpp
 * @brief Broadcast session lifecycle: device acquisition, streaming, teardown.
 */

#ifndef MEGAPHONE_SESSION_CONTROLLER_HPP
#define MEGAPHONE_SESSION_CONTROLLER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include "CapturePipeline.hpp"
#include "DeviceFactory.hpp"
#include "Errors.hpp"
#include "FrameRingBuffer.hpp"
#include "MixEngine.hpp"
#include "OutputPipeline.hpp"
#include "SessionConfig.hpp"
#include "VoiceCommandQueue.hpp"
#include "VoicePool.hpp"
#include "Worker.hpp"

namespace megaphone {

enum class BroadcastState {
    Idle,
    Starting,
    Live,
    Stopping,
    Faulted
};

inline const char* to_string(BroadcastState state) {
    switch (state) {
        case BroadcastState::Idle: return "Idle";
        case BroadcastState::Starting: return "Starting";
        case BroadcastState::Live: return "Live";
        case BroadcastState::Stopping: return "Stopping";
        case BroadcastState::Faulted: return "Faulted";
    }
    return "Unknown";
}

/**
 * @brief Counters of the current (or last) session. Never reset mid-session.
 */
struct SessionDiagnostics {
    uint64_t ticks = 0;             // output frames rendered
    uint64_t frames_captured = 0;
    uint64_t overruns = 0;          // capture frames dropped (drop-oldest)
    uint64_t underruns = 0;         // mic frames replaced by silence
    uint64_t clipped_samples = 0;
    uint64_t capture_xruns = 0;
    uint64_t playback_xruns = 0;
    uint64_t worst_mix_us = 0;
    uint64_t over_budget_ticks = 0;
    size_t active_voices = 0;
    size_t ring_depth = 0;
    size_t ring_capacity = 0;
};

/**
 * @brief Passive snapshot returned by observe_state().
 *
 * capture_active and output_active are always equal: the microphone is
 * live exactly when the speaker is.
 */
struct SessionState {
    BroadcastState state = BroadcastState::Idle;
    bool capture_active = false;
    bool output_active = false;
    int sample_rate = 0;
    int channels = 0;
    int bit_depth = 0;
    size_t frame_samples = 0;
    ErrorCode last_error = ErrorCode::Ok;
    SessionDiagnostics diagnostics;
};

/**
 * @brief Idle -> Starting -> Live -> Stopping -> Idle, plus Faulted.
 *
 * Control calls are serialized by a mutex no real-time thread touches.
 * A device reported lost by a driver thread is torn down on the worker:
 * output first, then capture, then the state becomes Faulted.
 */
class SessionController {
public:
    using PermissionHook = std::function<bool()>;

    SessionController(const SessionConfig& config, hal::DeviceFactory& factory, Worker& worker,
                      VoicePool& voices, VoiceCommandQueue& commands);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * @brief Consulted by start() before any device is touched. Unset means granted.
     */
    void set_permission_hook(PermissionHook hook);

    /**
     * @brief Acquire both devices and go Live.
     *
     * @return Ok, InvalidState (not Idle), ConfigError, PermissionDenied
     *         (both leave the state Idle) or DeviceUnavailable (Faulted).
     */
    ErrorCode start();

    /**
     * @brief Release both devices and drop every voice. No-op unless Live.
     */
    void stop();

    /**
     * @brief Faulted -> Idle. InvalidState from any other state.
     */
    ErrorCode reset();

    BroadcastState state() const { return state_.load(std::memory_order_acquire); }
    SessionState snapshot() const;

    const SessionConfig& config() const { return config_; }

private:
    struct Session {
        std::unique_ptr<FrameRingBuffer> ring;
        std::unique_ptr<MixEngine> mixer;
        std::unique_ptr<CapturePipeline> capture;
        std::unique_ptr<OutputPipeline> output;
    };

    ErrorCode acquire(Session& session);
    void teardown(Session& session);
    void on_device_lost(uint64_t generation, ErrorCode error);
    void handle_device_lost(uint64_t generation);
    std::shared_ptr<Session> current() const;

    SessionConfig config_;
    hal::DeviceFactory& factory_;
    Worker& worker_;
    VoicePool& voices_;
    VoiceCommandQueue& commands_;
    PermissionHook permission_;

    std::mutex control_mutex_;
    mutable std::mutex session_mutex_; // guards session_ pointer only
    std::shared_ptr<Session> session_;

    std::atomic<BroadcastState> state_{BroadcastState::Idle};
    std::atomic<ErrorCode> last_error_{ErrorCode::Ok};
    std::atomic<uint64_t> generation_{0};
};

} // namespace megaphone

#endif // MEGAPHONE_SESSION_CONTROLLER_HPP
