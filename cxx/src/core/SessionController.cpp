/**
 * @file SessionController.cpp
 * @brief Session state machine and ordered device teardown.
 */

#include "SessionController.hpp"
#include "Logger.hpp"
#include <iostream>

namespace megaphone {

SessionController::SessionController(const SessionConfig& config, hal::DeviceFactory& factory, Worker& worker,
                                     VoicePool& voices, VoiceCommandQueue& commands)
    : config_(config)
    , factory_(factory)
    , worker_(worker)
    , voices_(voices)
    , commands_(commands)
{
}

SessionController::~SessionController() {
    stop();
    // A device-lost task may still be queued and refers to this controller
    worker_.wait_idle();
}

void SessionController::set_permission_hook(PermissionHook hook) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    permission_ = std::move(hook);
}

ErrorCode SessionController::start() {
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (state() != BroadcastState::Idle) {
        std::cerr << "[Session] start rejected in state " << to_string(state()) << std::endl;
        return ErrorCode::InvalidState;
    }

    std::string reason;
    if (config_.validate(&reason) != ErrorCode::Ok) {
        std::cerr << "[Session] Invalid configuration: " << reason << std::endl;
        last_error_.store(ErrorCode::ConfigError);
        return ErrorCode::ConfigError;
    }

    if (permission_ && !permission_()) {
        std::cerr << "[Session] Microphone permission denied" << std::endl;
        last_error_.store(ErrorCode::PermissionDenied);
        return ErrorCode::PermissionDenied;
    }

    state_.store(BroadcastState::Starting, std::memory_order_release);
    const uint64_t generation = generation_.fetch_add(1) + 1;
    const StreamFormat format = config_.format();

    voices_.clear();
    commands_.clear();

    auto session = std::make_shared<Session>();
    session->ring = std::make_unique<FrameRingBuffer>(config_.ring_capacity(), format.frame_length());
    session->mixer = std::make_unique<MixEngine>(format, *session->ring, voices_, commands_,
                                                 config_.mic_gain, config_.voice_gain);

    auto capture_driver = factory_.create(hal::StreamDirection::Capture, config_.capture_device,
                                          config_.realtime_priority);
    auto playback_driver = factory_.create(hal::StreamDirection::Playback, config_.playback_device,
                                           config_.realtime_priority);

    ErrorCode err = ErrorCode::Ok;
    if (!capture_driver || !playback_driver) {
        std::cerr << "[Session] No driver available for the configured devices" << std::endl;
        err = ErrorCode::DeviceUnavailable;
    } else {
        session->capture = std::make_unique<CapturePipeline>(std::move(capture_driver), *session->ring);
        session->output = std::make_unique<OutputPipeline>(std::move(playback_driver), *session->mixer);

        auto lost = [this, generation](ErrorCode error) { on_device_lost(generation, error); };
        session->capture->set_error_callback(lost);
        session->output->set_error_callback(lost);
    }

    {
        std::lock_guard<std::mutex> session_lock(session_mutex_);
        session_ = session;
    }

    if (err == ErrorCode::Ok) {
        err = acquire(*session);
    }

    if (err != ErrorCode::Ok) {
        teardown(*session);
        last_error_.store(err);
        state_.store(BroadcastState::Faulted, std::memory_order_release);
        return err;
    }

    last_error_.store(ErrorCode::Ok);
    state_.store(BroadcastState::Live, std::memory_order_release);
    std::cout << "[Session] Live: " << format.sample_rate << " Hz, " << format.channels << " ch, "
              << format.bit_depth << "-bit, " << format.frame_samples << " samples/frame, ring "
              << session->ring->capacity() << " frames" << std::endl;
    return ErrorCode::Ok;
}

ErrorCode SessionController::acquire(Session& session) {
    const StreamFormat format = config_.format();
    const auto timeout = config_.device_timeout();

    ErrorCode err = session.capture->open(format, timeout);
    if (err != ErrorCode::Ok) {
        std::cerr << "[Session] Capture device '" << config_.capture_device << "' unavailable" << std::endl;
        return ErrorCode::DeviceUnavailable;
    }
    if (session.capture->format() != format) {
        std::cerr << "[Session] Capture device negotiated " << session.capture->format().sample_rate
                  << " Hz, session needs " << format.sample_rate << " Hz" << std::endl;
        return ErrorCode::DeviceUnavailable;
    }

    err = session.output->open(format, timeout);
    if (err != ErrorCode::Ok) {
        std::cerr << "[Session] Playback device '" << config_.playback_device << "' unavailable" << std::endl;
        return ErrorCode::DeviceUnavailable;
    }
    if (session.output->format() != format) {
        std::cerr << "[Session] Playback device negotiated " << session.output->format().sample_rate
                  << " Hz, session needs " << format.sample_rate << " Hz" << std::endl;
        return ErrorCode::DeviceUnavailable;
    }

    // Capture first so the ring holds a frame by the first output tick
    if (!session.capture->start() || !session.output->start()) {
        std::cerr << "[Session] Cannot start streams" << std::endl;
        return ErrorCode::DeviceUnavailable;
    }
    return ErrorCode::Ok;
}

void SessionController::teardown(Session& session) {
    if (session.output) {
        session.output->stop();
        session.output->close();
    }
    if (session.capture) {
        session.capture->stop();
        session.capture->close();
    }
    // No mix tick can run any more
    voices_.clear();
    commands_.clear();
}

void SessionController::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (state() != BroadcastState::Live) {
        return;
    }

    state_.store(BroadcastState::Stopping, std::memory_order_release);
    if (auto session = current()) {
        teardown(*session);
    }
    state_.store(BroadcastState::Idle, std::memory_order_release);

    std::cout << "[Session] Stopped" << std::endl;
    AudioLogger::instance().flush(std::cout);
}

ErrorCode SessionController::reset() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (state() != BroadcastState::Faulted) {
        return ErrorCode::InvalidState;
    }
    last_error_.store(ErrorCode::Ok);
    state_.store(BroadcastState::Idle, std::memory_order_release);
    return ErrorCode::Ok;
}

void SessionController::on_device_lost(uint64_t generation, ErrorCode error) {
    // Driver thread: it cannot join itself, so the teardown runs on the worker
    AudioLogger::instance().log_message("Session", to_string(error));
    worker_.post([this, generation]() { handle_device_lost(generation); });
}

void SessionController::handle_device_lost(uint64_t generation) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (generation != generation_.load() || state() != BroadcastState::Live) {
        return; // stale report or already stopped
    }

    state_.store(BroadcastState::Stopping, std::memory_order_release);
    if (auto session = current()) {
        teardown(*session);
    }
    last_error_.store(ErrorCode::DeviceLost);
    state_.store(BroadcastState::Faulted, std::memory_order_release);
    std::cerr << "[Session] Device lost, session torn down" << std::endl;
}

std::shared_ptr<SessionController::Session> SessionController::current() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

SessionState SessionController::snapshot() const {
    SessionState snap;
    snap.state = state();
    snap.last_error = last_error_.load();
    snap.capture_active = snap.state == BroadcastState::Live;
    snap.output_active = snap.capture_active;

    const StreamFormat format = config_.format();
    snap.sample_rate = format.sample_rate;
    snap.channels = format.channels;
    snap.bit_depth = format.bit_depth;
    snap.frame_samples = format.frame_samples;

    auto session = current();
    if (!session) {
        return snap;
    }

    auto& diag = snap.diagnostics;
    diag.ticks = session->mixer->ticks();
    diag.underruns = session->mixer->underruns();
    diag.clipped_samples = session->mixer->clipped_samples();
    diag.worst_mix_us = session->mixer->worst_mix_us();
    diag.over_budget_ticks = session->mixer->over_budget_ticks();
    diag.active_voices = snap.state == BroadcastState::Live ? session->mixer->active_voices() : 0;
    diag.ring_depth = session->ring->size();
    diag.ring_capacity = session->ring->capacity();
    if (session->capture) {
        diag.frames_captured = session->capture->frames_captured();
        diag.overruns = session->capture->overruns();
        diag.capture_xruns = session->capture->xruns();
    }
    if (session->output) {
        diag.playback_xruns = session->output->xruns();
    }
    return snap;
}

} // namespace megaphone
