/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#include "AlsaDriver.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <pthread.h>

namespace hal {

using megaphone::AudioLogger;
using megaphone::ErrorCode;
using megaphone::Sample;
using megaphone::StreamFormat;

namespace {

snd_pcm_format_t pcm_format_for(int bit_depth) {
    switch (bit_depth) {
        case 8: return SND_PCM_FORMAT_S8;
        case 16: return SND_PCM_FORMAT_S16_LE;
        case 32: return SND_PCM_FORMAT_S32_LE;
        default: return SND_PCM_FORMAT_UNKNOWN;
    }
}

size_t bytes_per_sample(int bit_depth) {
    return static_cast<size_t>(bit_depth / 8);
}

} // namespace

AlsaDriver::AlsaDriver(StreamDirection direction, const std::string& device, int realtime_priority)
    : pcm_handle_(nullptr)
    , device_name_(device)
    , direction_(direction)
    , realtime_priority_(realtime_priority)
    , running_(false)
{
    // Buffers will be sized after PCM setup
}

AlsaDriver::~AlsaDriver() {
    close();
}

ErrorCode AlsaDriver::open(const StreamFormat& format, std::chrono::milliseconds timeout) {
    close();

    if (pcm_format_for(format.bit_depth) == SND_PCM_FORMAT_UNKNOWN) {
        std::cerr << "ALSA: Unsupported bit depth " << format.bit_depth << std::endl;
        return ErrorCode::DeviceUnavailable;
    }

    const snd_pcm_stream_t stream =
        direction_ == StreamDirection::Capture ? SND_PCM_STREAM_CAPTURE : SND_PCM_STREAM_PLAYBACK;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    stall_limit_ = timeout;

    // Open non-blocking so a device held by another client cannot hang us
    int err;
    while ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), stream, SND_PCM_NONBLOCK)) < 0) {
        pcm_handle_ = nullptr;
        const bool busy = (err == -EBUSY || err == -EAGAIN);
        if (!busy || std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "ALSA: Cannot open " << to_string(direction_) << " device " << device_name_
                      << " (" << snd_strerror(err) << ")" << std::endl;
            return ErrorCode::DeviceUnavailable;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if ((err = snd_pcm_nonblock(pcm_handle_, 0)) < 0) {
        std::cerr << "ALSA: Cannot switch to blocking mode (" << snd_strerror(err) << ")" << std::endl;
        close();
        return ErrorCode::DeviceUnavailable;
    }

    if (!setup_pcm(format) || !setup_sw_params()) {
        close();
        return ErrorCode::DeviceUnavailable;
    }

    std::cout << "ALSA " << to_string(direction_) << ": " << device_name_
              << " rate=" << format_.sample_rate << " ch=" << format_.channels
              << " bits=" << format_.bit_depth << " period=" << period_size_
              << " buffer=" << buffer_size_ << std::endl;
    return ErrorCode::Ok;
}

bool AlsaDriver::setup_pcm(const StreamFormat& requested) {
    int err;
    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params)) < 0) {
        std::cerr << "ALSA: Cannot initialize hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        std::cerr << "ALSA: Cannot set access type (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params, pcm_format_for(requested.bit_depth))) < 0) {
        std::cerr << "ALSA: Cannot set " << requested.bit_depth << "-bit sample format (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    if ((err = snd_pcm_hw_params_set_channels(pcm_handle_, hw_params, static_cast<unsigned int>(requested.channels))) < 0) {
        std::cerr << "ALSA: Cannot set channel count " << requested.channels << " (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    unsigned int rate = static_cast<unsigned int>(requested.sample_rate);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params, &rate, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set sample rate (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    snd_pcm_uframes_t frames = requested.frame_samples;
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params, &frames, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set period size (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    unsigned int periods = 4;
    snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params, &periods, nullptr);

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params)) < 0) {
        std::cerr << "ALSA: Cannot set parameters (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    snd_pcm_hw_params_get_period_size(hw_params, &period_size_, nullptr);
    snd_pcm_hw_params_get_buffer_size(hw_params, &buffer_size_);

    // The session frame stays as requested; only the rate is negotiated.
    format_ = requested;
    format_.sample_rate = static_cast<int>(rate);

    frame_.assign(format_.frame_length(), 0);
    interleaved_buffer_.assign(format_.frame_length() * bytes_per_sample(format_.bit_depth), 0);

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        std::cerr << "ALSA: Cannot prepare audio interface for use (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    return true;
}

bool AlsaDriver::setup_sw_params() {
    int err;
    snd_pcm_sw_params_t* sw_params;
    snd_pcm_sw_params_alloca(&sw_params);

    if ((err = snd_pcm_sw_params_current(pcm_handle_, sw_params)) < 0) {
        std::cerr << "ALSA: Cannot read software parameters (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    snd_pcm_sw_params_set_avail_min(pcm_handle_, sw_params, period_size_);

    // Playback starts once the buffer is nearly full to avoid an immediate underrun
    const snd_pcm_uframes_t threshold = direction_ == StreamDirection::Playback
        ? std::max<snd_pcm_uframes_t>(buffer_size_ - period_size_, 1)
        : 1;
    snd_pcm_sw_params_set_start_threshold(pcm_handle_, sw_params, threshold);

    if ((err = snd_pcm_sw_params(pcm_handle_, sw_params)) < 0) {
        std::cerr << "ALSA: Cannot set software parameters (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    return true;
}

bool AlsaDriver::start() {
    if (running_) return true;
    if (!pcm_handle_) return false;

    int err;
    if (snd_pcm_state(pcm_handle_) != SND_PCM_STATE_PREPARED && (err = snd_pcm_prepare(pcm_handle_)) < 0) {
        std::cerr << "ALSA: Cannot prepare " << to_string(direction_) << " stream (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    running_ = true;
    processing_thread_ = std::thread(&AlsaDriver::thread_loop, this);
    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        if (processing_thread_.get_id() == std::this_thread::get_id()) {
            return; // called from our own callback; the loop exits on its own
        }
        processing_thread_.join();
    }

    if (pcm_handle_) {
        snd_pcm_drop(pcm_handle_);
    }
}

void AlsaDriver::close() {
    stop();
    if (pcm_handle_) {
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

void AlsaDriver::set_realtime_priority() {
    if (realtime_priority_ <= 0) return;

    // Set Real-Time Priority (SCHED_FIFO)
    struct sched_param param;
    param.sched_priority = realtime_priority_;
    int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    if (res != 0) {
        if (res == EPERM) {
            AudioLogger::instance().log_message("ALSA", "Priority Failed: EPERM (Need ulimit -r)");
        } else {
            AudioLogger::instance().log_message("ALSA", "Priority Failed: Unknown Error");
        }
    } else {
        AudioLogger::instance().log_event("ALSA_RT_PRIORITY", static_cast<float>(realtime_priority_));
    }
}

void AlsaDriver::thread_loop() {
    set_realtime_priority();

    if (direction_ == StreamDirection::Capture) {
        int err = snd_pcm_start(pcm_handle_);
        if (err < 0 && !recover_pcm(err)) {
            report_lost("capture start failed");
            return;
        }
    }

    while (running_) {
        if (direction_ == StreamDirection::Capture) {
            if (!read_frame()) break;
            if (callback_) callback_(std::span<Sample>(frame_));
        } else {
            // Zeroing: a missing callback plays silence, never stale data
            std::fill(frame_.begin(), frame_.end(), 0);
            if (callback_) callback_(std::span<Sample>(frame_));
            if (!write_frame()) break;
        }
    }
}

bool AlsaDriver::wait_ready() {
    const auto stall_start = std::chrono::steady_clock::now();
    while (running_) {
        int r = snd_pcm_wait(pcm_handle_, 100);
        if (r > 0) return true;
        if (r < 0) {
            if (!recover_pcm(r)) {
                report_lost("wait failed");
                return false;
            }
            return true;
        }
        if (std::chrono::steady_clock::now() - stall_start > stall_limit_) {
            report_lost("device stalled");
            return false;
        }
    }
    return false;
}

bool AlsaDriver::read_frame() {
    const size_t frame_bytes = static_cast<size_t>(format_.channels) * bytes_per_sample(format_.bit_depth);
    const snd_pcm_uframes_t wanted = format_.frame_samples;
    snd_pcm_uframes_t filled = 0;

    while (filled < wanted && running_) {
        if (!wait_ready()) return false;

        snd_pcm_sframes_t r = snd_pcm_readi(pcm_handle_, interleaved_buffer_.data() + filled * frame_bytes, wanted - filled);
        if (r == -EAGAIN) continue;
        if (r < 0) {
            if (!recover_pcm(static_cast<int>(r))) {
                report_lost("capture read failed");
                return false;
            }
            continue;
        }
        filled += static_cast<snd_pcm_uframes_t>(r);
    }
    if (filled < wanted) return false; // stop requested

    const size_t n = frame_.size();
    switch (format_.bit_depth) {
        case 8: {
            const auto* src = reinterpret_cast<const int8_t*>(interleaved_buffer_.data());
            for (size_t i = 0; i < n; ++i) frame_[i] = src[i];
            break;
        }
        case 16: {
            const auto* src = reinterpret_cast<const int16_t*>(interleaved_buffer_.data());
            for (size_t i = 0; i < n; ++i) frame_[i] = src[i];
            break;
        }
        default: {
            const auto* src = reinterpret_cast<const int32_t*>(interleaved_buffer_.data());
            std::copy_n(src, n, frame_.begin());
            break;
        }
    }
    return true;
}

bool AlsaDriver::write_frame() {
    const size_t n = frame_.size();
    switch (format_.bit_depth) {
        case 8: {
            auto* dst = reinterpret_cast<int8_t*>(interleaved_buffer_.data());
            for (size_t i = 0; i < n; ++i) dst[i] = static_cast<int8_t>(frame_[i]);
            break;
        }
        case 16: {
            auto* dst = reinterpret_cast<int16_t*>(interleaved_buffer_.data());
            for (size_t i = 0; i < n; ++i) dst[i] = static_cast<int16_t>(frame_[i]);
            break;
        }
        default: {
            auto* dst = reinterpret_cast<int32_t*>(interleaved_buffer_.data());
            std::copy_n(frame_.begin(), n, dst);
            break;
        }
    }

    const size_t frame_bytes = static_cast<size_t>(format_.channels) * bytes_per_sample(format_.bit_depth);
    const snd_pcm_uframes_t wanted = format_.frame_samples;
    snd_pcm_uframes_t written = 0;

    while (written < wanted && running_) {
        if (!wait_ready()) return false;

        snd_pcm_sframes_t r = snd_pcm_writei(pcm_handle_, interleaved_buffer_.data() + written * frame_bytes, wanted - written);
        if (r == -EAGAIN) continue;
        if (r < 0) {
            if (!recover_pcm(static_cast<int>(r))) {
                report_lost("playback write failed");
                return false;
            }
            continue;
        }
        written += static_cast<snd_pcm_uframes_t>(r);
    }
    return written == wanted;
}

bool AlsaDriver::recover_pcm(int err) {
    if (err == -EPIPE) {
        const uint64_t count = xruns_.fetch_add(1, std::memory_order_relaxed) + 1;
        AudioLogger::instance().log_event(direction_ == StreamDirection::Capture ? "CaptureXrun" : "PlaybackXrun",
                                          static_cast<float>(count));
        if (snd_pcm_prepare(pcm_handle_) < 0) return false;
        if (direction_ == StreamDirection::Capture) {
            return snd_pcm_start(pcm_handle_) >= 0;
        }
        return true;
    }
    if (err == -ESTRPIPE) {
        while ((err = snd_pcm_resume(pcm_handle_)) == -EAGAIN && running_)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (err < 0) {
            err = snd_pcm_prepare(pcm_handle_);
        }
        return err >= 0;
    }
    if (err == -EINTR) {
        return true;
    }
    // -ENODEV, -EBADFD, -EIO: the device is gone
    return false;
}

void AlsaDriver::report_lost(const char* reason) {
    running_ = false;
    AudioLogger::instance().log_message("ALSA", reason);
    if (error_callback_) {
        error_callback_(ErrorCode::DeviceLost);
    }
}

std::unique_ptr<AudioDriver> AlsaDeviceFactory::create(StreamDirection direction, const std::string& device,
                                                       int realtime_priority) {
    return std::make_unique<AlsaDriver>(direction, device, realtime_priority);
}

std::vector<DeviceInfo> AlsaDeviceFactory::enumerate() const {
    std::vector<DeviceInfo> devices;
    void** hints = nullptr;
    int err = snd_device_name_hint(-1, "pcm", &hints);
    if (err < 0) {
        std::cerr << "ALSA: Cannot list devices (" << snd_strerror(err) << ")" << std::endl;
        return devices;
    }

    auto take = [](void* hint, const char* id) {
        std::string value;
        if (char* raw = snd_device_name_get_hint(hint, id)) {
            value = raw;
            std::free(raw);
        }
        return value;
    };

    for (void** n = hints; *n != nullptr; ++n) {
        DeviceInfo info;
        info.name = take(*n, "NAME");
        if (info.name.empty() || info.name == "null") continue;
        info.description = take(*n, "DESC");
        std::replace(info.description.begin(), info.description.end(), '\n', ' ');
        const std::string io = take(*n, "IOID"); // empty means both directions
        info.capture = io.empty() || io == "Input";
        info.playback = io.empty() || io == "Output";
        devices.push_back(std::move(info));
    }

    snd_device_name_free_hint(hints);
    return devices;
}

} // namespace hal
