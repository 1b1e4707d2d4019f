/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#ifndef MEGAPHONE_HAL_ALSA_DRIVER_HPP
#define MEGAPHONE_HAL_ALSA_DRIVER_HPP

#include "AudioDriver.hpp"
#include "DeviceFactory.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace hal {

/**
 * @brief ALSA capture or playback stream (interleaved, S8/S16_LE/S32_LE).
 *
 * The processing thread reads or writes exactly one session frame per
 * iteration. Xruns are recovered and counted; any other PCM error, or the
 * device delivering nothing for longer than the open() timeout, is reported
 * as ErrorCode::DeviceLost through the error callback.
 */
class AlsaDriver : public AudioDriver {
public:
    /**
     * @param direction Capture (microphone) or playback (speaker).
     * @param device ALSA device name.
     * @param realtime_priority SCHED_FIFO priority, 0 keeps the default policy.
     */
    AlsaDriver(StreamDirection direction, const std::string& device = "default", int realtime_priority = 80);
    ~AlsaDriver() override;

    megaphone::ErrorCode open(const megaphone::StreamFormat& format, std::chrono::milliseconds timeout) override;
    bool start() override;
    void stop() override;
    void close() override;
    void set_callback(FrameCallback callback) override { callback_ = std::move(callback); }
    void set_error_callback(ErrorCallback callback) override { error_callback_ = std::move(callback); }

    megaphone::StreamFormat format() const override { return format_; }
    StreamDirection direction() const override { return direction_; }
    bool is_open() const override { return pcm_handle_ != nullptr; }
    bool is_running() const override { return running_.load(); }
    uint64_t xrun_count() const override { return xruns_.load(std::memory_order_relaxed); }

    const std::string& device_name() const { return device_name_; }

private:
    void thread_loop();
    bool setup_pcm(const megaphone::StreamFormat& requested);
    bool setup_sw_params();
    bool recover_pcm(int err);
    bool wait_ready();
    bool read_frame();
    bool write_frame();
    void set_realtime_priority();
    void report_lost(const char* reason);

    snd_pcm_t* pcm_handle_;
    std::string device_name_;
    StreamDirection direction_;
    int realtime_priority_;
    megaphone::StreamFormat format_;
    snd_pcm_uframes_t period_size_ = 0;
    snd_pcm_uframes_t buffer_size_ = 0;
    std::chrono::milliseconds stall_limit_{2000};

    FrameCallback callback_;
    ErrorCallback error_callback_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> xruns_{0};
    std::thread processing_thread_;

    // Internal buffers
    std::vector<megaphone::Sample> frame_;
    std::vector<uint8_t> interleaved_buffer_;
};

/**
 * @brief Creates AlsaDriver instances and lists PCM devices via name hints.
 */
class AlsaDeviceFactory : public DeviceFactory {
public:
    std::unique_ptr<AudioDriver> create(StreamDirection direction, const std::string& device,
                                        int realtime_priority) override;
    std::vector<DeviceInfo> enumerate() const override;
};

} // namespace hal

#endif // MEGAPHONE_HAL_ALSA_DRIVER_HPP
