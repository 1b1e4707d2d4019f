/**
 * @file TestHelper.hpp
 * @brief Hardware-free drivers and fixtures for engine tests.
 */

#ifndef MEGAPHONE_TEST_HELPER_HPP
#define MEGAPHONE_TEST_HELPER_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sndfile.h>
#include <unistd.h>
#include "AudioDriver.hpp"
#include "AudioAsset.hpp"
#include "DeviceFactory.hpp"

namespace test {

using megaphone::ErrorCode;
using megaphone::Sample;
using megaphone::StreamFormat;

/**
 * @brief Shared record of driver open/close calls, in call order.
 */
class DeviceEventLog {
public:
    void record(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

/**
 * @brief AudioDriver without a thread: the test drives every tick.
 */
class ManualDriver : public hal::AudioDriver {
public:
    ManualDriver(hal::StreamDirection direction, DeviceEventLog& log)
        : direction_(direction)
        , log_(log)
    {
    }

    ErrorCode open(const StreamFormat& format, std::chrono::milliseconds /*timeout*/) override {
        if (fail_open) {
            return ErrorCode::DeviceUnavailable;
        }
        format_ = format;
        if (negotiated_rate > 0) {
            format_.sample_rate = negotiated_rate;
        }
        frame_.assign(format_.frame_length(), 0);
        open_ = true;
        log_.record(std::string("open ") + hal::to_string(direction_));
        return ErrorCode::Ok;
    }

    bool start() override {
        if (!open_) return false;
        running_ = true;
        return true;
    }

    void stop() override { running_ = false; }

    void close() override {
        stop();
        if (open_) {
            open_ = false;
            log_.record(std::string("close ") + hal::to_string(direction_));
        }
    }

    void set_callback(FrameCallback callback) override { callback_ = std::move(callback); }
    void set_error_callback(ErrorCallback callback) override { error_callback_ = std::move(callback); }

    StreamFormat format() const override { return format_; }
    hal::StreamDirection direction() const override { return direction_; }
    bool is_open() const override { return open_; }
    bool is_running() const override { return running_; }

    /**
     * @brief Capture tick: deliver one frame as if read from the microphone.
     */
    void capture(const std::vector<Sample>& frame) {
        if (!running_ || !callback_) return;
        frame_ = frame;
        frame_.resize(format_.frame_length(), 0);
        callback_(std::span<Sample>(frame_));
    }

    /**
     * @brief Playback tick: the frame the speaker would receive.
     */
    std::vector<Sample> play() {
        std::fill(frame_.begin(), frame_.end(), 0);
        if (running_ && callback_) {
            callback_(std::span<Sample>(frame_));
        }
        return frame_;
    }

    /**
     * @brief Simulate the device disappearing mid-stream.
     */
    void lose() {
        running_ = false;
        if (error_callback_) error_callback_(ErrorCode::DeviceLost);
    }

    bool fail_open = false;
    int negotiated_rate = 0;

private:
    hal::StreamDirection direction_;
    DeviceEventLog& log_;
    StreamFormat format_;
    std::vector<Sample> frame_;
    FrameCallback callback_;
    ErrorCallback error_callback_;
    std::atomic<bool> open_{false};
    std::atomic<bool> running_{false};
};

/**
 * @brief DeviceFactory handing out ManualDrivers. Keeps raw pointers to the
 * most recently created pair; they stay valid until the next session starts.
 */
class ManualDeviceFactory : public hal::DeviceFactory {
public:
    std::unique_ptr<hal::AudioDriver> create(hal::StreamDirection direction, const std::string& device,
                                             int /*realtime_priority*/) override {
        ++created;
        requested_devices.push_back(device);
        auto driver = std::make_unique<ManualDriver>(direction, log);
        if (direction == hal::StreamDirection::Capture) {
            driver->fail_open = fail_capture;
            capture = driver.get();
        } else {
            driver->fail_open = fail_playback;
            driver->negotiated_rate = playback_rate;
            playback = driver.get();
        }
        return driver;
    }

    std::vector<hal::DeviceInfo> enumerate() const override {
        return {hal::DeviceInfo{"manual", "Manual test device", true, true}};
    }

    bool fail_capture = false;
    bool fail_playback = false;
    int playback_rate = 0;

    int created = 0;
    std::vector<std::string> requested_devices;
    ManualDriver* capture = nullptr;
    ManualDriver* playback = nullptr;
    DeviceEventLog log;
};

inline bool wait_until(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

inline std::shared_ptr<const megaphone::AudioAsset> make_asset(std::vector<Sample> samples, int channels = 1,
                                                               int sample_rate = 48000) {
    auto asset = std::make_shared<megaphone::AudioAsset>();
    asset->info.id = 1;
    asset->info.name = "test";
    asset->info.channels = channels;
    asset->info.sample_rate = sample_rate;
    asset->info.frame_count = samples.size() / static_cast<size_t>(channels);
    asset->samples = std::move(samples);
    return asset;
}

/**
 * @brief Scratch directory removed when the object goes out of scope.
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("megaphone_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

/**
 * @brief Write interleaved 16-bit PCM as a WAV file.
 */
inline bool write_wav(const std::string& path, const std::vector<short>& samples, int sample_rate, int channels) {
    SF_INFO info{};
    info.samplerate = sample_rate;
    info.channels = channels;
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SNDFILE* file = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!file) return false;
    const sf_count_t frames = static_cast<sf_count_t>(samples.size() / static_cast<size_t>(channels));
    const sf_count_t written = sf_writef_short(file, samples.data(), frames);
    sf_close(file);
    return written == frames;
}

} // namespace test

#endif // MEGAPHONE_TEST_HELPER_HPP
