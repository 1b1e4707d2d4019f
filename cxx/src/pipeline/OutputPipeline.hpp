/**
 * @file OutputPipeline.hpp
 * @brief Speaker output: each driver tick asks the mixer for one frame.
 */

#ifndef MEGAPHONE_OUTPUT_PIPELINE_HPP
#define MEGAPHONE_OUTPUT_PIPELINE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include "AudioDriver.hpp"
#include "MixEngine.hpp"

namespace megaphone {

/**
 * @brief Owns the playback driver. The mix runs on its real-time thread.
 */
class OutputPipeline {
public:
    OutputPipeline(std::unique_ptr<hal::AudioDriver> driver, MixEngine& mixer);
    ~OutputPipeline();

    OutputPipeline(const OutputPipeline&) = delete;
    OutputPipeline& operator=(const OutputPipeline&) = delete;

    ErrorCode open(const StreamFormat& format, std::chrono::milliseconds timeout);
    bool start();
    void stop();
    void close();

    void set_error_callback(hal::AudioDriver::ErrorCallback callback);

    StreamFormat format() const { return driver_->format(); }
    bool is_open() const { return driver_->is_open(); }
    bool is_running() const { return driver_->is_running(); }

    uint64_t frames_rendered() const { return frames_.load(std::memory_order_relaxed); }
    uint64_t xruns() const { return driver_->xrun_count(); }

    hal::AudioDriver& driver() { return *driver_; }

private:
    std::unique_ptr<hal::AudioDriver> driver_;
    MixEngine& mixer_;
    std::atomic<uint64_t> frames_{0};
};

} // namespace megaphone

#endif // MEGAPHONE_OUTPUT_PIPELINE_HPP
