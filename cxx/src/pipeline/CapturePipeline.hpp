/**
 * @file CapturePipeline.hpp
 * @brief Microphone input: one driver tick, one frame into the ring buffer.
 */

#ifndef MEGAPHONE_CAPTURE_PIPELINE_HPP
#define MEGAPHONE_CAPTURE_PIPELINE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include "AudioDriver.hpp"
#include "FrameRingBuffer.hpp"

namespace megaphone {

/**
 * @brief Owns the capture driver and feeds the session's FrameRingBuffer.
 *
 * The frame callback runs on the driver's real-time thread. When the ring is
 * full the oldest queued frame is dropped and an overrun is counted.
 */
class CapturePipeline {
public:
    CapturePipeline(std::unique_ptr<hal::AudioDriver> driver, FrameRingBuffer& ring);
    ~CapturePipeline();

    CapturePipeline(const CapturePipeline&) = delete;
    CapturePipeline& operator=(const CapturePipeline&) = delete;

    ErrorCode open(const StreamFormat& format, std::chrono::milliseconds timeout);
    bool start();
    void stop();
    void close();

    void set_error_callback(hal::AudioDriver::ErrorCallback callback);

    StreamFormat format() const { return driver_->format(); }
    bool is_open() const { return driver_->is_open(); }
    bool is_running() const { return driver_->is_running(); }

    uint64_t frames_captured() const { return frames_.load(std::memory_order_relaxed); }
    uint64_t overruns() const { return overruns_.load(std::memory_order_relaxed); }
    uint64_t xruns() const { return driver_->xrun_count(); }

    hal::AudioDriver& driver() { return *driver_; }

private:
    void on_frame(std::span<const Sample> frame);

    std::unique_ptr<hal::AudioDriver> driver_;
    FrameRingBuffer& ring_;
    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> overruns_{0};
};

} // namespace megaphone

#endif // MEGAPHONE_CAPTURE_PIPELINE_HPP
