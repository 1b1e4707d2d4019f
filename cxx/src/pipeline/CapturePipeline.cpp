#include "CapturePipeline.hpp"
#include "Logger.hpp"

namespace megaphone {

CapturePipeline::CapturePipeline(std::unique_ptr<hal::AudioDriver> driver, FrameRingBuffer& ring)
    : driver_(std::move(driver))
    , ring_(ring)
{
    driver_->set_callback([this](std::span<Sample> frame) {
        on_frame(frame);
    });
}

CapturePipeline::~CapturePipeline() {
    close();
}

ErrorCode CapturePipeline::open(const StreamFormat& format, std::chrono::milliseconds timeout) {
    return driver_->open(format, timeout);
}

bool CapturePipeline::start() {
    return driver_->start();
}

void CapturePipeline::stop() {
    driver_->stop();
}

void CapturePipeline::close() {
    driver_->close();
}

void CapturePipeline::set_error_callback(hal::AudioDriver::ErrorCallback callback) {
    driver_->set_error_callback(std::move(callback));
}

void CapturePipeline::on_frame(std::span<const Sample> frame) {
    frames_.fetch_add(1, std::memory_order_relaxed);
    if (ring_.push(frame)) {
        return;
    }

    // Overflow: drop-oldest keeps the backlog bounded and the audio recent
    ring_.push_overwrite(frame);
    const uint64_t count = overruns_.fetch_add(1, std::memory_order_relaxed) + 1;
    AudioLogger::instance().log_event("Overrun", static_cast<float>(count));
}

} // namespace megaphone
