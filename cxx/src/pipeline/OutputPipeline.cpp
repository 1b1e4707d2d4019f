#include "OutputPipeline.hpp"

namespace megaphone {

OutputPipeline::OutputPipeline(std::unique_ptr<hal::AudioDriver> driver, MixEngine& mixer)
    : driver_(std::move(driver))
    , mixer_(mixer)
{
    driver_->set_callback([this](std::span<Sample> frame) {
        mixer_.render(frame);
        frames_.fetch_add(1, std::memory_order_relaxed);
    });
}

OutputPipeline::~OutputPipeline() {
    close();
}

ErrorCode OutputPipeline::open(const StreamFormat& format, std::chrono::milliseconds timeout) {
    return driver_->open(format, timeout);
}

bool OutputPipeline::start() {
    return driver_->start();
}

void OutputPipeline::stop() {
    driver_->stop();
}

void OutputPipeline::close() {
    driver_->close();
}

void OutputPipeline::set_error_callback(hal::AudioDriver::ErrorCallback callback) {
    driver_->set_error_callback(std::move(callback));
}

} // namespace megaphone
