/**
 * @file AudioDriver.hpp
 * @brief Abstract base class for platform-specific audio hardware drivers.
 *
 * Hardware/OS audio code (ALSA today) stays behind this interface; the
 * capture/output pipelines and the mixer never see a platform type.
 */

#ifndef MEGAPHONE_HAL_AUDIO_DRIVER_HPP
#define MEGAPHONE_HAL_AUDIO_DRIVER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include "Errors.hpp"
#include "PcmFormat.hpp"

namespace hal {

enum class StreamDirection {
    Capture,
    Playback
};

inline const char* to_string(StreamDirection direction) {
    return direction == StreamDirection::Capture ? "capture" : "playback";
}

/**
 * @brief One capture or playback stream on one device.
 *
 * The driver owns its own real-time thread and invokes the frame callback
 * once per frame:
 * - Capture: the span holds the frame just read from the device.
 * - Playback: the callback fills the span, the driver writes it.
 *
 * The error callback fires at most once, from the driver thread, when the
 * device is lost; the driver thread has already left its loop by then.
 */
class AudioDriver {
public:
    using FrameCallback = std::function<void(std::span<megaphone::Sample> frame)>;
    using ErrorCallback = std::function<void(megaphone::ErrorCode error)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Acquire the device with the requested format.
     *
     * @param format Requested session format.
     * @param timeout Upper bound for acquiring a busy device.
     * @return ErrorCode::Ok or ErrorCode::DeviceUnavailable.
     */
    virtual megaphone::ErrorCode open(const megaphone::StreamFormat& format, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Start streaming on the driver thread.
     *
     * @return true if successfully started, false otherwise.
     */
    virtual bool start() = 0;

    /**
     * @brief Stop streaming. Cooperative: the frame in flight completes.
     */
    virtual void stop() = 0;

    /**
     * @brief Stop and release the device.
     */
    virtual void close() = 0;

    virtual void set_callback(FrameCallback callback) = 0;
    virtual void set_error_callback(ErrorCallback callback) = 0;

    /**
     * @brief Format actually negotiated with the hardware (valid after open).
     */
    virtual megaphone::StreamFormat format() const = 0;

    virtual StreamDirection direction() const = 0;
    virtual bool is_open() const = 0;
    virtual bool is_running() const = 0;

    /**
     * @brief Recovered over/underruns reported by the device.
     */
    virtual uint64_t xrun_count() const { return 0; }
};

} // namespace hal

#endif // MEGAPHONE_HAL_AUDIO_DRIVER_HPP
