/**
 * @file DeviceFactory.hpp
 * @brief Device enumeration and driver creation supplied by the platform layer.
 */

#ifndef MEGAPHONE_HAL_DEVICE_FACTORY_HPP
#define MEGAPHONE_HAL_DEVICE_FACTORY_HPP

#include <memory>
#include <string>
#include <vector>
#include "AudioDriver.hpp"

namespace hal {

struct DeviceInfo {
    std::string name;
    std::string description;
    bool capture = false;
    bool playback = false;
};

class DeviceFactory {
public:
    virtual ~DeviceFactory() = default;

    /**
     * @brief Create an unopened driver for one direction of a device.
     *
     * @param direction Capture or playback.
     * @param device Platform device name.
     * @param realtime_priority SCHED_FIFO priority for the driver thread, 0 for none.
     */
    virtual std::unique_ptr<AudioDriver> create(StreamDirection direction, const std::string& device,
                                                int realtime_priority) = 0;

    virtual std::vector<DeviceInfo> enumerate() const = 0;
};

} // namespace hal

#endif // MEGAPHONE_HAL_DEVICE_FACTORY_HPP
