/**
 * @file VoiceCommandQueue.hpp
 * @brief Control-thread requests for the voice pool, applied on the mix tick.
 */

#ifndef MEGAPHONE_VOICE_COMMAND_QUEUE_HPP
#define MEGAPHONE_VOICE_COMMAND_QUEUE_HPP

#include <memory>
#include <mutex>
#include "Logger.hpp"
#include "VoicePool.hpp"

namespace megaphone {

struct VoiceCommand {
    enum class Type {
        Trigger,
        Stop,
        StopAll
    };

    Type type = Type::Stop;
    VoiceId voice = kInvalidVoiceId;
    std::shared_ptr<const AudioAsset> asset;
    float gain = 1.0f;
};

/**
 * @brief Lock-free SPSC queue from the control side to the mix tick.
 *
 * Several control threads may push; they serialize among themselves on a
 * mutex the mix thread never touches.
 */
class VoiceCommandQueue {
public:
    static constexpr size_t kSlots = 256;

    bool push(VoiceCommand command) {
        std::lock_guard<std::mutex> lock(producer_mutex_);
        return ring_.push(std::move(command));
    }

    /**
     * @brief Apply every pending command to the pool (mix thread).
     * @return Number of commands applied.
     */
    size_t drain_into(VoicePool& pool) {
        size_t applied = 0;
        while (auto command = ring_.pop()) {
            switch (command->type) {
                case VoiceCommand::Type::Trigger:
                    pool.trigger(std::move(command->asset), command->gain, command->voice);
                    break;
                case VoiceCommand::Type::Stop:
                    pool.stop(command->voice);
                    break;
                case VoiceCommand::Type::StopAll:
                    pool.stop_all();
                    break;
            }
            ++applied;
        }
        return applied;
    }

    /**
     * @brief Discard pending commands. Only while no mix tick is running.
     */
    void clear() {
        while (ring_.pop()) {
        }
    }

    bool empty() const { return ring_.empty(); }

private:
    LockFreeRingBuffer<VoiceCommand, kSlots> ring_;
    std::mutex producer_mutex_;
};

} // namespace megaphone

#endif // MEGAPHONE_VOICE_COMMAND_QUEUE_HPP
