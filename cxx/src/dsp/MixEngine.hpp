/**
 * @file MixEngine.hpp
 * @brief Sums the live microphone frame and all active voices per output tick.
 */

#ifndef MEGAPHONE_MIX_ENGINE_HPP
#define MEGAPHONE_MIX_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <span>
#include <vector>
#include "FrameRingBuffer.hpp"
#include "PcmFormat.hpp"
#include "VoiceCommandQueue.hpp"
#include "VoicePool.hpp"

namespace megaphone {

/**
 * @brief Output-tick mixer. RT-safe: no allocation, no blocking locks.
 *
 * out[i] = clamp(mic[i] * mic_gain + sum(voice[i] * voice.gain * voice_gain))
 *
 * The clamp saturates at the bounds of the session bit depth instead of
 * wrapping. Summation is done in double precision so the result does not
 * depend on the order of the voices.
 */
class MixEngine {
public:
    MixEngine(const StreamFormat& format, FrameRingBuffer& capture, VoicePool& voices,
              VoiceCommandQueue& commands, float mic_gain = 1.0f, float voice_gain = 1.0f);

    /**
     * @brief Produce one output frame (called once per output device tick).
     *
     * Applies pending voice commands, pops one capture frame (silence on
     * underrun), advances the voices and mixes.
     */
    void render(std::span<Sample> out);

    /**
     * @brief Mixing kernel.
     *
     * @return Number of samples that had to be clamped.
     */
    static size_t mix_frames(std::span<const Sample> mic, float mic_gain,
                             std::span<const VoiceFrame> voices, float voice_gain,
                             SampleRange range, std::span<Sample> out);

    void set_mic_gain(float gain) { mic_gain_.store(gain, std::memory_order_relaxed); }
    void set_voice_gain(float gain) { voice_gain_.store(gain, std::memory_order_relaxed); }
    float mic_gain() const { return mic_gain_.load(std::memory_order_relaxed); }
    float voice_gain() const { return voice_gain_.load(std::memory_order_relaxed); }

    uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
    uint64_t underruns() const { return underruns_.load(std::memory_order_relaxed); }
    uint64_t clipped_samples() const { return clipped_.load(std::memory_order_relaxed); }
    uint64_t worst_mix_us() const { return worst_mix_us_.load(std::memory_order_relaxed); }
    uint64_t over_budget_ticks() const { return over_budget_.load(std::memory_order_relaxed); }
    size_t active_voices() const { return active_voices_.load(std::memory_order_relaxed); }

    void reset_stats();

    const StreamFormat& format() const { return format_; }

private:
    StreamFormat format_;
    SampleRange range_;
    FrameRingBuffer& capture_;
    VoicePool& voices_;
    VoiceCommandQueue& commands_;

    std::vector<Sample> mic_frame_;
    std::chrono::microseconds budget_;

    std::atomic<float> mic_gain_;
    std::atomic<float> voice_gain_;

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> underruns_{0};
    std::atomic<uint64_t> clipped_{0};
    std::atomic<uint64_t> worst_mix_us_{0};
    std::atomic<uint64_t> over_budget_{0};
    std::atomic<size_t> active_voices_{0};
};

} // namespace megaphone

#endif // MEGAPHONE_MIX_ENGINE_HPP
