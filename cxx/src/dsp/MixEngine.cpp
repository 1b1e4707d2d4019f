#include "MixEngine.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace megaphone {

MixEngine::MixEngine(const StreamFormat& format, FrameRingBuffer& capture, VoicePool& voices,
                     VoiceCommandQueue& commands, float mic_gain, float voice_gain)
    : format_(format)
    , range_(format.range())
    , capture_(capture)
    , voices_(voices)
    , commands_(commands)
    , mic_frame_(format.frame_length(), 0)
    , budget_(static_cast<int64_t>(format.frame_duration_ms() * 1000.0))
    , mic_gain_(mic_gain)
    , voice_gain_(voice_gain)
{
}

void MixEngine::render(std::span<Sample> out) {
    const auto start_time = std::chrono::steady_clock::now();

    commands_.drain_into(voices_);

    if (!capture_.pop(std::span<Sample>(mic_frame_))) {
        // Underrun: substitute silence to keep the output cadence
        std::fill(mic_frame_.begin(), mic_frame_.end(), 0);
        const uint64_t count = underruns_.fetch_add(1, std::memory_order_relaxed) + 1;
        AudioLogger::instance().log_event("Underrun", static_cast<float>(count));
    }

    const auto& voice_frames = voices_.advance_all(format_.frame_samples);

    const size_t clipped = mix_frames(mic_frame_, mic_gain_.load(std::memory_order_relaxed),
                                      voice_frames, voice_gain_.load(std::memory_order_relaxed),
                                      range_, out);
    if (clipped > 0) {
        clipped_.fetch_add(clipped, std::memory_order_relaxed);
    }

    active_voices_.store(voices_.active_count(), std::memory_order_relaxed);
    ticks_.fetch_add(1, std::memory_order_relaxed);

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time);
    const auto elapsed_us = static_cast<uint64_t>(elapsed.count());
    if (elapsed_us > worst_mix_us_.load(std::memory_order_relaxed)) {
        worst_mix_us_.store(elapsed_us, std::memory_order_relaxed);
    }
    if (elapsed > budget_) {
        over_budget_.fetch_add(1, std::memory_order_relaxed);
        AudioLogger::instance().log_event("MixOverBudgetUs", static_cast<float>(elapsed_us));
    }
}

size_t MixEngine::mix_frames(std::span<const Sample> mic, float mic_gain,
                             std::span<const VoiceFrame> voices, float voice_gain,
                             SampleRange range, std::span<Sample> out) {
    size_t clipped = 0;
    const double mic_g = static_cast<double>(mic_gain);
    const double voice_g = static_cast<double>(voice_gain);

    for (size_t i = 0; i < out.size(); ++i) {
        double acc = i < mic.size() ? static_cast<double>(mic[i]) * mic_g : 0.0;
        for (const auto& voice : voices) {
            if (i < voice.samples.size()) {
                acc += static_cast<double>(voice.samples[i]) * static_cast<double>(voice.gain) * voice_g;
            }
        }

        // Master Safety Clamp
        if (!range.contains(acc)) {
            ++clipped;
        }
        out[i] = range.clamp(acc);
    }
    return clipped;
}

void MixEngine::reset_stats() {
    ticks_.store(0, std::memory_order_relaxed);
    underruns_.store(0, std::memory_order_relaxed);
    clipped_.store(0, std::memory_order_relaxed);
    worst_mix_us_.store(0, std::memory_order_relaxed);
    over_budget_.store(0, std::memory_order_relaxed);
    active_voices_.store(0, std::memory_order_relaxed);
}

} // namespace megaphone
