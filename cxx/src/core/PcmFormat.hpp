/**
 * @file PcmFormat.hpp
 * @brief Sample type and stream format shared by every stage of a session.
 */

#ifndef MEGAPHONE_PCM_FORMAT_HPP
#define MEGAPHONE_PCM_FORMAT_HPP

#include <cstdint>
#include <cstddef>
#include <cmath>
#include <span>

namespace megaphone {

/**
 * @brief One PCM sample. Always held in a 32-bit container; the numeric
 * range actually used is that of the session bit depth.
 */
using Sample = int32_t;

inline bool is_supported_bit_depth(int bits) {
    return bits == 8 || bits == 16 || bits == 32;
}

/**
 * @brief Representable range of a signed integer bit depth.
 */
struct SampleRange {
    Sample min;
    Sample max;

    static constexpr SampleRange for_bit_depth(int bits) {
        if (bits >= 32) {
            return {INT32_MIN, INT32_MAX};
        }
        const int64_t half = int64_t{1} << (bits - 1);
        return {static_cast<Sample>(-half), static_cast<Sample>(half - 1)};
    }

    /**
     * @brief Round to nearest and saturate. Never wraps.
     */
    Sample clamp(double value) const {
        if (value >= static_cast<double>(max)) return max;
        if (value <= static_cast<double>(min)) return min;
        return static_cast<Sample>(std::llround(value));
    }

    bool contains(double value) const {
        return value >= static_cast<double>(min) && value <= static_cast<double>(max);
    }
};

/**
 * @brief Session stream format. Frames are interleaved.
 */
struct StreamFormat {
    int sample_rate = 48000;
    int channels = 1;
    int bit_depth = 16;
    size_t frame_samples = 480; // samples per channel per frame

    /**
     * @brief Number of interleaved values in one frame.
     */
    size_t frame_length() const { return frame_samples * static_cast<size_t>(channels); }

    double frame_duration_ms() const {
        return sample_rate > 0 ? 1000.0 * static_cast<double>(frame_samples) / sample_rate : 0.0;
    }

    SampleRange range() const { return SampleRange::for_bit_depth(bit_depth); }

    bool operator==(const StreamFormat&) const = default;
};

inline void fill_silence(std::span<Sample> frame) {
    for (auto& s : frame) s = 0;
}

} // namespace megaphone

#endif // MEGAPHONE_PCM_FORMAT_HPP
