/**
 * @file SampleConverter.hpp
 * @brief Channel remixing, linear resampling and quantization of decoded clips.
 *
 * Works on normalized interleaved doubles in [-1, 1]. Not real-time code:
 * called from the worker thread while an asset is being decoded.
 */

#ifndef MEGAPHONE_SAMPLE_CONVERTER_HPP
#define MEGAPHONE_SAMPLE_CONVERTER_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>
#include "PcmFormat.hpp"

namespace megaphone::dsp {

/**
 * @brief Map in_channels to out_channels.
 *
 * Downmix averages the source channels folding onto each output channel
 * (c, c + out, c + 2*out, ...). Upmix repeats source channels cyclically.
 */
inline std::vector<double> remix_channels(const std::vector<double>& in, int in_channels, int out_channels) {
    if (in_channels == out_channels || in_channels <= 0 || out_channels <= 0) {
        return in;
    }
    const size_t frames = in.size() / static_cast<size_t>(in_channels);
    std::vector<double> out(frames * static_cast<size_t>(out_channels), 0.0);

    for (size_t f = 0; f < frames; ++f) {
        const double* src = in.data() + f * static_cast<size_t>(in_channels);
        double* dst = out.data() + f * static_cast<size_t>(out_channels);
        for (int c = 0; c < out_channels; ++c) {
            if (in_channels > out_channels) {
                double sum = 0.0;
                int folded = 0;
                for (int s = c; s < in_channels; s += out_channels) {
                    sum += src[s];
                    ++folded;
                }
                dst[c] = folded > 0 ? sum / folded : 0.0;
            } else {
                dst[c] = src[c % in_channels];
            }
        }
    }
    return out;
}

/**
 * @brief Linear-interpolation sample rate conversion.
 */
inline std::vector<double> resample_linear(const std::vector<double>& in, int channels, int in_rate, int out_rate) {
    if (in_rate == out_rate || in_rate <= 0 || out_rate <= 0 || channels <= 0 || in.empty()) {
        return in;
    }
    const size_t ch = static_cast<size_t>(channels);
    const size_t in_frames = in.size() / ch;
    const double ratio = static_cast<double>(out_rate) / static_cast<double>(in_rate);
    const size_t out_frames = std::max<size_t>(1, static_cast<size_t>(std::llround(static_cast<double>(in_frames) * ratio)));

    std::vector<double> out(out_frames * ch, 0.0);
    for (size_t i = 0; i < out_frames; ++i) {
        const double pos = static_cast<double>(i) / ratio;
        const size_t i0 = std::min(static_cast<size_t>(pos), in_frames - 1);
        const size_t i1 = std::min(i0 + 1, in_frames - 1);
        const double frac = pos - static_cast<double>(i0);
        for (size_t c = 0; c < ch; ++c) {
            const double a = in[i0 * ch + c];
            const double b = in[i1 * ch + c];
            out[i * ch + c] = a + (b - a) * frac;
        }
    }
    return out;
}

/**
 * @brief Scale normalized samples to the signed range of bit_depth.
 */
inline std::vector<Sample> quantize(const std::vector<double>& in, int bit_depth) {
    const SampleRange range = SampleRange::for_bit_depth(bit_depth);
    const double scale = std::ldexp(1.0, bit_depth - 1);
    std::vector<Sample> out(in.size());
    std::transform(in.begin(), in.end(), out.begin(), [&](double v) {
        return range.clamp(v * scale);
    });
    return out;
}

/**
 * @brief Normalize integer samples of a given bit depth to [-1, 1].
 */
inline std::vector<double> normalize(const std::vector<Sample>& in, int bit_depth) {
    const double scale = std::ldexp(1.0, bit_depth - 1);
    std::vector<double> out(in.size());
    std::transform(in.begin(), in.end(), out.begin(), [&](Sample s) {
        return static_cast<double>(s) / scale;
    });
    return out;
}

} // namespace megaphone::dsp

#endif // MEGAPHONE_SAMPLE_CONVERTER_HPP
