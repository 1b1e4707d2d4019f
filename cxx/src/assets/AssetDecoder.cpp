#include "AssetDecoder.hpp"
#include "SampleConverter.hpp"
#include <sndfile.h>
#include <algorithm>
#include <iostream>
#include <memory>

namespace megaphone {

namespace {

struct SndFileCloser {
    void operator()(SNDFILE* file) const {
        if (file) sf_close(file);
    }
};

using SndFilePtr = std::unique_ptr<SNDFILE, SndFileCloser>;

constexpr sf_count_t kReadChunkFrames = 4096;

} // namespace

AssetDecoder::AssetDecoder(const StreamFormat& canonical)
    : canonical_(canonical)
{
}

ErrorCode AssetDecoder::decode_file(const std::string& path, DecodedPcm& out) const {
    SF_INFO info{};
    SndFilePtr file(sf_open(path.c_str(), SFM_READ, &info));
    if (!file) {
        std::cerr << "[AssetDecoder] Cannot open " << path << ": " << sf_strerror(nullptr) << std::endl;
        return ErrorCode::DecodeError;
    }

    if (info.channels <= 0 || info.samplerate <= 0 || info.frames <= 0) {
        std::cerr << "[AssetDecoder] No audio in " << path << std::endl;
        return ErrorCode::DecodeError;
    }

    const double seconds = static_cast<double>(info.frames) / info.samplerate;
    if (seconds > kMaxClipSeconds) {
        std::cerr << "[AssetDecoder] Clip too long (" << seconds << " s): " << path << std::endl;
        return ErrorCode::DecodeError;
    }

    DecodedPcm pcm;
    pcm.channels = info.channels;
    pcm.sample_rate = info.samplerate;
    pcm.samples.resize(static_cast<size_t>(info.frames) * static_cast<size_t>(info.channels));

    sf_count_t total = 0;
    while (total < info.frames) {
        const sf_count_t want = std::min(kReadChunkFrames, info.frames - total);
        const sf_count_t got = sf_readf_double(file.get(), pcm.samples.data() + total * info.channels, want);
        if (got <= 0) {
            break;
        }
        total += got;
    }

    if (sf_error(file.get()) != SF_ERR_NO_ERROR) {
        std::cerr << "[AssetDecoder] Read error in " << path << ": " << sf_strerror(file.get()) << std::endl;
        return ErrorCode::DecodeError;
    }
    if (total == 0) {
        std::cerr << "[AssetDecoder] No frames decoded from " << path << std::endl;
        return ErrorCode::DecodeError;
    }

    // Truncated files report more frames than they hold; keep what was read.
    pcm.samples.resize(static_cast<size_t>(total) * static_cast<size_t>(info.channels));
    out = std::move(pcm);
    return ErrorCode::Ok;
}

std::vector<Sample> AssetDecoder::to_canonical(const DecodedPcm& pcm) const {
    auto remixed = dsp::remix_channels(pcm.samples, pcm.channels, canonical_.channels);
    auto resampled = dsp::resample_linear(remixed, canonical_.channels, pcm.sample_rate, canonical_.sample_rate);
    return dsp::quantize(resampled, canonical_.bit_depth);
}

} // namespace megaphone
