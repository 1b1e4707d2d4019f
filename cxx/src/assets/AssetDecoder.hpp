/**
 * @file AssetDecoder.hpp
 * @brief libsndfile-based decoding of soundboard clips into canonical PCM.
 */

#ifndef MEGAPHONE_ASSET_DECODER_HPP
#define MEGAPHONE_ASSET_DECODER_HPP

#include <string>
#include <vector>
#include "PcmFormat.hpp"
#include "Errors.hpp"

namespace megaphone {

/**
 * @brief Decoded clip before conversion: normalized interleaved doubles.
 */
struct DecodedPcm {
    std::vector<double> samples;
    int channels = 0;
    int sample_rate = 0;

    size_t frame_count() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }
};

/**
 * @brief Decodes files and converts them to the session's canonical format.
 */
class AssetDecoder {
public:
    // Soundboard clips are short; anything longer is rejected as a decode error.
    static constexpr double kMaxClipSeconds = 600.0;

    explicit AssetDecoder(const StreamFormat& canonical);

    /**
     * @brief Decode any container/codec the installed libsndfile supports.
     *
     * @param path File to read.
     * @param out Receives the decoded samples on success, untouched otherwise.
     * @return ErrorCode::Ok or ErrorCode::DecodeError.
     */
    ErrorCode decode_file(const std::string& path, DecodedPcm& out) const;

    /**
     * @brief Remix, resample and quantize to the canonical format.
     *
     * @return Interleaved samples with canonical().channels channels.
     */
    std::vector<Sample> to_canonical(const DecodedPcm& pcm) const;

    const StreamFormat& canonical() const { return canonical_; }

private:
    StreamFormat canonical_;
};

} // namespace megaphone

#endif // MEGAPHONE_ASSET_DECODER_HPP
