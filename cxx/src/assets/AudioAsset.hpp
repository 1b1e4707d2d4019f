/**
 * @file AudioAsset.hpp
 * @brief Immutable decoded soundboard clip.
 */

#ifndef MEGAPHONE_AUDIO_ASSET_HPP
#define MEGAPHONE_AUDIO_ASSET_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "PcmFormat.hpp"

namespace megaphone {

using AssetId = uint32_t;

inline constexpr AssetId kInvalidAssetId = 0;

/**
 * @brief Metadata of a published asset, as shown to the user.
 */
struct AssetInfo {
    AssetId id = kInvalidAssetId;
    std::string name;
    std::string source_path;
    size_t frame_count = 0; // samples per channel
    int channels = 0;
    int sample_rate = 0;
};

/**
 * @brief Fully decoded PCM in the session's canonical format.
 *
 * Never modified after publication; shared read-only by voices through
 * std::shared_ptr<const AudioAsset>.
 */
struct AudioAsset {
    AssetInfo info;
    std::vector<Sample> samples; // interleaved, frame_count * channels

    size_t frame_count() const { return info.frame_count; }
    int channels() const { return info.channels; }
};

} // namespace megaphone

#endif // MEGAPHONE_AUDIO_ASSET_HPP
