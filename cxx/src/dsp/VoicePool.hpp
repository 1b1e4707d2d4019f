/**
 * @file VoicePool.hpp
 * @brief Currently-triggered soundboard clips, one read cursor per voice.
 */

#ifndef MEGAPHONE_VOICE_POOL_HPP
#define MEGAPHONE_VOICE_POOL_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include "AudioAsset.hpp"
#include "Errors.hpp"

namespace megaphone {

class AssetManager;

using VoiceId = uint32_t;

inline constexpr VoiceId kInvalidVoiceId = 0;

/**
 * @brief One voice's contribution to the current tick.
 */
struct VoiceFrame {
    VoiceId id = kInvalidVoiceId;
    float gain = 1.0f;
    std::span<const Sample> samples; // valid until the next advance_all()/trigger()
};

/**
 * @brief Fixed set of voice slots, mutated only from the mix tick.
 *
 * Re-triggering an asset that is already playing starts a second,
 * independent voice. When every slot is busy the oldest voice is stolen.
 */
class VoicePool {
public:
    /**
     * @param max_voices Number of slots.
     * @param channels Channel count of the canonical format.
     * @param max_frame_samples Largest frame advance_all() will be asked for.
     */
    VoicePool(size_t max_voices, int channels, size_t max_frame_samples);

    /**
     * @brief Start a voice at offset 0.
     *
     * @param asset Clip to play (must use the pool's channel count).
     * @param gain Linear gain applied by the mixer.
     * @param id Pre-allocated id (see allocate_id()), or kInvalidVoiceId.
     * @return The voice id, kInvalidVoiceId if asset is null or has another channel count.
     */
    VoiceId trigger(std::shared_ptr<const AudioAsset> asset, float gain = 1.0f, VoiceId id = kInvalidVoiceId);

    /**
     * @brief Look the asset up and start a voice.
     * @return ErrorCode::NotFound if the asset is unknown or removed.
     */
    Result<VoiceId> trigger(const AssetManager& assets, AssetId asset_id, float gain = 1.0f);

    /**
     * @brief Deactivate a voice immediately. Idempotent; unknown ids are ignored.
     */
    void stop(VoiceId id);

    void stop_all();

    /**
     * @brief Next frame_samples samples (per channel) of every active voice.
     *
     * Frames come in trigger order and are zero-padded past the end of the
     * asset. A voice reaching its end is deactivated by this call and
     * reclaimed at the start of the next one.
     */
    const std::vector<VoiceFrame>& advance_all(size_t frame_samples);

    /**
     * @brief Drop inactive voices and their asset references.
     */
    void reclaim();

    /**
     * @brief Thread-safe id allocation, used by the control side to return an
     * id before the trigger reaches the mix tick.
     */
    VoiceId allocate_id() { return next_id_.fetch_add(1, std::memory_order_relaxed); }

    bool is_active(VoiceId id) const;
    size_t active_count() const;

    /**
     * @brief Running count of asset references dropped by reclaimed voices.
     * Readable from any thread; a change means removed assets may be freeable.
     */
    uint64_t assets_released() const { return assets_released_.load(std::memory_order_acquire); }
    size_t size() const { return order_.size(); }
    size_t max_voices() const { return slots_.size(); }
    void clear();

private:
    struct Slot {
        VoiceId id = kInvalidVoiceId;
        std::shared_ptr<const AudioAsset> asset;
        size_t offset = 0;
        float gain = 1.0f;
        bool active = false;
        bool in_use = false;
        std::vector<Sample> scratch;
    };

    void release(Slot& slot);

    std::vector<Slot> slots_;
    std::vector<size_t> order_; // slot indices in trigger order
    std::vector<VoiceFrame> frames_;
    int channels_;
    std::atomic<VoiceId> next_id_{1};
    std::atomic<uint64_t> assets_released_{0};
};

} // namespace megaphone

#endif // MEGAPHONE_VOICE_POOL_HPP
