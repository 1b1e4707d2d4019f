/**
 * @file VoicePool.cpp
 * @brief Voice slot management with oldest-first stealing.
 */

#include "VoicePool.hpp"
#include "AssetManager.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace megaphone {

VoicePool::VoicePool(size_t max_voices, int channels, size_t max_frame_samples)
    : slots_(std::max<size_t>(max_voices, 1))
    , channels_(std::max(channels, 1))
{
    const size_t scratch_len = max_frame_samples * static_cast<size_t>(channels_);
    for (auto& slot : slots_) {
        slot.scratch.assign(scratch_len, 0);
    }
    order_.reserve(slots_.size());
    frames_.reserve(slots_.size());
}

VoiceId VoicePool::trigger(std::shared_ptr<const AudioAsset> asset, float gain, VoiceId id) {
    if (!asset || asset->channels() != channels_) {
        return kInvalidVoiceId;
    }
    if (id == kInvalidVoiceId) {
        id = allocate_id();
    }

    reclaim();

    // Voice stealing: every slot busy, take the oldest
    if (order_.size() == slots_.size()) {
        auto& victim = slots_[order_.front()];
        AudioLogger::instance().log_event("VoiceSteal", static_cast<float>(victim.id));
        release(victim);
        order_.erase(order_.begin());
    }

    for (size_t i = 0; i < slots_.size(); ++i) {
        auto& slot = slots_[i];
        if (slot.in_use) continue;

        slot.id = id;
        slot.asset = std::move(asset);
        slot.offset = 0;
        slot.gain = gain;
        slot.active = true;
        slot.in_use = true;
        order_.push_back(i);
        return id;
    }
    return kInvalidVoiceId;
}

Result<VoiceId> VoicePool::trigger(const AssetManager& assets, AssetId asset_id, float gain) {
    auto asset = assets.find(asset_id);
    if (!asset) {
        return ErrorCode::NotFound;
    }
    return trigger(std::move(asset), gain);
}

void VoicePool::stop(VoiceId id) {
    for (size_t index : order_) {
        auto& slot = slots_[index];
        if (slot.id == id) {
            slot.active = false;
            return;
        }
    }
}

void VoicePool::stop_all() {
    for (size_t index : order_) {
        slots_[index].active = false;
    }
}

const std::vector<VoiceFrame>& VoicePool::advance_all(size_t frame_samples) {
    reclaim();
    frames_.clear();

    const size_t ch = static_cast<size_t>(channels_);
    const size_t frame_len = frame_samples * ch;

    for (size_t index : order_) {
        auto& slot = slots_[index];
        if (!slot.active) continue;

        if (slot.scratch.size() < frame_len) {
            slot.scratch.resize(frame_len); // only if asked for more than max_frame_samples
        }

        const size_t total = slot.asset->frame_count();
        const size_t remaining = total > slot.offset ? total - slot.offset : 0;
        const size_t take = std::min(frame_samples, remaining);

        const auto* src = slot.asset->samples.data() + slot.offset * ch;
        std::copy_n(src, take * ch, slot.scratch.begin());
        std::fill(slot.scratch.begin() + static_cast<std::ptrdiff_t>(take * ch),
                  slot.scratch.begin() + static_cast<std::ptrdiff_t>(frame_len), 0);

        slot.offset += take;
        if (slot.offset >= total) {
            slot.active = false;
        }

        frames_.push_back(VoiceFrame{slot.id, slot.gain, std::span<const Sample>(slot.scratch.data(), frame_len)});
    }
    return frames_;
}

void VoicePool::reclaim() {
    auto first_dead = std::remove_if(order_.begin(), order_.end(), [this](size_t index) {
        auto& slot = slots_[index];
        if (slot.active) return false;
        release(slot);
        return true;
    });
    order_.erase(first_dead, order_.end());
}

void VoicePool::release(Slot& slot) {
    slot.active = false;
    slot.in_use = false;
    if (slot.asset) {
        slot.asset.reset();
        assets_released_.fetch_add(1, std::memory_order_release);
    }
    slot.offset = 0;
    slot.id = kInvalidVoiceId;
}

bool VoicePool::is_active(VoiceId id) const {
    for (size_t index : order_) {
        const auto& slot = slots_[index];
        if (slot.id == id) return slot.active;
    }
    return false;
}

size_t VoicePool::active_count() const {
    return static_cast<size_t>(std::count_if(order_.begin(), order_.end(),
                                             [this](size_t index) { return slots_[index].active; }));
}

void VoicePool::clear() {
    for (auto& slot : slots_) {
        release(slot);
    }
    order_.clear();
    frames_.clear();
}

} // namespace megaphone
