#include "AssetManager.hpp"
#include "SampleConverter.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace megaphone {

AssetManager::AssetManager(const StreamFormat& canonical, Worker& worker)
    : decoder_(canonical)
    , worker_(worker)
    , table_(std::make_shared<const AssetTable>())
{
}

AssetManager::~AssetManager() {
    // Queued decode tasks capture this; let them finish first.
    worker_.wait_idle();
}

template<typename F>
auto AssetManager::run_on_worker(F&& fn) -> std::invoke_result_t<F> {
    if (worker_.on_worker_thread()) {
        return fn();
    }
    return worker_.submit(std::forward<F>(fn)).get();
}

Result<AssetId> AssetManager::load(const std::string& path, const std::string& display_name) {
    return run_on_worker([this, path, display_name]() {
        return decode_and_publish(path, display_name);
    });
}

std::future<Result<AssetId>> AssetManager::load_async(const std::string& path, const std::string& display_name) {
    return worker_.submit([this, path, display_name]() {
        return decode_and_publish(path, display_name);
    });
}

Result<AssetId> AssetManager::load_pcm(const std::string& display_name, const std::vector<Sample>& samples,
                                       int sample_rate, int channels, int bit_depth) {
    if (samples.empty() || channels <= 0 || sample_rate <= 0 || !is_supported_bit_depth(bit_depth)
        || samples.size() % static_cast<size_t>(channels) != 0) {
        std::cerr << "[AssetManager] Rejected PCM clip '" << display_name << "': invalid format" << std::endl;
        return ErrorCode::DecodeError;
    }

    return run_on_worker([this, display_name, &samples, sample_rate, channels, bit_depth]() {
        DecodedPcm pcm;
        pcm.channels = channels;
        pcm.sample_rate = sample_rate;
        pcm.samples = dsp::normalize(samples, bit_depth);
        return publish_pcm(display_name, std::string(), pcm);
    });
}

Result<AssetId> AssetManager::decode_and_publish(const std::string& path, const std::string& display_name) {
    DecodedPcm pcm;
    if (decoder_.decode_file(path, pcm) != ErrorCode::Ok) {
        return ErrorCode::DecodeError;
    }

    std::string name = display_name;
    if (name.empty()) {
        name = std::filesystem::path(path).filename().string();
    }
    return publish_pcm(name, path, pcm);
}

Result<AssetId> AssetManager::publish_pcm(const std::string& display_name, const std::string& source_path,
                                          const DecodedPcm& pcm) {
    const StreamFormat& format = decoder_.canonical();

    auto asset = std::make_shared<AudioAsset>();
    asset->samples = decoder_.to_canonical(pcm);
    asset->info.id = next_id_.fetch_add(1, std::memory_order_relaxed);
    asset->info.name = display_name;
    asset->info.source_path = source_path;
    asset->info.channels = format.channels;
    asset->info.sample_rate = format.sample_rate;
    asset->info.frame_count = asset->samples.size() / static_cast<size_t>(format.channels);

    if (asset->info.frame_count == 0) {
        std::cerr << "[AssetManager] Clip '" << display_name << "' is empty after conversion" << std::endl;
        return ErrorCode::DecodeError;
    }

    auto current = snapshot();
    auto next = std::make_shared<AssetTable>(*current);
    next->entries.push_back(asset);
    table_.store(std::move(next), std::memory_order_release);

    std::cout << "[AssetManager] Loaded '" << display_name << "' as #" << asset->info.id
              << " (" << asset->info.frame_count << " frames)" << std::endl;

    release_unreferenced();
    return asset->info.id;
}

bool AssetManager::remove(AssetId id) {
    return run_on_worker([this, id]() {
        const bool removed = unpublish(id);
        release_unreferenced();
        return removed;
    });
}

bool AssetManager::unpublish(AssetId id) {
    auto current = snapshot();
    auto it = std::find_if(current->entries.begin(), current->entries.end(),
                           [id](const auto& asset) { return asset->info.id == id; });
    if (it == current->entries.end()) {
        return false;
    }

    pending_release_.push_back(*it);

    auto next = std::make_shared<AssetTable>();
    next->entries.reserve(current->entries.size() - 1);
    for (const auto& asset : current->entries) {
        if (asset->info.id != id) next->entries.push_back(asset);
    }
    table_.store(std::move(next), std::memory_order_release);
    pending_count_.store(pending_release_.size(), std::memory_order_release);
    return true;
}

size_t AssetManager::collect_garbage() {
    return run_on_worker([this]() { return release_unreferenced(); });
}

size_t AssetManager::release_unreferenced() {
    // use_count() == 1: only this list holds it, and an unpublished asset
    // cannot gain new references.
    const size_t before = pending_release_.size();
    std::erase_if(pending_release_, [](const auto& asset) { return asset.use_count() == 1; });
    const size_t released = before - pending_release_.size();
    pending_count_.store(pending_release_.size(), std::memory_order_release);
    if (released > 0) {
        std::cout << "[AssetManager] Released " << released << " removed asset(s)" << std::endl;
    }
    return released;
}

std::vector<AssetInfo> AssetManager::list() const {
    auto current = snapshot();
    std::vector<AssetInfo> infos;
    infos.reserve(current->entries.size());
    for (const auto& asset : current->entries) {
        infos.push_back(asset->info);
    }
    return infos;
}

std::shared_ptr<const AudioAsset> AssetManager::find(AssetId id) const {
    auto current = snapshot();
    for (const auto& asset : current->entries) {
        if (asset->info.id == id) return asset;
    }
    return nullptr;
}

size_t AssetManager::size() const {
    return snapshot()->entries.size();
}

} // namespace megaphone
