/**
 * @file AssetManager.hpp
 * @brief Decodes, caches and publishes soundboard clips.
 */

#ifndef MEGAPHONE_ASSET_MANAGER_HPP
#define MEGAPHONE_ASSET_MANAGER_HPP

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "AudioAsset.hpp"
#include "AssetDecoder.hpp"
#include "Errors.hpp"
#include "Worker.hpp"

namespace megaphone {

/**
 * @brief Owner of every decoded AudioAsset.
 *
 * The published table is an immutable snapshot swapped atomically, so readers
 * on any thread see either the old or the new table, never a half-written
 * asset. Only the worker thread builds and swaps tables.
 *
 * Removal is deferred: a removed asset disappears from the table at once but
 * its PCM stays alive while any voice still holds a reference. The worker
 * releases it in collect_garbage(), so the audio threads never free memory.
 */
class AssetManager {
public:
    AssetManager(const StreamFormat& canonical, Worker& worker);
    ~AssetManager();

    AssetManager(const AssetManager&) = delete;
    AssetManager& operator=(const AssetManager&) = delete;

    /**
     * @brief Decode a file on the worker and publish it.
     *
     * @param path File to decode.
     * @param display_name Name shown to the user, defaults to the file name.
     * @return New id, or ErrorCode::DecodeError with the table unchanged.
     */
    Result<AssetId> load(const std::string& path, const std::string& display_name = "");

    std::future<Result<AssetId>> load_async(const std::string& path, const std::string& display_name = "");

    /**
     * @brief Publish a clip already decoded by the platform layer.
     *
     * The samples are converted from (sample_rate, channels, bit_depth)
     * to the canonical format like a decoded file.
     */
    Result<AssetId> load_pcm(const std::string& display_name, const std::vector<Sample>& samples,
                             int sample_rate, int channels, int bit_depth);

    /**
     * @brief Unpublish an asset. Memory is released once unreferenced.
     * @return false if the id is unknown or already removed.
     */
    bool remove(AssetId id);

    /**
     * @brief Published assets in insertion order.
     */
    std::vector<AssetInfo> list() const;

    /**
     * @brief Shared read-only handle, nullptr if unknown or removed.
     */
    std::shared_ptr<const AudioAsset> find(AssetId id) const;

    /**
     * @brief Release removed assets no voice references any more.
     * @return Number of assets released.
     */
    size_t collect_garbage();

    size_t pending_release_count() const { return pending_count_.load(std::memory_order_acquire); }
    size_t size() const;

    const StreamFormat& canonical() const { return decoder_.canonical(); }

private:
    struct AssetTable {
        std::vector<std::shared_ptr<const AudioAsset>> entries; // insertion order
    };

    // Worker thread only
    Result<AssetId> decode_and_publish(const std::string& path, const std::string& display_name);
    Result<AssetId> publish_pcm(const std::string& display_name, const std::string& source_path, const DecodedPcm& pcm);
    bool unpublish(AssetId id);
    size_t release_unreferenced();

    template<typename F>
    auto run_on_worker(F&& fn) -> std::invoke_result_t<F>;

    std::shared_ptr<const AssetTable> snapshot() const {
        return table_.load(std::memory_order_acquire);
    }

    AssetDecoder decoder_;
    Worker& worker_;
    std::atomic<std::shared_ptr<const AssetTable>> table_;
    std::atomic<AssetId> next_id_{1};

    std::vector<std::shared_ptr<const AudioAsset>> pending_release_; // worker thread only
    std::atomic<size_t> pending_count_{0};
};

} // namespace megaphone

#endif // MEGAPHONE_ASSET_MANAGER_HPP
