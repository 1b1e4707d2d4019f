/**
 * @file BroadcastEngine.hpp
 * @brief Megaphone + soundboard engine: the public C++ entry point.
 */

#ifndef MEGAPHONE_BROADCAST_ENGINE_HPP
#define MEGAPHONE_BROADCAST_ENGINE_HPP

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "AssetManager.hpp"
#include "DeviceFactory.hpp"
#include "SessionConfig.hpp"
#include "SessionController.hpp"
#include "VoiceCommandQueue.hpp"
#include "VoicePool.hpp"
#include "Worker.hpp"

namespace megaphone {

/**
 * @brief Owns the assets, the voices and the session.
 *
 * Every method is a control call and may come from any non real-time
 * thread. Assets persist across sessions; voices do not.
 *
 * While the engine exists the worker polls the voice pool and frees removed
 * assets as soon as their last voice has been reclaimed.
 */
class BroadcastEngine {
public:
    /**
     * @param config Session configuration, validated by start_broadcast().
     * @param factory Platform devices; nullptr selects the ALSA factory.
     */
    explicit BroadcastEngine(const SessionConfig& config = SessionConfig{},
                             std::unique_ptr<hal::DeviceFactory> factory = nullptr);
    ~BroadcastEngine();

    BroadcastEngine(const BroadcastEngine&) = delete;
    BroadcastEngine& operator=(const BroadcastEngine&) = delete;

    void set_permission_hook(SessionController::PermissionHook hook);

    ErrorCode start_broadcast();
    void stop_broadcast();
    ErrorCode reset();

    Result<AssetId> add_asset(const std::string& path, const std::string& display_name = "");
    std::future<Result<AssetId>> add_asset_async(const std::string& path, const std::string& display_name = "");
    Result<AssetId> add_pcm_asset(const std::string& display_name, const std::vector<Sample>& samples,
                                  int sample_rate, int channels, int bit_depth);
    bool remove_asset(AssetId id);
    std::vector<AssetInfo> list_assets() const;

    /**
     * @brief Start a new voice for the asset, overlaid on the live microphone.
     *
     * The id is returned at once; the voice starts on the next output tick.
     * @return NotFound for an unknown or removed asset, InvalidState when
     *         the session is not Live.
     */
    Result<VoiceId> trigger_asset(AssetId id);

    /**
     * @brief Stop a voice. Unknown or finished ids are ignored.
     */
    void stop_voice(VoiceId id);

    SessionState observe_state() const;

    bool save_library(const std::string& path) const;

    /**
     * @brief Re-decode every clip in a manifest. Entries that fail are skipped.
     * @return Number of clips restored, or the manifest's load error.
     */
    Result<size_t> restore_library(const std::string& path);

    const SessionConfig& config() const { return config_; }
    AssetManager& assets() { return assets_; }
    hal::DeviceFactory& device_factory() { return *factory_; }

private:
    static constexpr std::chrono::milliseconds kHousekeepingInterval{50};

    void release_finished_assets(); // worker thread

    SessionConfig config_;
    std::unique_ptr<hal::DeviceFactory> factory_;
    Worker worker_;
    AssetManager assets_;
    VoicePool voices_;
    VoiceCommandQueue commands_;
    SessionController session_;

    // Orders trigger/stop_voice against start/stop/reset
    std::mutex control_mutex_;
    uint64_t released_seen_ = 0; // worker thread only
};

} // namespace megaphone

#endif // MEGAPHONE_BROADCAST_ENGINE_HPP
