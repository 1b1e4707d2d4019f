#include "BroadcastEngine.hpp"
#include "AlsaDriver.hpp"
#include "AssetLibrary.hpp"
#include <algorithm>
#include <iostream>

namespace megaphone {

namespace {

std::unique_ptr<hal::DeviceFactory> default_factory(std::unique_ptr<hal::DeviceFactory> factory) {
    if (factory) return factory;
    return std::make_unique<hal::AlsaDeviceFactory>();
}

} // namespace

BroadcastEngine::BroadcastEngine(const SessionConfig& config, std::unique_ptr<hal::DeviceFactory> factory)
    : config_(config)
    , factory_(default_factory(std::move(factory)))
    , worker_("megaphone-worker")
    , assets_(config.format(), worker_)
    , voices_(static_cast<size_t>(std::max(config.max_voices, 1)), config.channels,
              static_cast<size_t>(std::max(config.frame_samples, 1)))
    , session_(config, *factory_, worker_, voices_, commands_)
{
    worker_.set_idle_task([this]() { release_finished_assets(); }, kHousekeepingInterval);
}

BroadcastEngine::~BroadcastEngine() {
    worker_.set_idle_task(nullptr, kHousekeepingInterval);
    session_.stop();
}

void BroadcastEngine::release_finished_assets() {
    const uint64_t released = voices_.assets_released();
    if (released == released_seen_) {
        return;
    }
    released_seen_ = released;
    if (assets_.pending_release_count() > 0) {
        assets_.collect_garbage();
    }
}

void BroadcastEngine::set_permission_hook(SessionController::PermissionHook hook) {
    session_.set_permission_hook(std::move(hook));
}

ErrorCode BroadcastEngine::start_broadcast() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return session_.start();
}

void BroadcastEngine::stop_broadcast() {
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        session_.stop();
    }
    assets_.collect_garbage(); // voices dropped their references
}

ErrorCode BroadcastEngine::reset() {
    ErrorCode result;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        result = session_.reset();
        if (result == ErrorCode::Ok) {
            // A trigger racing the device-loss teardown may have queued after it
            commands_.clear();
        }
    }
    assets_.collect_garbage();
    return result;
}

Result<AssetId> BroadcastEngine::add_asset(const std::string& path, const std::string& display_name) {
    return assets_.load(path, display_name);
}

std::future<Result<AssetId>> BroadcastEngine::add_asset_async(const std::string& path,
                                                              const std::string& display_name) {
    return assets_.load_async(path, display_name);
}

Result<AssetId> BroadcastEngine::add_pcm_asset(const std::string& display_name, const std::vector<Sample>& samples,
                                               int sample_rate, int channels, int bit_depth) {
    return assets_.load_pcm(display_name, samples, sample_rate, channels, bit_depth);
}

bool BroadcastEngine::remove_asset(AssetId id) {
    return assets_.remove(id);
}

std::vector<AssetInfo> BroadcastEngine::list_assets() const {
    return assets_.list();
}

Result<VoiceId> BroadcastEngine::trigger_asset(AssetId id) {
    auto asset = assets_.find(id);
    if (!asset) {
        return ErrorCode::NotFound;
    }

    std::lock_guard<std::mutex> lock(control_mutex_);
    if (session_.state() != BroadcastState::Live) {
        return ErrorCode::InvalidState;
    }

    const VoiceId voice = voices_.allocate_id();
    VoiceCommand command;
    command.type = VoiceCommand::Type::Trigger;
    command.voice = voice;
    command.asset = std::move(asset);
    if (!commands_.push(std::move(command))) {
        std::cerr << "[BroadcastEngine] Voice command queue full, trigger of #" << id << " dropped" << std::endl;
        return ErrorCode::InvalidState;
    }
    if (session_.state() != BroadcastState::Live) {
        // Device lost meanwhile; reset() or the next start discards the command
        return ErrorCode::InvalidState;
    }
    return voice;
}

void BroadcastEngine::stop_voice(VoiceId id) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (id == kInvalidVoiceId || session_.state() != BroadcastState::Live) {
        return;
    }
    VoiceCommand command;
    command.type = VoiceCommand::Type::Stop;
    command.voice = id;
    if (!commands_.push(std::move(command))) {
        std::cerr << "[BroadcastEngine] Voice command queue full, stop of voice " << id << " dropped" << std::endl;
    }
}

SessionState BroadcastEngine::observe_state() const {
    return session_.snapshot();
}

bool BroadcastEngine::save_library(const std::string& path) const {
    return AssetLibrary::save_to_file(AssetLibrary::from_assets(assets_.list()), path);
}

Result<size_t> BroadcastEngine::restore_library(const std::string& path) {
    LibraryManifest manifest;
    const ErrorCode err = AssetLibrary::load_from_file(manifest, path);
    if (err != ErrorCode::Ok) {
        return err;
    }

    size_t restored = 0;
    for (const auto& entry : manifest.entries) {
        auto result = assets_.load(entry.path, entry.name);
        if (result) {
            ++restored;
        } else {
            std::cerr << "[AssetLibrary] Skipped '" << entry.path << "': " << to_string(result.error()) << std::endl;
        }
    }
    return restored;
}

} // namespace megaphone
