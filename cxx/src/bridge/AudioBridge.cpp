/**
 * @file AudioBridge.cpp
 * @brief C-compatible API bridge for the broadcast engine.
 */

#include "megaphone/CInterface.h"
#include "BroadcastEngine.hpp"
#include "SessionConfig.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

// Internal handle structure (hidden from C API)
struct EngineHandleImpl {
    std::mutex permission_mutex;
    MegaphonePermissionCallback permission = nullptr;
    void* permission_user_data = nullptr;

    // Last member: destroyed first, while the permission hook state is valid
    std::unique_ptr<megaphone::BroadcastEngine> engine;

    explicit EngineHandleImpl(const megaphone::SessionConfig& config)
        : engine(std::make_unique<megaphone::BroadcastEngine>(config))
    {
        engine->set_permission_hook([this]() {
            std::lock_guard<std::mutex> lock(permission_mutex);
            return permission == nullptr || permission(permission_user_data) != 0;
        });
    }
};

EngineHandleImpl* as_impl(MegaphoneHandle handle) {
    return static_cast<EngineHandleImpl*>(handle);
}

int to_c_error(megaphone::ErrorCode code) {
    return -static_cast<int>(code);
}

int state_to_c(megaphone::BroadcastState state) {
    switch (state) {
        case megaphone::BroadcastState::Idle: return MEGAPHONE_STATE_IDLE;
        case megaphone::BroadcastState::Starting: return MEGAPHONE_STATE_STARTING;
        case megaphone::BroadcastState::Live: return MEGAPHONE_STATE_LIVE;
        case megaphone::BroadcastState::Stopping: return MEGAPHONE_STATE_STOPPING;
        case megaphone::BroadcastState::Faulted: return MEGAPHONE_STATE_FAULTED;
    }
    return MEGAPHONE_STATE_IDLE;
}

void copy_string(char* dst, size_t size, const std::string& src) {
    std::strncpy(dst, src.c_str(), size - 1);
    dst[size - 1] = '\0';
}

MegaphoneHandle create_handle(const megaphone::SessionConfig& config) {
    try {
        return static_cast<MegaphoneHandle>(new EngineHandleImpl(config));
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] Engine creation failed: " << e.what() << std::endl;
        return nullptr;
    }
}

} // namespace

extern "C" {

MegaphoneHandle megaphone_create(void) {
    return create_handle(megaphone::SessionConfig{});
}

MegaphoneHandle megaphone_create_from_config(const char* config_path) {
    if (!config_path) return nullptr;
    megaphone::SessionConfig config;
    if (megaphone::SessionConfigStore::load_from_file(config, config_path) != megaphone::ErrorCode::Ok) {
        return nullptr;
    }
    return create_handle(config);
}

void megaphone_destroy(MegaphoneHandle handle) {
    if (handle) {
        delete as_impl(handle);
    }
}

int megaphone_set_permission(MegaphoneHandle handle, MegaphonePermissionCallback callback, void* user_data) {
    if (!handle) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        auto* impl = as_impl(handle);
        std::lock_guard<std::mutex> lock(impl->permission_mutex);
        impl->permission = callback;
        impl->permission_user_data = user_data;
        return MEGAPHONE_OK;
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] set_permission: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int megaphone_start_broadcast(MegaphoneHandle handle) {
    if (!handle) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        return to_c_error(as_impl(handle)->engine->start_broadcast());
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] start_broadcast: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int megaphone_stop_broadcast(MegaphoneHandle handle) {
    if (!handle) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        as_impl(handle)->engine->stop_broadcast();
        return MEGAPHONE_OK;
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] stop_broadcast: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int megaphone_reset(MegaphoneHandle handle) {
    if (!handle) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        return to_c_error(as_impl(handle)->engine->reset());
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] reset: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int megaphone_get_state(MegaphoneHandle handle, MegaphoneSessionState* out_state) {
    if (!handle || !out_state) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        const auto snap = as_impl(handle)->engine->observe_state();
        const auto& diag = snap.diagnostics;

        *out_state = MegaphoneSessionState{};
        out_state->state = state_to_c(snap.state);
        out_state->capture_active = snap.capture_active ? 1 : 0;
        out_state->output_active = snap.output_active ? 1 : 0;
        out_state->sample_rate = snap.sample_rate;
        out_state->channels = snap.channels;
        out_state->bit_depth = snap.bit_depth;
        out_state->frame_samples = static_cast<uint32_t>(snap.frame_samples);
        out_state->last_error = to_c_error(snap.last_error);
        out_state->ticks = diag.ticks;
        out_state->overruns = diag.overruns;
        out_state->underruns = diag.underruns;
        out_state->clipped_samples = diag.clipped_samples;
        out_state->xruns = diag.capture_xruns + diag.playback_xruns;
        out_state->worst_mix_us = diag.worst_mix_us;
        out_state->active_voices = static_cast<uint32_t>(diag.active_voices);
        return MEGAPHONE_OK;
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] get_state: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int64_t megaphone_add_asset(MegaphoneHandle handle, const char* path, const char* display_name) {
    if (!handle || !path) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        auto result = as_impl(handle)->engine->add_asset(path, display_name ? display_name : "");
        return result ? static_cast<int64_t>(*result) : to_c_error(result.error());
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] add_asset: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int64_t megaphone_add_pcm_asset(MegaphoneHandle handle, const char* display_name,
                                const int32_t* samples, size_t sample_count,
                                int sample_rate, int channels, int bit_depth) {
    if (!handle || !samples || sample_count == 0) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        std::vector<megaphone::Sample> pcm(samples, samples + sample_count);
        auto result = as_impl(handle)->engine->add_pcm_asset(display_name ? display_name : "", pcm,
                                                            sample_rate, channels, bit_depth);
        return result ? static_cast<int64_t>(*result) : to_c_error(result.error());
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] add_pcm_asset: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int megaphone_remove_asset(MegaphoneHandle handle, uint32_t asset_id) {
    if (!handle) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        return as_impl(handle)->engine->remove_asset(asset_id) ? MEGAPHONE_OK : MEGAPHONE_ERR_NOT_FOUND;
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] remove_asset: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int megaphone_asset_count(MegaphoneHandle handle) {
    if (!handle) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        return static_cast<int>(as_impl(handle)->engine->list_assets().size());
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] asset_count: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int megaphone_asset_info(MegaphoneHandle handle, int index, MegaphoneAssetInfo* out_info) {
    if (!handle || !out_info || index < 0) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        const auto assets = as_impl(handle)->engine->list_assets();
        if (static_cast<size_t>(index) >= assets.size()) return MEGAPHONE_ERR_NOT_FOUND;

        const auto& info = assets[static_cast<size_t>(index)];
        out_info->id = info.id;
        copy_string(out_info->name, sizeof(out_info->name), info.name);
        copy_string(out_info->source_path, sizeof(out_info->source_path), info.source_path);
        out_info->frame_count = info.frame_count;
        out_info->channels = info.channels;
        out_info->sample_rate = info.sample_rate;
        return MEGAPHONE_OK;
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] asset_info: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int64_t megaphone_trigger_asset(MegaphoneHandle handle, uint32_t asset_id) {
    if (!handle) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        auto result = as_impl(handle)->engine->trigger_asset(asset_id);
        return result ? static_cast<int64_t>(*result) : to_c_error(result.error());
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] trigger_asset: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

int megaphone_stop_voice(MegaphoneHandle handle, uint32_t voice_id) {
    if (!handle) return MEGAPHONE_ERR_INVALID_ARGUMENT;
    try {
        as_impl(handle)->engine->stop_voice(voice_id);
        return MEGAPHONE_OK;
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] stop_voice: " << e.what() << std::endl;
        return MEGAPHONE_ERR_INTERNAL;
    }
}

const char* megaphone_error_string(int code) {
    switch (code) {
        case MEGAPHONE_ERR_INVALID_ARGUMENT: return "InvalidArgument";
        case MEGAPHONE_ERR_INTERNAL: return "Internal";
        default: break;
    }
    if (code > 0 || code < MEGAPHONE_ERR_INVALID_STATE) {
        return "Unknown";
    }
    return megaphone::to_string(static_cast<megaphone::ErrorCode>(-code));
}

} // extern "C"
