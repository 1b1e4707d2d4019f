/**
 * @file CInterface.h
 * @brief C-compatible API layer for cross-platform interoperability.
 *
 * Lets UI shells in other languages drive the engine:
 *   - Linux: C++ GUI libraries (Qt, GTK, etc.)
 *   - Android: Kotlin via JNI
 *   - macOS/iOS: Swift (via Bridge/C-Interop)
 *   - Windows: .NET (C# via P/Invoke)
 *
 * Functions returning int report 0 (or a non-negative value) on success and
 * a negative MegaphoneError on failure. No C++ exception crosses this API.
 */

#ifndef MEGAPHONE_C_INTERFACE_H
#define MEGAPHONE_C_INTERFACE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Negated values of megaphone::ErrorCode, plus two API-level codes
enum MegaphoneError {
    MEGAPHONE_OK = 0,
    MEGAPHONE_ERR_PERMISSION_DENIED = -1,
    MEGAPHONE_ERR_DEVICE_UNAVAILABLE = -2,
    MEGAPHONE_ERR_DEVICE_LOST = -3,
    MEGAPHONE_ERR_DECODE = -4,
    MEGAPHONE_ERR_NOT_FOUND = -5,
    MEGAPHONE_ERR_CONFIG = -6,
    MEGAPHONE_ERR_INVALID_STATE = -7,
    MEGAPHONE_ERR_INVALID_ARGUMENT = -100,
    MEGAPHONE_ERR_INTERNAL = -101
};

enum MegaphoneBroadcastState {
    MEGAPHONE_STATE_IDLE = 0,
    MEGAPHONE_STATE_STARTING = 1,
    MEGAPHONE_STATE_LIVE = 2,
    MEGAPHONE_STATE_STOPPING = 3,
    MEGAPHONE_STATE_FAULTED = 4
};

typedef struct {
    int state;              // MegaphoneBroadcastState
    int capture_active;
    int output_active;
    int sample_rate;
    int channels;
    int bit_depth;
    uint32_t frame_samples;
    int last_error;         // MegaphoneError
    uint64_t ticks;
    uint64_t overruns;
    uint64_t underruns;
    uint64_t clipped_samples;
    uint64_t xruns;
    uint64_t worst_mix_us;
    uint32_t active_voices;
} MegaphoneSessionState;

typedef struct {
    uint32_t id;
    char name[128];
    char source_path[512];
    uint64_t frame_count;
    int channels;
    int sample_rate;
} MegaphoneAssetInfo;

// Returns non-zero when microphone access is granted
typedef int (*MegaphonePermissionCallback)(void* user_data);

// Opaque handle type
typedef void* MegaphoneHandle;

// Lifecycle
MegaphoneHandle megaphone_create(void);
MegaphoneHandle megaphone_create_from_config(const char* config_path);
void megaphone_destroy(MegaphoneHandle handle);
int megaphone_set_permission(MegaphoneHandle handle, MegaphonePermissionCallback callback, void* user_data);

// Session
int megaphone_start_broadcast(MegaphoneHandle handle);
int megaphone_stop_broadcast(MegaphoneHandle handle);
int megaphone_reset(MegaphoneHandle handle);
int megaphone_get_state(MegaphoneHandle handle, MegaphoneSessionState* out_state);

// Assets: ids are positive, failures negative
int64_t megaphone_add_asset(MegaphoneHandle handle, const char* path, const char* display_name);
int64_t megaphone_add_pcm_asset(MegaphoneHandle handle, const char* display_name,
                                const int32_t* samples, size_t sample_count,
                                int sample_rate, int channels, int bit_depth);
int megaphone_remove_asset(MegaphoneHandle handle, uint32_t asset_id);
int megaphone_asset_count(MegaphoneHandle handle);
int megaphone_asset_info(MegaphoneHandle handle, int index, MegaphoneAssetInfo* out_info);

// Voices
int64_t megaphone_trigger_asset(MegaphoneHandle handle, uint32_t asset_id);
int megaphone_stop_voice(MegaphoneHandle handle, uint32_t voice_id);

const char* megaphone_error_string(int code);

#ifdef __cplusplus
}
#endif

#endif // MEGAPHONE_C_INTERFACE_H
