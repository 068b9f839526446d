#pragma once

#include "rdlink/c_api/rdl_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define RDL_API_VERSION_MAJOR 1
#define RDL_API_VERSION_MINOR 0
#define RDL_API_VERSION_PATCH 0

typedef enum {
    RDL_SUCCESS = 0,
    RDL_ERROR_GENERIC = 1,
    RDL_ERROR_INVALID_INPUT = 2,
    RDL_ERROR_INVALID_STATE = 3,
    RDL_ERROR_ENCODE = 4,
    RDL_ERROR_DECODE = 5,
    RDL_ERROR_HANDSHAKE = 6,
    RDL_ERROR_KEY_GENERATION = 7,
    RDL_ERROR_ENCRYPTION = 8,
    RDL_ERROR_DECRYPTION = 9,
    RDL_ERROR_TRANSPORT = 10,
    RDL_ERROR_DISCOVERY = 11,
    RDL_ERROR_TIMEOUT = 12,
    RDL_ERROR_OBJECT_DISPOSED = 13,
    RDL_ERROR_NULL_POINTER = 14,
    RDL_ERROR_OUT_OF_MEMORY = 15,
    RDL_ERROR_SODIUM_FAILURE = 16,
    RDL_ERROR_UNKNOWN_CHANNEL = 17,
    RDL_ERROR_UNKNOWN_TIMER = 18
} RdlErrorCode;

typedef enum {
    RDL_STATE_IDLE = 0,
    RDL_STATE_CONNECTING = 1,
    RDL_STATE_WAITING_PASSWORD = 2,
    RDL_STATE_AUTHENTICATING = 3,
    RDL_STATE_STREAMING = 4,
    RDL_STATE_DISCONNECTED = 5,
    RDL_STATE_ERROR = 6
} RdlSessionState;

typedef enum {
    RDL_CHANNEL_DISCOVERY = 0,
    RDL_CHANNEL_RELAY = 1
} RdlChannelKind;

typedef enum {
    RDL_SHORTCUT_CTRL_ALT_DEL = 0,
    RDL_SHORTCUT_LOCK_SCREEN = 1,
    RDL_SHORTCUT_REFRESH_SCREEN = 2,
    RDL_SHORTCUT_RESTART_REMOTE_DEVICE = 3
} RdlShortcut;

typedef enum {
    RDL_IMAGE_QUALITY_LOW = 2,
    RDL_IMAGE_QUALITY_BALANCED = 3,
    RDL_IMAGE_QUALITY_BEST = 4
} RdlImageQuality;

/*
 * Events delivered through RdlCallbacks.on_event. `value` carries the numeric
 * payload (new state, latency in ms) and `data` the textual or serialized
 * payload; both are zero when unused. Rich payloads (peer info, option and
 * permission notices, cursor image, display switch) are serialized protobuf
 * messages of the rdlink.proto.peer package.
 */
typedef enum {
    RDL_EVENT_STATE_CHANGED = 0,
    RDL_EVENT_LOG = 1,
    RDL_EVENT_ERROR = 2,
    RDL_EVENT_PASSWORD_REQUIRED = 3,
    RDL_EVENT_LOGIN_ERROR = 4,
    RDL_EVENT_PEER_INFO = 5,
    RDL_EVENT_STATS = 6,
    RDL_EVENT_CHAT = 7,
    RDL_EVENT_LATENCY = 8,
    RDL_EVENT_DISCONNECTED = 9,
    RDL_EVENT_CLIPBOARD = 10,
    RDL_EVENT_OPTION_NOTICE = 11,
    RDL_EVENT_PERMISSION_NOTICE = 12,
    RDL_EVENT_SESSION_START = 13,
    RDL_EVENT_SESSION_RELEASE = 14,
    RDL_EVENT_AUDIO_FORMAT = 15,
    RDL_EVENT_CURSOR_DATA = 16,
    RDL_EVENT_CURSOR_POSITION = 17,
    RDL_EVENT_CURSOR_ID = 18,
    RDL_EVENT_SWITCH_DISPLAY = 19
} RdlEventType;

typedef struct RdlClientHandle RdlClientHandle;

typedef struct RdlError {
    RdlErrorCode code;
    char* message;
} RdlError;

typedef struct RdlClientOptions {
    const char* target_id;
    const char* server_key;
    const char* client_name;
    RdlImageQuality image_quality;
    uint32_t custom_fps;
    bool disable_audio;
    bool disable_clipboard;
} RdlClientOptions;

/*
 * Host hooks. Channel and timer ids are chosen by the library; the host
 * reports back with rdl_channel_* and rdl_timer_fired using the same ids.
 * open_channel must not call rdl_channel_* before it returns.
 */
typedef struct RdlCallbacks {
    int32_t (*open_channel)(void* user_data, uint64_t channel_id, RdlChannelKind kind);
    int32_t (*send)(void* user_data, uint64_t channel_id, const uint8_t* data, size_t length);
    void (*close_channel)(void* user_data, uint64_t channel_id);
    void (*schedule_timer)(void* user_data, uint64_t timer_id, uint32_t delay_ms, bool repeating);
    void (*cancel_timer)(void* user_data, uint64_t timer_id);
    int64_t (*now_ms)(void* user_data);
    void (*on_event)(void* user_data, RdlEventType type, int64_t value, const uint8_t* data, size_t length);
    void (*on_video_frame)(void* user_data, int32_t codec, const uint8_t* data, size_t length,
                           bool key_frame, int64_t pts, int32_t display);
    void (*on_audio_frame)(void* user_data, const uint8_t* data, size_t length);
    void* user_data;
} RdlCallbacks;

RDL_API const char* rdl_version(void);

RDL_API RdlErrorCode rdl_init(void);

RDL_API RdlErrorCode rdl_client_create(
    const RdlClientOptions* options,
    const RdlCallbacks* callbacks,
    RdlClientHandle** out_handle,
    RdlError* out_error);

RDL_API void rdl_client_destroy(RdlClientHandle* handle);

RDL_API RdlErrorCode rdl_client_connect(
    RdlClientHandle* handle,
    RdlError* out_error);

RDL_API RdlErrorCode rdl_client_authenticate(
    RdlClientHandle* handle,
    const char* password,
    size_t password_length,
    RdlError* out_error);

RDL_API void rdl_client_disconnect(RdlClientHandle* handle);

RDL_API RdlSessionState rdl_client_state(const RdlClientHandle* handle);

RDL_API RdlErrorCode rdl_channel_opened(
    RdlClientHandle* handle,
    uint64_t channel_id,
    RdlError* out_error);

RDL_API RdlErrorCode rdl_channel_data(
    RdlClientHandle* handle,
    uint64_t channel_id,
    const uint8_t* data,
    size_t length,
    RdlError* out_error);

RDL_API RdlErrorCode rdl_channel_closed(
    RdlClientHandle* handle,
    uint64_t channel_id,
    const char* reason,
    RdlError* out_error);

RDL_API RdlErrorCode rdl_channel_error(
    RdlClientHandle* handle,
    uint64_t channel_id,
    const char* message,
    RdlError* out_error);

RDL_API RdlErrorCode rdl_timer_fired(
    RdlClientHandle* handle,
    uint64_t timer_id,
    RdlError* out_error);

RDL_API RdlErrorCode rdl_client_send_clipboard(
    RdlClientHandle* handle,
    const char* text,
    size_t text_length,
    RdlError* out_error);

RDL_API RdlErrorCode rdl_client_send_chat(
    RdlClientHandle* handle,
    const char* text,
    size_t text_length,
    RdlError* out_error);

RDL_API RdlErrorCode rdl_client_send_shortcut(
    RdlClientHandle* handle,
    RdlShortcut shortcut,
    RdlError* out_error);

RDL_API RdlErrorCode rdl_client_set_image_quality(
    RdlClientHandle* handle,
    RdlImageQuality quality,
    RdlError* out_error);

RDL_API RdlErrorCode rdl_client_set_custom_fps(
    RdlClientHandle* handle,
    uint32_t fps,
    RdlError* out_error);

RDL_API void rdl_error_free(RdlError* error);

#ifdef __cplusplus
}
#endif
