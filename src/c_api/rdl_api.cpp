/**
 * @file rdl_api.cpp
 * @brief C ABI over RemoteDesktopClient
 */

#include "rdlink/c_api/rdl_api.h"
#include "rdl_internal.hpp"
#include "rdlink/client/client_config.hpp"
#include "rdlink/client/remote_desktop_client.hpp"
#include "rdlink/crypto/sodium_interop.hpp"
#include "rdlink/protocol/constants.hpp"
#include "rdlink/core/format.hpp"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <string_view>

using namespace rdlink::protocol;
using namespace rdlink::client;
using rdlink::protocol::crypto::SodiumInterop;

// ============================================================================
// Internal Helper Implementations
// ============================================================================

namespace rdl::internal {

RdlErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? RDL_SUCCESS
               : RDL_ERROR_SODIUM_FAILURE;
}

void fill_error(RdlError* out_error, const RdlErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

RdlErrorCode fill_error_from_failure(RdlError* out_error, const ProtocolFailure& failure) {
    RdlErrorCode code = RDL_ERROR_GENERIC;

    switch (failure.type) {
        case ProtocolFailureType::InvalidInput:
            code = RDL_ERROR_INVALID_INPUT;
            break;
        case ProtocolFailureType::InvalidState:
            code = RDL_ERROR_INVALID_STATE;
            break;
        case ProtocolFailureType::Encode:
            code = RDL_ERROR_ENCODE;
            break;
        case ProtocolFailureType::Decode:
            code = RDL_ERROR_DECODE;
            break;
        case ProtocolFailureType::Handshake:
            code = RDL_ERROR_HANDSHAKE;
            break;
        case ProtocolFailureType::KeyGeneration:
            code = RDL_ERROR_KEY_GENERATION;
            break;
        case ProtocolFailureType::Encryption:
            code = RDL_ERROR_ENCRYPTION;
            break;
        case ProtocolFailureType::Decryption:
            code = RDL_ERROR_DECRYPTION;
            break;
        case ProtocolFailureType::Transport:
            code = RDL_ERROR_TRANSPORT;
            break;
        case ProtocolFailureType::Discovery:
            code = RDL_ERROR_DISCOVERY;
            break;
        case ProtocolFailureType::Timeout:
            code = RDL_ERROR_TIMEOUT;
            break;
        case ProtocolFailureType::ObjectDisposed:
            code = RDL_ERROR_OBJECT_DISPOSED;
            break;
        case ProtocolFailureType::NullPointer:
            code = RDL_ERROR_NULL_POINTER;
            break;
        default:
            code = RDL_ERROR_GENERIC;
            break;
    }

    fill_error(out_error, code, failure.message);
    return code;
}

bool validate_buffer_param(const void* data, const size_t length, RdlError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, RDL_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

bool validate_output_handle(const void* handle, RdlError* out_error) {
    if (!handle) {
        fill_error(out_error, RDL_ERROR_NULL_POINTER, "Output handle pointer is null");
        return false;
    }
    return true;
}

namespace {

class CApiTransportChannel final : public ITransportChannel {
public:
    CApiTransportChannel(CApiTransportBridge* bridge, const uint64_t channel_id)
        : bridge_(bridge), channel_id_(channel_id) {}

    Result<Unit, ProtocolFailure> Send(std::span<const uint8_t> data) override {
        if (closed_) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport("Channel is closed"));
        }
        return bridge_->Send(channel_id_, data);
    }

    void Close() override {
        if (!closed_) {
            closed_ = true;
            bridge_->Close(channel_id_);
        }
    }

private:
    CApiTransportBridge* bridge_;
    uint64_t channel_id_;
    bool closed_ = false;
};

} // namespace

// ----------------------------------------------------------------------------
// CApiTransportBridge
// ----------------------------------------------------------------------------

CApiTransportBridge::CApiTransportBridge(const RdlCallbacks& callbacks)
    : callbacks_(callbacks) {}

Result<std::unique_ptr<ITransportChannel>, ProtocolFailure> CApiTransportBridge::Open(
    const ChannelKind kind,
    std::shared_ptr<ITransportChannelHandler> handler) {

    using ResultType = Result<std::unique_ptr<ITransportChannel>, ProtocolFailure>;

    const uint64_t channel_id = next_channel_id_++;
    const auto host_kind = kind == ChannelKind::Discovery ? RDL_CHANNEL_DISCOVERY : RDL_CHANNEL_RELAY;
    if (const int32_t status = callbacks_.open_channel(callbacks_.user_data, channel_id, host_kind); status != 0) {
        return ResultType::Err(ProtocolFailure::Transport(
            rdlink::compat::format("Host refused to open the {} channel (status {})", ToString(kind), status)));
    }
    handlers_.emplace(channel_id, std::move(handler));
    return ResultType::Ok(std::make_unique<CApiTransportChannel>(this, channel_id));
}

Result<Unit, ProtocolFailure> CApiTransportBridge::Send(const uint64_t channel_id, std::span<const uint8_t> data) {
    if (const int32_t status = callbacks_.send(callbacks_.user_data, channel_id, data.data(), data.size());
        status != 0) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Transport(
            rdlink::compat::format("Host failed to send on channel {} (status {})", channel_id, status)));
    }
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

void CApiTransportBridge::Close(const uint64_t channel_id) {
    if (handlers_.erase(channel_id) > 0) {
        callbacks_.close_channel(callbacks_.user_data, channel_id);
    }
}

std::shared_ptr<ITransportChannelHandler> CApiTransportBridge::Find(const uint64_t channel_id) const {
    const auto it = handlers_.find(channel_id);
    return it == handlers_.end() ? nullptr : it->second;
}

// ----------------------------------------------------------------------------
// CApiTimerScheduler
// ----------------------------------------------------------------------------

CApiTimerScheduler::CApiTimerScheduler(const RdlCallbacks& callbacks)
    : callbacks_(callbacks) {}

TimerId CApiTimerScheduler::ScheduleOnce(const std::chrono::milliseconds delay, std::function<void()> callback) {
    return Schedule(delay, std::move(callback), false);
}

TimerId CApiTimerScheduler::ScheduleRepeating(const std::chrono::milliseconds interval, std::function<void()> callback) {
    return Schedule(interval, std::move(callback), true);
}

TimerId CApiTimerScheduler::Schedule(
    const std::chrono::milliseconds delay,
    std::function<void()> callback,
    const bool repeating) {
    const TimerId id = next_timer_id_++;
    timers_.emplace(id, Entry{std::move(callback), repeating});
    callbacks_.schedule_timer(callbacks_.user_data, id, static_cast<uint32_t>(delay.count()), repeating);
    return id;
}

void CApiTimerScheduler::Cancel(const TimerId id) {
    if (timers_.erase(id) > 0) {
        callbacks_.cancel_timer(callbacks_.user_data, id);
    }
}

std::chrono::milliseconds CApiTimerScheduler::Now() const {
    return std::chrono::milliseconds(callbacks_.now_ms(callbacks_.user_data));
}

bool CApiTimerScheduler::Fire(const TimerId id) {
    const auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }
    std::function<void()> callback = it->second.callback;
    if (!it->second.repeating) {
        timers_.erase(it);
    }
    callback();
    return true;
}

// ----------------------------------------------------------------------------
// CApiEventHandler
// ----------------------------------------------------------------------------

CApiEventHandler::CApiEventHandler(const RdlCallbacks& callbacks)
    : callbacks_(callbacks) {}

void CApiEventHandler::Emit(const RdlEventType type, const int64_t value, const std::string& payload) const {
    if (callbacks_.on_event) {
        callbacks_.on_event(
            callbacks_.user_data, type, value,
            reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    }
}

void CApiEventHandler::OnStateChanged(const SessionState state, SessionState) {
    Emit(RDL_EVENT_STATE_CHANGED, static_cast<int64_t>(state), std::string(ToString(state)));
}

void CApiEventHandler::OnLog(const std::string& message) {
    Emit(RDL_EVENT_LOG, 0, message);
}

void CApiEventHandler::OnError(const std::string& message) {
    Emit(RDL_EVENT_ERROR, 0, message);
}

void CApiEventHandler::OnPasswordRequired() {
    Emit(RDL_EVENT_PASSWORD_REQUIRED, 0, {});
}

void CApiEventHandler::OnLoginError(const std::string& message) {
    Emit(RDL_EVENT_LOGIN_ERROR, 0, message);
}

void CApiEventHandler::OnPeerInfo(const rdlink::proto::peer::PeerInfo& info) {
    Emit(RDL_EVENT_PEER_INFO, 0, info.SerializeAsString());
}

void CApiEventHandler::OnStats(const SessionStats& stats) {
    Emit(RDL_EVENT_STATS, static_cast<int64_t>(stats.video_frames),
         rdlink::compat::format(
             "{{\"state\":\"{}\",\"frames_sent\":{},\"frames_received\":{},\"bytes_sent\":{},"
             "\"bytes_received\":{},\"video_frames\":{},\"audio_frames\":{},\"latency_ms\":{},\"uptime_ms\":{}}}",
             ToString(stats.state), stats.frames_sent, stats.frames_received, stats.bytes_sent,
             stats.bytes_received, stats.video_frames, stats.audio_frames,
             stats.last_latency ? stats.last_latency->count() : -1, stats.uptime.count()));
}

void CApiEventHandler::OnChat(const std::string& text) {
    Emit(RDL_EVENT_CHAT, 0, text);
}

void CApiEventHandler::OnLatency(const std::chrono::milliseconds round_trip) {
    Emit(RDL_EVENT_LATENCY, round_trip.count(), {});
}

void CApiEventHandler::OnDisconnected(const std::string& reason) {
    Emit(RDL_EVENT_DISCONNECTED, 0, reason);
}

void CApiEventHandler::OnClipboard(const std::string& text) {
    Emit(RDL_EVENT_CLIPBOARD, 0, text);
}

void CApiEventHandler::OnOptionNotice(const rdlink::proto::peer::OptionMessage& option) {
    Emit(RDL_EVENT_OPTION_NOTICE, 0, option.SerializeAsString());
}

void CApiEventHandler::OnPermissionNotice(const rdlink::proto::peer::PermissionInfo& permission) {
    Emit(RDL_EVENT_PERMISSION_NOTICE, permission.enabled() ? 1 : 0, permission.SerializeAsString());
}

// ----------------------------------------------------------------------------
// CApiPresentationSink
// ----------------------------------------------------------------------------

CApiPresentationSink::CApiPresentationSink(const RdlCallbacks& callbacks)
    : callbacks_(callbacks) {}

void CApiPresentationSink::Emit(const RdlEventType type, const int64_t value, const std::string& payload) const {
    if (callbacks_.on_event) {
        callbacks_.on_event(
            callbacks_.user_data, type, value,
            reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    }
}

void CApiPresentationSink::Start() {
    Emit(RDL_EVENT_SESSION_START, 0, {});
}

void CApiPresentationSink::Release() {
    Emit(RDL_EVENT_SESSION_RELEASE, 0, {});
}

void CApiPresentationSink::OnVideoFrame(
    const VideoCodec codec,
    std::span<const uint8_t> data,
    const bool key_frame,
    const int64_t pts,
    const int32_t display) {
    if (callbacks_.on_video_frame) {
        callbacks_.on_video_frame(
            callbacks_.user_data, static_cast<int32_t>(codec), data.data(), data.size(), key_frame, pts, display);
    }
}

void CApiPresentationSink::OnAudioFormat(const uint32_t sample_rate, const uint32_t channels) {
    Emit(RDL_EVENT_AUDIO_FORMAT, static_cast<int64_t>(sample_rate),
         rdlink::compat::format("{}", channels));
}

void CApiPresentationSink::OnAudioFrame(std::span<const uint8_t> data) {
    if (callbacks_.on_audio_frame) {
        callbacks_.on_audio_frame(callbacks_.user_data, data.data(), data.size());
    }
}

void CApiPresentationSink::OnCursorData(const rdlink::proto::peer::CursorData& cursor) {
    Emit(RDL_EVENT_CURSOR_DATA, static_cast<int64_t>(cursor.id()), cursor.SerializeAsString());
}

void CApiPresentationSink::OnCursorPosition(const int32_t x, const int32_t y) {
    const int64_t packed = (static_cast<int64_t>(x) << 32) | static_cast<uint32_t>(y);
    Emit(RDL_EVENT_CURSOR_POSITION, packed, {});
}

void CApiPresentationSink::OnCursorId(const uint64_t id) {
    Emit(RDL_EVENT_CURSOR_ID, static_cast<int64_t>(id), {});
}

void CApiPresentationSink::OnSwitchDisplay(const rdlink::proto::peer::SwitchDisplay& display) {
    Emit(RDL_EVENT_SWITCH_DISPLAY, display.display(), display.SerializeAsString());
}

void CApiPresentationSink::SetScaleMode(ScaleMode) {
}

} // namespace rdl::internal

// ============================================================================
// C API Implementations
// ============================================================================

using namespace rdl::internal;

namespace {

bool validate_client_handle(const RdlClientHandle* handle, RdlError* out_error) {
    if (!handle || !handle->client) {
        fill_error(out_error, RDL_ERROR_NULL_POINTER, "Client handle is null");
        return false;
    }
    return true;
}

RdlErrorCode report(const Result<Unit, ProtocolFailure>& result, RdlError* out_error) {
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    return RDL_SUCCESS;
}

std::string_view text_param(const char* text, const size_t length) {
    return text ? std::string_view(text, length) : std::string_view();
}

std::shared_ptr<ITransportChannelHandler> find_channel(
    RdlClientHandle* handle,
    const uint64_t channel_id,
    RdlError* out_error) {
    auto handler = handle->bridge->Find(channel_id);
    if (!handler) {
        fill_error(out_error, RDL_ERROR_UNKNOWN_CHANNEL,
                   rdlink::compat::format("Unknown channel id {}", channel_id));
    }
    return handler;
}

} // namespace

extern "C" {

// ----------------------------------------------------------------------------
// Version & Initialization
// ----------------------------------------------------------------------------

const char* rdl_version(void) {
    return kLibraryVersion.data();
}

RdlErrorCode rdl_init(void) {
    return EnsureInitialized();
}

// ----------------------------------------------------------------------------
// Client lifecycle
// ----------------------------------------------------------------------------

RdlErrorCode rdl_client_create(
    const RdlClientOptions* options,
    const RdlCallbacks* callbacks,
    RdlClientHandle** out_handle,
    RdlError* out_error) {
    if (const auto err = EnsureInitialized(); err != RDL_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return RDL_ERROR_NULL_POINTER;
    }
    if (!options || !options->target_id || !options->server_key) {
        fill_error(out_error, RDL_ERROR_NULL_POINTER, "Options with target id and server key are required");
        return RDL_ERROR_NULL_POINTER;
    }
    if (!callbacks || !callbacks->open_channel || !callbacks->send || !callbacks->close_channel ||
        !callbacks->schedule_timer || !callbacks->cancel_timer || !callbacks->now_ms) {
        fill_error(out_error, RDL_ERROR_NULL_POINTER, "Channel and timer callbacks are required");
        return RDL_ERROR_NULL_POINTER;
    }

    ClientConfig config = ClientConfig::Default(options->target_id, options->server_key);
    if (options->client_name) {
        config.client_name = options->client_name;
    }
    if (options->image_quality != 0) {
        config.image_quality = static_cast<rdlink::proto::peer::ImageQuality>(options->image_quality);
    }
    if (options->custom_fps != 0) {
        config.custom_fps = options->custom_fps;
    }
    config.disable_audio = options->disable_audio;
    config.disable_clipboard = options->disable_clipboard;

    auto* handle = new(std::nothrow) RdlClientHandle{};
    if (!handle) {
        fill_error(out_error, RDL_ERROR_OUT_OF_MEMORY, "Failed to allocate client handle");
        return RDL_ERROR_OUT_OF_MEMORY;
    }
    handle->bridge = std::make_shared<CApiTransportBridge>(*callbacks);
    handle->timers = std::make_shared<CApiTimerScheduler>(*callbacks);
    handle->events = std::make_shared<CApiEventHandler>(*callbacks);
    handle->sink = std::make_shared<CApiPresentationSink>(*callbacks);

    auto result = RemoteDesktopClient::Create(
        std::move(config), handle->bridge, handle->timers, handle->events, handle->sink);
    if (result.IsErr()) {
        delete handle;
        return fill_error_from_failure(out_error, std::move(result).UnwrapErr());
    }
    handle->client = std::move(result).Unwrap();

    *out_handle = handle;
    return RDL_SUCCESS;
}

void rdl_client_destroy(RdlClientHandle* handle) {
    delete handle;
}

RdlErrorCode rdl_client_connect(RdlClientHandle* handle, RdlError* out_error) {
    if (!validate_client_handle(handle, out_error)) {
        return RDL_ERROR_NULL_POINTER;
    }
    return report(handle->client->Connect(), out_error);
}

RdlErrorCode rdl_client_authenticate(
    RdlClientHandle* handle,
    const char* password,
    const size_t password_length,
    RdlError* out_error) {
    if (!validate_client_handle(handle, out_error) ||
        !validate_buffer_param(password, password_length, out_error)) {
        return out_error ? out_error->code : RDL_ERROR_NULL_POINTER;
    }
    return report(handle->client->Authenticate(text_param(password, password_length)), out_error);
}

void rdl_client_disconnect(RdlClientHandle* handle) {
    if (handle && handle->client) {
        handle->client->Disconnect();
    }
}

RdlSessionState rdl_client_state(const RdlClientHandle* handle) {
    if (!handle || !handle->client) {
        return RDL_STATE_IDLE;
    }
    return static_cast<RdlSessionState>(handle->client->State());
}

// ----------------------------------------------------------------------------
// Host-driven events
// ----------------------------------------------------------------------------

RdlErrorCode rdl_channel_opened(RdlClientHandle* handle, const uint64_t channel_id, RdlError* out_error) {
    if (!validate_client_handle(handle, out_error)) {
        return RDL_ERROR_NULL_POINTER;
    }
    const auto handler = find_channel(handle, channel_id, out_error);
    if (!handler) {
        return RDL_ERROR_UNKNOWN_CHANNEL;
    }
    handler->OnOpen();
    return RDL_SUCCESS;
}

RdlErrorCode rdl_channel_data(
    RdlClientHandle* handle,
    const uint64_t channel_id,
    const uint8_t* data,
    const size_t length,
    RdlError* out_error) {
    if (!validate_client_handle(handle, out_error) ||
        !validate_buffer_param(data, length, out_error)) {
        return out_error ? out_error->code : RDL_ERROR_NULL_POINTER;
    }
    const auto handler = find_channel(handle, channel_id, out_error);
    if (!handler) {
        return RDL_ERROR_UNKNOWN_CHANNEL;
    }
    handler->OnMessage(std::span<const uint8_t>(data, length));
    return RDL_SUCCESS;
}

RdlErrorCode rdl_channel_closed(
    RdlClientHandle* handle,
    const uint64_t channel_id,
    const char* reason,
    RdlError* out_error) {
    if (!validate_client_handle(handle, out_error)) {
        return RDL_ERROR_NULL_POINTER;
    }
    const auto handler = find_channel(handle, channel_id, out_error);
    if (!handler) {
        return RDL_ERROR_UNKNOWN_CHANNEL;
    }
    handler->OnClose(reason ? reason : "");
    return RDL_SUCCESS;
}

RdlErrorCode rdl_channel_error(
    RdlClientHandle* handle,
    const uint64_t channel_id,
    const char* message,
    RdlError* out_error) {
    if (!validate_client_handle(handle, out_error)) {
        return RDL_ERROR_NULL_POINTER;
    }
    const auto handler = find_channel(handle, channel_id, out_error);
    if (!handler) {
        return RDL_ERROR_UNKNOWN_CHANNEL;
    }
    handler->OnError(message ? message : "");
    return RDL_SUCCESS;
}

RdlErrorCode rdl_timer_fired(RdlClientHandle* handle, const uint64_t timer_id, RdlError* out_error) {
    if (!validate_client_handle(handle, out_error)) {
        return RDL_ERROR_NULL_POINTER;
    }
    if (!handle->timers->Fire(timer_id)) {
        fill_error(out_error, RDL_ERROR_UNKNOWN_TIMER,
                   rdlink::compat::format("Unknown or cancelled timer id {}", timer_id));
        return RDL_ERROR_UNKNOWN_TIMER;
    }
    return RDL_SUCCESS;
}

// ----------------------------------------------------------------------------
// Session controls
// ----------------------------------------------------------------------------

RdlErrorCode rdl_client_send_clipboard(
    RdlClientHandle* handle,
    const char* text,
    const size_t text_length,
    RdlError* out_error) {
    if (!validate_client_handle(handle, out_error) ||
        !validate_buffer_param(text, text_length, out_error)) {
        return out_error ? out_error->code : RDL_ERROR_NULL_POINTER;
    }
    return report(handle->client->SendClipboard(text_param(text, text_length)), out_error);
}

RdlErrorCode rdl_client_send_chat(
    RdlClientHandle* handle,
    const char* text,
    const size_t text_length,
    RdlError* out_error) {
    if (!validate_client_handle(handle, out_error) ||
        !validate_buffer_param(text, text_length, out_error)) {
        return out_error ? out_error->code : RDL_ERROR_NULL_POINTER;
    }
    return report(handle->client->SendChat(text_param(text, text_length)), out_error);
}

RdlErrorCode rdl_client_send_shortcut(
    RdlClientHandle* handle,
    const RdlShortcut shortcut,
    RdlError* out_error) {
    if (!validate_client_handle(handle, out_error)) {
        return RDL_ERROR_NULL_POINTER;
    }
    switch (shortcut) {
        case RDL_SHORTCUT_CTRL_ALT_DEL:
            return report(handle->client->SendCtrlAltDel(), out_error);
        case RDL_SHORTCUT_LOCK_SCREEN:
            return report(handle->client->SendLockScreen(), out_error);
        case RDL_SHORTCUT_REFRESH_SCREEN:
            return report(handle->client->RefreshScreen(), out_error);
        case RDL_SHORTCUT_RESTART_REMOTE_DEVICE:
            return report(handle->client->RestartRemoteDevice(), out_error);
    }
    fill_error(out_error, RDL_ERROR_INVALID_INPUT, "Unknown shortcut");
    return RDL_ERROR_INVALID_INPUT;
}

RdlErrorCode rdl_client_set_image_quality(
    RdlClientHandle* handle,
    const RdlImageQuality quality,
    RdlError* out_error) {
    if (!validate_client_handle(handle, out_error)) {
        return RDL_ERROR_NULL_POINTER;
    }
    if (quality != RDL_IMAGE_QUALITY_LOW && quality != RDL_IMAGE_QUALITY_BALANCED &&
        quality != RDL_IMAGE_QUALITY_BEST) {
        fill_error(out_error, RDL_ERROR_INVALID_INPUT, "Unknown image quality");
        return RDL_ERROR_INVALID_INPUT;
    }
    return report(
        handle->client->SetImageQuality(static_cast<rdlink::proto::peer::ImageQuality>(quality)),
        out_error);
}

RdlErrorCode rdl_client_set_custom_fps(
    RdlClientHandle* handle,
    const uint32_t fps,
    RdlError* out_error) {
    if (!validate_client_handle(handle, out_error)) {
        return RDL_ERROR_NULL_POINTER;
    }
    return report(handle->client->SetCustomFps(fps), out_error);
}

// ----------------------------------------------------------------------------
// Memory Management
// ----------------------------------------------------------------------------

void rdl_error_free(RdlError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

} // extern "C"
