/**
 * @file rdl_internal.hpp
 * @brief Adapters between the C callback table and the client interfaces
 *
 * Not part of the public API.
 */

#ifndef RDL_INTERNAL_HPP
#define RDL_INTERNAL_HPP

#include "rdlink/c_api/rdl_api.h"
#include "rdlink/client/remote_desktop_client.hpp"
#include "rdlink/interfaces/i_client_event_handler.hpp"
#include "rdlink/interfaces/i_presentation_sink.hpp"
#include "rdlink/interfaces/i_timer_scheduler.hpp"
#include "rdlink/interfaces/i_transport_bridge.hpp"
#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace rdl::internal {

using namespace rdlink::protocol;
using namespace rdlink::interfaces;

RdlErrorCode EnsureInitialized();

void fill_error(RdlError* out_error, RdlErrorCode code, const std::string& message);

RdlErrorCode fill_error_from_failure(RdlError* out_error, const ProtocolFailure& failure);

bool validate_buffer_param(const void* data, size_t length, RdlError* out_error);

bool validate_output_handle(const void* handle, RdlError* out_error);

/**
 * @brief Routes channel traffic through the host's open / send / close hooks
 */
class CApiTransportBridge final : public ITransportBridge {
public:
    explicit CApiTransportBridge(const RdlCallbacks& callbacks);

    Result<std::unique_ptr<ITransportChannel>, ProtocolFailure> Open(
        ChannelKind kind,
        std::shared_ptr<ITransportChannelHandler> handler) override;

    Result<Unit, ProtocolFailure> Send(uint64_t channel_id, std::span<const uint8_t> data);
    void Close(uint64_t channel_id);

    // nullptr for ids that were never opened or are already closed
    [[nodiscard]] std::shared_ptr<ITransportChannelHandler> Find(uint64_t channel_id) const;

private:
    RdlCallbacks callbacks_;
    uint64_t next_channel_id_ = 1;
    std::map<uint64_t, std::shared_ptr<ITransportChannelHandler>> handlers_;
};

/**
 * @brief Timer registry driven by rdl_timer_fired
 */
class CApiTimerScheduler final : public ITimerScheduler {
public:
    explicit CApiTimerScheduler(const RdlCallbacks& callbacks);

    TimerId ScheduleOnce(std::chrono::milliseconds delay, std::function<void()> callback) override;
    TimerId ScheduleRepeating(std::chrono::milliseconds interval, std::function<void()> callback) override;
    void Cancel(TimerId id) override;
    [[nodiscard]] std::chrono::milliseconds Now() const override;

    [[nodiscard]] bool Fire(TimerId id);

private:
    struct Entry {
        std::function<void()> callback;
        bool repeating = false;
    };

    TimerId Schedule(std::chrono::milliseconds delay, std::function<void()> callback, bool repeating);

    RdlCallbacks callbacks_;
    TimerId next_timer_id_ = 1;
    std::map<TimerId, Entry> timers_;
};

class CApiEventHandler final : public IClientEventHandler {
public:
    explicit CApiEventHandler(const RdlCallbacks& callbacks);

    void OnStateChanged(rdlink::client::SessionState state, rdlink::client::SessionState previous) override;
    void OnLog(const std::string& message) override;
    void OnError(const std::string& message) override;
    void OnPasswordRequired() override;
    void OnLoginError(const std::string& message) override;
    void OnPeerInfo(const rdlink::proto::peer::PeerInfo& info) override;
    void OnStats(const rdlink::client::SessionStats& stats) override;
    void OnChat(const std::string& text) override;
    void OnLatency(std::chrono::milliseconds round_trip) override;
    void OnDisconnected(const std::string& reason) override;
    void OnClipboard(const std::string& text) override;
    void OnOptionNotice(const rdlink::proto::peer::OptionMessage& option) override;
    void OnPermissionNotice(const rdlink::proto::peer::PermissionInfo& permission) override;

private:
    void Emit(RdlEventType type, int64_t value, const std::string& payload) const;

    RdlCallbacks callbacks_;
};

class CApiPresentationSink final : public IPresentationSink {
public:
    explicit CApiPresentationSink(const RdlCallbacks& callbacks);

    void Start() override;
    void Release() override;
    void OnVideoFrame(
        VideoCodec codec,
        std::span<const uint8_t> data,
        bool key_frame,
        int64_t pts,
        int32_t display) override;
    void OnAudioFormat(uint32_t sample_rate, uint32_t channels) override;
    void OnAudioFrame(std::span<const uint8_t> data) override;
    void OnCursorData(const rdlink::proto::peer::CursorData& cursor) override;
    void OnCursorPosition(int32_t x, int32_t y) override;
    void OnCursorId(uint64_t id) override;
    void OnSwitchDisplay(const rdlink::proto::peer::SwitchDisplay& display) override;
    void SetScaleMode(ScaleMode mode) override;

private:
    void Emit(RdlEventType type, int64_t value, const std::string& payload) const;

    RdlCallbacks callbacks_;
};

} // namespace rdl::internal

/**
 * @brief Opaque handle wrapping a RemoteDesktopClient and its host adapters
 *
 * The client is declared last so it is destroyed before the adapters it
 * closes channels and cancels timers through.
 */
struct RdlClientHandle {
    std::shared_ptr<rdl::internal::CApiTransportBridge> bridge;
    std::shared_ptr<rdl::internal::CApiTimerScheduler> timers;
    std::shared_ptr<rdl::internal::CApiEventHandler> events;
    std::shared_ptr<rdl::internal::CApiPresentationSink> sink;
    std::unique_ptr<rdlink::client::RemoteDesktopClient> client;
};

#endif // RDL_INTERNAL_HPP
