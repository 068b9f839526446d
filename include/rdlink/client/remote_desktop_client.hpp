#pragma once

#include "rdlink/client/client_config.hpp"
#include "rdlink/client/session_state.hpp"
#include "rdlink/client/session_stats.hpp"
#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"
#include "rdlink/interfaces/i_client_event_handler.hpp"
#include "rdlink/interfaces/i_presentation_sink.hpp"
#include "rdlink/interfaces/i_timer_scheduler.hpp"
#include "rdlink/interfaces/i_transport_bridge.hpp"
#include "rdlink/protocol/message_builder.hpp"
#include "rdlink/protocol/peer_event.hpp"
#include "rdlink/protocol/secure_channel.hpp"
#include "peer/message.pb.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rdlink::client {

using interfaces::ChannelKind;
using interfaces::IClientEventHandler;
using interfaces::IPresentationSink;
using interfaces::ITimerScheduler;
using interfaces::ITransportBridge;
using interfaces::ITransportChannel;
using interfaces::ScaleMode;
using interfaces::TimerId;

/**
 * @brief Drives one remote desktop session from discovery to streaming
 *
 * Single-threaded: every public call and every bridge or timer callback must
 * arrive on the same event loop. Reply to a password prompt with
 * Authenticate(); everything else is reported through IClientEventHandler.
 *
 * @code
 * auto client = RemoteDesktopClient::Create(config, bridge, timers, events, sink).Unwrap();
 * client->Connect();
 * // OnPasswordRequired -> client->Authenticate(password);
 * @endcode
 */
class RemoteDesktopClient {
public:
    [[nodiscard]] static Result<std::unique_ptr<RemoteDesktopClient>, ProtocolFailure> Create(
        ClientConfig config,
        std::shared_ptr<ITransportBridge> bridge,
        std::shared_ptr<ITimerScheduler> timers,
        std::shared_ptr<IClientEventHandler> events,
        std::shared_ptr<IPresentationSink> sink);

    RemoteDesktopClient(const RemoteDesktopClient&) = delete;
    RemoteDesktopClient& operator=(const RemoteDesktopClient&) = delete;
    RemoteDesktopClient(RemoteDesktopClient&&) = delete;
    RemoteDesktopClient& operator=(RemoteDesktopClient&&) = delete;
    ~RemoteDesktopClient();

    // ========================================================================
    // Session lifecycle
    // ========================================================================

    /**
     * @brief Start a new session, tearing down whatever the previous one left open
     */
    Result<Unit, ProtocolFailure> Connect();

    /**
     * @brief Answer the pending password challenge
     *
     * @return Err(InvalidState) unless the client is waiting for a password
     */
    Result<Unit, ProtocolFailure> Authenticate(std::string_view password);

    /**
     * @brief Close everything and move to Disconnected from any state; repeat calls are no-ops
     */
    void Disconnect();

    [[nodiscard]] SessionState State() const noexcept { return state_; }

    [[nodiscard]] SessionStats GetStats() const;

    [[nodiscard]] const ClientConfig& Config() const noexcept { return config_; }

    // ========================================================================
    // Session controls (Streaming only)
    // ========================================================================

    Result<Unit, ProtocolFailure> SendClipboard(std::string_view text);
    Result<Unit, ProtocolFailure> SendChat(std::string_view text);
    Result<Unit, ProtocolFailure> SendCtrlAltDel();
    Result<Unit, ProtocolFailure> SendLockScreen();

    Result<Unit, ProtocolFailure> SendMouseEvent(
        int32_t mask,
        int32_t x,
        int32_t y,
        std::span<const proto::peer::ControlKey> modifiers = {});

    Result<Unit, ProtocolFailure> SendKeyEvent(const proto::peer::KeyEvent& event);

    Result<Unit, ProtocolFailure> RefreshScreen();
    Result<Unit, ProtocolFailure> RestartRemoteDevice();

    Result<Unit, ProtocolFailure> SetImageQuality(proto::peer::ImageQuality quality);
    Result<Unit, ProtocolFailure> SetCustomImageQuality(int32_t quality);
    Result<Unit, ProtocolFailure> SetCustomFps(uint32_t fps);
    Result<Unit, ProtocolFailure> SetShowRemoteCursor(bool show);
    Result<Unit, ProtocolFailure> SetBlockInput(bool block);
    Result<Unit, ProtocolFailure> SetLockAfterSession(bool lock);
    Result<Unit, ProtocolFailure> SetPrivacyMode(bool on);
    Result<Unit, ProtocolFailure> SetDisableClipboard(bool disable);
    Result<Unit, ProtocolFailure> SetDisableAudio(bool disable);
    Result<Unit, ProtocolFailure> SelectDisplay(int32_t display);

    // Local only; allowed in every state.
    void SetScaleMode(ScaleMode mode);

private:
    class ChannelEndpoint;

    RemoteDesktopClient(
        ClientConfig config,
        std::vector<uint8_t> server_key,
        std::shared_ptr<ITransportBridge> bridge,
        std::shared_ptr<ITimerScheduler> timers,
        std::shared_ptr<IClientEventHandler> events,
        std::shared_ptr<IPresentationSink> sink);

    // Channel callbacks, routed through ChannelEndpoint
    void HandleChannelOpen(ChannelKind kind);
    void HandleFrame(ChannelKind kind, std::span<const uint8_t> payload);
    void HandleChannelClosed(ChannelKind kind, const std::string& reason);
    void HandleChannelError(ChannelKind kind, const std::string& message);

    void HandleDiscoveryFrame(std::span<const uint8_t> payload);
    void HandleRelayFrame(std::span<const uint8_t> payload);
    void HandleRelayTicket(protocol::RelayTicket ticket);

    void Dispatch(protocol::PeerEvent event);
    void HandleIdentityProof(const proto::peer::SignedId& signed_id);
    void HandleHash(const proto::peer::Hash& hash);
    void HandleLoginResponse(const proto::peer::LoginResponse& response);
    void HandlePeerInfo(const proto::peer::PeerInfo& info);
    void HandleVideoFrame(const proto::peer::VideoFrame& frame);
    void HandleTestDelay(const proto::peer::TestDelay& delay);
    void HandleClipboard(const proto::peer::Clipboard& clipboard);

    void StartSession(const proto::peer::PeerInfo& info);
    void SendKeepAlive();

    Result<Unit, ProtocolFailure> OpenChannel(ChannelKind kind);
    void CloseChannel(ChannelKind kind);
    Result<Unit, ProtocolFailure> SendFramed(ChannelKind kind, std::span<const uint8_t> payload);
    Result<Unit, ProtocolFailure> SendPeer(const proto::peer::Message& message);
    Result<Unit, ProtocolFailure> SendControl(const proto::peer::Message& message);
    Result<Unit, ProtocolFailure> SendOption(const protocol::OptionPatch& patch);
    [[nodiscard]] Result<Unit, ProtocolFailure> RequireStreaming() const;

    TimerId ScheduleSessionTimer(
        std::chrono::milliseconds delay,
        bool repeating,
        void (RemoteDesktopClient::*handler)());
    void CancelTimer(TimerId& id);
    void OnDiscoveryTimeout();
    void OnHandshakeTimeout();
    void OnStatsTick();

    void TearDown();
    void EndSession(SessionState terminal_state, const std::string& reason);
    void Transition(SessionState next);
    void Log(const std::string& message);

    [[nodiscard]] std::string GenerateClientId() const;

    ClientConfig config_;
    std::vector<uint8_t> server_key_;
    std::shared_ptr<ITransportBridge> bridge_;
    std::shared_ptr<ITimerScheduler> timers_;
    std::shared_ptr<IClientEventHandler> events_;
    std::shared_ptr<IPresentationSink> sink_;

    SessionState state_ = SessionState::Idle;
    uint64_t sequence_id_ = 0;
    bool tearing_down_ = false;
    bool sink_started_ = false;

    std::shared_ptr<ChannelEndpoint> discovery_endpoint_;
    std::unique_ptr<ITransportChannel> discovery_channel_;
    std::shared_ptr<ChannelEndpoint> relay_endpoint_;
    std::unique_ptr<ITransportChannel> relay_channel_;

    std::optional<protocol::RelayTicket> ticket_;
    std::vector<uint8_t> peer_signing_key_;
    bool identity_verified_ = false;
    protocol::SecureChannel secure_channel_;

    std::string login_salt_;
    std::string login_challenge_;
    std::string client_id_;
    uint64_t login_session_id_ = 0;

    TimerId discovery_timer_ = interfaces::kInvalidTimerId;
    TimerId handshake_timer_ = interfaces::kInvalidTimerId;
    TimerId keep_alive_timer_ = interfaces::kInvalidTimerId;
    TimerId stats_timer_ = interfaces::kInvalidTimerId;

    uint64_t frames_sent_ = 0;
    uint64_t frames_received_ = 0;
    uint64_t bytes_sent_ = 0;
    uint64_t bytes_received_ = 0;
    uint64_t video_frames_ = 0;
    uint64_t audio_frames_ = 0;
    std::optional<std::chrono::milliseconds> last_latency_;
    std::optional<std::chrono::milliseconds> streaming_since_;
};

} // namespace rdlink::client
