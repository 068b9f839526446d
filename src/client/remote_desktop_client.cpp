#include "rdlink/client/remote_desktop_client.hpp"
#include "rdlink/core/constants.hpp"
#include "rdlink/core/format.hpp"
#include "rdlink/crypto/sodium_interop.hpp"
#include "rdlink/debug/session_logger.hpp"
#include "rdlink/protocol/constants.hpp"
#include "rdlink/protocol/frame_codec.hpp"
#include "rdlink/protocol/identity_verifier.hpp"
#include "rdlink/protocol/message_codec.hpp"
#include "rdlink/protocol/password_challenge.hpp"

#include <algorithm>
#include <utility>
#include <variant>

namespace rdlink::client {

using protocol::ErrorMessages;
using protocol::crypto::SodiumInterop;
using protocol::IdentityVerifier;
using protocol::MessageBuilder;
using protocol::MessageCodec;
using protocol::MiscFlag;
using protocol::OptionPatch;

namespace {

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::span<const uint8_t> AsBytes(const std::string& value) {
    return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

std::string ToBase36(uint64_t value) {
    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.push_back(kDigits[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace

// ============================================================================
// ChannelEndpoint
// ============================================================================

// Handler registered with the bridge for one channel. Owns the channel's frame
// decoder; once detached it drops every callback.
class RemoteDesktopClient::ChannelEndpoint final
    : public interfaces::ITransportChannelHandler,
      public std::enable_shared_from_this<ChannelEndpoint> {
public:
    ChannelEndpoint(RemoteDesktopClient* owner, const ChannelKind kind)
        : owner_(owner), kind_(kind) {}

    void Detach() noexcept {
        owner_ = nullptr;
        decoder_.Reset();
    }

    void OnOpen() override {
        if (owner_ != nullptr) {
            owner_->HandleChannelOpen(kind_);
        }
    }

    void OnMessage(std::span<const uint8_t> chunk) override {
        if (owner_ == nullptr) {
            return;
        }
        auto self = shared_from_this();
        const auto payloads = decoder_.Feed(chunk);
        for (const auto& payload : payloads) {
            if (owner_ == nullptr) {
                break;
            }
            owner_->HandleFrame(kind_, payload);
        }
    }

    void OnClose(const std::string& reason) override {
        if (owner_ != nullptr) {
            owner_->HandleChannelClosed(kind_, reason);
        }
    }

    void OnError(const std::string& message) override {
        if (owner_ != nullptr) {
            owner_->HandleChannelError(kind_, message);
        }
    }

private:
    RemoteDesktopClient* owner_;
    ChannelKind kind_;
    protocol::FrameDecoder decoder_;
};

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<RemoteDesktopClient>, ProtocolFailure> RemoteDesktopClient::Create(
    ClientConfig config,
    std::shared_ptr<ITransportBridge> bridge,
    std::shared_ptr<ITimerScheduler> timers,
    std::shared_ptr<IClientEventHandler> events,
    std::shared_ptr<IPresentationSink> sink) {

    using ResultType = Result<std::unique_ptr<RemoteDesktopClient>, ProtocolFailure>;

    if (!bridge || !timers || !events || !sink) {
        return ResultType::Err(
            ProtocolFailure::NullPointer("Transport bridge, timer scheduler, event handler and sink are required"));
    }
    auto valid = config.Validate();
    if (valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }

    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return ResultType::Err(ProtocolFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    auto key_result = IdentityVerifier::DecodeServerKey(config.server_key);
    if (key_result.IsErr()) {
        return ResultType::Err(std::move(key_result).UnwrapErr());
    }

    return ResultType::Ok(std::unique_ptr<RemoteDesktopClient>(new RemoteDesktopClient(
        std::move(config),
        std::move(key_result).Unwrap(),
        std::move(bridge),
        std::move(timers),
        std::move(events),
        std::move(sink))));
}

RemoteDesktopClient::RemoteDesktopClient(
    ClientConfig config,
    std::vector<uint8_t> server_key,
    std::shared_ptr<ITransportBridge> bridge,
    std::shared_ptr<ITimerScheduler> timers,
    std::shared_ptr<IClientEventHandler> events,
    std::shared_ptr<IPresentationSink> sink)
    : config_(std::move(config)),
      server_key_(std::move(server_key)),
      bridge_(std::move(bridge)),
      timers_(std::move(timers)),
      events_(std::move(events)),
      sink_(std::move(sink)) {}

RemoteDesktopClient::~RemoteDesktopClient() {
    tearing_down_ = true;
    TearDown();
}

// ============================================================================
// Session lifecycle
// ============================================================================

Result<Unit, ProtocolFailure> RemoteDesktopClient::Connect() {
    if (tearing_down_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Cannot connect while the previous session is being torn down"));
    }

    TearDown();
    ++sequence_id_;
    frames_sent_ = 0;
    frames_received_ = 0;
    bytes_sent_ = 0;
    bytes_received_ = 0;
    video_frames_ = 0;
    audio_frames_ = 0;
    last_latency_.reset();
    client_id_ = GenerateClientId();
    login_session_id_ = SodiumInterop::GenerateRandomUInt64(true);

    Transition(SessionState::Connecting);
    Log(compat::format("Connecting to {}", config_.target_id));

    auto opened = OpenChannel(ChannelKind::Discovery);
    if (opened.IsErr()) {
        EndSession(SessionState::Error, opened.UnwrapErr().message);
        return opened;
    }
    discovery_timer_ = ScheduleSessionTimer(
        config_.discovery_timeout, false, &RemoteDesktopClient::OnDiscoveryTimeout);
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::Authenticate(std::string_view password) {
    if (state_ != SessionState::WaitingPassword) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                compat::format("Cannot authenticate in state {}", ToString(state_))));
    }

    auto hash_result = protocol::PasswordChallenge::Respond(password, login_salt_, login_challenge_);
    if (hash_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(hash_result).UnwrapErr());
    }

    protocol::LoginIntent intent;
    intent.username = config_.target_id;
    intent.password_hash = std::move(hash_result).Unwrap();
    intent.my_id = client_id_;
    intent.my_name = config_.client_name;
    intent.my_platform = config_.platform;
    intent.version = config_.client_version;
    intent.session_id = login_session_id_;
    intent.image_quality = config_.image_quality;
    intent.custom_fps = static_cast<int32_t>(config_.custom_fps);
    intent.show_remote_cursor = config_.show_remote_cursor;
    intent.disable_audio = config_.disable_audio;
    intent.disable_clipboard = config_.disable_clipboard;
    intent.lock_after_session_end = config_.lock_after_session_end;

    Transition(SessionState::Authenticating);
    auto sent = SendPeer(MessageBuilder::LoginRequest(intent));
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(intent.password_hash));
    if (sent.IsErr() && state_ == SessionState::Authenticating) {
        Transition(SessionState::WaitingPassword);
    }
    return sent;
}

void RemoteDesktopClient::Disconnect() {
    if (state_ == SessionState::Disconnected) {
        return;
    }
    EndSession(SessionState::Disconnected, "Disconnected by user");
}

SessionStats RemoteDesktopClient::GetStats() const {
    SessionStats stats;
    stats.state = state_;
    stats.sequence_id = sequence_id_;
    stats.frames_sent = frames_sent_;
    stats.frames_received = frames_received_;
    stats.bytes_sent = bytes_sent_;
    stats.bytes_received = bytes_received_;
    stats.video_frames = video_frames_;
    stats.audio_frames = audio_frames_;
    stats.send_counter = secure_channel_.SendCounter();
    stats.receive_counter = secure_channel_.ReceiveCounter();
    stats.last_latency = last_latency_;
    if (streaming_since_) {
        stats.uptime = timers_->Now() - *streaming_since_;
    }
    return stats;
}

// ============================================================================
// Channel events
// ============================================================================

void RemoteDesktopClient::HandleChannelOpen(const ChannelKind kind) {
    if (kind == ChannelKind::Discovery) {
        if (state_ != SessionState::Connecting) {
            return;
        }
        Log("Discovery channel open, requesting relay");
        auto serialized = MessageCodec::SerializeDiscovery(MessageBuilder::PunchHoleRequest(
            config_.target_id, config_.server_key, true, config_.client_version));
        if (serialized.IsErr()) {
            EndSession(SessionState::Error, serialized.UnwrapErr().message);
            return;
        }
        auto sent = SendFramed(ChannelKind::Discovery, serialized.Unwrap());
        if (sent.IsErr()) {
            EndSession(SessionState::Disconnected, sent.UnwrapErr().message);
        }
        return;
    }

    if (!ticket_) {
        return;
    }
    Log(compat::format("Relay channel open, joining {}", ticket_->relay_server));
    auto serialized = MessageCodec::SerializeDiscovery(MessageBuilder::RequestRelay(
        config_.target_id, ticket_->uuid, ticket_->relay_server, config_.server_key));
    if (serialized.IsErr()) {
        EndSession(SessionState::Error, serialized.UnwrapErr().message);
        return;
    }
    auto sent = SendFramed(ChannelKind::Relay, serialized.Unwrap());
    if (sent.IsErr()) {
        EndSession(SessionState::Disconnected, sent.UnwrapErr().message);
    }
}

void RemoteDesktopClient::HandleFrame(const ChannelKind kind, std::span<const uint8_t> payload) {
    ++frames_received_;
    bytes_received_ += payload.size();
    if (kind == ChannelKind::Discovery) {
        HandleDiscoveryFrame(payload);
    } else {
        HandleRelayFrame(payload);
    }
}

void RemoteDesktopClient::HandleChannelClosed(const ChannelKind kind, const std::string& reason) {
    if (IsTerminal(state_)) {
        return;
    }
    EndSession(SessionState::Disconnected,
               compat::format("{} channel closed: {}", interfaces::ToString(kind), reason));
}

void RemoteDesktopClient::HandleChannelError(const ChannelKind kind, const std::string& message) {
    if (IsTerminal(state_)) {
        return;
    }
    EndSession(SessionState::Disconnected,
               compat::format("{} channel error: {}", interfaces::ToString(kind), message));
}

// ============================================================================
// Discovery
// ============================================================================

void RemoteDesktopClient::HandleDiscoveryFrame(std::span<const uint8_t> payload) {
    if (state_ != SessionState::Connecting || ticket_) {
        return;
    }

    auto parsed = MessageCodec::ParseDiscovery(payload);
    if (parsed.IsErr()) {
        Log(compat::format("Ignoring malformed discovery reply: {}", parsed.UnwrapErr().message));
        return;
    }

    auto outcome = MessageCodec::InterpretDiscovery(parsed.Unwrap());
    if (!outcome) {
        return;
    }
    CancelTimer(discovery_timer_);

    if (const auto* rejection = std::get_if<protocol::DiscoveryRejection>(&*outcome)) {
        EndSession(SessionState::Error, rejection->reason);
        return;
    }
    HandleRelayTicket(std::get<protocol::RelayTicket>(std::move(*outcome)));
}

void RemoteDesktopClient::HandleRelayTicket(protocol::RelayTicket ticket) {
    auto key_result = IdentityVerifier::ResolvePeerSigningKey(
        AsBytes(ticket.signed_peer_pk), server_key_, config_.target_id);
    if (key_result.IsErr()) {
        EndSession(SessionState::Error, key_result.UnwrapErr().message);
        return;
    }
    peer_signing_key_ = std::move(key_result).Unwrap();
    RDL_DEBUG_PUBLIC_KEY(debug::Stage::Discovery, "peer_signing_key", peer_signing_key_);

    Log(compat::format("Relay assigned: {}", ticket.relay_server));
    ticket_ = std::move(ticket);
    CloseChannel(ChannelKind::Discovery);

    auto opened = OpenChannel(ChannelKind::Relay);
    if (opened.IsErr()) {
        EndSession(SessionState::Error, opened.UnwrapErr().message);
        return;
    }
    // Covers the relay open, the identity proof and the first login message.
    handshake_timer_ = ScheduleSessionTimer(
        config_.handshake_timeout, false, &RemoteDesktopClient::OnHandshakeTimeout);
}

void RemoteDesktopClient::OnDiscoveryTimeout() {
    discovery_timer_ = interfaces::kInvalidTimerId;
    if (state_ != SessionState::Connecting || ticket_) {
        return;
    }
    EndSession(SessionState::Error,
               compat::format("Discovery timed out after {} ms", config_.discovery_timeout.count()));
}

void RemoteDesktopClient::OnHandshakeTimeout() {
    handshake_timer_ = interfaces::kInvalidTimerId;
    if (state_ != SessionState::Connecting) {
        return;
    }
    EndSession(SessionState::Error,
               compat::format("Handshake timed out after {} ms", config_.handshake_timeout.count()));
}

// ============================================================================
// Relay stream
// ============================================================================

void RemoteDesktopClient::HandleRelayFrame(std::span<const uint8_t> payload) {
    auto plaintext = secure_channel_.ProcessIncoming(payload);
    if (plaintext.IsErr()) {
        EndSession(SessionState::Disconnected,
                   compat::format("Decryption failed: {}", plaintext.UnwrapErr().message));
        return;
    }

    auto parsed = MessageCodec::ParsePeer(plaintext.Unwrap());
    if (parsed.IsErr()) {
        Log(compat::format("Ignoring undecodable peer message: {}", parsed.UnwrapErr().message));
        return;
    }
    Dispatch(MessageCodec::ToPeerEvent(std::move(parsed).Unwrap()));
}

void RemoteDesktopClient::Dispatch(protocol::PeerEvent event) {
    if (!identity_verified_) {
        if (const auto* signed_id = std::get_if<proto::peer::SignedId>(&event)) {
            HandleIdentityProof(*signed_id);
        } else if (!std::holds_alternative<protocol::UnknownPeerMessage>(event)) {
            EndSession(SessionState::Error, "Peer sent a message before proving its identity");
        }
        return;
    }

    const bool streaming = state_ == SessionState::Streaming;
    std::visit(Overloaded{
        [this](const proto::peer::SignedId&) {
            Log("Ignoring repeated identity proof");
        },
        [this](const proto::peer::PublicKey&) {
            Log("Ignoring unexpected key exchange message");
        },
        [this](const proto::peer::Hash& hash) { HandleHash(hash); },
        [this](const proto::peer::LoginResponse& response) { HandleLoginResponse(response); },
        [this](const proto::peer::PeerInfo& info) { HandlePeerInfo(info); },
        [this, streaming](const proto::peer::VideoFrame& frame) {
            if (streaming) {
                HandleVideoFrame(frame);
            }
        },
        [this, streaming](const proto::peer::AudioFrame& frame) {
            if (streaming) {
                ++audio_frames_;
                sink_->OnAudioFrame(AsBytes(frame.data()));
            }
        },
        [this, streaming](const proto::peer::AudioFormat& format) {
            if (streaming) {
                sink_->OnAudioFormat(format.sample_rate(), format.channels());
            }
        },
        [this, streaming](const proto::peer::CursorData& cursor) {
            if (streaming) {
                sink_->OnCursorData(cursor);
            }
        },
        [this, streaming](const proto::peer::CursorPosition& position) {
            if (streaming) {
                sink_->OnCursorPosition(position.x(), position.y());
            }
        },
        [this, streaming](const protocol::CursorIdNotice& notice) {
            if (streaming) {
                sink_->OnCursorId(notice.id);
            }
        },
        [this, streaming](const proto::peer::Clipboard& clipboard) {
            if (streaming) {
                HandleClipboard(clipboard);
            }
        },
        [this](const proto::peer::TestDelay& delay) { HandleTestDelay(delay); },
        [this](const proto::peer::MessageBox& box) {
            Log(compat::format("Remote message [{}] {}: {}", box.msgtype(), box.title(), box.text()));
        },
        [this, streaming](const proto::peer::ChatMessage& chat) {
            if (streaming) {
                events_->OnChat(chat.text());
            }
        },
        [this, streaming](const proto::peer::OptionMessage& option) {
            if (streaming) {
                events_->OnOptionNotice(option);
            }
        },
        [this, streaming](const proto::peer::PermissionInfo& permission) {
            if (streaming) {
                events_->OnPermissionNotice(permission);
            }
        },
        [this, streaming](const proto::peer::SwitchDisplay& display) {
            if (streaming) {
                sink_->OnSwitchDisplay(display);
            }
        },
        [this](const protocol::CloseNotice& notice) {
            EndSession(SessionState::Disconnected,
                       std::string(protocol::kRemoteClosePrefix) + notice.reason);
        },
        [](const protocol::UnknownPeerMessage&) {}
    }, event);
}

void RemoteDesktopClient::HandleIdentityProof(const proto::peer::SignedId& signed_id) {
    auto identity_result = IdentityVerifier::ParseIdentityProof(
        AsBytes(signed_id.id()), peer_signing_key_, config_.target_id);
    if (identity_result.IsErr()) {
        EndSession(SessionState::Error, identity_result.UnwrapErr().message);
        return;
    }
    const protocol::PeerIdentity identity = std::move(identity_result).Unwrap();
    RDL_DEBUG_PUBLIC_KEY(debug::Stage::Handshake, "peer_ephemeral_key", identity.ephemeral_public_key);

    auto generated = secure_channel_.GenerateLocalKeyMaterial();
    if (generated.IsErr()) {
        EndSession(SessionState::Error, generated.UnwrapErr().message);
        return;
    }
    auto material_result = secure_channel_.SealSymmetricKey(identity.ephemeral_public_key);
    if (material_result.IsErr()) {
        EndSession(SessionState::Error, material_result.UnwrapErr().message);
        return;
    }
    const protocol::KeyExchangeMaterial material = std::move(material_result).Unwrap();

    auto sent = SendPeer(MessageBuilder::KeyExchange(material.local_public_key, material.sealed_key));
    if (sent.IsErr()) {
        if (!IsTerminal(state_)) {
            EndSession(SessionState::Error, sent.UnwrapErr().message);
        }
        return;
    }

    auto enabled = secure_channel_.Enable();
    if (enabled.IsErr()) {
        EndSession(SessionState::Error, enabled.UnwrapErr().message);
        return;
    }
    identity_verified_ = true;
    Log(compat::format("Secure channel established with {}", identity.peer_id));
}

// ============================================================================
// Login
// ============================================================================

void RemoteDesktopClient::HandleHash(const proto::peer::Hash& hash) {
    if (state_ == SessionState::Streaming) {
        return;
    }
    login_salt_ = hash.salt();
    login_challenge_ = hash.challenge();
    if (state_ == SessionState::Connecting) {
        CancelTimer(handshake_timer_);
        Transition(SessionState::WaitingPassword);
        events_->OnPasswordRequired();
    }
}

void RemoteDesktopClient::HandleLoginResponse(const proto::peer::LoginResponse& response) {
    if (state_ != SessionState::Authenticating) {
        Log(compat::format("Ignoring login response in state {}", ToString(state_)));
        return;
    }
    if (response.union_case() == proto::peer::LoginResponse::kError) {
        Log(compat::format("Login rejected: {}", response.error()));
        Transition(SessionState::WaitingPassword);
        events_->OnLoginError(response.error());
        return;
    }

    Log("Login successful");
    events_->OnPeerInfo(response.peer_info());
    StartSession(response.peer_info());
}

void RemoteDesktopClient::HandlePeerInfo(const proto::peer::PeerInfo& info) {
    events_->OnPeerInfo(info);
    if (state_ == SessionState::WaitingPassword || state_ == SessionState::Connecting) {
        Log("No password required");
        CancelTimer(handshake_timer_);
        StartSession(info);
    }
}

void RemoteDesktopClient::StartSession(const proto::peer::PeerInfo& info) {
    Transition(SessionState::Streaming);
    if (state_ != SessionState::Streaming) {
        return;
    }
    streaming_since_ = timers_->Now();
    sink_->Start();
    sink_started_ = true;
    sink_->SetScaleMode(config_.scale_mode);
    keep_alive_timer_ = ScheduleSessionTimer(
        config_.keep_alive_interval, true, &RemoteDesktopClient::SendKeepAlive);
    stats_timer_ = ScheduleSessionTimer(
        config_.stats_interval, true, &RemoteDesktopClient::OnStatsTick);
    Log(compat::format("Session started with {} ({}, {} display(s))",
                       info.hostname(), info.platform(), info.displays_size()));
}

// ============================================================================
// Streaming
// ============================================================================

void RemoteDesktopClient::HandleVideoFrame(const proto::peer::VideoFrame& frame) {
    ++video_frames_;
    if (SendPeer(MessageBuilder::Misc(MiscFlag::VideoReceived)).IsErr()) {
        return;
    }

    const protocol::VideoCodec codec = protocol::VideoCodecOf(frame);
    for (const auto* encoded : protocol::EncodedFramesOf(frame)) {
        sink_->OnVideoFrame(codec, AsBytes(encoded->data()), encoded->key(), encoded->pts(), frame.display());
    }
}

void RemoteDesktopClient::HandleTestDelay(const proto::peer::TestDelay& delay) {
    if (delay.from_client()) {
        const auto sent_at = std::chrono::milliseconds(delay.time());
        const auto round_trip = std::max(timers_->Now() - sent_at, std::chrono::milliseconds(0));
        last_latency_ = round_trip;
        events_->OnLatency(round_trip);
        return;
    }

    proto::peer::Message echo;
    *echo.mutable_test_delay() = delay;
    (void)SendPeer(echo);
}

void RemoteDesktopClient::HandleClipboard(const proto::peer::Clipboard& clipboard) {
    if (config_.disable_clipboard) {
        return;
    }
    if (clipboard.compress()) {
        Log("Ignoring compressed clipboard update");
        return;
    }
    events_->OnClipboard(clipboard.content());
}

void RemoteDesktopClient::SendKeepAlive() {
    if (state_ != SessionState::Streaming) {
        return;
    }
    (void)SendPeer(MessageBuilder::TestDelay(timers_->Now().count(), true));
}

void RemoteDesktopClient::OnStatsTick() {
    if (state_ == SessionState::Streaming) {
        events_->OnStats(GetStats());
    }
}

// ============================================================================
// Controls
// ============================================================================

Result<Unit, ProtocolFailure> RemoteDesktopClient::SendClipboard(std::string_view text) {
    return SendControl(MessageBuilder::Clipboard(text));
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SendChat(std::string_view text) {
    return SendControl(MessageBuilder::ChatMessage(text));
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SendCtrlAltDel() {
    return SendControl(MessageBuilder::ControlKeyShortcut(proto::peer::CtrlAltDel));
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SendLockScreen() {
    return SendControl(MessageBuilder::ControlKeyShortcut(proto::peer::LockScreen));
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SendMouseEvent(
    const int32_t mask,
    const int32_t x,
    const int32_t y,
    std::span<const proto::peer::ControlKey> modifiers) {
    return SendControl(MessageBuilder::MouseEvent(mask, x, y, modifiers));
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SendKeyEvent(const proto::peer::KeyEvent& event) {
    proto::peer::Message message;
    *message.mutable_key_event() = event;
    return SendControl(message);
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::RefreshScreen() {
    return SendControl(MessageBuilder::Misc(MiscFlag::RefreshVideo));
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::RestartRemoteDevice() {
    return SendControl(MessageBuilder::Misc(MiscFlag::RestartRemoteDevice));
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SetImageQuality(const proto::peer::ImageQuality quality) {
    OptionPatch patch;
    patch.image_quality = quality;
    RDL_TRY(SendOption(patch));
    config_.image_quality = quality;
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SetCustomImageQuality(const int32_t quality) {
    if (quality < 1 || quality > static_cast<int32_t>(protocol::kMaxCustomImageQuality)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Custom image quality must be between 1 and {}, got {}",
                               protocol::kMaxCustomImageQuality, quality)));
    }
    OptionPatch patch;
    patch.custom_image_quality = quality;
    return SendOption(patch);
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SetCustomFps(const uint32_t fps) {
    if (fps == 0 || fps > protocol::kMaxCustomFps) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Custom FPS must be between 1 and {}, got {}", protocol::kMaxCustomFps, fps)));
    }
    OptionPatch patch;
    patch.custom_fps = static_cast<int32_t>(fps);
    RDL_TRY(SendOption(patch));
    config_.custom_fps = fps;
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SetShowRemoteCursor(const bool show) {
    OptionPatch patch;
    patch.show_remote_cursor = show;
    RDL_TRY(SendOption(patch));
    config_.show_remote_cursor = show;
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SetBlockInput(const bool block) {
    OptionPatch patch;
    patch.block_input = block;
    return SendOption(patch);
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SetLockAfterSession(const bool lock) {
    OptionPatch patch;
    patch.lock_after_session_end = lock;
    RDL_TRY(SendOption(patch));
    config_.lock_after_session_end = lock;
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SetPrivacyMode(const bool on) {
    return SendControl(MessageBuilder::TogglePrivacyMode(on));
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SetDisableClipboard(const bool disable) {
    OptionPatch patch;
    patch.disable_clipboard = disable;
    RDL_TRY(SendOption(patch));
    config_.disable_clipboard = disable;
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SetDisableAudio(const bool disable) {
    OptionPatch patch;
    patch.disable_audio = disable;
    RDL_TRY(SendOption(patch));
    config_.disable_audio = disable;
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SelectDisplay(const int32_t display) {
    if (display < 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(compat::format("Display index must not be negative, got {}", display)));
    }
    return SendControl(MessageBuilder::SwitchDisplay(display));
}

void RemoteDesktopClient::SetScaleMode(const ScaleMode mode) {
    config_.scale_mode = mode;
    sink_->SetScaleMode(mode);
}

// ============================================================================
// Outbound plumbing
// ============================================================================

Result<Unit, ProtocolFailure> RemoteDesktopClient::OpenChannel(const ChannelKind kind) {
    auto endpoint = std::make_shared<ChannelEndpoint>(this, kind);
    auto opened = bridge_->Open(kind, endpoint);
    if (opened.IsErr()) {
        endpoint->Detach();
        return Result<Unit, ProtocolFailure>::Err(std::move(opened).UnwrapErr());
    }
    RDL_DEBUG_MSG(debug::Stage::Relay, interfaces::ToString(kind));
    if (kind == ChannelKind::Discovery) {
        discovery_endpoint_ = std::move(endpoint);
        discovery_channel_ = std::move(opened).Unwrap();
    } else {
        relay_endpoint_ = std::move(endpoint);
        relay_channel_ = std::move(opened).Unwrap();
    }
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

void RemoteDesktopClient::CloseChannel(const ChannelKind kind) {
    auto& endpoint = kind == ChannelKind::Discovery ? discovery_endpoint_ : relay_endpoint_;
    auto& channel = kind == ChannelKind::Discovery ? discovery_channel_ : relay_channel_;
    if (endpoint) {
        endpoint->Detach();
        endpoint.reset();
    }
    if (channel) {
        std::unique_ptr<ITransportChannel> closing = std::move(channel);
        closing->Close();
    }
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SendFramed(
    const ChannelKind kind,
    std::span<const uint8_t> payload) {

    ITransportChannel* channel = kind == ChannelKind::Discovery
        ? discovery_channel_.get()
        : relay_channel_.get();
    if (channel == nullptr) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(
                compat::format("The {} channel is not open", interfaces::ToString(kind))));
    }

    auto frame_result = protocol::FrameCodec::Encode(payload);
    if (frame_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(frame_result).UnwrapErr());
    }
    const std::vector<uint8_t> frame = std::move(frame_result).Unwrap();
    RDL_TRY(channel->Send(frame));
    ++frames_sent_;
    bytes_sent_ += frame.size();
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SendPeer(const proto::peer::Message& message) {
    auto serialized = MessageCodec::SerializePeer(message);
    if (serialized.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(serialized).UnwrapErr());
    }

    auto outgoing = secure_channel_.ProcessOutgoing(serialized.Unwrap());
    if (outgoing.IsErr()) {
        ProtocolFailure failure = std::move(outgoing).UnwrapErr();
        EndSession(SessionState::Disconnected, failure.message);
        return Result<Unit, ProtocolFailure>::Err(std::move(failure));
    }

    auto sent = SendFramed(ChannelKind::Relay, outgoing.Unwrap());
    if (sent.IsErr() && sent.UnwrapErr().type == protocol::ProtocolFailureType::Transport) {
        EndSession(SessionState::Disconnected, sent.UnwrapErr().message);
    }
    return sent;
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SendControl(const proto::peer::Message& message) {
    RDL_TRY(RequireStreaming());
    return SendPeer(message);
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::SendOption(const OptionPatch& patch) {
    return SendControl(MessageBuilder::OptionChange(patch));
}

Result<Unit, ProtocolFailure> RemoteDesktopClient::RequireStreaming() const {
    if (state_ != SessionState::Streaming) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::NOT_STREAMING)));
    }
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

// ============================================================================
// Timers and teardown
// ============================================================================

TimerId RemoteDesktopClient::ScheduleSessionTimer(
    const std::chrono::milliseconds delay,
    const bool repeating,
    void (RemoteDesktopClient::*handler)()) {

    const uint64_t sequence = sequence_id_;
    auto callback = [this, sequence, handler]() {
        if (sequence == sequence_id_) {
            (this->*handler)();
        }
    };
    return repeating
        ? timers_->ScheduleRepeating(delay, std::move(callback))
        : timers_->ScheduleOnce(delay, std::move(callback));
}

void RemoteDesktopClient::CancelTimer(TimerId& id) {
    if (id != interfaces::kInvalidTimerId) {
        timers_->Cancel(id);
        id = interfaces::kInvalidTimerId;
    }
}

void RemoteDesktopClient::TearDown() {
    CancelTimer(discovery_timer_);
    CancelTimer(handshake_timer_);
    CancelTimer(keep_alive_timer_);
    CancelTimer(stats_timer_);

    CloseChannel(ChannelKind::Discovery);
    CloseChannel(ChannelKind::Relay);

    if (sink_started_) {
        sink_started_ = false;
        sink_->Release();
    }

    secure_channel_ = protocol::SecureChannel();
    identity_verified_ = false;
    ticket_.reset();
    peer_signing_key_.clear();
    login_salt_.clear();
    login_challenge_.clear();
    streaming_since_.reset();
}

void RemoteDesktopClient::EndSession(const SessionState terminal_state, const std::string& reason) {
    if (tearing_down_) {
        return;
    }
    tearing_down_ = true;
    TearDown();
    Transition(terminal_state);
    tearing_down_ = false;

    Log(reason);
    if (terminal_state == SessionState::Error) {
        events_->OnError(reason);
    } else {
        events_->OnDisconnected(reason);
    }
}

void RemoteDesktopClient::Transition(const SessionState next) {
    if (next == state_) {
        return;
    }
    const SessionState previous = state_;
    state_ = next;
    RDL_DEBUG_TRANSITION(ToString(previous), ToString(next));
    events_->OnStateChanged(next, previous);
}

void RemoteDesktopClient::Log(const std::string& message) {
    RDL_DEBUG_MSG(debug::Stage::Session, message);
    events_->OnLog(message);
}

std::string RemoteDesktopClient::GenerateClientId() const {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return config_.client_id_prefix + ToBase36(static_cast<uint64_t>(now.count()));
}

} // namespace rdlink::client
