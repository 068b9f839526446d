#include <catch2/catch_test_macros.hpp>
#include "rdlink/client/remote_desktop_client.hpp"
#include "rdlink/protocol/frame_codec.hpp"
#include "rdlink/protocol/message_builder.hpp"
#include "rdlink/protocol/message_codec.hpp"
#include "rdlink/protocol/constants.hpp"
#include "helpers/session_harness.hpp"
#include <algorithm>
#include <string>
#include <utility>
using namespace rdlink;
using namespace rdlink::test_helpers;
using client::SessionState;
using protocol::MessageCodec;
namespace {
template<typename Pred>
size_t CountMatching(const std::vector<proto::peer::Message>& messages, Pred pred) {
    return static_cast<size_t>(std::count_if(messages.begin(), messages.end(), pred));
}
std::string AsString(const std::vector<uint8_t>& bytes) {
    return {bytes.begin(), bytes.end()};
}
}
TEST_CASE("Remote session - Password login reaches streaming", "[integration][session]") {
    SessionHarness harness;
    SECTION("Discovery request names the target and forces relay") {
        harness.ReachDiscovery();
        auto request = MessageCodec::ParseDiscovery(harness.Discovery()->SentPayloads()[0]);
        REQUIRE(request.IsOk());
        const auto& punch = request.Unwrap().punch_hole_request();
        REQUIRE(punch.id() == kTargetId);
        REQUIRE(punch.licence_key() == harness.config.server_key);
        REQUIRE(punch.force_relay());
        REQUIRE(harness.client->State() == SessionState::Connecting);
    }
    SECTION("Relay join echoes the ticket") {
        harness.ReachRelay();
        auto request = MessageCodec::ParseDiscovery(harness.Relay()->SentPayloads()[0]);
        REQUIRE(request.IsOk());
        const auto& relay = request.Unwrap().request_relay();
        REQUIRE(relay.id() == kTargetId);
        REQUIRE(relay.relay_server() == kRelayServer);
        REQUIRE(relay.uuid().empty());
    }
    SECTION("Relay response ticket carries its uuid through") {
        harness.ReachDiscovery();
        harness.Discovery()->Deliver(harness.peer.RelayResponseTicket(kRelayServer, "uuid-42"));
        REQUIRE(harness.Relay() != nullptr);
        harness.Relay()->Open();
        auto request = MessageCodec::ParseDiscovery(harness.Relay()->SentPayloads()[0]);
        REQUIRE(request.Unwrap().request_relay().uuid() == "uuid-42");
    }
    SECTION("Key exchange travels in the clear, then everything is sealed") {
        harness.ReachSecureChannel();
        auto exchange = MessageCodec::ParsePeer(harness.Relay()->SentPayloads()[1]);
        REQUIRE(exchange.IsOk());
        REQUIRE(exchange.Unwrap().has_public_key());
        REQUIRE(harness.peer.HasSessionKey());
        REQUIRE(harness.client->State() == SessionState::Connecting);
    }
    SECTION("Full login") {
        harness.ReachPasswordPrompt();
        REQUIRE(harness.events->password_prompts == 1);
        REQUIRE(harness.client->Authenticate(kPassword).IsOk());
        auto sent = harness.DrainClientMessages();
        REQUIRE(sent.size() == 1);
        const auto& login = sent[0].login_request();
        REQUIRE(login.username() == kTargetId);
        REQUIRE(AsString(ScriptedRemotePeer::ExpectedPasswordHash(kPassword, kSalt, kChallenge)) == login.password());
        REQUIRE(login.my_id().rfind(std::string(protocol::kDefaultClientIdPrefix), 0) == 0);
        REQUIRE(login.session_id() != 0);
        REQUIRE(login.option().custom_fps() == 30);
        harness.DeliverSealed(ScriptedRemotePeer::LoginAccepted("remote-host"));
        REQUIRE(harness.client->State() == SessionState::Streaming);
        REQUIRE(harness.events->peer_infos.size() == 1);
        REQUIRE(harness.events->peer_infos[0].hostname() == "remote-host");
        REQUIRE(harness.sink->starts == 1);
        REQUIRE(harness.sink->scale_modes.back() == interfaces::ScaleMode::Fit);
        const std::vector<std::pair<SessionState, SessionState>> expected = {
            {SessionState::Idle, SessionState::Connecting},
            {SessionState::Connecting, SessionState::WaitingPassword},
            {SessionState::WaitingPassword, SessionState::Authenticating},
            {SessionState::Authenticating, SessionState::Streaming}};
        REQUIRE(harness.events->transitions == expected);
    }
}
TEST_CASE("Remote session - Discovery failures", "[integration][discovery]") {
    SessionHarness harness;
    harness.ReachDiscovery();
    SECTION("Unknown device ends in error") {
        harness.Discovery()->Deliver(ScriptedRemotePeer::PunchHoleFailure(proto::discovery::PunchHoleResponse::ID_NOT_EXIST));
        REQUIRE(harness.client->State() == SessionState::Error);
        REQUIRE(harness.events->errors == std::vector<std::string>{"Device not found"});
        REQUIRE(harness.Discovery()->closed);
        REQUIRE(harness.bridge->CountOpened(ChannelKind::Relay) == 0);
    }
    SECTION("Offline device") {
        harness.Discovery()->Deliver(ScriptedRemotePeer::PunchHoleFailure(proto::discovery::PunchHoleResponse::OFFLINE));
        REQUIRE(harness.events->errors.back() == "Device offline");
    }
    SECTION("Discovery timeout") {
        harness.timers->Advance(std::chrono::milliseconds(29'999));
        REQUIRE(harness.client->State() == SessionState::Connecting);
        harness.timers->Advance(std::chrono::milliseconds(1));
        REQUIRE(harness.client->State() == SessionState::Error);
        REQUIRE(harness.events->errors.back() == "Discovery timed out after 30000 ms");
    }
    SECTION("Malformed reply is ignored") {
        const std::vector<uint8_t> junk = {0xFF, 0xFF, 0xFF, 0x0F};
        harness.Discovery()->Deliver(protocol::FrameCodec::Encode(junk).Unwrap());
        REQUIRE(harness.client->State() == SessionState::Connecting);
    }
    SECTION("Discovery channel dropping disconnects") {
        harness.Discovery()->RemoteClose("server went away");
        REQUIRE(harness.client->State() == SessionState::Disconnected);
        REQUIRE(harness.events->disconnects.back() == "discovery channel closed: server went away");
    }
}
TEST_CASE("Remote session - Login variations", "[integration][login]") {
    SessionHarness harness;
    SECTION("Device without a password starts on peer info") {
        harness.ReachPasswordPrompt();
        harness.DeliverSealed(ScriptedRemotePeer::PeerInfoOnly("kiosk"));
        REQUIRE(harness.client->State() == SessionState::Streaming);
        REQUIRE(harness.events->peer_infos.size() == 1);
        REQUIRE_FALSE(harness.events->Visited(SessionState::Authenticating));
    }
    SECTION("Wrong password returns to the prompt and a retry succeeds") {
        harness.ReachPasswordPrompt();
        REQUIRE(harness.client->Authenticate("wrong").IsOk());
        harness.DeliverSealed(ScriptedRemotePeer::LoginRejected("Wrong Password"));
        REQUIRE(harness.client->State() == SessionState::WaitingPassword);
        REQUIRE(harness.events->login_errors == std::vector<std::string>{"Wrong Password"});
        REQUIRE(harness.events->password_prompts == 1);
        REQUIRE(harness.client->Authenticate(kPassword).IsOk());
        auto sent = harness.DrainClientMessages();
        REQUIRE(sent.size() == 2);
        REQUIRE(sent[0].login_request().password() != sent[1].login_request().password());
        REQUIRE(AsString(ScriptedRemotePeer::ExpectedPasswordHash(kPassword, kSalt, kChallenge)) ==
                sent[1].login_request().password());
        harness.DeliverSealed(ScriptedRemotePeer::LoginAccepted("remote-host"));
        REQUIRE(harness.client->State() == SessionState::Streaming);
    }
    SECTION("Authenticate outside the prompt is refused") {
        auto early = harness.client->Authenticate(kPassword);
        REQUIRE(early.IsErr());
        REQUIRE(early.UnwrapErr().type == protocol::ProtocolFailureType::InvalidState);
        harness.ReachStreaming();
        REQUIRE(harness.client->Authenticate(kPassword).IsErr());
    }
    SECTION("Login response outside authentication is ignored") {
        harness.ReachPasswordPrompt();
        harness.DeliverSealed(ScriptedRemotePeer::LoginAccepted("remote-host"));
        REQUIRE(harness.client->State() == SessionState::WaitingPassword);
        REQUIRE(harness.sink->starts == 0);
    }
    SECTION("Handshake timeout before the identity proof") {
        harness.ReachRelay();
        harness.timers->Advance(std::chrono::milliseconds(30'000));
        REQUIRE(harness.client->State() == SessionState::Error);
        REQUIRE(harness.events->errors.back() == "Handshake timed out after 30000 ms");
        REQUIRE(harness.Relay()->closed);
    }
    SECTION("Relay channel that never opens times out") {
        harness.ReachDiscovery();
        harness.Discovery()->Deliver(harness.peer.PunchHoleTicket(kRelayServer));
        REQUIRE(harness.Relay() != nullptr);
        harness.timers->Advance(std::chrono::milliseconds(30'000));
        REQUIRE(harness.client->State() == SessionState::Error);
        REQUIRE(harness.events->errors.back() == "Handshake timed out after 30000 ms");
        REQUIRE(harness.Relay()->closed);
    }
    SECTION("Silent device after the key exchange times out") {
        harness.ReachSecureChannel();
        harness.timers->Advance(std::chrono::milliseconds(30'000));
        REQUIRE(harness.client->State() == SessionState::Error);
        REQUIRE(harness.events->errors.back() == "Handshake timed out after 30000 ms");
        REQUIRE(harness.timers->PendingCount() == 0);
    }
    SECTION("Password challenge cancels the handshake timer") {
        harness.ReachPasswordPrompt();
        harness.timers->Advance(std::chrono::milliseconds(60'000));
        REQUIRE(harness.client->State() == SessionState::WaitingPassword);
        REQUIRE(harness.timers->PendingCount() == 0);
    }
    SECTION("Device without a password starts right after the key exchange") {
        harness.ReachSecureChannel();
        harness.DeliverSealed(ScriptedRemotePeer::PeerInfoOnly("kiosk"));
        REQUIRE(harness.client->State() == SessionState::Streaming);
        REQUIRE(harness.events->peer_infos.size() == 1);
        REQUIRE(harness.events->password_prompts == 0);
        REQUIRE(harness.sink->starts == 1);
        harness.timers->Advance(std::chrono::milliseconds(30'000));
        REQUIRE(harness.client->State() == SessionState::Streaming);
    }
}
TEST_CASE("Remote session - Streaming traffic", "[integration][streaming]") {
    SessionHarness harness;
    harness.ReachStreaming();
    SECTION("Video frames are acknowledged and handed to the sink") {
        harness.DeliverSealed(ScriptedRemotePeer::H264Frame("nal-units", true, 33));
        auto sent = harness.DrainClientMessages();
        REQUIRE(CountMatching(sent, [](const auto& m) { return m.misc().video_received(); }) == 1);
        REQUIRE(harness.sink->video_frames.size() == 1);
        const auto& frame = harness.sink->video_frames[0];
        REQUIRE(frame.codec == protocol::VideoCodec::H264);
        REQUIRE(AsString(frame.data) == "nal-units");
        REQUIRE(frame.key_frame);
        REQUIRE(frame.pts == 33);
        REQUIRE(harness.client->GetStats().video_frames == 1);
    }
    SECTION("Large video frame split across seven chunks") {
        std::string data(10 * 1024, '\0');
        for (size_t i = 0; i < data.size(); ++i) {
            data[i] = static_cast<char>(i * 31 + 7);
        }
        const auto frame = harness.peer.SealedFrame(ScriptedRemotePeer::H264Frame(data, false, 90));
        const size_t cuts[] = {1, 2, 700, 3000, 3001, 9000};
        size_t offset = 0;
        for (const size_t cut : cuts) {
            harness.Relay()->Deliver(std::span<const uint8_t>(frame.data() + offset, cut - offset));
            REQUIRE(harness.sink->video_frames.empty());
            offset = cut;
        }
        harness.Relay()->Deliver(std::span<const uint8_t>(frame.data() + offset, frame.size() - offset));
        REQUIRE(harness.sink->video_frames.size() == 1);
        REQUIRE(AsString(harness.sink->video_frames[0].data) == data);
    }
    SECTION("Keep-alive probes and stats ticks") {
        harness.timers->Advance(std::chrono::milliseconds(3'000));
        REQUIRE(harness.events->stats_reports.size() == 3);
        REQUIRE(harness.events->stats_reports.back().state == SessionState::Streaming);
        REQUIRE(harness.events->stats_reports.back().uptime == std::chrono::milliseconds(3'000));
        auto sent = harness.DrainClientMessages();
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].test_delay().from_client());
        const int64_t probe_time = sent[0].test_delay().time();
        REQUIRE(probe_time == harness.timers->Now().count());
        harness.timers->Advance(std::chrono::milliseconds(40));
        proto::peer::Message echo;
        echo.mutable_test_delay()->set_time(probe_time);
        echo.mutable_test_delay()->set_from_client(true);
        harness.DeliverSealed(echo);
        REQUIRE(harness.events->latencies.back() == std::chrono::milliseconds(40));
        REQUIRE(harness.client->GetStats().last_latency == std::chrono::milliseconds(40));
    }
    SECTION("Remote probes are echoed back") {
        auto probe = protocol::MessageBuilder::TestDelay(555, false);
        harness.DeliverSealed(probe);
        auto sent = harness.DrainClientMessages();
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].test_delay().time() == 555);
        REQUIRE_FALSE(sent[0].test_delay().from_client());
        REQUIRE(harness.events->latencies.empty());
    }
    SECTION("Chat, clipboard, cursor and audio reach their consumers") {
        harness.DeliverSealed(protocol::MessageBuilder::ChatMessage("hello there"));
        harness.DeliverSealed(protocol::MessageBuilder::Clipboard("copied text"));
        proto::peer::Message position;
        position.mutable_cursor_position()->set_x(10);
        position.mutable_cursor_position()->set_y(-4);
        harness.DeliverSealed(position);
        proto::peer::Message format;
        format.mutable_misc()->mutable_audio_format()->set_sample_rate(48000);
        format.mutable_misc()->mutable_audio_format()->set_channels(2);
        harness.DeliverSealed(format);
        proto::peer::Message audio;
        audio.mutable_audio_frame()->set_data("pcm");
        harness.DeliverSealed(audio);
        REQUIRE(harness.events->chats == std::vector<std::string>{"hello there"});
        REQUIRE(harness.events->clipboards == std::vector<std::string>{"copied text"});
        REQUIRE(harness.sink->cursor_positions.back() == std::make_pair(10, -4));
        REQUIRE(harness.sink->audio_formats.back() == std::make_pair(48000u, 2u));
        REQUIRE(harness.sink->audio_frames.size() == 1);
        REQUIRE(harness.client->GetStats().audio_frames == 1);
    }
    SECTION("Compressed clipboard is not surfaced") {
        proto::peer::Message clipboard;
        clipboard.mutable_clipboard()->set_compress(true);
        clipboard.mutable_clipboard()->set_content("zstd");
        harness.DeliverSealed(clipboard);
        REQUIRE(harness.events->clipboards.empty());
    }
    SECTION("Remote close notice") {
        proto::peer::Message close;
        close.mutable_misc()->set_close_reason("Session ended by host");
        harness.DeliverSealed(close);
        REQUIRE(harness.client->State() == SessionState::Disconnected);
        REQUIRE(harness.events->disconnects.back() == "Remote: Session ended by host");
        REQUIRE(harness.Relay()->closed);
        REQUIRE(harness.sink->releases == 1);
        REQUIRE(harness.timers->PendingCount() == 0);
    }
    SECTION("Relay drop") {
        harness.Relay()->RemoteClose("reset by peer");
        REQUIRE(harness.client->State() == SessionState::Disconnected);
        REQUIRE(harness.events->disconnects.back() == "relay channel closed: reset by peer");
    }
}
TEST_CASE("Remote session - Disabled clipboard", "[integration][streaming]") {
    SessionHarness harness([](ClientConfig& config) { config.disable_clipboard = true; });
    harness.ReachStreaming();
    harness.DeliverSealed(protocol::MessageBuilder::Clipboard("secret"));
    REQUIRE(harness.events->clipboards.empty());
}
TEST_CASE("Remote session - Controls", "[integration][controls]") {
    SessionHarness harness;
    SECTION("Controls need a streaming session") {
        auto result = harness.client->SendChat("too early");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == protocol::ProtocolFailureType::InvalidState);
        REQUIRE(harness.client->SetCustomFps(60).IsErr());
        REQUIRE(harness.client->Config().custom_fps == 30);
    }
    SECTION("Streaming controls are sealed and sent") {
        harness.ReachStreaming();
        REQUIRE(harness.client->SendChat("hi").IsOk());
        REQUIRE(harness.client->SendCtrlAltDel().IsOk());
        REQUIRE(harness.client->SendMouseEvent(1, 100, 200).IsOk());
        REQUIRE(harness.client->SetCustomFps(60).IsOk());
        REQUIRE(harness.client->SetPrivacyMode(true).IsOk());
        REQUIRE(harness.client->RefreshScreen().IsOk());
        REQUIRE(harness.client->SelectDisplay(1).IsOk());
        auto sent = harness.DrainClientMessages();
        REQUIRE(sent.size() == 7);
        REQUIRE(sent[0].misc().chat_message().text() == "hi");
        REQUIRE(sent[1].key_event().control_key() == proto::peer::CtrlAltDel);
        REQUIRE(sent[2].mouse_event().x() == 100);
        REQUIRE(sent[3].misc().option().custom_fps() == 60);
        REQUIRE(sent[4].misc().toggle_privacy_mode().on());
        REQUIRE(sent[5].misc().refresh_video());
        REQUIRE(sent[6].misc().switch_display().display() == 1);
        REQUIRE(harness.client->Config().custom_fps == 60);
    }
    SECTION("Out-of-range values send nothing") {
        harness.ReachStreaming();
        REQUIRE(harness.client->SetCustomFps(0).IsErr());
        REQUIRE(harness.client->SetCustomFps(121).IsErr());
        REQUIRE(harness.client->SetCustomImageQuality(0).IsErr());
        REQUIRE(harness.client->SetCustomImageQuality(101).IsErr());
        REQUIRE(harness.client->SelectDisplay(-1).IsErr());
        REQUIRE(harness.DrainClientMessages().empty());
    }
    SECTION("Scale mode is local and always forwarded") {
        harness.client->SetScaleMode(interfaces::ScaleMode::Fill);
        REQUIRE(harness.sink->scale_modes.back() == interfaces::ScaleMode::Fill);
        REQUIRE(harness.client->Config().scale_mode == interfaces::ScaleMode::Fill);
    }
    SECTION("Failed send disconnects the session") {
        harness.ReachStreaming();
        harness.Relay()->fail_sends = true;
        REQUIRE(harness.client->SendChat("lost").IsErr());
        REQUIRE(harness.client->State() == SessionState::Disconnected);
    }
}
TEST_CASE("Remote session - Disconnect and reconnect", "[integration][session]") {
    SessionHarness harness;
    SECTION("User disconnect tears everything down once") {
        harness.ReachStreaming();
        harness.client->Disconnect();
        REQUIRE(harness.client->State() == SessionState::Disconnected);
        REQUIRE(harness.events->disconnects == std::vector<std::string>{"Disconnected by user"});
        REQUIRE(harness.sink->releases == 1);
        REQUIRE(harness.timers->PendingCount() == 0);
        harness.client->Disconnect();
        REQUIRE(harness.events->disconnects.size() == 1);
    }
    SECTION("Disconnect before connecting still ends disconnected") {
        harness.client->Disconnect();
        REQUIRE(harness.client->State() == SessionState::Disconnected);
        REQUIRE(harness.events->disconnects.size() == 1);
        REQUIRE(harness.bridge->CountOpened(ChannelKind::Discovery) == 0);
        REQUIRE(harness.timers->PendingCount() == 0);
        REQUIRE(harness.client->Connect().IsOk());
        REQUIRE(harness.client->State() == SessionState::Connecting);
    }
    SECTION("Reconnect starts a fresh session") {
        harness.ReachRelay();
        REQUIRE(harness.client->Connect().IsOk());
        REQUIRE(harness.Relay()->closed);
        REQUIRE(harness.bridge->CountOpened(ChannelKind::Discovery) == 2);
        REQUIRE(harness.client->GetStats().sequence_id == 2);
        harness.timers->Advance(std::chrono::milliseconds(29'000));
        REQUIRE(harness.client->State() == SessionState::Connecting);
    }
    SECTION("Bridge refusing to open fails the connect") {
        harness.bridge->refuse_opens = true;
        auto result = harness.client->Connect();
        REQUIRE(result.IsErr());
        REQUIRE(harness.client->State() == SessionState::Error);
    }
}

TEST_CASE("Remote session - Disconnect from every stage", "[integration][session]") {
    SessionHarness harness;
    const auto require_torn_down = [&harness]() {
        REQUIRE(harness.client->State() == SessionState::Disconnected);
        REQUIRE(harness.timers->PendingCount() == 0);
        REQUIRE(harness.events->disconnects.back() == "Disconnected by user");
        REQUIRE(harness.Discovery()->closed);
        if (const auto relay = harness.Relay()) {
            REQUIRE(relay->closed);
        }
    };

    SECTION("While discovery is pending") {
        harness.ReachDiscovery();
        REQUIRE(harness.timers->PendingCount() == 1);
        harness.client->Disconnect();
        require_torn_down();
        REQUIRE(harness.bridge->CountOpened(ChannelKind::Relay) == 0);
    }
    SECTION("While the relay join is pending") {
        harness.ReachRelay();
        REQUIRE(harness.timers->PendingCount() == 1);
        harness.client->Disconnect();
        require_torn_down();
    }
    SECTION("At the password prompt") {
        harness.ReachPasswordPrompt();
        harness.client->Disconnect();
        require_torn_down();
    }
    SECTION("While the login is in flight") {
        harness.ReachPasswordPrompt();
        REQUIRE(harness.client->Authenticate(kPassword).IsOk());
        harness.client->Disconnect();
        require_torn_down();
        harness.DeliverSealed(ScriptedRemotePeer::LoginAccepted("remote-host"));
        REQUIRE(harness.client->State() == SessionState::Disconnected);
        REQUIRE(harness.sink->starts == 0);
    }
    SECTION("After a discovery rejection") {
        harness.ReachDiscovery();
        harness.Discovery()->Deliver(
            ScriptedRemotePeer::PunchHoleFailure(proto::discovery::PunchHoleResponse::OFFLINE));
        REQUIRE(harness.client->State() == SessionState::Error);
        harness.client->Disconnect();
        require_torn_down();
        REQUIRE(harness.events->errors.size() == 1);
        REQUIRE(harness.events->disconnects.size() == 1);
        REQUIRE(harness.events->transitions.back() ==
                std::make_pair(SessionState::Error, SessionState::Disconnected));
        harness.client->Disconnect();
        REQUIRE(harness.events->disconnects.size() == 1);
    }
}
