#include "rdlink/protocol/message_codec.hpp"
#include "rdlink/core/format.hpp"

#include <limits>

namespace rdlink::protocol {

namespace {

template<typename TMessage>
Result<std::vector<uint8_t>, ProtocolFailure> SerializeMessage(
    const TMessage& message,
    std::string_view family) {

    const size_t size = message.ByteSizeLong();
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Encode(
                compat::format("{} message of {} bytes is too large to serialize", family, size)));
    }

    std::vector<uint8_t> bytes(size);
    if (!message.SerializeToArray(bytes.data(), static_cast<int>(size))) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Encode(
                compat::format("Failed to serialize {} message to protobuf", family)));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(bytes));
}

template<typename TMessage>
Result<TMessage, ProtocolFailure> ParseMessage(
    std::span<const uint8_t> payload,
    std::string_view family) {

    if (payload.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<TMessage, ProtocolFailure>::Err(
            ProtocolFailure::Decode(
                compat::format("{} payload of {} bytes is too large to parse", family, payload.size())));
    }

    TMessage message;
    if (!message.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
        return Result<TMessage, ProtocolFailure>::Err(
            ProtocolFailure::Decode(
                compat::format("Failed to parse {} message ({} bytes)", family, payload.size())));
    }
    return Result<TMessage, ProtocolFailure>::Ok(std::move(message));
}

PeerEvent FromMisc(proto::peer::Misc misc) {
    using proto::peer::Misc;
    switch (misc.union_case()) {
        case Misc::kChatMessage:
            return std::move(*misc.mutable_chat_message());
        case Misc::kSwitchDisplay:
            return std::move(*misc.mutable_switch_display());
        case Misc::kPermissionInfo:
            return std::move(*misc.mutable_permission_info());
        case Misc::kOption:
            return std::move(*misc.mutable_option());
        case Misc::kAudioFormat:
            return std::move(*misc.mutable_audio_format());
        case Misc::kCloseReason:
            return CloseNotice{misc.close_reason()};
        default:
            return UnknownPeerMessage{
                static_cast<uint32_t>(proto::peer::Message::kMisc),
                static_cast<uint32_t>(misc.union_case())};
    }
}

} // namespace

std::string_view ToString(const VideoCodec codec) noexcept {
    switch (codec) {
        case VideoCodec::None: return "none";
        case VideoCodec::Vp9: return "vp9";
        case VideoCodec::H264: return "h264";
        case VideoCodec::H265: return "h265";
        case VideoCodec::Vp8: return "vp8";
        case VideoCodec::Av1: return "av1";
        case VideoCodec::Rgb: return "rgb";
        case VideoCodec::Yuv: return "yuv";
    }
    return "none";
}

Result<std::vector<uint8_t>, ProtocolFailure> MessageCodec::SerializeDiscovery(
    const proto::discovery::RendezvousMessage& message) {
    return SerializeMessage(message, "discovery");
}

Result<std::vector<uint8_t>, ProtocolFailure> MessageCodec::SerializePeer(
    const proto::peer::Message& message) {
    return SerializeMessage(message, "peer");
}

Result<proto::discovery::RendezvousMessage, ProtocolFailure> MessageCodec::ParseDiscovery(
    std::span<const uint8_t> payload) {
    return ParseMessage<proto::discovery::RendezvousMessage>(payload, "discovery");
}

Result<proto::peer::Message, ProtocolFailure> MessageCodec::ParsePeer(
    std::span<const uint8_t> payload) {
    return ParseMessage<proto::peer::Message>(payload, "peer");
}

PeerEvent MessageCodec::ToPeerEvent(proto::peer::Message message) {
    using proto::peer::Message;
    switch (message.union_case()) {
        case Message::kSignedId:
            return std::move(*message.mutable_signed_id());
        case Message::kPublicKey:
            return std::move(*message.mutable_public_key());
        case Message::kHash:
            return std::move(*message.mutable_hash());
        case Message::kLoginResponse:
            return std::move(*message.mutable_login_response());
        case Message::kPeerInfo:
            return std::move(*message.mutable_peer_info());
        case Message::kVideoFrame:
            return std::move(*message.mutable_video_frame());
        case Message::kAudioFrame:
            return std::move(*message.mutable_audio_frame());
        case Message::kCursorData:
            return std::move(*message.mutable_cursor_data());
        case Message::kCursorPosition:
            return std::move(*message.mutable_cursor_position());
        case Message::kCursorId:
            return CursorIdNotice{message.cursor_id()};
        case Message::kClipboard:
            return std::move(*message.mutable_clipboard());
        case Message::kTestDelay:
            return std::move(*message.mutable_test_delay());
        case Message::kMessageBox:
            return std::move(*message.mutable_message_box());
        case Message::kMisc:
            return FromMisc(std::move(*message.mutable_misc()));
        default:
            return UnknownPeerMessage{static_cast<uint32_t>(message.union_case()), 0};
    }
}

std::string MessageCodec::DescribePunchHoleFailure(
    const proto::discovery::PunchHoleResponse& response) {

    if (!response.other_failure().empty()) {
        return response.other_failure();
    }

    using Failure = proto::discovery::PunchHoleResponse;
    switch (response.failure()) {
        case Failure::ID_NOT_EXIST:
            return "Device not found";
        case Failure::OFFLINE:
            return "Device offline";
        case Failure::LICENSE_MISMATCH:
            return "License mismatch";
        case Failure::LICENSE_OVERUSE:
            return "Too many connections";
        default:
            return compat::format("Unknown error (code: {})", static_cast<int>(response.failure()));
    }
}

std::optional<DiscoveryOutcome> MessageCodec::InterpretDiscovery(
    const proto::discovery::RendezvousMessage& message) {

    using proto::discovery::RendezvousMessage;
    switch (message.union_case()) {
        case RendezvousMessage::kPunchHoleResponse: {
            const auto& response = message.punch_hole_response();
            // failure defaults to ID_NOT_EXIST, so success is judged by the endpoints
            if (!response.relay_server().empty() || !response.socket_addr().empty()) {
                return DiscoveryOutcome{RelayTicket{response.relay_server(), std::string(), response.pk()}};
            }
            return DiscoveryOutcome{DiscoveryRejection{DescribePunchHoleFailure(response)}};
        }
        case RendezvousMessage::kRelayResponse: {
            const auto& response = message.relay_response();
            if (!response.refuse_reason().empty()) {
                return DiscoveryOutcome{DiscoveryRejection{"Relay refused: " + response.refuse_reason()}};
            }
            return DiscoveryOutcome{RelayTicket{response.relay_server(), response.uuid(), response.pk()}};
        }
        default:
            return std::nullopt;
    }
}

VideoCodec VideoCodecOf(const proto::peer::VideoFrame& frame) noexcept {
    if (frame.has_vp9s()) {
        return VideoCodec::Vp9;
    }
    if (frame.has_h264s()) {
        return VideoCodec::H264;
    }
    if (frame.has_h265s()) {
        return VideoCodec::H265;
    }
    if (frame.has_vp8s()) {
        return VideoCodec::Vp8;
    }
    if (frame.has_av1s()) {
        return VideoCodec::Av1;
    }
    if (frame.has_rgb()) {
        return VideoCodec::Rgb;
    }
    if (frame.has_yuv()) {
        return VideoCodec::Yuv;
    }
    return VideoCodec::None;
}

std::vector<const proto::peer::EncodedVideoFrame*> EncodedFramesOf(
    const proto::peer::VideoFrame& frame) {

    const proto::peer::EncodedVideoFrames* frames = nullptr;
    switch (VideoCodecOf(frame)) {
        case VideoCodec::Vp9: frames = &frame.vp9s(); break;
        case VideoCodec::H264: frames = &frame.h264s(); break;
        case VideoCodec::H265: frames = &frame.h265s(); break;
        case VideoCodec::Vp8: frames = &frame.vp8s(); break;
        case VideoCodec::Av1: frames = &frame.av1s(); break;
        default: break;
    }

    std::vector<const proto::peer::EncodedVideoFrame*> result;
    if (frames == nullptr) {
        return result;
    }
    result.reserve(static_cast<size_t>(frames->frames_size()));
    for (const auto& encoded : frames->frames()) {
        result.push_back(&encoded);
    }
    return result;
}

} // namespace rdlink::protocol
