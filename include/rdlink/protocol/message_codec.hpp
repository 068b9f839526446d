#pragma once

#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"
#include "rdlink/protocol/peer_event.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace rdlink::protocol {

enum class VideoCodec {
    None,
    Vp9,
    H264,
    H265,
    Vp8,
    Av1,
    Rgb,
    Yuv
};

[[nodiscard]] std::string_view ToString(VideoCodec codec) noexcept;

/**
 * @brief Serialization boundary between raw payloads and the two message families
 */
class MessageCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> SerializeDiscovery(
        const proto::discovery::RendezvousMessage& message);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> SerializePeer(
        const proto::peer::Message& message);

    [[nodiscard]] static Result<proto::discovery::RendezvousMessage, ProtocolFailure> ParseDiscovery(
        std::span<const uint8_t> payload);

    [[nodiscard]] static Result<proto::peer::Message, ProtocolFailure> ParsePeer(
        std::span<const uint8_t> payload);

    /**
     * @brief Flatten the top-level union and the Misc control union into one event
     */
    [[nodiscard]] static PeerEvent ToPeerEvent(proto::peer::Message message);

    /**
     * @brief Classify a discovery reply as a relay ticket or a rejection
     *
     * Replies that are neither (requests echoed back, other kinds) yield
     * nullopt and are left to the caller to ignore.
     */
    [[nodiscard]] static std::optional<DiscoveryOutcome> InterpretDiscovery(
        const proto::discovery::RendezvousMessage& message);

    [[nodiscard]] static std::string DescribePunchHoleFailure(
        const proto::discovery::PunchHoleResponse& response);

private:
    MessageCodec() = delete;
};

[[nodiscard]] VideoCodec VideoCodecOf(const proto::peer::VideoFrame& frame) noexcept;

/**
 * @brief Encoded subframes of a compressed video frame; empty for raw RGB/YUV
 */
[[nodiscard]] std::vector<const proto::peer::EncodedVideoFrame*> EncodedFramesOf(
    const proto::peer::VideoFrame& frame);

} // namespace rdlink::protocol
