#pragma once

#include "discovery/rendezvous.pb.h"
#include "peer/message.pb.h"

#include <cstdint>
#include <string>
#include <variant>

namespace rdlink::protocol {

struct CursorIdNotice {
    uint64_t id = 0;
};

struct CloseNotice {
    std::string reason;
};

/**
 * @brief A peer message kind this client has no handler for
 *
 * @c misc_field_number is set when the unknown kind arrived inside the
 * control union rather than the top-level message.
 */
struct UnknownPeerMessage {
    uint32_t field_number = 0;
    uint32_t misc_field_number = 0;
};

using PeerEvent = std::variant<
    proto::peer::SignedId,
    proto::peer::PublicKey,
    proto::peer::Hash,
    proto::peer::LoginResponse,
    proto::peer::PeerInfo,
    proto::peer::VideoFrame,
    proto::peer::AudioFrame,
    proto::peer::AudioFormat,
    proto::peer::CursorData,
    proto::peer::CursorPosition,
    CursorIdNotice,
    proto::peer::Clipboard,
    proto::peer::TestDelay,
    proto::peer::MessageBox,
    proto::peer::ChatMessage,
    proto::peer::OptionMessage,
    proto::peer::PermissionInfo,
    proto::peer::SwitchDisplay,
    CloseNotice,
    UnknownPeerMessage>;

struct RelayTicket {
    std::string relay_server;
    std::string uuid;
    std::string signed_peer_pk;
};

struct DiscoveryRejection {
    std::string reason;
};

using DiscoveryOutcome = std::variant<RelayTicket, DiscoveryRejection>;

} // namespace rdlink::protocol
