#pragma once

#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"
#include "rdlink/interfaces/i_presentation_sink.hpp"
#include "peer/message.pb.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace rdlink::client {

using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;

/**
 * @brief Settings for one RemoteDesktopClient
 *
 * The server key is the base64 Ed25519 key of the signal server. It doubles
 * as the licence key on the discovery and relay requests and anchors the
 * identity chain, so it is mandatory.
 *
 * @code
 * auto config = ClientConfig::Default("123456789", server_key_base64);
 * config.custom_fps = 60;
 * if (auto valid = config.Validate(); valid.IsErr()) { ... }
 * @endcode
 */
struct ClientConfig {
    std::string target_id;
    std::string server_key;

    std::string client_name;
    std::string client_version;
    std::string platform;
    std::string client_id_prefix;

    proto::peer::ImageQuality image_quality = proto::peer::Balanced;
    uint32_t custom_fps = 30;
    bool show_remote_cursor = true;
    bool disable_audio = false;
    bool disable_clipboard = false;
    bool lock_after_session_end = false;
    interfaces::ScaleMode scale_mode = interfaces::ScaleMode::Fit;

    std::chrono::milliseconds discovery_timeout{30'000};
    std::chrono::milliseconds handshake_timeout{30'000};
    std::chrono::milliseconds keep_alive_interval{3'000};
    std::chrono::milliseconds stats_interval{1'000};

    [[nodiscard]] static ClientConfig Default(std::string target_id, std::string server_key);

    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const;
};

} // namespace rdlink::client
