#include "rdlink/client/client_config.hpp"
#include "rdlink/protocol/constants.hpp"
#include "rdlink/protocol/identity_verifier.hpp"
#include "rdlink/core/format.hpp"

namespace rdlink::client {

namespace {

Result<Unit, ProtocolFailure> RequirePositive(
    const std::chrono::milliseconds value,
    const char* name) {
    if (value.count() <= 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(compat::format("{} must be positive", name)));
    }
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

} // namespace

ClientConfig ClientConfig::Default(std::string target_id, std::string server_key) {
    ClientConfig config;
    config.target_id = std::move(target_id);
    config.server_key = std::move(server_key);
    config.client_name = std::string(protocol::kDefaultClientName);
    config.client_version = std::string(protocol::kDefaultClientVersion);
    config.platform = std::string(protocol::kDefaultPlatform);
    config.client_id_prefix = std::string(protocol::kDefaultClientIdPrefix);
    config.custom_fps = protocol::kDefaultCustomFps;
    config.discovery_timeout = protocol::kDefaultDiscoveryTimeout;
    config.handshake_timeout = protocol::kDefaultHandshakeTimeout;
    config.keep_alive_interval = protocol::kDefaultKeepAliveInterval;
    config.stats_interval = protocol::kDefaultStatsInterval;
    return config;
}

Result<Unit, ProtocolFailure> ClientConfig::Validate() const {
    if (target_id.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Target device id is empty"));
    }

    auto key_result = protocol::IdentityVerifier::DecodeServerKey(server_key);
    if (key_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(key_result).UnwrapErr());
    }

    if (custom_fps == 0 || custom_fps > protocol::kMaxCustomFps) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Custom FPS must be between 1 and {}, got {}",
                               protocol::kMaxCustomFps, custom_fps)));
    }

    RDL_TRY(RequirePositive(discovery_timeout, "Discovery timeout"));
    RDL_TRY(RequirePositive(handshake_timeout, "Handshake timeout"));
    RDL_TRY(RequirePositive(keep_alive_interval, "Keep-alive interval"));
    RDL_TRY(RequirePositive(stats_interval, "Stats interval"));
    return Result<Unit, ProtocolFailure>::Ok(Unit{});
}

} // namespace rdlink::client
