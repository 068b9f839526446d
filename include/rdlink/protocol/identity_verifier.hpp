#pragma once

#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rdlink::protocol {

/**
 * @brief The remote's claimed id and ephemeral key, after signature checks
 */
struct PeerIdentity {
    std::string peer_id;
    std::vector<uint8_t> ephemeral_public_key;
};

/**
 * @brief Verification of the signed identity chain
 *
 * The configured server key signs {device id, device signing key}; the device
 * signing key signs {device id, ephemeral box key}. Both records are an
 * Ed25519 signature (64 bytes) followed by a serialized IdPk.
 */
class IdentityVerifier {
public:
    /**
     * @brief Decode the base64 server key configured out of band
     *
     * @return Ok(32-byte Ed25519 public key) or Err(InvalidInput)
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> DecodeServerKey(
        std::string_view server_key_base64);

    /**
     * @brief Open the server-signed record from the discovery reply
     *
     * @return Ok(device Ed25519 signing key) or Err(Handshake)
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> ResolvePeerSigningKey(
        std::span<const uint8_t> signed_peer_key,
        std::span<const uint8_t> server_key,
        std::string_view target_id);

    /**
     * @brief Open the identity proof sent first on the relay stream
     *
     * @return Ok(PeerIdentity) or Err(Handshake)
     */
    [[nodiscard]] static Result<PeerIdentity, ProtocolFailure> ParseIdentityProof(
        std::span<const uint8_t> signed_id,
        std::span<const uint8_t> peer_signing_key,
        std::string_view target_id);

private:
    [[nodiscard]] static Result<PeerIdentity, ProtocolFailure> OpenSignedIdPk(
        std::span<const uint8_t> signed_record,
        std::span<const uint8_t> signer_key,
        std::string_view target_id,
        std::string_view signature_error);

    IdentityVerifier() = delete;
};

} // namespace rdlink::protocol
