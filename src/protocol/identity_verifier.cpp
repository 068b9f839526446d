#include "rdlink/protocol/identity_verifier.hpp"
#include "rdlink/protocol/constants.hpp"
#include "rdlink/crypto/sodium_interop.hpp"
#include "rdlink/core/constants.hpp"
#include "rdlink/core/format.hpp"
#include "rdlink/debug/session_logger.hpp"
#include "peer/message.pb.h"

#include <sodium.h>

namespace rdlink::protocol {

Result<std::vector<uint8_t>, ProtocolFailure> IdentityVerifier::DecodeServerKey(
    std::string_view server_key_base64) {

    if (server_key_base64.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Server key is empty"));
    }

    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    std::vector<uint8_t> key(server_key_base64.size());
    size_t decoded_len = 0;
    const int rc = sodium_base642bin(
        key.data(), key.size(),
        server_key_base64.data(), server_key_base64.size(),
        " \r\n", &decoded_len, nullptr,
        sodium_base64_VARIANT_ORIGINAL);
    if (rc != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Server key is not valid base64"));
    }
    if (decoded_len != kEd25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Server key must decode to {} bytes, got {}",
                               kEd25519PublicKeyBytes, decoded_len)));
    }
    key.resize(decoded_len);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(key));
}

Result<std::vector<uint8_t>, ProtocolFailure> IdentityVerifier::ResolvePeerSigningKey(
    std::span<const uint8_t> signed_peer_key,
    std::span<const uint8_t> server_key,
    std::string_view target_id) {

    auto opened = OpenSignedIdPk(
        signed_peer_key, server_key, target_id, ErrorMessages::SERVER_SIGNATURE_INVALID);
    if (opened.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            std::move(opened).UnwrapErr());
    }

    PeerIdentity identity = std::move(opened).Unwrap();
    if (identity.ephemeral_public_key.size() != kEd25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(
                compat::format("Device signing key must be {} bytes, got {}",
                               kEd25519PublicKeyBytes, identity.ephemeral_public_key.size())));
    }

    RDL_DEBUG_PUBLIC_KEY(debug::Stage::Discovery, "device_signing_key", identity.ephemeral_public_key);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
        std::move(identity.ephemeral_public_key));
}

Result<PeerIdentity, ProtocolFailure> IdentityVerifier::ParseIdentityProof(
    std::span<const uint8_t> signed_id,
    std::span<const uint8_t> peer_signing_key,
    std::string_view target_id) {

    auto opened = OpenSignedIdPk(
        signed_id, peer_signing_key, target_id, ErrorMessages::IDENTITY_PROOF_INVALID);
    if (opened.IsErr()) {
        return opened;
    }

    const PeerIdentity& identity = opened.Unwrap();
    if (identity.ephemeral_public_key.size() != kX25519PublicKeyBytes) {
        return Result<PeerIdentity, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(
                compat::format("Ephemeral key must be {} bytes, got {}",
                               kX25519PublicKeyBytes, identity.ephemeral_public_key.size())));
    }

    RDL_DEBUG_PUBLIC_KEY(debug::Stage::Handshake, "peer_ephemeral_key", identity.ephemeral_public_key);
    return opened;
}

Result<PeerIdentity, ProtocolFailure> IdentityVerifier::OpenSignedIdPk(
    std::span<const uint8_t> signed_record,
    std::span<const uint8_t> signer_key,
    std::string_view target_id,
    std::string_view signature_error) {

    if (signer_key.size() != kEd25519PublicKeyBytes) {
        return Result<PeerIdentity, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(
                compat::format("Signing key must be {} bytes, got {}",
                               kEd25519PublicKeyBytes, signer_key.size())));
    }
    if (signed_record.size() <= kEd25519SignatureBytes) {
        return Result<PeerIdentity, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(
                compat::format("Signed record of {} bytes is too short", signed_record.size())));
    }

    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<PeerIdentity, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    std::vector<uint8_t> record(signed_record.size() - kEd25519SignatureBytes);
    unsigned long long record_len = 0;
    if (crypto_sign_open(
            record.data(), &record_len,
            signed_record.data(), signed_record.size(),
            signer_key.data()) != SodiumConstants::SUCCESS) {
        return Result<PeerIdentity, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(std::string(signature_error)));
    }
    record.resize(static_cast<size_t>(record_len));

    proto::peer::IdPk id_pk;
    if (!id_pk.ParseFromArray(record.data(), static_cast<int>(record.size()))) {
        return Result<PeerIdentity, ProtocolFailure>::Err(
            ProtocolFailure::Handshake("Signed record does not contain a valid IdPk"));
    }

    if (id_pk.id() != target_id) {
        return Result<PeerIdentity, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(
                compat::format("{}: expected '{}', got '{}'",
                               ErrorMessages::IDENTITY_ID_MISMATCH, target_id, id_pk.id())));
    }

    PeerIdentity identity;
    identity.peer_id = id_pk.id();
    identity.ephemeral_public_key.assign(id_pk.pk().begin(), id_pk.pk().end());
    return Result<PeerIdentity, ProtocolFailure>::Ok(std::move(identity));
}

} // namespace rdlink::protocol
