#include "rdlink/protocol/secure_channel.hpp"
#include "rdlink/protocol/constants.hpp"
#include "rdlink/crypto/sodium_interop.hpp"
#include "rdlink/core/constants.hpp"
#include "rdlink/core/format.hpp"
#include "rdlink/debug/session_logger.hpp"

#include <sodium.h>
#include <array>
#include <string>

namespace rdlink::protocol {

static_assert(kSealedKeyBytes == kSymmetricKeyBytes + crypto_box_MACBYTES);

Result<Unit, ProtocolFailure> SecureChannel::GenerateLocalKeyMaterial() {
    if (IsEnabled()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::CHANNEL_ALREADY_ENABLED)));
    }

    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    auto keypair_result = crypto::SodiumInterop::GenerateX25519KeyPair("session ephemeral");
    if (keypair_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(keypair_result).UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(keypair_result).Unwrap();

    auto symmetric_result = crypto::SecureMemoryHandle::Allocate(kSymmetricKeyBytes);
    if (symmetric_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(symmetric_result.UnwrapErr()));
    }
    crypto::SecureMemoryHandle symmetric_key = std::move(symmetric_result).Unwrap();

    auto fill_result = symmetric_key.WithWriteAccess([](std::span<uint8_t> key) {
        randombytes_buf(key.data(), key.size());
        return unit;
    });
    if (fill_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(fill_result.UnwrapErr()));
    }

    local_secret_key_ = std::move(secret_key);
    local_public_key_ = std::move(public_key);
    symmetric_key_ = std::move(symmetric_key);
    key_sealed_ = false;

    RDL_DEBUG_PUBLIC_KEY(debug::Stage::Handshake, "local_ephemeral_key", local_public_key_);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<KeyExchangeMaterial, ProtocolFailure> SecureChannel::SealSymmetricKey(
    std::span<const uint8_t> peer_public_key) {

    if (IsEnabled()) {
        return Result<KeyExchangeMaterial, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::CHANNEL_ALREADY_ENABLED)));
    }
    if (!HasLocalKeyMaterial() || symmetric_key_.IsInvalid()) {
        return Result<KeyExchangeMaterial, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Local key material has not been generated"));
    }
    if (peer_public_key.size() != kX25519PublicKeyBytes) {
        return Result<KeyExchangeMaterial, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Peer public key must be {} bytes, got {}",
                               kX25519PublicKeyBytes, peer_public_key.size())));
    }

    const std::array<uint8_t, crypto_box_NONCEBYTES> zero_nonce{};
    std::vector<uint8_t> sealed(kSealedKeyBytes);

    auto seal_result = symmetric_key_.WithReadAccess([&](std::span<const uint8_t> symmetric_key) {
        auto box_result = local_secret_key_.WithReadAccess([&](std::span<const uint8_t> secret_key) {
            return crypto_box_easy(
                sealed.data(),
                symmetric_key.data(), symmetric_key.size(),
                zero_nonce.data(),
                peer_public_key.data(),
                secret_key.data());
        });
        return box_result.IsOk() ? box_result.Unwrap() : SodiumConstants::FAILURE;
    });
    if (seal_result.IsErr()) {
        return Result<KeyExchangeMaterial, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(seal_result.UnwrapErr()));
    }
    if (seal_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<KeyExchangeMaterial, ProtocolFailure>::Err(
            ProtocolFailure::Encryption("Failed to seal session key for peer"));
    }

    key_sealed_ = true;
    RDL_DEBUG_VALUE(debug::Stage::Handshake, "sealed_key_size", sealed.size());
    return Result<KeyExchangeMaterial, ProtocolFailure>::Ok(
        KeyExchangeMaterial{local_public_key_, std::move(sealed)});
}

Result<Unit, ProtocolFailure> SecureChannel::Enable() {
    if (IsEnabled()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::CHANNEL_ALREADY_ENABLED)));
    }
    if (!key_sealed_) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState(std::string(ErrorMessages::KEY_NOT_SEALED)));
    }

    auto key_result = symmetric_key_.ReadBytes(kSymmetricKeyBytes);
    if (key_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(key_result.UnwrapErr()));
    }
    std::vector<uint8_t> key = std::move(key_result).Unwrap();
    auto cipher_result = SequencedCipher::Create(key);
    (void)crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    if (cipher_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(cipher_result).UnwrapErr());
    }

    cipher_.emplace(std::move(cipher_result).Unwrap());
    local_secret_key_ = crypto::SecureMemoryHandle();
    RDL_DEBUG_MSG(debug::Stage::Cipher, "enabled");
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> SecureChannel::ProcessOutgoing(
    std::span<const uint8_t> data) {
    if (!cipher_) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
            std::vector<uint8_t>(data.begin(), data.end()));
    }
    return cipher_->Seal(data);
}

Result<std::vector<uint8_t>, ProtocolFailure> SecureChannel::ProcessIncoming(
    std::span<const uint8_t> data) {
    if (!cipher_) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
            std::vector<uint8_t>(data.begin(), data.end()));
    }
    return cipher_->Open(data);
}

} // namespace rdlink::protocol
