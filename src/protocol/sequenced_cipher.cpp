#include "rdlink/protocol/sequenced_cipher.hpp"
#include "rdlink/protocol/constants.hpp"
#include "rdlink/crypto/sodium_interop.hpp"
#include "rdlink/core/constants.hpp"
#include "rdlink/core/format.hpp"
#include "rdlink/debug/session_logger.hpp"

#include <sodium.h>
#include <limits>
#include <string>

namespace rdlink::protocol {

static_assert(kSecretboxNonceBytes == crypto_secretbox_NONCEBYTES);
static_assert(kSecretboxMacBytes == crypto_secretbox_MACBYTES);
static_assert(kSymmetricKeyBytes == crypto_secretbox_KEYBYTES);

SequencedCipher::SequencedCipher(crypto::SecureMemoryHandle key) noexcept
    : key_(std::move(key)) {}

Result<SequencedCipher, ProtocolFailure> SequencedCipher::Create(std::span<const uint8_t> key) {
    if (key.size() != kSymmetricKeyBytes) {
        return Result<SequencedCipher, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Session key must be {} bytes, got {}", kSymmetricKeyBytes, key.size())));
    }

    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<SequencedCipher, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    auto handle_result = crypto::SecureMemoryHandle::Allocate(kSymmetricKeyBytes);
    if (handle_result.IsErr()) {
        return Result<SequencedCipher, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    crypto::SecureMemoryHandle handle = std::move(handle_result).Unwrap();

    auto write_result = handle.Write(key);
    if (write_result.IsErr()) {
        return Result<SequencedCipher, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return Result<SequencedCipher, ProtocolFailure>::Ok(SequencedCipher(std::move(handle)));
}

std::array<uint8_t, 24> SequencedCipher::NonceFor(const uint64_t counter) noexcept {
    std::array<uint8_t, 24> nonce{};
    const uint64_t sequence = counter + 1;
    for (size_t i = 0; i < kSequenceNumberBytes; ++i) {
        nonce[i] = static_cast<uint8_t>((sequence >> (8 * i)) & 0xFF);
    }
    return nonce;
}

Result<std::vector<uint8_t>, ProtocolFailure> SequencedCipher::Seal(
    std::span<const uint8_t> plaintext) {

    if (poisoned_) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Encryption(std::string(ErrorMessages::CHANNEL_POISONED)));
    }
    if (send_counter_ == std::numeric_limits<uint64_t>::max() - 1) {
        poisoned_ = true;
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Encryption("Send sequence number exhausted"));
    }

    const auto nonce = NonceFor(send_counter_);
    std::vector<uint8_t> ciphertext(plaintext.size() + kSecretboxMacBytes);

    auto seal_result = key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return crypto_secretbox_easy(
            ciphertext.data(), plaintext.data(), plaintext.size(), nonce.data(), key.data());
    });
    if (seal_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(seal_result.UnwrapErr()));
    }
    if (seal_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Encryption(
                compat::format("Failed to seal message at counter {}", send_counter_)));
    }

    debug::LogCipherStep("SEAL", send_counter_, plaintext.size(), ciphertext.size());
    ++send_counter_;
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, ProtocolFailure> SequencedCipher::Open(
    std::span<const uint8_t> ciphertext) {

    if (poisoned_) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decryption(std::string(ErrorMessages::CHANNEL_POISONED)));
    }
    if (ciphertext.size() < kSecretboxMacBytes) {
        poisoned_ = true;
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decryption(
                compat::format("Ciphertext of {} bytes is shorter than the MAC", ciphertext.size())));
    }

    const auto nonce = NonceFor(receive_counter_);
    std::vector<uint8_t> plaintext(ciphertext.size() - kSecretboxMacBytes);

    auto open_result = key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return crypto_secretbox_open_easy(
            plaintext.data(), ciphertext.data(), ciphertext.size(), nonce.data(), key.data());
    });
    if (open_result.IsErr()) {
        poisoned_ = true;
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(open_result.UnwrapErr()));
    }
    if (open_result.Unwrap() != SodiumConstants::SUCCESS) {
        poisoned_ = true;
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decryption(
                compat::format("Authentication failed at receive counter {}", receive_counter_)));
    }

    debug::LogCipherStep("OPEN", receive_counter_, ciphertext.size(), plaintext.size());
    ++receive_counter_;
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(plaintext));
}

} // namespace rdlink::protocol
