#pragma once

#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"
#include "rdlink/crypto/sodium_secure_memory_handle.hpp"
#include "rdlink/protocol/sequenced_cipher.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace rdlink::protocol {

struct KeyExchangeMaterial {
    std::vector<uint8_t> local_public_key;
    std::vector<uint8_t> sealed_key;
};

/**
 * @brief Per-session key material and the relay stream cipher
 *
 * Lifecycle: GenerateLocalKeyMaterial -> SealSymmetricKey -> Enable. Until
 * Enable() both Process* calls pass data through untouched; the key exchange
 * message itself travels in the clear.
 */
class SecureChannel {
public:
    SecureChannel() = default;
    SecureChannel(SecureChannel&&) noexcept = default;
    SecureChannel& operator=(SecureChannel&&) noexcept = default;
    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;
    ~SecureChannel() = default;

    /**
     * @brief Fresh X25519 keypair and fresh random 32-byte session key
     *
     * Replaces any earlier material. Fails with InvalidState once enabled.
     */
    Result<Unit, ProtocolFailure> GenerateLocalKeyMaterial();

    /**
     * @brief Box the session key to @p peer_public_key under the all-zero nonce
     *
     * The zero nonce is safe only because the local keypair is used once.
     */
    Result<KeyExchangeMaterial, ProtocolFailure> SealSymmetricKey(
        std::span<const uint8_t> peer_public_key);

    /**
     * @brief Switch the stream to encrypted mode; exactly once
     */
    Result<Unit, ProtocolFailure> Enable();

    Result<std::vector<uint8_t>, ProtocolFailure> ProcessOutgoing(std::span<const uint8_t> data);

    Result<std::vector<uint8_t>, ProtocolFailure> ProcessIncoming(std::span<const uint8_t> data);

    [[nodiscard]] bool IsEnabled() const noexcept { return cipher_.has_value(); }
    [[nodiscard]] bool HasLocalKeyMaterial() const noexcept { return !local_secret_key_.IsInvalid(); }
    [[nodiscard]] bool IsPoisoned() const noexcept { return cipher_.has_value() && cipher_->IsPoisoned(); }
    [[nodiscard]] uint64_t SendCounter() const noexcept { return cipher_ ? cipher_->SealedCount() : 0; }
    [[nodiscard]] uint64_t ReceiveCounter() const noexcept { return cipher_ ? cipher_->OpenedCount() : 0; }

private:
    crypto::SecureMemoryHandle local_secret_key_;
    std::vector<uint8_t> local_public_key_;
    crypto::SecureMemoryHandle symmetric_key_;
    bool key_sealed_ = false;
    std::optional<SequencedCipher> cipher_;
};

} // namespace rdlink::protocol
