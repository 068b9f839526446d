#pragma once

#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"
#include "rdlink/crypto/sodium_secure_memory_handle.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace rdlink::protocol {

/**
 * @brief XSalsa20-Poly1305 with an implicit per-direction sequence number
 *
 * Both ends keep one counter per direction, starting at zero. Message i in a
 * direction travels under sequence number i + 1, written little-endian into
 * the first eight bytes of an otherwise zero nonce. Output is MAC || ciphertext.
 *
 * A failed Open() poisons the cipher: the counters can no longer be trusted to
 * match the remote, so every later call fails.
 */
class SequencedCipher {
public:
    [[nodiscard]] static Result<SequencedCipher, ProtocolFailure> Create(
        std::span<const uint8_t> key);

    SequencedCipher(SequencedCipher&&) noexcept = default;
    SequencedCipher& operator=(SequencedCipher&&) noexcept = default;
    SequencedCipher(const SequencedCipher&) = delete;
    SequencedCipher& operator=(const SequencedCipher&) = delete;
    ~SequencedCipher() = default;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Seal(
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Open(
        std::span<const uint8_t> ciphertext);

    [[nodiscard]] uint64_t SealedCount() const noexcept { return send_counter_; }
    [[nodiscard]] uint64_t OpenedCount() const noexcept { return receive_counter_; }
    [[nodiscard]] bool IsPoisoned() const noexcept { return poisoned_; }

    /**
     * @brief Nonce for the message sent or received with counter value @p counter
     */
    [[nodiscard]] static std::array<uint8_t, 24> NonceFor(uint64_t counter) noexcept;

private:
    explicit SequencedCipher(crypto::SecureMemoryHandle key) noexcept;

    crypto::SecureMemoryHandle key_;
    uint64_t send_counter_ = 0;
    uint64_t receive_counter_ = 0;
    bool poisoned_ = false;
};

} // namespace rdlink::protocol
