#pragma once

#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"
#include "rdlink/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace rdlink::protocol::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium primitives used by the session handshake
 *
 * Every method reports problems through Result; nothing here throws across
 * the boundary.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other sodium operation. Idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Zero a buffer in a way the optimizer cannot elide
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate an X25519 box keypair
     *
     * The secret half is placed in guarded sodium memory.
     *
     * @param key_purpose Used in error messages only
     * @return Ok((secret_key_handle, public_key_bytes)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static uint64_t GenerateRandomUInt64(bool ensure_non_zero = false);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace rdlink::protocol::crypto
