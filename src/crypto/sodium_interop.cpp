#include "rdlink/crypto/sodium_interop.hpp"
#include "rdlink/crypto/sodium_secure_memory_handle.hpp"

#include <string>

namespace rdlink::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                std::string(ErrorMessages::BUFFER_TOO_LARGE) + ": " +
                std::to_string(buffer.size())));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

// ============================================================================
// Key Generation
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(std::move(sk_handle_result).UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk_bytes(Constants::X_25519_PUBLIC_KEY_SIZE);
    auto generate_result = sk_handle.WithWriteAccess([&pk_bytes](std::span<uint8_t> sk) {
        return crypto_box_keypair(pk_bytes.data(), sk.data());
    });
    if (generate_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(std::move(generate_result).UnwrapErr()));
    }
    if (generate_result.Unwrap() != SodiumConstants::SUCCESS) {
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration(
                "Failed to generate " + std::string(key_purpose) + " key pair"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint64_t SodiumInterop::GenerateRandomUInt64(bool ensure_non_zero) {
    uint64_t value;
    do {
        randombytes_buf(&value, sizeof(value));
    } while (ensure_non_zero && value == 0);

    return value;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace rdlink::protocol::crypto
