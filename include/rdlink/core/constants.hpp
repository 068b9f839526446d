#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace rdlink::protocol {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view BUFFER_TOO_LARGE = "Buffer too large";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view CHANNEL_POISONED = "Secure channel failed earlier and can no longer be used";
    static constexpr std::string_view CHANNEL_ALREADY_ENABLED = "Secure channel is already enabled";
    static constexpr std::string_view KEY_NOT_SEALED = "Symmetric key has not been sealed for the peer";
    static constexpr std::string_view IDENTITY_PROOF_INVALID = "Identity proof signature verification failed";
    static constexpr std::string_view IDENTITY_ID_MISMATCH = "Identity proof names a different device";
    static constexpr std::string_view SERVER_SIGNATURE_INVALID = "Peer key is not signed by the configured server";
    static constexpr std::string_view NOT_STREAMING = "Session is not streaming";
};
}
