#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rdlink::protocol {

inline constexpr std::string_view kLibraryVersion = "1.0.0";
inline constexpr std::string_view kDefaultClientVersion = "rdlink-web/1.0";
inline constexpr std::string_view kDefaultClientName = "rdlink Web";
inline constexpr std::string_view kDefaultPlatform = "Web";
inline constexpr std::string_view kDefaultClientIdPrefix = "rdlink-web-";
inline constexpr std::string_view kPrivacyModeImplKey = "privacy_mode_impl_virtual_display";
inline constexpr std::string_view kRemoteClosePrefix = "Remote: ";

inline constexpr size_t kSymmetricKeyBytes = 32;
inline constexpr size_t kSealedKeyBytes = 48;
inline constexpr size_t kSecretboxNonceBytes = 24;
inline constexpr size_t kSecretboxMacBytes = 16;
inline constexpr size_t kSequenceNumberBytes = 8;
inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr std::chrono::milliseconds kDefaultDiscoveryTimeout{30'000};
inline constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{30'000};
inline constexpr std::chrono::milliseconds kDefaultKeepAliveInterval{3'000};
inline constexpr std::chrono::milliseconds kDefaultStatsInterval{1'000};

inline constexpr uint32_t kDefaultCustomFps = 30;
inline constexpr uint32_t kMaxCustomFps = 120;
inline constexpr uint32_t kMaxCustomImageQuality = 100;

} // namespace rdlink::protocol
