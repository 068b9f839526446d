#pragma once

/**
 * @file session_logger.hpp
 * @brief Debug tracing for the handshake and session state machine.
 *
 * Only sizes, counters, state names and short public-key prefixes are
 * printed. Secret keys and decrypted payloads are never traced.
 *
 * Enable via CMake: -DRDLINK_DEBUG_LOG=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace rdlink::debug {

// ============================================================================
// Channel identifiers - always defined so types are available
// ============================================================================

enum class Stage {
    Discovery,
    Relay,
    Handshake,
    Cipher,
    Session
};

#ifdef RDLINK_DEBUG_LOG

/**
 * @brief Hex of the first bytes of a public value, suffixed with its size.
 */
inline std::string ToHexPrefix(std::span<const uint8_t> data, size_t max_bytes = 8) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    result.reserve(shown * 2 + 16);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...";
    }
    result += "(" + std::to_string(data.size()) + " bytes)";
    return result;
}

inline const char* StageToString(Stage stage) {
    switch (stage) {
        case Stage::Discovery: return "DISCOVERY";
        case Stage::Relay: return "RELAY";
        case Stage::Handshake: return "HANDSHAKE";
        case Stage::Cipher: return "CIPHER";
        case Stage::Session: return "SESSION";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Core logging macros
// ============================================================================

#define RDL_DEBUG_PUBLIC_KEY(stage, key_name, data) \
    do { \
        fprintf(stderr, "[RDL-DEBUG] %s %s: %s\n", \
            ::rdlink::debug::StageToString(stage), \
            key_name, \
            ::rdlink::debug::ToHexPrefix(data).c_str()); \
        fflush(stderr); \
    } while(0)

#define RDL_DEBUG_VALUE(stage, name, value) \
    do { \
        fprintf(stderr, "[RDL-DEBUG] %s %s: %s\n", \
            ::rdlink::debug::StageToString(stage), \
            name, \
            std::to_string(value).c_str()); \
        fflush(stderr); \
    } while(0)

#define RDL_DEBUG_MSG(stage, message) \
    do { \
        const std::string_view rdl_msg_(message); \
        fprintf(stderr, "[RDL-DEBUG] %s %.*s\n", \
            ::rdlink::debug::StageToString(stage), \
            static_cast<int>(rdl_msg_.size()), rdl_msg_.data()); \
        fflush(stderr); \
    } while(0)

#define RDL_DEBUG_TRANSITION(from, to) \
    do { \
        const std::string_view rdl_from_(from); \
        const std::string_view rdl_to_(to); \
        fprintf(stderr, "[RDL-DEBUG] SESSION ========== %.*s -> %.*s ==========\n", \
            static_cast<int>(rdl_from_.size()), rdl_from_.data(), \
            static_cast<int>(rdl_to_.size()), rdl_to_.data()); \
        fflush(stderr); \
    } while(0)

// ============================================================================
// Cipher Logging
// ============================================================================

inline void LogCipherStep(const char* direction, uint64_t counter, size_t input_size, size_t output_size) {
    fprintf(stderr, "[RDL-DEBUG] CIPHER %s counter=%llu in=%zu out=%zu\n",
        direction,
        static_cast<unsigned long long>(counter),
        input_size,
        output_size);
    fflush(stderr);
}

#else // !RDLINK_DEBUG_LOG

#define RDL_DEBUG_PUBLIC_KEY(stage, key_name, data) ((void)0)
#define RDL_DEBUG_VALUE(stage, name, value) ((void)0)
#define RDL_DEBUG_MSG(stage, message) ((void)0)
#define RDL_DEBUG_TRANSITION(from, to) ((void)0)

inline void LogCipherStep(const char*, uint64_t, size_t, size_t) {}

#endif // RDLINK_DEBUG_LOG

} // namespace rdlink::debug
