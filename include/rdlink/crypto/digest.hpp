#pragma once

#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"

#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>

namespace rdlink::protocol::crypto {

/**
 * @brief SHA-256 over OpenSSL EVP
 *
 * Digest() hashes the concatenation of all parts in order, without copying
 * them into one buffer first.
 */
class Digest {
public:
    static constexpr size_t SHA256_LEN = 32;

    static Result<std::vector<uint8_t>, ProtocolFailure> Sha256(
        std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, ProtocolFailure> Sha256(
        std::initializer_list<std::span<const uint8_t>> parts);

private:
    Digest() = delete;
};

} // namespace rdlink::protocol::crypto
