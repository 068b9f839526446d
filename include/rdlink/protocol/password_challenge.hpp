#pragma once

#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace rdlink::protocol {

/**
 * @brief Response to the remote's salted login challenge
 *
 * SHA256(SHA256(password || salt) || challenge). The raw password never
 * leaves this function.
 */
class PasswordChallenge {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Respond(
        std::string_view password,
        std::string_view salt,
        std::string_view challenge);

private:
    PasswordChallenge() = delete;
};

} // namespace rdlink::protocol
