#include "rdlink/protocol/password_challenge.hpp"
#include "rdlink/crypto/digest.hpp"
#include "rdlink/crypto/sodium_interop.hpp"

#include <span>

namespace rdlink::protocol {

namespace {

std::span<const uint8_t> AsBytes(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

} // namespace

Result<std::vector<uint8_t>, ProtocolFailure> PasswordChallenge::Respond(
    std::string_view password,
    std::string_view salt,
    std::string_view challenge) {

    auto intermediate_result = crypto::Digest::Sha256({AsBytes(password), AsBytes(salt)});
    if (intermediate_result.IsErr()) {
        return intermediate_result;
    }
    std::vector<uint8_t> intermediate = std::move(intermediate_result).Unwrap();

    auto response = crypto::Digest::Sha256(
        {std::span<const uint8_t>(intermediate), AsBytes(challenge)});
    if (crypto::SodiumInterop::IsInitialized()) {
        (void)crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(intermediate));
    }
    return response;
}

} // namespace rdlink::protocol
