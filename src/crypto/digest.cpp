#include "rdlink/crypto/digest.hpp"
#include "rdlink/core/constants.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <memory>
#include <string>

namespace rdlink::protocol::crypto {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        EVP_MD_CTX_free(ctx);
    }
};

std::string LastOpenSslError() {
    const unsigned long code = ERR_get_error();
    if (code == OpenSSLConstants::NO_ERROR) {
        return std::string(OpenSSLConstants::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return std::string(buffer);
}

} // namespace

Result<std::vector<uint8_t>, ProtocolFailure> Digest::Sha256(
    std::span<const uint8_t> data) {
    return Sha256({data});
}

Result<std::vector<uint8_t>, ProtocolFailure> Digest::Sha256(
    std::initializer_list<std::span<const uint8_t>> parts) {

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("Failed to create digest context"));
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("SHA-256 init failed: " + LastOpenSslError()));
    }

    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != OpenSSLConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Generic("SHA-256 update failed: " + LastOpenSslError()));
        }
    }

    std::vector<uint8_t> digest(SHA256_LEN);
    unsigned int written = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &written) != OpenSSLConstants::SUCCESS ||
        written != SHA256_LEN) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("SHA-256 final failed: " + LastOpenSslError()));
    }

    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(digest));
}

} // namespace rdlink::protocol::crypto
