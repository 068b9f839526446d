#include <catch2/catch_test_macros.hpp>
#include "rdlink/protocol/sequenced_cipher.hpp"
#include "rdlink/crypto/sodium_interop.hpp"
#include <sodium.h>
#include <string>
using namespace rdlink::protocol;
using namespace rdlink::protocol::crypto;
namespace {
std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}
}
TEST_CASE("SequencedCipher - Nonce layout", "[cipher]") {
    SECTION("First message uses sequence number one") {
        const auto nonce = SequencedCipher::NonceFor(0);
        REQUIRE(nonce[0] == 1);
        for (size_t i = 1; i < nonce.size(); ++i) {
            REQUIRE(nonce[i] == 0);
        }
    }
    SECTION("Counter is little-endian in the first eight bytes") {
        const auto nonce = SequencedCipher::NonceFor(0x0102030405060707ULL);
        REQUIRE(nonce[0] == 0x08);
        REQUIRE(nonce[1] == 0x07);
        REQUIRE(nonce[7] == 0x01);
        REQUIRE(nonce[8] == 0x00);
    }
}
TEST_CASE("SequencedCipher - Two ends in lockstep", "[cipher]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(32);
    auto local = SequencedCipher::Create(key).Unwrap();
    auto remote = SequencedCipher::Create(key).Unwrap();
    SECTION("Messages open in order in both directions") {
        for (int i = 0; i < 5; ++i) {
            const auto text = Bytes("frame " + std::to_string(i));
            auto sealed = local.Seal(text);
            REQUIRE(sealed.IsOk());
            REQUIRE(sealed.Unwrap().size() == text.size() + crypto_secretbox_MACBYTES);
            REQUIRE(remote.Open(sealed.Unwrap()).Unwrap() == text);
            auto reply = remote.Seal(text);
            REQUIRE(local.Open(reply.Unwrap()).Unwrap() == text);
        }
        REQUIRE(local.SealedCount() == 5);
        REQUIRE(local.OpenedCount() == 5);
    }
    SECTION("Output matches secretbox under the sequence nonce") {
        const auto text = Bytes("known");
        auto sealed = local.Seal(text).Unwrap();
        const auto nonce = SequencedCipher::NonceFor(0);
        std::vector<uint8_t> expected(text.size() + crypto_secretbox_MACBYTES);
        crypto_secretbox_easy(expected.data(), text.data(), text.size(), nonce.data(), key.data());
        REQUIRE(sealed == expected);
    }
    SECTION("Same plaintext seals differently each time") {
        const auto text = Bytes("repeat");
        REQUIRE(local.Seal(text).Unwrap() != local.Seal(text).Unwrap());
    }
    SECTION("Out-of-order delivery fails and poisons") {
        auto first = local.Seal(Bytes("one")).Unwrap();
        auto second = local.Seal(Bytes("two")).Unwrap();
        auto result = remote.Open(second);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Decryption);
        REQUIRE(remote.IsPoisoned());
        REQUIRE(remote.Open(first).IsErr());
        REQUIRE(remote.Seal(Bytes("x")).IsErr());
    }
    SECTION("Ciphertext shorter than the MAC is rejected") {
        const std::vector<uint8_t> tiny(8, 0x00);
        REQUIRE(remote.Open(tiny).IsErr());
        REQUIRE(remote.IsPoisoned());
    }
}
TEST_CASE("SequencedCipher - Key validation", "[cipher]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wrong key length") {
        auto result = SequencedCipher::Create(std::vector<uint8_t>(16, 0x01));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Different keys cannot talk") {
        auto a = SequencedCipher::Create(SodiumInterop::GetRandomBytes(32)).Unwrap();
        auto b = SequencedCipher::Create(SodiumInterop::GetRandomBytes(32)).Unwrap();
        REQUIRE(b.Open(a.Seal(Bytes("hi")).Unwrap()).IsErr());
    }
}
