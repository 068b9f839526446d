#include <catch2/catch_test_macros.hpp>
#include "rdlink/protocol/identity_verifier.hpp"
#include "rdlink/crypto/sodium_interop.hpp"
#include "helpers/scripted_remote_peer.hpp"
#include <string>
using namespace rdlink::protocol;
using namespace rdlink::protocol::crypto;
using rdlink::test_helpers::ScriptedRemotePeer;
namespace {
std::span<const uint8_t> Bytes(const std::string& text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}
std::vector<uint8_t> ToVector(std::span<const uint8_t> bytes) {
    return {bytes.begin(), bytes.end()};
}
}
TEST_CASE("IdentityVerifier - Server key decoding", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ScriptedRemotePeer peer("123456789");
    SECTION("Standard base64 decodes to the Ed25519 key") {
        auto key = IdentityVerifier::DecodeServerKey(peer.ServerKeyBase64());
        REQUIRE(key.IsOk());
        REQUIRE(key.Unwrap() == ToVector(peer.ServerPublicKey()));
    }
    SECTION("Empty key") {
        auto key = IdentityVerifier::DecodeServerKey("");
        REQUIRE(key.IsErr());
        REQUIRE(key.UnwrapErr().type == rdlink::protocol::ProtocolFailureType::InvalidInput);
    }
    SECTION("Not base64") {
        REQUIRE(IdentityVerifier::DecodeServerKey("not*base64!").IsErr());
    }
    SECTION("Wrong length") {
        REQUIRE(IdentityVerifier::DecodeServerKey("AAAA").IsErr());
    }
}
TEST_CASE("IdentityVerifier - Signed identity chain", "[identity][handshake]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ScriptedRemotePeer peer("123456789");
    const auto server_key = ToVector(peer.ServerPublicKey());
    SECTION("Server-signed record yields the device signing key") {
        const std::string signed_pk = peer.SignedDeviceKey();
        auto device_key = IdentityVerifier::ResolvePeerSigningKey(Bytes(signed_pk), server_key, "123456789");
        REQUIRE(device_key.IsOk());
        REQUIRE(device_key.Unwrap() == ToVector(peer.DevicePublicKey()));
    }
    SECTION("Device-signed proof yields the ephemeral box key") {
        const std::string proof = peer.IdentityProof();
        auto identity = IdentityVerifier::ParseIdentityProof(Bytes(proof), peer.DevicePublicKey(), "123456789");
        REQUIRE(identity.IsOk());
        REQUIRE(identity.Unwrap().peer_id == "123456789");
        REQUIRE(identity.Unwrap().ephemeral_public_key == ToVector(peer.EphemeralPublicKey()));
    }
    SECTION("Record signed by another server is rejected") {
        ScriptedRemotePeer impostor("123456789");
        const std::string signed_pk = impostor.SignedDeviceKey();
        auto device_key = IdentityVerifier::ResolvePeerSigningKey(Bytes(signed_pk), server_key, "123456789");
        REQUIRE(device_key.IsErr());
        REQUIRE(device_key.UnwrapErr().type == rdlink::protocol::ProtocolFailureType::Handshake);
    }
    SECTION("Record naming a different device is rejected") {
        const std::string signed_pk = peer.SignedDeviceKey();
        auto device_key = IdentityVerifier::ResolvePeerSigningKey(Bytes(signed_pk), server_key, "987654321");
        REQUIRE(device_key.IsErr());
        REQUIRE(device_key.UnwrapErr().message.find("987654321") != std::string::npos);
    }
    SECTION("Flipped signature bit is rejected") {
        std::string proof = peer.IdentityProof();
        proof[3] = static_cast<char>(proof[3] ^ 0x01);
        REQUIRE(IdentityVerifier::ParseIdentityProof(Bytes(proof), peer.DevicePublicKey(), "123456789").IsErr());
    }
    SECTION("Proof signed with the server key instead of the device key is rejected") {
        const std::string proof = peer.IdentityProof();
        REQUIRE(IdentityVerifier::ParseIdentityProof(Bytes(proof), server_key, "123456789").IsErr());
    }
    SECTION("Truncated record is rejected") {
        const std::string proof = peer.IdentityProof().substr(0, 64);
        REQUIRE(IdentityVerifier::ParseIdentityProof(Bytes(proof), peer.DevicePublicKey(), "123456789").IsErr());
    }
    SECTION("Proof carrying a key of the wrong size is rejected") {
        auto [secret, public_key] = ScriptedRemotePeer::GenerateSigningKeyPair();
        const std::vector<uint8_t> short_key(16, 0x01);
        const std::string proof = ScriptedRemotePeer::SignIdPk("123456789", short_key, secret);
        auto identity = IdentityVerifier::ParseIdentityProof(Bytes(proof), public_key, "123456789");
        REQUIRE(identity.IsErr());
    }
}
