#include <catch2/catch_test_macros.hpp>
#include "rdlink/crypto/sodium_interop.hpp"
#include "rdlink/crypto/sodium_secure_memory_handle.hpp"
#include <algorithm>
#include <vector>
using namespace rdlink::protocol;
using namespace rdlink::protocol::crypto;
TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate a session key slot") {
        auto result = SecureMemoryHandle::Allocate(32);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().Size() == 32);
        REQUIRE_FALSE(result.Unwrap().IsInvalid());
    }
    SECTION("Zero-sized allocation is rejected") {
        auto result = SecureMemoryHandle::Allocate(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
    SECTION("Default handle is invalid") {
        SecureMemoryHandle handle;
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.ReadBytes(1).IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - Write and read back", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
    SECTION("Full write reads back unchanged") {
        std::vector<uint8_t> key(32, 0x5A);
        REQUIRE(handle.Write(key).IsOk());
        REQUIRE(handle.ReadBytes(32).Unwrap() == key);
    }
    SECTION("Short write zero-fills the remainder") {
        std::vector<uint8_t> prefix(8, 0xEE);
        REQUIRE(handle.Write(std::vector<uint8_t>(32, 0x11)).IsOk());
        REQUIRE(handle.Write(prefix).IsOk());
        auto bytes = handle.ReadBytes(32).Unwrap();
        REQUIRE(std::all_of(bytes.begin(), bytes.begin() + 8, [](uint8_t b) { return b == 0xEE; }));
        REQUIRE(std::all_of(bytes.begin() + 8, bytes.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Oversized write fails") {
        auto result = handle.Write(std::vector<uint8_t>(33, 0x01));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Reading more than was allocated fails") {
        REQUIRE(handle.ReadBytes(64).IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - Scoped access", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
    SECTION("Write access then read access") {
        auto written = handle.WithWriteAccess([](std::span<uint8_t> bytes) {
            std::fill(bytes.begin(), bytes.end(), 0x7C);
            return bytes.size();
        });
        REQUIRE(written.Unwrap() == 16);
        auto sum = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            size_t total = 0;
            for (const uint8_t b : bytes) {
                total += b;
            }
            return total;
        });
        REQUIRE(sum.Unwrap() == 16u * 0x7C);
    }
    SECTION("Moved-from handle refuses access") {
        SecureMemoryHandle moved = std::move(handle);
        REQUIRE(handle.IsInvalid());
        REQUIRE_FALSE(moved.IsInvalid());
        auto result = handle.WithReadAccess([](std::span<const uint8_t>) { return 0; });
        REQUIRE(result.IsErr());
    }
    SECTION("Move assignment releases the previous allocation") {
        auto other = SecureMemoryHandle::Allocate(64).Unwrap();
        other = std::move(handle);
        REQUIRE(other.Size() == 16);
        REQUIRE(handle.Size() == 0);
    }
}
