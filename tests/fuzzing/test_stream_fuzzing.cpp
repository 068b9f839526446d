#include <catch2/catch_test_macros.hpp>
#include "rdlink/protocol/frame_codec.hpp"
#include "rdlink/protocol/message_builder.hpp"
#include "rdlink/protocol/message_codec.hpp"
#include "helpers/session_harness.hpp"
#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace rdlink;
using namespace rdlink::test_helpers;
using client::SessionState;
using protocol::FrameCodec;
using protocol::FrameDecoder;
using protocol::MessageBuilder;

namespace {

void DeliverInRandomChunks(
    const FakeChannelState& channel,
    const std::vector<uint8_t>& stream,
    std::mt19937& gen,
    const size_t max_chunk) {

    std::uniform_int_distribution<size_t> chunk_dist(1, max_chunk);
    size_t offset = 0;
    while (offset < stream.size()) {
        const size_t length = std::min(chunk_dist(gen), stream.size() - offset);
        channel.Deliver(std::span<const uint8_t>(stream.data() + offset, length));
        offset += length;
    }
}

std::vector<uint8_t> RandomBytes(std::mt19937& gen, const size_t length) {
    std::uniform_int_distribution<int> byte_dist(0, 255);
    std::vector<uint8_t> bytes(length);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(byte_dist(gen));
    }
    return bytes;
}

}

TEST_CASE("Fuzzing - Frame decoder under random chunking", "[fuzzing][framing]") {
    std::mt19937 gen(1337);

    SECTION("500 streams reassemble exactly regardless of chunk boundaries") {
        std::uniform_int_distribution<size_t> count_dist(1, 12);
        std::uniform_int_distribution<size_t> size_dist(0, 20'000);

        for (int round = 0; round < 500; ++round) {
            std::vector<std::vector<uint8_t>> payloads;
            std::vector<uint8_t> stream;
            const size_t count = count_dist(gen);
            for (size_t i = 0; i < count; ++i) {
                payloads.push_back(RandomBytes(gen, size_dist(gen) % (round % 3 == 0 ? 20'000 : 200)));
                const auto frame = FrameCodec::Encode(payloads.back()).Unwrap();
                stream.insert(stream.end(), frame.begin(), frame.end());
            }

            FrameDecoder decoder;
            std::vector<std::vector<uint8_t>> decoded;
            std::uniform_int_distribution<size_t> chunk_dist(1, 97);
            size_t offset = 0;
            while (offset < stream.size()) {
                const size_t length = std::min(chunk_dist(gen), stream.size() - offset);
                for (auto& payload : decoder.Feed(std::span<const uint8_t>(stream.data() + offset, length))) {
                    decoded.push_back(std::move(payload));
                }
                offset += length;
            }

            REQUIRE(decoded == payloads);
            REQUIRE(decoder.BufferedBytes() == 0);
        }
    }

    SECTION("Random garbage never yields more payload bytes than were fed") {
        for (int round = 0; round < 1'000; ++round) {
            FrameDecoder decoder;
            const auto garbage = RandomBytes(gen, 1 + static_cast<size_t>(round % 64));
            size_t produced = 0;
            for (const auto& payload : decoder.Feed(garbage)) {
                produced += payload.size();
            }
            REQUIRE(produced + decoder.BufferedBytes() <= garbage.size());
        }
    }
}

TEST_CASE("Fuzzing - Relay stream split at random points", "[fuzzing][session]") {
    std::mt19937 gen(2024);

    for (int round = 0; round < 25; ++round) {
        SessionHarness harness;
        harness.ReachStreaming();

        std::vector<uint8_t> stream;
        std::vector<std::string> expected;
        for (int i = 0; i < 40; ++i) {
            expected.push_back("chat " + std::to_string(round) + "/" + std::to_string(i) +
                               std::string(static_cast<size_t>(i * 7), 'x'));
            const auto frame = harness.peer.SealedFrame(MessageBuilder::ChatMessage(expected.back()));
            stream.insert(stream.end(), frame.begin(), frame.end());
        }

        DeliverInRandomChunks(*harness.Relay(), stream, gen, 1 + static_cast<size_t>(round * 13));

        REQUIRE(harness.client->State() == SessionState::Streaming);
        REQUIRE(harness.events->chats == expected);
        REQUIRE(harness.client->GetStats().receive_counter >= 40);
    }
}

TEST_CASE("Fuzzing - Garbage on every channel", "[fuzzing][session]") {
    std::mt19937 gen(99);

    SECTION("Random discovery replies never open a relay for an unverified peer") {
        for (int round = 0; round < 200; ++round) {
            SessionHarness harness;
            harness.ReachDiscovery();
            const auto payload = RandomBytes(gen, 1 + static_cast<size_t>(round % 120));
            harness.Discovery()->Deliver(FrameCodec::Encode(payload).Unwrap());
            REQUIRE(harness.bridge->CountOpened(ChannelKind::Relay) == 0);
            REQUIRE((harness.client->State() == SessionState::Connecting ||
                     harness.client->State() == SessionState::Error));
        }
    }

    SECTION("Random relay payloads before the proof never reach the key exchange") {
        for (int round = 0; round < 200; ++round) {
            SessionHarness harness;
            harness.ReachRelay();
            const auto payload = RandomBytes(gen, 1 + static_cast<size_t>(round % 120));
            harness.Relay()->Deliver(FrameCodec::Encode(payload).Unwrap());
            REQUIRE(harness.Relay()->SentPayloads().size() == 1);
            REQUIRE(harness.client->State() != SessionState::WaitingPassword);
        }
    }

    SECTION("Random sealed-channel traffic always ends the session cleanly") {
        for (int round = 0; round < 100; ++round) {
            SessionHarness harness;
            harness.ReachStreaming();
            const auto payload = RandomBytes(gen, 1 + static_cast<size_t>(round % 200));
            harness.Relay()->Deliver(FrameCodec::Encode(payload).Unwrap());
            REQUIRE(harness.client->State() == SessionState::Disconnected);
            REQUIRE(harness.sink->releases == 1);
            REQUIRE(harness.timers->PendingCount() == 0);
        }
    }

    SECTION("Sealed messages of unknown kinds are skipped") {
        SessionHarness harness;
        harness.ReachStreaming();
        for (int round = 0; round < 50; ++round) {
            harness.Relay()->Deliver(FrameCodec::Encode(harness.peer.SealedPayload(proto::peer::Message())).Unwrap());
        }
        REQUIRE(harness.client->State() == SessionState::Streaming);
        harness.DeliverSealed(MessageBuilder::ChatMessage("still here"));
        REQUIRE(harness.events->chats == std::vector<std::string>{"still here"});
    }
}
