#pragma once
#include "rdlink/interfaces/i_transport_bridge.hpp"
#include "rdlink/protocol/frame_codec.hpp"
#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace rdlink::test_helpers {

using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
using interfaces::ChannelKind;
using interfaces::ITransportBridge;
using interfaces::ITransportChannel;
using interfaces::ITransportChannelHandler;

// Shared between the bridge (test side) and the channel handed to the client.
struct FakeChannelState {
    ChannelKind kind = ChannelKind::Discovery;
    std::shared_ptr<ITransportChannelHandler> handler;
    std::vector<std::vector<uint8_t>> sent_chunks;
    bool closed = false;
    bool fail_sends = false;

    // Reassembles everything the client sent into frame payloads.
    [[nodiscard]] std::vector<std::vector<uint8_t>> SentPayloads() const {
        protocol::FrameDecoder decoder;
        std::vector<std::vector<uint8_t>> payloads;
        for (const auto& chunk : sent_chunks) {
            for (auto& payload : decoder.Feed(chunk)) {
                payloads.push_back(std::move(payload));
            }
        }
        return payloads;
    }

    void Open() const { handler->OnOpen(); }

    void Deliver(std::span<const uint8_t> chunk) const { handler->OnMessage(chunk); }

    void RemoteClose(const std::string& reason) const { handler->OnClose(reason); }

    void RemoteError(const std::string& message) const { handler->OnError(message); }
};

class FakeTransportChannel final : public ITransportChannel {
public:
    explicit FakeTransportChannel(std::shared_ptr<FakeChannelState> state)
        : state_(std::move(state)) {}

    [[nodiscard]] Result<Unit, ProtocolFailure> Send(std::span<const uint8_t> data) override {
        if (state_->closed) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Transport("Fake channel closed"));
        }
        if (state_->fail_sends) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Transport("Fake send failure"));
        }
        state_->sent_chunks.emplace_back(data.begin(), data.end());
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    void Close() override { state_->closed = true; }

private:
    std::shared_ptr<FakeChannelState> state_;
};

class FakeTransportBridge final : public ITransportBridge {
public:
    [[nodiscard]] Result<std::unique_ptr<ITransportChannel>, ProtocolFailure> Open(
        const ChannelKind kind,
        std::shared_ptr<ITransportChannelHandler> handler) override {
        if (refuse_opens) {
            return Result<std::unique_ptr<ITransportChannel>, ProtocolFailure>::Err(
                ProtocolFailure::Transport("Fake bridge refused to open"));
        }
        auto state = std::make_shared<FakeChannelState>();
        state->kind = kind;
        state->handler = std::move(handler);
        channels.push_back(state);
        return Result<std::unique_ptr<ITransportChannel>, ProtocolFailure>::Ok(
            std::make_unique<FakeTransportChannel>(state));
    }

    [[nodiscard]] std::shared_ptr<FakeChannelState> Latest(const ChannelKind kind) const {
        for (auto it = channels.rbegin(); it != channels.rend(); ++it) {
            if ((*it)->kind == kind) {
                return *it;
            }
        }
        return nullptr;
    }

    [[nodiscard]] size_t CountOpened(const ChannelKind kind) const {
        size_t count = 0;
        for (const auto& channel : channels) {
            if (channel->kind == kind) {
                ++count;
            }
        }
        return count;
    }

    std::vector<std::shared_ptr<FakeChannelState>> channels;
    bool refuse_opens = false;
};

} // namespace rdlink::test_helpers
