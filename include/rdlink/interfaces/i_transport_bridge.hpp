#pragma once
#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
namespace rdlink::interfaces {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
enum class ChannelKind : uint8_t {
    Discovery,
    Relay
};
[[nodiscard]] constexpr std::string_view ToString(const ChannelKind kind) noexcept {
    return kind == ChannelKind::Discovery ? "discovery" : "relay";
}
// Receives events for one channel. Chunk boundaries carry no meaning.
class ITransportChannelHandler {
public:
    virtual ~ITransportChannelHandler() = default;
    virtual void OnOpen() = 0;
    virtual void OnMessage(std::span<const uint8_t> chunk) = 0;
    virtual void OnClose(const std::string& reason) = 0;
    virtual void OnError(const std::string& message) = 0;
};
class ITransportChannel {
public:
    virtual ~ITransportChannel() = default;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Send(std::span<const uint8_t> data) = 0;
    // Idempotent. No handler callbacks are delivered after Close returns.
    virtual void Close() = 0;
};
class ITransportBridge {
public:
    virtual ~ITransportBridge() = default;
    // The handler must not be called before Open returns.
    [[nodiscard]] virtual Result<std::unique_ptr<ITransportChannel>, ProtocolFailure> Open(
        ChannelKind kind,
        std::shared_ptr<ITransportChannelHandler> handler) = 0;
};
}
