#pragma once
#include "rdlink/client/session_state.hpp"
#include "rdlink/client/session_stats.hpp"
#include "peer/message.pb.h"
#include <chrono>
#include <string>
namespace rdlink::interfaces {
class IClientEventHandler {
public:
    virtual ~IClientEventHandler() = default;
    virtual void OnStateChanged(client::SessionState state, client::SessionState previous) = 0;
    virtual void OnLog(const std::string& message) = 0;
    virtual void OnError(const std::string& message) = 0;
    virtual void OnPasswordRequired() = 0;
    virtual void OnLoginError(const std::string& message) = 0;
    virtual void OnPeerInfo(const proto::peer::PeerInfo& info) = 0;
    virtual void OnStats(const client::SessionStats& stats) = 0;
    virtual void OnChat(const std::string& text) = 0;
    virtual void OnLatency(std::chrono::milliseconds round_trip) = 0;
    virtual void OnDisconnected(const std::string& reason) = 0;
    virtual void OnClipboard(const std::string& text) = 0;
    virtual void OnOptionNotice(const proto::peer::OptionMessage& option) = 0;
    virtual void OnPermissionNotice(const proto::peer::PermissionInfo& permission) = 0;
};
}
