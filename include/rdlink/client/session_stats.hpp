#pragma once
#include "rdlink/client/session_state.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
namespace rdlink::client {
struct SessionStats {
    SessionState state = SessionState::Idle;
    uint64_t sequence_id = 0;
    uint64_t frames_sent = 0;
    uint64_t frames_received = 0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t video_frames = 0;
    uint64_t audio_frames = 0;
    uint64_t send_counter = 0;
    uint64_t receive_counter = 0;
    std::optional<std::chrono::milliseconds> last_latency;
    std::chrono::milliseconds uptime{0};
};
}
