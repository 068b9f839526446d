#pragma once
#include "rdlink/protocol/message_codec.hpp"
#include "peer/message.pb.h"
#include <cstdint>
#include <span>
#include <string>
namespace rdlink::interfaces {
enum class ScaleMode : uint8_t {
    Fit,
    Fill,
    Original,
    Stretch
};
// Decoding and rendering live outside the core; this is where decoded
// session media is handed off.
class IPresentationSink {
public:
    virtual ~IPresentationSink() = default;
    virtual void Start() = 0;
    virtual void Release() = 0;
    virtual void OnVideoFrame(
        protocol::VideoCodec codec,
        std::span<const uint8_t> data,
        bool key_frame,
        int64_t pts,
        int32_t display) = 0;
    virtual void OnAudioFormat(uint32_t sample_rate, uint32_t channels) = 0;
    virtual void OnAudioFrame(std::span<const uint8_t> data) = 0;
    virtual void OnCursorData(const proto::peer::CursorData& cursor) = 0;
    virtual void OnCursorPosition(int32_t x, int32_t y) = 0;
    virtual void OnCursorId(uint64_t id) = 0;
    virtual void OnSwitchDisplay(const proto::peer::SwitchDisplay& display) = 0;
    virtual void SetScaleMode(ScaleMode mode) = 0;
};
}
