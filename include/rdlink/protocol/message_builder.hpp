#pragma once

#include "discovery/rendezvous.pb.h"
#include "peer/message.pb.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rdlink::protocol {

/**
 * @brief Option values to change; unset members are left out of the message
 */
struct OptionPatch {
    std::optional<proto::peer::ImageQuality> image_quality;
    std::optional<int32_t> custom_image_quality;
    std::optional<int32_t> custom_fps;
    std::optional<bool> lock_after_session_end;
    std::optional<bool> show_remote_cursor;
    std::optional<bool> privacy_mode;
    std::optional<bool> block_input;
    std::optional<bool> disable_audio;
    std::optional<bool> disable_clipboard;
    std::optional<bool> disable_keyboard;
};

struct LoginIntent {
    std::string username;
    std::vector<uint8_t> password_hash;
    std::string my_id;
    std::string my_name;
    std::string my_platform;
    std::string version;
    uint64_t session_id = 0;
    proto::peer::ImageQuality image_quality = proto::peer::Balanced;
    int32_t custom_fps = 30;
    bool show_remote_cursor = true;
    bool disable_audio = false;
    bool disable_clipboard = false;
    bool lock_after_session_end = false;
};

enum class MiscFlag {
    RefreshVideo,
    VideoReceived,
    RestartRemoteDevice
};

/**
 * @brief Outbound message construction from caller intent
 *
 * Field encodings follow what deployed peers expect: tri-state options use
 * BoolOption (No / Yes, never NotSet), shortcuts are control-key presses.
 */
class MessageBuilder {
public:
    // ========================================================================
    // Discovery family
    // ========================================================================

    static proto::discovery::RendezvousMessage PunchHoleRequest(
        std::string_view target_id,
        std::string_view licence_key,
        bool force_relay,
        std::string_view version);

    static proto::discovery::RendezvousMessage RequestRelay(
        std::string_view target_id,
        std::string_view uuid,
        std::string_view relay_server,
        std::string_view licence_key);

    // ========================================================================
    // Peer family
    // ========================================================================

    static proto::peer::Message KeyExchange(
        std::span<const uint8_t> local_public_key,
        std::span<const uint8_t> sealed_key);

    static proto::peer::Message LoginRequest(const LoginIntent& intent);

    static proto::peer::Message MouseEvent(
        int32_t mask,
        int32_t x,
        int32_t y,
        std::span<const proto::peer::ControlKey> modifiers = {});

    static proto::peer::Message ControlKeyEvent(
        proto::peer::ControlKey key,
        bool down,
        bool press,
        std::span<const proto::peer::ControlKey> modifiers = {});

    static proto::peer::Message UnicodeKeyEvent(
        uint32_t code_point,
        bool down,
        bool press,
        std::span<const proto::peer::ControlKey> modifiers = {});

    static proto::peer::Message SequenceKeyEvent(std::string_view sequence);

    /**
     * @brief Single press of a combined key such as CtrlAltDel or LockScreen
     */
    static proto::peer::Message ControlKeyShortcut(proto::peer::ControlKey key);

    static proto::peer::Message TestDelay(int64_t time_ms, bool from_client);

    static proto::peer::Message Clipboard(std::string_view text);

    static proto::peer::Message ChatMessage(std::string_view text);

    static proto::peer::Message OptionChange(const OptionPatch& patch);

    static proto::peer::Message Misc(MiscFlag flag);

    static proto::peer::Message TogglePrivacyMode(bool on);

    static proto::peer::Message SwitchDisplay(int32_t display);

private:
    MessageBuilder() = delete;
};

} // namespace rdlink::protocol
