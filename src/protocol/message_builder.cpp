#include "rdlink/protocol/message_builder.hpp"
#include "rdlink/protocol/constants.hpp"

namespace rdlink::protocol {

namespace {

using BoolOption = proto::peer::OptionMessage::BoolOption;

BoolOption ToBoolOption(const bool value) {
    return value ? proto::peer::OptionMessage::Yes : proto::peer::OptionMessage::No;
}

void AddModifiers(
    google::protobuf::RepeatedField<int>* target,
    std::span<const proto::peer::ControlKey> modifiers) {
    for (const auto modifier : modifiers) {
        target->Add(static_cast<int>(modifier));
    }
}

} // namespace

proto::discovery::RendezvousMessage MessageBuilder::PunchHoleRequest(
    std::string_view target_id,
    std::string_view licence_key,
    const bool force_relay,
    std::string_view version) {

    proto::discovery::RendezvousMessage message;
    auto* request = message.mutable_punch_hole_request();
    request->set_id(std::string(target_id));
    request->set_nat_type(proto::discovery::SYMMETRIC);
    request->set_licence_key(std::string(licence_key));
    request->set_conn_type(proto::discovery::DEFAULT_CONN);
    request->set_version(std::string(version));
    request->set_force_relay(force_relay);
    return message;
}

proto::discovery::RendezvousMessage MessageBuilder::RequestRelay(
    std::string_view target_id,
    std::string_view uuid,
    std::string_view relay_server,
    std::string_view licence_key) {

    proto::discovery::RendezvousMessage message;
    auto* request = message.mutable_request_relay();
    request->set_id(std::string(target_id));
    request->set_uuid(std::string(uuid));
    request->set_relay_server(std::string(relay_server));
    request->set_licence_key(std::string(licence_key));
    request->set_secure(false);
    request->set_conn_type(proto::discovery::DEFAULT_CONN);
    return message;
}

proto::peer::Message MessageBuilder::KeyExchange(
    std::span<const uint8_t> local_public_key,
    std::span<const uint8_t> sealed_key) {

    proto::peer::Message message;
    auto* public_key = message.mutable_public_key();
    public_key->set_asymmetric_value(local_public_key.data(), local_public_key.size());
    public_key->set_symmetric_value(sealed_key.data(), sealed_key.size());
    return message;
}

proto::peer::Message MessageBuilder::LoginRequest(const LoginIntent& intent) {
    proto::peer::Message message;
    auto* login = message.mutable_login_request();
    login->set_username(intent.username);
    login->set_password(intent.password_hash.data(), intent.password_hash.size());
    login->set_my_id(intent.my_id);
    login->set_my_name(intent.my_name);
    login->set_my_platform(intent.my_platform);
    login->set_version(intent.version);
    login->set_session_id(intent.session_id);

    auto* option = login->mutable_option();
    option->set_image_quality(intent.image_quality);
    option->set_custom_fps(intent.custom_fps);
    option->set_show_remote_cursor(ToBoolOption(intent.show_remote_cursor));
    option->set_disable_audio(ToBoolOption(intent.disable_audio));
    option->set_disable_clipboard(ToBoolOption(intent.disable_clipboard));
    option->set_lock_after_session_end(ToBoolOption(intent.lock_after_session_end));

    auto* decoding = option->mutable_supported_decoding();
    decoding->set_ability_h264(1);
    decoding->set_prefer(proto::peer::SupportedDecoding::H264);
    return message;
}

proto::peer::Message MessageBuilder::MouseEvent(
    const int32_t mask,
    const int32_t x,
    const int32_t y,
    std::span<const proto::peer::ControlKey> modifiers) {

    proto::peer::Message message;
    auto* mouse = message.mutable_mouse_event();
    mouse->set_mask(mask);
    mouse->set_x(x);
    mouse->set_y(y);
    AddModifiers(mouse->mutable_modifiers(), modifiers);
    return message;
}

proto::peer::Message MessageBuilder::ControlKeyEvent(
    const proto::peer::ControlKey key,
    const bool down,
    const bool press,
    std::span<const proto::peer::ControlKey> modifiers) {

    proto::peer::Message message;
    auto* event = message.mutable_key_event();
    event->set_control_key(key);
    event->set_down(down);
    event->set_press(press);
    event->set_mode(proto::peer::Legacy);
    AddModifiers(event->mutable_modifiers(), modifiers);
    return message;
}

proto::peer::Message MessageBuilder::UnicodeKeyEvent(
    const uint32_t code_point,
    const bool down,
    const bool press,
    std::span<const proto::peer::ControlKey> modifiers) {

    proto::peer::Message message;
    auto* event = message.mutable_key_event();
    event->set_unicode(code_point);
    event->set_down(down);
    event->set_press(press);
    event->set_mode(proto::peer::Legacy);
    AddModifiers(event->mutable_modifiers(), modifiers);
    return message;
}

proto::peer::Message MessageBuilder::SequenceKeyEvent(std::string_view sequence) {
    proto::peer::Message message;
    auto* event = message.mutable_key_event();
    event->set_seq(std::string(sequence));
    event->set_press(true);
    event->set_mode(proto::peer::Legacy);
    return message;
}

proto::peer::Message MessageBuilder::ControlKeyShortcut(const proto::peer::ControlKey key) {
    return ControlKeyEvent(key, true, true);
}

proto::peer::Message MessageBuilder::TestDelay(const int64_t time_ms, const bool from_client) {
    proto::peer::Message message;
    auto* delay = message.mutable_test_delay();
    delay->set_time(time_ms);
    delay->set_from_client(from_client);
    return message;
}

proto::peer::Message MessageBuilder::Clipboard(std::string_view text) {
    proto::peer::Message message;
    auto* clipboard = message.mutable_clipboard();
    clipboard->set_compress(false);
    clipboard->set_content(text.data(), text.size());
    clipboard->set_format(proto::peer::Text);
    return message;
}

proto::peer::Message MessageBuilder::ChatMessage(std::string_view text) {
    proto::peer::Message message;
    message.mutable_misc()->mutable_chat_message()->set_text(std::string(text));
    return message;
}

proto::peer::Message MessageBuilder::OptionChange(const OptionPatch& patch) {
    proto::peer::Message message;
    auto* option = message.mutable_misc()->mutable_option();
    if (patch.image_quality) {
        option->set_image_quality(*patch.image_quality);
    }
    if (patch.custom_image_quality) {
        option->set_custom_image_quality(*patch.custom_image_quality);
    }
    if (patch.custom_fps) {
        option->set_custom_fps(*patch.custom_fps);
    }
    if (patch.lock_after_session_end) {
        option->set_lock_after_session_end(ToBoolOption(*patch.lock_after_session_end));
    }
    if (patch.show_remote_cursor) {
        option->set_show_remote_cursor(ToBoolOption(*patch.show_remote_cursor));
    }
    if (patch.privacy_mode) {
        option->set_privacy_mode(ToBoolOption(*patch.privacy_mode));
    }
    if (patch.block_input) {
        option->set_block_input(ToBoolOption(*patch.block_input));
    }
    if (patch.disable_audio) {
        option->set_disable_audio(ToBoolOption(*patch.disable_audio));
    }
    if (patch.disable_clipboard) {
        option->set_disable_clipboard(ToBoolOption(*patch.disable_clipboard));
    }
    if (patch.disable_keyboard) {
        option->set_disable_keyboard(ToBoolOption(*patch.disable_keyboard));
    }
    return message;
}

proto::peer::Message MessageBuilder::Misc(const MiscFlag flag) {
    proto::peer::Message message;
    auto* misc = message.mutable_misc();
    switch (flag) {
        case MiscFlag::RefreshVideo:
            misc->set_refresh_video(true);
            break;
        case MiscFlag::VideoReceived:
            misc->set_video_received(true);
            break;
        case MiscFlag::RestartRemoteDevice:
            misc->set_restart_remote_device(true);
            break;
    }
    return message;
}

proto::peer::Message MessageBuilder::TogglePrivacyMode(const bool on) {
    proto::peer::Message message;
    auto* toggle = message.mutable_misc()->mutable_toggle_privacy_mode();
    toggle->set_impl_key(std::string(kPrivacyModeImplKey));
    toggle->set_on(on);
    return message;
}

proto::peer::Message MessageBuilder::SwitchDisplay(const int32_t display) {
    proto::peer::Message message;
    message.mutable_misc()->mutable_switch_display()->set_display(display);
    return message;
}

} // namespace rdlink::protocol
