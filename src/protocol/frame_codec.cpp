#include "rdlink/protocol/frame_codec.hpp"
#include "rdlink/core/format.hpp"

#include <algorithm>
#include <cstring>

namespace rdlink::protocol {

Result<std::vector<uint8_t>, ProtocolFailure> FrameCodec::Encode(
    std::span<const uint8_t> payload) {

    const size_t header_len = HeaderLength(payload.size());
    if (header_len == 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("Payload of {} bytes exceeds frame limit of {} bytes",
                               payload.size(), MAX_PAYLOAD_LEN)));
    }

    const uint32_t header_value =
        (static_cast<uint32_t>(payload.size()) << 2) | static_cast<uint32_t>(header_len - 1);

    std::vector<uint8_t> frame(header_len + payload.size());
    for (size_t i = 0; i < header_len; ++i) {
        frame[i] = static_cast<uint8_t>((header_value >> (8 * i)) & 0xFF);
    }
    if (!payload.empty()) {
        std::memcpy(frame.data() + header_len, payload.data(), payload.size());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(frame));
}

std::vector<std::vector<uint8_t>> FrameDecoder::Feed(std::span<const uint8_t> chunk) {
    std::vector<std::vector<uint8_t>> payloads;

    if (!chunk.empty()) {
        Reserve(chunk.size());
        std::memcpy(buffer_.data() + write_pos_, chunk.data(), chunk.size());
        write_pos_ += chunk.size();
    }

    while (BufferedBytes() > 0) {
        const uint8_t* head = buffer_.data() + read_pos_;
        const size_t header_len = static_cast<size_t>(head[0] & 0x03) + 1;
        if (BufferedBytes() < header_len) {
            break;
        }

        uint32_t header_value = 0;
        for (size_t i = 0; i < header_len; ++i) {
            header_value |= static_cast<uint32_t>(head[i]) << (8 * i);
        }
        const size_t payload_len = header_value >> 2;
        if (BufferedBytes() < header_len + payload_len) {
            break;
        }

        payloads.emplace_back(head + header_len, head + header_len + payload_len);
        read_pos_ += header_len + payload_len;
    }

    if (read_pos_ == write_pos_) {
        read_pos_ = 0;
        write_pos_ = 0;
    }
    return payloads;
}

void FrameDecoder::Reset() noexcept {
    read_pos_ = 0;
    write_pos_ = 0;
}

void FrameDecoder::Reserve(size_t additional) {
    if (write_pos_ + additional <= buffer_.size()) {
        return;
    }
    Compact();
    const size_t needed = write_pos_ + additional;
    if (needed <= buffer_.size()) {
        return;
    }
    buffer_.resize(std::max({needed, buffer_.size() * 2, MIN_CAPACITY}));
}

void FrameDecoder::Compact() noexcept {
    if (read_pos_ == 0) {
        return;
    }
    const size_t pending = write_pos_ - read_pos_;
    if (pending > 0) {
        std::memmove(buffer_.data(), buffer_.data() + read_pos_, pending);
    }
    read_pos_ = 0;
    write_pos_ = pending;
}

} // namespace rdlink::protocol
