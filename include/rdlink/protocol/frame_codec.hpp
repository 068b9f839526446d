#pragma once

#include "rdlink/core/result.hpp"
#include "rdlink/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rdlink::protocol {

/**
 * @brief Length-prefixed envelope used on both the discovery and relay streams
 *
 * The low two bits of the first header byte hold (header length - 1). The
 * little-endian header value shifted right by two is the payload length.
 */
class FrameCodec {
public:
    static constexpr size_t MAX_HEADER_LEN = 4;
    static constexpr size_t MAX_PAYLOAD_LEN = 0x3FFFFFFF;

    /**
     * @brief Prefix @p payload with the smallest header that fits it
     *
     * @return Ok(frame) or Err(InvalidInput) if the payload exceeds MAX_PAYLOAD_LEN
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Encode(
        std::span<const uint8_t> payload);

    /**
     * @brief Header size for a payload of @p payload_len bytes, 0 if it cannot be framed
     */
    [[nodiscard]] static constexpr size_t HeaderLength(size_t payload_len) noexcept {
        if (payload_len <= 0x3F) {
            return 1;
        }
        if (payload_len <= 0x3FFF) {
            return 2;
        }
        if (payload_len <= 0x3FFFFF) {
            return 3;
        }
        if (payload_len <= MAX_PAYLOAD_LEN) {
            return 4;
        }
        return 0;
    }

private:
    FrameCodec() = delete;
};

/**
 * @brief Incremental reassembler for one inbound stream
 *
 * Chunk boundaries are arbitrary: a chunk may hold part of a header, part of
 * a payload, or several complete frames.
 */
class FrameDecoder {
public:
    static constexpr size_t MIN_CAPACITY = 4096;

    FrameDecoder() = default;

    /**
     * @brief Append @p chunk and return every payload it completes, in order
     */
    std::vector<std::vector<uint8_t>> Feed(std::span<const uint8_t> chunk);

    void Reset() noexcept;

    [[nodiscard]] size_t BufferedBytes() const noexcept {
        return write_pos_ - read_pos_;
    }

    [[nodiscard]] size_t Capacity() const noexcept {
        return buffer_.size();
    }

private:
    void Reserve(size_t additional);
    void Compact() noexcept;

    std::vector<uint8_t> buffer_;
    size_t read_pos_ = 0;
    size_t write_pos_ = 0;
};

} // namespace rdlink::protocol
