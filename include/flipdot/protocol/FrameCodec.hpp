// FrameCodec.hpp
// -----------------------------------------------------------------------------
// Converts between Message / Frame values and wire bytes for one FrameFormat.
// The codec is stateless apart from its format, so one instance can be shared
// by any number of threads.

#pragma once

#include "flipdot/core/Expected.hpp"
#include "flipdot/protocol/Frame.hpp"
#include "flipdot/protocol/FrameFormat.hpp"
#include "flipdot/protocol/Message.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace flipdot::protocol {

class FrameCodec {
public:
    explicit FrameCodec(FrameFormat format = FrameFormat::luminator());

    const FrameFormat& format() const { return format_; }

    std::vector<std::uint8_t> encodeFrame(const Frame& frame) const;

    /**
     * @brief Parse one complete wire frame.
     *
     * Failures, checked in this order:
     * - FrameError::Truncated when shorter than the smallest possible frame
     * - FrameError::Malformed for a bad marker or a non-hex digit (text formats)
     * - FrameError::ChecksumMismatch
     * - FrameError::Truncated / Malformed when the declared length is
     *   shorter / longer than the body actually received
     *
     * Binary formats checksum the marker and verify it first, so a corrupted
     * marker byte also reports ChecksumMismatch.
     */
    expected<Frame> decodeFrame(const std::uint8_t* data, std::size_t size) const;
    expected<Frame> decodeFrame(const std::vector<std::uint8_t>& bytes) const {
        return decodeFrame(bytes.data(), bytes.size());
    }

    std::vector<std::uint8_t> encode(const Message& message) const;

    /// decodeFrame() followed by Message::fromFrame().
    expected<Message> decode(const std::uint8_t* data, std::size_t size) const;
    expected<Message> decode(const std::vector<std::uint8_t>& bytes) const {
        return decode(bytes.data(), bytes.size());
    }

    /**
     * @brief Length of the first complete frame in a receive buffer, or 0.
     *
     * CRLF formats end at the first '\n'. Other formats use the length byte,
     * counted from the first start marker. Any noise before the marker is
     * included in the returned span.
     */
    std::size_t scanFrame(const std::uint8_t* data, std::size_t size) const;

    /// Smallest encoded frame (no data bytes), terminator included.
    std::size_t minimumFrameSize() const;

private:
    FrameFormat format_;
};

} // namespace flipdot::protocol
