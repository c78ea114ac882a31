#include "flipdot/protocol/FrameCodec.hpp"

#include "flipdot/core/Errors.hpp"
#include "flipdot/protocol/ByteBuffer.hpp"

#include <algorithm>
#include <utility>

namespace flipdot::protocol {

namespace {

// len + addr_hi + addr_lo + type + checksum
constexpr std::size_t RAW_OVERHEAD = 5;
constexpr std::size_t HEADER_SIZE = 4;

int hexValue(std::uint8_t c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::error_code frameError(FrameError e) {
    return make_error_code(e);
}

} // namespace

FrameCodec::FrameCodec(FrameFormat format)
: format_(std::move(format))
{
    if (!format_.checksum) {
        format_.checksum = checksum::negatedSum;
    }
}

std::size_t FrameCodec::minimumFrameSize() const {
    const std::size_t body = format_.encoding == FrameEncoding::AsciiHex ? RAW_OVERHEAD * 2 : RAW_OVERHEAD;
    return 1 + body + (format_.crlfTerminator ? 2 : 0);
}

std::vector<std::uint8_t> FrameCodec::encodeFrame(const Frame& frame) const {
    ByteBuffer raw;
    if (format_.checksumCoversMarker) {
        raw.appendUInt8(format_.startMarker);
    }
    raw.appendBytes(frame.rawBytes());
    const auto sum = format_.checksum(raw.data(), raw.size());

    std::vector<std::uint8_t> body = frame.rawBytes();
    body.push_back(sum);

    ByteBuffer out;
    out.appendUInt8(format_.startMarker);
    if (format_.encoding == FrameEncoding::AsciiHex) {
        out.appendHex(body);
    } else {
        out.appendBytes(body);
    }
    if (format_.crlfTerminator) {
        out.appendChar('\r');
        out.appendChar('\n');
    }
    return out.release();
}

expected<Frame> FrameCodec::decodeFrame(const std::uint8_t* data, std::size_t size) const {
    if (!data) {
        return unexpected(frameError(FrameError::Truncated));
    }

    std::size_t end = size;
    if (format_.crlfTerminator) {
        while (end > 0 && (data[end - 1] == '\n' || data[end - 1] == '\r')) {
            --end;
        }
    }

    const std::size_t minBody = format_.encoding == FrameEncoding::AsciiHex ? RAW_OVERHEAD * 2 : RAW_OVERHEAD;
    if (end < 1 + minBody) {
        return unexpected(frameError(FrameError::Truncated));
    }

    std::vector<std::uint8_t> body;
    if (format_.encoding == FrameEncoding::Binary) {
        // Checksum over marker + raw bytes, so a flipped marker shows up here.
        const std::size_t coveredStart = format_.checksumCoversMarker ? 0 : 1;
        const auto expectedSum = format_.checksum(data + coveredStart, end - 1 - coveredStart);
        if (expectedSum != data[end - 1]) {
            return unexpected(frameError(FrameError::ChecksumMismatch));
        }
        if (data[0] != format_.startMarker) {
            return unexpected(frameError(FrameError::Malformed));
        }
        body.assign(data + 1, data + end);
    } else {
        if (data[0] != format_.startMarker) {
            return unexpected(frameError(FrameError::Malformed));
        }
        const std::size_t digits = end - 1;
        if (digits % 2 != 0) {
            return unexpected(frameError(FrameError::Malformed));
        }
        body.reserve(digits / 2);
        for (std::size_t i = 1; i < end; i += 2) {
            const int hi = hexValue(data[i]);
            const int lo = hexValue(data[i + 1]);
            if (hi < 0 || lo < 0) {
                return unexpected(frameError(FrameError::Malformed));
            }
            body.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }

        ByteBuffer covered;
        if (format_.checksumCoversMarker) {
            covered.appendUInt8(format_.startMarker);
        }
        covered.appendBytes(body.data(), body.size() - 1);
        if (format_.checksum(covered.data(), covered.size()) != body.back()) {
            return unexpected(frameError(FrameError::ChecksumMismatch));
        }
    }

    const std::size_t declared = body[0];
    const std::size_t actual = body.size() - RAW_OVERHEAD;
    if (declared > actual) {
        return unexpected(frameError(FrameError::Truncated));
    }
    if (declared < actual) {
        return unexpected(frameError(FrameError::Malformed));
    }

    const Address address{static_cast<std::uint16_t>((body[1] << 8) | body[2])};
    const MsgType type{body[3]};
    std::vector<std::uint8_t> payload(body.begin() + HEADER_SIZE, body.end() - 1);
    return Frame::create(address, type, std::move(payload));
}

std::vector<std::uint8_t> FrameCodec::encode(const Message& message) const {
    return encodeFrame(message.toFrame());
}

expected<Message> FrameCodec::decode(const std::uint8_t* data, std::size_t size) const {
    return decodeFrame(data, size).and_then([](const Frame& frame) {
        return Message::fromFrame(frame);
    });
}

std::size_t FrameCodec::scanFrame(const std::uint8_t* data, std::size_t size) const {
    if (!data || size == 0) {
        return 0;
    }

    if (format_.crlfTerminator) {
        const auto* newline = std::find(data, data + size, static_cast<std::uint8_t>('\n'));
        return newline == data + size ? 0 : static_cast<std::size_t>(newline - data) + 1;
    }

    const auto* marker = std::find(data, data + size, format_.startMarker);
    if (marker == data + size) {
        return 0;
    }
    const std::size_t start = static_cast<std::size_t>(marker - data);
    const std::size_t available = size - start - 1;

    std::size_t dataLength = 0;
    std::size_t bytesPerRaw = 1;
    if (format_.encoding == FrameEncoding::AsciiHex) {
        bytesPerRaw = 2;
        if (available < 2) {
            return 0;
        }
        const int hi = hexValue(marker[1]);
        const int lo = hexValue(marker[2]);
        if (hi < 0 || lo < 0) {
            // Garbage length: hand back marker + 2 chars so the caller can drop them.
            return start + 3;
        }
        dataLength = static_cast<std::size_t>((hi << 4) | lo);
    } else {
        if (available < 1) {
            return 0;
        }
        dataLength = marker[1];
    }

    const std::size_t frameSize = 1 + (RAW_OVERHEAD + dataLength) * bytesPerRaw;
    if (size - start < frameSize) {
        return 0;
    }
    return start + frameSize;
}

} // namespace flipdot::protocol
