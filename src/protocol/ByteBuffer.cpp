#include "flipdot/protocol/ByteBuffer.hpp"

#include <utility>

namespace flipdot::protocol {

ByteBuffer::ByteBuffer() {
    buffer.reserve(64); // largest ASCII frame is ~520 bytes, but nearly all are under 40
}

void ByteBuffer::clear() {
    buffer.clear();
}

void ByteBuffer::appendChar(char value) {
    buffer.push_back(static_cast<std::uint8_t>(value));
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendUInt16(std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void ByteBuffer::appendBytes(const std::uint8_t* bytes, std::size_t count) {
    if (!bytes || count == 0) {
        return;
    }
    buffer.insert(buffer.end(), bytes, bytes + count);
}

void ByteBuffer::appendBytes(const std::vector<std::uint8_t>& bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

void ByteBuffer::appendHex(std::uint8_t value) {
    static constexpr char digits[] = "0123456789ABCDEF";
    buffer.push_back(static_cast<std::uint8_t>(digits[value >> 4]));
    buffer.push_back(static_cast<std::uint8_t>(digits[value & 0x0Fu]));
}

void ByteBuffer::appendHex(const std::vector<std::uint8_t>& bytes) {
    buffer.reserve(buffer.size() + bytes.size() * 2);
    for (auto byte : bytes) {
        appendHex(byte);
    }
}

std::vector<std::uint8_t> ByteBuffer::release() {
    std::vector<std::uint8_t> out = std::move(buffer);
    buffer.clear();
    return out;
}

} // namespace flipdot::protocol
