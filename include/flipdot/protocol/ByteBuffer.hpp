#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace flipdot::protocol {

// Growable scratch buffer for frames, raw or hex-encoded. Multi-byte values
// are written big-endian, matching the sign bus wire order.
class ByteBuffer {
public:
    ByteBuffer();

    void clear();
    void appendChar(char value);
    void appendUInt8(std::uint8_t value);
    void appendUInt16(std::uint16_t value);
    void appendBytes(const std::uint8_t* bytes, std::size_t count);
    void appendBytes(const std::vector<std::uint8_t>& bytes);

    /// Two upper-case ASCII hex digits per byte, high nibble first.
    void appendHex(std::uint8_t value);
    void appendHex(const std::vector<std::uint8_t>& bytes);

    const std::uint8_t* data() const { return buffer.data(); }
    std::uint8_t* data() { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }

    std::vector<std::uint8_t> release();

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace flipdot::protocol
