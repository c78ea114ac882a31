#pragma once

#include "flipdot/core/Expected.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace flipdot::protocol {

/// Bus address of a sign. Devices normally live in 2..126.
struct Address {
    std::uint16_t value = 0;

    constexpr Address() = default;
    constexpr explicit Address(std::uint16_t v) : value(v) {}

    constexpr bool operator==(Address other) const { return value == other.value; }
    constexpr bool operator!=(Address other) const { return value != other.value; }
    constexpr bool operator<(Address other) const { return value < other.value; }
};

constexpr std::uint16_t MIN_DEVICE_ADDRESS = 2;
constexpr std::uint16_t MAX_DEVICE_ADDRESS = 126;

constexpr bool isDeviceAddress(Address address) {
    return address.value >= MIN_DEVICE_ADDRESS && address.value <= MAX_DEVICE_ADDRESS;
}

/// Message type byte as carried on the wire.
struct MsgType {
    std::uint8_t value = 0;

    constexpr MsgType() = default;
    constexpr explicit MsgType(std::uint8_t v) : value(v) {}

    constexpr bool operator==(MsgType other) const { return value == other.value; }
    constexpr bool operator!=(MsgType other) const { return value != other.value; }
};

constexpr std::size_t MAX_FRAME_DATA = 0xFF;

/**
 * @brief One undecorated frame: address, type byte and up to 255 data bytes.
 *
 * Framing (marker, hex/binary encoding, checksum) is applied by FrameCodec
 * according to a FrameFormat; this struct is the part every sign family shares.
 */
class Frame {
public:
    Frame() = default;

    /// Fails with SignError::InvalidArgument when @p data exceeds 255 bytes.
    static expected<Frame> create(Address address, MsgType type, std::vector<std::uint8_t> data);

    Address address() const { return addr; }
    MsgType messageType() const { return type; }
    const std::vector<std::uint8_t>& data() const { return payload; }

    /// Length byte, address, type and data: everything the checksum covers.
    std::vector<std::uint8_t> rawBytes() const;

    std::string describe() const;

    bool operator==(const Frame& other) const {
        return addr == other.addr && type == other.type && payload == other.payload;
    }
    bool operator!=(const Frame& other) const { return !(*this == other); }

private:
    Frame(Address a, MsgType t, std::vector<std::uint8_t> d)
    : addr(a), type(t), payload(std::move(d)) {}

    Address addr{};
    MsgType type{};
    std::vector<std::uint8_t> payload;
};

std::string toHexLine(const std::uint8_t* data, std::size_t size);

} // namespace flipdot::protocol
