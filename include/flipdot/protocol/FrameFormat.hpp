// FrameFormat.hpp
// -----------------------------------------------------------------------------
// Describes how a sign family wraps a raw frame on the wire.
//   * start marker and whether it is checksummed
//   * ASCII-hex or binary body
//   * optional CRLF terminator
//   * checksum algorithm, injected as a plain function value
// Luminator MAX3000/Horizon signs use FrameFormat::luminator(); other
// families can be described without touching FrameCodec or its callers.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace flipdot::protocol {

using ChecksumFn = std::function<std::uint8_t(const std::uint8_t* data, std::size_t size)>;

namespace checksum {

/// Two's complement of the byte sum: data plus checksum sums to zero.
std::uint8_t negatedSum(const std::uint8_t* data, std::size_t size) noexcept;

/// Plain 8-bit sum of all bytes.
std::uint8_t additive(const std::uint8_t* data, std::size_t size) noexcept;

/// XOR of all bytes.
std::uint8_t xorAll(const std::uint8_t* data, std::size_t size) noexcept;

} // namespace checksum

enum class FrameEncoding : std::uint8_t {
    AsciiHex,
    Binary,
};

struct FrameFormat {
    std::string name;
    FrameEncoding encoding = FrameEncoding::AsciiHex;
    std::uint8_t startMarker = ':';
    bool checksumCoversMarker = false;
    bool crlfTerminator = true;
    ChecksumFn checksum = checksum::negatedSum;

    /// Intel-HEX style text frames used by Luminator signs and the ODK.
    static FrameFormat luminator();

    /// Compact binary framing; the checksum also covers @p marker.
    static FrameFormat binary(std::uint8_t marker, ChecksumFn checksumFn);
};

} // namespace flipdot::protocol
