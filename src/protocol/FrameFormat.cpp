#include "flipdot/protocol/FrameFormat.hpp"

#include <utility>

namespace flipdot::protocol {

namespace checksum {

std::uint8_t negatedSum(const std::uint8_t* data, std::size_t size) noexcept {
    std::uint8_t acc = 0;
    for (std::size_t i = 0; i < size; ++i) {
        acc = static_cast<std::uint8_t>(acc - data[i]);
    }
    return acc;
}

std::uint8_t additive(const std::uint8_t* data, std::size_t size) noexcept {
    std::uint8_t acc = 0;
    for (std::size_t i = 0; i < size; ++i) {
        acc = static_cast<std::uint8_t>(acc + data[i]);
    }
    return acc;
}

std::uint8_t xorAll(const std::uint8_t* data, std::size_t size) noexcept {
    std::uint8_t acc = 0;
    for (std::size_t i = 0; i < size; ++i) {
        acc ^= data[i];
    }
    return acc;
}

} // namespace checksum

FrameFormat FrameFormat::luminator() {
    FrameFormat format;
    format.name = "luminator";
    format.encoding = FrameEncoding::AsciiHex;
    format.startMarker = ':';
    format.checksumCoversMarker = false;
    format.crlfTerminator = true;
    format.checksum = checksum::negatedSum;
    return format;
}

FrameFormat FrameFormat::binary(std::uint8_t marker, ChecksumFn checksumFn) {
    FrameFormat format;
    format.name = "binary";
    format.encoding = FrameEncoding::Binary;
    format.startMarker = marker;
    format.checksumCoversMarker = true;
    format.crlfTerminator = false;
    format.checksum = checksumFn ? std::move(checksumFn) : ChecksumFn(checksum::additive);
    return format;
}

} // namespace flipdot::protocol
