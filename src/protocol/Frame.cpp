#include "flipdot/protocol/Frame.hpp"

#include "flipdot/core/Errors.hpp"
#include "flipdot/protocol/ByteBuffer.hpp"

#include <iomanip>
#include <sstream>

namespace flipdot::protocol {

expected<Frame> Frame::create(Address address, MsgType type, std::vector<std::uint8_t> data) {
    if (data.size() > MAX_FRAME_DATA) {
        return unexpected(make_error_code(SignError::InvalidArgument));
    }
    return Frame(address, type, std::move(data));
}

std::vector<std::uint8_t> Frame::rawBytes() const {
    ByteBuffer buffer;
    buffer.appendUInt8(static_cast<std::uint8_t>(payload.size()));
    buffer.appendUInt16(addr.value);
    buffer.appendUInt8(type.value);
    buffer.appendBytes(payload);
    return buffer.release();
}

std::string Frame::describe() const {
    std::ostringstream os;
    os << std::hex << std::uppercase << std::setfill('0')
       << "Type " << std::setw(2) << static_cast<int>(type.value)
       << " | Addr " << std::setw(4) << addr.value;
    if (!payload.empty()) {
        os << " | Data";
        for (auto byte : payload) {
            os << ' ' << std::setw(2) << static_cast<int>(byte);
        }
    }
    return os.str();
}

std::string toHexLine(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        if (i) os << ' ';
        os << std::setw(2) << static_cast<int>(data[i]);
    }
    return os.str();
}

} // namespace flipdot::protocol
