#include "flipdot/protocol/Message.hpp"

#include "flipdot/core/Errors.hpp"

#include <iomanip>
#include <sstream>

namespace flipdot::protocol {

namespace {

// Wire type bytes.
constexpr std::uint8_t TYPE_DATA_CHUNK = 0x00;
constexpr std::uint8_t TYPE_DATA_CHUNKS_SENT = 0x01;
constexpr std::uint8_t TYPE_CONTROL = 0x02;
constexpr std::uint8_t TYPE_REQUEST_OPERATION = 0x03;
constexpr std::uint8_t TYPE_REPORT_STATE = 0x04;
constexpr std::uint8_t TYPE_ACK_OPERATION = 0x05;
constexpr std::uint8_t TYPE_PIXELS_COMPLETE = 0x06;
constexpr std::uint8_t TYPE_NAK_OPERATION = 0x07;

// Single data byte of TYPE_CONTROL messages.
constexpr std::uint8_t CONTROL_HELLO = 0xFF;
constexpr std::uint8_t CONTROL_QUERY_STATE = 0x00;
constexpr std::uint8_t CONTROL_GOODBYE = 0x55;

constexpr std::uint8_t PIXELS_COMPLETE_CODE = 0x00;

struct OperationCodes {
    OperationKind kind;
    std::uint8_t request;
    std::uint8_t ack;
};

constexpr OperationCodes OPERATION_CODES[] = {
    {OperationKind::ReceiveConfig, 0xA1, 0x95},
    {OperationKind::SendPage, 0xA2, 0x91},
    {OperationKind::StartReset, 0xA6, 0x93},
    {OperationKind::FinishReset, 0xA7, 0x94},
    {OperationKind::ShowLoadedPage, 0xA9, 0x96},
    {OperationKind::LoadNextPage, 0xAA, 0x97},
};

struct StateCode {
    State state;
    std::uint8_t code;
};

constexpr StateCode STATE_CODES[] = {
    {State::Unconfigured, 0x0F},
    {State::ConfigInProgress, 0x0D},
    {State::ConfigReceived, 0x07},
    {State::ConfigFailed, 0x0C},
    {State::PixelsInProgress, 0x03},
    {State::PixelsReceived, 0x01},
    {State::PixelsFailed, 0x0B},
    {State::PageLoaded, 0x10},
    {State::PageLoadInProgress, 0x13},
    {State::PageShown, 0x12},
    {State::PageShowInProgress, 0x11},
    {State::ShowingPages, 0x14},
    {State::ReadyToReset, 0x08},
};

const OperationCodes& codesFor(OperationKind kind) {
    for (const auto& entry : OPERATION_CODES) {
        if (entry.kind == kind) {
            return entry;
        }
    }
    return OPERATION_CODES[0];
}

std::uint8_t stateCode(State state) {
    for (const auto& entry : STATE_CODES) {
        if (entry.state == state) {
            return entry.code;
        }
    }
    return 0;
}

bool stateFromCode(std::uint8_t code, State& out) {
    for (const auto& entry : STATE_CODES) {
        if (entry.code == code) {
            out = entry.state;
            return true;
        }
    }
    return false;
}

std::vector<std::uint8_t> operationBytes(const Operation& op, bool ack) {
    const auto& codes = codesFor(op.kind);
    std::vector<std::uint8_t> bytes{ack ? codes.ack : codes.request};
    if (op.kind == OperationKind::SendPage) {
        bytes.push_back(op.page.value);
    }
    return bytes;
}

// Request/ack code plus the trailing page id that only SendPage carries.
bool operationFromBytes(const std::vector<std::uint8_t>& data, bool ack, Operation& out) {
    if (data.empty()) {
        return false;
    }
    for (const auto& entry : OPERATION_CODES) {
        if ((ack ? entry.ack : entry.request) != data[0]) {
            continue;
        }
        if (entry.kind == OperationKind::SendPage) {
            if (data.size() != 2) {
                return false;
            }
            out = Operation::sendPage(PageId{data[1]});
        } else {
            if (data.size() != 1) {
                return false;
            }
            out = Operation{entry.kind, PageId{}};
        }
        return true;
    }
    return false;
}

std::uint16_t readUInt16(const std::vector<std::uint8_t>& data) {
    return static_cast<std::uint16_t>((data[0] << 8) | data[1]);
}

std::error_code unknownKind() {
    return make_error_code(FrameError::UnknownKind);
}

} // namespace

const char* toString(State state) {
    switch (state) {
        case State::Unconfigured: return "Unconfigured";
        case State::ConfigInProgress: return "ConfigInProgress";
        case State::ConfigReceived: return "ConfigReceived";
        case State::ConfigFailed: return "ConfigFailed";
        case State::PixelsInProgress: return "PixelsInProgress";
        case State::PixelsReceived: return "PixelsReceived";
        case State::PixelsFailed: return "PixelsFailed";
        case State::PageLoaded: return "PageLoaded";
        case State::PageLoadInProgress: return "PageLoadInProgress";
        case State::PageShown: return "PageShown";
        case State::PageShowInProgress: return "PageShowInProgress";
        case State::ShowingPages: return "ShowingPages";
        case State::ReadyToReset: return "ReadyToReset";
    }
    return "Unknown";
}

bool isConfigured(State state) {
    switch (state) {
        case State::Unconfigured:
        case State::ConfigInProgress:
        case State::ConfigFailed:
        case State::ReadyToReset:
            return false;
        default:
            return true;
    }
}

const char* toString(OperationKind kind) {
    switch (kind) {
        case OperationKind::ReceiveConfig: return "ReceiveConfig";
        case OperationKind::SendPage: return "SendPage";
        case OperationKind::ShowLoadedPage: return "ShowLoadedPage";
        case OperationKind::LoadNextPage: return "LoadNextPage";
        case OperationKind::StartReset: return "StartReset";
        case OperationKind::FinishReset: return "FinishReset";
    }
    return "Unknown";
}

std::string Operation::describe() const {
    std::ostringstream os;
    os << toString(kind);
    if (kind == OperationKind::SendPage) {
        os << ' ' << std::hex << std::uppercase << std::setfill('0')
           << std::setw(2) << static_cast<int>(page.value);
    }
    return os.str();
}

const char* toString(MessageKind kind) {
    switch (kind) {
        case MessageKind::DataChunk: return "DataChunk";
        case MessageKind::DataChunksSent: return "DataChunksSent";
        case MessageKind::Hello: return "Hello";
        case MessageKind::QueryState: return "QueryState";
        case MessageKind::ReportState: return "ReportState";
        case MessageKind::RequestOperation: return "RequestOperation";
        case MessageKind::AckOperation: return "AckOperation";
        case MessageKind::NakOperation: return "NakOperation";
        case MessageKind::PixelsComplete: return "PixelsComplete";
        case MessageKind::Goodbye: return "Goodbye";
    }
    return "Unknown";
}

Message Message::hello(Address address) {
    return Message(MessageKind::Hello, address);
}

Message Message::queryState(Address address) {
    return Message(MessageKind::QueryState, address);
}

Message Message::reportState(Address address, State state) {
    Message msg(MessageKind::ReportState, address);
    msg.state_ = state;
    return msg;
}

Message Message::requestOperation(Address address, Operation op) {
    Message msg(MessageKind::RequestOperation, address);
    msg.operation_ = op;
    return msg;
}

Message Message::ackOperation(Address address, Operation op) {
    Message msg(MessageKind::AckOperation, address);
    msg.operation_ = op;
    return msg;
}

Message Message::nakOperation(Address address, Operation op) {
    Message msg(MessageKind::NakOperation, address);
    msg.operation_ = op;
    return msg;
}

Message Message::dataChunksSent(Address address, ChunkCount count) {
    Message msg(MessageKind::DataChunksSent, address);
    msg.chunkCount_ = count;
    return msg;
}

Message Message::pixelsComplete(Address address) {
    return Message(MessageKind::PixelsComplete, address);
}

Message Message::goodbye(Address address) {
    return Message(MessageKind::Goodbye, address);
}

expected<Message> Message::dataChunk(Address address, Offset offset, std::vector<std::uint8_t> bytes) {
    if (bytes.size() > MAX_CHUNK_BYTES) {
        return unexpected(make_error_code(SignError::InvalidArgument));
    }
    Message msg(MessageKind::DataChunk, address);
    msg.offset_ = offset;
    msg.data_ = std::move(bytes);
    return msg;
}

bool Message::expectsResponse() const {
    switch (kind_) {
        case MessageKind::Hello:
        case MessageKind::QueryState:
        case MessageKind::RequestOperation:
        case MessageKind::DataChunk:
        case MessageKind::DataChunksSent:
            return true;
        default:
            return false;
    }
}

Frame Message::toFrame() const {
    std::uint8_t type = 0;
    std::vector<std::uint8_t> data;

    switch (kind_) {
        case MessageKind::DataChunk:
            type = TYPE_DATA_CHUNK;
            data.reserve(2 + data_.size());
            data.push_back(static_cast<std::uint8_t>(offset_.value >> 8));
            data.push_back(static_cast<std::uint8_t>(offset_.value & 0xFF));
            data.insert(data.end(), data_.begin(), data_.end());
            break;
        case MessageKind::DataChunksSent:
            type = TYPE_DATA_CHUNKS_SENT;
            data = {static_cast<std::uint8_t>(chunkCount_.value >> 8),
                    static_cast<std::uint8_t>(chunkCount_.value & 0xFF)};
            break;
        case MessageKind::Hello:
            type = TYPE_CONTROL;
            data = {CONTROL_HELLO};
            break;
        case MessageKind::QueryState:
            type = TYPE_CONTROL;
            data = {CONTROL_QUERY_STATE};
            break;
        case MessageKind::Goodbye:
            type = TYPE_CONTROL;
            data = {CONTROL_GOODBYE};
            break;
        case MessageKind::ReportState:
            type = TYPE_REPORT_STATE;
            data = {stateCode(state_)};
            break;
        case MessageKind::RequestOperation:
            type = TYPE_REQUEST_OPERATION;
            data = operationBytes(operation_, false);
            break;
        case MessageKind::AckOperation:
            type = TYPE_ACK_OPERATION;
            data = operationBytes(operation_, true);
            break;
        case MessageKind::NakOperation:
            type = TYPE_NAK_OPERATION;
            data = operationBytes(operation_, false);
            break;
        case MessageKind::PixelsComplete:
            type = TYPE_PIXELS_COMPLETE;
            data = {PIXELS_COMPLETE_CODE};
            break;
    }

    // Chunk bodies are capped by dataChunk(), so creation cannot fail here.
    return *Frame::create(address_, MsgType{type}, std::move(data));
}

expected<Message> Message::fromFrame(const Frame& frame) {
    const auto address = frame.address();
    const auto& data = frame.data();

    switch (frame.messageType().value) {
        case TYPE_DATA_CHUNK: {
            if (data.size() < 2) {
                return unexpected(unknownKind());
            }
            return dataChunk(address, Offset{readUInt16(data)},
                             std::vector<std::uint8_t>(data.begin() + 2, data.end()));
        }
        case TYPE_DATA_CHUNKS_SENT:
            if (data.size() != 2) {
                return unexpected(unknownKind());
            }
            return dataChunksSent(address, ChunkCount{readUInt16(data)});
        case TYPE_CONTROL:
            if (data.size() == 1) {
                switch (data[0]) {
                    case CONTROL_HELLO: return hello(address);
                    case CONTROL_QUERY_STATE: return queryState(address);
                    case CONTROL_GOODBYE: return goodbye(address);
                    default: break;
                }
            }
            return unexpected(unknownKind());
        case TYPE_REPORT_STATE: {
            State state{};
            if (data.size() != 1 || !stateFromCode(data[0], state)) {
                return unexpected(unknownKind());
            }
            return reportState(address, state);
        }
        case TYPE_REQUEST_OPERATION:
        case TYPE_ACK_OPERATION:
        case TYPE_NAK_OPERATION: {
            const auto type = frame.messageType().value;
            Operation op;
            if (!operationFromBytes(data, type == TYPE_ACK_OPERATION, op)) {
                return unexpected(unknownKind());
            }
            if (type == TYPE_REQUEST_OPERATION) return requestOperation(address, op);
            if (type == TYPE_ACK_OPERATION) return ackOperation(address, op);
            return nakOperation(address, op);
        }
        case TYPE_PIXELS_COMPLETE:
            if (data.size() != 1 || data[0] != PIXELS_COMPLETE_CODE) {
                return unexpected(unknownKind());
            }
            return pixelsComplete(address);
        default:
            return unexpected(unknownKind());
    }
}

std::string Message::describe() const {
    std::ostringstream os;
    const bool fromSign = kind_ == MessageKind::ReportState
        || kind_ == MessageKind::AckOperation
        || kind_ == MessageKind::NakOperation;

    os << std::hex << std::uppercase << std::setfill('0')
       << "[Addr " << std::setw(4) << address_.value << "] "
       << (fromSign ? "--> " : "<-- ") << toString(kind_);

    switch (kind_) {
        case MessageKind::ReportState:
            os << " [" << toString(state_) << ']';
            break;
        case MessageKind::RequestOperation:
        case MessageKind::AckOperation:
        case MessageKind::NakOperation:
            os << " [" << operation_.describe() << ']';
            break;
        case MessageKind::DataChunk:
            os << " [Offset " << std::setw(4) << offset_.value << ']';
            for (auto byte : data_) {
                os << ' ' << std::setw(2) << static_cast<int>(byte);
            }
            break;
        case MessageKind::DataChunksSent:
            os << " [" << std::setw(4) << chunkCount_.value << ']';
            break;
        default:
            break;
    }
    return os.str();
}

bool Message::operator==(const Message& other) const {
    return kind_ == other.kind_
        && address_ == other.address_
        && state_ == other.state_
        && operation_ == other.operation_
        && offset_ == other.offset_
        && chunkCount_ == other.chunkCount_
        && data_ == other.data_;
}

} // namespace flipdot::protocol
