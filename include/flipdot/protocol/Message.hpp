#pragma once

#include "flipdot/core/Expected.hpp"
#include "flipdot/protocol/Frame.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace flipdot::protocol {

/// Page slot in a sign's memory. Unique per sign, not per bus.
struct PageId {
    std::uint8_t value = 0;

    constexpr PageId() = default;
    constexpr explicit PageId(std::uint8_t v) : value(v) {}

    constexpr bool operator==(PageId other) const { return value == other.value; }
    constexpr bool operator!=(PageId other) const { return value != other.value; }
    constexpr bool operator<(PageId other) const { return value < other.value; }
};

/// Byte offset of a DataChunk within the item being transferred.
struct Offset {
    std::uint16_t value = 0;

    constexpr Offset() = default;
    constexpr explicit Offset(std::uint16_t v) : value(v) {}

    constexpr bool operator==(Offset other) const { return value == other.value; }
    constexpr bool operator!=(Offset other) const { return value != other.value; }
};

struct ChunkCount {
    std::uint16_t value = 0;

    constexpr ChunkCount() = default;
    constexpr explicit ChunkCount(std::uint16_t v) : value(v) {}

    constexpr bool operator==(ChunkCount other) const { return value == other.value; }
    constexpr bool operator!=(ChunkCount other) const { return value != other.value; }
};

/// Device-reported state.
enum class State : std::uint8_t {
    Unconfigured,
    ConfigInProgress,
    ConfigReceived,
    ConfigFailed,
    PixelsInProgress,
    PixelsReceived,
    PixelsFailed,
    PageLoaded,
    PageLoadInProgress,
    PageShown,
    PageShowInProgress,
    ShowingPages,
    ReadyToReset,
};

const char* toString(State state);

/// True once the sign holds a valid configuration and can accept page operations.
bool isConfigured(State state);

enum class OperationKind : std::uint8_t {
    ReceiveConfig,
    SendPage,
    ShowLoadedPage,
    LoadNextPage,
    StartReset,
    FinishReset,
};

const char* toString(OperationKind kind);

/// Device-side action a host can request. Only SendPage carries a page id.
struct Operation {
    OperationKind kind = OperationKind::ReceiveConfig;
    PageId page{};

    static constexpr Operation receiveConfig() { return {OperationKind::ReceiveConfig, PageId{}}; }
    static constexpr Operation sendPage(PageId id) { return {OperationKind::SendPage, id}; }
    static constexpr Operation showLoadedPage() { return {OperationKind::ShowLoadedPage, PageId{}}; }
    static constexpr Operation loadNextPage() { return {OperationKind::LoadNextPage, PageId{}}; }
    static constexpr Operation startReset() { return {OperationKind::StartReset, PageId{}}; }
    static constexpr Operation finishReset() { return {OperationKind::FinishReset, PageId{}}; }

    constexpr bool operator==(const Operation& other) const {
        return kind == other.kind && (kind != OperationKind::SendPage || page == other.page);
    }
    constexpr bool operator!=(const Operation& other) const { return !(*this == other); }

    std::string describe() const;
};

enum class MessageKind : std::uint8_t {
    DataChunk,
    DataChunksSent,
    Hello,
    QueryState,
    ReportState,
    RequestOperation,
    AckOperation,
    NakOperation,
    PixelsComplete,
    Goodbye,
};

const char* toString(MessageKind kind);

/// Largest chunk body: the frame data byte budget minus the 2-byte offset.
constexpr std::size_t MAX_CHUNK_BYTES = MAX_FRAME_DATA - 2;

/**
 * @brief One protocol message. Closed set; construct through the factories.
 *
 * Every message carries the Address of the sign it targets or originates from.
 * Fields that do not apply to a kind stay at their defaults so equality is a
 * plain field-wise comparison.
 */
class Message {
public:
    static Message hello(Address address);
    static Message queryState(Address address);
    static Message reportState(Address address, State state);
    static Message requestOperation(Address address, Operation op);
    static Message ackOperation(Address address, Operation op);
    static Message nakOperation(Address address, Operation op);
    static Message dataChunksSent(Address address, ChunkCount count);
    static Message pixelsComplete(Address address);
    static Message goodbye(Address address);

    /// Fails with SignError::InvalidArgument when @p bytes exceeds MAX_CHUNK_BYTES.
    static expected<Message> dataChunk(Address address, Offset offset, std::vector<std::uint8_t> bytes);

    MessageKind kind() const { return kind_; }
    Address address() const { return address_; }
    State state() const { return state_; }
    const Operation& operation() const { return operation_; }
    Offset offset() const { return offset_; }
    ChunkCount chunkCount() const { return chunkCount_; }
    const std::vector<std::uint8_t>& data() const { return data_; }

    /// Whether a sign answers this message when it is addressed to it.
    bool expectsResponse() const;

    Frame toFrame() const;

    /// Maps a frame to a message, failing with FrameError::UnknownKind for
    /// type/data combinations outside the protocol.
    static expected<Message> fromFrame(const Frame& frame);

    std::string describe() const;

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }

private:
    Message(MessageKind kind, Address address) : kind_(kind), address_(address) {}

    MessageKind kind_;
    Address address_;
    State state_ = State::Unconfigured;
    Operation operation_{};
    Offset offset_{};
    ChunkCount chunkCount_{};
    std::vector<std::uint8_t> data_;
};

} // namespace flipdot::protocol
