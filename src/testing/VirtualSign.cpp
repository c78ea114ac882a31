#include "flipdot/testing/VirtualSign.hpp"

#include "flipdot/log/Log.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>

namespace flipdot::testing {

using protocol::MessageKind;
using protocol::OperationKind;

namespace {

std::string tag(Address address) {
    std::ostringstream os;
    os << "[VirtualSign " << std::hex << std::uppercase << std::setfill('0')
       << std::setw(4) << address.value << "] ";
    return os.str();
}

} // namespace

VirtualSign::VirtualSign(Address address, PageFlipStyle flipStyle)
: address_(address)
, flipStyle_(flipStyle)
{}

const Page* VirtualSign::page(PageId id) const {
    auto it = pages_.find(id);
    return it == pages_.end() ? nullptr : &it->second;
}

std::optional<PageId> VirtualSign::loadedPage() const {
    if (batch_.empty()) {
        return std::nullopt;
    }
    return batch_[loadedIndex_ % batch_.size()];
}

std::optional<Message> VirtualSign::processMessage(const Message& message) {
    if (message.address() != address_) {
        return std::nullopt;
    }

    switch (message.kind()) {
        case MessageKind::Hello:
        case MessageKind::QueryState:
            return reportState();
        case MessageKind::RequestOperation:
            return requestOperation(message.operation());
        case MessageKind::DataChunk:
            return dataChunk(message);
        case MessageKind::DataChunksSent:
            return dataChunksSent(message);
        case MessageKind::PixelsComplete:
            pixelsComplete();
            return std::nullopt;
        case MessageKind::Goodbye:
            logInfo(tag(address_), "goodbye\n");
            reset();
            return std::nullopt;
        default:
            // Replies from other devices are not for us.
            return std::nullopt;
    }
}

void VirtualSign::tick() {
    if (flipStyle_ != PageFlipStyle::Automatic || state_ != State::ShowingPages || batch_.empty()) {
        return;
    }
    loadedIndex_ = (loadedIndex_ + 1) % batch_.size();
    shown_ = batch_[loadedIndex_];
}

std::optional<Message> VirtualSign::reportState() {
    const auto reported = state_;

    // Loading and showing complete instantly; the next query sees the result.
    if (state_ == State::PageLoadInProgress) {
        state_ = State::PageLoaded;
    } else if (state_ == State::PageShowInProgress) {
        state_ = State::PageShown;
    }
    return Message::reportState(address_, reported);
}

std::optional<Message> VirtualSign::requestOperation(const Operation& op) {
    switch (op.kind) {
        case OperationKind::ReceiveConfig:
            if (state_ != State::Unconfigured && state_ != State::ConfigFailed) {
                return nak(op);
            }
            return beginTransfer(op, State::ConfigInProgress);

        case OperationKind::SendPage:
            if (!acceptsPages()) {
                return nak(op);
            }
            if (state_ != State::PixelsReceived) {
                batch_.clear();
                loadedIndex_ = 0;
            }
            return beginTransfer(op, State::PixelsInProgress);

        case OperationKind::ShowLoadedPage:
            if (state_ == State::ShowingPages) {
                return ack(op);
            }
            if (state_ != State::PageLoaded) {
                return nak(op);
            }
            shown_ = loadedPage();
            state_ = State::PageShowInProgress;
            return ack(op);

        case OperationKind::LoadNextPage:
            if (state_ == State::ShowingPages) {
                return ack(op);
            }
            if (state_ != State::PageShown || batch_.empty()) {
                return nak(op);
            }
            loadedIndex_ = (loadedIndex_ + 1) % batch_.size();
            state_ = State::PageLoadInProgress;
            return ack(op);

        case OperationKind::StartReset:
            state_ = State::ReadyToReset;
            return ack(op);

        case OperationKind::FinishReset:
            if (state_ != State::ReadyToReset) {
                return nak(op);
            }
            reset();
            return ack(op);
    }
    return nak(op);
}

std::optional<Message> VirtualSign::beginTransfer(const Operation& op, State inProgress) {
    state_ = inProgress;
    transfer_ = op;
    received_.clear();
    chunksReceived_ = 0;
    return ack(op);
}

std::optional<Message> VirtualSign::dataChunk(const Message& message) {
    if (!transfer_) {
        return std::nullopt;
    }

    ++chunksReceived_;
    if (failChunk_ && *failChunk_ == chunksReceived_) {
        logInfo(tag(address_), "injected failure on chunk ", chunksReceived_, "\n");
        failChunk_.reset();
        return failTransfer();
    }
    if (message.offset().value != received_.size()) {
        logError(tag(address_), "chunk at offset ", message.offset().value,
                 ", expected ", received_.size(), "\n");
        return failTransfer();
    }

    received_.insert(received_.end(), message.data().begin(), message.data().end());
    return ack(*transfer_);
}

std::optional<Message> VirtualSign::dataChunksSent(const Message& message) {
    if (!transfer_) {
        return std::nullopt;
    }
    if (message.chunkCount().value != chunksReceived_) {
        logError(tag(address_), "host sent ", message.chunkCount().value,
                 " chunks, received ", chunksReceived_, "\n");
        return failTransfer();
    }

    const auto op = *transfer_;
    if (op.kind == OperationKind::ReceiveConfig) {
        auto type = signTypeFromConfig(received_);
        if (!type) {
            return failTransfer();
        }
        signType_ = *type;
        width_ = dimensions(*type).width;
        height_ = dimensions(*type).height;
        state_ = State::ConfigReceived;
        logInfo(tag(address_), "configured as ", toString(*type), "\n");
    } else {
        auto page = Page::fromBytes(width_, height_, received_);
        if (!page) {
            return failTransfer();
        }
        pages_.insert_or_assign(op.page, std::move(*page));
        if (std::find(batch_.begin(), batch_.end(), op.page) == batch_.end()) {
            batch_.push_back(op.page);
        }
        state_ = State::PixelsReceived;
    }

    transfer_.reset();
    received_.clear();
    chunksReceived_ = 0;
    return ack(op);
}

void VirtualSign::pixelsComplete() {
    if (state_ != State::PixelsReceived || batch_.empty()) {
        return;
    }

    for (auto id : batch_) {
        const auto& stored = pages_.at(id);
        logInfo(tag(address_), "page ", static_cast<int>(id.value), " (",
                stored.width(), "x", stored.height(), ")\n", stored.describe(), "\n");
    }

    loadedIndex_ = 0;
    if (flipStyle_ == PageFlipStyle::Automatic) {
        shown_ = batch_.front();
        state_ = State::ShowingPages;
    } else {
        state_ = State::PageLoaded;
    }
}

Message VirtualSign::failTransfer() {
    const auto op = *transfer_;
    state_ = op.kind == OperationKind::ReceiveConfig ? State::ConfigFailed : State::PixelsFailed;
    transfer_.reset();
    received_.clear();
    chunksReceived_ = 0;
    return nak(op);
}

bool VirtualSign::acceptsPages() const {
    switch (state_) {
        case State::ConfigReceived:
        case State::PixelsReceived:
        case State::PixelsFailed:
        case State::PageLoaded:
        case State::PageLoadInProgress:
        case State::PageShown:
        case State::PageShowInProgress:
        case State::ShowingPages:
            return true;
        default:
            return false;
    }
}

void VirtualSign::reset() {
    state_ = State::Unconfigured;
    signType_.reset();
    width_ = 0;
    height_ = 0;
    pages_.clear();
    batch_.clear();
    loadedIndex_ = 0;
    shown_.reset();
    transfer_.reset();
    received_.clear();
    chunksReceived_ = 0;
}

} // namespace flipdot::testing
