#include "flipdot/core/Sign.hpp"

#include "flipdot/core/Errors.hpp"
#include "flipdot/core/SignConfig.hpp"
#include "flipdot/log/Log.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace flipdot {

using protocol::ChunkCount;
using protocol::Offset;
using protocol::OperationKind;

namespace {

std::string tag(Address address) {
    std::ostringstream os;
    os << "[Sign " << std::hex << std::uppercase << std::setfill('0')
       << std::setw(4) << address.value << "] ";
    return os.str();
}

} // namespace

Sign::Sign(std::shared_ptr<BusHandle> bus, Address address, SignType type)
: bus_(std::move(bus))
, address_(address)
, type_(type)
, machine_(address)
{}

Page Sign::createPage(PageId id) const {
    const auto size = dimensions(type_);
    return Page(id, size.width, size.height);
}

expected<void> Sign::configure() {
    configured_ = false;

    auto state = queryState(Message::hello(address_));
    if (!state) {
        return unexpected(state.error());
    }

    if (*state != State::Unconfigured) {
        if (auto reset = resetSign(*state); !reset) {
            return reset;
        }
    }

    const auto& block = configBytes(type_);
    if (auto sent = transfer(protocol::Operation::receiveConfig(),
                             std::vector<std::uint8_t>(block.begin(), block.end())); !sent) {
        return sent;
    }

    state = queryState(Message::queryState(address_));
    if (!state) {
        return unexpected(state.error());
    }
    if (*state != State::ConfigReceived) {
        logError(tag(address_), "configuration not accepted, sign reports ",
                 protocol::toString(*state), "\n");
        return unexpected(make_error_code(SignError::UnexpectedResponse));
    }

    configured_ = true;
    logInfo(tag(address_), "configured as ", toString(type_), "\n");
    return {};
}

expected<PageFlipStyle> Sign::sendPages(const std::vector<Page>& pages) {
    if (!configured_) {
        logError(tag(address_), "sendPages() before configure()\n");
        return unexpected(make_error_code(SignError::NotConfigured));
    }
    if (pages.empty()) {
        return unexpected(make_error_code(SignError::InvalidArgument));
    }

    const auto size = dimensions(type_);
    for (const auto& page : pages) {
        if (page.width() != size.width || page.height() != size.height) {
            logError(tag(address_), "page ", static_cast<int>(page.id().value), " is ",
                     page.width(), "x", page.height(), ", sign is ",
                     size.width, "x", size.height, "\n");
            return unexpected(make_error_code(SignError::InvalidArgument));
        }
    }

    for (const auto& page : pages) {
        if (auto sent = transfer(protocol::Operation::sendPage(page.id()), page.bytes()); !sent) {
            return unexpected(sent.error());
        }
    }

    auto done = send(Message::pixelsComplete(address_));
    if (!done) {
        return unexpected(done.error());
    }

    auto state = queryState(Message::queryState(address_));
    if (!state) {
        return unexpected(state.error());
    }

    switch (*state) {
        case State::ShowingPages:
            logInfo(tag(address_), pages.size(), " page(s) sent, sign flips automatically\n");
            return PageFlipStyle::Automatic;
        case State::PageLoaded:
            logInfo(tag(address_), pages.size(), " page(s) sent, first page loaded\n");
            return PageFlipStyle::Manual;
        default:
            logError(tag(address_), "unexpected state after page transfer: ",
                     protocol::toString(*state), "\n");
            return unexpected(make_error_code(SignError::UnexpectedResponse));
    }
}

expected<void> Sign::showLoadedPage() {
    if (!configured_) {
        return unexpected(make_error_code(SignError::NotConfigured));
    }
    return switchPage(State::PageShown, State::PageLoaded, protocol::Operation::showLoadedPage());
}

expected<void> Sign::loadNextPage() {
    if (!configured_) {
        return unexpected(make_error_code(SignError::NotConfigured));
    }
    return switchPage(State::PageLoaded, State::PageShown, protocol::Operation::loadNextPage());
}

expected<void> Sign::shutDown() {
    // Goodbye resets the sign whether or not it answers.
    configured_ = false;

    auto response = send(Message::goodbye(address_));
    if (!response) {
        return unexpected(response.error());
    }
    if (*response) {
        logError(tag(address_), "unexpected reply to Goodbye: ", (*response)->describe(), "\n");
        return unexpected(make_error_code(SignError::UnexpectedResponse));
    }
    logInfo(tag(address_), "shut down\n");
    return {};
}

expected<std::optional<Message>> Sign::send(const Message& message) {
    return bus_->processMessage(message);
}

expected<State> Sign::queryState(const Message& query) {
    auto response = send(query);
    if (!response) {
        return unexpected(response.error());
    }
    return machine_.acceptState(*response);
}

expected<void> Sign::requestOperation(const protocol::Operation& op) {
    if (auto begun = machine_.beginOperation(op); !begun) {
        return begun;
    }
    auto response = send(Message::requestOperation(address_, op));
    if (!response) {
        machine_.abandonOperation();
        return unexpected(response.error());
    }
    return machine_.completeOperation(*response);
}

expected<void> Sign::resetSign(State current) {
    logInfo(tag(address_), "resetting from ", protocol::toString(current), "\n");

    if (current != State::ReadyToReset) {
        if (auto ok = requestOperation(protocol::Operation::startReset()); !ok) {
            return ok;
        }
        auto state = queryState(Message::hello(address_));
        if (!state) {
            return unexpected(state.error());
        }
        if (*state != State::ReadyToReset) {
            logError(tag(address_), "expected ReadyToReset, got ", protocol::toString(*state), "\n");
            return unexpected(make_error_code(SignError::UnexpectedResponse));
        }
    }

    if (auto ok = requestOperation(protocol::Operation::finishReset()); !ok) {
        return ok;
    }
    auto state = queryState(Message::hello(address_));
    if (!state) {
        return unexpected(state.error());
    }
    if (*state != State::Unconfigured) {
        logError(tag(address_), "expected Unconfigured after reset, got ", protocol::toString(*state), "\n");
        return unexpected(make_error_code(SignError::UnexpectedResponse));
    }
    return {};
}

expected<void> Sign::transfer(const protocol::Operation& op, const std::vector<std::uint8_t>& bytes) {
    const auto chunks = splitIntoChunks(bytes, config::CHUNK_SIZE);
    if (chunks.size() > std::numeric_limits<std::uint16_t>::max()) {
        return unexpected(make_error_code(SignError::InvalidArgument));
    }

    if (auto begun = machine_.beginOperation(op); !begun) {
        return begun;
    }

    auto step = [this](const Message& message, bool last) -> expected<void> {
        auto response = send(message);
        if (!response) {
            machine_.abandonOperation();
            return unexpected(response.error());
        }
        return last ? machine_.completeOperation(*response) : machine_.acceptAck(*response);
    };

    if (auto ok = step(Message::requestOperation(address_, op), false); !ok) {
        return ok;
    }

    std::size_t offset = 0;
    for (const auto& chunk : chunks) {
        auto message = Message::dataChunk(address_, Offset{static_cast<std::uint16_t>(offset)}, chunk);
        if (!message) {
            machine_.abandonOperation();
            return unexpected(message.error());
        }
        if (auto ok = step(*message, false); !ok) {
            return ok;
        }
        offset += chunk.size();
    }

    return step(Message::dataChunksSent(address_, ChunkCount{static_cast<std::uint16_t>(chunks.size())}), true);
}

expected<void> Sign::switchPage(State target, State trigger, const protocol::Operation& op) {
    for (int poll = 0; poll < config::MAX_STATE_POLLS; ++poll) {
        auto state = queryState(Message::queryState(address_));
        if (!state) {
            return unexpected(state.error());
        }

        if (*state == State::ShowingPages) {
            logInfo(tag(address_), "sign flips its own pages; ", op.describe(), " has no effect\n");
            return {};
        }
        if (*state == target) {
            return {};
        }
        if (*state == trigger) {
            if (auto ok = requestOperation(op); !ok) {
                return ok;
            }
            continue;
        }
        if (*state == State::PageLoadInProgress || *state == State::PageShowInProgress) {
            continue;
        }

        logError(tag(address_), op.describe(), ": unexpected state ", protocol::toString(*state), "\n");
        return unexpected(make_error_code(SignError::UnexpectedResponse));
    }

    logError(tag(address_), op.describe(), ": sign did not settle after ",
             config::MAX_STATE_POLLS, " polls\n");
    return unexpected(make_error_code(SignError::UnexpectedResponse));
}

} // namespace flipdot
