#include "flipdot/core/DeviceStateMachine.hpp"

#include "flipdot/core/Errors.hpp"
#include "flipdot/log/Log.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace flipdot {

using protocol::MessageKind;
using protocol::OperationKind;

namespace {

std::string describeResponse(const std::optional<Message>& response) {
    return response ? response->describe() : std::string("no response");
}

std::string addressTag(Address address) {
    std::ostringstream os;
    os << "[Sign " << std::hex << std::uppercase << std::setfill('0')
       << std::setw(4) << address.value << "] ";
    return os.str();
}

} // namespace

DeviceStateMachine::DeviceStateMachine(Address address)
: address_(address)
{}

expected<void> DeviceStateMachine::beginOperation(const Operation& op) {
    std::lock_guard lock(mutex_);
    if (pending_) {
        logError(addressTag(address_), "cannot start ", op.describe(), ": ",
                 pending_->describe(), " is still pending\n");
        return unexpected(make_error_code(SignError::OperationInProgress));
    }
    if (lastState_ == State::Unconfigured && op.kind != OperationKind::ReceiveConfig) {
        logError(addressTag(address_), op.describe(), " rejected: sign is unconfigured\n");
        return unexpected(make_error_code(SignError::NotConfigured));
    }
    pending_ = op;
    return {};
}

expected<void> DeviceStateMachine::acceptAck(const std::optional<Message>& response) {
    return checkAck(response, false);
}

expected<void> DeviceStateMachine::completeOperation(const std::optional<Message>& response) {
    return checkAck(response, true);
}

expected<void> DeviceStateMachine::checkAck(const std::optional<Message>& response, bool release) {
    std::lock_guard lock(mutex_);
    if (!pending_) {
        return unexpected(unexpectedResponse("no pending operation", response));
    }

    const auto op = *pending_;
    if (response && response->address() == address_ && response->operation() == op) {
        if (response->kind() == MessageKind::AckOperation) {
            if (release) {
                pending_.reset();
            }
            return {};
        }
        if (response->kind() == MessageKind::NakOperation) {
            pending_.reset();
            logError(addressTag(address_), op.describe(), " rejected by sign\n");
            return unexpected(make_error_code(SignError::NakReceived));
        }
    }

    pending_.reset();
    const std::string expected = "AckOperation [" + op.describe() + "]";
    return unexpected(unexpectedResponse(expected.c_str(), response));
}

void DeviceStateMachine::abandonOperation() {
    std::lock_guard lock(mutex_);
    pending_.reset();
}

expected<State> DeviceStateMachine::acceptState(const std::optional<Message>& response) {
    std::lock_guard lock(mutex_);
    if (!response || response->kind() != MessageKind::ReportState || response->address() != address_) {
        return unexpected(unexpectedResponse("ReportState", response));
    }

    const auto state = response->state();
    lastState_ = state;
    return state;
}

std::optional<Operation> DeviceStateMachine::pendingOperation() const {
    std::lock_guard lock(mutex_);
    return pending_;
}

std::optional<State> DeviceStateMachine::lastReportedState() const {
    std::lock_guard lock(mutex_);
    return lastState_;
}

bool DeviceStateMachine::isConfigured() const {
    std::lock_guard lock(mutex_);
    return lastState_ && protocol::isConfigured(*lastState_);
}

std::error_code DeviceStateMachine::unexpectedResponse(const char* expected,
                                                       const std::optional<Message>& actual) {
    logError(addressTag(address_), "unexpected response: expected ", expected,
             ", got ", describeResponse(actual), "\n");
    return make_error_code(SignError::UnexpectedResponse);
}

} // namespace flipdot
