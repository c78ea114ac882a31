#pragma once

#include "flipdot/core/Expected.hpp"
#include "flipdot/protocol/Message.hpp"

#include <mutex>
#include <optional>

namespace flipdot {

using protocol::Address;
using protocol::Message;
using protocol::Operation;
using protocol::State;

/**
 * @brief Host-side view of one device: the pending operation slot plus the
 * last state the device reported.
 *
 * Every response the Sign receives passes through here. Anything not from
 * this Address or not of the expected shape fails with
 * SignError::UnexpectedResponse, and any failure releases the pending slot so
 * the next request can start cleanly.
 */
class DeviceStateMachine {
public:
    explicit DeviceStateMachine(Address address);

    Address address() const { return address_; }

    /**
     * @brief Claim the pending slot for @p op.
     *
     * Fails with SignError::OperationInProgress while another operation is
     * unresolved, or SignError::NotConfigured when the device last reported
     * Unconfigured and @p op is anything but ReceiveConfig.
     */
    expected<void> beginOperation(const Operation& op);

    /// Checks an ack for the pending operation and keeps the slot open (data chunks follow).
    expected<void> acceptAck(const std::optional<Message>& response);

    /// Checks an ack for the pending operation and releases the slot.
    expected<void> completeOperation(const std::optional<Message>& response);

    /// Releases the slot without a response, e.g. after a transport failure.
    void abandonOperation();

    /// Validates a ReportState from this address and records it.
    expected<State> acceptState(const std::optional<Message>& response);

    std::optional<Operation> pendingOperation() const;
    std::optional<State> lastReportedState() const;

    /// True when the last reported state is ConfigReceived or any page state.
    bool isConfigured() const;

private:
    expected<void> checkAck(const std::optional<Message>& response, bool release);
    std::error_code unexpectedResponse(const char* expected, const std::optional<Message>& actual);

    const Address address_;
    mutable std::mutex mutex_;
    std::optional<Operation> pending_;
    std::optional<State> lastState_;
};

} // namespace flipdot
