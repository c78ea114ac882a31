#include "flipdot/core/DeviceStateMachine.hpp"
#include "flipdot/core/Errors.hpp"

#include "TestSupport.hpp"

using namespace flipdot;
using protocol::PageId;

static const Address kAddress{3};

static void testSecondRequestIsInProgress() {
    DeviceStateMachine machine(kAddress);
    ASSERT_TRUE(machine.beginOperation(Operation::receiveConfig()).has_value(), "first request");
    ASSERT_EQ(test_support::errorOf(machine.beginOperation(Operation::receiveConfig())),
              make_error_code(SignError::OperationInProgress), "same request again");
    ASSERT_EQ(test_support::errorOf(machine.beginOperation(Operation::startReset())),
              make_error_code(SignError::OperationInProgress), "different request");
    ASSERT_TRUE(machine.pendingOperation() == Operation::receiveConfig(), "first request still pending");
}

static void testAckClearsSlot() {
    DeviceStateMachine machine(kAddress);
    const auto op = Operation::sendPage(PageId{1});
    ASSERT_TRUE(machine.beginOperation(op).has_value(), "begin");
    ASSERT_TRUE(machine.acceptAck(Message::ackOperation(kAddress, op)).has_value(), "intermediate ack");
    ASSERT_TRUE(machine.pendingOperation().has_value(), "still pending after intermediate ack");
    ASSERT_TRUE(machine.completeOperation(Message::ackOperation(kAddress, op)).has_value(), "final ack");
    ASSERT_TRUE(!machine.pendingOperation().has_value(), "slot cleared");
    ASSERT_TRUE(machine.beginOperation(Operation::loadNextPage()).has_value(), "next request allowed");
}

static void testNakIsRecoverable() {
    DeviceStateMachine machine(kAddress);
    const auto op = Operation::showLoadedPage();
    (void)machine.beginOperation(op);
    auto result = machine.completeOperation(Message::nakOperation(kAddress, op));
    ASSERT_EQ(test_support::errorOf(result), make_error_code(SignError::NakReceived), "nak surfaced");
    ASSERT_TRUE(!result && isRetryable(result.error()), "nak is retryable");
    ASSERT_TRUE(!machine.pendingOperation().has_value(), "nak clears slot");
}

static void testWrongResponses() {
    const auto unexpectedResponse = make_error_code(SignError::UnexpectedResponse);
    const auto op = Operation::sendPage(PageId{2});

    DeviceStateMachine machine(kAddress);
    (void)machine.beginOperation(op);
    ASSERT_EQ(test_support::errorOf(machine.completeOperation(Message::ackOperation(Address{4}, op))),
              unexpectedResponse, "ack from another address");
    ASSERT_TRUE(!machine.pendingOperation().has_value(), "failure clears slot");

    (void)machine.beginOperation(op);
    ASSERT_EQ(test_support::errorOf(machine.completeOperation(Message::ackOperation(kAddress, Operation::sendPage(PageId{3})))),
              unexpectedResponse, "ack for another page");

    (void)machine.beginOperation(op);
    ASSERT_EQ(test_support::errorOf(machine.completeOperation(Message::reportState(kAddress, State::PageLoaded))),
              unexpectedResponse, "wrong shape");

    (void)machine.beginOperation(op);
    ASSERT_EQ(test_support::errorOf(machine.completeOperation(std::nullopt)), unexpectedResponse, "timeout");
    ASSERT_TRUE(!machine.pendingOperation().has_value(), "timeout clears slot");

    ASSERT_EQ(test_support::errorOf(machine.completeOperation(Message::ackOperation(kAddress, op))),
              unexpectedResponse, "ack with nothing pending");

    ASSERT_EQ(test_support::errorOf(machine.acceptState(Message::reportState(Address{9}, State::Unconfigured))),
              unexpectedResponse, "state from another address");
    ASSERT_EQ(test_support::errorOf(machine.acceptState(std::nullopt)), unexpectedResponse, "no state");
}

static void testConfiguredTracking() {
    DeviceStateMachine machine(kAddress);
    ASSERT_TRUE(!machine.isConfigured(), "nothing known yet");

    auto state = machine.acceptState(Message::reportState(kAddress, State::Unconfigured));
    ASSERT_TRUE(state && *state == State::Unconfigured, "state recorded");
    ASSERT_EQ(test_support::errorOf(machine.beginOperation(Operation::sendPage(PageId{0}))),
              make_error_code(SignError::NotConfigured), "only ReceiveConfig while unconfigured");
    ASSERT_TRUE(machine.beginOperation(Operation::receiveConfig()).has_value(), "ReceiveConfig allowed");
    machine.abandonOperation();

    (void)machine.acceptState(Message::reportState(kAddress, State::ConfigReceived));
    ASSERT_TRUE(machine.isConfigured(), "configured after ConfigReceived");

    (void)machine.acceptState(Message::reportState(kAddress, State::ReadyToReset));
    ASSERT_TRUE(!machine.isConfigured(), "reset clears configuration");
}

int main() {
    testSecondRequestIsInProgress();
    testAckClearsSlot();
    testNakIsRecoverable();
    testWrongResponses();
    testConfiguredTracking();
    return test_support::finish("DeviceStateMachine");
}
