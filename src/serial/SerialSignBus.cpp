#include "flipdot/serial/SerialSignBus.hpp"

#include "flipdot/io/TimeoutConfig.hpp"
#include "flipdot/log/Log.hpp"
#include "flipdot/serial/SerialConfig.hpp"

#include <thread>
#include <utility>

namespace flipdot::serial {

using protocol::MessageKind;
using protocol::State;

namespace {

void sleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

std::chrono::milliseconds delayAfterSend(const Message& message) {
    // Signs drop data that arrives faster than they can store it.
    if (message.kind() == MessageKind::DataChunk) {
        return config::DATA_CHUNK_DELAY;
    }
    return std::chrono::milliseconds::zero();
}

std::chrono::milliseconds delayAfterReceive(const Message& message) {
    // Flipping a full page of dots can take a second or more; poll gently.
    if (message.kind() == MessageKind::ReportState
        && (message.state() == State::PageLoadInProgress || message.state() == State::PageShowInProgress)) {
        return config::PROGRESS_POLL_DELAY;
    }
    return std::chrono::milliseconds::zero();
}

} // namespace

SerialSignBus::SerialSignBus(std::shared_ptr<Transport> transport, protocol::FrameCodec codec)
: transport_(std::move(transport))
, codec_(std::move(codec))
, readTimeout_(io::TimeoutConfig::defaultTimeout())
, sleep_(sleepFor)
{}

void SerialSignBus::setSleepFunction(SleepFn sleep) {
    sleep_ = sleep ? std::move(sleep) : SleepFn(sleepFor);
}

expected<std::optional<Message>> SerialSignBus::processMessage(const Message& message) {
    logInfo("[SerialSignBus] ", message.describe(), "\n");

    const auto bytes = codec_.encode(message);
    logDebug("[SerialSignBus] tx ", protocol::toHexLine(bytes.data(), bytes.size()), "\n");
    if (auto written = transport_->write(bytes); !written) {
        logError("[SerialSignBus] write failed: ", written.error().message(), "\n");
        return unexpected(written.error());
    }

    if (const auto delay = delayAfterSend(message); delay.count() > 0) {
        sleep_(delay);
    }

    if (!message.expectsResponse()) {
        return std::optional<Message>{};
    }

    auto frame = transport_->readFrame(readTimeout_);
    if (!frame) {
        if (isTimeout(frame.error())) {
            logInfo("[SerialSignBus] no response within ", readTimeout_.count(), "ms\n");
            return std::optional<Message>{};
        }
        logError("[SerialSignBus] read failed: ", frame.error().message(), "\n");
        return unexpected(frame.error());
    }

    logDebug("[SerialSignBus] rx ", protocol::toHexLine(frame->data(), frame->size()), "\n");
    auto response = codec_.decode(*frame);
    if (!response) {
        logError("[SerialSignBus] undecodable response (", response.error().message(), "): ",
                 protocol::toHexLine(frame->data(), frame->size()), "\n");
        return unexpected(response.error());
    }

    logInfo("[SerialSignBus] ", response->describe(), "\n");

    if (const auto delay = delayAfterReceive(*response); delay.count() > 0) {
        sleep_(delay);
    }
    return std::optional<Message>{std::move(*response)};
}

} // namespace flipdot::serial
