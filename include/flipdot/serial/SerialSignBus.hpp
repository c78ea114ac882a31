#pragma once

#include "flipdot/core/SignBus.hpp"
#include "flipdot/protocol/FrameCodec.hpp"
#include "flipdot/serial/Transport.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace flipdot::serial {

/**
 * @brief SignBus that talks to real signs through a Transport.
 *
 * One call is one transaction: encode and write the message, pause when the
 * protocol needs pacing, then read at most one response frame if the message
 * expects one. A read timeout yields std::nullopt. A response that fails to
 * decode is returned as its FrameError.
 */
class SerialSignBus : public SignBus {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    explicit SerialSignBus(std::shared_ptr<Transport> transport,
                           protocol::FrameCodec codec = protocol::FrameCodec{});

    expected<std::optional<Message>> processMessage(const Message& message) override;

    void setReadTimeout(std::chrono::milliseconds timeout) { readTimeout_ = timeout; }
    std::chrono::milliseconds readTimeout() const { return readTimeout_; }

    /// Replaces std::this_thread::sleep_for for the inter-frame delays.
    void setSleepFunction(SleepFn sleep);

    Transport& transport() { return *transport_; }

private:
    std::shared_ptr<Transport> transport_;
    protocol::FrameCodec codec_;
    std::chrono::milliseconds readTimeout_;
    SleepFn sleep_;
};

} // namespace flipdot::serial
