#pragma once

#include "flipdot/core/SignBus.hpp"
#include "flipdot/protocol/FrameCodec.hpp"
#include "flipdot/serial/Transport.hpp"

#include <chrono>
#include <memory>

namespace flipdot::testing {

/**
 * @brief Bridges an ODK (the vendor's sign-bus diagnostic tool) to a SignBus.
 *
 * The ODK acts as a host: it sends requests on its own link and expects the
 * replies a sign would give. Each processMessage() call forwards one of its
 * frames to the bus (usually a VirtualSignBus) and writes back the reply.
 */
class Odk {
public:
    Odk(std::shared_ptr<serial::Transport> odkLink, std::shared_ptr<SignBus> bus,
        protocol::FrameCodec codec = protocol::FrameCodec{});

    /**
     * @brief Handle one frame from the ODK.
     *
     * Returns false when the ODK sent nothing within the read timeout.
     * Undecodable frames, bus failures and link failures are errors.
     */
    expected<bool> processMessage();

    void setReadTimeout(std::chrono::milliseconds timeout) { readTimeout_ = timeout; }
    std::chrono::milliseconds readTimeout() const { return readTimeout_; }

private:
    std::shared_ptr<serial::Transport> link_;
    std::shared_ptr<SignBus> bus_;
    protocol::FrameCodec codec_;
    std::chrono::milliseconds readTimeout_;
};

} // namespace flipdot::testing
