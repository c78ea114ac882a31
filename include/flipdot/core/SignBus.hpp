#pragma once

#include "flipdot/core/Expected.hpp"
#include "flipdot/protocol/Message.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace flipdot {

using protocol::Message;

/**
 * @brief One request/response transaction on a shared sign bus.
 *
 * Implementations send @p message and return the single response it provoked,
 * or std::nullopt when none arrived in time (or none is defined for the
 * message). A timeout is not an error. Transport failures and undecodable
 * responses are returned as error codes and end the transaction.
 */
class SignBus {
public:
    virtual ~SignBus() = default;

    virtual expected<std::optional<Message>> processMessage(const Message& message) = 0;
};

/**
 * @brief Serialises access to a SignBus shared by several signs.
 *
 * At most one transaction is in flight bus-wide; concurrent callers block on
 * the handle's mutex until the current transaction completes.
 */
class BusHandle {
public:
    explicit BusHandle(std::shared_ptr<SignBus> bus);

    BusHandle(const BusHandle&) = delete;
    BusHandle& operator=(const BusHandle&) = delete;

    expected<std::optional<Message>> processMessage(const Message& message);

    std::shared_ptr<SignBus> bus() const { return bus_; }

private:
    std::mutex mutex_;
    std::shared_ptr<SignBus> bus_;
};

/// Convenience for the common "one bus, several signs" setup.
std::shared_ptr<BusHandle> makeBusHandle(std::shared_ptr<SignBus> bus);

} // namespace flipdot
