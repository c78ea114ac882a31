#include "flipdot/core/SignBus.hpp"

#include "flipdot/core/Errors.hpp"

#include <utility>

namespace flipdot {

BusHandle::BusHandle(std::shared_ptr<SignBus> bus)
: bus_(std::move(bus))
{}

expected<std::optional<Message>> BusHandle::processMessage(const Message& message) {
    std::lock_guard lock(mutex_);
    if (!bus_) {
        return unexpected(make_error_code(SignError::InvalidArgument));
    }
    return bus_->processMessage(message);
}

std::shared_ptr<BusHandle> makeBusHandle(std::shared_ptr<SignBus> bus) {
    return std::make_shared<BusHandle>(std::move(bus));
}

} // namespace flipdot
