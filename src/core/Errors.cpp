#include "flipdot/core/Errors.hpp"

#include <string>

namespace flipdot {
namespace {

class FrameErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "flipdot.frame"; }

    std::string message(int value) const override {
        switch (static_cast<FrameError>(value)) {
            case FrameError::Truncated:        return "frame truncated";
            case FrameError::UnknownKind:      return "unknown message kind";
            case FrameError::ChecksumMismatch: return "checksum mismatch";
            case FrameError::Malformed:        return "malformed frame";
        }
        return "unknown frame error";
    }
};

class SignErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "flipdot.sign"; }

    std::string message(int value) const override {
        switch (static_cast<SignError>(value)) {
            case SignError::UnexpectedResponse:  return "sign did not respond according to the protocol";
            case SignError::OperationInProgress: return "another operation is already pending for this address";
            case SignError::NotConfigured:       return "sign has not been configured";
            case SignError::NakReceived:         return "sign rejected the operation";
            case SignError::InvalidArgument:     return "invalid argument";
        }
        return "unknown sign error";
    }

    std::error_condition default_error_condition(int value) const noexcept override {
        switch (static_cast<SignError>(value)) {
            case SignError::OperationInProgress: return std::errc::operation_in_progress;
            case SignError::InvalidArgument:     return std::errc::invalid_argument;
            case SignError::UnexpectedResponse:  return std::errc::protocol_error;
            default:                             return std::error_condition(value, *this);
        }
    }
};

class SignTypeErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "flipdot.signtype"; }

    std::string message(int value) const override {
        switch (static_cast<SignTypeError>(value)) {
            case SignTypeError::WrongConfigLength: return "wrong sign configuration data length";
            case SignTypeError::UnknownConfig:     return "configuration data didn't match any known sign";
        }
        return "unknown sign type error";
    }
};

class PageErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "flipdot.page"; }

    std::string message(int value) const override {
        switch (static_cast<PageError>(value)) {
            case PageError::OutOfBounds:     return "coordinate out of bounds for page";
            case PageError::WrongPageLength: return "wrong number of data bytes for page";
        }
        return "unknown page error";
    }

    std::error_condition default_error_condition(int value) const noexcept override {
        if (static_cast<PageError>(value) == PageError::OutOfBounds) {
            return std::errc::argument_out_of_domain;
        }
        return std::error_condition(value, *this);
    }
};

} // namespace

const std::error_category& frameErrorCategory() noexcept {
    static const FrameErrorCategory category;
    return category;
}

const std::error_category& signErrorCategory() noexcept {
    static const SignErrorCategory category;
    return category;
}

const std::error_category& signTypeErrorCategory() noexcept {
    static const SignTypeErrorCategory category;
    return category;
}

const std::error_category& pageErrorCategory() noexcept {
    static const PageErrorCategory category;
    return category;
}

std::error_code make_error_code(FrameError e) noexcept {
    return {static_cast<int>(e), frameErrorCategory()};
}

std::error_code make_error_code(SignError e) noexcept {
    return {static_cast<int>(e), signErrorCategory()};
}

std::error_code make_error_code(SignTypeError e) noexcept {
    return {static_cast<int>(e), signTypeErrorCategory()};
}

std::error_code make_error_code(PageError e) noexcept {
    return {static_cast<int>(e), pageErrorCategory()};
}

bool isRetryable(const std::error_code& ec) noexcept {
    return ec == SignError::NakReceived;
}

} // namespace flipdot
