// Errors.hpp
// -----------------------------------------------------------------------------
// std::error_code categories for everything the protocol engine can reject.
// Transport failures are not listed here: they surface as the Asio/system
// error code produced by the transport itself.

#pragma once

#include <system_error>

namespace flipdot {

/// Local decode failures. All of them mean "no usable response".
/// Malformed is a finer split of a frame that cannot be parsed; callers treat
/// it exactly like the other three (compare the category, not the value).
enum class FrameError {
    Truncated = 1,
    UnknownKind,
    ChecksumMismatch,
    Malformed,        // bad marker or non-hex digit in a text frame, or a declared length longer than the body
};

/// Semantic violations of the sign protocol.
enum class SignError {
    UnexpectedResponse = 1,
    OperationInProgress,
    NotConfigured,
    NakReceived,       // recoverable: the caller may retry the whole operation
    InvalidArgument,
};

enum class SignTypeError {
    WrongConfigLength = 1,
    UnknownConfig,
};

enum class PageError {
    OutOfBounds = 1,
    WrongPageLength,
};

const std::error_category& frameErrorCategory() noexcept;
const std::error_category& signErrorCategory() noexcept;
const std::error_category& signTypeErrorCategory() noexcept;
const std::error_category& pageErrorCategory() noexcept;

std::error_code make_error_code(FrameError e) noexcept;
std::error_code make_error_code(SignError e) noexcept;
std::error_code make_error_code(SignTypeError e) noexcept;
std::error_code make_error_code(PageError e) noexcept;

/// True for errors the caller may fix by simply retrying the operation.
bool isRetryable(const std::error_code& ec) noexcept;

} // namespace flipdot

namespace std {
template <> struct is_error_code_enum<flipdot::FrameError> : true_type {};
template <> struct is_error_code_enum<flipdot::SignError> : true_type {};
template <> struct is_error_code_enum<flipdot::SignTypeError> : true_type {};
template <> struct is_error_code_enum<flipdot::PageError> : true_type {};
} // namespace std
