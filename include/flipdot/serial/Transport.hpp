#pragma once

#include "flipdot/core/Expected.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace flipdot::serial {

/**
 * @brief Byte pipe a SignBus runs over.
 *
 * `readFrame` returns exactly one complete encoded frame. When nothing arrives
 * within @p timeout it fails with an error equal to `std::errc::timed_out`;
 * callers treat that as "no response", not as a failure.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual expected<void> write(const std::vector<std::uint8_t>& bytes) = 0;
    virtual expected<std::vector<std::uint8_t>> readFrame(std::chrono::milliseconds timeout) = 0;
};

inline bool isTimeout(const std::error_code& ec) {
    return ec == std::errc::timed_out;
}

} // namespace flipdot::serial
