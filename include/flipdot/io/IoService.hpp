#pragma once
#include "flipdot/io/IoConfig.hpp"

#include <memory>
#include <thread>

namespace flipdot::io {

/**
 * @brief RAII wrapper around `asio::io_context` running on a dedicated thread.
 *
 * Serial reads and writes are issued asynchronously on this loop and awaited
 * with a deadline (see Deadline.hpp), which gives the blocking, timeout-bounded
 * calls the sign protocol is written against.
 *
 * Lifetime notes:
 * - Destroy ports before the IoService so their handlers complete while the
 *   `io_context` is still running.
 * - The destructor releases the work guard, stops the loop and joins the thread.
 */
class IoService {
public:
    IoService();
    ~IoService();

    IoService(const IoService&) = delete;
    IoService& operator=(const IoService&) = delete;
    IoService(IoService&&) = delete;
    IoService& operator=(IoService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

/// Process-wide loop for callers that do not need their own.
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace flipdot::io
