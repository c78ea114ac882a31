#pragma once
#include "flipdot/core/Expected.hpp"
#include "flipdot/io/IoConfig.hpp"
#include "flipdot/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <system_error>

namespace flipdot::io {

/**
 * @brief Block on an async transfer, bounded by an Asio timer.
 *
 * @p start_async receives a completion handler with the usual
 * `(error_code, bytes_transferred)` signature and must launch exactly one
 * operation with it. A `steady_timer` is armed on the same executor; the
 * first of the two to finish wins. When the timer wins, @p cancel is called
 * (it must cancel the object that launched the operation, e.g.
 * `port.cancel()`) and the result is `std::errc::timed_out`, the code every
 * Transport uses for "no data in time".
 *
 * Handlers own the shared state, so a late completion after this function
 * has returned is harmless. The executor's `io_context` must be running on
 * another thread.
 */
template<typename StartAsync, typename Cancel>
expected<std::size_t> transfer_with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct Outcome {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        std::error_code ec;
        std::size_t transferred = 0;
    };

    auto outcome = std::make_shared<Outcome>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    start_async([outcome, timer](const std::error_code& ec, std::size_t n) {
        {
            std::lock_guard<std::mutex> lk(outcome->m);
            if (outcome->done) return;
            outcome->ec = ec;
            outcome->transferred = n;
            outcome->done = true;
        }
        outcome->cv.notify_one();
        timer->cancel();
    });

    timer->expires_after(timeout);
    timer->async_wait([outcome, cancel, timer, timeout](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(outcome->m);
            if (outcome->done) return;
            outcome->ec = std::make_error_code(std::errc::timed_out);
            outcome->done = true;
        }
        logDebug("[Deadline] nothing after ", timeout.count(), "ms, cancelling\n");
        cancel();
        outcome->cv.notify_one();
    });

    std::unique_lock<std::mutex> lk(outcome->m);
    outcome->cv.wait(lk, [&]{ return outcome->done; });
    if (outcome->ec) {
        return unexpected(outcome->ec);
    }
    return outcome->transferred;
}

} // namespace flipdot::io
