#include "flipdot/serial/SerialPort.hpp"

#include "flipdot/io/Deadline.hpp"
#include "flipdot/io/TimeoutConfig.hpp"
#include "flipdot/log/Log.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace flipdot::serial {

using steady = std::chrono::steady_clock;

SerialPort::SerialPort(std::shared_ptr<asio::io_context> io, protocol::FrameCodec codec)
: io_(std::move(io))
, port_(*io_)
, codec_(std::move(codec))
, inbox_(std::make_shared<Inbox>())
{}

SerialPort::~SerialPort() {
    close();
}

std::error_code SerialPort::open(const std::string& device, unsigned int baudRate) {
    close();

    std::error_code ec;
    port_.open(device, ec);
    if (ec) {
        logError("[SerialPort] open ", device, " failed: ", ec.message(), "\n");
        return ec;
    }

    using sp = asio::serial_port_base;
    const auto configureOption = [&](const auto& option) {
        if (!ec) {
            port_.set_option(option, ec);
        }
    };
    configureOption(sp::baud_rate(baudRate));
    configureOption(sp::character_size(config::CHARACTER_SIZE));
    configureOption(sp::parity(sp::parity::none));
    configureOption(sp::stop_bits(sp::stop_bits::one));
    configureOption(sp::flow_control(sp::flow_control::none));
    if (ec) {
        logError("[SerialPort] configuring ", device, " failed: ", ec.message(), "\n");
        close();
        return ec;
    }

    device_ = device;
    {
        std::lock_guard lock(inbox_->mutex);
        inbox_->pending.clear();
    }
    logInfo("[SerialPort] opened ", device, " at ", baudRate, " baud\n");
    return {};
}

void SerialPort::close() {
    if (!port_.is_open()) return;
    std::error_code ec;
    port_.cancel(ec);
    port_.close(ec);
    logInfo("[SerialPort] closed ", device_, "\n");
}

expected<void> SerialPort::write(const std::vector<std::uint8_t>& bytes) {
    if (!port_.is_open()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }

    auto sent = io::transfer_with_deadline(port_.get_executor(), io::TimeoutConfig::defaultTimeout(),
        [&](auto completion){ asio::async_write(port_, asio::buffer(bytes), completion); },
        [&]{ std::error_code ignored; port_.cancel(ignored); }
    );
    if (!sent) {
        logError("[SerialPort] write failed: ", sent.error().message(), "\n");
        return unexpected(sent.error());
    }
    return {};
}

expected<std::vector<std::uint8_t>> SerialPort::readFrame(std::chrono::milliseconds timeout) {
    if (!port_.is_open()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }

    const auto deadline = steady::now() + io::TimeoutConfig::sanitize(timeout);

    for (;;) {
        if (const auto length = scanPending()) {
            return takeFrame(length);
        }

        const auto now = steady::now();
        if (now >= deadline) {
            return unexpected(std::make_error_code(std::errc::timed_out));
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        // The handler files the bytes itself, so a read that completes just
        // as the deadline fires still lands in the inbox.
        auto inbox = inbox_;
        auto received = io::transfer_with_deadline(port_.get_executor(), remaining,
            [&](auto completion){
                port_.async_read_some(asio::buffer(inbox->chunk),
                    [inbox, completion](const std::error_code& ec, std::size_t n) mutable {
                        {
                            std::lock_guard lock(inbox->mutex);
                            inbox->pending.insert(inbox->pending.end(), inbox->chunk.begin(),
                                                  inbox->chunk.begin() + static_cast<std::ptrdiff_t>(n));
                            if (inbox->pending.size() > config::MAX_PENDING_BYTES) {
                                logError("[SerialPort] discarding ", inbox->pending.size(), " unframed bytes\n");
                                inbox->pending.clear();
                            }
                        }
                        completion(ec, n);
                    });
            },
            [&]{ std::error_code ignored; port_.cancel(ignored); }
        );
        if (!received && !isTimeout(received.error())) {
            logError("[SerialPort] read failed: ", received.error().message(), "\n");
            return unexpected(received.error());
        }
    }
}

std::size_t SerialPort::scanPending() {
    std::lock_guard lock(inbox_->mutex);
    return codec_.scanFrame(inbox_->pending.data(), inbox_->pending.size());
}

std::vector<std::uint8_t> SerialPort::takeFrame(std::size_t length) {
    std::lock_guard lock(inbox_->mutex);
    auto& pending = inbox_->pending;
    auto begin = pending.begin();
    auto end = begin + static_cast<std::ptrdiff_t>(std::min(length, pending.size()));

    // Line noise before the start marker is not part of the frame.
    const auto marker = std::find(begin, end, codec_.format().startMarker);
    if (marker != begin && marker != end) {
        logError("[SerialPort] skipped ", std::distance(begin, marker), " byte(s) before frame\n");
        begin = marker;
    }

    std::vector<std::uint8_t> frame(begin, end);
    pending.erase(pending.begin(), end);
    return frame;
}

} // namespace flipdot::serial
