#pragma once

#include "flipdot/io/IoConfig.hpp"
#include "flipdot/io/IoService.hpp"
#include "flipdot/protocol/FrameCodec.hpp"
#include "flipdot/serial/SerialConfig.hpp"
#include "flipdot/serial/Transport.hpp"

#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flipdot::serial {

namespace asio = io::asio;

/**
 * @brief Transport over a local serial device (USB RS-485 adapter).
 *
 * The port is opened 8N1 with no flow control. Reads run asynchronously on
 * the IoService loop and are bounded with `io::transfer_with_deadline`; bytes that
 * arrive after a complete frame, or after a read timed out, are kept for the
 * next `readFrame` call.
 */
class SerialPort : public Transport {
public:
    explicit SerialPort(std::shared_ptr<asio::io_context> io = io::shared_io_context(),
                        protocol::FrameCodec codec = protocol::FrameCodec{});
    ~SerialPort() override;

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    /// Opens and configures @p device (e.g. "/dev/ttyUSB0").
    std::error_code open(const std::string& device, unsigned int baudRate = config::BAUD_RATE);
    void close();
    bool isOpen() const { return port_.is_open(); }

    const std::string& deviceName() const { return device_; }

    expected<void> write(const std::vector<std::uint8_t>& bytes) override;
    expected<std::vector<std::uint8_t>> readFrame(std::chrono::milliseconds timeout) override;

private:
    // Shared with in-flight read handlers, which may complete on the I/O
    // thread after readFrame has given up on them.
    struct Inbox {
        std::mutex mutex;
        std::array<std::uint8_t, config::READ_CHUNK_SIZE> chunk{};
        std::vector<std::uint8_t> pending;
    };

    std::size_t scanPending();
    std::vector<std::uint8_t> takeFrame(std::size_t length);

    std::shared_ptr<asio::io_context> io_;
    asio::serial_port port_;
    protocol::FrameCodec codec_;
    std::string device_;
    std::shared_ptr<Inbox> inbox_;
};

} // namespace flipdot::serial
