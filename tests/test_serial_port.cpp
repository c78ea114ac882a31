#include "flipdot/io/IoService.hpp"
#include "flipdot/protocol/FrameCodec.hpp"
#include "flipdot/serial/SerialPort.hpp"

#include "TestSupport.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

using namespace flipdot;
using namespace std::chrono_literals;

namespace {

// Pseudo-terminal pair standing in for a USB RS-485 adapter.
class PseudoTerminal {
public:
    PseudoTerminal() {
        master_ = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (master_ >= 0 && ::grantpt(master_) == 0 && ::unlockpt(master_) == 0) {
            if (const char* name = ::ptsname(master_)) {
                slaveName_ = name;
            }
        }
    }

    ~PseudoTerminal() {
        if (master_ >= 0) {
            ::close(master_);
        }
    }

    bool ok() const { return master_ >= 0 && !slaveName_.empty(); }
    const std::string& slaveName() const { return slaveName_; }

    void send(const std::string& bytes) {
        ssize_t n = ::write(master_, bytes.data(), bytes.size());
        ASSERT_TRUE(n == static_cast<ssize_t>(bytes.size()), "pty write");
    }

    std::string receive(std::size_t expected) {
        std::string out;
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        char buf[256];
        while (out.size() < expected && std::chrono::steady_clock::now() < deadline) {
            ssize_t n = ::read(master_, buf, sizeof(buf));
            if (n > 0) {
                out.append(buf, static_cast<std::size_t>(n));
            }
        }
        return out;
    }

private:
    int master_ = -1;
    std::string slaveName_;
};

std::string text(const std::vector<std::uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

static void testOpenFailure() {
    io::IoService service;
    serial::SerialPort port(service.io());
    auto ec = port.open("/dev/flipdot-no-such-port");
    ASSERT_TRUE(static_cast<bool>(ec), "missing device reported");
    ASSERT_TRUE(!port.isOpen(), "port stays closed");

    auto read = port.readFrame(10ms);
    ASSERT_TRUE(!read && !serial::isTimeout(read.error()), "closed port is not a timeout");
    ASSERT_TRUE(!port.write({0x3A}), "write on closed port fails");
}

static void testFramesOverPty() {
    PseudoTerminal pty;
    ASSERT_TRUE(pty.ok(), "pty available");
    if (!pty.ok()) {
        return;
    }

    io::IoService service;
    serial::SerialPort port(service.io());
    ASSERT_TRUE(!port.open(pty.slaveName()), "open pty");
    ASSERT_TRUE(port.isOpen(), "port open");
    ASSERT_EQ(port.deviceName(), pty.slaveName(), "device name kept");

    const std::string hello = ":01000302FFFB\r\n";
    ASSERT_TRUE(port.write(std::vector<std::uint8_t>(hello.begin(), hello.end())).has_value(), "write");
    ASSERT_EQ(pty.receive(hello.size()), hello, "bytes on the wire");

    // Noise, then two frames where the second arrives in pieces.
    std::thread sender([&pty]{
        pty.send("\x7F\x7F:0100030401F7\r\n:0100");
        std::this_thread::sleep_for(50ms);
        pty.send("030407F");
        std::this_thread::sleep_for(50ms);
        pty.send("1\r\n");
    });

    auto first = port.readFrame(1000ms);
    auto second = port.readFrame(1000ms);
    sender.join();

    ASSERT_TRUE(first.has_value(), "first frame read");
    ASSERT_EQ(first ? text(*first) : std::string(), std::string(":0100030401F7\r\n"), "noise skipped");
    ASSERT_TRUE(second.has_value(), "fragmented frame read");
    ASSERT_EQ(second ? text(*second) : std::string(), std::string(":0100030407F1\r\n"), "fragments joined");

    auto decoded = protocol::FrameCodec{}.decode(second ? *second : std::vector<std::uint8_t>{});
    ASSERT_TRUE(decoded && decoded->state() == protocol::State::ConfigReceived, "decodes as a state report");

    const auto start = std::chrono::steady_clock::now();
    auto silent = port.readFrame(100ms);
    const auto waited = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(!silent && serial::isTimeout(silent.error()), "silence is a timeout");
    ASSERT_TRUE(waited >= 90ms && waited < 1s, "timeout honoured");

    port.close();
    ASSERT_TRUE(!port.isOpen(), "closed");
}

static void testBytesSurviveTimeout() {
    PseudoTerminal pty;
    ASSERT_TRUE(pty.ok(), "pty available");
    if (!pty.ok()) {
        return;
    }

    io::IoService service;
    serial::SerialPort port(service.io());
    ASSERT_TRUE(!port.open(pty.slaveName()), "open pty");

    // Half a frame, then silence: the read times out but keeps what it got.
    pty.send(":0100030401");
    auto partial = port.readFrame(150ms);
    ASSERT_TRUE(!partial && serial::isTimeout(partial.error()), "incomplete frame times out");

    // Many short deadlines racing a byte stream must not drop any of it.
    std::thread sender([&pty]{
        pty.send("F7\r\n");
        for (int i = 0; i < 20; ++i) {
            pty.send(":01000304");
            std::this_thread::sleep_for(2ms);
            pty.send("07F1\r\n");
        }
    });

    auto first = port.readFrame(1000ms);
    ASSERT_EQ(first ? text(*first) : std::string(), std::string(":0100030401F7\r\n"), "frame completed after timeout");

    int frames = 0;
    int attempts = 0;
    while (frames < 20 && attempts < 2000) {
        ++attempts;
        auto next = port.readFrame(1ms);
        if (next) {
            ASSERT_EQ(text(*next), std::string(":0100030407F1\r\n"), "frame intact");
            ++frames;
        } else {
            ASSERT_TRUE(serial::isTimeout(next.error()), "only timeouts while waiting");
        }
    }
    sender.join();
    ASSERT_EQ(frames, 20, "every frame arrived");
}

int main() {
    testOpenFailure();
    testFramesOverPty();
    testBytesSurviveTimeout();
    return test_support::finish("SerialPort");
}
