#include "flipdot/core/Errors.hpp"
#include "flipdot/serial/SerialPort.hpp"
#include "flipdot/testing/Odk.hpp"
#include "flipdot/testing/VirtualSignBus.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <strings.h>

using namespace flipdot;

// Answers an ODK on a serial port with virtual signs.
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cout << "Usage: odk <serial_port> <auto|manual> [sign_address]\n\n"
                  << "serial_port is a device such as /dev/ttyUSB0.\n"
                  << "Without sign_address, virtual signs answer on every address "
                  << protocol::MIN_DEVICE_ADDRESS << "-" << protocol::MAX_DEVICE_ADDRESS << ".\n";
        return 0;
    }

    const auto flipStyle = strcasecmp(argv[2], "auto") == 0 ? PageFlipStyle::Automatic : PageFlipStyle::Manual;

    auto bus = std::make_shared<testing::VirtualSignBus>();
    if (argc > 3) {
        const auto value = std::strtoul(argv[3], nullptr, 10);
        const protocol::Address address{static_cast<std::uint16_t>(value)};
        if (!protocol::isDeviceAddress(address)) {
            std::cerr << "Sign address must be " << protocol::MIN_DEVICE_ADDRESS
                      << "-" << protocol::MAX_DEVICE_ADDRESS << "\n";
            return 1;
        }
        std::cout << "Providing virtual sign " << address.value << "\n";
        bus->addSign(address, flipStyle);
    } else {
        std::cout << "Providing all virtual signs\n";
        for (auto a = protocol::MIN_DEVICE_ADDRESS; a <= protocol::MAX_DEVICE_ADDRESS; ++a) {
            bus->addSign(protocol::Address{a}, flipStyle);
        }
    }

    auto port = std::make_shared<serial::SerialPort>();
    if (auto ec = port->open(argv[1])) {
        std::cerr << "Could not open " << argv[1] << ": " << ec.message() << "\n";
        return 1;
    }

    constexpr std::chrono::seconds pageInterval{5};
    auto nextTick = std::chrono::steady_clock::now() + pageInterval;

    testing::Odk odk(port, bus);
    for (;;) {
        // Bad frames from the ODK are logged and skipped; only link failures end the bridge.
        auto handled = odk.processMessage();
        if (!handled && handled.error().category() != frameErrorCategory()) {
            std::cerr << "ODK link failed: " << handled.error().message() << "\n";
            return 1;
        }

        if (std::chrono::steady_clock::now() >= nextTick) {
            bus->tick();
            nextTick += pageInterval;
        }
    }
}
