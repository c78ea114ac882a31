#include "flipdot/core/Sign.hpp"
#include "flipdot/serial/SerialPort.hpp"
#include "flipdot/serial/SerialSignBus.hpp"
#include "flipdot/testing/VirtualSignBus.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace flipdot;

// Sends two patterned pages to the 90x7 side sign at address 3, either on a
// real bus (pass the serial device) or on an emulated one (no arguments).
int main(int argc, char** argv) {
    constexpr Address signAddress{3};

    std::shared_ptr<testing::VirtualSignBus> virtualBus;
    std::shared_ptr<SignBus> bus;

    if (argc > 1) {
        auto port = std::make_shared<serial::SerialPort>();
        if (auto ec = port->open(argv[1])) {
            std::cerr << "Could not open " << argv[1] << ": " << ec.message() << "\n";
            return 1;
        }
        bus = std::make_shared<serial::SerialSignBus>(port);
    } else {
        std::cout << "No serial port given, using a virtual sign\n";
        virtualBus = std::make_shared<testing::VirtualSignBus>();
        virtualBus->addSign(signAddress, PageFlipStyle::Manual);
        bus = virtualBus;
    }

    Sign sign(makeBusHandle(bus), signAddress, SignType::Max3000Side90x7);
    if (auto r = sign.configure(); !r) {
        std::cerr << "Configure failed: " << r.error().message() << "\n";
        return 1;
    }

    auto page1 = sign.createPage(PageId{0});
    auto page2 = sign.createPage(PageId{1});
    for (std::uint32_t x = 0; x < sign.width(); ++x) {
        for (std::uint32_t y = 0; y < sign.height(); ++y) {
            // Coordinates come from the sign's own size, so these cannot be out of bounds.
            (void)page1.setPixel(x, y, x % 4 == y % 4);
            (void)page2.setPixel(x, y, (x + y) % 5 > 2);
        }
    }

    auto style = sign.sendPages({page1, page2});
    if (!style) {
        std::cerr << "Sending pages failed: " << style.error().message() << "\n";
        return 1;
    }

    if (*style == PageFlipStyle::Manual) {
        std::cout << "Manually flipping pages\n";
        for (auto step : {&Sign::showLoadedPage, &Sign::loadNextPage, &Sign::showLoadedPage}) {
            if (auto r = (sign.*step)(); !r) {
                std::cerr << "Page flip failed: " << r.error().message() << "\n";
                return 1;
            }
        }
    } else {
        std::cout << "Sign should automatically flip pages\n";
    }

    if (virtualBus) {
        if (const auto* emulated = virtualBus->sign(signAddress)) {
            for (const auto& entry : emulated->pages()) {
                std::cout << "Page " << static_cast<int>(entry.first.value) << ":\n"
                          << entry.second.describe() << "\n";
            }
        }
    }

    if (auto r = sign.shutDown(); !r) {
        std::cerr << "Shut down failed: " << r.error().message() << "\n";
        return 1;
    }
    return 0;
}
