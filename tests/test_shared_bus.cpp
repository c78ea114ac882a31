#include "flipdot/core/Sign.hpp"
#include "flipdot/testing/VirtualSignBus.hpp"

#include "TestSupport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

using namespace flipdot;
using namespace flipdot::protocol;
using testing::VirtualSignBus;

namespace {

// Forwards to the emulator and records how many transactions overlap.
class OverlapCountingBus : public SignBus {
public:
    explicit OverlapCountingBus(std::shared_ptr<SignBus> inner)
    : inner_(std::move(inner)) {}

    expected<std::optional<Message>> processMessage(const Message& message) override {
        const int now = ++inFlight_;
        int seen = maxInFlight_.load();
        while (now > seen && !maxInFlight_.compare_exchange_weak(seen, now)) {
        }
        ++transactions_;

        // Widen the window a concurrent caller would have to slip through.
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        auto response = inner_->processMessage(message);

        --inFlight_;
        return response;
    }

    int maxInFlight() const { return maxInFlight_.load(); }
    int transactions() const { return transactions_.load(); }

private:
    std::shared_ptr<SignBus> inner_;
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
    std::atomic<int> transactions_{0};
};

struct Outcome {
    bool configured = false;
    bool sent = false;
    bool shown = false;
};

void drive(Sign& sign, Outcome& outcome) {
    outcome.configured = sign.configure().has_value();
    if (!outcome.configured) {
        return;
    }
    auto first = sign.createPage(PageId{1});
    auto second = sign.createPage(PageId{2});
    (void)first.setPixel(sign.address().value, 0, true);
    (void)second.setPixel(0, 1, true);
    auto style = sign.sendPages({first, second});
    outcome.sent = style && *style == PageFlipStyle::Manual;
    outcome.shown = outcome.sent && sign.showLoadedPage().has_value();
}

} // namespace

static void testOneTransactionAtATime() {
    auto signs = std::make_shared<VirtualSignBus>();
    signs->addSign(Address{3});
    signs->addSign(Address{4});
    auto counting = std::make_shared<OverlapCountingBus>(signs);
    auto handle = makeBusHandle(counting);

    Sign left(handle, Address{3}, SignType::Max3000Side90x7);
    Sign right(handle, Address{4}, SignType::Max3000Side90x7);
    Outcome leftOutcome;
    Outcome rightOutcome;

    std::thread a([&]{ drive(left, leftOutcome); });
    std::thread b([&]{ drive(right, rightOutcome); });
    a.join();
    b.join();

    ASSERT_EQ(counting->maxInFlight(), 1, "never more than one transaction on the bus");
    ASSERT_TRUE(counting->transactions() > 40, "both signs did real work");

    ASSERT_TRUE(leftOutcome.configured && rightOutcome.configured, "both configured");
    ASSERT_TRUE(leftOutcome.sent && rightOutcome.sent, "both sent pages");
    ASSERT_TRUE(leftOutcome.shown && rightOutcome.shown, "both showing");

    for (auto address : {Address{3}, Address{4}}) {
        const auto* device = signs->sign(address);
        ASSERT_TRUE(device != nullptr, "sign present");
        if (!device) {
            continue;
        }
        ASSERT_TRUE(device->signType() == SignType::Max3000Side90x7, "device configured");
        ASSERT_EQ(device->pages().size(), static_cast<std::size_t>(2), "both pages stored");
        const auto* first = device->page(PageId{1});
        auto lit = first ? first->getPixel(address.value, 0) : expected<bool>(false);
        ASSERT_TRUE(lit && *lit, "page content belongs to this sign");
        ASSERT_TRUE(device->shownPage() == PageId{1}, "first page shown");
    }
}

int main() {
    testOneTransactionAtATime();
    return test_support::finish("SharedBus");
}
