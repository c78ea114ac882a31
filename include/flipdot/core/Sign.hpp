#pragma once

#include "flipdot/core/DeviceStateMachine.hpp"
#include "flipdot/core/Expected.hpp"
#include "flipdot/core/Page.hpp"
#include "flipdot/core/SignBus.hpp"
#include "flipdot/core/SignType.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace flipdot {

/**
 * @brief High-level driver for one sign on a (possibly shared) bus.
 *
 * The Sign keeps no authoritative copy of the device state: every operation
 * asks the device and checks each response through its DeviceStateMachine.
 * Operations are blocking and strictly sequential for one sign.
 *
 * Typical use:
 * @code
 * Sign sign(bus, Address{3}, SignType::Max3000Side90x7);
 * sign.configure();
 * auto page = sign.createPage(PageId{1});
 * page.setPixel(0, 0, true);
 * if (sign.sendPages({page}) == PageFlipStyle::Manual) {
 *     sign.showLoadedPage();
 * }
 * @endcode
 */
class Sign {
public:
    Sign(std::shared_ptr<BusHandle> bus, Address address, SignType type);

    Sign(const Sign&) = delete;
    Sign& operator=(const Sign&) = delete;

    Address address() const { return address_; }
    SignType signType() const { return type_; }
    std::uint32_t width() const { return dimensions(type_).width; }
    std::uint32_t height() const { return dimensions(type_).height; }

    /// Blank page sized for this sign.
    Page createPage(PageId id) const;

    /**
     * @brief Reset the sign if needed and send its configuration block.
     *
     * Hello first; a sign that is not Unconfigured is taken through
     * StartReset / FinishReset. Succeeds once the sign reports ConfigReceived.
     * Page operations fail with NotConfigured until a call has succeeded.
     */
    expected<void> configure();

    /**
     * @brief Transfer @p pages in order and report how the sign flips them.
     *
     * Each page is sent as RequestOperation(SendPage) followed by 16-byte
     * DataChunks and a DataChunksSent count, every step acknowledged.
     * A Nak aborts with SignError::NakReceived; resend the whole batch to retry.
     */
    expected<PageFlipStyle> sendPages(const std::vector<Page>& pages);

    /// Switch the display to the loaded page. A no-op on Automatic signs.
    expected<void> showLoadedPage();

    /// Load the next stored page without showing it. A no-op on Automatic signs.
    expected<void> loadNextPage();

    /// Goodbye; the sign resets and blanks. No response is expected.
    expected<void> shutDown();

    /// True once configure() has succeeded, until the next configure() or shutDown().
    bool isConfigured() const { return configured_; }

    const DeviceStateMachine& stateMachine() const { return machine_; }

private:
    expected<std::optional<Message>> send(const Message& message);
    expected<State> queryState(const Message& query);
    expected<void> requestOperation(const protocol::Operation& op);
    expected<void> resetSign(State current);
    expected<void> transfer(const protocol::Operation& op, const std::vector<std::uint8_t>& bytes);
    expected<void> switchPage(State target, State trigger, const protocol::Operation& op);

    std::shared_ptr<BusHandle> bus_;
    const Address address_;
    const SignType type_;
    DeviceStateMachine machine_;
    bool configured_ = false;
};

} // namespace flipdot
