#include "flipdot/core/Page.hpp"

#include "flipdot/core/Errors.hpp"
#include "flipdot/core/SignConfig.hpp"
#include "flipdot/log/Log.hpp"

#include <algorithm>
#include <sstream>

namespace flipdot {

const char* toString(PageFlipStyle style) {
    switch (style) {
        case PageFlipStyle::Automatic: return "Automatic";
        case PageFlipStyle::Manual: return "Manual";
    }
    return "Unknown";
}

Page::Page(PageId id, std::uint32_t width, std::uint32_t height)
: width_(width)
, height_(height)
{
    const auto dataEnd = config::PAGE_HEADER_SIZE + width * bytesPerColumn(height);
    bytes_.reserve(byteCount(width, height));
    bytes_ = {id.value, config::PAGE_HEADER_MARK, 0x00, 0x00};
    bytes_.resize(dataEnd, 0x00);
    bytes_.resize(byteCount(width, height), config::PAGE_PADDING);
}

expected<Page> Page::fromBytes(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> bytes) {
    const auto expectedSize = byteCount(width, height);
    if (bytes.size() != expectedSize) {
        logError("[Page] wrong page length for ", width, "x", height,
                 ": expected ", expectedSize, ", got ", bytes.size(), "\n");
        return unexpected(make_error_code(PageError::WrongPageLength));
    }
    return Page(width, height, std::move(bytes));
}

std::size_t Page::bytesPerColumn(std::uint32_t height) {
    return (static_cast<std::size_t>(height) + 7) / 8;
}

std::size_t Page::byteCount(std::uint32_t width, std::uint32_t height) {
    const auto dataBytes = config::PAGE_HEADER_SIZE + static_cast<std::size_t>(width) * bytesPerColumn(height);
    return (dataBytes + 15) / 16 * 16;
}

std::size_t Page::byteIndex(std::uint32_t x, std::uint32_t y) const {
    return config::PAGE_HEADER_SIZE + static_cast<std::size_t>(x) * bytesPerColumn(height_) + y / 8;
}

expected<bool> Page::getPixel(std::uint32_t x, std::uint32_t y) const {
    if (!inBounds(x, y)) {
        return unexpected(make_error_code(PageError::OutOfBounds));
    }
    const auto mask = static_cast<std::uint8_t>(1u << (y % 8));
    return (bytes_[byteIndex(x, y)] & mask) == mask;
}

expected<void> Page::setPixel(std::uint32_t x, std::uint32_t y, bool value) {
    if (!inBounds(x, y)) {
        return unexpected(make_error_code(PageError::OutOfBounds));
    }
    const auto mask = static_cast<std::uint8_t>(1u << (y % 8));
    auto& byte = bytes_[byteIndex(x, y)];
    if (value) {
        byte |= mask;
    } else {
        byte &= static_cast<std::uint8_t>(~mask);
    }
    return {};
}

void Page::fill(bool value) {
    for (std::uint32_t x = 0; x < width_; ++x) {
        for (std::uint32_t y = 0; y < height_; ++y) {
            const auto mask = static_cast<std::uint8_t>(1u << (y % 8));
            auto& byte = bytes_[byteIndex(x, y)];
            byte = value ? (byte | mask) : (byte & static_cast<std::uint8_t>(~mask));
        }
    }
}

std::string Page::describe() const {
    const std::string border(width_, '-');
    std::ostringstream os;
    os << '+' << border << "+\n";
    for (std::uint32_t y = 0; y < height_; ++y) {
        os << '|';
        for (std::uint32_t x = 0; x < width_; ++x) {
            const auto mask = static_cast<std::uint8_t>(1u << (y % 8));
            os << ((bytes_[byteIndex(x, y)] & mask) ? '@' : ' ');
        }
        os << "|\n";
    }
    os << '+' << border << '+';
    return os.str();
}

std::vector<std::vector<std::uint8_t>> splitIntoChunks(const std::vector<std::uint8_t>& bytes,
                                                       std::size_t chunkSize) {
    std::vector<std::vector<std::uint8_t>> chunks;
    if (chunkSize == 0) {
        return chunks;
    }
    for (std::size_t offset = 0; offset < bytes.size(); offset += chunkSize) {
        const auto end = std::min(bytes.size(), offset + chunkSize);
        chunks.emplace_back(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                            bytes.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

} // namespace flipdot
