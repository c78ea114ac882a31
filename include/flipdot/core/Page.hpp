#pragma once

#include "flipdot/core/Expected.hpp"
#include "flipdot/protocol/Message.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace flipdot {

using protocol::PageId;

/// How a sign moves between the pages it holds.
enum class PageFlipStyle : std::uint8_t {
    Automatic,  // the sign cycles pages by itself
    Manual,     // the host drives loadNextPage() / showLoadedPage()
};

const char* toString(PageFlipStyle style);

/**
 * @brief Pixel buffer in the exact byte layout a sign receives.
 *
 * Layout:
 * - 4-byte header `[id, 0x10, 0x00, 0x00]`
 * - column-major pixels, `ceil(height / 8)` bytes per column, bit `y % 8` of
 *   byte `4 + x * bytesPerColumn + y / 8`
 * - 0xFF padding up to a multiple of 16 bytes
 */
class Page {
public:
    /// Blank page (all dots off).
    Page(PageId id, std::uint32_t width, std::uint32_t height);

    /// Wraps received bytes; fails with PageError::WrongPageLength on a size mismatch.
    static expected<Page> fromBytes(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> bytes);

    PageId id() const { return PageId{bytes_[0]}; }
    std::uint32_t width() const { return width_; }
    std::uint32_t height() const { return height_; }

    /// PageError::OutOfBounds unless 0 <= x < width and 0 <= y < height.
    expected<bool> getPixel(std::uint32_t x, std::uint32_t y) const;
    expected<void> setPixel(std::uint32_t x, std::uint32_t y, bool value);

    /// Sets every dot; header and padding bytes are untouched.
    void fill(bool value);

    const std::vector<std::uint8_t>& bytes() const { return bytes_; }

    /// ASCII rendering with a `+--+` border and '@' for lit dots.
    std::string describe() const;

    static std::size_t bytesPerColumn(std::uint32_t height);
    static std::size_t byteCount(std::uint32_t width, std::uint32_t height);

    bool operator==(const Page& other) const {
        return width_ == other.width_ && height_ == other.height_ && bytes_ == other.bytes_;
    }
    bool operator!=(const Page& other) const { return !(*this == other); }

private:
    Page(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> bytes)
    : width_(width), height_(height), bytes_(std::move(bytes)) {}

    bool inBounds(std::uint32_t x, std::uint32_t y) const { return x < width_ && y < height_; }
    std::size_t byteIndex(std::uint32_t x, std::uint32_t y) const;

    std::uint32_t width_;
    std::uint32_t height_;
    std::vector<std::uint8_t> bytes_;
};

/// Splits @p bytes into CHUNK_SIZE pieces; only the last may be shorter.
std::vector<std::vector<std::uint8_t>> splitIntoChunks(const std::vector<std::uint8_t>& bytes,
                                                       std::size_t chunkSize);

} // namespace flipdot
