#pragma once

#include <cstddef>
#include <cstdint>

namespace flipdot::config {

/**
 * @brief Constants that shape page transfer and page switching.
 *
 * Bus timing (baud rate, inter-frame delays, read timeouts) lives in
 * serial/SerialConfig.hpp; these values apply to every bus.
 */

// Transfer --------------------------------------------------------------------
constexpr std::size_t CHUNK_SIZE = 16;          // bytes per DataChunk
constexpr std::size_t PAGE_HEADER_SIZE = 4;     // [id, 0x10, 0x00, 0x00]
constexpr std::uint8_t PAGE_HEADER_MARK = 0x10;
constexpr std::uint8_t PAGE_PADDING = 0xFF;

// Page switching --------------------------------------------------------------
constexpr int MAX_STATE_POLLS = 50;              // QueryState attempts per show/load

} // namespace flipdot::config
