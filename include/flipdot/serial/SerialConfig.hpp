#pragma once

#include <chrono>
#include <cstddef>

namespace flipdot::serial::config {

/**
 * @brief Line settings and pacing for the RS-485 sign bus.
 *
 * Read timeouts are process-wide, see io::TimeoutConfig.
 */

// Line settings (8N1, no flow control) ----------------------------------------
constexpr unsigned int BAUD_RATE = 19200;
constexpr unsigned int CHARACTER_SIZE = 8;

// Pacing ----------------------------------------------------------------------
constexpr std::chrono::milliseconds DATA_CHUNK_DELAY{30};      // after each DataChunk
constexpr std::chrono::milliseconds PROGRESS_POLL_DELAY{100};  // after a *InProgress report

// Receive buffering -----------------------------------------------------------
constexpr std::size_t READ_CHUNK_SIZE = 256;
constexpr std::size_t MAX_PENDING_BYTES = 4096;  // drop unframed noise beyond this

} // namespace flipdot::serial::config
