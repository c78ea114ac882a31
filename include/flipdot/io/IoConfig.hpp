#pragma once

#include <asio.hpp>
#include <system_error>

namespace flipdot::io {

/**
 * @brief Single place that pulls in standalone Asio.
 *
 * Higher layers name `flipdot::io::asio` rather than including Asio
 * themselves, so the transport code can be read without the Asio headers.
 */
namespace asio = ::asio;

} // namespace flipdot::io
