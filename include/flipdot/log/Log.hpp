#pragma once

#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace flipdot::log {

/**
 * @brief Severity of a log line.
 *
 * Debug carries raw wire dumps (every frame in hex), Info one line per bus
 * transaction, Error protocol violations and I/O failures. Lines below the
 * current level are dropped before they are formatted.
 */
enum class Level : std::uint8_t {
    Debug,
    Info,
    Error,
};

const char* toString(Level level);

/// Receives one finished line. Debug and Info go to the info sink.
using LogHandler = std::function<void(std::string_view)>;

void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void setLogLevel(Level level);
Level logLevel();
bool enabled(Level level);

void write(Level level, std::string_view message);

namespace detail {

template<typename... Args>
void emit(Level level, Args&&... args) {
    if (!enabled(level)) {
        return;
    }
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    write(level, oss.str());
}

} // namespace detail

template<typename... Args>
void logDebug(Args&&... args) {
    detail::emit(Level::Debug, std::forward<Args>(args)...);
}

template<typename... Args>
void logInfo(Args&&... args) {
    detail::emit(Level::Info, std::forward<Args>(args)...);
}

template<typename... Args>
void logError(Args&&... args) {
    detail::emit(Level::Error, std::forward<Args>(args)...);
}

} // namespace flipdot::log

namespace flipdot {
using log::LogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::setLogLevel;
using log::logDebug;
using log::logInfo;
using log::logError;
} // namespace flipdot
