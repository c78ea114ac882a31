#include "flipdot/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace flipdot::log {

namespace {

void toStdout(std::string_view message) {
    std::cout << message;
    std::cout.flush();
}

void toStderr(std::string_view message) {
    std::cerr << message;
    std::cerr.flush();
}

struct Sinks {
    std::mutex mutex;
    LogHandler info = toStdout;
    LogHandler error = toStderr;
};

Sinks& sinks() {
    static Sinks instance;
    return instance;
}

std::atomic<Level> threshold{Level::Info};

} // namespace

const char* toString(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Error: return "error";
    }
    return "unknown";
}

void setInfoLogHandler(LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    s.info = handler ? std::move(handler) : LogHandler(toStdout);
}

void setErrorLogHandler(LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    s.error = handler ? std::move(handler) : LogHandler(toStderr);
}

void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler) {
    setInfoLogHandler(std::move(infoHandler));
    setErrorLogHandler(std::move(errorHandler));
}

void resetLogHandlers() {
    setLogHandlers(nullptr, nullptr);
}

void setLogLevel(Level level) {
    threshold.store(level);
}

Level logLevel() {
    return threshold.load();
}

bool enabled(Level level) {
    return level >= threshold.load();
}

void write(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    LogHandler handler;
    {
        // Copied out so a handler may itself swap handlers.
        auto& s = sinks();
        std::lock_guard lock(s.mutex);
        handler = level == Level::Error ? s.error : s.info;
    }
    if (handler) {
        handler(message);
    }
}

} // namespace flipdot::log
