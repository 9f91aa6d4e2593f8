#include "bulbnet/log/Log.hpp"

#include <array>
#include <iostream>
#include <mutex>

namespace bulbnet::log {

namespace {

constexpr std::size_t kLevelCount = 2;

std::size_t slot(LogLevel level) {
    return level == LogLevel::Error ? 1 : 0;
}

LogHandler makeDefaultHandler(LogLevel level) {
    if (level == LogLevel::Error) {
        return [](std::string_view message) {
            std::cerr << message;
            std::cerr.flush();
        };
    }
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

std::mutex handlerMutex;
std::array<LogHandler, kLevelCount> handlers{
    makeDefaultHandler(LogLevel::Info),
    makeDefaultHandler(LogLevel::Error)
};

void install(LogLevel level, LogHandler handler) {
    handlers[slot(level)] = handler ? std::move(handler) : makeDefaultHandler(level);
}

} // namespace

void setLogHandler(LogLevel level, LogHandler handler) {
    std::lock_guard lock(handlerMutex);
    install(level, std::move(handler));
}

void setInfoLogHandler(LogHandler handler) {
    setLogHandler(LogLevel::Info, std::move(handler));
}

void setErrorLogHandler(LogHandler handler) {
    setLogHandler(LogLevel::Error, std::move(handler));
}

void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler) {
    std::lock_guard lock(handlerMutex);
    install(LogLevel::Info, std::move(infoHandler));
    install(LogLevel::Error, std::move(errorHandler));
}

void resetLogHandlers() {
    std::lock_guard lock(handlerMutex);
    install(LogLevel::Info, nullptr);
    install(LogLevel::Error, nullptr);
}

void write(LogLevel level, std::string_view message) {
    LogHandler handler;
    {
        // Copy out so a slow sink never holds the lock.
        std::lock_guard lock(handlerMutex);
        handler = handlers[slot(level)];
    }
    if (handler) {
        handler(message);
    }
}

void logInfo(std::string_view message) {
    write(LogLevel::Info, message);
}

void logError(std::string_view message) {
    write(LogLevel::Error, message);
}

} // namespace bulbnet::log
