#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace bulbnet::log {

enum class LogLevel {
    Info,
    Error
};

using LogHandler = std::function<void(std::string_view)>;

/**
 * @brief Replace the sink for one level. An empty handler restores the default
 * (stdout for Info, stderr for Error).
 */
void setLogHandler(LogLevel level, LogHandler handler);
void setInfoLogHandler(LogHandler handler);
void setErrorLogHandler(LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

void write(LogLevel level, std::string_view message);
void logInfo(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename First, typename... Rest>
using EnableForPieces = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !IsStringViewConvertible<std::decay_t<First>>::value>;

} // namespace detail

template<typename First, typename... Rest,
         typename = detail::EnableForPieces<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    write(LogLevel::Info,
        detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest,
         typename = detail::EnableForPieces<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    write(LogLevel::Error,
        detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

} // namespace bulbnet::log

namespace bulbnet {
using log::LogLevel;
using log::LogHandler;
using log::setLogHandler;
using log::setInfoLogHandler;
using log::setErrorLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logError;
} // namespace bulbnet
