#pragma once

/**
 * @file ErrorLogging.hpp
 * @brief Integration between Error types and LogService
 *
 * Include this header to get automatic logging when throwing errors.
 */

#include <tether/core/Error.hpp>
#include <tether/io/LogService.hpp>

namespace tether {

/**
 * @brief Convert error severity to log level
 */
inline LogLevel SeverityToLogLevel(Severity severity) {
    switch (severity) {
    case Severity::INFO:
        return LogLevel::Info;
    case Severity::WARNING:
        return LogLevel::Warning;
    case Severity::ERROR:
        return LogLevel::Error;
    case Severity::FATAL:
        return LogLevel::Fatal;
    }
    return LogLevel::Error;
}

/**
 * @brief Log an error to the global LogService
 */
inline void LogError(const Error &error) {
    GetLogService().Log(SeverityToLogLevel(error.severity()), error.what());
}

/**
 * @brief Throw an error after logging it
 *
 * Usage:
 * @code
 * ThrowAndLog(SessionError::NotReady("Busy"));
 * @endcode
 */
template <typename E> [[noreturn]] void ThrowAndLog(E &&error) {
    LogError(error);
    throw std::forward<E>(error);
}

} // namespace tether

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error after logging it to global LogService
 * @param error The error to throw
 */
#define TETHER_THROW_LOG(error) ::tether::ThrowAndLog((error))

// NOLINTEND(cppcoreguidelines-macro-usage)
