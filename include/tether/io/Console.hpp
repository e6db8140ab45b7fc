#pragma once

/**
 * @file Console.hpp
 * @brief Console abstraction with ANSI color support
 *
 * Terminal-aware output used by the console log sink and the demo front end.
 * Colors are disabled automatically when the output stream is not a TTY.
 */

#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace tether {

// =============================================================================
// LogLevel
// =============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    Trace,   ///< Raw channel traffic
    Debug,   ///< Command send / completion details
    Info,    ///< Normal operation
    Event,   ///< Lifecycle events (session started, simulation launched, ...)
    Warning, ///< Timeouts, engine errors, stale output
    Error,   ///< Rejected operations
    Fatal    ///< Session lost
};

[[nodiscard]] inline const char *LogLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRC";
    case LogLevel::Debug:
        return "DBG";
    case LogLevel::Info:
        return "INF";
    case LogLevel::Event:
        return "EVT";
    case LogLevel::Warning:
        return "WRN";
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Fatal:
        return "FTL";
    }
    return "???";
}

// =============================================================================
// AnsiColor
// =============================================================================

struct AnsiColor {
    static constexpr const char *Reset = "\033[0m";
    static constexpr const char *Bold = "\033[1m";
    static constexpr const char *Dim = "\033[2m";

    static constexpr const char *Red = "\033[31m";
    static constexpr const char *Green = "\033[32m";
    static constexpr const char *Yellow = "\033[33m";
    static constexpr const char *Cyan = "\033[36m";
    static constexpr const char *White = "\033[37m";
    static constexpr const char *Gray = "\033[90m";

    static constexpr const char *BgRed = "\033[41m";
};

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Console output with color and padding helpers
 */
class Console {
  public:
    Console() : is_tty_(isatty(STDOUT_FILENO) != 0), color_enabled_(is_tty_) {}

    /// Check if stdout is a terminal (supports ANSI codes)
    [[nodiscard]] bool IsTerminal() const { return is_tty_; }

    /// Enable/disable color output (auto-detected by default)
    void SetColorEnabled(bool enabled) { color_enabled_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_enabled_; }

    /// Apply color if enabled
    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        if (!color_enabled_) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + AnsiColor::Reset;
    }

    [[nodiscard]] static const char *LevelColor(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return AnsiColor::Gray;
        case LogLevel::Debug:
            return AnsiColor::Cyan;
        case LogLevel::Info:
            return AnsiColor::White;
        case LogLevel::Event:
            return AnsiColor::Green;
        case LogLevel::Warning:
            return AnsiColor::Yellow;
        case LogLevel::Error:
            return AnsiColor::Red;
        case LogLevel::Fatal:
            return AnsiColor::BgRed;
        }
        return AnsiColor::White;
    }

    /// Pad string to width (text on the left)
    [[nodiscard]] static std::string PadRight(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(text) + std::string(width - text.size(), ' ');
    }

    /// Pad string to width (text on the right)
    [[nodiscard]] static std::string PadLeft(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(width - text.size(), ' ') + std::string(text);
    }

    /// Write raw string with newline
    void WriteLine(std::string_view text = "") const { std::cout << text << "\n"; }

    void Flush() const { std::cout.flush(); }

  private:
    bool is_tty_ = false;
    bool color_enabled_ = false;
};

} // namespace tether
