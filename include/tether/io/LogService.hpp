#pragma once

/**
 * @file LogService.hpp
 * @brief Unified logging service for Tether
 *
 * Provides both immediate and buffered logging modes.
 *
 * Consolidates: LogConfig, LogEntry, LogContextManager, LogService
 */

#include <tether/io/Console.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace tether {

// =============================================================================
// LogConfig
// =============================================================================

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel console_level = LogLevel::Info;
    bool console_enabled = true;

    bool file_enabled = false;
    std::string file_path;
    LogLevel file_level = LogLevel::Debug;

    /// Create default config
    [[nodiscard]] static LogConfig Default() { return LogConfig{}; }

    /// Create quiet config (errors only)
    [[nodiscard]] static LogConfig Quiet() {
        LogConfig config;
        config.console_level = LogLevel::Error;
        return config;
    }

    /// Create verbose config (raw channel traffic included)
    [[nodiscard]] static LogConfig Verbose() {
        LogConfig config;
        config.console_level = LogLevel::Trace;
        return config;
    }
};

// =============================================================================
// LogContext
// =============================================================================

/**
 * @brief Log context - set by the session while a command is in flight
 *
 * The LogContext is thread-local. Code running under a ScopedContext does not
 * need to pass the context explicitly.
 */
struct LogContext {
    std::string component;   ///< Emitting subsystem (e.g., "session", "sim")
    uint64_t command_id = 0; ///< Engine command number, 0 when none in flight

    /// "component#id" or just "component"
    [[nodiscard]] std::string Tag() const {
        if (command_id == 0) {
            return component;
        }
        return component + "#" + std::to_string(command_id);
    }

    [[nodiscard]] bool IsSet() const { return !component.empty(); }
};

// =============================================================================
// LogEntry
// =============================================================================

/**
 * @brief A single log entry with full context
 */
struct LogEntry {
    LogLevel level;      ///< Severity level
    double elapsed;      ///< Seconds since the log service was created
    std::string message; ///< Log message
    LogContext context;  ///< Component / command context

    /// Wall clock time for ordering logs from concurrent sources
    std::chrono::steady_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, double elapsed, std::string_view message,
                           const LogContext &ctx) {
        LogEntry entry;
        entry.level = level;
        entry.elapsed = elapsed;
        entry.message = std::string(message);
        entry.context = ctx;
        entry.wall_time = std::chrono::steady_clock::now();
        return entry;
    }

    /// Format for output: "[elapsed] [LEVEL] [component#id] message"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::ostringstream oss;
        oss << "[" << std::fixed << std::setprecision(3) << elapsed << "] ";
        oss << "[" << LogLevelName(level) << "] ";

        if (include_context && context.IsSet()) {
            oss << "[" << context.Tag() << "] ";
        }

        oss << message;
        return oss.str();
    }

    /// Format with colors (for terminal)
    [[nodiscard]] std::string FormatColored(const Console &console) const {
        std::ostringstream oss;
        oss << console.Colorize("[", AnsiColor::Dim);
        oss << std::fixed << std::setprecision(3) << elapsed;
        oss << console.Colorize("]", AnsiColor::Dim) << " ";

        oss << console.Colorize("[" + std::string(LogLevelName(level)) + "]",
                                Console::LevelColor(level))
            << " ";

        if (context.IsSet()) {
            oss << console.Colorize("[" + context.Tag() + "]", AnsiColor::Cyan) << " ";
        }

        oss << message;
        return oss.str();
    }
};

// =============================================================================
// LogContextManager
// =============================================================================

/**
 * @brief Thread-local log context manager
 */
class LogContextManager {
  public:
    static void SetContext(const LogContext &ctx) { current_context_ = ctx; }
    static void ClearContext() { current_context_ = LogContext{}; }
    [[nodiscard]] static const LogContext &GetContext() { return current_context_; }

    /**
     * @brief RAII guard for automatic context management
     */
    class ScopedContext {
      public:
        explicit ScopedContext(const std::string &component, uint64_t command_id = 0)
            : previous_(current_context_) {
            current_context_.component = component;
            current_context_.command_id = command_id;
        }

        ~ScopedContext() { current_context_ = previous_; }

        ScopedContext(const ScopedContext &) = delete;
        ScopedContext &operator=(const ScopedContext &) = delete;
        ScopedContext(ScopedContext &&) = delete;
        ScopedContext &operator=(ScopedContext &&) = delete;

      private:
        LogContext previous_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_context_;
};

// =============================================================================
// LogService
// =============================================================================

/**
 * @brief Unified logging service for Tether
 *
 * ALL logging goes through this service. It operates in two modes:
 *
 * 1. **Immediate mode** (default): entries are pushed to sinks as they are
 *    logged.
 * 2. **Buffered mode**: entries are collected and flushed together, e.g.
 *    around a burst of simulation commands.
 */
class LogService {
  public:
    /// Sink callback type: receives batch of entries to output
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    LogService() : epoch_(std::chrono::steady_clock::now()) {}

    // === Mode Control ===

    void SetImmediateMode(bool immediate) {
        std::lock_guard<std::mutex> lock(mutex_);
        immediate_mode_ = immediate;
    }

    [[nodiscard]] bool IsImmediateMode() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return immediate_mode_;
    }

    /**
     * @brief RAII guard for buffered mode
     *
     * Switches to buffered mode on construction, restores previous mode
     * and flushes on destruction.
     */
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service)
            : service_(service), previous_mode_(service.IsImmediateMode()) {
            service_.SetImmediateMode(false);
        }

        ~BufferedScope() {
            service_.FlushAndClear();
            service_.SetImmediateMode(previous_mode_);
        }

        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;
        BufferedScope(BufferedScope &&) = delete;
        BufferedScope &operator=(BufferedScope &&) = delete;

      private:
        LogService &service_;
        bool previous_mode_;
    };

    // === Configuration ===

    /// Set minimum level (below this = dropped)
    void SetMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    [[nodiscard]] LogLevel GetMinLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void AddSink(Sink sink) { AddSink(std::move(sink), LogLevel::Trace); }

    /// Add a sink that only receives entries at or above a level
    void AddSink(Sink sink, LogLevel min_level) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.emplace_back(std::move(sink), min_level);
    }

    void ClearSinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    // === Logging API ===

    /// Log a message (uses current thread-local context)
    void Log(LogLevel level, std::string_view message) {
        Log(level, message, LogContextManager::GetContext());
    }

    /// Log with explicit context (bypasses thread-local)
    void Log(LogLevel level, std::string_view message, const LogContext &ctx) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }

        auto entry = LogEntry::Create(level, Elapsed(), message, ctx);

        if (level == LogLevel::Error) {
            ++error_count_;
        } else if (level == LogLevel::Fatal) {
            ++fatal_count_;
        }

        if (immediate_mode_) {
            FlushEntry(entry);
        } else {
            entries_.push_back(std::move(entry));
        }
    }

    void Trace(std::string_view msg) { Log(LogLevel::Trace, msg); }
    void Debug(std::string_view msg) { Log(LogLevel::Debug, msg); }
    void Info(std::string_view msg) { Log(LogLevel::Info, msg); }
    void Event(std::string_view msg) { Log(LogLevel::Event, msg); }
    void Warning(std::string_view msg) { Log(LogLevel::Warning, msg); }
    void Error(std::string_view msg) { Log(LogLevel::Error, msg); }
    void Fatal(std::string_view msg) { Log(LogLevel::Fatal, msg); }

    // === Flush Control ===

    /// Flush buffer to all sinks
    void Flush(bool sort_by_time = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        FlushLocked(sort_by_time);
    }

    void FlushAndClear(bool sort_by_time = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        FlushLocked(sort_by_time);
        entries_.clear();
    }

    /// Clear buffer without flushing (discard pending logs)
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    // === Query API ===

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] std::vector<LogEntry> GetPending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }

    [[nodiscard]] std::size_t FatalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fatal_count_;
    }

    void ResetErrorCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = 0;
        fatal_count_ = 0;
    }

  private:
    std::vector<LogEntry> entries_;
    std::vector<std::pair<Sink, LogLevel>> sinks_; ///< sink + min level
    LogLevel min_level_ = LogLevel::Info;
    bool immediate_mode_ = true;

    std::size_t error_count_ = 0;
    std::size_t fatal_count_ = 0;

    std::chrono::steady_clock::time_point epoch_;
    mutable std::mutex mutex_;

    [[nodiscard]] double Elapsed() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_).count();
    }

    void FlushLocked(bool sort_by_time) {
        if (entries_.empty()) {
            return;
        }

        if (sort_by_time) {
            std::stable_sort(entries_.begin(), entries_.end(),
                             [](const LogEntry &a, const LogEntry &b) {
                                 return a.wall_time < b.wall_time;
                             });
        }

        for (const auto &[sink, min_level] : sinks_) {
            std::vector<LogEntry> filtered;
            filtered.reserve(entries_.size());
            for (const auto &entry : entries_) {
                if (entry.level >= min_level) {
                    filtered.push_back(entry);
                }
            }
            if (!filtered.empty()) {
                sink(filtered);
            }
        }
    }

    void FlushEntry(const LogEntry &entry) {
        for (const auto &[sink, min_level] : sinks_) {
            if (entry.level >= min_level) {
                sink({entry});
            }
        }
    }
};

/**
 * @brief Global log service singleton
 */
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

} // namespace tether

// =============================================================================
// Logging Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define TETHER_LOG_TRACE(msg) ::tether::GetLogService().Trace(msg)

#define TETHER_LOG_DEBUG(msg) ::tether::GetLogService().Debug(msg)

#define TETHER_LOG_INFO(msg) ::tether::GetLogService().Info(msg)

#define TETHER_LOG_EVENT(msg) ::tether::GetLogService().Event(msg)

#define TETHER_LOG_WARN(msg) ::tether::GetLogService().Warning(msg)

#define TETHER_LOG_ERROR(msg) ::tether::GetLogService().Error(msg)

#define TETHER_LOG_FATAL(msg) ::tether::GetLogService().Fatal(msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
