#pragma once

/**
 * @file LogSink.hpp
 * @brief Pre-built log sinks for common output destinations
 */

#include <tether/core/Error.hpp>
#include <tether/io/Console.hpp>
#include <tether/io/LogService.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tether {

/**
 * @brief Factory for common log sinks
 */
class LogSinks {
  public:
    /// Console sink with colors (respects TTY detection). Writes to stderr so
    /// that stdout stays free for structured tool results.
    static LogService::Sink Console(const class Console &console) {
        return [console](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                if (console.IsColorEnabled()) {
                    std::cerr << entry.FormatColored(console) << "\n";
                } else {
                    std::cerr << entry.Format() << "\n";
                }
            }
            std::cerr.flush();
        };
    }

    /// File sink (plain text, no colors)
    static LogService::Sink File(const std::string &path) {
        auto file = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) {
            throw IOError("open log file", path, std::strerror(errno));
        }
        return [file](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                *file << entry.Format() << "\n";
            }
            file->flush();
        };
    }

    /// JSON Lines sink (for log aggregation)
    static LogService::Sink JsonLines(const std::string &path) {
        auto file = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) {
            throw IOError("open log file", path, std::strerror(errno));
        }
        return [file](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                nlohmann::json line;
                line["elapsed"] = entry.elapsed;
                line["level"] = LogLevelName(entry.level);
                line["component"] = entry.context.component;
                if (entry.context.command_id != 0) {
                    line["command_id"] = entry.context.command_id;
                }
                line["message"] = entry.message;
                *file << line.dump() << "\n";
            }
            file->flush();
        };
    }

    /**
     * @brief In-memory sink, mostly for tests
     *
     * The returned store is shared with the sink and outlives the service.
     */
    struct MemoryStore {
        std::mutex mutex;
        std::vector<LogEntry> entries;

        [[nodiscard]] std::vector<LogEntry> Snapshot() {
            std::lock_guard<std::mutex> lock(mutex);
            return entries;
        }

        [[nodiscard]] bool Contains(const std::string &needle) {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto &entry : entries) {
                if (entry.message.find(needle) != std::string::npos) {
                    return true;
                }
            }
            return false;
        }
    };

    static LogService::Sink Memory(const std::shared_ptr<MemoryStore> &store) {
        return [store](const std::vector<LogEntry> &entries) {
            std::lock_guard<std::mutex> lock(store->mutex);
            store->entries.insert(store->entries.end(), entries.begin(), entries.end());
        };
    }

    /// Null sink (for benchmarking)
    static LogService::Sink Null() {
        return [](const std::vector<LogEntry> & /*entries*/) {};
    }

    /// Callback sink (custom handling)
    static LogService::Sink Callback(std::function<void(const LogEntry &)> handler) {
        return [handler = std::move(handler)](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                handler(entry);
            }
        };
    }
};

/**
 * @brief Wire a LogService according to a LogConfig
 *
 * Replaces any existing sinks.
 */
inline void ApplyLogConfig(LogService &service, const LogConfig &config) {
    service.ClearSinks();
    LogLevel floor = config.console_level;
    if (config.console_enabled) {
        service.AddSink(LogSinks::Console(Console{}), config.console_level);
    }
    if (config.file_enabled && !config.file_path.empty()) {
        service.AddSink(LogSinks::File(config.file_path), config.file_level);
        floor = std::min(floor, config.file_level);
    }
    service.SetMinLevel(floor);
}

} // namespace tether
