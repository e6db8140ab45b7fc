/**
 * @file ConfigLoader.cpp
 * @brief YAML configuration loading (yaml-cpp)
 */

#include <tether/io/ConfigLoader.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>

namespace tether::io {

namespace {

Milliseconds SecondsToMs(double seconds) {
    return Milliseconds{static_cast<Milliseconds::rep>(std::llround(seconds * 1000.0))};
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <typename T> void ReadIf(const YAML::Node &node, const char *key, T &out) {
    if (const auto value = node[key]) {
        out = value.as<T>();
    }
}

void ReadSecondsIf(const YAML::Node &node, const char *key, Milliseconds &out) {
    if (const auto value = node[key]) {
        out = SecondsToMs(value.as<double>());
    }
}

} // namespace

TetherConfig ConfigLoader::Load(const std::string &path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile &) {
        throw ConfigError("cannot read configuration file", path, -1);
    } catch (const YAML::Exception &e) {
        throw ConfigError(e.msg, path, e.mark.line >= 0 ? e.mark.line + 1 : -1);
    }
    return ParseRoot(root, path);
}

TetherConfig ConfigLoader::Parse(const std::string &yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception &e) {
        throw ConfigError(e.msg, "<string>", e.mark.line >= 0 ? e.mark.line + 1 : -1);
    }
    return ParseRoot(root, "<string>");
}

LogLevel ConfigLoader::ParseLogLevel(const std::string &name) {
    const auto lower = Lower(name);
    if (lower == "trace") {
        return LogLevel::Trace;
    }
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "event") {
        return LogLevel::Event;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::Warning;
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    if (lower == "fatal") {
        return LogLevel::Fatal;
    }
    throw ConfigError("unknown log level '" + name + "'");
}

TetherConfig ConfigLoader::ParseRoot(const YAML::Node &root, const std::string &source) {
    TetherConfig cfg;
    cfg.source_file = source;

    if (!root || root.IsNull()) {
        return cfg; // Empty document: all defaults
    }
    if (!root.IsMap()) {
        throw ConfigError("top-level YAML node must be a mapping", source, -1);
    }

    try {
        if (const auto session = root["session"]) {
            ParseSession(cfg.session, session, source);
        }
        if (const auto envelope = root["envelope"]) {
            ParseEnvelope(cfg.envelope, envelope, source);
        }
        if (const auto logging = root["logging"]) {
            ParseLogging(cfg.log, logging, source);
        }
    } catch (const YAML::Exception &e) {
        throw ConfigError(e.msg, source, e.mark.line >= 0 ? e.mark.line + 1 : -1);
    }

    auto errors = cfg.Validate();
    if (!errors.empty()) {
        std::string joined;
        for (const auto &err : errors) {
            joined += (joined.empty() ? "" : "; ") + err;
        }
        throw ConfigError(joined, source, -1);
    }
    return cfg;
}

void ConfigLoader::ParseSession(SessionConfig &cfg, const YAML::Node &node,
                                const std::string &source) {
    ReadIf(node, "executable", cfg.executable);
    ReadIf(node, "args", cfg.args);
    ReadIf(node, "prompt", cfg.prompt);
    ReadIf(node, "startup_banner", cfg.startup_banner);
    ReadSecondsIf(node, "startup_timeout", cfg.startup_timeout);
    ReadSecondsIf(node, "command_timeout", cfg.command_timeout);
    ReadSecondsIf(node, "resync_timeout", cfg.resync_timeout);
    ReadIf(node, "exit_command", cfg.exit_command);
    ReadSecondsIf(node, "exit_grace", cfg.exit_grace);
    ReadIf(node, "interrupt_on_timeout", cfg.interrupt_on_timeout);
    ReadIf(node, "line_terminator", cfg.line_terminator);
    ReadIf(node, "history_limit", cfg.history_limit);

    if (const auto mode = node["timeout_mode"]) {
        const auto value = Lower(mode.as<std::string>());
        if (value == "deadline") {
            cfg.timeout_mode = TimeoutMode::Deadline;
        } else if (value == "inactivity") {
            cfg.timeout_mode = TimeoutMode::Inactivity;
        } else {
            throw ConfigError("unknown timeout_mode '" + value + "'", source,
                              mode.Mark().line + 1, "use 'deadline' or 'inactivity'");
        }
    }

    if (const auto markers = node["error_markers"]) {
        if (!markers.IsSequence()) {
            throw ConfigError("session.error_markers must be a list", source,
                              markers.Mark().line + 1);
        }
        cfg.error_markers.clear();
        for (const auto &entry : markers) {
            ErrorMarker marker;
            if (entry.IsScalar()) {
                marker.pattern = entry.as<std::string>();
            } else {
                marker.pattern = entry["pattern"].as<std::string>();
                ReadIf(entry, "within_lines", marker.within_lines);
            }
            cfg.error_markers.push_back(std::move(marker));
        }
    }
}

void ConfigLoader::ParseEnvelope(EnvelopeConfig &cfg, const YAML::Node &node,
                                 const std::string & /*source*/) {
    ReadIf(node, "max_chars", cfg.max_chars);
    ReadIf(node, "reports_dir", cfg.reports_dir);
    ReadIf(node, "report_cache_hours", cfg.report_cache_hours);
}

void ConfigLoader::ParseLogging(LogConfig &cfg, const YAML::Node &node,
                                const std::string &source) {
    for (const char *key : {"console_level", "file_level"}) {
        const auto level = node[key];
        if (!level) {
            continue;
        }
        const auto name = level.as<std::string>();
        LogLevel parsed;
        try {
            parsed = ParseLogLevel(name);
        } catch (const ConfigError &) {
            throw ConfigError("unknown log level '" + name + "'", source, level.Mark().line + 1,
                              "use trace, debug, info, event, warning, error or fatal");
        }
        (std::string(key) == "console_level" ? cfg.console_level : cfg.file_level) = parsed;
    }
    ReadIf(node, "console", cfg.console_enabled);
    if (const auto file = node["file"]) {
        cfg.file_path = file.as<std::string>();
        cfg.file_enabled = !cfg.file_path.empty();
    }
}

} // namespace tether::io
