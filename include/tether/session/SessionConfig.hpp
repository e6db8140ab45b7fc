#pragma once

/**
 * @file SessionConfig.hpp
 * @brief Session, envelope and top-level configuration structs
 *
 * These structs are plain data with Validate() helpers. YAML loading lives in
 * io/ConfigLoader.hpp.
 */

#include <tether/io/LogService.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace tether {

using Milliseconds = std::chrono::milliseconds;

// =============================================================================
// ErrorMarker
// =============================================================================

/**
 * @brief In-band error marker recognized in engine output
 *
 * The pattern is an ECMAScript regex matched (case-insensitively) against each
 * whitespace-trimmed output line. within_lines limits the search to the first
 * N lines (0 = anywhere), which is how interpreter errors are told apart from
 * report content that merely mentions them.
 */
struct ErrorMarker {
    std::string pattern;
    std::size_t within_lines = 0;

    ErrorMarker() = default;
    ErrorMarker(std::string p, std::size_t within = 0)
        : pattern(std::move(p)), within_lines(within) {}

    /// Vivado tool errors ("ERROR: [Synth 8-87] ...") and Tcl interpreter errors
    [[nodiscard]] static std::vector<ErrorMarker> Defaults() {
        return {
            {R"(^ERROR:\s*\[)", 0},
            {R"(^invalid command name)", 5},
            {R"(^wrong # args:)", 5},
            {R"(^can't read ".*": no such variable)", 5},
            {R"(^expected .* but got)", 5},
            {R"(^couldn't open)", 5},
            {R"(^no files matched)", 5},
        };
    }
};

// =============================================================================
// SessionConfig
// =============================================================================

/**
 * @brief How the per-call timeout is measured
 */
enum class TimeoutMode {
    Deadline,  ///< Wall-clock budget from the moment the command is sent
    Inactivity ///< Budget restarts whenever new output arrives
};

/**
 * @brief Process-session configuration
 */
struct SessionConfig {
    std::string executable = "vivado";
    std::vector<std::string> args = {"-mode", "tcl", "-nojournal", "-nolog"};

    /// Prompt text that marks the engine as idle
    std::string prompt = "Vivado%";

    /// Optional banner to wait for before probing with an empty line
    std::string startup_banner;

    Milliseconds startup_timeout{10'000};
    Milliseconds command_timeout{300'000};
    TimeoutMode timeout_mode = TimeoutMode::Deadline;

    /// Budget for the drain that follows an earlier timeout when no per-call
    /// timeout is given
    Milliseconds resync_timeout{2'000};

    std::string exit_command = "exit";
    Milliseconds exit_grace{5'000};

    /// Send the terminal interrupt character when a command times out
    bool interrupt_on_timeout = false;

    std::vector<ErrorMarker> error_markers = ErrorMarker::Defaults();

    std::string line_terminator = "\n";

    /// Number of completed commands kept in the status history
    std::size_t history_limit = 100;

    [[nodiscard]] static SessionConfig Default() { return SessionConfig{}; }

    /// Validate configuration
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (executable.empty()) {
            errors.push_back("session.executable must not be empty");
        }
        if (prompt.empty()) {
            errors.push_back("session.prompt must not be empty");
        }
        if (startup_timeout.count() <= 0) {
            errors.push_back("session.startup_timeout must be positive");
        }
        if (command_timeout.count() <= 0) {
            errors.push_back("session.command_timeout must be positive");
        }
        if (exit_grace.count() < 0) {
            errors.push_back("session.exit_grace must not be negative");
        }
        if (line_terminator.empty()) {
            errors.push_back("session.line_terminator must not be empty");
        }
        return errors;
    }
};

// =============================================================================
// EnvelopeConfig
// =============================================================================

/**
 * @brief Response size bounding and report artifact settings
 */
struct EnvelopeConfig {
    std::size_t max_chars = 8000;
    std::string reports_dir = "/tmp/tether";
    double report_cache_hours = 1.0;

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (max_chars == 0) {
            errors.push_back("envelope.max_chars must be positive");
        }
        if (reports_dir.empty()) {
            errors.push_back("envelope.reports_dir must not be empty");
        }
        if (report_cache_hours < 0.0) {
            errors.push_back("envelope.report_cache_hours must not be negative");
        }
        return errors;
    }
};

// =============================================================================
// TetherConfig
// =============================================================================

struct TetherConfig {
    SessionConfig session;
    EnvelopeConfig envelope;
    LogConfig log;

    /// Where the config came from (file path or "<string>")
    std::string source_file;

    [[nodiscard]] std::vector<std::string> Validate() const {
        auto errors = session.Validate();
        auto envelope_errors = envelope.Validate();
        errors.insert(errors.end(), envelope_errors.begin(), envelope_errors.end());
        return errors;
    }
};

} // namespace tether
