#pragma once

/**
 * @file Error.hpp
 * @brief Consolidated error handling for Tether
 *
 * Provides a flattened exception hierarchy with a handful of categories.
 * Each category carries a kind enum and context rather than many subclasses.
 *
 * Outcome conditions that are not failures of the call itself (command
 * timeout, in-band engine errors, process exit during a command, parse
 * gaps) are reported through Transaction / ParsedReport, not exceptions.
 */

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace tether {

// =============================================================================
// Error Severity
// =============================================================================

enum class Severity : uint8_t {
    INFO,    ///< Informational (logged, no action)
    WARNING, ///< Warning (caller may continue)
    ERROR,   ///< Error (operation rejected)
    FATAL    ///< Fatal (session is unusable until restarted)
};

// =============================================================================
// Base Exception
// =============================================================================

/**
 * @brief Base class for all Tether exceptions
 *
 * All Tether exceptions carry:
 * - A severity level (defaults to ERROR)
 * - A category string for logging context and JSON error objects
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[tether] " + msg), severity_(severity),
          category_(std::move(category)) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

  protected:
    Severity severity_;
    std::string category_;
};

// =============================================================================
// Session Errors
// =============================================================================

/**
 * @brief Session lifecycle error categories
 */
enum class SessionErrorKind {
    NotReady,       ///< Command attempted while state != Ready
    AlreadyStarted, ///< start() while state != Uninitialized
    StartupTimeout, ///< Prompt not seen within the startup timeout
    ProcessExited,  ///< Engine process went away
    SpawnFailed     ///< Could not create the process / pseudo-terminal
};

/**
 * @brief Process-session errors (lifecycle, transport)
 */
class SessionError : public Error {
  public:
    SessionError(SessionErrorKind kind, const std::string &detail)
        : Error(FormatMessage(kind, detail), KindToSeverity(kind), "session"), kind_(kind) {}

    [[nodiscard]] SessionErrorKind kind() const { return kind_; }

    static SessionError NotReady(const std::string &state) {
        return {SessionErrorKind::NotReady, "session state is " + state + ", expected Ready"};
    }

    static SessionError AlreadyStarted(const std::string &state) {
        return {SessionErrorKind::AlreadyStarted, "session state is " + state};
    }

    static SessionError StartupTimeout(double seconds, const std::string &last_output) {
        std::string detail = "prompt not seen within " + std::to_string(seconds) + "s";
        if (!last_output.empty()) {
            detail += "; last output: " + Tail(last_output, 200);
        }
        return {SessionErrorKind::StartupTimeout, detail};
    }

    static SessionError ProcessExited(const std::string &during) {
        return {SessionErrorKind::ProcessExited, "engine process exited during " + during};
    }

    static SessionError SpawnFailed(const std::string &executable, const std::string &reason) {
        return {SessionErrorKind::SpawnFailed, "'" + executable + "': " + reason};
    }

  private:
    static Severity KindToSeverity(SessionErrorKind kind) {
        switch (kind) {
        case SessionErrorKind::NotReady:
        case SessionErrorKind::AlreadyStarted:
            return Severity::ERROR;
        case SessionErrorKind::StartupTimeout:
        case SessionErrorKind::ProcessExited:
        case SessionErrorKind::SpawnFailed:
            return Severity::FATAL;
        }
        return Severity::ERROR;
    }

    static std::string FormatMessage(SessionErrorKind kind, const std::string &detail) {
        std::string prefix;
        switch (kind) {
        case SessionErrorKind::NotReady:
            prefix = "Session not ready";
            break;
        case SessionErrorKind::AlreadyStarted:
            prefix = "Session already started";
            break;
        case SessionErrorKind::StartupTimeout:
            prefix = "Startup timeout";
            break;
        case SessionErrorKind::ProcessExited:
            prefix = "Process exited";
            break;
        case SessionErrorKind::SpawnFailed:
            prefix = "Spawn failed";
            break;
        }
        return detail.empty() ? prefix : prefix + ": " + detail;
    }

    static std::string Tail(const std::string &text, std::size_t n) {
        return text.size() <= n ? text : "..." + text.substr(text.size() - n);
    }

    SessionErrorKind kind_;
};

// =============================================================================
// Simulation Errors
// =============================================================================

enum class SimulationErrorKind {
    InvalidPhase, ///< Operation not allowed in the current simulation phase
    InvalidScope  ///< Signal path / pattern resolved to nothing
};

/**
 * @brief Simulation-controller precondition violations
 *
 * Raised before any command is sent to the engine.
 */
class SimulationError : public Error {
  public:
    SimulationError(SimulationErrorKind kind, const std::string &detail)
        : Error(std::string(kind == SimulationErrorKind::InvalidPhase ? "Invalid phase"
                                                                      : "Invalid scope") +
                    ": " + detail,
                Severity::ERROR, "simulation"),
          kind_(kind) {}

    [[nodiscard]] SimulationErrorKind kind() const { return kind_; }

    static SimulationError InvalidPhase(const std::string &operation, const std::string &phase) {
        return {SimulationErrorKind::InvalidPhase,
                "'" + operation + "' not allowed while simulation is " + phase};
    }

    static SimulationError InvalidScope(const std::string &path) {
        return {SimulationErrorKind::InvalidScope, "'" + path + "' matched no simulation objects"};
    }

  private:
    SimulationErrorKind kind_;
};

// =============================================================================
// Report Artifact Errors
// =============================================================================

enum class ReportErrorKind {
    FileNotFound,    ///< Artifact path / report id does not exist
    RangeOutOfBounds ///< Requested offset beyond the artifact length
};

/**
 * @brief Paged-read errors on report artifacts (purely local)
 */
class ReportError : public Error {
  public:
    ReportError(ReportErrorKind kind, const std::string &detail)
        : Error(std::string(kind == ReportErrorKind::FileNotFound ? "Report file not found"
                                                                  : "Range out of bounds") +
                    ": " + detail,
                Severity::ERROR, "report"),
          kind_(kind) {}

    [[nodiscard]] ReportErrorKind kind() const { return kind_; }

    static ReportError FileNotFound(const std::string &path) {
        return {ReportErrorKind::FileNotFound, "'" + path + "'"};
    }

    static ReportError RangeOutOfBounds(std::size_t offset, std::size_t length) {
        return {ReportErrorKind::RangeOutOfBounds,
                "offset " + std::to_string(offset) + " beyond length " + std::to_string(length)};
    }

  private:
    ReportErrorKind kind_;
};

// =============================================================================
// Configuration Errors
// =============================================================================

/**
 * @brief Configuration/parsing errors with optional file context
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config") {}

    ConfigError(const std::string &section, const std::string &key)
        : Error("Config: " + section + " has invalid value for '" + key + "'", Severity::ERROR,
                "config") {}

    ConfigError(const std::string &message, const std::string &file, int line,
                const std::string &hint = "")
        : Error(FormatMessage(message, file, line, hint), Severity::ERROR, "config"), file_(file),
          line_(line), hint_(hint) {}

    [[nodiscard]] const std::string &file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

  private:
    static std::string FormatMessage(const std::string &msg, const std::string &file, int line,
                                     const std::string &hint) {
        std::string result = "Config: " + msg;
        if (!file.empty()) {
            result += "\n  at: " + file;
            if (line >= 0) {
                result += ":" + std::to_string(line);
            }
        }
        if (!hint.empty()) {
            result += "\n  hint: " + hint;
        }
        return result;
    }

    std::string file_;
    int line_ = -1;
    std::string hint_;
};

// =============================================================================
// I/O Errors
// =============================================================================

/**
 * @brief File and channel I/O errors
 */
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, const std::string &path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace tether

// =============================================================================
// Error Throwing Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error (simple version, no logging)
 */
#define TETHER_THROW(error) throw(error)

// NOLINTEND(cppcoreguidelines-macro-usage)
