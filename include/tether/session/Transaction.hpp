#pragma once

/**
 * @file Transaction.hpp
 * @brief One command/response cycle with the engine
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace tether {

/**
 * @brief How a command's response boundary was resolved
 */
enum class CompletionKind {
    PromptMatched, ///< Prompt seen at end of stream, no error markers
    ErrorDetected, ///< Prompt seen, but an in-band error marker was present
    Timeout,       ///< Caller's budget expired; engine may still be working
    ProcessExited  ///< Engine process went away mid-command
};

[[nodiscard]] inline const char *CompletionKindName(CompletionKind kind) {
    switch (kind) {
    case CompletionKind::PromptMatched:
        return "prompt-matched";
    case CompletionKind::ErrorDetected:
        return "error-detected";
    case CompletionKind::Timeout:
        return "timeout";
    case CompletionKind::ProcessExited:
        return "process-exited";
    }
    return "unknown";
}

struct Transaction {
    uint64_t id = 0;
    std::string command;

    /// Response text: CR removed, echo and trailing prompt stripped
    std::string raw;

    std::chrono::milliseconds elapsed{0};
    CompletionKind completion = CompletionKind::PromptMatched;

    /// False when a resync after an earlier timeout failed and the command
    /// was never written to the engine
    bool command_sent = true;

    /// Output drained from an earlier timed-out command before this one ran
    std::string stale_output;

    /// Lines that matched an error marker, in order
    std::vector<std::string> error_messages;

    [[nodiscard]] bool Ok() const { return completion == CompletionKind::PromptMatched; }
    [[nodiscard]] bool TimedOut() const { return completion == CompletionKind::Timeout; }
    [[nodiscard]] bool HasError() const { return completion == CompletionKind::ErrorDetected; }

    /// Prompt reached (with or without engine errors)
    [[nodiscard]] bool Completed() const {
        return completion == CompletionKind::PromptMatched ||
               completion == CompletionKind::ErrorDetected;
    }
};

} // namespace tether
