#pragma once

/**
 * @file TransactionFramer.hpp
 * @brief Turns the engine's character stream into response boundaries
 *
 * A response is complete when the prompt appears at the *end* of the stream,
 * at the start of a line, followed by nothing but spaces/tabs. Prompt text
 * inside a line, or followed by a newline, is output and not a boundary.
 * Only the last prompt.size() + kLookahead characters are examined per feed.
 */

#include <tether/session/SessionConfig.hpp>

#include <regex>
#include <string>
#include <vector>

namespace tether {

class TransactionFramer {
  public:
    static constexpr std::size_t kLookahead = 64;

    TransactionFramer(std::string prompt, const std::vector<ErrorMarker> &markers);

    /// Start a new frame; `command` is used for echo stripping ("" = none)
    void Begin(const std::string &command);

    /// Append output. @return true once the prompt sits at end of stream
    bool Feed(const std::string &chunk);

    [[nodiscard]] bool Complete() const { return complete_; }

    /// Raw accumulated text with CR removed
    [[nodiscard]] const std::string &Buffer() const { return buffer_; }

    /// Response text: echo line, trailing prompt and edge newlines removed
    [[nodiscard]] std::string Text() const;

    /// Lines matching an error marker (respecting within_lines)
    [[nodiscard]] std::vector<std::string> DetectErrors(const std::string &text) const;

    [[nodiscard]] const std::string &Prompt() const { return prompt_; }

    /// True if `text` ends with the prompt at the start of its last line
    [[nodiscard]] static bool EndsWithPrompt(const std::string &text, const std::string &prompt);

    /// Remove CR characters and ANSI escape sequences
    [[nodiscard]] static std::string Normalize(const std::string &chunk);

  private:
    struct CompiledMarker {
        std::regex regex;
        std::size_t within_lines;
    };

    std::string prompt_;
    std::vector<CompiledMarker> markers_;
    std::string command_;
    std::string buffer_;
    bool complete_ = false;
};

} // namespace tether
