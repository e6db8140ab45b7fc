#pragma once

/**
 * @file Envelope.hpp
 * @brief Size-bounded delivery of engine text
 *
 * Large reports are cut to a fixed character budget. The cut is a plain
 * character count (bytes of the engine's output), not line aware; callers that
 * need an exact section read it from the full artifact instead.
 */

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace tether {

struct Envelope {
    std::string content; ///< Verbatim, or the first max_chars characters
    bool truncated = false;
    std::size_t total_length = 0; ///< Length of the original text
    std::size_t total_lines = 0;
    std::size_t returned_chars = 0;
    std::string truncation_message; ///< Empty unless truncated

    /// Full text on disk, when one was written
    std::optional<std::string> artifact_path;
};

/**
 * @brief Wrap `content` so that at most `max_chars` characters are returned
 *
 * len(content) <= max_chars: content unchanged, truncated = false.
 * Otherwise content.size() == max_chars, truncated = true and
 * total_length == len(original).
 */
[[nodiscard]] Envelope MakeEnvelope(const std::string &content, std::size_t max_chars);

/// Number of lines as an editor would count them (a trailing newline does not open a line)
[[nodiscard]] std::size_t CountLines(const std::string &text);

/**
 * @brief JSON form used at the tool-call boundary
 *
 * `content_key` names the field holding the text ("output", "raw_report", ...).
 */
[[nodiscard]] nlohmann::json ToJson(const Envelope &envelope,
                                    const std::string &content_key = "output");

} // namespace tether
