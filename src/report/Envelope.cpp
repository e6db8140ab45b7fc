/**
 * @file Envelope.cpp
 * @brief Character-count truncation
 */

#include <tether/report/Envelope.hpp>

#include <algorithm>

namespace tether {

std::size_t CountLines(const std::string &text) {
    if (text.empty()) {
        return 0;
    }
    const auto newlines = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    return text.back() == '\n' ? newlines : newlines + 1;
}

Envelope MakeEnvelope(const std::string &content, std::size_t max_chars) {
    Envelope env;
    env.total_length = content.size();
    env.total_lines = CountLines(content);

    if (content.size() <= max_chars) {
        env.content = content;
        env.returned_chars = content.size();
        return env;
    }

    env.content = content.substr(0, max_chars);
    env.truncated = true;
    env.returned_chars = max_chars;
    env.truncation_message = "Output truncated (" + std::to_string(content.size()) +
                             " chars -> " + std::to_string(max_chars) +
                             " chars). Use generate_full_report for complete output.";
    return env;
}

nlohmann::json ToJson(const Envelope &envelope, const std::string &content_key) {
    nlohmann::json j;
    j[content_key] = envelope.content;
    j["truncated"] = envelope.truncated;
    if (envelope.truncated) {
        j["truncation_info"] = {
            {"total_chars", envelope.total_length},
            {"total_lines", envelope.total_lines},
            {"returned_chars", envelope.returned_chars},
            {"returned_lines", CountLines(envelope.content)},
            {"message", envelope.truncation_message},
        };
    }
    if (envelope.artifact_path) {
        j["file_path"] = *envelope.artifact_path;
    }
    return j;
}

} // namespace tether
