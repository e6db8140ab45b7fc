/**
 * @file TransactionFramer.cpp
 * @brief Prompt framing, echo stripping and error-marker detection
 */

#include <tether/session/TransactionFramer.hpp>

#include <tether/core/Error.hpp>

#include <sstream>

namespace tether {

namespace {

std::string TrimCopy(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\n");
    return s.substr(first, last - first + 1);
}

bool IsBlank(char c) { return c == ' ' || c == '\t'; }

} // namespace

TransactionFramer::TransactionFramer(std::string prompt, const std::vector<ErrorMarker> &markers)
    : prompt_(std::move(prompt)) {
    markers_.reserve(markers.size());
    for (const auto &marker : markers) {
        try {
            markers_.push_back(
                {std::regex(marker.pattern, std::regex::ECMAScript | std::regex::icase),
                 marker.within_lines});
        } catch (const std::regex_error &e) {
            throw ConfigError("invalid error marker '" + marker.pattern + "': " + e.what());
        }
    }
}

void TransactionFramer::Begin(const std::string &command) {
    command_ = TrimCopy(command);
    buffer_.clear();
    complete_ = false;
}

bool TransactionFramer::Feed(const std::string &chunk) {
    buffer_ += Normalize(chunk);
    const std::size_t window = prompt_.size() + kLookahead;
    if (buffer_.size() <= window) {
        complete_ = EndsWithPrompt(buffer_, prompt_);
    } else {
        // Keep one extra char so the line-start check can see the newline
        complete_ = EndsWithPrompt(buffer_.substr(buffer_.size() - window - 1), prompt_);
    }
    return complete_;
}

bool TransactionFramer::EndsWithPrompt(const std::string &text, const std::string &prompt) {
    std::size_t end = text.size();
    while (end > 0 && IsBlank(text[end - 1])) {
        --end;
    }
    if (prompt.empty() || end < prompt.size()) {
        return false;
    }
    const std::size_t start = end - prompt.size();
    if (text.compare(start, prompt.size(), prompt) != 0) {
        return false;
    }
    return start == 0 || text[start - 1] == '\n';
}

std::string TransactionFramer::Normalize(const std::string &chunk) {
    std::string out;
    out.reserve(chunk.size());
    for (std::size_t i = 0; i < chunk.size(); ++i) {
        const char c = chunk[i];
        if (c == '\r') {
            continue;
        }
        if (c == '\x1b' && i + 1 < chunk.size() && chunk[i + 1] == '[') {
            // CSI sequence: ESC [ params final-byte
            i += 2;
            while (i < chunk.size() && !(chunk[i] >= '@' && chunk[i] <= '~')) {
                ++i;
            }
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string TransactionFramer::Text() const {
    std::string text = buffer_;

    if (complete_) {
        std::size_t end = text.size();
        while (end > 0 && IsBlank(text[end - 1])) {
            --end;
        }
        text.erase(end - prompt_.size());
    }

    if (!command_.empty()) {
        const auto newline = text.find('\n');
        const auto first_line = TrimCopy(text.substr(0, newline));
        if (first_line == command_) {
            text.erase(0, newline == std::string::npos ? text.size() : newline + 1);
        }
    }

    while (!text.empty() && (text.back() == '\n' || IsBlank(text.back()))) {
        text.pop_back();
    }
    while (!text.empty() && text.front() == '\n') {
        text.erase(0, 1);
    }
    return text;
}

std::vector<std::string> TransactionFramer::DetectErrors(const std::string &text) const {
    std::vector<std::string> found;
    std::istringstream stream(text);
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(stream, line)) {
        const auto trimmed = TrimCopy(line);
        if (trimmed.empty()) {
            continue;
        }
        ++line_no;
        for (const auto &marker : markers_) {
            if (marker.within_lines != 0 && line_no > marker.within_lines) {
                continue;
            }
            if (std::regex_search(trimmed, marker.regex)) {
                found.push_back(trimmed);
                break;
            }
        }
    }
    return found;
}

} // namespace tether
