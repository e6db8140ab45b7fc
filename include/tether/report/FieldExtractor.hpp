#pragma once

/**
 * @file FieldExtractor.hpp
 * @brief One labeled field of a text report, matched independently
 *
 * A report shape is an ordered table of extractors. Adding a field means
 * adding a row, not touching the parse loop.
 */

#include <cmath>
#include <cstdlib>
#include <functional>
#include <limits>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace tether {

template <typename Report> struct FieldExtractor {
    std::string name;
    std::regex pattern;
    bool required = false;

    /// Store the match in the report; group 1 is the captured value
    std::function<void(Report &, const std::smatch &)> apply;
};

/**
 * @brief Run every extractor against `text` (first match wins per field)
 * @return Names of the extractors that did not match
 */
template <typename Report>
std::vector<std::string> ApplyExtractors(const std::vector<FieldExtractor<Report>> &table,
                                         const std::string &text, Report &out) {
    std::vector<std::string> unmatched;
    for (const auto &extractor : table) {
        std::smatch match;
        if (std::regex_search(text, match, extractor.pattern)) {
            extractor.apply(out, match);
        } else {
            unmatched.push_back(extractor.name);
        }
    }
    return unmatched;
}

namespace parse {

/// Numeric literal as printed by the engine ("-0.250", "1.95", "<0.01" -> 0.01)
[[nodiscard]] inline std::optional<double> Number(const std::string &text) {
    std::string s;
    for (char c : text) {
        if (c != '<' && c != '>' && c != ',' && c != ' ' && c != '\t' && c != '*') {
            s.push_back(c);
        }
    }
    if (s.empty()) {
        return std::nullopt;
    }
    char *end = nullptr;
    const double value = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

/// Number() that also fits in an int; out-of-range counts as unparsed
[[nodiscard]] inline std::optional<int> Integer(const std::string &text) {
    auto value = Number(text);
    if (!value || *value < static_cast<double>(std::numeric_limits<int>::min()) ||
        *value > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

[[nodiscard]] inline std::string Trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] inline std::vector<std::string> Lines(const std::string &text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

} // namespace parse

} // namespace tether
