#pragma once

/**
 * @file Tcl.hpp
 * @brief Minimal Tcl list handling for engine commands and results
 */

#include <string>
#include <vector>

namespace tether::tcl {

/**
 * @brief Brace-quote a word so the interpreter takes it literally
 *
 * Hierarchical names such as `top/u_fifo/data[3]` contain brackets that Tcl
 * would otherwise evaluate.
 */
[[nodiscard]] inline std::string Brace(const std::string &word) { return "{" + word + "}"; }

/**
 * @brief Split a Tcl list (as returned by get_cells, get_ports, ...) into words
 *
 * Whitespace separates words; `{...}` groups (nesting allowed) form one word
 * with the outer braces removed; `"..."` groups likewise.
 */
[[nodiscard]] inline std::vector<std::string> SplitList(const std::string &text) {
    std::vector<std::string> words;
    std::size_t i = 0;
    const std::size_t n = text.size();
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };

    while (i < n) {
        while (i < n && is_space(text[i])) {
            ++i;
        }
        if (i >= n) {
            break;
        }
        std::string word;
        if (text[i] == '{') {
            int depth = 1;
            ++i;
            while (i < n && depth > 0) {
                if (text[i] == '{') {
                    ++depth;
                } else if (text[i] == '}') {
                    if (--depth == 0) {
                        break;
                    }
                }
                word.push_back(text[i++]);
            }
            ++i; // closing brace
        } else if (text[i] == '"') {
            ++i;
            while (i < n && text[i] != '"') {
                word.push_back(text[i++]);
            }
            ++i;
        } else {
            while (i < n && !is_space(text[i])) {
                word.push_back(text[i++]);
            }
        }
        words.push_back(std::move(word));
    }
    return words;
}

} // namespace tether::tcl
