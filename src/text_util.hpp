#pragma once

/**
 * Small string helpers shared by the command parser, settings loader and
 * input handling.
 */

#include <algorithm>
#include <cctype>
#include <string>

namespace llmchat {

// Strips leading and trailing ASCII whitespace.
inline std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace llmchat
