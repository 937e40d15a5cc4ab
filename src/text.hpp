#pragma once

#include <string>
#include <string_view>

namespace text {

// Strips leading and trailing ASCII whitespace.
inline std::string trim(std::string_view s) {
    auto start_pos = s.find_first_not_of(" \t\n\r");
    if (start_pos == std::string_view::npos) return {};
    auto end_pos = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start_pos, end_pos - start_pos + 1));
}

} // namespace text
