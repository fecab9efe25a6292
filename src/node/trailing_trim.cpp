#include "safepath/trailing_trim.hpp"

#include "safepath/char_filter.hpp"

namespace safepath {

bool is_dot_literal(const std::string& node) {
    return node == "." || node == "..";
}

bool is_dots_only(const std::string& node) {
    if (is_dot_literal(node)) return false;
    bool saw_dot = false;
    for (char c : node) {
        if (c == '.') {
            saw_dot = true;
        } else if (c != ' ') {
            return false;
        }
    }
    return saw_dot;
}

std::string trim_trailing(const std::string& node) {
    auto end = node.find_last_not_of(". ");
    if (end == std::string::npos) {
        return std::string(1, kReplacementChar) + node + kReplacementChar;
    }
    return node.substr(0, end + 1);
}

} // namespace safepath
