#include "safepath/drive_root.hpp"

namespace safepath {

namespace {

bool is_ascii_letter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

char to_upper_ascii(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

} // namespace

bool is_drive_letter(const std::string& node) {
    if (node.size() != 2 && node.size() != 3) return false;
    if (!is_ascii_letter(node[0]) || node[1] != ':') return false;
    return node.size() == 2 || node[2] == '\\';
}

std::optional<DriveRoot> detect_drive_root(const std::string& node) {
    if (node == "/" || node == "\\") {
        return DriveRoot{NodeRole::Root, node};
    }
    if (is_drive_letter(node)) {
        // "C:\" and not "C:": only the former is absolute on Windows
        return DriveRoot{NodeRole::DriveLetter, std::string(1, to_upper_ascii(node[0])) + ":\\"};
    }
    return std::nullopt;
}

} // namespace safepath
