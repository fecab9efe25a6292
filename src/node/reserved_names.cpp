#include "safepath/reserved_names.hpp"

#include "safepath/char_filter.hpp"

#include <algorithm>
#include <array>

namespace safepath {

namespace {

const std::array<const char*, 22> kReservedNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

// Reserved only on FAT volumes
const std::array<const char*, 6> kFatReservedNames = {
    "$IDLE$", "CONFIG$", "KEYBD$", "SCREEN$", "CLOCK$", "LST",
};

// ASCII only, so the result never depends on the process locale
std::string to_upper_ascii(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), [](char c) {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    });
    return result;
}

template<std::size_t N>
bool contains(const std::array<const char*, N>& names, const std::string& upper) {
    return std::any_of(names.begin(), names.end(),
                       [&upper](const char* name) { return upper == name; });
}

std::string wrap(const std::string& s) {
    return std::string(1, kReplacementChar) + s + kReplacementChar;
}

} // namespace

bool is_reserved_name(const std::string& name, bool fat_compatible) {
    std::string upper = to_upper_ascii(name);
    if (contains(kReservedNames, upper)) return true;
    return fat_compatible && contains(kFatReservedNames, upper);
}

std::pair<std::string, std::string> split_extension(const std::string& node) {
    auto dot = node.rfind('.');
    if (dot == std::string::npos) {
        return {node, ""};
    }
    auto first_non_dot = node.find_first_not_of('.');
    if (first_non_dot == std::string::npos || first_non_dot > dot) {
        return {node, ""};
    }
    return {node.substr(0, dot), node.substr(dot)};
}

std::string guard_reserved_name(const std::string& node, bool fat_compatible) {
    if (is_reserved_name(node, fat_compatible)) {
        return wrap(node);
    }
    auto [stem, ext] = split_extension(node);
    if (!ext.empty() && is_reserved_name(stem, fat_compatible)) {
        return wrap(stem) + ext;
    }
    return node;
}

} // namespace safepath
