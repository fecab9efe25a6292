#pragma once

#include "safepath/types.hpp"

#include <optional>
#include <string>

namespace safepath {

struct DriveRoot {
    NodeRole role;     // Root or DriveLetter
    std::string text;  // "/", "\" or "X:\"
};

// True for "X:" and "X:\" with any ASCII letter X
bool is_drive_letter(const std::string& node);

// Recognize a POSIX root ("/", "\") or a drive letter, which is canonicalized
// to upper case with a trailing backslash: "c:" -> "C:\".
// The node must already be stripped of surrounding whitespace.
std::optional<DriveRoot> detect_drive_root(const std::string& node);

} // namespace safepath
