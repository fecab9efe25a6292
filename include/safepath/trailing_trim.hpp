#pragma once

#include <string>

namespace safepath {

// "." and ".." name directories and are the only nodes allowed a trailing dot
bool is_dot_literal(const std::string& node);

// True when the node, ignoring spaces, is nothing but dots ("...", ". .").
// "." and ".." are excluded.
bool is_dots_only(const std::string& node);

// Remove trailing '.' and ' ' (NTFS drops them silently).
// A node that would become empty is wrapped instead: "." -> "_._"
std::string trim_trailing(const std::string& node);

} // namespace safepath
