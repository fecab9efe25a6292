#pragma once

#include <string>
#include <utility>

namespace safepath {

// Windows device names (CON, PRN, AUX, NUL, COM1-9, LPT1-9); with fat_compatible
// also $IDLE$, CONFIG$, KEYBD$, SCREEN$, CLOCK$ and LST.
// Comparison is ASCII case-insensitive.
bool is_reserved_name(const std::string& name, bool fat_compatible = false);

// Split a node into stem and extension at the last dot.
// Leading dots belong to the stem: ".profile" has no extension.
//   "nul.txt"  -> {"nul", ".txt"}
//   "a.tar.gz" -> {"a.tar", ".gz"}
//   "nul."     -> {"nul", "."}
std::pair<std::string, std::string> split_extension(const std::string& node);

// Wrap a reserved node so it cannot name a device:
//   "NUL" -> "_NUL_", "nul.txt" -> "_nul_.txt"
// The whole-node match wins over the stem match. Other nodes pass unchanged.
std::string guard_reserved_name(const std::string& node, bool fat_compatible = false);

} // namespace safepath
