#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace safepath {

// Character used in place of anything that may not appear in a node.
constexpr char kReplacementChar = '_';

// True for < > : " | ? * \ / , C0 controls (0-31) and 127-160 (DEL, C1, NBSP)
bool is_blacklisted(std::uint32_t code_point);

// Replace every blacklisted code point with '_'.
// Input is read as UTF-8; each byte that is not part of a well-formed
// sequence is replaced too, so the result is always valid UTF-8.
std::string filter_characters(const std::string& node);

// Number of code points in a valid UTF-8 string
std::size_t code_point_length(const std::string& utf8);

// First max_code_points code points of a valid UTF-8 string
std::string truncate_code_points(const std::string& utf8, std::size_t max_code_points);

// Whitespace stripped by trim_whitespace, independent of the locale
constexpr const char* kAsciiWhitespace = " \t\n\v\f\r";

// Strip ASCII whitespace (space, \t, \n, \v, \f, \r) from both ends
std::string trim_whitespace(const std::string& s);

} // namespace safepath
