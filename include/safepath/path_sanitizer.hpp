#pragma once

/**
 * @file path_sanitizer.hpp
 * @brief Sanitization of whole paths
 *
 * Paths are split on both '/' and '\' whatever the host, each node is
 * sanitized for its position, and the result is joined with '/':
 *
 *   "abc\\./22"        -> "abc/22"
 *   "C:\\abc\\22"      -> "/C:/abc/22"
 *   "NUL\\abc"         -> "_NUL_/abc"
 *   "\\\\?\\C:\\x"     -> UNSUPPORTED_PATH
 *
 * @example
 * ```cpp
 * safepath::SanitizationPolicy policy;
 * policy.warn = safepath::log_warning_sink();
 * auto r = safepath::sanitize_path(user_input, safepath::Hint::AssertedTrue, policy);
 * if (r.isErr()) return r.error();
 * open(r.value().path);
 * ```
 */

#include "safepath/result.hpp"
#include "safepath/types.hpp"

#include <string>
#include <vector>

namespace safepath {

/**
 * @brief Sanitize a full path
 * @param path Path using '/' or '\' separators (or both)
 * @param is_file Hint for the last node only; all others are directories
 * @param policy FAT compatibility, truncation and the warning callback
 * @return The sanitized nodes and path, or UNSUPPORTED_PATH, CONTRADICTION,
 *         LENGTH_EXCEEDED
 */
Result<SanitizedPath> sanitize_path(const std::string& path,
                                    Hint is_file = Hint::Unknown,
                                    const SanitizationPolicy& policy = {});

/**
 * @brief Sanitize an already split path
 *
 * Same rules as sanitize_path. An empty first node is the absolute root;
 * empty, blank and "." nodes elsewhere are dropped.
 */
Result<SanitizedPath> sanitize_nodes(const std::vector<std::string>& nodes,
                                     Hint is_file = Hint::Unknown,
                                     const SanitizationPolicy& policy = {});

/// Split on every '/' and '\', keeping empty nodes
std::vector<std::string> split_path(const std::string& path);

/// Join sanitized nodes with '/'; a drive root is written as "/X:"
std::string join_nodes(const std::vector<std::string>& nodes);

} // namespace safepath
