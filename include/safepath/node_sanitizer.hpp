#pragma once

/**
 * @file node_sanitizer.hpp
 * @brief Sanitization of a single path node
 *
 * A node is one component between separators. The result is legal on POSIX,
 * NTFS and (with fat_compatible) FAT, whichever platform runs the code:
 *
 *   "plums;and/or|apples" -> "plums;and_or_apples"
 *   "nul.txt"             -> "_nul_.txt"
 *   "abc. "               -> "abc"
 *   "c:"                  -> "C:\"   (first node, may be a drive)
 *
 * The pipeline runs in a fixed order: drive/root detection, dots-only guard,
 * character filter, reserved-name guard, trailing trim, length limit.
 */

#include "safepath/result.hpp"
#include "safepath/types.hpp"

#include <optional>
#include <string>

namespace safepath {

struct SanitizedNode {
    std::string text;
    std::optional<NodeRole> root_role;  // set when taken as "/", "\" or a drive
};

/**
 * @brief Sanitize one node
 * @param text The node, possibly hostile
 * @param is_file AssertedFalse for directories, AssertedTrue for files
 * @param is_root_or_drive AssertedTrue if known to be "/" or a drive such as "C:\"
 * @param policy fat_compatible and trim_to_limit are used; warn is not called
 * @return The sanitized node, or CONTRADICTION / LENGTH_EXCEEDED
 */
Result<std::string> sanitize_node(const std::string& text,
                                  Hint is_file = Hint::Unknown,
                                  Hint is_root_or_drive = Hint::Unknown,
                                  const SanitizationPolicy& policy = {});

/// Same as sanitize_node, also reporting whether the node became a root or drive
Result<SanitizedNode> sanitize_node_detailed(const std::string& text,
                                             Hint is_file,
                                             Hint is_root_or_drive,
                                             const SanitizationPolicy& policy);

} // namespace safepath
