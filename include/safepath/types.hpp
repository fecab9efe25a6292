#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace safepath {

// Longest node (in code points) accepted on every supported filesystem.
constexpr std::size_t kMaxNodeLength = 254;

// ============================================================================
// Role Hints
// ============================================================================

// Caller knowledge about a node. Unknown lets the sanitizer decide.
enum class Hint {
    Unknown,
    AssertedTrue,
    AssertedFalse,
};

inline const char* hint_to_string(Hint h) {
    switch (h) {
        case Hint::Unknown: return "unknown";
        case Hint::AssertedTrue: return "true";
        case Hint::AssertedFalse: return "false";
    }
    return "unknown";
}

// Accepts true/false/unknown and the yes/no spellings (case-insensitive)
std::optional<Hint> parse_hint(const std::string& s);

inline Hint hint_from_bool(bool b) {
    return b ? Hint::AssertedTrue : Hint::AssertedFalse;
}

// ============================================================================
// Node Role
// ============================================================================

enum class NodeRole {
    Root,          // "/" or "\", or a leading "." / ".." relative marker
    DriveLetter,   // "C:\"
    Intermediate,  // any directory before the last node
    Terminal,      // the last node, file or directory
};

inline const char* node_role_to_string(NodeRole r) {
    switch (r) {
        case NodeRole::Root: return "root";
        case NodeRole::DriveLetter: return "drive";
        case NodeRole::Intermediate: return "intermediate";
        case NodeRole::Terminal: return "terminal";
    }
    return "terminal";
}

// ============================================================================
// Sanitization Policy
// ============================================================================

using WarnCallback = std::function<void(const std::string&)>;

struct SanitizationPolicy {
    bool fat_compatible = false;  // also reject FAT-only device names
    bool trim_to_limit = false;   // truncate long nodes instead of failing
    WarnCallback warn;            // called once when a path was changed
};

// ============================================================================
// Sanitized Path
// ============================================================================

struct SanitizedPath {
    std::vector<std::string> nodes;  // sanitized nodes, first may be "/", "C:\", "." or ".."
    std::vector<NodeRole> roles;     // parallel to nodes
    std::string path;                // nodes joined with '/'
};

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    path_sanitized,
    invalid_configuration,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::path_sanitized: return "path_sanitized";
        case Warning::invalid_configuration: return "invalid_configuration";
    }
    return "unknown";
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
    }
    return "warn";
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

} // namespace safepath
