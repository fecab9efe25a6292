#pragma once

#include "safepath/result.hpp"
#include "safepath/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace safepath {

// ============================================================================
// Policy Configuration
// ============================================================================

constexpr const char* kPolicySchema = "safepath.policy.v1";

// Environment variables read by apply_env_overrides
constexpr const char* kEnvFat = "SAFEPATH_FAT";
constexpr const char* kEnvTrim = "SAFEPATH_TRIM";
constexpr const char* kEnvWarn = "SAFEPATH_WARN";
constexpr const char* kEnvPolicy = "SAFEPATH_POLICY";

struct PolicyConfig {
    std::string schema;  // MUST be "safepath.policy.v1"

    bool fat_compatible = false;
    bool trim_to_limit = false;

    // [warnings] section - maps warning key to action
    std::unordered_map<std::string, WarningAction> warnings;

    // Source path for diagnostics, empty for the built-in policy
    std::string source_path;
};

// fat and trim off, path_sanitized = warn
PolicyConfig get_builtin_policy_config();

// ============================================================================
// Policy Parsing
// ============================================================================

struct PolicyConfigParseResult {
    bool ok = false;
    std::string error;
    PolicyConfig config;
    std::vector<std::string> warnings;  // "invalid_configuration:<detail>"
};

// Parse a policy from JSON. Bad field values are reported in warnings and
// keep their defaults; bad JSON or a wrong $schema fail the parse.
PolicyConfigParseResult parse_policy_config(const std::string& json_str,
                                            const std::string& source_path = "");

// Read and parse a policy file (IO_ERROR or POLICY_INVALID on failure).
// Field-level problems are appended to warnings when it is non-null.
Result<PolicyConfig> load_policy_config(const std::string& path,
                                        std::vector<std::string>* warnings = nullptr);

// ============================================================================
// Environment Overrides
// ============================================================================

// Parse 1/true/yes/on and 0/false/no/off (case-insensitive)
std::optional<bool> parse_bool_flag(const std::string& s);

// Apply SAFEPATH_FAT, SAFEPATH_TRIM and SAFEPATH_WARN from env.
// SAFEPATH_WARN takes warn/ignore/error, or 1/0 for warn/ignore, and sets the
// path_sanitized action. Unparseable values are skipped and returned as
// "invalid_configuration:<variable>" entries.
std::vector<std::string> apply_env_overrides(PolicyConfig& config,
                                             const std::unordered_map<std::string, std::string>& env);

// Values of the SAFEPATH_* variables present in the process environment
std::unordered_map<std::string, std::string> policy_env_from_process();

// ============================================================================
// Policy Resolution
// ============================================================================

// Command-line switches; they can only turn options on
struct PolicyFlags {
    bool fat_compatible = false;
    bool trim_to_limit = false;
};

struct ResolvedPolicy {
    PolicyConfig config;
    std::vector<std::string> problems;  // "invalid_configuration:<detail>"
};

/**
 * @brief Build the effective policy from every source
 *
 * Precedence: flags > SAFEPATH_FAT/TRIM/WARN > policy file > built-in.
 * The file is policy_file, else SAFEPATH_POLICY from env, else none.
 *
 * @return The policy and its configuration problems, or IO_ERROR /
 *         POLICY_INVALID from the file
 */
Result<ResolvedPolicy> resolve_policy_config(const std::string& policy_file,
                                             const std::unordered_map<std::string, std::string>& env,
                                             const PolicyFlags& flags);

// ============================================================================
// Engine Policy
// ============================================================================

// The policy holds warn; when it comes from WarningCollector::sink the
// policy must stay within the collector's lifetime.
SanitizationPolicy make_sanitization_policy(const PolicyConfig& config, WarnCallback warn = {});

} // namespace safepath
