#include "safepath/policy.hpp"

#include "safepath/char_filter.hpp"
#include "safepath/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace safepath {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Missing keys keep the default silently; wrong types are reported
void read_bool(const nlohmann::json& j, const std::string& key, bool& out,
               std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    if (j[key].is_boolean()) {
        out = j[key].get<bool>();
    } else {
        warnings.push_back("invalid_configuration:invalid_" + key);
    }
}

} // namespace

PolicyConfig get_builtin_policy_config() {
    PolicyConfig config;
    config.schema = kPolicySchema;
    config.warnings[warning_to_string(Warning::path_sanitized)] = WarningAction::Warn;
    return config;
}

PolicyConfigParseResult parse_policy_config(const std::string& json_str,
                                            const std::string& source_path) {
    PolicyConfigParseResult result;
    result.config = get_builtin_policy_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim_whitespace(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kPolicySchema) {
            result.error = std::string("$schema mismatch: expected ") + kPolicySchema;
            return result;
        }

        read_bool(j, "fat_compatible", result.config.fat_compatible, result.warnings);
        read_bool(j, "trim_to_limit", result.config.trim_to_limit, result.warnings);

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                std::string key_str = to_lower(key);
                if (!parse_warning_key(key_str)) {
                    result.warnings.push_back("invalid_configuration:unknown_warning_key:" + key_str);
                    continue;
                }
                std::optional<WarningAction> action;
                if (val.is_string()) {
                    action = parse_warning_action(val.get<std::string>());
                }
                if (action) {
                    result.config.warnings[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                }
            }
        } else if (j.contains("warnings")) {
            result.warnings.push_back("invalid_configuration:invalid_warnings");
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

Result<PolicyConfig> load_policy_config(const std::string& path,
                                        std::vector<std::string>* warnings) {
    auto content = read_file(path);
    if (!content) {
        return Result<PolicyConfig>::err(
            Error(ErrorCode::IO_ERROR, "cannot read policy file '" + path + "'"));
    }

    auto parsed = parse_policy_config(*content, path);
    if (!parsed.ok) {
        return Result<PolicyConfig>::err(
            Error(ErrorCode::POLICY_INVALID, parsed.error).withContext(path));
    }

    if (warnings) {
        warnings->insert(warnings->end(), parsed.warnings.begin(), parsed.warnings.end());
    }
    return Result<PolicyConfig>::ok(std::move(parsed.config));
}

std::optional<bool> parse_bool_flag(const std::string& s) {
    std::string lower = to_lower(trim_whitespace(s));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

std::vector<std::string> apply_env_overrides(PolicyConfig& config,
                                             const std::unordered_map<std::string, std::string>& env) {
    std::vector<std::string> problems;

    auto apply_bool = [&](const char* name, bool& out) {
        auto it = env.find(name);
        if (it == env.end()) return;
        if (auto value = parse_bool_flag(it->second)) {
            out = *value;
        } else {
            problems.push_back(std::string("invalid_configuration:") + name);
        }
    };

    apply_bool(kEnvFat, config.fat_compatible);
    apply_bool(kEnvTrim, config.trim_to_limit);

    auto warn_it = env.find(kEnvWarn);
    if (warn_it != env.end()) {
        std::optional<WarningAction> action = parse_warning_action(trim_whitespace(warn_it->second));
        if (!action) {
            if (auto enabled = parse_bool_flag(warn_it->second)) {
                action = *enabled ? WarningAction::Warn : WarningAction::Ignore;
            }
        }
        if (action) {
            config.warnings[warning_to_string(Warning::path_sanitized)] = *action;
        } else {
            problems.push_back(std::string("invalid_configuration:") + kEnvWarn);
        }
    }

    return problems;
}

std::unordered_map<std::string, std::string> policy_env_from_process() {
    std::unordered_map<std::string, std::string> env;
    for (const char* name : {kEnvFat, kEnvTrim, kEnvWarn, kEnvPolicy}) {
        if (auto value = get_env(name)) {
            env[name] = *value;
        }
    }
    return env;
}

Result<ResolvedPolicy> resolve_policy_config(const std::string& policy_file,
                                             const std::unordered_map<std::string, std::string>& env,
                                             const PolicyFlags& flags) {
    ResolvedPolicy resolved;

    std::string path = policy_file;
    if (path.empty()) {
        auto it = env.find(kEnvPolicy);
        if (it != env.end()) {
            path = trim_whitespace(it->second);
        }
    }

    if (path.empty()) {
        resolved.config = get_builtin_policy_config();
    } else {
        auto loaded = load_policy_config(path, &resolved.problems);
        if (loaded.isErr()) {
            return Result<ResolvedPolicy>::err(loaded.error());
        }
        resolved.config = std::move(loaded.value());
    }

    auto env_problems = apply_env_overrides(resolved.config, env);
    resolved.problems.insert(resolved.problems.end(), env_problems.begin(), env_problems.end());

    if (flags.fat_compatible) resolved.config.fat_compatible = true;
    if (flags.trim_to_limit) resolved.config.trim_to_limit = true;

    return Result<ResolvedPolicy>::ok(std::move(resolved));
}

SanitizationPolicy make_sanitization_policy(const PolicyConfig& config, WarnCallback warn) {
    SanitizationPolicy policy;
    policy.fat_compatible = config.fat_compatible;
    policy.trim_to_limit = config.trim_to_limit;
    policy.warn = std::move(warn);
    return policy;
}

} // namespace safepath
