#pragma once

#include "safepath/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace safepath {

// ============================================================================
// Warning Collector
// ============================================================================

class WarningCollector {
public:
    // Default constructor with no policy: every warning is "warn"
    WarningCollector() = default;

    // Constructor with policy map (warning key -> action)
    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    // Callbacks from sink() point at this object, so it never moves
    WarningCollector(const WarningCollector&) = delete;
    WarningCollector& operator=(const WarningCollector&) = delete;

    // Replace the policy map
    void set_policy(const std::unordered_map<std::string, WarningAction>& policy);

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with no fields
    void emit(Warning warning);

    // Emit a warning by key string (for dynamic warning keys)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Callback for SanitizationPolicy::warn; the message is stored in field "message".
    // The callback refers to this collector: it, and every SanitizationPolicy
    // holding it, must not outlive the collector.
    WarnCallback sink(Warning warning);

    // Override the policy for one key (takes precedence over the policy map)
    void apply_override(const std::string& warning_key, WarningAction action);

    // Action that applies to a key after overrides and policy
    WarningAction effective_action(const std::string& key) const;

    // Get all emitted warnings after policy application
    // Warnings with action "ignore" are excluded
    std::vector<WarningObject> get_warnings() const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    // Check if any effective warnings remain (excluding ignored)
    bool has_effective_warnings() const;

    // Clear all collected warnings
    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;
    std::unordered_map<std::string, WarningAction> overrides_;
};

// ============================================================================
// Convenience functions for warning fields
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> path_sanitized(
    const std::string& original,
    const std::string& sanitized) {
    return {{"original", original}, {"sanitized", sanitized}};
}

inline std::unordered_map<std::string, std::string> invalid_configuration(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

} // namespace warnings

} // namespace safepath
