#include "safepath/warnings.hpp"

#include <algorithm>
#include <cctype>

namespace safepath {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

void WarningCollector::set_policy(const std::unordered_map<std::string, WarningAction>& policy) {
    policy_ = policy;
}

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    WarningAction action = effective_action(warning_key);

    // Ignored warnings are still collected but marked
    warnings_.push_back({to_lower(warning_key), std::move(fields), action});
}

WarnCallback WarningCollector::sink(Warning warning) {
    return [this, warning](const std::string& message) {
        emit(warning, {{"message", message}});
    };
}

void WarningCollector::apply_override(const std::string& warning_key, WarningAction action) {
    overrides_[to_lower(warning_key)] = action;
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

bool WarningCollector::has_errors() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action == WarningAction::Error;
    });
}

bool WarningCollector::has_effective_warnings() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action != WarningAction::Ignore;
    });
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::effective_action(const std::string& key) const {
    std::string lower_key = to_lower(key);

    // Overrides first (highest precedence)
    auto override_it = overrides_.find(lower_key);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }

    auto policy_it = policy_.find(lower_key);
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    // Default: warn
    return WarningAction::Warn;
}

} // namespace safepath
