#include "safepath/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace safepath {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Hint> parse_hint(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "true" || lower == "yes") return Hint::AssertedTrue;
    if (lower == "false" || lower == "no") return Hint::AssertedFalse;
    if (lower == "unknown") return Hint::Unknown;
    return std::nullopt;
}

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "path_sanitized") return Warning::path_sanitized;
    if (lower == "invalid_configuration") return Warning::invalid_configuration;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

} // namespace safepath
