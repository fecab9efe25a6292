#include "safepath/node_sanitizer.hpp"

#include "safepath/char_filter.hpp"
#include "safepath/drive_root.hpp"
#include "safepath/length_limit.hpp"
#include "safepath/reserved_names.hpp"
#include "safepath/trailing_trim.hpp"

namespace safepath {

namespace {

struct ResolvedHints {
    Hint is_file;
    Hint is_root_or_drive;
};

// A file is never a root, and a root is never a file
Result<ResolvedHints> resolve_hints(const std::string& text, Hint is_file, Hint is_root_or_drive) {
    switch (is_file) {
        case Hint::AssertedTrue:
            switch (is_root_or_drive) {
                case Hint::AssertedTrue:
                    return Result<ResolvedHints>::err(Error(
                        ErrorCode::CONTRADICTION,
                        "is_file and is_root_or_drive are both true for node '" + text + "'"));
                case Hint::Unknown:
                    return Result<ResolvedHints>::ok({is_file, Hint::AssertedFalse});
                case Hint::AssertedFalse:
                    return Result<ResolvedHints>::ok({is_file, is_root_or_drive});
            }
            break;
        case Hint::Unknown:
            if (is_root_or_drive == Hint::AssertedTrue) {
                return Result<ResolvedHints>::ok({Hint::AssertedFalse, is_root_or_drive});
            }
            return Result<ResolvedHints>::ok({is_file, is_root_or_drive});
        case Hint::AssertedFalse:
            return Result<ResolvedHints>::ok({is_file, is_root_or_drive});
    }
    return Result<ResolvedHints>::ok({is_file, is_root_or_drive});
}

bool may_keep_dot_literal(Hint is_file) {
    switch (is_file) {
        case Hint::AssertedTrue:
            return false;
        case Hint::Unknown:
        case Hint::AssertedFalse:
            return true;
    }
    return true;
}

std::string wrap(const std::string& s) {
    return std::string(1, kReplacementChar) + s + kReplacementChar;
}

// Trailing trim can expose a reserved stem ("nul.txt." -> "nul.txt"),
// so a trimmed node is guarded again.
std::string settle(const std::string& node, bool fat_compatible) {
    std::string trimmed = trim_trailing(node);
    if (trimmed != node) {
        trimmed = guard_reserved_name(trimmed, fat_compatible);
    }
    return trimmed;
}

} // namespace

Result<SanitizedNode> sanitize_node_detailed(const std::string& text,
                                             Hint is_file,
                                             Hint is_root_or_drive,
                                             const SanitizationPolicy& policy) {
    auto hints = resolve_hints(text, is_file, is_root_or_drive);
    if (hints.isErr()) {
        return Result<SanitizedNode>::err(hints.error());
    }
    const ResolvedHints resolved = hints.value();

    std::string node = trim_whitespace(text);

    switch (resolved.is_root_or_drive) {
        case Hint::AssertedFalse:
            break;
        case Hint::Unknown:
        case Hint::AssertedTrue:
            if (auto root = detect_drive_root(node)) {
                return Result<SanitizedNode>::ok({root->text, root->role});
            }
            if (resolved.is_root_or_drive == Hint::AssertedTrue) {
                return Result<SanitizedNode>::err(Error(
                    ErrorCode::CONTRADICTION,
                    "Node '" + node + "' is not the root or a drive letter"));
            }
            break;
    }

    if (is_dots_only(node)) {
        node = wrap(node);
    }

    node = filter_characters(node);
    node = guard_reserved_name(node, policy.fat_compatible);

    if (trim_whitespace(node).empty()) {
        node = wrap(node);
    }

    if (may_keep_dot_literal(resolved.is_file) && is_dot_literal(node)) {
        return Result<SanitizedNode>::ok({node, std::nullopt});
    }

    node = settle(node, policy.fat_compatible);

    // A second round only follows a reserved-name wrap, which leaves a
    // leading '_' that no later guard can match.
    for (;;) {
        auto limited = enforce_length(node, text, policy.trim_to_limit);
        if (limited.isErr()) {
            return Result<SanitizedNode>::err(limited.error());
        }
        if (limited.value() == node) {
            break;
        }
        node = settle(limited.value(), policy.fat_compatible);
    }

    return Result<SanitizedNode>::ok({node, std::nullopt});
}

Result<std::string> sanitize_node(const std::string& text,
                                  Hint is_file,
                                  Hint is_root_or_drive,
                                  const SanitizationPolicy& policy) {
    return sanitize_node_detailed(text, is_file, is_root_or_drive, policy)
        .map([](const SanitizedNode& n) { return n.text; });
}

} // namespace safepath
