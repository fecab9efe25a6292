#include "safepath/path_sanitizer.hpp"

#include "safepath/char_filter.hpp"
#include "safepath/drive_root.hpp"
#include "safepath/node_sanitizer.hpp"
#include "safepath/trailing_trim.hpp"

namespace safepath {

namespace {

const char* const kLongUncPrefix = "\\\\?";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// "/C:/x" is how a drive root is written out; read it back as the drive
bool is_rooted_drive(const std::vector<std::string>& nodes) {
    return nodes.size() > 1 && trim_whitespace(nodes[0]).empty() &&
           is_drive_letter(trim_whitespace(nodes[1]));
}

Result<SanitizedPath> assemble(std::vector<std::string> nodes,
                               Hint is_file,
                               const SanitizationPolicy& policy) {
    SanitizedPath out;

    // an explicit "/X:" is a drive even when it is the only node
    const bool rooted_drive = is_rooted_drive(nodes);
    if (rooted_drive) {
        nodes.erase(nodes.begin());
    }
    if (nodes.empty()) {
        nodes.emplace_back();
    }

    const std::size_t last = nodes.size() - 1;

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const std::string& raw = nodes[i];
        const std::string stripped = trim_whitespace(raw);

        if (i == 0) {
            // Leading markers: empty is the absolute root, "." and ".." are relative
            if (stripped.empty()) {
                out.nodes.push_back(nodes.size() == 1 ? "." : "/");
                out.roles.push_back(NodeRole::Root);
                continue;
            }
            if (is_dot_literal(stripped)) {
                out.nodes.push_back(stripped);
                out.roles.push_back(NodeRole::Root);
                continue;
            }
        } else if (stripped.empty() || stripped == ".") {
            // "a//b" and "a/./b" are "a/b"
            continue;
        }

        const bool as_drive = rooted_drive && i == 0;
        const Hint node_is_file = (i == last && !as_drive) ? is_file : Hint::AssertedFalse;
        const Hint node_is_root = as_drive ? Hint::AssertedTrue
                                           : (i == 0) ? Hint::Unknown : Hint::AssertedFalse;

        auto node = sanitize_node_detailed(raw, node_is_file, node_is_root, policy);
        if (node.isErr()) {
            return Result<SanitizedPath>::err(node.error());
        }

        out.nodes.push_back(node.value().text);
        out.roles.push_back(node.value().root_role.value_or(NodeRole::Intermediate));
    }

    if (out.roles.back() == NodeRole::Intermediate) {
        out.roles.back() = NodeRole::Terminal;
    }

    out.path = join_nodes(out.nodes);
    return Result<SanitizedPath>::ok(std::move(out));
}

void warn_if_changed(const std::string& original,
                     const SanitizedPath& sanitized,
                     const SanitizationPolicy& policy) {
    if (policy.warn && sanitized.path != original) {
        policy.warn("Sanitized filename " + original + " \xe2\x86\x92 " + sanitized.path);
    }
}

} // namespace

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::string join_nodes(const std::vector<std::string>& nodes) {
    std::string out;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const std::string& node = nodes[i];
        if (i == 0) {
            if (node == "/" || node == "\\") {
                out = "/";
            } else if (is_drive_letter(node)) {
                // joining "C:\" with '/' would give "C:\/x"
                out = "/" + node.substr(0, 2);
            } else if (node == "." && nodes.size() > 1) {
                out.clear();
            } else {
                out = node;
            }
            continue;
        }
        if (!out.empty() && out.back() != '/') {
            out.push_back('/');
        }
        out += node;
    }
    return out.empty() ? "." : out;
}

Result<SanitizedPath> sanitize_path(const std::string& path,
                                    Hint is_file,
                                    const SanitizationPolicy& policy) {
    const std::string trimmed = trim_whitespace(path);
    if (starts_with(trimmed, kLongUncPrefix)) {
        return Result<SanitizedPath>::err(Error(
            ErrorCode::UNSUPPORTED_PATH,
            "Long UNC Windows paths (\\\\? prefix) are not supported (path '" + path + "')"));
    }

    auto result = assemble(split_path(trimmed), is_file, policy);
    if (result.isOk()) {
        warn_if_changed(path, result.value(), policy);
    }
    return result;
}

Result<SanitizedPath> sanitize_nodes(const std::vector<std::string>& nodes,
                                     Hint is_file,
                                     const SanitizationPolicy& policy) {
    auto result = assemble(nodes, is_file, policy);
    if (result.isOk()) {
        std::string original;
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            if (i > 0) original.push_back('/');
            original += nodes[i];
        }
        warn_if_changed(original, result.value(), policy);
    }
    return result;
}

} // namespace safepath
