/**
 * safepath CLI - node command
 *
 * Sanitize one path node.
 */

#include "../common.hpp"
#include <safepath/node_sanitizer.hpp>
#include <CLI/CLI.hpp>

namespace safepath::cli::commands {

namespace {

struct NodeOptions {
    std::string text;
    bool file = false;
    bool dir = false;
    std::string root = "unknown";
};

int cmd_node(const GlobalOptions& opts, const NodeOptions& node_opts) {
    init_logging(opts);

    auto effective = resolve_policy(opts);
    if (effective.isErr()) {
        print_error(effective.error().toString(), opts.json);
        return 1;
    }

    WarningCollector collector(effective.value().config.warnings);
    report_policy_problems(collector, effective.value());

    // sanitize_node never calls warn; the change is reported here instead
    SanitizationPolicy policy = make_sanitization_policy(effective.value().config);

    Hint is_file = Hint::Unknown;
    if (node_opts.file) is_file = Hint::AssertedTrue;
    if (node_opts.dir) is_file = Hint::AssertedFalse;
    Hint is_root = parse_hint(node_opts.root).value_or(Hint::Unknown);

    auto sanitized = sanitize_node(node_opts.text, is_file, is_root, policy);
    if (sanitized.isErr()) {
        if (opts.json) {
            nlohmann::json j = error_to_json(node_opts.text, sanitized.error());
            j["ok"] = false;
            j["warnings"] = warnings_to_json(collector);
            output_json(j);
        } else {
            std::cerr << "Error: " << sanitized.error().toString() << std::endl;
            log_warnings(collector);
        }
        return 1;
    }

    const std::string& out = sanitized.value();
    if (out != node_opts.text) {
        collector.emit(Warning::path_sanitized,
                       warnings::path_sanitized(node_opts.text, out));
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !collector.has_errors();
        j["input"] = node_opts.text;
        j["output"] = out;
        j["changed"] = out != node_opts.text;
        j["warnings"] = warnings_to_json(collector);
        output_json(j);
    } else {
        std::cout << out << std::endl;
        log_warnings(collector);
    }

    return collector.has_errors() ? 2 : 0;
}

} // anonymous namespace

void setup_node(CLI::App* app, GlobalOptions& opts) {
    static NodeOptions node_opts;

    app->add_option("text", node_opts.text, "Node to sanitize")->required();
    auto* file_flag = app->add_flag("--file", node_opts.file, "The node is a file");
    app->add_flag("--dir", node_opts.dir, "The node is a directory")->excludes(file_flag);
    app->add_option("--root", node_opts.root, "Whether the node is the root or a drive")
        ->check(CLI::IsMember({"yes", "no", "unknown", "true", "false"}, CLI::ignore_case));

    app->callback([&opts]() {
        std::exit(cmd_node(opts, node_opts));
    });
}

} // namespace safepath::cli::commands
