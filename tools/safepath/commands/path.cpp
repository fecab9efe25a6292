/**
 * safepath CLI - path command
 *
 * Sanitize whole paths.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace safepath::cli::commands {

namespace {

int cmd_path(const GlobalOptions& opts, const PathInputOptions& path_opts) {
    init_logging(opts);

    auto effective = resolve_policy(opts);
    if (effective.isErr()) {
        print_error(effective.error().toString(), opts.json);
        return 1;
    }

    WarningCollector collector(effective.value().config.warnings);
    report_policy_problems(collector, effective.value());

    // policy refers to collector and must not leave this function
    const SanitizationPolicy policy = make_sanitization_policy(
        effective.value().config, collector.sink(Warning::path_sanitized));
    const Hint is_file = file_hint(path_opts);

    bool any_failed = false;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& input : collect_inputs(path_opts.inputs)) {
        auto sanitized = sanitize_path(input, is_file, policy);
        if (sanitized.isErr()) {
            any_failed = true;
            spdlog::debug("rejected '{}': {}", input, sanitized.error().toString());
            if (opts.json) {
                results.push_back(error_to_json(input, sanitized.error()));
            } else {
                std::cerr << "Error: " << sanitized.error().toString() << std::endl;
            }
            continue;
        }

        const SanitizedPath& out = sanitized.value();
        if (opts.json) {
            nlohmann::json j;
            j["input"] = input;
            j["output"] = out.path;
            j["changed"] = out.path != input;
            j["nodes"] = out.nodes;
            results.push_back(j);
        } else {
            std::cout << out.path << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !any_failed && !collector.has_errors();
        j["results"] = results;
        j["warnings"] = warnings_to_json(collector);
        output_json(j);
    } else {
        log_warnings(collector);
    }

    if (any_failed) return 1;
    if (collector.has_errors()) return 2;
    return 0;
}

} // anonymous namespace

void setup_path(CLI::App* app, GlobalOptions& opts) {
    static PathInputOptions path_opts;

    app->add_option("paths", path_opts.inputs, "Paths to sanitize (stdin when omitted or '-')");
    auto* file_flag = app->add_flag("--file", path_opts.file, "The last node is a file");
    app->add_flag("--dir", path_opts.dir, "The last node is a directory")->excludes(file_flag);

    app->callback([&opts]() {
        std::exit(cmd_path(opts, path_opts));
    });
}

} // namespace safepath::cli::commands
