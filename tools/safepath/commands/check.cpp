/**
 * safepath CLI - check command
 *
 * Validation mode: list the paths that sanitizing would change.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace safepath::cli::commands {

namespace {

int cmd_check(const GlobalOptions& opts, const PathInputOptions& check_opts) {
    init_logging(opts);

    auto effective = resolve_policy(opts);
    if (effective.isErr()) {
        print_error(effective.error().toString(), opts.json);
        return 1;
    }

    WarningCollector collector(effective.value().config.warnings);
    collector.apply_override(warning_to_string(Warning::path_sanitized), WarningAction::Error);
    report_policy_problems(collector, effective.value());

    // Warnings are not needed here: a changed path is an offender by itself
    SanitizationPolicy policy = make_sanitization_policy(effective.value().config);
    const Hint is_file = file_hint(check_opts);

    std::size_t checked = 0;
    std::size_t offending = 0;
    nlohmann::json offenders = nlohmann::json::array();

    for (const auto& input : collect_inputs(check_opts.inputs)) {
        ++checked;
        auto sanitized = sanitize_path(input, is_file, policy);
        if (sanitized.isErr()) {
            ++offending;
            if (opts.json) {
                offenders.push_back(error_to_json(input, sanitized.error()));
            } else {
                std::cout << input << ": " << sanitized.error().toString() << std::endl;
            }
            continue;
        }

        const std::string& output = sanitized.value().path;
        if (output == input) {
            continue;
        }

        ++offending;
        collector.emit(Warning::path_sanitized, warnings::path_sanitized(input, output));
        if (opts.json) {
            nlohmann::json j;
            j["input"] = input;
            j["output"] = output;
            offenders.push_back(j);
        } else {
            std::cout << input << " -> " << output << std::endl;
        }
    }

    spdlog::debug("checked {} path(s), {} offender(s)", checked, offending);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = offending == 0;
        j["checked"] = checked;
        j["offenders"] = offenders;
        j["warnings"] = warnings_to_json(collector);
        output_json(j);
    } else {
        for (const auto& problem : effective.value().problems) {
            spdlog::warn("{}", problem);
        }
        if (offending == 0 && !opts.quiet) {
            std::cout << "OK: " << checked << " path(s) already sanitized" << std::endl;
        }
    }

    return offending == 0 ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static PathInputOptions check_opts;

    app->add_option("paths", check_opts.inputs, "Paths to check (stdin when omitted or '-')");
    auto* file_flag = app->add_flag("--file", check_opts.file, "The last node is a file");
    app->add_flag("--dir", check_opts.dir, "The last node is a directory")->excludes(file_flag);

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace safepath::cli::commands
