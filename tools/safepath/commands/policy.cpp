/**
 * safepath CLI - policy command
 *
 * Print the effective policy after file, environment and flags.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace safepath::cli::commands {

namespace {

int cmd_policy(const GlobalOptions& opts) {
    init_logging(opts);

    auto effective = resolve_policy(opts);
    if (effective.isErr()) {
        print_error(effective.error().toString(), opts.json);
        return 1;
    }

    const PolicyConfig& config = effective.value().config;

    nlohmann::json j;
    j["$schema"] = config.schema;
    j["fat_compatible"] = config.fat_compatible;
    j["trim_to_limit"] = config.trim_to_limit;

    nlohmann::json actions = nlohmann::json::object();
    for (const auto& [key, action] : config.warnings) {
        actions[key] = action_to_string(action);
    }
    j["warnings"] = actions;
    j["source"] = config.source_path.empty() ? "builtin" : config.source_path;

    if (opts.json) {
        WarningCollector collector(config.warnings);
        report_policy_problems(collector, effective.value());

        nlohmann::json out;
        out["ok"] = true;
        out["policy"] = j;
        out["warnings"] = warnings_to_json(collector);
        output_json(out);
    } else {
        for (const auto& problem : effective.value().problems) {
            spdlog::warn("{}", problem);
        }
        std::cout << dump_json(j) << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_policy(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_policy(opts));
    });
}

} // namespace safepath::cli::commands
