/**
 * safepath CLI - Entry Point
 *
 * Sanitize paths so they are legal on POSIX, NTFS and FAT.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace safepath::cli::commands {
    void setup_path(CLI::App* app, GlobalOptions& opts);
    void setup_node(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_policy(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace safepath::cli;

    CLI::App app{"safepath - cross-platform path sanitizer"};
    app.set_version_flag("-V,--version", SAFEPATH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--policy", opts.policy, "Policy file (default: $SAFEPATH_POLICY or built-in)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");
    app.add_flag("--fat", opts.fat, "Also guard FAT device names");
    app.add_flag("--trim", opts.trim, "Truncate long nodes instead of failing");

    // Commands
    auto* path_cmd = app.add_subcommand("path", "Sanitize paths");
    commands::setup_path(path_cmd, opts);

    auto* node_cmd = app.add_subcommand("node", "Sanitize a single node");
    commands::setup_node(node_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Report paths that are not already sanitized");
    commands::setup_check(check_cmd, opts);

    auto* policy_cmd = app.add_subcommand("policy", "Print the effective policy");
    commands::setup_policy(policy_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
