/**
 * safepath CLI - Common utilities and types
 */

#pragma once

#include <safepath/log.hpp>
#include <safepath/path_sanitizer.hpp>
#include <safepath/platform.hpp>
#include <safepath/policy.hpp>
#include <safepath/result.hpp>
#include <safepath/warnings.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace safepath::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string policy;            // --policy
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
    bool fat = false;              // --fat
    bool trim = false;             // --trim
};

/**
 * Options shared by commands that take paths.
 */
struct PathInputOptions {
    std::vector<std::string> inputs;
    bool file = false;             // --file
    bool dir = false;              // --dir
};

inline Hint file_hint(const PathInputOptions& in) {
    if (in.file) return Hint::AssertedTrue;
    if (in.dir) return Hint::AssertedFalse;
    return Hint::Unknown;
}

/**
 * Route spdlog to stderr and pick the level.
 * Priority: -q / -v > SAFEPATH_LOG_LEVEL > warn
 */
inline void init_logging(const GlobalOptions& opts) {
    if (!spdlog::get("safepath")) {
        auto logger = spdlog::stderr_color_mt("safepath");
        logger->set_pattern("%^%l%$: %v");
        spdlog::set_default_logger(logger);
    }

    LogLevel level = LogLevel::Warn;
    if (auto env = get_env("SAFEPATH_LOG_LEVEL")) {
        if (auto parsed = parse_log_level(*env)) {
            level = *parsed;
        }
    }
    if (opts.verbose) level = LogLevel::Debug;
    if (opts.quiet) level = LogLevel::Error;

    configure_logging(level);
}

/**
 * Resolve the policy from --policy, the SAFEPATH_* environment and flags.
 */
inline Result<ResolvedPolicy> resolve_policy(const GlobalOptions& opts) {
    PolicyFlags flags;
    flags.fat_compatible = opts.fat;
    flags.trim_to_limit = opts.trim;

    auto resolved = resolve_policy_config(opts.policy, policy_env_from_process(), flags);
    if (resolved.isOk() && !resolved.value().config.source_path.empty()) {
        spdlog::debug("policy loaded from {}", resolved.value().config.source_path);
    }
    return resolved;
}

/**
 * Record configuration problems as invalid_configuration warnings.
 */
inline void report_policy_problems(WarningCollector& collector, const ResolvedPolicy& effective) {
    const std::string prefix = "invalid_configuration:";
    for (const auto& problem : effective.problems) {
        std::string reason = problem.compare(0, prefix.size(), prefix) == 0
                                 ? problem.substr(prefix.size())
                                 : problem;
        collector.emit(Warning::invalid_configuration,
                       warnings::invalid_configuration(reason, effective.config.source_path));
    }
}

inline nlohmann::json warnings_to_json(const WarningCollector& collector) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : collector.get_warnings()) {
        nlohmann::json j;
        j["key"] = w.key;
        j["action"] = w.action;
        j["fields"] = w.fields;
        arr.push_back(j);
    }
    return arr;
}

/**
 * In text mode, warnings go to the log once the command is done.
 */
inline void log_warnings(const WarningCollector& collector) {
    for (const auto& w : collector.get_warnings()) {
        std::string text = w.key;
        auto message = w.fields.find("message");
        if (message != w.fields.end()) {
            text = message->second;
        } else {
            auto reason = w.fields.find("reason");
            if (reason != w.fields.end()) {
                text += ": " + reason->second;
            }
        }
        if (w.action == "error") {
            spdlog::error("{}", text);
        } else {
            spdlog::warn("{}", text);
        }
    }
}

/**
 * Command-line inputs, or one per line from stdin when there are none
 * or an input is "-".
 */
inline std::vector<std::string> collect_inputs(const std::vector<std::string>& args) {
    std::vector<std::string> inputs;
    auto read_stdin = [&inputs]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            inputs.push_back(line);
        }
    };

    if (args.empty()) {
        read_stdin();
        return inputs;
    }
    for (const auto& arg : args) {
        if (arg == "-") {
            read_stdin();
        } else {
            inputs.push_back(arg);
        }
    }
    return inputs;
}

/**
 * Output utilities.
 */

// Inputs are echoed verbatim and may be malformed UTF-8; such bytes are
// written as U+FFFD instead of making dump() throw.
inline std::string dump_json(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << dump_json(j) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << dump_json(j) << std::endl;
}

inline nlohmann::json error_to_json(const std::string& input, const Error& error) {
    nlohmann::json j;
    j["input"] = input;
    j["error"] = error.message();
    j["code"] = error_code_to_string(error.code());
    return j;
}

} // namespace safepath::cli
