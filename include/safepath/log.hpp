#pragma once

#include "safepath/types.hpp"

#include <optional>
#include <string>

namespace safepath {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

std::optional<LogLevel> parse_log_level(const std::string& s);

// Set the level of the default spdlog logger
void configure_logging(LogLevel level);

// Warning callback that writes each message through spdlog::warn
WarnCallback log_warning_sink();

} // namespace safepath
