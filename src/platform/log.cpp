#include "safepath/log.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace safepath {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

void configure_logging(LogLevel level) {
    spdlog::set_level(to_spdlog_level(level));
}

WarnCallback log_warning_sink() {
    return [](const std::string& message) { spdlog::warn("{}", message); };
}

} // namespace safepath
