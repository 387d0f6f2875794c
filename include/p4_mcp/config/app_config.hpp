#pragma once

#include <p4_mcp/core/log.hpp>

#include <optional>
#include <string>

namespace p4_mcp {

enum class LogFormat {
    Text,
    Json,
};

struct AppConfig {
    bool mock_mode = false;              // P4_MOCK_MODE / --mock / yaml "mock"
    std::string p4_binary = "p4";
    int timeout_seconds = 600;           // 0 = wait indefinitely
    bool strict_arguments = false;       // reject tool calls missing required params
    LogLevel log_level = LogLevel::Info;
    LogFormat log_format = LogFormat::Text;
};

// Flags given on the command line. Unset optionals leave the lower-precedence
// value (YAML file, environment, default) in place.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<bool> mock_mode;
    std::optional<std::string> p4_binary;
    std::optional<int> timeout_seconds;
    std::optional<bool> strict_arguments;
    std::optional<LogLevel> log_level;
    std::optional<LogFormat> log_format;
    bool force_color = false;
    bool force_no_color = false;
    bool check = false;
};

} // namespace p4_mcp
