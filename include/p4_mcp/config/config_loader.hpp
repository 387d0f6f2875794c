#pragma once

#include <p4_mcp/config/app_config.hpp>
#include <p4_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace p4_mcp {

// Environment variable that selects the mock backend when set (any value).
constexpr const char* kMockModeEnvVar = "P4_MOCK_MODE";

// Parse a YAML config file on top of the built-in defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments. --help and --version print and exit inside argparse.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply process environment toggles (P4_MOCK_MODE). Read once at startup.
AppConfig ApplyEnvironment(AppConfig config);

// Apply CLI flags on top of `base`; flags that were not given are ignored.
AppConfig ApplyCliOverrides(AppConfig base, const CliOptions& cli);

// Reject configurations the server cannot run with.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Full chain: defaults -> YAML (if --config) -> environment -> CLI -> validate.
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli);

std::optional<LogFormat> ParseLogFormat(std::string_view name);

} // namespace p4_mcp
