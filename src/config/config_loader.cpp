#include <p4_mcp/config/config_loader.hpp>

#include <p4_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace p4_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config};
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

std::optional<LogFormat> ParseLogFormat(std::string_view name) {
    auto lower = ToLower(name);
    if (lower == "text") return LogFormat::Text;
    if (lower == "json") return LogFormat::Json;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        if (root["mock"]) {
            config.mock_mode = root["mock"].as<bool>();
        }
        if (root["p4_binary"]) {
            config.p4_binary = root["p4_binary"].as<std::string>();
        }
        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<int>();
        }
        if (root["strict_arguments"]) {
            config.strict_arguments = root["strict_arguments"].as<bool>();
        }
        if (root["log_level"]) {
            auto name = root["log_level"].as<std::string>();
            auto level = ParseLogLevel(name);
            if (!level) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Unknown log_level: " + name));
            }
            config.log_level = *level;
        }
        if (root["log_format"]) {
            auto name = root["log_format"].as<std::string>();
            auto format = ParseLogFormat(name);
            if (!format) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Unknown log_format: " + name));
            }
            config.log_format = *format;
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("p4-mcp", kVersion);
    program.add_description(
        "Model Context Protocol server exposing Perforce operations over stdio.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--mock")
        .help("Use the canned-text mock backend instead of the p4 binary")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--p4")
        .help("p4 executable to run (resolved through PATH)");
    program.add_argument("--timeout")
        .help("Seconds to wait for a p4 command, 0 to wait indefinitely")
        .scan<'i', int>();
    program.add_argument("--strict-args")
        .help("Reject tool calls that omit required parameters")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-d", "--debug")
        .help("Enable debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--verbose")
        .help("Enable info logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-level")
        .help("Log level: debug, info, warn, error");
    program.add_argument("--log-format")
        .help("Log format on stderr: text or json");
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--check")
        .help("Run 'p4 info' through the configured backend and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }
    if (program.get<bool>("--mock")) {
        cli.mock_mode = true;
    }
    if (auto val = program.present("--p4")) {
        cli.p4_binary = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        cli.timeout_seconds = *val;
    }
    if (program.get<bool>("--strict-args")) {
        cli.strict_arguments = true;
    }

    // --log-level wins over the --debug / --verbose shorthands.
    if (program.get<bool>("--verbose")) {
        cli.log_level = LogLevel::Info;
    }
    if (program.get<bool>("--debug")) {
        cli.log_level = LogLevel::Debug;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --log-level: " + *val));
        }
        cli.log_level = *level;
    }
    if (auto val = program.present("--log-format")) {
        auto format = ParseLogFormat(*val);
        if (!format) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --log-format: " + *val));
        }
        cli.log_format = *format;
    }

    cli.force_color = program.get<bool>("--color");
    cli.force_no_color = program.get<bool>("--no-color");
    cli.check = program.get<bool>("--check");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
AppConfig ApplyEnvironment(AppConfig config) {
    if (std::getenv(kMockModeEnvVar) != nullptr) {
        config.mock_mode = true;
    }
    return config;
}

// ---------------------------------------------------------------------------
// ApplyCliOverrides
// ---------------------------------------------------------------------------
AppConfig ApplyCliOverrides(AppConfig base, const CliOptions& cli) {
    if (cli.mock_mode) {
        base.mock_mode = *cli.mock_mode;
    }
    if (cli.p4_binary) {
        base.p4_binary = *cli.p4_binary;
    }
    if (cli.timeout_seconds) {
        base.timeout_seconds = *cli.timeout_seconds;
    }
    if (cli.strict_arguments) {
        base.strict_arguments = *cli.strict_arguments;
    }
    if (cli.log_level) {
        base.log_level = *cli.log_level;
    }
    if (cli.log_format) {
        base.log_format = *cli.log_format;
    }
    return base;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.p4_binary.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("p4 binary name must not be empty"));
    }
    if (config.timeout_seconds < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must not be negative, got " +
                            std::to_string(config.timeout_seconds)));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli) {
    AppConfig config;
    if (cli.config_path) {
        auto yaml_result = LoadFromYaml(*cli.config_path);
        if (yaml_result.IsErr()) {
            return yaml_result;
        }
        config = std::move(yaml_result).Value();
    }

    config = ApplyCliOverrides(ApplyEnvironment(std::move(config)), cli);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // namespace p4_mcp
