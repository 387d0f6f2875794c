#include <catch2/catch_test_macros.hpp>

#include <p4_mcp/config/config_loader.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace p4_mcp;

namespace {

void SetEnv(const char* name, const char* value) {
    setenv(name, value, 1);
}

void UnsetEnv(const char* name) {
    unsetenv(name);
}

// Clears P4_MOCK_MODE for the duration of a test.
class MockEnvGuard {
public:
    MockEnvGuard() { UnsetEnv(kMockModeEnvVar); }
    ~MockEnvGuard() { UnsetEnv(kMockModeEnvVar); }
};

// Tests run from the build directory; derive the testdata path from this file.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);           // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

Result<CliOptions, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "p4-mcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// Defaults
// ===========================================================================

TEST_CASE("AppConfig: defaults", "[config]") {
    AppConfig config;
    CHECK_FALSE(config.mock_mode);
    CHECK(config.p4_binary == "p4");
    CHECK(config.timeout_seconds == 600);
    CHECK_FALSE(config.strict_arguments);
    CHECK(config.log_level == LogLevel::Info);
    CHECK(config.log_format == LogFormat::Text);
}

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.mock_mode);
    CHECK(config.p4_binary == "/opt/perforce/bin/p4");
    CHECK(config.timeout_seconds == 120);
    CHECK(config.strict_arguments);
    CHECK(config.log_level == LogLevel::Debug);
    CHECK(config.log_format == LogFormat::Json);
}

TEST_CASE("LoadFromYaml: missing keys keep defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().mock_mode);
    CHECK(result.Value().timeout_seconds == 600);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

TEST_CASE("LoadFromYaml: wrong value type", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_types.yaml"));
    REQUIRE(result.IsErr());
}

TEST_CASE("LoadFromYaml: unknown log level", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_log_level.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Unknown log_level: verbose");
}

TEST_CASE("LoadFromYaml: unknown log format", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_log_format.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Unknown log_format: xml");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no flags leaves everything unset", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK_FALSE(cli.config_path.has_value());
    CHECK_FALSE(cli.mock_mode.has_value());
    CHECK_FALSE(cli.p4_binary.has_value());
    CHECK_FALSE(cli.timeout_seconds.has_value());
    CHECK_FALSE(cli.strict_arguments.has_value());
    CHECK_FALSE(cli.log_level.has_value());
    CHECK_FALSE(cli.log_format.has_value());
    CHECK_FALSE(cli.check);
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    auto result = ParseArgs({"-c", "p4.yaml", "--mock", "--p4", "/usr/bin/p4",
                             "--timeout", "30", "--strict-args",
                             "--log-format", "json", "--no-color", "--check"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.config_path == std::optional<std::string>("p4.yaml"));
    CHECK(cli.mock_mode == std::optional<bool>(true));
    CHECK(cli.p4_binary == std::optional<std::string>("/usr/bin/p4"));
    CHECK(cli.timeout_seconds == std::optional<int>(30));
    CHECK(cli.strict_arguments == std::optional<bool>(true));
    CHECK(cli.log_format == std::optional<LogFormat>(LogFormat::Json));
    CHECK(cli.force_no_color);
    CHECK_FALSE(cli.force_color);
    CHECK(cli.check);
}

TEST_CASE("LoadFromCli: --debug and --verbose", "[config][cli]") {
    auto debug = ParseArgs({"-d"});
    REQUIRE(debug.IsOk());
    CHECK(debug.Value().log_level == std::optional<LogLevel>(LogLevel::Debug));

    auto verbose = ParseArgs({"--verbose"});
    REQUIRE(verbose.IsOk());
    CHECK(verbose.Value().log_level == std::optional<LogLevel>(LogLevel::Info));

    auto both = ParseArgs({"--verbose", "--debug"});
    REQUIRE(both.IsOk());
    CHECK(both.Value().log_level == std::optional<LogLevel>(LogLevel::Debug));
}

TEST_CASE("LoadFromCli: --log-level beats --debug", "[config][cli]") {
    auto result = ParseArgs({"--debug", "--log-level", "error"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().log_level == std::optional<LogLevel>(LogLevel::Error));
}

TEST_CASE("LoadFromCli: invalid values are rejected", "[config][cli]") {
    CHECK(ParseArgs({"--log-level", "loud"}).IsErr());
    CHECK(ParseArgs({"--log-format", "xml"}).IsErr());
    CHECK(ParseArgs({"--timeout", "soon"}).IsErr());
    CHECK(ParseArgs({"--no-such-flag"}).IsErr());
}

// ===========================================================================
// Environment
// ===========================================================================

TEST_CASE("ApplyEnvironment: P4_MOCK_MODE enables mock mode", "[config][env]") {
    MockEnvGuard guard;
    CHECK_FALSE(ApplyEnvironment(AppConfig{}).mock_mode);

    SetEnv(kMockModeEnvVar, "1");
    CHECK(ApplyEnvironment(AppConfig{}).mock_mode);
}

TEST_CASE("ApplyEnvironment: any value counts, even empty", "[config][env]") {
    MockEnvGuard guard;
    SetEnv(kMockModeEnvVar, "");
    CHECK(ApplyEnvironment(AppConfig{}).mock_mode);
}

// ===========================================================================
// Merge / validate
// ===========================================================================

TEST_CASE("ApplyCliOverrides: only given flags override", "[config][merge]") {
    AppConfig base;
    base.p4_binary = "/opt/p4";
    base.timeout_seconds = 60;

    CliOptions cli;
    cli.timeout_seconds = 5;

    auto merged = ApplyCliOverrides(base, cli);
    CHECK(merged.p4_binary == "/opt/p4");
    CHECK(merged.timeout_seconds == 5);
}

TEST_CASE("ValidateConfig: rejects empty binary and negative timeout", "[config][validate]") {
    AppConfig config;
    CHECK(ValidateConfig(config).IsOk());

    config.timeout_seconds = 0;
    CHECK(ValidateConfig(config).IsOk());

    config.timeout_seconds = -1;
    CHECK(ValidateConfig(config).IsErr());

    config.timeout_seconds = 10;
    config.p4_binary.clear();
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ResolveConfig: CLI beats YAML", "[config][merge]") {
    MockEnvGuard guard;
    CliOptions cli;
    cli.config_path = TestDataPath("valid_config.yaml");
    cli.p4_binary = "p4-override";
    cli.log_level = LogLevel::Warn;

    auto result = ResolveConfig(cli);
    REQUIRE(result.IsOk());
    CHECK(result.Value().p4_binary == "p4-override");
    CHECK(result.Value().log_level == LogLevel::Warn);
    CHECK(result.Value().timeout_seconds == 120);
    CHECK(result.Value().mock_mode);
}

TEST_CASE("ResolveConfig: environment applies without a file", "[config][merge]") {
    MockEnvGuard guard;
    SetEnv(kMockModeEnvVar, "yes");
    auto result = ResolveConfig(CliOptions{});
    REQUIRE(result.IsOk());
    CHECK(result.Value().mock_mode);
}

TEST_CASE("ResolveConfig: invalid file value fails validation", "[config][merge]") {
    MockEnvGuard guard;
    CliOptions cli;
    cli.config_path = TestDataPath("negative_timeout.yaml");
    auto result = ResolveConfig(cli);
    REQUIRE(result.IsErr());
    CHECK(result.Error().ExitCode() == 99);
}

TEST_CASE("ResolveConfig: missing config file is an error", "[config][merge]") {
    CliOptions cli;
    cli.config_path = TestDataPath("does_not_exist.yaml");
    CHECK(ResolveConfig(cli).IsErr());
}

TEST_CASE("ParseLogFormat: text and json", "[config]") {
    CHECK(ParseLogFormat("text") == LogFormat::Text);
    CHECK(ParseLogFormat("JSON") == LogFormat::Json);
    CHECK_FALSE(ParseLogFormat("yaml").has_value());
}
