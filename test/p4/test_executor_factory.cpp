#include <catch2/catch_test_macros.hpp>

#include <p4_mcp/p4/executor_factory.hpp>
#include "mocks/scripted_executor.hpp"

using namespace p4_mcp;

TEST_CASE("CreateExecutor: mock mode selects the mock backend", "[p4][factory]") {
    AppConfig config;
    config.mock_mode = true;
    auto executor = CreateExecutor(config);
    REQUIRE(executor != nullptr);
    CHECK(executor->Name() == "mock");

    auto result = executor->Execute(InfoCommand{});
    REQUIRE(result.IsOk());
    CHECK(result.Value().rfind("Mock P4 Info:", 0) == 0);
}

TEST_CASE("CreateExecutor: real mode runs the configured binary", "[p4][factory]") {
    AppConfig config;
    config.p4_binary = "echo";
    auto executor = CreateExecutor(config);
    REQUIRE(executor != nullptr);
    CHECK(executor->Name() == "echo");

    auto result = executor->Execute(ChangesCommand{});
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "changes -m 10\n");
}

TEST_CASE("CheckBackend: returns p4 info output", "[p4][factory]") {
    AppConfig config;
    config.mock_mode = true;
    auto executor = CreateExecutor(config);

    auto result = CheckBackend(*executor);
    REQUIRE(result.IsOk());
    CHECK(result.Value().rfind("Mock P4 Info:", 0) == 0);
}

TEST_CASE("CheckBackend: failure is a backend error", "[p4][factory]") {
    p4_mcp::testing::ScriptedExecutor executor;
    executor.Enqueue(Result<std::string, ExecutionError>::Err(
        ExecutionError{ExecutionErrorKind::SpawnFailed, "cannot execute 'p4'", "", std::nullopt}));

    auto result = CheckBackend(executor);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Backend);
    CHECK(result.Error().CategoryName() == "backend");
    CHECK(result.Error().ExitCode() == 1);
    CHECK(result.Error().message == "spawn_failed: cannot execute 'p4'");
    REQUIRE(executor.CallCount() == 1);
}

TEST_CASE("CheckBackend: missing binary fails the check", "[p4][factory]") {
    AppConfig config;
    config.p4_binary = "p4-mcp-no-such-binary-xyz";
    auto executor = CreateExecutor(config);

    auto result = CheckBackend(*executor);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Backend);
    CHECK(result.Error().message.rfind("spawn_failed: ", 0) == 0);
}
