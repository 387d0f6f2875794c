#include <catch2/catch_test_macros.hpp>

#include <p4_mcp/core/subprocess.hpp>

#include <chrono>
#include <string>

using namespace p4_mcp;
using namespace std::chrono_literals;

TEST_CASE("RunSubprocess: captures stdout", "[core][subprocess]") {
    auto r = RunSubprocess("echo", {"hello", "world"}, 5000ms);
    REQUIRE(r.IsOk());
    CHECK(r.Value().exit_code == 0);
    CHECK(r.Value().stdout_text == "hello world\n");
    CHECK(r.Value().stderr_text.empty());
    CHECK_FALSE(r.Value().timed_out);
}

TEST_CASE("RunSubprocess: arguments are not shell-interpreted", "[core][subprocess]") {
    auto r = RunSubprocess("echo", {"$HOME", "a;b", "*"}, 5000ms);
    REQUIRE(r.IsOk());
    CHECK(r.Value().stdout_text == "$HOME a;b *\n");
}

TEST_CASE("RunSubprocess: captures stderr and exit code", "[core][subprocess]") {
    auto r = RunSubprocess("sh", {"-c", "echo oops >&2; exit 3"}, 5000ms);
    REQUIRE(r.IsOk());
    CHECK(r.Value().exit_code == 3);
    CHECK(r.Value().stderr_text == "oops\n");
    CHECK(r.Value().stdout_text.empty());
}

TEST_CASE("RunSubprocess: non-zero exit is still Ok", "[core][subprocess]") {
    auto r = RunSubprocess("false", {}, 5000ms);
    REQUIRE(r.IsOk());
    CHECK(r.Value().exit_code != 0);
}

TEST_CASE("RunSubprocess: stdin is empty", "[core][subprocess]") {
    auto r = RunSubprocess("cat", {}, 5000ms);
    REQUIRE(r.IsOk());
    CHECK(r.Value().exit_code == 0);
    CHECK(r.Value().stdout_text.empty());
}

TEST_CASE("RunSubprocess: large output on both pipes does not deadlock", "[core][subprocess]") {
    auto r = RunSubprocess(
        "sh", {"-c", "i=0; while [ $i -lt 5000 ]; do echo out$i; echo err$i >&2; i=$((i+1)); done"},
        30000ms);
    REQUIRE(r.IsOk());
    CHECK(r.Value().exit_code == 0);
    CHECK(r.Value().stdout_text.find("out4999\n") != std::string::npos);
    CHECK(r.Value().stderr_text.find("err4999\n") != std::string::npos);
}

TEST_CASE("RunSubprocess: missing binary is Err", "[core][subprocess]") {
    auto r = RunSubprocess("p4-mcp-no-such-binary-xyz", {}, 5000ms);
    REQUIRE(r.IsErr());
    CHECK(r.Error().find("p4-mcp-no-such-binary-xyz") != std::string::npos);
}

TEST_CASE("RunSubprocess: timeout kills the child", "[core][subprocess]") {
    auto start = std::chrono::steady_clock::now();
    auto r = RunSubprocess("sleep", {"5"}, 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(r.IsOk());
    CHECK(r.Value().timed_out);
    CHECK(elapsed < 4s);
}

TEST_CASE("RunSubprocess: zero timeout waits for completion", "[core][subprocess]") {
    auto r = RunSubprocess("sh", {"-c", "sleep 0.1; echo done"}, 0ms);
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().timed_out);
    CHECK(r.Value().stdout_text == "done\n");
}

TEST_CASE("RunSubprocess: timeout beyond the poll() range is not truncated", "[core][subprocess]") {
    // 4294968 s in ms exceeds INT_MAX and would wrap to a sub-second wait.
    auto r = RunSubprocess("sh", {"-c", "sleep 1; echo done"},
                           std::chrono::milliseconds(4294968000LL));
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().timed_out);
    CHECK(r.Value().exit_code == 0);
    CHECK(r.Value().stdout_text == "done\n");
}

TEST_CASE("RunSubprocess: timeout applies after the child closes its pipes", "[core][subprocess]") {
    auto start = std::chrono::steady_clock::now();
    auto r = RunSubprocess("sh", {"-c", "exec >&- 2>&-; sleep 5"}, 300ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(r.IsOk());
    CHECK(r.Value().timed_out);
    CHECK(r.Value().exit_code == 128 + 9);
    CHECK(elapsed < 4s);
}

TEST_CASE("RunSubprocess: child that closes its pipes and exits in time is not killed", "[core][subprocess]") {
    auto r = RunSubprocess("sh", {"-c", "exec >&- 2>&-; sleep 0.1; exit 4"}, 5000ms);
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().timed_out);
    CHECK(r.Value().exit_code == 4);
}
