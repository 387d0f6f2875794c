#include <catch2/catch_test_macros.hpp>

#include <p4_mcp/core/result.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <utility>

using namespace p4_mcp;

// ===========================================================================
// Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok holds value", "[core][result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err holds error", "[core][result]") {
    auto r = Result<int, std::string>::Err("p4 not found");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "p4 not found");
}

TEST_CASE("Result: move-only value can be taken out", "[core][result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(7));
    REQUIRE(r.IsOk());
    auto p = std::move(r).Value();
    REQUIRE(p != nullptr);
    CHECK(*p == 7);
}

TEST_CASE("Result: ValueOr", "[core][result]") {
    CHECK(Result<int, std::string>::Ok(3).ValueOr(0) == 3);
    CHECK(Result<int, std::string>::Err("x").ValueOr(10) == 10);
}

// ===========================================================================
// AndThen / Map
// ===========================================================================

TEST_CASE("Result: AndThen chains on Ok", "[core][result]") {
    auto r = Result<int, std::string>::Ok(5)
        .AndThen([](int v) { return Result<int, std::string>::Ok(v + 10); })
        .AndThen([](int v) {
            return Result<std::string, std::string>::Ok(std::to_string(v * 2));
        });
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "30");
}

TEST_CASE("Result: AndThen short-circuits on Err", "[core][result]") {
    bool called = false;
    auto r = Result<int, std::string>::Err("bad")
        .AndThen([&called](int v) {
            called = true;
            return Result<int, std::string>::Ok(v);
        });
    CHECK_FALSE(called);
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "bad");
}

TEST_CASE("Result: Map transforms the value only", "[core][result]") {
    auto ok = Result<int, std::string>::Ok(4).Map([](int v) { return v * v; });
    REQUIRE(ok.IsOk());
    CHECK(ok.Value() == 16);

    auto err = Result<int, std::string>::Err("e").Map([](int v) { return v * v; });
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "e");
}

// ===========================================================================
// Result<void, E>
// ===========================================================================

TEST_CASE("Result<void>: Ok and Err", "[core][result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, Error>::Err(Error{"ConfigLoader", "bad", ErrorCategory::Config});
    REQUIRE(err.IsErr());
    CHECK(err.Error().message == "bad");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: exit code follows category", "[core][result]") {
    CHECK(Error{"op", "m", ErrorCategory::Config}.ExitCode() == 99);
    CHECK(Error{"op", "m", ErrorCategory::Backend}.ExitCode() == 1);
    CHECK(Error{"op", "m", ErrorCategory::Internal}.ExitCode() == 99);
}

TEST_CASE("Error: category names", "[core][result]") {
    CHECK(Error{"op", "m", ErrorCategory::Config}.CategoryName() == "config");
    CHECK(Error{"op", "m", ErrorCategory::Backend}.CategoryName() == "backend");
    CHECK(Error{"op", "m", ErrorCategory::Internal}.CategoryName() == "internal");
}

TEST_CASE("Error: ToString and stream output", "[core][result]") {
    Error e{"ConfigLoader", "timeout must not be negative", ErrorCategory::Config};
    CHECK(e.ToString() == "ConfigLoader: timeout must not be negative");

    std::ostringstream oss;
    oss << e;
    CHECK(oss.str() == e.ToString());
}

TEST_CASE("Error: equality", "[core][result]") {
    Error a{"op", "m", ErrorCategory::Config};
    Error b{"op", "m", ErrorCategory::Config};
    Error c{"op", "m", ErrorCategory::Backend};
    CHECK(a == b);
    CHECK(a != c);
}
