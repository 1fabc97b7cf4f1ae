#include <catch2/catch_test_macros.hpp>

#include <mcp_cli/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace mcp_cli;

// ===========================================================================
// Basic Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: move-only value can be taken out", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(7));
    auto p = std::move(r).Value();
    REQUIRE(p != nullptr);
    CHECK(*p == 7);
}

TEST_CASE("Result: ValueOr", "[result]") {
    CHECK(Result<int, std::string>::Ok(42).ValueOr(0) == 42);
    CHECK(Result<int, std::string>::Err("fail").ValueOr(99) == 99);
}

// ===========================================================================
// AndThen / Map / MapError
// ===========================================================================

TEST_CASE("Result: AndThen chains on Ok", "[result]") {
    auto r = Result<int, std::string>::Ok(10);
    auto r2 = std::move(r).AndThen([](int v) {
        return Result<std::string, std::string>::Ok(std::to_string(v * 2));
    });
    REQUIRE(r2.IsOk());
    CHECK(r2.Value() == "20");
}

TEST_CASE("Result: AndThen short-circuits on Err", "[result]") {
    auto r = Result<int, std::string>::Err("bad");
    bool called = false;
    auto r2 = std::move(r).AndThen([&called](int v) {
        called = true;
        return Result<int, std::string>::Ok(v);
    });
    CHECK_FALSE(called);
    REQUIRE(r2.IsErr());
    CHECK(r2.Error() == "bad");
}

TEST_CASE("Result: Map transforms the value", "[result]") {
    auto r = Result<int, std::string>::Ok(3);
    auto mapped = r.Map([](int v) { return v + 1; });
    REQUIRE(mapped.IsOk());
    CHECK(mapped.Value() == 4);
}

TEST_CASE("Result: MapError lifts the error type", "[result]") {
    auto r = Result<int, std::string>::Err("oops");
    auto lifted = std::move(r).MapError([](std::string msg) {
        return Error{"Lift", msg, std::nullopt, ErrorCategory::Validation};
    });
    REQUIRE(lifted.IsErr());
    CHECK(lifted.Error().message == "oops");
    CHECK(lifted.Error().category == ErrorCategory::Validation);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());
    auto err = Result<void, std::string>::Err("nope");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "nope");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: exit code follows the category", "[result][error]") {
    auto code = [](ErrorCategory c) { return Error{"op", "m", std::nullopt, c}.ExitCode(); };
    CHECK(code(ErrorCategory::Config) == 2);
    CHECK(code(ErrorCategory::Validation) == 2);
    CHECK(code(ErrorCategory::Startup) == 3);
    CHECK(code(ErrorCategory::Transport) == 4);
    CHECK(code(ErrorCategory::Protocol) == 5);
    CHECK(code(ErrorCategory::Tool) == 6);
    CHECK(code(ErrorCategory::Internal) == 99);
}

TEST_CASE("Error: default category is internal", "[result][error]") {
    Error e{"op", "boom"};
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.CategoryName() == "internal");
}

TEST_CASE("Error: ToString keeps only the first detail line", "[result][error]") {
    Error e{"call memory", "server exited", std::string("line one\nline two"),
            ErrorCategory::Transport};
    CHECK(e.ToString() == "call memory: server exited (line one ...)");

    Error plain{"ConfigLoader", "bad file", std::nullopt, ErrorCategory::Config};
    CHECK(plain.ToString() == "ConfigLoader: bad file");
}

TEST_CASE("Error: ToJson is one structured object", "[result][error]") {
    Error e{"call git", "no such repo", std::string("trace"), ErrorCategory::Tool};
    auto j = nlohmann::json::parse(e.ToJson());
    REQUIRE(j.contains("error"));
    CHECK(j["error"]["category"] == "tool");
    CHECK(j["error"]["operation"] == "call git");
    CHECK(j["error"]["message"] == "no such repo");
    CHECK(j["error"]["detail"] == "trace");
    CHECK(j["error"]["exit_code"] == 6);
}

TEST_CASE("Error: ToJson survives invalid UTF-8 in diagnostics", "[result][error]") {
    Error e{"call x", "crash", std::string("bad \xff\xfe bytes"), ErrorCategory::Startup};
    std::string out;
    REQUIRE_NOTHROW(out = e.ToJson());
    CHECK(nlohmann::json::parse(out)["error"]["exit_code"] == 3);
}

TEST_CASE("Error: equality compares every field", "[result][error]") {
    Error a{"op", "m", std::nullopt, ErrorCategory::Tool};
    Error b = a;
    CHECK(a == b);
    b.detail = "d";
    CHECK(a != b);
}
