#include <catch2/catch_test_macros.hpp>

#include <mcp_cli/core/cancellation.hpp>
#include <mcp_cli/core/types.hpp>

#include <string>
#include <thread>

using namespace mcp_cli;

// ===========================================================================
// MethodName
// ===========================================================================

TEST_CASE("MethodName: valid names", "[types][MethodName]") {
    SECTION("tool name") {
        auto r = MethodName::Create("sequential_thinking");
        REQUIRE(r.IsOk());
        CHECK(r.Value().Value() == "sequential_thinking");
    }
    SECTION("slash-separated") {
        auto r = MethodName::Create("tools/call");
        REQUIRE(r.IsOk());
    }
    SECTION("max 128 chars") {
        auto r = MethodName::Create(std::string(128, 'm'));
        REQUIRE(r.IsOk());
    }
}

TEST_CASE("MethodName: invalid names", "[types][MethodName]") {
    SECTION("empty") {
        auto r = MethodName::Create("");
        REQUIRE(r.IsErr());
        CHECK(r.Error().find("empty") != std::string::npos);
    }
    SECTION("too long") {
        auto r = MethodName::Create(std::string(129, 'm'));
        REQUIRE(r.IsErr());
        CHECK(r.Error().find("128") != std::string::npos);
    }
    SECTION("whitespace") {
        CHECK(MethodName::Create("brave search").IsErr());
        CHECK(MethodName::Create("memory\n").IsErr());
    }
    SECTION("non-ASCII") {
        CHECK(MethodName::Create("m\xc3\xa9moire").IsErr());
    }
}

TEST_CASE("MethodName: equality", "[types][MethodName]") {
    auto a = MethodName::Create("git").Value();
    auto b = MethodName::Create("git").Value();
    auto c = MethodName::Create("memory").Value();
    CHECK(a == b);
    CHECK(a != c);
}

// ===========================================================================
// CancellationToken
// ===========================================================================

TEST_CASE("CancellationToken: starts uncancelled", "[types][cancel]") {
    CancellationToken token;
    CHECK_FALSE(token.IsCancelled());
}

TEST_CASE("CancellationToken: copies share the flag", "[types][cancel]") {
    CancellationToken token;
    CancellationToken copy = token;
    copy.Cancel();
    CHECK(token.IsCancelled());
}

TEST_CASE("CancellationToken: visible across threads", "[types][cancel]") {
    CancellationToken token;
    std::thread t([token]() mutable { token.Cancel(); });
    t.join();
    CHECK(token.IsCancelled());
}
