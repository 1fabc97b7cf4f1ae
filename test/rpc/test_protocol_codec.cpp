#include <catch2/catch_test_macros.hpp>

#include <mcp_cli/rpc/protocol_codec.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>

using namespace mcp_cli;
using json = nlohmann::json;

namespace {

MethodName Method(const char* name) {
    return MethodName::Create(name).Value();
}

} // anonymous namespace

// ===========================================================================
// EncodeRequest
// ===========================================================================

TEST_CASE("EncodeRequest: one JSON-RPC 2.0 line", "[rpc][codec]") {
    auto r = EncodeRequest(Method("brave_search"), json{{"query", "rust"}}, 7);
    REQUIRE(r.IsOk());
    const auto& line = r.Value();
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
    CHECK(std::count(line.begin(), line.end(), '\n') == 1);

    auto j = json::parse(line);
    CHECK(j["jsonrpc"] == "2.0");
    CHECK(j["method"] == "brave_search");
    CHECK(j["params"] == json{{"query", "rust"}});
    CHECK(j["id"] == 7);
}

TEST_CASE("EncodeRequest: null params become an empty object", "[rpc][codec]") {
    auto r = EncodeRequest(Method("git"), json(nullptr), 1);
    REQUIRE(r.IsOk());
    CHECK(json::parse(r.Value())["params"] == json::object());
}

TEST_CASE("EncodeRequest: newlines inside values stay escaped", "[rpc][codec]") {
    auto r = EncodeRequest(Method("memory"), json{{"content", "a\nb\r\nc"}}, 2);
    REQUIRE(r.IsOk());
    const auto& line = r.Value();
    CHECK(std::count(line.begin(), line.end(), '\n') == 1);
    CHECK(json::parse(line)["params"]["content"] == "a\nb\r\nc");
}

TEST_CASE("EncodeRequest: non-object params are rejected", "[rpc][codec]") {
    SECTION("array") {
        auto r = EncodeRequest(Method("git"), json::array({1, 2}), 1);
        REQUIRE(r.IsErr());
        CHECK(r.Error().parse_message.find("array") != std::string::npos);
    }
    SECTION("string") {
        CHECK(EncodeRequest(Method("git"), json("x"), 1).IsErr());
    }
}

TEST_CASE("EncodeRequest: invalid UTF-8 is a protocol error", "[rpc][codec]") {
    auto r = EncodeRequest(Method("memory"), json{{"content", std::string("\xff\xfe")}}, 3);
    CHECK(r.IsErr());
}

// ===========================================================================
// DecodeResponse
// ===========================================================================

TEST_CASE("DecodeResponse: result member is returned", "[rpc][codec]") {
    auto r = DecodeResponse(R"({"jsonrpc":"2.0","id":1,"result":{"nodes":[1,2]}})");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json{{"nodes", {1, 2}}});
}

TEST_CASE("DecodeResponse: non-object result passes through", "[rpc][codec]") {
    auto r = DecodeResponse(R"({"result":"done"})");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "done");
}

TEST_CASE("DecodeResponse: missing result is an empty object", "[rpc][codec]") {
    auto r = DecodeResponse("{}\n");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::object());
}

TEST_CASE("DecodeResponse: error wins over result", "[rpc][codec]") {
    auto r = DecodeResponse(R"({"error":{"code":-32601,"message":"no"},"result":1})");
    REQUIRE(r.IsErr());
    REQUIRE(KindOf(r.Error()) == ErrorKind::Tool);
    const auto& tool = std::get<ToolError>(r.Error());
    CHECK(tool.payload["code"] == -32601);
}

TEST_CASE("DecodeResponse: string error payload is kept verbatim", "[rpc][codec]") {
    auto r = DecodeResponse(R"({"error":"repository not found"})");
    REQUIRE(r.IsErr());
    CHECK(std::get<ToolError>(r.Error()).payload == "repository not found");
}

TEST_CASE("DecodeResponse: null error still counts as error", "[rpc][codec]") {
    auto r = DecodeResponse(R"({"error":null})");
    REQUIRE(r.IsErr());
    CHECK(KindOf(r.Error()) == ErrorKind::Tool);
}

TEST_CASE("DecodeResponse: CRLF line endings are tolerated", "[rpc][codec]") {
    auto r = DecodeResponse("{\"result\":1}\r\n");
    REQUIRE(r.IsOk());
    CHECK(r.Value() == 1);
}

TEST_CASE("DecodeResponse: malformed JSON is a protocol error", "[rpc][codec]") {
    auto r = DecodeResponse("starting server...", "stderr text");
    REQUIRE(r.IsErr());
    REQUIRE(KindOf(r.Error()) == ErrorKind::Protocol);
    const auto& e = std::get<ProtocolError>(r.Error());
    CHECK(e.raw_line == "starting server...");
    CHECK_FALSE(e.parse_message.empty());
    CHECK(e.diagnostics == "stderr text");
}

TEST_CASE("DecodeResponse: non-object JSON is a protocol error", "[rpc][codec]") {
    SECTION("array") {
        auto r = DecodeResponse("[1,2,3]");
        REQUIRE(r.IsErr());
        CHECK(std::get<ProtocolError>(r.Error()).parse_message.find("array") !=
              std::string::npos);
    }
    SECTION("number") {
        CHECK(KindOf(DecodeResponse("42").Error()) == ErrorKind::Protocol);
    }
    SECTION("empty line") {
        CHECK(KindOf(DecodeResponse("").Error()) == ErrorKind::Protocol);
    }
}
