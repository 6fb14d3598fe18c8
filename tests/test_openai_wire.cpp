#include <catch2/catch.hpp>
#include "openai_client.hpp"

using namespace llmchat;
using json = nlohmann::json;

// ============================================================================
// Request encoding
// ============================================================================

TEST_CASE("Completions URL tolerates trailing slashes", "[wire]") {
    REQUIRE(chat_completions_url("https://api.deepseek.com") ==
            "https://api.deepseek.com/chat/completions");
    REQUIRE(chat_completions_url("https://api.openai.com/v1/") ==
            "https://api.openai.com/v1/chat/completions");
}

TEST_CASE("Request body carries model, messages and sampling", "[wire]") {
    std::vector<ApiMessage> messages = {
        {Role::System, "Be brief"},
        {Role::User, "Hello"},
    };
    json body = build_chat_body("deepseek-chat", messages, 0.7, 256, true);

    REQUIRE(body["model"] == "deepseek-chat");
    REQUIRE(body["stream"] == true);
    REQUIRE(body["max_tokens"] == 256);
    REQUIRE(body["temperature"].get<double>() == Approx(0.7));
    REQUIRE(body["messages"].size() == 2);
    REQUIRE(body["messages"][0] == json({{"role", "system"}, {"content", "Be brief"}}));
    REQUIRE(body["messages"][1]["role"] == "user");
    REQUIRE_FALSE(body["messages"][1].contains("timestamp"));
}

TEST_CASE("Encoded body replaces invalid UTF-8", "[wire]") {
    std::vector<ApiMessage> messages = {{Role::User, "caf\xe9"}};
    json body = build_chat_body("m", messages, 0.5, 16, false);

    std::string encoded;
    REQUIRE_NOTHROW(encoded = encode_body(body));
    json decoded = json::parse(encoded);
    REQUIRE(decoded["messages"][0]["content"] == "caf\xef\xbf\xbd");
    REQUIRE(decoded["model"] == "m");
}

// ============================================================================
// Response decoding
// ============================================================================

TEST_CASE("Reply text comes from the first choice", "[wire]") {
    std::string body = R"({"choices":[{"message":{"role":"assistant","content":"Hi!"}}]})";
    REQUIRE(extract_reply_text(body) == "Hi!");

    std::string null_content = R"({"choices":[{"message":{"role":"assistant","content":null}}]})";
    REQUIRE(extract_reply_text(null_content).empty());
}

TEST_CASE("Malformed or error responses throw ServiceError", "[wire]") {
    REQUIRE_THROWS_AS(extract_reply_text("not json"), ServiceError);
    REQUIRE_THROWS_AS(extract_reply_text(R"({"choices":[]})"), ServiceError);
    REQUIRE_THROWS_AS(extract_reply_text(R"({"choices":[{}]})"), ServiceError);
    REQUIRE_THROWS_WITH(extract_reply_text(R"({"error":{"message":"quota exceeded"}})"),
                        "quota exceeded");
}

TEST_CASE("HTTP error messages prefer the error object", "[wire]") {
    REQUIRE(extract_error_message(R"({"error":{"message":"Invalid API key"}})", 401) ==
            "HTTP 401: Invalid API key");
    REQUIRE(extract_error_message("Bad Gateway", 502) == "HTTP 502: Bad Gateway");
    REQUIRE(extract_error_message("", 503) == "HTTP 503");
}

TEST_CASE("Stream deltas yield only non-empty text", "[wire][sse]") {
    REQUIRE(*parse_stream_delta(R"({"choices":[{"delta":{"content":"tok"}}]})") == "tok");
    REQUIRE_FALSE(parse_stream_delta(R"({"choices":[{"delta":{"role":"assistant"}}]})"));
    REQUIRE_FALSE(parse_stream_delta(R"({"choices":[{"delta":{"content":""}}]})"));
    REQUIRE_FALSE(parse_stream_delta(R"({"choices":[{"delta":{},"finish_reason":"stop"}]})"));
    REQUIRE_FALSE(parse_stream_delta("{truncated"));
    REQUIRE_THROWS_AS(parse_stream_delta(R"({"error":{"message":"overloaded"}})"), ServiceError);
}

// ============================================================================
// SSE framing
// ============================================================================

TEST_CASE("SSE parser reassembles lines split across chunks", "[wire][sse]") {
    SseParser parser;

    REQUIRE(parser.feed("data: {\"a\"").empty());
    auto first = parser.feed(":1}\n\nda");
    REQUIRE(first == std::vector<std::string>{"{\"a\":1}"});

    auto second = parser.feed("ta:{\"b\":2}\r\n\r\n");
    REQUIRE(second == std::vector<std::string>{"{\"b\":2}"});
    REQUIRE_FALSE(parser.done());
}

TEST_CASE("SSE parser skips comments and stops at DONE", "[wire][sse]") {
    SseParser parser;

    auto payloads = parser.feed(": keep-alive\n"
                                "event: message\n"
                                "data: one\n\n"
                                "data: [DONE]\n\n"
                                "data: after\n\n");
    REQUIRE(payloads == std::vector<std::string>{"one"});
    REQUIRE(parser.done());
    REQUIRE(parser.feed("data: more\n").empty());
}
