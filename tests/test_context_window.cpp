#include <catch2/catch.hpp>
#include "context_window.hpp"

using namespace llmchat;

namespace {

std::vector<Message> numbered(std::size_t n) {
    std::vector<Message> out;
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back({i % 2 == 0 ? Role::User : Role::Assistant,
                       "m" + std::to_string(i), "ts"});
    }
    return out;
}

} // namespace

TEST_CASE("Context keeps the most recent messages in order", "[context]") {
    auto history = numbered(10);
    auto context = build_context(history, 4);

    REQUIRE(context.size() == 4);
    REQUIRE(context[0].content == "m6");
    REQUIRE(context[3].content == "m9");
    REQUIRE(context[0].role == Role::User);
}

TEST_CASE("Context returns everything when history is short", "[context]") {
    auto history = numbered(3);
    REQUIRE(build_context(history, 20).size() == 3);
    REQUIRE(build_context({}, 20).empty());
}

TEST_CASE("Context with zero limit is empty", "[context]") {
    REQUIRE(build_context(numbered(5), 0).empty());
}

TEST_CASE("Building context leaves history untouched", "[context]") {
    auto history = numbered(8);
    build_context(history, 2);
    REQUIRE(history.size() == 8);
}

TEST_CASE("Strip timestamps keeps role and content", "[context]") {
    auto api = strip_timestamps(numbered(3));
    REQUIRE(api.size() == 3);
    REQUIRE(api[1] == ApiMessage{Role::Assistant, "m1"});
}

TEST_CASE("Trim waits until history doubles the limit", "[context]") {
    auto messages = numbered(10);
    REQUIRE_FALSE(trim_history(messages, 5));
    REQUIRE(messages.size() == 10);

    messages = numbered(11);
    REQUIRE(trim_history(messages, 5));
    REQUIRE(messages.size() == 5);
    REQUIRE(messages.front().content == "m6");
    REQUIRE(messages.back().content == "m10");
}
