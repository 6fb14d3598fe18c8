#include <catch2/catch.hpp>
#include "stream_aggregator.hpp"
#include "test_support.hpp"

using namespace llmchat;
using llmchat_test::FakeStream;
using llmchat_test::RecordingPresenter;

TEST_CASE("Fragments are forwarded in order and concatenated", "[stream]") {
    RecordingPresenter presenter;
    FakeStream stream({"Hel", "lo", ", world"});
    StreamAggregator aggregator(presenter);

    AggregateResult result = aggregator.consume(stream);

    REQUIRE(result.success());
    REQUIRE(result.text == "Hello, world");
    REQUIRE(result.fragments == 3);
    REQUIRE(presenter.events == std::vector<std::string>{
        "fragment:Hel", "fragment:lo", "fragment:, world", "end_stream"});
}

TEST_CASE("Empty stream yields an empty reply", "[stream]") {
    RecordingPresenter presenter;
    FakeStream stream(std::vector<std::string>{});
    StreamAggregator aggregator(presenter);

    AggregateResult result = aggregator.consume(stream);
    REQUIRE(result.success());
    REQUIRE(result.text.empty());
    REQUIRE(presenter.events == std::vector<std::string>{"end_stream"});
}

TEST_CASE("Mid-stream failure keeps partial text and reports once", "[stream]") {
    RecordingPresenter presenter;
    FakeStream stream({"partial ", "answer", "never"}, 2);
    StreamAggregator aggregator(presenter);

    AggregateResult result = aggregator.consume(stream);

    REQUIRE_FALSE(result.success());
    REQUIRE(*result.error == ErrorKind::ServiceError);
    REQUIRE(result.text == "partial answer");
    REQUIRE(result.error_message == "connection reset");
    REQUIRE(presenter.errors.size() == 1);
    REQUIRE(presenter.errors[0].second == "Stream error: connection reset");

    // The stream is closed before the error is shown.
    REQUIRE(presenter.events[2] == "end_stream");
    REQUIRE(presenter.events[3] == "error:Stream error: connection reset");
}

TEST_CASE("Cancel check stops pulling fragments", "[stream]") {
    RecordingPresenter presenter;
    FakeStream stream({"a", "b", "c"});
    StreamAggregator aggregator(presenter);

    int checks = 0;
    AggregateResult result = aggregator.consume(stream, [&checks] { return ++checks > 1; });

    REQUIRE(result.cancelled);
    REQUIRE_FALSE(result.success());
    REQUIRE(result.text == "a");
    REQUIRE(stream.pulls == 1);
    REQUIRE(presenter.events.back() == "end_stream");
}

TEST_CASE("Stream ended by transport cancellation is flagged", "[stream]") {
    RecordingPresenter presenter;
    FakeStream stream({"a"}, -1, true);
    StreamAggregator aggregator(presenter);

    AggregateResult result = aggregator.consume(stream);
    REQUIRE(result.cancelled);
    REQUIRE(result.text == "a");
}

TEST_CASE("An aggregator consumes only one stream", "[stream]") {
    RecordingPresenter presenter;
    FakeStream first({"x"});
    FakeStream second({"y"});
    StreamAggregator aggregator(presenter);

    aggregator.consume(first);
    REQUIRE_THROWS_AS(aggregator.consume(second), std::logic_error);
}
