#include <catch2/catch.hpp>
#include "file_input.hpp"
#include "test_support.hpp"

#include <fstream>

using namespace llmchat;
using llmchat_test::RecordingPresenter;
using llmchat_test::ScriptedInput;
using llmchat_test::TempDir;

TEST_CASE("File references start with @", "[file]") {
    REQUIRE(is_file_reference("@notes.md"));
    REQUIRE(is_file_reference("@"));
    REQUIRE_FALSE(is_file_reference("mail me @ home"));
}

TEST_CASE("Bare @ names the default input file", "[file]") {
    REQUIRE(file_reference_path("@") == "input.txt");
    REQUIRE(file_reference_path("@   ") == "input.txt");
    REQUIRE(file_reference_path("@ docs/prompt.txt ") == "docs/prompt.txt");
}

TEST_CASE("Missing file is reported as not found", "[file]") {
    TempDir dir;
    RecordingPresenter presenter;
    ScriptedInput input;

    auto content = load_file_message("@" + dir.file("nope.txt"), false, input, presenter);
    REQUIRE_FALSE(content);
    REQUIRE(presenter.errors[0].first == ErrorKind::NotFound);
}

TEST_CASE("Whitespace-only file is not sent", "[file]") {
    TempDir dir;
    { std::ofstream(dir.file("blank.txt")) << "  \n\t\n"; }
    RecordingPresenter presenter;
    ScriptedInput input;

    REQUIRE_FALSE(load_file_message("@" + dir.file("blank.txt"), false, input, presenter));
    REQUIRE(presenter.warnings.size() == 1);
}

TEST_CASE("Zero-byte file is reported as empty", "[file]") {
    TempDir dir;
    { std::ofstream touch(dir.file("empty.txt")); }
    RecordingPresenter presenter;
    ScriptedInput input;

    REQUIRE_FALSE(load_file_message("@" + dir.file("empty.txt"), false, input, presenter));
    REQUIRE(presenter.errors.empty());
    REQUIRE(presenter.warnings.size() == 1);
    REQUIRE(presenter.warnings[0].rfind("File is empty", 0) == 0);
}

TEST_CASE("Confirmed file content is returned trimmed", "[file]") {
    TempDir dir;
    { std::ofstream(dir.file("q.txt")) << "\n  /help is just text here  \n"; }
    RecordingPresenter presenter;
    ScriptedInput input;
    input.answers = {"Y"};

    auto content = load_file_message("@" + dir.file("q.txt"), true, input, presenter);
    REQUIRE(content);
    REQUIRE(*content == "/help is just text here");
    REQUIRE(presenter.events[0] == "preview:" + dir.file("q.txt"));
    REQUIRE(input.prompts == std::vector<std::string>{"Send this? (y/n): "});
}

TEST_CASE("Declined or unanswered confirmation sends nothing", "[file]") {
    TempDir dir;
    { std::ofstream(dir.file("q.txt")) << "question"; }
    RecordingPresenter presenter;
    ScriptedInput input;

    SECTION("declined") {
        input.answers = {"n"};
    }
    SECTION("end of input") {
    }

    REQUIRE_FALSE(load_file_message("@" + dir.file("q.txt"), true, input, presenter));
    REQUIRE(presenter.warnings.back() == "Cancelled");
}

TEST_CASE("Confirmation is skipped when disabled", "[file]") {
    TempDir dir;
    { std::ofstream(dir.file("q.txt")) << "question"; }
    RecordingPresenter presenter;
    ScriptedInput input;

    REQUIRE(*load_file_message("@" + dir.file("q.txt"), false, input, presenter) == "question");
    REQUIRE(input.prompts.empty());
}
