#pragma once

/**
 * Test doubles shared by the llmchat unit tests.
 */

#include "input_editor.hpp"
#include "model_service.hpp"
#include "presenter.hpp"

#include <deque>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace llmchat_test {

using namespace llmchat;

// Records every presenter event as "kind:payload" in call order.
class RecordingPresenter : public Presenter {
public:
    std::vector<std::string> events;
    std::vector<std::pair<ErrorKind, std::string>> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> successes;
    std::vector<std::string> fragments;
    std::vector<std::string> replies;
    std::vector<SessionSummary> last_sessions;
    SessionStats last_stats;
    std::vector<std::pair<std::string, std::string>> last_config;

    void show_thinking() override { events.push_back("thinking"); }
    void show_fragment(const std::string& fragment) override {
        fragments.push_back(fragment);
        events.push_back("fragment:" + fragment);
    }
    void end_stream() override { events.push_back("end_stream"); }
    void show_reply(const std::string& text) override {
        replies.push_back(text);
        events.push_back("reply:" + text);
    }
    void show_error(ErrorKind kind, const std::string& message) override {
        errors.emplace_back(kind, message);
        events.push_back("error:" + message);
    }
    void show_warning(const std::string& message) override {
        warnings.push_back(message);
        events.push_back("warning:" + message);
    }
    void show_success(const std::string& message) override {
        successes.push_back(message);
        events.push_back("success:" + message);
    }
    void show_info(const std::string& message) override { events.push_back("info:" + message); }
    void show_help() override { events.push_back("help"); }
    void show_sessions(const std::vector<SessionSummary>& sessions) override {
        last_sessions = sessions;
        events.push_back("sessions");
    }
    void show_stats(const SessionStats& stats) override {
        last_stats = stats;
        events.push_back("stats");
    }
    void show_history(const std::string& session, const std::vector<Message>&) override {
        events.push_back("history:" + session);
    }
    void show_config(const std::vector<std::pair<std::string, std::string>>& entries) override {
        last_config = entries;
        events.push_back("config");
    }
    void show_file_preview(const std::string& path, const std::string&) override {
        events.push_back("preview:" + path);
    }
};

// Answers prompts from a queue; nullopt once the script runs out.
class ScriptedInput : public LineInput {
public:
    std::deque<std::string> answers;
    std::vector<std::string> prompts;

    std::optional<std::string> read_line(const std::string& prompt) override {
        return next(prompt);
    }
    std::optional<std::string> read_secret(const std::string& prompt) override {
        return next(prompt);
    }

private:
    std::optional<std::string> next(const std::string& prompt) {
        prompts.push_back(prompt);
        if (answers.empty()) {
            return std::nullopt;
        }
        std::string answer = answers.front();
        answers.pop_front();
        return answer;
    }
};

// Replays a fixed list of fragments, optionally failing after some of them.
class FakeStream : public FragmentStream {
public:
    FakeStream(std::vector<std::string> fragments, int fail_after = -1, bool cancel_at_end = false)
        : fragments_(std::move(fragments)), fail_after_(fail_after), cancel_at_end_(cancel_at_end) {}

    std::optional<std::string> next() override {
        ++pulls;
        if (fail_after_ >= 0 && index_ == static_cast<std::size_t>(fail_after_)) {
            throw ServiceError("connection reset");
        }
        if (index_ >= fragments_.size()) {
            cancelled_ = cancel_at_end_;
            return std::nullopt;
        }
        return fragments_[index_++];
    }

    bool was_cancelled() const override { return cancelled_; }

    int pulls = 0;

private:
    std::vector<std::string> fragments_;
    std::size_t index_ = 0;
    int fail_after_;
    bool cancel_at_end_;
    bool cancelled_ = false;
};

// In-memory model service with scripted replies.
class FakeModelService : public IModelService {
public:
    bool configured = true;
    std::string reply = "Hi there";
    std::vector<std::string> stream_fragments;
    int stream_fail_after = -1;
    bool fail_open = false;
    bool fail_complete = false;
    bool cancel_complete = false;

    std::vector<std::vector<ApiMessage>> requests;
    std::vector<int> max_tokens_seen;
    std::string key = "sk-test";
    std::string url = "https://api.example.com";
    std::string model_name = "test-model";

    bool is_configured() const override { return configured; }

    std::optional<std::string> complete(const std::vector<ApiMessage>& messages,
                                        double,
                                        int max_tokens,
                                        CancelCallback) override {
        requests.push_back(messages);
        max_tokens_seen.push_back(max_tokens);
        if (fail_complete) {
            throw ServiceError("HTTP 401: invalid api key");
        }
        if (cancel_complete) {
            return std::nullopt;
        }
        return reply;
    }

    std::unique_ptr<FragmentStream> open_stream(const std::vector<ApiMessage>& messages,
                                                double,
                                                int max_tokens,
                                                CancelCallback) override {
        requests.push_back(messages);
        max_tokens_seen.push_back(max_tokens);
        if (fail_open) {
            throw ServiceError("HTTP 500: server error");
        }
        return std::make_unique<FakeStream>(stream_fragments, stream_fail_after);
    }

    bool validate_connection() override { return configured; }

    void update_config(const std::string& api_key,
                       const std::string& base_url,
                       const std::string& model) override {
        if (!api_key.empty()) key = api_key;
        if (!base_url.empty()) url = base_url;
        if (!model.empty()) model_name = model;
    }

    std::string api_key() const override { return key; }
    std::string base_url() const override { return url; }
    std::string model() const override { return model_name; }
};

// Unique scratch directory, removed with its contents on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("llmchat_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

} // namespace llmchat_test
