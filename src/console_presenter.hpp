#pragma once

/**
 * Terminal implementation of the Presenter.
 *
 * Streamed fragments are written raw as they arrive; complete replies and
 * history entries are rendered as markdown. Listings use Console tables.
 */

#include "console.hpp"
#include "markdown_renderer.hpp"
#include "presenter.hpp"

namespace llmchat {

class ConsolePresenter : public Presenter {
public:
    // The console must outlive the presenter.
    explicit ConsolePresenter(Console& console);

    void show_thinking() override;
    void show_fragment(const std::string& fragment) override;
    void end_stream() override;
    void show_reply(const std::string& text) override;

    void show_error(ErrorKind kind, const std::string& message) override;
    void show_warning(const std::string& message) override;
    void show_success(const std::string& message) override;
    void show_info(const std::string& message) override;

    void show_help() override;
    void show_sessions(const std::vector<SessionSummary>& sessions) override;
    void show_stats(const SessionStats& stats) override;
    void show_history(const std::string& session, const std::vector<Message>& messages) override;
    void show_config(const std::vector<std::pair<std::string, std::string>>& entries) override;
    void show_file_preview(const std::string& path, const std::string& content) override;

private:
    Console& console_;
    MarkdownRenderer renderer_;
    bool thinking_ = false;         // "Thinking..." status line is showing.
    bool stream_started_ = false;   // Reply label printed for the current stream.

    void clear_thinking();
    void print_reply_label();
};

} // namespace llmchat
