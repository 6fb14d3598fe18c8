#include "console_presenter.hpp"
#include <cctype>

namespace llmchat {

namespace {
    std::string upper(std::string s) {
        for (auto& c : s) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return s;
    }

    const char* HELP_TEXT = R"(# llmchat - Interactive Chat Tool

Type your message and press Enter to chat.

**Commands:**

- `/help` - Show this help message
- `/history` - Show conversation history
- `/stats` - Show conversation statistics
- `/clear` - Clear conversation history
- `/system [text]` - Show or set the system prompt
- `/stream` - Toggle streaming mode
- `/session [list|switch|new|delete|rename]` - Manage sessions
- `/config` - Configure API key, base URL and model
- `/config show` - Show all settings
- `/config set <option> <value>` - Change one setting
- `/exit`, `/quit` - Save and exit

**Input tips:**

- `@filename` - Load a message from a file (shows content first)
- `@` - Load from the default file (input.txt)
)";
}

ConsolePresenter::ConsolePresenter(Console& console)
    : console_(console), renderer_(console.colors_enabled()) {
}

void ConsolePresenter::clear_thinking() {
    if (thinking_) {
        console_.clear_status();
        thinking_ = false;
    }
}

void ConsolePresenter::print_reply_label() {
    console_.print_colored("Assistant:", ansi::GREEN);
    console_.println();
}

// ========== Model Output ==========

void ConsolePresenter::show_thinking() {
    console_.start_status("Thinking...");
    thinking_ = true;
    stream_started_ = false;
}

void ConsolePresenter::show_fragment(const std::string& fragment) {
    clear_thinking();
    if (!stream_started_) {
        print_reply_label();
        stream_started_ = true;
    }
    console_.print_raw(fragment);
    console_.flush();
}

void ConsolePresenter::end_stream() {
    clear_thinking();
    if (stream_started_) {
        console_.println();
        console_.println();
    }
    stream_started_ = false;
}

void ConsolePresenter::show_reply(const std::string& text) {
    clear_thinking();
    print_reply_label();
    console_.print(renderer_.render(text));
    console_.println();
}

// ========== Status ==========

void ConsolePresenter::show_error(ErrorKind kind, const std::string& message) {
    clear_thinking();
    if (kind == ErrorKind::UnknownCommand) {
        console_.print_error(message + " (type /help for commands)");
        return;
    }
    console_.print_error("✗ Error: " + message);
}

void ConsolePresenter::show_warning(const std::string& message) {
    clear_thinking();
    console_.print_warning(message);
}

void ConsolePresenter::show_success(const std::string& message) {
    console_.print_success(message);
}

void ConsolePresenter::show_info(const std::string& message) {
    console_.print_info(message);
}

// ========== Query Results ==========

void ConsolePresenter::show_help() {
    console_.print_panel("Welcome", renderer_.render(HELP_TEXT));
}

void ConsolePresenter::show_sessions(const std::vector<SessionSummary>& sessions) {
    std::vector<std::vector<std::string>> rows;
    for (const auto& s : sessions) {
        rows.push_back({s.name, std::to_string(s.message_count), s.active ? "✓" : ""});
    }
    console_.print_table("Available Sessions", {"Name", "Messages", "Active"}, rows);
}

void ConsolePresenter::show_stats(const SessionStats& stats) {
    console_.print_table("Session Statistics: " + stats.name, {"Metric", "Value"}, {
        {"Total Messages", std::to_string(stats.total)},
        {"User Messages", std::to_string(stats.user)},
        {"Assistant Messages", std::to_string(stats.assistant)},
        {"System Messages", std::to_string(stats.system)},
    });
}

void ConsolePresenter::show_history(const std::string& session, const std::vector<Message>& messages) {
    if (messages.empty()) {
        console_.print_warning("No conversation history.");
        return;
    }

    console_.print_panel("History", "CONVERSATION HISTORY: " + session);

    size_t index = 1;
    for (const auto& msg : messages) {
        const std::string timestamp = msg.timestamp.empty() ? "Unknown" : msg.timestamp;
        const char* color = msg.role == Role::Assistant ? ansi::GREEN : ansi::BLUE;

        console_.println();
        console_.print_colored("[" + std::to_string(index++) + "] " +
                               upper(role_to_string(msg.role)) + " (" + timestamp + ")", color);
        console_.println();
        console_.print(renderer_.render(msg.content));
        console_.print_dim(std::string(40, '-'));
    }
}

void ConsolePresenter::show_config(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::vector<std::vector<std::string>> rows;
    for (const auto& [name, value] : entries) {
        rows.push_back({name, value});
    }
    console_.print_table("Current Configuration", {"Option", "Value"}, rows);
}

void ConsolePresenter::show_file_preview(const std::string& path, const std::string& content) {
    console_.println();
    console_.print_warning("File content (" + path + "):");
    console_.print_panel(path, content);
}

} // namespace llmchat
