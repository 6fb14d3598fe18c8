#include "chat_app.hpp"
#include "chat_manager.hpp"
#include "commands.hpp"
#include "console.hpp"
#include "console_presenter.hpp"
#include "conversation.hpp"
#include "file_input.hpp"
#include "input_editor.hpp"
#include "model_service.hpp"
#include "session_store.hpp"
#include "text_util.hpp"

#include <atomic>
#include <csignal>
#include <signal.h>

namespace llmchat {

// ========== Interrupt Handling ==========

static std::atomic<bool> g_interrupted{false};

static void interrupt_handler(int) {
    g_interrupted.store(true);
}

void install_interrupt_handler() {
    struct sigaction action {};
    action.sa_handler = interrupt_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // No SA_RESTART: let read() fail with EINTR.
    sigaction(SIGINT, &action, nullptr);
}

bool interrupt_requested() {
    return g_interrupted.load();
}

void clear_interrupt() {
    g_interrupted.store(false);
}

// ========== Application ==========

ChatApp::ChatApp(Settings& settings, Console& console, LineInput& input, IModelService* service)
    : settings_(settings), console_(console), input_(input), service_(service) {
}

int ChatApp::run() {
    ConsolePresenter presenter(console_);

    SessionStore store(settings_.history_file);
    LoadResult loaded = store.open();
    if (loaded.failed()) {
        presenter.show_error(ErrorKind::PersistenceError, "Error loading history: " + loaded.error);
    }

    ChatSessionManager manager(store, {settings_.max_context_messages, settings_.max_history_messages});
    ConversationOrchestrator conversation(manager, service_, presenter, settings_);
    CommandProcessor commands(manager, service_, settings_, presenter, input_);

    presenter.show_help();
    if (service_ == nullptr || !service_->is_configured()) {
        presenter.show_warning("API key not set. Use /config to configure it.");
    }
    presenter.show_info("Session: " + manager.current_session());

    const CancelCallback cancel_check = [] { return interrupt_requested(); };

    while (true) {
        clear_interrupt();
        std::optional<std::string> line = input_.read_line("You: ");
        if (!line) {
            break;
        }

        if (interrupt_requested()) {
            presenter.show_warning("Interrupted. Type /exit to quit.");
            continue;
        }

        std::string text = trim(*line);
        if (text.empty()) {
            continue;
        }

        if (is_file_reference(text)) {
            std::optional<std::string> content =
                load_file_message(text, settings_.confirm_before_send, input_, presenter);
            if (content) {
                conversation.send(*content, cancel_check);
            }
            continue;
        }

        if (is_command(text)) {
            if (commands.execute(text).exit_requested) {
                break;
            }
            continue;
        }

        conversation.send(text, cancel_check);
    }

    OpResult saved = manager.save();
    if (saved.success()) {
        presenter.show_success("Chat history saved.");
    } else {
        presenter.show_error(ErrorKind::PersistenceError, saved.message);
    }
    presenter.show_success("Goodbye!");
    return saved.success() ? 0 : 1;
}

} // namespace llmchat
