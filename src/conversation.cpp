#include "conversation.hpp"
#include "presenter.hpp"
#include "verbose.hpp"

namespace llmchat {

ConversationOrchestrator::ConversationOrchestrator(ChatSessionManager& manager,
                                                   IModelService* service,
                                                   Presenter& presenter,
                                                   const Settings& settings)
    : manager_(manager), service_(service), presenter_(presenter), settings_(settings) {
}

TurnOutcome ConversationOrchestrator::send(const std::string& user_text, CancelCallback cancel_check) {
    TurnOutcome outcome;

    if (service_ == nullptr || !service_->is_configured()) {
        outcome.error = ErrorKind::NotConfigured;
        outcome.error_message = "API key not configured. Use /config to set it.";
        presenter_.show_error(ErrorKind::NotConfigured, outcome.error_message);
        return outcome;
    }

    manager_.add_message(Role::User, user_text);
    state_ = TurnState::AwaitingModel;

    ChatRequest request;
    request.messages = manager_.get_context();
    if (!settings_.system_prompt.empty()) {
        request.system_prompt = settings_.system_prompt;
    }
    request.temperature = settings_.temperature;
    request.max_tokens = settings_.max_tokens;
    request.stream = settings_.streaming_enabled;

    verbose_log("CHAT", "Sending " + std::to_string(request.messages.size()) +
                " context message(s) from session " + manager_.current_session() +
                (request.stream ? " (streaming)" : ""));

    presenter_.show_thinking();
    ChatResult result = service_->chat(request, presenter_, std::move(cancel_check));

    if (result.cancelled) {
        verbose_log("CHAT", "Turn cancelled, discarding " + std::to_string(result.text.size()) +
                    " byte(s) of partial reply");
        presenter_.show_warning("Request cancelled.");
        outcome.cancelled = true;
        state_ = TurnState::Idle;
        return outcome;
    }

    if (result.error) {
        outcome.state = TurnState::Failed;
        outcome.error = result.error;
        outcome.error_message = result.error_message;
        if (!result.error_reported) {
            presenter_.show_error(*result.error, result.error_message);
        }
        state_ = TurnState::Idle;
        return outcome;
    }

    if (!request.stream) {
        presenter_.show_reply(result.text);
    }

    manager_.add_message(Role::Assistant, result.text);
    outcome.state = TurnState::Success;
    outcome.reply = std::move(result.text);

    const std::size_t interval = settings_.auto_save_interval;
    if (interval > 0 && manager_.current_size() % interval == 0) {
        OpResult saved = manager_.save();
        if (saved.success()) {
            outcome.autosaved = true;
            verbose_log("CHAT", "Auto-saved after " + std::to_string(manager_.current_size()) + " messages");
        } else {
            presenter_.show_warning("Auto-save failed: " + saved.message);
        }
    }

    state_ = TurnState::Idle;
    return outcome;
}

} // namespace llmchat
