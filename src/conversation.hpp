#pragma once

/**
 * Conversation orchestration.
 *
 * Runs one user turn end to end: record the user message, build the
 * context window, call the model service, record the reply and decide
 * whether to auto-save.
 */

#include "chat_manager.hpp"
#include "errors.hpp"
#include "model_service.hpp"
#include "settings.hpp"
#include <optional>
#include <string>

namespace llmchat {

class Presenter;

enum class TurnState {
    Idle,           // No request in flight.
    AwaitingModel,  // User message recorded, waiting on the service.
    Success,        // Reply recorded.
    Failed          // Service failed; only the user message was recorded.
};

/**
 * What happened during one send().
 */
struct TurnOutcome {
    TurnState state = TurnState::Idle;
    std::optional<ErrorKind> error;
    std::string error_message;
    std::string reply;       // Recorded assistant text (empty unless Success).
    bool cancelled = false;
    bool autosaved = false;  // True if this turn triggered a save.

    bool success() const { return state == TurnState::Success; }
};

class ConversationOrchestrator {
public:
    // All collaborators must outlive the orchestrator. The service may be
    // null, in which case every send() reports NotConfigured.
    ConversationOrchestrator(ChatSessionManager& manager,
                             IModelService* service,
                             Presenter& presenter,
                             const Settings& settings);

    // Runs one turn. Always returns to Idle before returning.
    TurnOutcome send(const std::string& user_text, CancelCallback cancel_check = nullptr);

    TurnState state() const { return state_; }

private:
    ChatSessionManager& manager_;
    IModelService* service_;
    Presenter& presenter_;
    const Settings& settings_;
    TurnState state_ = TurnState::Idle;
};

} // namespace llmchat
