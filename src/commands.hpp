#pragma once

/**
 * Slash command handling.
 *
 * Parses "/command [args]" lines and applies them to the session manager,
 * the runtime settings and the model service. All user-visible output goes
 * through the presenter.
 */

#include "chat_manager.hpp"
#include "errors.hpp"
#include "model_service.hpp"
#include "settings.hpp"
#include <optional>
#include <string>

namespace llmchat {

class LineInput;
class Presenter;

/**
 * Outcome of one command line.
 */
struct CommandResult {
    bool exit_requested = false;     // /exit or /quit.
    std::optional<ErrorKind> error;  // Set when the command was rejected or failed.
};

/**
 * A command line split into its parts.
 */
struct ParsedCommand {
    std::string name;  // Lowercased command word including '/', e.g. "/session".
    std::string args;  // Remainder with surrounding whitespace removed.
};

// True if the line is a command (starts with '/').
bool is_command(const std::string& line);

// Splits "/Cmd  some args " into {"/cmd", "some args"}.
ParsedCommand parse_command(const std::string& line);

class CommandProcessor {
public:
    // All collaborators must outlive the processor. The service may be null.
    CommandProcessor(ChatSessionManager& manager,
                     IModelService* service,
                     Settings& settings,
                     Presenter& presenter,
                     LineInput& input);

    // Runs one command line. Unknown commands are reported as
    // UnknownCommand and change nothing.
    CommandResult execute(const std::string& line);

private:
    ChatSessionManager& manager_;
    IModelService* service_;
    Settings& settings_;
    Presenter& presenter_;
    LineInput& input_;

    CommandResult handle_system(const std::string& args);
    CommandResult handle_stream();
    CommandResult handle_clear();
    CommandResult handle_session(const std::string& args);
    CommandResult handle_config(const std::string& args);
    CommandResult handle_config_interactive();
    CommandResult handle_config_set(const std::string& args);

    // Reports a failed OpResult, or the success message.
    CommandResult report(const OpResult& result, const std::string& success_message);
    CommandResult usage(const std::string& text);
};

} // namespace llmchat
