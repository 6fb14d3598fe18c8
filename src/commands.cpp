#include "commands.hpp"
#include "input_editor.hpp"
#include "presenter.hpp"
#include "text_util.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace llmchat {

namespace {
    // Splits at the first run of whitespace: "a b c" -> {"a", "b c"}.
    std::pair<std::string, std::string> split_first(const std::string& s) {
        std::string t = trim(s);
        auto space = std::find_if(t.begin(), t.end(), [](unsigned char c) { return std::isspace(c); });
        std::string head(t.begin(), space);
        std::string tail = trim(std::string(space, t.end()));
        return {head, tail};
    }

    std::vector<std::string> split_words(const std::string& s) {
        std::vector<std::string> words;
        std::istringstream stream(s);
        std::string word;
        while (stream >> word) {
            words.push_back(word);
        }
        return words;
    }
}

bool is_command(const std::string& line) {
    std::string t = trim(line);
    return !t.empty() && t[0] == '/';
}

ParsedCommand parse_command(const std::string& line) {
    auto [name, args] = split_first(line);
    return {to_lower(name), args};
}

CommandProcessor::CommandProcessor(ChatSessionManager& manager,
                                   IModelService* service,
                                   Settings& settings,
                                   Presenter& presenter,
                                   LineInput& input)
    : manager_(manager)
    , service_(service)
    , settings_(settings)
    , presenter_(presenter)
    , input_(input) {
}

CommandResult CommandProcessor::execute(const std::string& line) {
    ParsedCommand cmd = parse_command(line);
    verbose_log("CHAT", "Command " + cmd.name + (cmd.args.empty() ? "" : " " + cmd.args));

    if (cmd.name == "/help") {
        presenter_.show_help();
    } else if (cmd.name == "/history") {
        presenter_.show_history(manager_.current_session(), manager_.history());
    } else if (cmd.name == "/stats") {
        presenter_.show_stats(manager_.stats());
    } else if (cmd.name == "/clear") {
        return handle_clear();
    } else if (cmd.name == "/system") {
        return handle_system(cmd.args);
    } else if (cmd.name == "/stream") {
        return handle_stream();
    } else if (cmd.name == "/session") {
        return handle_session(cmd.args);
    } else if (cmd.name == "/config") {
        return handle_config(cmd.args);
    } else if (cmd.name == "/exit" || cmd.name == "/quit") {
        CommandResult result;
        result.exit_requested = true;
        return result;
    } else {
        presenter_.show_error(ErrorKind::UnknownCommand, "Unknown command: " + cmd.name);
        CommandResult result;
        result.error = ErrorKind::UnknownCommand;
        return result;
    }

    return {};
}

CommandResult CommandProcessor::report(const OpResult& result, const std::string& success_message) {
    if (!result.success()) {
        presenter_.show_error(*result.error, result.message);
        CommandResult failed;
        failed.error = result.error;
        return failed;
    }
    presenter_.show_success(success_message);
    return {};
}

CommandResult CommandProcessor::usage(const std::string& text) {
    presenter_.show_error(ErrorKind::InvalidOperation, "Usage: " + text);
    CommandResult result;
    result.error = ErrorKind::InvalidOperation;
    return result;
}

// ========== Conversation ==========

CommandResult CommandProcessor::handle_clear() {
    return report(manager_.clear_history(), "Conversation history cleared.");
}

CommandResult CommandProcessor::handle_system(const std::string& args) {
    if (args.empty()) {
        presenter_.show_info("Current system prompt: " +
                             (settings_.system_prompt.empty() ? std::string("(none)")
                                                              : settings_.system_prompt));
        return {};
    }
    settings_.system_prompt = args;
    presenter_.show_success("System prompt updated.");
    return {};
}

CommandResult CommandProcessor::handle_stream() {
    settings_.streaming_enabled = !settings_.streaming_enabled;
    presenter_.show_success(std::string("Streaming mode ") +
                            (settings_.streaming_enabled ? "enabled" : "disabled"));
    return {};
}

// ========== Sessions ==========

CommandResult CommandProcessor::handle_session(const std::string& args) {
    auto [sub, rest] = split_first(args);
    sub = to_lower(sub);

    if (sub.empty() || sub == "list") {
        presenter_.show_sessions(manager_.list_sessions());
        return {};
    }

    if (sub == "switch") {
        if (rest.empty()) {
            return usage("/session switch <name>");
        }
        manager_.switch_session(rest);
        presenter_.show_success("Switched to session: " + rest);
        return {};
    }

    if (sub == "new") {
        std::optional<std::string> requested;
        if (!rest.empty()) {
            requested = rest;
        }
        std::string name = manager_.new_session(requested);
        presenter_.show_success("Created and switched to new session: " + name);
        return {};
    }

    if (sub == "delete") {
        if (rest.empty()) {
            return usage("/session delete <name>");
        }
        return report(manager_.delete_session(rest), "Session '" + rest + "' deleted.");
    }

    if (sub == "rename") {
        std::vector<std::string> names = split_words(rest);
        if (names.size() != 2) {
            return usage("/session rename <old> <new>");
        }
        return report(manager_.rename_session(names[0], names[1]),
                      "Session renamed from '" + names[0] + "' to '" + names[1] + "'.");
    }

    presenter_.show_error(ErrorKind::UnknownCommand, "Unknown session subcommand: " + sub);
    CommandResult result;
    result.error = ErrorKind::UnknownCommand;
    return result;
}

// ========== Configuration ==========

CommandResult CommandProcessor::handle_config(const std::string& args) {
    auto [sub, rest] = split_first(args);
    sub = to_lower(sub);

    if (sub.empty()) {
        return handle_config_interactive();
    }
    if (sub == "show") {
        presenter_.show_config(describe_settings(settings_));
        return {};
    }
    if (sub == "set") {
        return handle_config_set(rest);
    }
    return usage("/config [show | set <option> <value>]");
}

CommandResult CommandProcessor::handle_config_interactive() {
    presenter_.show_config({
        {"api_key", redact_secret(settings_.api_key)},
        {"base_url", settings_.base_url},
        {"model", settings_.model},
    });
    presenter_.show_warning("Enter new values (leave empty to keep current):");

    std::string api_key = trim(input_.read_secret("API Key: ").value_or(""));
    std::string base_url = trim(input_.read_line("Base URL: ").value_or(""));
    std::string model = trim(input_.read_line("Model: ").value_or(""));

    if (!api_key.empty()) settings_.api_key = api_key;
    if (!base_url.empty()) settings_.base_url = base_url;
    if (!model.empty()) settings_.model = model;

    if (service_ == nullptr) {
        presenter_.show_error(ErrorKind::NotConfigured, "No model service available.");
        CommandResult result;
        result.error = ErrorKind::NotConfigured;
        return result;
    }

    service_->update_config(api_key, base_url, model);
    presenter_.show_success("Configuration updated.");
    return {};
}

CommandResult CommandProcessor::handle_config_set(const std::string& args) {
    auto [option, value] = split_first(args);
    if (option.empty() || value.empty()) {
        std::string names;
        for (const auto& n : setting_names()) {
            names += (names.empty() ? "" : ", ") + n;
        }
        return usage("/config set <option> <value> (options: " + names + ")");
    }

    option = to_lower(option);
    OpResult applied = apply_setting(settings_, option, value);
    if (!applied.success()) {
        return report(applied, "");
    }

    // Propagate to the collaborators that cache a copy.
    if (option == "max_context_messages" || option == "max_history_messages") {
        manager_.set_limits({settings_.max_context_messages, settings_.max_history_messages});
    } else if (service_ != nullptr && option == "model") {
        service_->update_config("", "", settings_.model);
    } else if (service_ != nullptr && option == "base_url") {
        service_->update_config("", settings_.base_url, "");
    }

    presenter_.show_success(option + " updated.");
    return {};
}

} // namespace llmchat
