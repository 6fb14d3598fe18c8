#pragma once

/**
 * Runtime settings for llmchat.
 *
 * Settings come from the process environment, optionally seeded from a
 * .env file, and can be overridden at runtime with /config set.
 */

#include "config.hpp"
#include "errors.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace llmchat {

/**
 * Every tunable of the chat client.
 */
struct Settings {
    // Connection.
    std::string api_key;
    std::string base_url = DEFAULT_BASE_URL;
    std::string model = DEFAULT_MODEL;

    // Conversation.
    std::string system_prompt = DEFAULT_SYSTEM_PROMPT;  // Empty sends no system message.
    std::size_t max_context_messages = DEFAULT_MAX_CONTEXT_MESSAGES;
    std::size_t max_history_messages = DEFAULT_MAX_HISTORY_MESSAGES;
    int max_tokens = DEFAULT_MAX_TOKENS;
    double temperature = DEFAULT_TEMPERATURE;
    bool streaming_enabled = DEFAULT_STREAMING;
    bool confirm_before_send = DEFAULT_CONFIRM_BEFORE_SEND;
    std::size_t auto_save_interval = DEFAULT_AUTO_SAVE_INTERVAL;  // 0 disables auto-save.

    // Storage.
    std::string history_file = HISTORY_FILE;
};

/**
 * Settings plus the problems found while reading them.
 */
struct SettingsLoad {
    Settings settings;
    std::vector<std::string> warnings;  // One line per ignored value.
};

// Reads KEY=VALUE lines from a .env file and exports the ones not already set.
// Returns the number of variables exported; a missing file exports nothing.
std::size_t load_env_file(const std::string& path);

// Builds settings from the environment variables named in config.hpp.
// Malformed values keep their default and produce a warning.
SettingsLoad load_settings_from_environment();

// Validates and applies one override by option name (see setting_names()).
OpResult apply_setting(Settings& settings, const std::string& key, const std::string& value);

// Option names accepted by apply_setting, in display order.
const std::vector<std::string>& setting_names();

// Name/value pairs for /config show, with the API key redacted.
std::vector<std::pair<std::string, std::string>> describe_settings(const Settings& settings);

} // namespace llmchat
