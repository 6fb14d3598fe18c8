#pragma once

/**
 * Application configuration constants.
 *
 * Default values for every runtime setting, file locations, and the
 * environment variable names the settings loader reads.
 */

#include <cstddef>

namespace llmchat {

// ========== File Paths ==========

constexpr const char* HISTORY_FILE = ".chat_history";     // Persisted session document.
constexpr const char* DEFAULT_INPUT_FILE = "input.txt";   // File used by a bare "@".
constexpr const char* ENV_FILE = ".env";                  // Optional KEY=VALUE file.

// ========== API Configuration ==========

constexpr const char* DEFAULT_BASE_URL = "https://api.deepseek.com";
constexpr const char* DEFAULT_MODEL = "deepseek-chat";
constexpr const char* CHAT_COMPLETIONS_PATH = "/chat/completions";

constexpr long CONNECT_TIMEOUT_SECONDS = 30;
constexpr long LOW_SPEED_TIME_SECONDS = 120;   // Abort when below 1 byte/s this long.

// Probe used by validate_connection().
constexpr const char* PROBE_MESSAGE = "Hello";
constexpr int PROBE_MAX_TOKENS = 10;

// ========== Conversation Defaults ==========

constexpr const char* DEFAULT_SYSTEM_PROMPT = "You are a helpful assistant";
constexpr std::size_t DEFAULT_MAX_CONTEXT_MESSAGES = 20;    // Sent to the model per request.
constexpr std::size_t DEFAULT_MAX_HISTORY_MESSAGES = 1000;  // Kept in local storage.
constexpr int DEFAULT_MAX_TOKENS = 4096;
constexpr double DEFAULT_TEMPERATURE = 0.7;
constexpr bool DEFAULT_STREAMING = true;
constexpr bool DEFAULT_CONFIRM_BEFORE_SEND = true;
constexpr std::size_t DEFAULT_AUTO_SAVE_INTERVAL = 4;

// ========== Environment Variables ==========

namespace env {
    constexpr const char* API_KEY = "OPENAI_API_KEY";
    constexpr const char* BASE_URL = "OPENAI_BASE_URL";
    constexpr const char* MODEL = "LLM_MODEL";
    constexpr const char* SYSTEM_PROMPT = "SYSTEM_PROMPT";
    constexpr const char* MAX_CONTEXT_MESSAGES = "MAX_CONTEXT_MESSAGES";
    constexpr const char* MAX_HISTORY_MESSAGES = "MAX_HISTORY_MESSAGES";
    constexpr const char* MAX_TOKENS = "MAX_TOKENS";
    constexpr const char* TEMPERATURE = "TEMPERATURE";
    constexpr const char* STREAMING_MODE = "STREAMING_MODE";
    constexpr const char* CONFIRM_BEFORE_SEND = "CONFIRM_BEFORE_SEND";
    constexpr const char* AUTO_SAVE_INTERVAL = "AUTO_SAVE_INTERVAL";
    constexpr const char* HISTORY_FILE = "HISTORY_FILE";
    constexpr const char* VERBOSE = "LLMCHAT_VERBOSE";
}

} // namespace llmchat
