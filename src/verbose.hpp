#pragma once

/**
 * Verbose logging utility for llmchat.
 *
 * Writes categorized debug lines to stderr (HTTP traffic, SSE events,
 * session persistence, configuration) when -v/--verbose is given or
 * LLMCHAT_VERBOSE is set. User-facing messages never go through here;
 * they are the presenter's job.
 */

#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>

namespace llmchat {

/**
 * Global verbose mode flag.
 */
inline bool g_verbose = false;

inline void set_verbose(bool enabled) {
    g_verbose = enabled;
}

inline bool is_verbose() {
    return g_verbose;
}

/**
 * Wall-clock time of day with milliseconds, e.g. "14:03:27.512".
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

namespace detail {

inline void write_log_line(const char* color, const std::string& tag, const std::string& message) {
    std::cerr << "\033[90m[" << timestamp() << "] " << color << "[" << tag << "]\033[0m "
              << message << std::endl;
}

} // namespace detail

// General progress message.
inline void verbose_log(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::write_log_line("\033[36m", category, message);
}

// Outgoing data (requests, writes).
inline void verbose_out(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::write_log_line("\033[33m", category + " >>>", message);
}

// Incoming data (responses, reads).
inline void verbose_in(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::write_log_line("\033[32m", category + " <<<", message);
}

// Failures. The presenter reports them to the user separately.
inline void verbose_err(const std::string& category, const std::string& message) {
    if (!g_verbose) return;
    detail::write_log_line("\033[31m", category + " ERR", message);
}

/**
 * Truncate long content for display.
 */
inline std::string truncate(const std::string& s, size_t max_len = 200) {
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len) + "... (" + std::to_string(s.length()) + " bytes total)";
}

/**
 * Mask a credential so only its first few characters are visible.
 * Used for the /config display and for logged request headers.
 */
inline std::string redact_secret(const std::string& secret, size_t visible = 8) {
    if (secret.empty()) return "(not set)";
    if (secret.length() <= visible) return std::string(secret.length(), '*');
    return secret.substr(0, visible) + "...";
}

/**
 * Collapse whitespace outside of string literals so a JSON body fits on
 * one log line, then truncate it.
 */
inline std::string format_json_compact(const std::string& json_str, size_t max_len = 500) {
    std::string compact;
    compact.reserve(json_str.size());
    bool in_string = false;
    bool last_was_space = false;

    for (char c : json_str) {
        if (c == '"' && (compact.empty() || compact.back() != '\\')) {
            in_string = !in_string;
        }

        if (in_string) {
            compact += c;
            last_was_space = false;
        } else if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!last_was_space) {
                compact += ' ';
                last_was_space = true;
            }
        } else {
            compact += c;
            last_was_space = false;
        }
    }

    return truncate(compact, max_len);
}

} // namespace llmchat
