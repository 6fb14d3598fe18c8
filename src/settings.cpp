#include "settings.hpp"
#include "text_util.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

namespace llmchat {

// ========== Value Parsing ==========

static std::optional<bool> parse_bool(const std::string& raw) {
    std::string value = to_lower(trim(raw));
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    return std::nullopt;
}

static std::optional<std::size_t> parse_count(const std::string& raw) {
    std::string value = trim(raw);
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static std::optional<double> parse_double(const std::string& raw) {
    std::string value = trim(raw);
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static std::string format_double(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// ========== .env ==========

std::size_t load_env_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        verbose_log("CONFIG", "No env file at " + path);
        return 0;
    }

    std::size_t exported = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) {
            continue;
        }

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment.
            size_t hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trim(value.substr(0, hash));
            }
        }

        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++exported;
        }
    }

    verbose_log("CONFIG", "Loaded " + std::to_string(exported) + " variable(s) from " + path);
    return exported;
}

// ========== Environment ==========

SettingsLoad load_settings_from_environment() {
    SettingsLoad load;
    Settings& s = load.settings;

    auto read = [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };

    if (auto v = read(env::API_KEY)) s.api_key = trim(*v);
    if (auto v = read(env::BASE_URL); v && !trim(*v).empty()) s.base_url = trim(*v);
    if (auto v = read(env::MODEL); v && !trim(*v).empty()) s.model = trim(*v);
    if (auto v = read(env::SYSTEM_PROMPT)) s.system_prompt = *v;
    if (auto v = read(env::HISTORY_FILE); v && !trim(*v).empty()) s.history_file = trim(*v);

    // Every remaining variable goes through the same validation as /config set.
    const std::pair<const char*, const char*> overrides[] = {
        {env::MAX_CONTEXT_MESSAGES, "max_context_messages"},
        {env::MAX_HISTORY_MESSAGES, "max_history_messages"},
        {env::MAX_TOKENS, "max_tokens"},
        {env::TEMPERATURE, "temperature"},
        {env::STREAMING_MODE, "streaming_enabled"},
        {env::CONFIRM_BEFORE_SEND, "confirm_before_send"},
        {env::AUTO_SAVE_INTERVAL, "auto_save_interval"},
    };
    for (const auto& [var, option] : overrides) {
        auto value = read(var);
        if (!value) {
            continue;
        }
        OpResult applied = apply_setting(s, option, *value);
        if (!applied.success()) {
            load.warnings.push_back(std::string(var) + ": " + applied.message + ", using default");
        }
    }

    verbose_log("CONFIG", "model=" + s.model + " base_url=" + s.base_url +
                " api_key=" + redact_secret(s.api_key));
    return load;
}

// ========== Overrides ==========

const std::vector<std::string>& setting_names() {
    static const std::vector<std::string> names = {
        "system_prompt",
        "max_context_messages",
        "max_history_messages",
        "max_tokens",
        "temperature",
        "streaming_enabled",
        "confirm_before_send",
        "auto_save_interval",
        "model",
        "base_url",
    };
    return names;
}

OpResult apply_setting(Settings& settings, const std::string& key, const std::string& value) {
    const std::string option = to_lower(trim(key));

    if (option == "system_prompt") {
        settings.system_prompt = value;
    } else if (option == "model" || option == "base_url") {
        std::string v = trim(value);
        if (v.empty()) {
            return OpResult::fail(ErrorKind::InvalidOperation, option + " cannot be empty");
        }
        (option == "model" ? settings.model : settings.base_url) = v;
    } else if (option == "max_context_messages" || option == "max_history_messages") {
        auto n = parse_count(value);
        if (!n || *n == 0) {
            return OpResult::fail(ErrorKind::InvalidOperation,
                                  option + " must be a positive integer, got '" + value + "'");
        }
        (option == "max_context_messages" ? settings.max_context_messages
                                          : settings.max_history_messages) = *n;
    } else if (option == "max_tokens") {
        auto n = parse_count(value);
        if (!n || *n == 0 || *n > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            return OpResult::fail(ErrorKind::InvalidOperation,
                                  "max_tokens must be a positive integer, got '" + value + "'");
        }
        settings.max_tokens = static_cast<int>(*n);
    } else if (option == "temperature") {
        auto t = parse_double(value);
        if (!t || *t < 0.0 || *t > 2.0) {
            return OpResult::fail(ErrorKind::InvalidOperation,
                                  "temperature must be a number between 0 and 2, got '" + value + "'");
        }
        settings.temperature = *t;
    } else if (option == "streaming_enabled" || option == "confirm_before_send") {
        auto b = parse_bool(value);
        if (!b) {
            return OpResult::fail(ErrorKind::InvalidOperation,
                                  option + " must be true or false, got '" + value + "'");
        }
        (option == "streaming_enabled" ? settings.streaming_enabled
                                       : settings.confirm_before_send) = *b;
    } else if (option == "auto_save_interval") {
        auto n = parse_count(value);
        if (!n) {
            return OpResult::fail(ErrorKind::InvalidOperation,
                                  "auto_save_interval must be a non-negative integer, got '" + value + "'");
        }
        settings.auto_save_interval = *n;
    } else {
        return OpResult::fail(ErrorKind::InvalidOperation, "Unknown option: " + key);
    }

    verbose_log("CONFIG", "Set " + option);
    return OpResult::ok();
}

std::vector<std::pair<std::string, std::string>> describe_settings(const Settings& settings) {
    auto flag = [](bool b) { return std::string(b ? "true" : "false"); };
    return {
        {"api_key", redact_secret(settings.api_key)},
        {"base_url", settings.base_url},
        {"model", settings.model},
        {"system_prompt", settings.system_prompt.empty() ? "(none)" : settings.system_prompt},
        {"max_context_messages", std::to_string(settings.max_context_messages)},
        {"max_history_messages", std::to_string(settings.max_history_messages)},
        {"max_tokens", std::to_string(settings.max_tokens)},
        {"temperature", format_double(settings.temperature)},
        {"streaming_enabled", flag(settings.streaming_enabled)},
        {"confirm_before_send", flag(settings.confirm_before_send)},
        {"auto_save_interval", std::to_string(settings.auto_save_interval)},
        {"history_file", settings.history_file},
    };
}

} // namespace llmchat
