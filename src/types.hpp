#pragma once

/**
 * Conversation data model.
 *
 * Messages carry a closed Role, their text and an ISO-8601 creation
 * timestamp. ApiMessage is the timestamp-free form sent to the model.
 */

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace llmchat {

enum class Role {
    User,
    Assistant,
    System
};

// "user", "assistant" or "system".
std::string role_to_string(Role role);

// Parses a wire/document role. Returns nullopt for anything else.
std::optional<Role> role_from_string(const std::string& value);

/**
 * One stored message of a session. Immutable once appended.
 */
struct Message {
    Role role;
    std::string content;
    std::string timestamp;  // ISO-8601, local time with microseconds.
};

/**
 * A message as sent to the model (no timestamp).
 */
struct ApiMessage {
    Role role;
    std::string content;

    nlohmann::json to_json() const {
        return {{"role", role_to_string(role)}, {"content", content}};
    }

    bool operator==(const ApiMessage& other) const {
        return role == other.role && content == other.content;
    }
};

/**
 * A named, ordered conversation transcript.
 */
struct Session {
    std::string name;
    std::vector<Message> messages;
};

// Session name -> session. Lexical order doubles as listing order.
using SessionMap = std::map<std::string, Session>;

// Current local time as "YYYY-MM-DDTHH:MM:SS.ffffff".
std::string now_iso8601();

} // namespace llmchat
