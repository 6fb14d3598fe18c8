#pragma once

/**
 * Chat session management.
 *
 * Wraps the SessionStore with the per-request context window and the
 * history retention policy, and answers the read-only queries behind
 * /stats, /history and /session list.
 */

#include "errors.hpp"
#include "session_store.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace llmchat {

/**
 * Message counts for one session.
 */
struct SessionStats {
    std::string name;
    std::size_t total = 0;
    std::size_t user = 0;
    std::size_t assistant = 0;
    std::size_t system = 0;
};

/**
 * One row of the session listing.
 */
struct SessionSummary {
    std::string name;
    std::size_t message_count = 0;
    bool active = false;
};

/**
 * Bounds applied to the current session.
 */
struct ContextLimits {
    std::size_t max_context_messages;  // Messages sent per request.
    std::size_t max_history_messages;  // Messages retained after a trim.
};

class ChatSessionManager {
public:
    // The store must outlive the manager.
    ChatSessionManager(SessionStore& store, ContextLimits limits);

    // Appends a timestamped message to the current session, then trims the
    // session when it has grown past twice the history limit.
    void add_message(Role role, const std::string& content);

    // Last max_context_messages of the current session, oldest first.
    std::vector<ApiMessage> get_context() const;

    // Whole current session without timestamps (export/debug; unbounded).
    std::vector<ApiMessage> get_messages_for_api() const;

    // Empties the current session and persists.
    OpResult clear_history();

    // Activates a session, creating it empty if needed. Never fails.
    void switch_session(const std::string& name);

    // Switches to the given name, or to a generated "session_xxxxxxxx".
    // Returns the name switched to.
    std::string new_session(const std::optional<std::string>& name = std::nullopt);

    OpResult delete_session(const std::string& name);
    OpResult rename_session(const std::string& old_name, const std::string& new_name);

    // Writes all sessions to disk.
    OpResult save() const;

    // ========== Queries ==========

    SessionStats stats() const;
    const std::vector<Message>& history() const;
    std::vector<SessionSummary> list_sessions() const;
    const std::string& current_session() const { return store_.current_name(); }
    std::size_t current_size() const;

    const ContextLimits& limits() const { return limits_; }
    void set_limits(ContextLimits limits) { limits_ = limits; }

private:
    SessionStore& store_;
    ContextLimits limits_;
};

} // namespace llmchat
