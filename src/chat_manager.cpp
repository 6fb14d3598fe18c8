#include "chat_manager.hpp"
#include "context_window.hpp"
#include "verbose.hpp"
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace llmchat {

namespace {

// "session_" followed by 8 random hex digits.
std::string random_session_name() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::uint32_t> dist;

    std::ostringstream oss;
    oss << "session_" << std::hex << std::setw(8) << std::setfill('0') << dist(gen);
    return oss.str();
}

} // namespace

ChatSessionManager::ChatSessionManager(SessionStore& store, ContextLimits limits)
    : store_(store)
    , limits_(limits) {
}

void ChatSessionManager::add_message(Role role, const std::string& content) {
    Session& session = store_.current();
    session.messages.push_back({role, content, now_iso8601()});

    if (trim_history(session.messages, limits_.max_history_messages)) {
        verbose_log("CHAT", "Trimmed '" + session.name + "' to " +
                    std::to_string(session.messages.size()) + " messages");
    }
}

std::vector<ApiMessage> ChatSessionManager::get_context() const {
    return build_context(history(), limits_.max_context_messages);
}

std::vector<ApiMessage> ChatSessionManager::get_messages_for_api() const {
    return strip_timestamps(history());
}

OpResult ChatSessionManager::clear_history() {
    store_.current().messages.clear();
    return store_.save();
}

void ChatSessionManager::switch_session(const std::string& name) {
    store_.set_current(name);
    verbose_log("CHAT", "Switched to session: " + name);
}

std::string ChatSessionManager::new_session(const std::optional<std::string>& name) {
    std::string target = name.value_or("");
    if (target.empty()) {
        do {
            target = random_session_name();
        } while (store_.contains(target));
    }
    switch_session(target);
    return target;
}

OpResult ChatSessionManager::delete_session(const std::string& name) {
    return store_.remove(name);
}

OpResult ChatSessionManager::rename_session(const std::string& old_name, const std::string& new_name) {
    return store_.rename(old_name, new_name);
}

OpResult ChatSessionManager::save() const {
    return store_.save();
}

SessionStats ChatSessionManager::stats() const {
    SessionStats stats;
    stats.name = store_.current_name();
    for (const auto& msg : history()) {
        ++stats.total;
        switch (msg.role) {
            case Role::User:
                ++stats.user;
                break;
            case Role::Assistant:
                ++stats.assistant;
                break;
            case Role::System:
                ++stats.system;
                break;
        }
    }
    return stats;
}

const std::vector<Message>& ChatSessionManager::history() const {
    const SessionStore& store = store_;
    return store.current().messages;
}

std::vector<SessionSummary> ChatSessionManager::list_sessions() const {
    std::vector<SessionSummary> rows;
    rows.reserve(store_.sessions().size());
    for (const auto& [name, session] : store_.sessions()) {
        rows.push_back({name, session.messages.size(), name == store_.current_name()});
    }
    return rows;
}

std::size_t ChatSessionManager::current_size() const {
    return history().size();
}

} // namespace llmchat
