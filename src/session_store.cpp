#include "session_store.hpp"
#include "verbose.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace llmchat {

namespace {

// Converts one persisted message record. Throws on a malformed record.
Message message_from_json(const json& record) {
    if (!record.is_object()) {
        throw std::invalid_argument("message record is not an object");
    }

    std::string role_text = record.at("role").get<std::string>();
    std::optional<Role> role = role_from_string(role_text);
    if (!role) {
        throw std::invalid_argument("unknown role '" + role_text + "'");
    }

    Message message;
    message.role = *role;
    message.content = record.at("content").get<std::string>();
    message.timestamp = record.value("timestamp", "");
    return message;
}

SessionMap sessions_from_json(const json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("top level is not an object");
    }

    SessionMap sessions;
    for (const auto& [name, records] : document.items()) {
        if (!records.is_array()) {
            throw std::invalid_argument("session '" + name + "' is not a list");
        }
        Session session{name, {}};
        session.messages.reserve(records.size());
        for (const auto& record : records) {
            session.messages.push_back(message_from_json(record));
        }
        sessions.emplace(name, std::move(session));
    }
    return sessions;
}

json sessions_to_json(const SessionMap& sessions) {
    json document = json::object();
    for (const auto& [name, session] : sessions) {
        json records = json::array();
        for (const auto& msg : session.messages) {
            records.push_back({
                {"role", role_to_string(msg.role)},
                {"content", msg.content},
                {"timestamp", msg.timestamp}
            });
        }
        document[name] = records;
    }
    return document;
}

LoadResult fallback(const std::string& error) {
    LoadResult result;
    result.found = true;
    result.error = error;
    result.sessions.emplace(FALLBACK_SESSION_NAME, Session{FALLBACK_SESSION_NAME, {}});
    return result;
}

} // namespace

std::string generate_session_name(const SessionMap& existing, std::time_t now) {
    std::tm tm_now{};
    localtime_r(&now, &tm_now);

    std::ostringstream oss;
    oss << "chat_" << std::put_time(&tm_now, "%Y%m%d_%H%M%S");
    const std::string base = oss.str();

    std::string name = base;
    for (int suffix = 2; existing.count(name) > 0; ++suffix) {
        name = base + "_" + std::to_string(suffix);
    }
    return name;
}

SessionStore::SessionStore(std::string history_file)
    : history_file_(std::move(history_file)) {
}

LoadResult SessionStore::load() const {
    LoadResult result;

    std::error_code ec;
    if (!fs::exists(history_file_, ec)) {
        verbose_log("STORE", "No session document at " + history_file_);
        return result;
    }

    std::ifstream file(history_file_);
    if (!file.is_open()) {
        verbose_err("STORE", "Cannot open " + history_file_);
        return fallback("cannot open " + history_file_);
    }

    try {
        json document;
        file >> document;
        result.sessions = sessions_from_json(document);
        result.found = true;
    } catch (const json::exception& e) {
        verbose_err("STORE", std::string("Parse failure: ") + e.what());
        return fallback(e.what());
    } catch (const std::invalid_argument& e) {
        verbose_err("STORE", std::string("Invalid document: ") + e.what());
        return fallback(e.what());
    }

    verbose_in("STORE", "Loaded " + std::to_string(result.sessions.size()) +
               " session(s) from " + history_file_);
    return result;
}

OpResult SessionStore::save(const SessionMap& sessions) const {
    const fs::path target(history_file_);
    const fs::path temp(history_file_ + ".tmp");

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return OpResult::fail(ErrorKind::PersistenceError,
                                  "cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    {
        std::ofstream file(temp, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            verbose_err("STORE", "Cannot write " + temp.string());
            return OpResult::fail(ErrorKind::PersistenceError, "cannot write " + temp.string());
        }
        try {
            // Invalid UTF-8 in message text is written as U+FFFD.
            file << sessions_to_json(sessions).dump(2, ' ', false, json::error_handler_t::replace)
                 << std::endl;
        } catch (const json::exception& e) {
            verbose_err("STORE", std::string("Encoding failed: ") + e.what());
            file.close();
            fs::remove(temp, ec);
            return OpResult::fail(ErrorKind::PersistenceError,
                                  std::string("cannot encode sessions: ") + e.what());
        }
        if (!file.good()) {
            file.close();
            fs::remove(temp, ec);
            return OpResult::fail(ErrorKind::PersistenceError, "write to " + temp.string() + " failed");
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        verbose_err("STORE", "Rename failed: " + ec.message());
        std::error_code ignored;
        fs::remove(temp, ignored);
        return OpResult::fail(ErrorKind::PersistenceError,
                              "cannot replace " + history_file_ + ": " + ec.message());
    }

    verbose_out("STORE", "Saved " + std::to_string(sessions.size()) + " session(s) to " + history_file_);
    return OpResult::ok();
}

OpResult SessionStore::save() const {
    return save(sessions_);
}

LoadResult SessionStore::open() {
    LoadResult result = load();
    sessions_ = result.sessions;

    const std::string fresh = generate_session_name(sessions_, std::time(nullptr));
    create_or_get(fresh);
    current_ = fresh;
    verbose_log("STORE", "Started new session: " + fresh);
    return result;
}

Session& SessionStore::create_or_get(const std::string& name) {
    auto it = sessions_.find(name);
    if (it == sessions_.end()) {
        it = sessions_.emplace(name, Session{name, {}}).first;
    }
    return it->second;
}

void SessionStore::set_current(const std::string& name) {
    create_or_get(name);
    current_ = name;
}

OpResult SessionStore::remove(const std::string& name) {
    if (!contains(name)) {
        return OpResult::fail(ErrorKind::InvalidOperation, "Session '" + name + "' not found.");
    }
    if (name == current_) {
        return OpResult::fail(ErrorKind::InvalidOperation,
                              "Cannot delete current session. Switch to another session first.");
    }

    sessions_.erase(name);
    return save();
}

OpResult SessionStore::rename(const std::string& old_name, const std::string& new_name) {
    auto it = sessions_.find(old_name);
    if (it == sessions_.end()) {
        return OpResult::fail(ErrorKind::NotFound, "Session '" + old_name + "' not found.");
    }
    if (contains(new_name)) {
        return OpResult::fail(ErrorKind::Conflict, "Session '" + new_name + "' already exists.");
    }

    auto node = sessions_.extract(it);
    node.key() = new_name;
    node.mapped().name = new_name;
    sessions_.insert(std::move(node));

    if (current_ == old_name) {
        current_ = new_name;
    }
    return save();
}

bool SessionStore::contains(const std::string& name) const {
    return sessions_.count(name) > 0;
}

Session& SessionStore::current() {
    if (current_.empty()) {
        throw std::logic_error("session store has no current session (open() not called)");
    }
    return create_or_get(current_);
}

const Session& SessionStore::current() const {
    auto it = sessions_.find(current_);
    if (it == sessions_.end()) {
        throw std::logic_error("session store has no current session (open() not called)");
    }
    return it->second;
}

} // namespace llmchat
