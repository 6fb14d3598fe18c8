#pragma once

/**
 * Session storage with JSON persistence.
 *
 * Owns every session of the process plus the pointer to the active one,
 * and persists the whole set as a single JSON document:
 *
 *   { "<session name>": [ {"role": ..., "content": ..., "timestamp": ...}, ... ], ... }
 *
 * The store never throws on I/O. Reads fall back to a safe default and
 * writes report a PersistenceError result; the in-memory state stays
 * authoritative for the rest of the run.
 */

#include "errors.hpp"
#include "types.hpp"
#include <ctime>
#include <string>

namespace llmchat {

/**
 * Result of reading the session document.
 */
struct LoadResult {
    SessionMap sessions;  // Loaded sessions, or {"default": []} after a failure.
    bool found = false;   // True if the document existed.
    std::string error;    // Read/parse failure detail (empty on success).

    bool failed() const { return !error.empty(); }
};

// Name of the fallback session used when the document is unreadable.
constexpr const char* FALLBACK_SESSION_NAME = "default";

/**
 * Builds a fresh session name "chat_YYYYMMDD_HHMMSS" from the given time.
 * A numeric suffix (_2, _3, ...) is appended if the name is already taken.
 */
std::string generate_session_name(const SessionMap& existing, std::time_t now);

class SessionStore {
public:
    // Creates an empty store bound to the given document path.
    // No I/O happens until open(), load() or save().
    explicit SessionStore(std::string history_file);

    // ========== Persistence ==========

    // Reads the document at the bound path.
    // Missing file: empty map, found=false. Unreadable or malformed
    // document: {"default": []} plus an error message. Never throws.
    LoadResult load() const;

    // Writes the given sessions as one document, replacing the previous
    // file through a temporary file and rename.
    OpResult save(const SessionMap& sessions) const;

    // Writes this store's sessions.
    OpResult save() const;

    // Hydrates from load(), then creates a fresh timestamp-named session and
    // makes it current. Returns the load result so the caller can report
    // a fallback.
    LoadResult open();

    // ========== Session Operations ==========

    // Returns the named session, creating an empty one if absent.
    Session& create_or_get(const std::string& name);

    // Makes the named session current, creating it if absent.
    void set_current(const std::string& name);

    // Deletes a session and persists. Fails with InvalidOperation (and no
    // mutation) if the session is active or absent. A successful deletion
    // whose save fails returns PersistenceError; the deletion stands.
    OpResult remove(const std::string& name);

    // Re-keys a session and persists. NotFound if old is absent, Conflict if
    // new is taken; neither mutates. Updates the current pointer when it
    // referenced old. A failed save is reported as for remove().
    OpResult rename(const std::string& old_name, const std::string& new_name);

    // ========== Queries ==========

    bool contains(const std::string& name) const;
    const SessionMap& sessions() const { return sessions_; }
    const std::string& current_name() const { return current_; }
    Session& current();
    const Session& current() const;
    const std::string& path() const { return history_file_; }

private:
    std::string history_file_;  // Path of the JSON document.
    SessionMap sessions_;       // All sessions, keyed by name.
    std::string current_;       // Name of the active session.
};

} // namespace llmchat
