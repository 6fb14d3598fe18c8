#pragma once

/**
 * Presentation seam between the conversation core and the terminal.
 *
 * The core emits structured events through this interface and never
 * writes to stdout itself, so tests can record what would be shown.
 */

#include "chat_manager.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace llmchat {

class Presenter {
public:
    virtual ~Presenter() = default;

    // ========== Model Output ==========

    // Shown while a request is in flight.
    virtual void show_thinking() = 0;

    // One streamed fragment, printed as soon as it arrives.
    virtual void show_fragment(const std::string& fragment) = 0;

    // Called once a stream ends (normally, on error or on cancel).
    virtual void end_stream() = 0;

    // A complete, non-streamed reply.
    virtual void show_reply(const std::string& text) = 0;

    // ========== Status ==========

    virtual void show_error(ErrorKind kind, const std::string& message) = 0;
    virtual void show_warning(const std::string& message) = 0;
    virtual void show_success(const std::string& message) = 0;
    virtual void show_info(const std::string& message) = 0;

    // ========== Query Results ==========

    virtual void show_help() = 0;
    virtual void show_sessions(const std::vector<SessionSummary>& sessions) = 0;
    virtual void show_stats(const SessionStats& stats) = 0;
    virtual void show_history(const std::string& session, const std::vector<Message>& messages) = 0;
    virtual void show_config(const std::vector<std::pair<std::string, std::string>>& entries) = 0;

    // Content loaded by "@file", shown before the send confirmation.
    virtual void show_file_preview(const std::string& path, const std::string& content) = 0;
};

} // namespace llmchat
