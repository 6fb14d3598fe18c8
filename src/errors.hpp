#pragma once

/**
 * Error taxonomy shared by the session and conversation layers.
 *
 * Recoverable failures travel as values (OpResult and the result structs
 * of the store and model service). ServiceError is the one exception type:
 * it is thrown inside the HTTP layer and converted to a result at the
 * service boundary.
 */

#include <optional>
#include <stdexcept>
#include <string>

namespace llmchat {

enum class ErrorKind {
    NotConfigured,     // No credentials / no model service.
    ServiceError,      // Remote call failed (network, auth, rate limit, bad response).
    NotFound,          // Named session does not exist.
    Conflict,          // Target session name already taken.
    InvalidOperation,  // Precondition violated (e.g. deleting the active session).
    PersistenceError,  // Reading or writing the session document failed.
    UnknownCommand     // Unrecognized slash command.
};

// Stable identifier for an error kind, e.g. "NotFound".
std::string error_kind_name(ErrorKind kind);

/**
 * Outcome of an operation that returns no value.
 */
struct OpResult {
    std::optional<ErrorKind> error;  // Empty on success.
    std::string message;             // Human-readable detail (empty on success).

    bool success() const { return !error.has_value(); }

    static OpResult ok() { return {}; }

    static OpResult fail(ErrorKind kind, std::string message) {
        return {kind, std::move(message)};
    }
};

/**
 * Raised by the remote model transport for any transport- or
 * protocol-level failure.
 */
class ServiceError : public std::runtime_error {
public:
    explicit ServiceError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace llmchat
