#include "errors.hpp"

namespace llmchat {

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotConfigured:
            return "NotConfigured";
        case ErrorKind::ServiceError:
            return "ServiceError";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::Conflict:
            return "Conflict";
        case ErrorKind::InvalidOperation:
            return "InvalidOperation";
        case ErrorKind::PersistenceError:
            return "PersistenceError";
        case ErrorKind::UnknownCommand:
            return "UnknownCommand";
    }
    return "Unknown";
}

} // namespace llmchat
