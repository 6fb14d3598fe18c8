#pragma once

/**
 * Remote model service interface.
 *
 * Implementations provide two transport primitives, a blocking completion
 * and a pull-based fragment stream, both of which throw ServiceError.
 * chat() turns either into a ChatResult so callers always handle the
 * failure path explicitly.
 */

#include "config.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llmchat {

class Presenter;

/**
 * Returns true if the in-flight request should be abandoned.
 */
using CancelCallback = std::function<bool()>;

/**
 * Parameters of one chat request.
 */
struct ChatRequest {
    std::vector<ApiMessage> messages;          // Context, oldest first.
    std::optional<std::string> system_prompt;  // Prepended as a system message when set.
    double temperature = DEFAULT_TEMPERATURE;
    int max_tokens = DEFAULT_MAX_TOKENS;
    bool stream = false;
};

/**
 * Outcome of one chat request.
 */
struct ChatResult {
    std::string text;                // Full reply, or partial text on stream failure/cancel.
    std::optional<ErrorKind> error;  // Set on failure.
    std::string error_message;
    bool error_reported = false;     // True if the presenter already showed the error.
    bool cancelled = false;

    bool success() const { return !error.has_value() && !cancelled; }
};

/**
 * Lazily produced reply fragments for one streaming request.
 * Not restartable.
 */
class FragmentStream {
public:
    virtual ~FragmentStream() = default;

    // Blocks until the next fragment is available. Returns nullopt once the
    // reply is complete or the request was cancelled. Throws ServiceError.
    virtual std::optional<std::string> next() = 0;

    // True if the stream ended because of cancellation.
    virtual bool was_cancelled() const = 0;
};

// Request messages with the system prompt (if any) as a leading system message.
std::vector<ApiMessage> build_request_messages(const ChatRequest& request);

class IModelService {
public:
    virtual ~IModelService() = default;

    // False when no credentials are available.
    virtual bool is_configured() const = 0;

    // Sends the messages and waits for the whole reply.
    // Returns nullopt if cancelled. Throws ServiceError.
    virtual std::optional<std::string> complete(const std::vector<ApiMessage>& messages,
                                                double temperature,
                                                int max_tokens,
                                                CancelCallback cancel_check) = 0;

    // Starts a streaming request. Throws ServiceError if it cannot be started.
    virtual std::unique_ptr<FragmentStream> open_stream(const std::vector<ApiMessage>& messages,
                                                        double temperature,
                                                        int max_tokens,
                                                        CancelCallback cancel_check) = 0;

    // Minimal liveness probe. Never throws.
    virtual bool validate_connection() = 0;

    // Replaces non-empty fields of the connection settings.
    virtual void update_config(const std::string& api_key,
                               const std::string& base_url,
                               const std::string& model) = 0;

    virtual std::string api_key() const = 0;
    virtual std::string base_url() const = 0;
    virtual std::string model() const = 0;

    // Runs one request. Streaming requests forward every fragment to the
    // presenter through a StreamAggregator.
    ChatResult chat(const ChatRequest& request, Presenter& presenter,
                    CancelCallback cancel_check = nullptr);
};

} // namespace llmchat
