#pragma once

/**
 * OpenAI-compatible chat completions client for llmchat.
 *
 * Talks to any service exposing POST <base_url>/chat/completions (DeepSeek,
 * OpenAI and compatible gateways) using libcurl for HTTP transport. Blocking
 * requests use the easy interface; streaming requests drive the multi
 * interface so fragments can be pulled one at a time.
 */

#include "config.hpp"
#include "model_service.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace llmchat {

/**
 * Connection settings for the remote service.
 */
struct ClientConfig {
    std::string api_key;
    std::string base_url = DEFAULT_BASE_URL;
    std::string model = DEFAULT_MODEL;
};

// ========== Wire Format ==========

// "<base_url>/chat/completions", tolerating a trailing slash on base_url.
std::string chat_completions_url(const std::string& base_url);

// Request body: {model, messages, temperature, max_tokens, stream}.
nlohmann::json build_chat_body(const std::string& model,
                               const std::vector<ApiMessage>& messages,
                               double temperature,
                               int max_tokens,
                               bool stream);

// Serializes a request body. Invalid UTF-8 in message text is replaced
// with U+FFFD instead of failing the request.
std::string encode_body(const nlohmann::json& body);

// choices[0].message.content of a non-streamed response.
// Throws ServiceError if the body is malformed or carries an error object.
std::string extract_reply_text(const std::string& body);

// Human-readable message for a failed HTTP response.
std::string extract_error_message(const std::string& body, long http_code);

// choices[0].delta.content of one SSE data payload. Returns nullopt for
// payloads that carry no text (role headers, finish markers, malformed JSON).
// Throws ServiceError if the payload is an error object.
std::optional<std::string> parse_stream_delta(const std::string& data);

/**
 * Splits a Server-Sent Events byte stream into "data:" payloads.
 *
 * Bytes may arrive in arbitrary chunks; incomplete lines are buffered until
 * their newline arrives. "[DONE]" ends the stream and is not returned.
 */
class SseParser {
public:
    std::vector<std::string> feed(const std::string& chunk);

    bool done() const { return done_; }

private:
    std::string buffer_;
    bool done_ = false;
};

// ========== Client ==========

class OpenAIChatClient : public IModelService {
public:
    explicit OpenAIChatClient(ClientConfig config);

    // Cleans up CURL global state.
    ~OpenAIChatClient() override;

    OpenAIChatClient(const OpenAIChatClient&) = delete;
    OpenAIChatClient& operator=(const OpenAIChatClient&) = delete;

    bool is_configured() const override;

    std::optional<std::string> complete(const std::vector<ApiMessage>& messages,
                                        double temperature,
                                        int max_tokens,
                                        CancelCallback cancel_check) override;

    std::unique_ptr<FragmentStream> open_stream(const std::vector<ApiMessage>& messages,
                                                double temperature,
                                                int max_tokens,
                                                CancelCallback cancel_check) override;

    // Sends a tiny non-streamed request and reports whether it succeeded.
    bool validate_connection() override;

    void update_config(const std::string& api_key,
                       const std::string& base_url,
                       const std::string& model) override;

    std::string api_key() const override { return config_.api_key; }
    std::string base_url() const override { return config_.base_url; }
    std::string model() const override { return config_.model; }

private:
    ClientConfig config_;

    // Performs an HTTP POST with JSON body. Returns nullopt if cancelled.
    // Throws ServiceError on transport failure or HTTP status >= 400.
    std::optional<std::string> http_post_json(const std::string& url,
                                              const nlohmann::json& body,
                                              CancelCallback cancel_check);
};

} // namespace llmchat
