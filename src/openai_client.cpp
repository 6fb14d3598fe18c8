#include "openai_client.hpp"
#include "verbose.hpp"
#include <curl/curl.h>
#include <deque>

namespace llmchat {

using json = nlohmann::json;

// ========== Wire Format ==========

std::string chat_completions_url(const std::string& base_url) {
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + CHAT_COMPLETIONS_PATH;
}

json build_chat_body(const std::string& model,
                     const std::vector<ApiMessage>& messages,
                     double temperature,
                     int max_tokens,
                     bool stream) {
    json wire_messages = json::array();
    for (const auto& msg : messages) {
        wire_messages.push_back(msg.to_json());
    }

    return {
        {"model", model},
        {"messages", wire_messages},
        {"temperature", temperature},
        {"max_tokens", max_tokens},
        {"stream", stream}
    };
}

std::string encode_body(const json& body) {
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Message of an {"error": ...} object, which may be a string or {"message": ...}.
static std::optional<std::string> error_object_message(const json& j) {
    if (!j.is_object() || !j.contains("error") || j["error"].is_null()) {
        return std::nullopt;
    }
    const json& err = j["error"];
    if (err.is_string()) {
        return err.get<std::string>();
    }
    if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        return err["message"].get<std::string>();
    }
    return std::string("Unknown API error");
}

std::string extract_reply_text(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        throw ServiceError(std::string("Invalid response from model service: ") + e.what());
    }

    if (auto message = error_object_message(j)) {
        throw ServiceError(*message);
    }

    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        throw ServiceError("Response contained no choices");
    }

    const json& choice = j["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        throw ServiceError("Response choice has no message");
    }

    const json& content = choice["message"].value("content", json());
    if (content.is_null()) {
        return "";
    }
    if (!content.is_string()) {
        throw ServiceError("Response message content is not text");
    }
    return content.get<std::string>();
}

std::string extract_error_message(const std::string& body, long http_code) {
    std::string prefix = "HTTP " + std::to_string(http_code);
    try {
        json j = json::parse(body);
        if (auto message = error_object_message(j)) {
            return prefix + ": " + *message;
        }
    } catch (const json::exception&) {
        // Not JSON; fall back to the raw body.
    }

    if (body.empty()) {
        return prefix;
    }
    return prefix + ": " + truncate(body, 200);
}

std::optional<std::string> parse_stream_delta(const std::string& data) {
    json event;
    try {
        event = json::parse(data);
    } catch (const json::exception&) {
        verbose_err("SSE", "Skipping malformed event: " + truncate(data, 200));
        return std::nullopt;
    }

    if (auto message = error_object_message(event)) {
        throw ServiceError(*message);
    }

    if (!event.contains("choices") || !event["choices"].is_array() || event["choices"].empty()) {
        return std::nullopt;
    }

    const json& choice = event["choices"][0];
    if (!choice.contains("delta") || !choice["delta"].is_object()) {
        return std::nullopt;
    }

    const json& delta = choice["delta"];
    if (!delta.contains("content") || !delta["content"].is_string()) {
        return std::nullopt;
    }

    std::string content = delta["content"].get<std::string>();
    if (content.empty()) {
        return std::nullopt;
    }
    return content;
}

std::vector<std::string> SseParser::feed(const std::string& chunk) {
    std::vector<std::string> payloads;
    if (done_) {
        return payloads;
    }

    buffer_.append(chunk);

    // Process complete SSE lines.
    size_t pos;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        // Blank lines separate events; lines starting with ':' are comments.
        if (line.rfind("data:", 0) != 0) {
            continue;
        }

        std::string data = line.substr(5);
        if (!data.empty() && data.front() == ' ') {
            data.erase(0, 1);
        }

        if (data == "[DONE]") {
            done_ = true;
            buffer_.clear();
            break;
        }
        if (!data.empty()) {
            payloads.push_back(std::move(data));
        }
    }

    return payloads;
}

// ========== CURL Helpers ==========

// CURL write callback for collecting response data into a string.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* response = static_cast<std::string*>(userdata);
    response->append(ptr, size * nmemb);
    return size * nmemb;
}

// Cancellation state shared with the progress callback.
struct CancelContext {
    CancelCallback cancel_check;
    bool cancelled = false;
};

// CURL progress callback for cancellation support.
// Returns non-zero to abort the transfer.
static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<CancelContext*>(userdata);
    if (ctx->cancel_check && ctx->cancel_check()) {
        ctx->cancelled = true;
        return 1;
    }
    return 0;
}

static curl_slist* make_headers(const std::string& api_key, bool streaming) {
    verbose_out("CURL", "Authorization: Bearer " + redact_secret(api_key));

    curl_slist* headers = nullptr;
    std::string auth_header = "Authorization: Bearer " + api_key;
    headers = curl_slist_append(headers, auth_header.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (streaming) {
        headers = curl_slist_append(headers, "Accept: text/event-stream");
    }
    return headers;
}

static void apply_common_options(CURL* curl, const std::string& url,
                                 curl_slist* headers, const std::string& body) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT_SECONDS);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, LOW_SPEED_TIME_SECONDS);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (is_verbose()) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }
}

// ========== Streaming ==========

namespace {

/**
 * Fragment stream over one in-flight SSE response.
 *
 * Each call to next() pumps the multi handle until a fragment is ready or
 * the transfer ends. Fragments that arrive together are queued so none is
 * lost; an error seen by the write callback is raised only after the
 * fragments received before it have been handed out.
 */
class CurlFragmentStream : public FragmentStream {
public:
    CurlFragmentStream(const std::string& url, const std::string& api_key,
                       std::string body, CancelCallback cancel_check)
        : body_(std::move(body)), cancel_{std::move(cancel_check), false} {
        easy_ = curl_easy_init();
        multi_ = curl_multi_init();
        if (!easy_ || !multi_) {
            cleanup();
            verbose_err("CURL", "Failed to initialize CURL");
            throw ServiceError("Failed to initialize CURL");
        }

        headers_ = make_headers(api_key, true);
        apply_common_options(easy_, url, headers_, body_);
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlFragmentStream::on_write);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(easy_, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(easy_, CURLOPT_XFERINFODATA, &cancel_);

        curl_multi_add_handle(multi_, easy_);
        verbose_log("CURL", "Starting streaming request...");

        // Pump until the status line is known so an HTTP error is raised here
        // rather than as a mid-stream failure.
        while (!finished_ && http_code_ == 0 && pending_.empty()) {
            pump();
        }
        if (http_code_ >= 400 || (finished_ && !error_.empty() && pending_.empty())) {
            while (!finished_) {
                pump();
            }
            std::string message = error_;
            cleanup();
            throw ServiceError(message);
        }
    }

    ~CurlFragmentStream() override {
        cleanup();
    }

    std::optional<std::string> next() override {
        while (true) {
            if (!pending_.empty()) {
                std::string fragment = std::move(pending_.front());
                pending_.pop_front();
                return fragment;
            }
            if (finished_) {
                if (!error_.empty()) {
                    std::string message = error_;
                    error_.clear();
                    throw ServiceError(message);
                }
                return std::nullopt;
            }
            pump();
        }
    }

    bool was_cancelled() const override {
        return cancel_.cancelled;
    }

private:
    CURLM* multi_ = nullptr;
    CURL* easy_ = nullptr;
    curl_slist* headers_ = nullptr;
    std::string body_;
    CancelContext cancel_;
    SseParser parser_;
    std::deque<std::string> pending_;
    std::string error_body_;
    std::string error_;
    long http_code_ = 0;
    bool finished_ = false;

    // CURL write callback. Feeds the SSE parser and queues text deltas.
    // Returning a short count aborts the transfer.
    static size_t on_write(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlFragmentStream*>(userdata);
        size_t total_size = size * nmemb;
        std::string chunk(ptr, total_size);

        if (self->http_code_ == 0) {
            curl_easy_getinfo(self->easy_, CURLINFO_RESPONSE_CODE, &self->http_code_);
        }
        if (self->http_code_ >= 400) {
            self->error_body_ += chunk;
            return total_size;
        }

        verbose_in("SSE", truncate(chunk, 300));
        try {
            for (const auto& data : self->parser_.feed(chunk)) {
                if (auto fragment = parse_stream_delta(data)) {
                    self->pending_.push_back(std::move(*fragment));
                }
            }
        } catch (const ServiceError& e) {
            self->error_ = e.what();
            return 0;
        }
        return total_size;
    }

    // One round of transfer work, waiting briefly for socket activity.
    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            finish_with_error(std::string("HTTP streaming POST failed: ") + curl_multi_strerror(mc));
            return;
        }

        if (http_code_ == 0) {
            curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &http_code_);
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                complete(msg->data.result);
                return;
            }
        }

        if (running == 0) {
            complete(CURLE_OK);
            return;
        }

        curl_multi_poll(multi_, nullptr, 0, 100, nullptr);
    }

    void complete(CURLcode res) {
        finished_ = true;
        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &http_code_);

        if (cancel_.cancelled) {
            verbose_log("CURL", "Stream cancelled by user");
            return;
        }
        if (http_code_ >= 400) {
            error_ = extract_error_message(error_body_, http_code_);
            verbose_err("CURL", error_);
            return;
        }
        if (res != CURLE_OK && error_.empty()) {
            error_ = std::string("HTTP streaming POST failed: ") + curl_easy_strerror(res);
            verbose_err("CURL", error_);
            return;
        }
        if (!error_.empty()) {
            verbose_err("SSE", error_);
            return;
        }
        verbose_in("CURL", "Stream complete, HTTP " + std::to_string(http_code_));
    }

    void finish_with_error(const std::string& message) {
        finished_ = true;
        error_ = message;
        verbose_err("CURL", message);
    }

    void cleanup() {
        if (multi_ && easy_) {
            curl_multi_remove_handle(multi_, easy_);
        }
        if (easy_) {
            curl_easy_cleanup(easy_);
            easy_ = nullptr;
        }
        if (multi_) {
            curl_multi_cleanup(multi_);
            multi_ = nullptr;
        }
        if (headers_) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
    }
};

} // namespace

// ========== Client ==========

OpenAIChatClient::OpenAIChatClient(ClientConfig config) : config_(std::move(config)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

OpenAIChatClient::~OpenAIChatClient() {
    curl_global_cleanup();
}

bool OpenAIChatClient::is_configured() const {
    return !config_.api_key.empty();
}

std::optional<std::string> OpenAIChatClient::http_post_json(const std::string& url,
                                                            const json& body,
                                                            CancelCallback cancel_check) {
    std::string body_str = encode_body(body);
    verbose_out("CURL", "POST " + url);
    verbose_out("CURL", "Body: " + format_json_compact(body_str));

    CURL* curl = curl_easy_init();
    if (!curl) {
        verbose_err("CURL", "Failed to initialize CURL");
        throw ServiceError("Failed to initialize CURL");
    }

    std::string response;
    CancelContext ctx{std::move(cancel_check), false};
    curl_slist* headers = make_headers(config_.api_key, false);

    apply_common_options(curl, url, headers, body_str);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    if (ctx.cancel_check) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (ctx.cancelled || res == CURLE_ABORTED_BY_CALLBACK) {
        verbose_log("CURL", "Request cancelled by user");
        return std::nullopt;
    }

    if (res != CURLE_OK) {
        verbose_err("CURL", std::string("POST failed: ") + curl_easy_strerror(res));
        throw ServiceError(std::string("HTTP POST failed: ") + curl_easy_strerror(res));
    }

    verbose_in("CURL", "HTTP " + std::to_string(http_code) + " - " + truncate(response, 500));

    if (http_code >= 400) {
        throw ServiceError(extract_error_message(response, http_code));
    }
    return response;
}

std::optional<std::string> OpenAIChatClient::complete(const std::vector<ApiMessage>& messages,
                                                      double temperature,
                                                      int max_tokens,
                                                      CancelCallback cancel_check) {
    if (!is_configured()) {
        throw ServiceError("API key is not configured");
    }

    json body = build_chat_body(config_.model, messages, temperature, max_tokens, false);
    std::optional<std::string> response =
        http_post_json(chat_completions_url(config_.base_url), body, std::move(cancel_check));
    if (!response) {
        return std::nullopt;
    }
    return extract_reply_text(*response);
}

std::unique_ptr<FragmentStream> OpenAIChatClient::open_stream(const std::vector<ApiMessage>& messages,
                                                              double temperature,
                                                              int max_tokens,
                                                              CancelCallback cancel_check) {
    if (!is_configured()) {
        throw ServiceError("API key is not configured");
    }

    std::string url = chat_completions_url(config_.base_url);
    std::string body = encode_body(build_chat_body(config_.model, messages, temperature,
                                                   max_tokens, true));
    verbose_out("CURL", "POST (stream) " + url);
    verbose_out("CURL", "Body: " + format_json_compact(body, 1000));

    return std::make_unique<CurlFragmentStream>(url, config_.api_key, std::move(body),
                                                std::move(cancel_check));
}

bool OpenAIChatClient::validate_connection() {
    if (!is_configured()) {
        return false;
    }

    try {
        std::vector<ApiMessage> probe{{Role::User, PROBE_MESSAGE}};
        return complete(probe, DEFAULT_TEMPERATURE, PROBE_MAX_TOKENS, nullptr).has_value();
    } catch (const ServiceError& e) {
        verbose_err("CURL", std::string("Connection check failed: ") + e.what());
        return false;
    }
}

void OpenAIChatClient::update_config(const std::string& api_key,
                                     const std::string& base_url,
                                     const std::string& model) {
    if (!api_key.empty()) {
        config_.api_key = api_key;
    }
    if (!base_url.empty()) {
        config_.base_url = base_url;
    }
    if (!model.empty()) {
        config_.model = model;
    }
    verbose_log("CONFIG", "Client now targets " + config_.base_url + " with model " + config_.model);
}

} // namespace llmchat
