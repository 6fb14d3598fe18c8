#include "model_service.hpp"
#include "presenter.hpp"
#include "stream_aggregator.hpp"

namespace llmchat {

std::vector<ApiMessage> build_request_messages(const ChatRequest& request) {
    std::vector<ApiMessage> full;
    full.reserve(request.messages.size() + 1);
    if (request.system_prompt && !request.system_prompt->empty()) {
        full.push_back({Role::System, *request.system_prompt});
    }
    full.insert(full.end(), request.messages.begin(), request.messages.end());
    return full;
}

ChatResult IModelService::chat(const ChatRequest& request, Presenter& presenter,
                               CancelCallback cancel_check) {
    ChatResult result;
    const std::vector<ApiMessage> messages = build_request_messages(request);

    if (!request.stream) {
        try {
            std::optional<std::string> reply = complete(messages, request.temperature,
                                                           request.max_tokens, cancel_check);
            if (!reply) {
                result.cancelled = true;
            } else {
                result.text = std::move(*reply);
            }
        } catch (const ServiceError& e) {
            result.error = ErrorKind::ServiceError;
            result.error_message = e.what();
        }
        return result;
    }

    std::unique_ptr<FragmentStream> stream;
    try {
        stream = open_stream(messages, request.temperature, request.max_tokens, cancel_check);
    } catch (const ServiceError& e) {
        result.error = ErrorKind::ServiceError;
        result.error_message = e.what();
        return result;
    }

    StreamAggregator aggregator(presenter);
    AggregateResult aggregate = aggregator.consume(*stream, cancel_check);
    result.text = std::move(aggregate.text);
    result.cancelled = aggregate.cancelled;
    if (aggregate.error) {
        result.error = aggregate.error;
        result.error_message = aggregate.error_message;
        result.error_reported = true;
    }
    return result;
}

} // namespace llmchat
