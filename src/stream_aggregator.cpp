#include "stream_aggregator.hpp"
#include "presenter.hpp"
#include "verbose.hpp"
#include <stdexcept>

namespace llmchat {

StreamAggregator::StreamAggregator(Presenter& presenter)
    : presenter_(presenter) {
}

AggregateResult StreamAggregator::consume(FragmentStream& stream, const CancelCallback& cancel_check) {
    if (consumed_) {
        throw std::logic_error("StreamAggregator already consumed a stream");
    }
    consumed_ = true;

    AggregateResult result;
    try {
        while (true) {
            if (cancel_check && cancel_check()) {
                result.cancelled = true;
                break;
            }

            std::optional<std::string> fragment = stream.next();
            if (!fragment) {
                result.cancelled = stream.was_cancelled();
                break;
            }

            presenter_.show_fragment(*fragment);
            result.text += *fragment;
            ++result.fragments;
        }
    } catch (const ServiceError& e) {
        verbose_err("SSE", std::string("Stream failed after ") +
                    std::to_string(result.fragments) + " fragment(s): " + e.what());
        presenter_.end_stream();
        result.error = ErrorKind::ServiceError;
        result.error_message = e.what();
        presenter_.show_error(ErrorKind::ServiceError, std::string("Stream error: ") + e.what());
        return result;
    }

    presenter_.end_stream();
    return result;
}

} // namespace llmchat
