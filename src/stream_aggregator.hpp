#pragma once

/**
 * Reduces a fragment stream to one reply while presenting it live.
 */

#include "errors.hpp"
#include "model_service.hpp"
#include <optional>
#include <string>

namespace llmchat {

class Presenter;

/**
 * Outcome of consuming one stream.
 */
struct AggregateResult {
    std::string text;                // Concatenated fragments (partial on error/cancel).
    std::optional<ErrorKind> error;  // ServiceError if the stream failed midway.
    std::string error_message;
    bool cancelled = false;
    std::size_t fragments = 0;       // Number of fragments forwarded.

    bool success() const { return !error.has_value() && !cancelled; }
};

/**
 * Consumes exactly one FragmentStream.
 *
 * Each fragment is forwarded to the presenter the moment it is pulled and
 * appended to the result in the same order. A mid-stream ServiceError is
 * reported to the presenter and the partial text is kept.
 */
class StreamAggregator {
public:
    explicit StreamAggregator(Presenter& presenter);

    // Pulls fragments until the stream ends, fails or is cancelled.
    // Throws std::logic_error if called a second time.
    AggregateResult consume(FragmentStream& stream, const CancelCallback& cancel_check = nullptr);

private:
    Presenter& presenter_;
    bool consumed_ = false;
};

} // namespace llmchat
