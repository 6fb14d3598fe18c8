#include "context_window.hpp"
#include <algorithm>
#include <iterator>

namespace llmchat {

namespace {

std::vector<ApiMessage> to_api(std::vector<Message>::const_iterator first,
                               std::vector<Message>::const_iterator last) {
    std::vector<ApiMessage> out;
    out.reserve(static_cast<std::size_t>(std::distance(first, last)));
    for (auto it = first; it != last; ++it) {
        out.push_back({it->role, it->content});
    }
    return out;
}

} // namespace

std::vector<ApiMessage> build_context(const std::vector<Message>& history, std::size_t max_context) {
    const std::size_t keep = std::min(history.size(), max_context);
    return to_api(history.end() - static_cast<std::ptrdiff_t>(keep), history.end());
}

std::vector<ApiMessage> strip_timestamps(const std::vector<Message>& history) {
    return to_api(history.begin(), history.end());
}

bool trim_history(std::vector<Message>& messages, std::size_t max_history) {
    if (messages.size() <= max_history * 2) {
        return false;
    }
    const std::size_t drop = messages.size() - max_history;
    messages.erase(messages.begin(), messages.begin() + static_cast<std::ptrdiff_t>(drop));
    return true;
}

} // namespace llmchat
