#pragma once

/**
 * Context window and retention policies.
 *
 * build_context() picks what is sent to the model per request; it never
 * touches stored history. trim_history() is the separate storage-capacity
 * policy applied after each append.
 */

#include "types.hpp"
#include <cstddef>
#include <vector>

namespace llmchat {

// Returns the last min(N, max_context) messages, oldest first, without timestamps.
std::vector<ApiMessage> build_context(const std::vector<Message>& history, std::size_t max_context);

// Returns the whole history without timestamps.
std::vector<ApiMessage> strip_timestamps(const std::vector<Message>& history);

// Once messages exceeds 2 * max_history, keeps only the most recent
// max_history of them. Returns true if anything was dropped.
bool trim_history(std::vector<Message>& messages, std::size_t max_history);

} // namespace llmchat
