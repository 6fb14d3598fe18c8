#include "types.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace llmchat {

std::string role_to_string(Role role) {
    switch (role) {
        case Role::User:
            return "user";
        case Role::Assistant:
            return "assistant";
        case Role::System:
            return "system";
    }
    return "user";
}

std::optional<Role> role_from_string(const std::string& value) {
    if (value == "user") {
        return Role::User;
    }
    if (value == "assistant") {
        return Role::Assistant;
    }
    if (value == "system") {
        return Role::System;
    }
    return std::nullopt;
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()) % 1000000;

    std::tm tm_now{};
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(6) << micros.count();
    return oss.str();
}

} // namespace llmchat
