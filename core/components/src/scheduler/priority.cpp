#include "taskq/core/scheduler/priority.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace taskq::core {

using common::ErrorCode;
using common::Result;

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

Result<Priority> priority_from_level(int level) {
    switch (level) {
        case 1: return Priority::HIGH;
        case 2: return Priority::MEDIUM;
        case 3: return Priority::LOW;
        default:
            return common::err<Priority>(
                ErrorCode::PRIORITY_INVALID,
                "priority level must be 1 (HIGH), 2 (MEDIUM) or 3 (LOW), got " +
                    std::to_string(level));
    }
}

Result<Priority> parse_priority(std::string_view text) {
    auto value = to_lower(trim(text));

    if (value == "high")
        return Priority::HIGH;
    if (value == "medium")
        return Priority::MEDIUM;
    if (value == "low")
        return Priority::LOW;

    if (value.size() == 1 && value[0] >= '1' && value[0] <= '3') {
        return priority_from_level(value[0] - '0');
    }

    return common::err<Priority>(ErrorCode::PRIORITY_INVALID,
                                 "unrecognized priority '" + std::string(text) + "'");
}

Result<EmptyQueueMode> parse_empty_queue_mode(std::string_view text) {
    auto value = to_lower(trim(text));

    if (value == "optional")
        return EmptyQueueMode::OPTIONAL;
    if (value == "strict")
        return EmptyQueueMode::STRICT;

    return common::err<EmptyQueueMode>(
        ErrorCode::CONFIG_INVALID_VALUE,
        "empty_queue_mode must be 'optional' or 'strict', got '" + std::string(text) + "'");
}

}  // namespace taskq::core
