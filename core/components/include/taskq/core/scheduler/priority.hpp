#pragma once

/**
 * @file priority.hpp
 * @brief Task priority levels and empty-queue behaviour
 */

#include <taskq/common/error.hpp>

#include <cstdint>
#include <string_view>

namespace taskq::core {

/**
 * @brief Fixed task priority levels; lower value is served first
 */
enum class Priority : uint8_t {
    HIGH   = 1,
    MEDIUM = 2,
    LOW    = 3,
};

constexpr bool is_valid_priority(Priority p) noexcept {
    return p == Priority::HIGH || p == Priority::MEDIUM || p == Priority::LOW;
}

constexpr std::string_view priority_name(Priority p) noexcept {
    switch (p) {
        case Priority::HIGH:   return "HIGH";
        case Priority::MEDIUM: return "MEDIUM";
        case Priority::LOW:    return "LOW";
        default:               return "INVALID";
    }
}

constexpr int priority_level(Priority p) noexcept {
    return static_cast<int>(p);
}

/**
 * @brief Map a numeric level (1..3) onto a Priority
 * @return PRIORITY_INVALID for any other value
 */
common::Result<Priority> priority_from_level(int level);

/**
 * @brief Parse "high"/"medium"/"low" (any case) or "1".."3"
 */
common::Result<Priority> parse_priority(std::string_view text);

/**
 * @brief What take() and peek() report when the queue holds nothing
 */
enum class EmptyQueueMode : uint8_t {
    OPTIONAL,  ///< success carrying std::nullopt
    STRICT,    ///< ErrorCode::QUEUE_EMPTY
};

constexpr std::string_view empty_queue_mode_name(EmptyQueueMode mode) noexcept {
    switch (mode) {
        case EmptyQueueMode::OPTIONAL: return "optional";
        case EmptyQueueMode::STRICT:   return "strict";
        default:                       return "unknown";
    }
}

common::Result<EmptyQueueMode> parse_empty_queue_mode(std::string_view text);

}  // namespace taskq::core
