#pragma once

/**
 * @file platform.hpp
 * @brief OS detection and the OS queries used by the logger
 */

#include <cstdint>
#include <string>
#include <string_view>

#if __cplusplus < 202002L && !defined(_MSVC_LANG)
    #error "taskq requires C++20"
#endif

// ============================================================================
// OPERATING SYSTEM
// ============================================================================

#if defined(_WIN32)
    #define TASKQ_OS_WINDOWS 1
#elif defined(__APPLE__)
    #define TASKQ_OS_MACOS 1
    #define TASKQ_OS_POSIX 1
#elif defined(__linux__)
    #define TASKQ_OS_LINUX 1
    #define TASKQ_OS_POSIX 1
#elif defined(__unix__)
    #define TASKQ_OS_POSIX 1
#endif

// std::source_location shipped late in some standard libraries
#if defined(__has_include) && __has_include(<source_location>)
    #include <source_location>
    #if defined(__cpp_lib_source_location)
        #define TASKQ_HAS_SOURCE_LOCATION 1
    #endif
#endif

// ============================================================================
// ATTRIBUTES
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define TASKQ_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define TASKQ_API __attribute__((visibility("default")))
#else
    #define TASKQ_UNLIKELY(x) (x)
    #define TASKQ_API
#endif

namespace taskq::common::platform {

/// Numeric id of the calling thread, as printed in log lines
TASKQ_API uint64_t get_thread_id() noexcept;

/// Value of an environment variable, empty when unset
TASKQ_API std::string get_env(std::string_view name);

/// True when fd refers to a terminal (used to decide on ANSI colors)
TASKQ_API bool is_terminal(int fd) noexcept;

}  // namespace taskq::common::platform
