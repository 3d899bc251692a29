#pragma once

/**
 * @file error.hpp
 * @brief Error codes, Error and Result<T> for taskq
 *
 * Fallible operations return Result<T> (or Result<void>) instead of throwing.
 * An error carries a 16-bit code whose high byte is its category, an optional
 * message, the source location it was raised at, key/value context and an
 * optional cause.
 */

#include "platform.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace taskq::common {

// ============================================================================
// CODES AND CATEGORIES
// ============================================================================

enum class ErrorCategory : uint8_t {
    GENERAL    = 0x00,
    RESOURCE   = 0x03,
    CONFIG     = 0x04,
    SCHEDULING = 0x07,
    PLATFORM   = 0x0A,
};

/// 0xCCEE: CC is the ErrorCategory, EE the error within it
enum class ErrorCode : uint32_t {
    SUCCESS          = 0x0000,
    UNKNOWN_ERROR    = 0x0001,
    INVALID_ARGUMENT = 0x0003,

    QUEUE_EMPTY = 0x0304,

    CONFIG_INVALID          = 0x0400,
    CONFIG_PARSE_ERROR      = 0x0402,
    CONFIG_REQUIRED_MISSING = 0x0405,
    CONFIG_FILE_NOT_FOUND   = 0x0406,
    CONFIG_INVALID_VALUE    = 0x0408,

    PRIORITY_INVALID = 0x0705,

    OS_ERROR = 0x0A09,
};

namespace detail {

struct ErrorCodeInfo {
    ErrorCode code;
    std::string_view name;
    bool transient;  ///< Retrying the same call may succeed
};

inline constexpr std::array<ErrorCodeInfo, 11> error_code_table = {{
    {ErrorCode::SUCCESS, "SUCCESS", false},
    {ErrorCode::UNKNOWN_ERROR, "UNKNOWN_ERROR", false},
    {ErrorCode::INVALID_ARGUMENT, "INVALID_ARGUMENT", false},
    {ErrorCode::QUEUE_EMPTY, "QUEUE_EMPTY", true},
    {ErrorCode::CONFIG_INVALID, "CONFIG_INVALID", false},
    {ErrorCode::CONFIG_PARSE_ERROR, "CONFIG_PARSE_ERROR", false},
    {ErrorCode::CONFIG_REQUIRED_MISSING, "CONFIG_REQUIRED_MISSING", false},
    {ErrorCode::CONFIG_FILE_NOT_FOUND, "CONFIG_FILE_NOT_FOUND", false},
    {ErrorCode::CONFIG_INVALID_VALUE, "CONFIG_INVALID_VALUE", false},
    {ErrorCode::PRIORITY_INVALID, "PRIORITY_INVALID", false},
    {ErrorCode::OS_ERROR, "OS_ERROR", false},
}};

constexpr const ErrorCodeInfo* find_error_code(ErrorCode code) noexcept {
    for (const auto& info : error_code_table) {
        if (info.code == code) {
            return &info;
        }
    }
    return nullptr;
}

}  // namespace detail

constexpr ErrorCategory get_category(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint32_t>(code) >> 8) & 0xFF);
}

constexpr bool is_success(ErrorCode code) noexcept {
    return code == ErrorCode::SUCCESS;
}

constexpr bool is_transient(ErrorCode code) noexcept {
    const auto* info = detail::find_error_code(code);
    return info != nullptr && info->transient;
}

/// Enumerator spelling, "UNKNOWN" for values outside ErrorCode
constexpr std::string_view error_name(ErrorCode code) noexcept {
    const auto* info = detail::find_error_code(code);
    return info != nullptr ? info->name : std::string_view("UNKNOWN");
}

constexpr std::string_view category_name(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::GENERAL:    return "General";
        case ErrorCategory::RESOURCE:   return "Resource";
        case ErrorCategory::CONFIG:     return "Configuration";
        case ErrorCategory::SCHEDULING: return "Scheduling";
        case ErrorCategory::PLATFORM:   return "Platform";
    }
    return "Unknown";
}

// ============================================================================
// SOURCE LOCATION
// ============================================================================

struct SourceLocation {
    const char* file     = "";
    const char* function = "";
    uint32_t line        = 0;
    uint32_t column      = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_name, const char* function_name, uint32_t line_no,
                             uint32_t column_no = 0) noexcept
        : file(file_name), function(function_name), line(line_no), column(column_no) {}

#if defined(TASKQ_HAS_SOURCE_LOCATION)
    static constexpr SourceLocation current(
        std::source_location here = std::source_location::current()) noexcept {
        return {here.file_name(), here.function_name(), here.line(), here.column()};
    }
#endif

    constexpr bool is_valid() const noexcept { return line != 0 && file[0] != '\0'; }
};

#if defined(TASKQ_HAS_SOURCE_LOCATION)
    #define TASKQ_CURRENT_LOCATION ::taskq::common::SourceLocation::current()
#else
    #define TASKQ_CURRENT_LOCATION \
        ::taskq::common::SourceLocation(__FILE__, __func__, static_cast<uint32_t>(__LINE__))
#endif

// ============================================================================
// ERROR
// ============================================================================

class Error {
public:
    using Context = std::vector<std::pair<std::string, std::string>>;

    Error() noexcept = default;

    Error(ErrorCode code, std::string_view message = {}, SourceLocation location = {})
        : code_(code), message_(message), location_(location) {}

    Error(const Error& other)
        : code_(other.code_),
          message_(other.message_),
          location_(other.location_),
          context_(other.context_),
          cause_(other.cause_ ? std::make_unique<Error>(*other.cause_) : nullptr) {}

    Error& operator=(const Error& other) {
        if (this != &other) {
            Error copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Error(Error&&) noexcept            = default;
    Error& operator=(Error&&) noexcept = default;
    ~Error()                           = default;

    ErrorCode code() const noexcept { return code_; }
    ErrorCategory category() const noexcept { return get_category(code_); }
    const std::string& message() const noexcept { return message_; }
    const SourceLocation& location() const noexcept { return location_; }
    const Context& context() const noexcept { return context_; }
    const Error* cause() const noexcept { return cause_.get(); }

    bool is_success() const noexcept { return code_ == ErrorCode::SUCCESS; }
    bool is_error() const noexcept { return code_ != ErrorCode::SUCCESS; }
    bool is_transient() const noexcept { return common::is_transient(code_); }

    explicit operator bool() const noexcept { return is_success(); }

    /// Attach a key/value pair printed by to_string()
    Error& with_context(std::string_view key, std::string_view value);

    /// Record the lower-level error that led to this one
    Error& with_cause(Error cause) {
        cause_ = std::make_unique<Error>(std::move(cause));
        return *this;
    }

    /**
     * @brief Multi-line description
     *
     * "[Category] NAME (0xCCEE): message", then the location, one line per
     * context entry and the cause chain.
     */
    std::string to_string() const;

private:
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
    SourceLocation location_;
    Context context_;
    std::unique_ptr<Error> cause_;
};

// ============================================================================
// RESULT
// ============================================================================

template<typename T = void>
class Result;

template<>
class Result<void> {
public:
    Result() noexcept = default;
    Result(ErrorCode code) : error_(code) {}
    Result(ErrorCode code, std::string_view message, SourceLocation location = TASKQ_CURRENT_LOCATION)
        : error_(code, message, location) {}
    Result(Error error) noexcept : error_(std::move(error)) {}

    bool is_success() const noexcept { return error_.is_success(); }
    bool is_error() const noexcept { return error_.is_error(); }
    explicit operator bool() const noexcept { return is_success(); }

    ErrorCode code() const noexcept { return error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

    ErrorCode error_code() const noexcept { return code(); }
    const std::string& error_message() const noexcept { return message(); }

    Result& with_cause(Error cause) {
        error_.with_cause(std::move(cause));
        return *this;
    }

private:
    Error error_;
};

/**
 * @brief Either a T or an Error
 *
 * value() requires is_success(). A successful Result reports
 * ErrorCode::SUCCESS from code() and an empty message().
 */
template<typename T>
class Result {
    static_assert(!std::is_reference_v<T>, "Result<T&> is not supported");

public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrorCode code) : state_(std::in_place_index<1>, code) {}
    Result(ErrorCode code, std::string_view message, SourceLocation location = TASKQ_CURRENT_LOCATION)
        : state_(std::in_place_index<1>, code, message, location) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool is_success() const noexcept { return state_.index() == 0; }
    bool is_error() const noexcept { return state_.index() != 0; }
    explicit operator bool() const noexcept { return is_success(); }

    T& value() & noexcept { return *std::get_if<0>(&state_); }
    const T& value() const& noexcept { return *std::get_if<0>(&state_); }
    T&& value() && noexcept { return std::move(*std::get_if<0>(&state_)); }

    T value_or(T fallback) const& { return is_success() ? value() : std::move(fallback); }
    T value_or(T fallback) && { return is_success() ? std::move(*this).value() : std::move(fallback); }

    const Error& error() const noexcept {
        if (const Error* failure = std::get_if<1>(&state_)) {
            return *failure;
        }
        return success_error();
    }

    ErrorCode code() const noexcept { return error().code(); }
    const std::string& message() const noexcept { return error().message(); }

    ErrorCode error_code() const noexcept { return code(); }
    const std::string& error_message() const noexcept { return message(); }

    Result& with_cause(Error cause) {
        if (Error* failure = std::get_if<1>(&state_)) {
            failure->with_cause(std::move(cause));
        }
        return *this;
    }

private:
    static const Error& success_error() noexcept {
        static const Error none;
        return none;
    }

    std::variant<T, Error> state_;
};

// ============================================================================
// CONSTRUCTION HELPERS
// ============================================================================

inline Result<void> ok() {
    return {};
}

template<typename T>
Result<T> ok(T value) {
    return Result<T>(std::move(value));
}

template<typename T = void>
Result<T> err(ErrorCode code, std::string_view message = {},
              SourceLocation location = TASKQ_CURRENT_LOCATION) {
    return Result<T>(code, message, location);
}

template<typename T = void>
Result<T> err(Error error) {
    return Result<T>(std::move(error));
}

// ============================================================================
// PROPAGATION
// ============================================================================

/// Return the error of a failed Result from the enclosing function
#define TASKQ_TRY(expr)                                      \
    do {                                                     \
        auto&& _taskq_result = (expr);                       \
        if (TASKQ_UNLIKELY(_taskq_result.is_error())) {      \
            return _taskq_result.error();                    \
        }                                                    \
    } while (0)

/// Move the value of a successful Result into var, or return its error
#define TASKQ_TRY_ASSIGN(var, expr)                          \
    auto _taskq_try_##var = (expr);                          \
    if (TASKQ_UNLIKELY(_taskq_try_##var.is_error())) {       \
        return _taskq_try_##var.error();                     \
    }                                                        \
    var = std::move(_taskq_try_##var).value()

}  // namespace taskq::common
