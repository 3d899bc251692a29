#pragma once

/**
 * @file debug.hpp
 * @brief Logging for taskq
 *
 * A process-wide Logger fans records out to pluggable sinks. Records below
 * the filter's level are dropped before the message is formatted, so the
 * TASKQ_LOG_* macros cost one atomic load when disabled.
 */

#include "error.hpp"
#include "platform.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace taskq::common::debug {

// ============================================================================
// LEVELS AND CATEGORIES
// ============================================================================

enum class LogLevel : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6,
};

namespace detail {
inline constexpr std::array<std::string_view, 7> level_names = {
    "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};
inline constexpr std::string_view level_chars = "TDIWEF";
}  // namespace detail

constexpr std::string_view level_name(LogLevel level) noexcept {
    auto index = static_cast<size_t>(level);
    return index < detail::level_names.size() ? detail::level_names[index] : "UNKNOWN";
}

/// One-letter tag used by the console sink; '?' for OFF
constexpr char level_char(LogLevel level) noexcept {
    auto index = static_cast<size_t>(level);
    return index < detail::level_chars.size() ? detail::level_chars[index] : '?';
}

/**
 * @brief Case-insensitive level lookup
 *
 * Accepts the level names plus WARNING, ERR, CRITICAL and NONE.
 * Anything else maps to INFO.
 */
TASKQ_API LogLevel parse_log_level(std::string_view name) noexcept;

namespace category {
inline constexpr std::string_view GENERAL = "general";
inline constexpr std::string_view QUEUE   = "queue";
inline constexpr std::string_view CONFIG  = "config";
}  // namespace category

// ============================================================================
// RECORDS AND SINKS
// ============================================================================

struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string_view category;
    std::string message;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id = 0;
    std::string_view thread_name;  ///< Empty unless Logger::set_thread_name was called
};

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush()                        = 0;

    /// Records are only dispatched to ready sinks
    virtual bool is_ready() const noexcept = 0;
};

/**
 * @brief Line-oriented sink for stdout, optionally stderr for ERROR and FATAL
 *
 * use_colors is cleared at construction when stdout is not a terminal.
 */
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool use_colors        = true;
        bool use_stderr        = false;
        bool include_timestamp = true;
        bool include_thread_id = true;
        bool include_location  = true;
    };

    ConsoleSink() : ConsoleSink(Config{}) {}
    explicit ConsoleSink(const Config& config);
    ~ConsoleSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override { return true; }

    const Config& config() const noexcept { return config_; }

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * @brief Appending file sink with numbered rotation
 *
 * Once the file reaches max_file_size bytes it becomes "<path>.1", existing
 * "<path>.N" files move to N+1 and anything past max_files is deleted.
 * A sink whose file cannot be opened reports !is_ready() and drops writes.
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string file_path;
        size_t max_file_size   = 10 * 1024 * 1024;  ///< 0 disables rotation
        uint32_t max_files     = 5;
        bool include_timestamp = true;
        bool include_thread_id = true;
    };

    explicit FileSink(Config config);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    void write(const LogRecord& record) override {
        if (callback_) {
            callback_(record);
        }
    }
    void flush() override {}
    bool is_ready() const noexcept override { return static_cast<bool>(callback_); }

private:
    Callback callback_;
};

// ============================================================================
// FILTER
// ============================================================================

/**
 * @brief Minimum level, optionally overridden per category
 *
 * A category override replaces the global level for that category, so it
 * can both widen and narrow what gets through. OFF records never pass.
 */
class LogFilter {
public:
    void set_level(LogLevel level) noexcept { level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const noexcept { return level_.load(std::memory_order_relaxed); }

    void set_category_level(std::string_view category, LogLevel level);

    bool should_log(LogLevel level, std::string_view category) const noexcept;

    /// Back to INFO without overrides
    void reset() noexcept;

private:
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::atomic<bool> has_overrides_{false};
    mutable std::mutex mutex_;
    std::map<std::string, LogLevel, std::less<>> overrides_;
};

// ============================================================================
// LOGGER
// ============================================================================

class Logger {
public:
    /// Process-wide logger, created with one default ConsoleSink
    static Logger& instance() noexcept;

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    /// Null sinks are ignored
    void add_sink(std::shared_ptr<ILogSink> sink);
    void clear_sinks();

    /// Swap the whole sink set at once; the previous sinks are flushed
    void replace_sinks(std::vector<std::shared_ptr<ILogSink>> sinks);
    size_t sink_count() const;

    LogFilter& filter() noexcept { return filter_; }
    const LogFilter& filter() const noexcept { return filter_; }

    void set_level(LogLevel level) noexcept { filter_.set_level(level); }

    bool is_enabled(LogLevel level, std::string_view category = {}) const noexcept {
        return filter_.should_log(level, category);
    }

    /// Sinks are called without the logger lock held, so they may log themselves
    void log(LogLevel level, std::string_view category, std::string message,
             SourceLocation location = TASKQ_CURRENT_LOCATION);

    void flush();

    /// Label the calling thread in its log records and, where supported, in the OS
    static void set_thread_name(std::string_view name);
    static std::string_view get_thread_name() noexcept;

private:
    Logger();
    ~Logger();

    std::vector<std::shared_ptr<ILogSink>> snapshot_sinks() const;

    LogFilter filter_;
    mutable std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
};

// ============================================================================
// MACROS
// ============================================================================

#define TASKQ_LOG_ENABLED(level) \
    ::taskq::common::debug::Logger::instance().is_enabled(::taskq::common::debug::LogLevel::level)

// The streamed expression is only evaluated when the record will be kept
#define TASKQ_LOG_AT(level, cat, ...)                                                         \
    do {                                                                                      \
        auto& _taskq_log = ::taskq::common::debug::Logger::instance();                        \
        if (_taskq_log.is_enabled(::taskq::common::debug::LogLevel::level, (cat))) {          \
            std::ostringstream _taskq_msg;                                                    \
            _taskq_msg << __VA_ARGS__;                                                        \
            _taskq_log.log(::taskq::common::debug::LogLevel::level, (cat), _taskq_msg.str(),  \
                           TASKQ_CURRENT_LOCATION);                                           \
        }                                                                                     \
    } while (0)

#define TASKQ_LOG_TRACE(cat, ...) TASKQ_LOG_AT(TRACE, cat, __VA_ARGS__)
#define TASKQ_LOG_DEBUG(cat, ...) TASKQ_LOG_AT(DEBUG, cat, __VA_ARGS__)
#define TASKQ_LOG_INFO(cat, ...)  TASKQ_LOG_AT(INFO, cat, __VA_ARGS__)
#define TASKQ_LOG_WARN(cat, ...)  TASKQ_LOG_AT(WARN, cat, __VA_ARGS__)
#define TASKQ_LOG_ERROR(cat, ...) TASKQ_LOG_AT(ERROR, cat, __VA_ARGS__)
#define TASKQ_LOG_FATAL(cat, ...) TASKQ_LOG_AT(FATAL, cat, __VA_ARGS__)

#define TASKQ_TRACE(...) TASKQ_LOG_TRACE(::taskq::common::debug::category::GENERAL, __VA_ARGS__)
#define TASKQ_DEBUG(...) TASKQ_LOG_DEBUG(::taskq::common::debug::category::GENERAL, __VA_ARGS__)
#define TASKQ_INFO(...)  TASKQ_LOG_INFO(::taskq::common::debug::category::GENERAL, __VA_ARGS__)
#define TASKQ_WARN(...)  TASKQ_LOG_WARN(::taskq::common::debug::category::GENERAL, __VA_ARGS__)
#define TASKQ_ERROR(...) TASKQ_LOG_ERROR(::taskq::common::debug::category::GENERAL, __VA_ARGS__)
#define TASKQ_FATAL(...) TASKQ_LOG_FATAL(::taskq::common::debug::category::GENERAL, __VA_ARGS__)

// ============================================================================
// SETUP
// ============================================================================

/// Set the global level; a TASKQ_LOG_LEVEL environment variable takes precedence
TASKQ_API void init_logging(LogLevel level = LogLevel::INFO);

/// Flush and detach every sink
TASKQ_API void shutdown_logging();

}  // namespace taskq::common::debug
