#include <taskq/common/debug.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

#if defined(TASKQ_OS_POSIX)
    #include <pthread.h>
#endif

namespace taskq::common::debug {

namespace {

thread_local std::string tls_thread_name;

// ANSI escapes, empty when colors are off
struct Palette {
    const char* reset    = "";
    const char* dim      = "";
    const char* category = "";
    const char* level    = "";
};

constexpr const char* ansi_for(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "\033[1;90m";
        case LogLevel::DEBUG: return "\033[1;36m";
        case LogLevel::INFO:  return "\033[1;32m";
        case LogLevel::WARN:  return "\033[1;33m";
        case LogLevel::ERROR: return "\033[1;31m";
        case LogLevel::FATAL: return "\033[1;35m";
        default:              return "";
    }
}

Palette palette_for(LogLevel level, bool colored) noexcept {
    if (!colored) {
        return {};
    }
    return {"\033[0m", "\033[2m", "\033[34m", ansi_for(level)};
}

void put_timestamp(std::ostream& out, std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;

    std::tm local{};
#if defined(TASKQ_OS_WINDOWS)
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    const char fill = out.fill('0');
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << millis;
    out.fill(fill);
}

void put_thread(std::ostream& out, const LogRecord& record, bool prefer_name) {
    out << "[T:";
    if (prefer_name && !record.thread_name.empty()) {
        out << record.thread_name;
    } else {
        out << std::hex << record.thread_id << std::dec;
    }
    out << ']';
}

bool terminal_supports_color() noexcept {
#if defined(TASKQ_OS_WINDOWS)
    return !platform::get_env("WT_SESSION").empty();
#else
    return platform::is_terminal(::fileno(stdout));
#endif
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    struct Alias {
        std::string_view name;
        LogLevel level;
    };
    static constexpr std::array<Alias, 11> aliases = {{
        {"trace", LogLevel::TRACE},
        {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},
        {"warn", LogLevel::WARN},
        {"warning", LogLevel::WARN},
        {"error", LogLevel::ERROR},
        {"err", LogLevel::ERROR},
        {"fatal", LogLevel::FATAL},
        {"critical", LogLevel::FATAL},
        {"off", LogLevel::OFF},
        {"none", LogLevel::OFF},
    }};

    for (const auto& alias : aliases) {
        if (alias.name.size() != name.size()) {
            continue;
        }
        bool same = true;
        for (size_t i = 0; i < name.size() && same; ++i) {
            same = std::tolower(static_cast<unsigned char>(name[i])) == alias.name[i];
        }
        if (same) {
            return alias.level;
        }
    }
    return LogLevel::INFO;
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::set_category_level(std::string_view category, LogLevel level) {
    std::lock_guard lock(mutex_);
    overrides_.insert_or_assign(std::string(category), level);
    has_overrides_.store(true, std::memory_order_release);
}

bool LogFilter::should_log(LogLevel level, std::string_view category) const noexcept {
    if (level >= LogLevel::OFF) {
        return false;
    }

    if (!category.empty() && has_overrides_.load(std::memory_order_acquire)) {
        std::lock_guard lock(mutex_);
        if (auto it = overrides_.find(category); it != overrides_.end()) {
            return level >= it->second;
        }
    }

    return level >= level_.load(std::memory_order_relaxed);
}

void LogFilter::reset() noexcept {
    std::lock_guard lock(mutex_);
    overrides_.clear();
    has_overrides_.store(false, std::memory_order_release);
    level_.store(LogLevel::INFO, std::memory_order_relaxed);
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {
    config_.use_colors = config_.use_colors && terminal_supports_color();
}

ConsoleSink::~ConsoleSink() {
    flush();
}

void ConsoleSink::write(const LogRecord& record) {
    const Palette ink = palette_for(record.level, config_.use_colors);

    std::ostringstream line;
    if (config_.include_timestamp) {
        line << ink.dim;
        put_timestamp(line, record.timestamp);
        line << ink.reset << ' ';
    }
    line << ink.level << '[' << level_char(record.level) << ']' << ink.reset << ' ';
    if (!record.category.empty()) {
        line << ink.category << '[' << record.category << ']' << ink.reset << ' ';
    }
    if (config_.include_thread_id) {
        line << ink.dim;
        put_thread(line, record, true);
        line << ink.reset << ' ';
    }
    line << record.message;
    if (config_.include_location && record.location.is_valid()) {
        line << ink.dim << " (" << record.location.file << ':' << record.location.line << ')'
             << ink.reset;
    }
    line << '\n';

    const bool to_stderr = config_.use_stderr && record.level >= LogLevel::ERROR;

    std::lock_guard lock(mutex_);
    (to_stderr ? std::cerr : std::cout) << line.str();
}

void ConsoleSink::flush() {
    std::lock_guard lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

struct FileSink::Impl {
    explicit Impl(Config cfg) : config(std::move(cfg)) { reopen(); }

    void reopen() {
        out.open(config.file_path, std::ios::out | std::ios::app);
        bytes = 0;
        if (out.is_open()) {
            std::error_code ec;
            auto size = std::filesystem::file_size(config.file_path, ec);
            bytes     = ec ? 0 : static_cast<size_t>(size);
        }
    }

    std::string numbered(uint32_t n) const { return config.file_path + "." + std::to_string(n); }

    void rotate() {
        out.close();

        std::error_code ec;
        std::filesystem::remove(numbered(config.max_files), ec);
        for (uint32_t n = config.max_files; n > 1; --n) {
            std::filesystem::rename(numbered(n - 1), numbered(n), ec);
        }
        if (config.max_files > 0) {
            std::filesystem::rename(config.file_path, numbered(1), ec);
        } else {
            std::filesystem::remove(config.file_path, ec);
        }

        reopen();
    }

    Config config;
    std::ofstream out;
    size_t bytes = 0;
    mutable std::mutex mutex;
};

FileSink::FileSink(Config config) : impl_(std::make_unique<Impl>(std::move(config))) {}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogRecord& record) {
    std::ostringstream line;
    if (impl_->config.include_timestamp) {
        put_timestamp(line, record.timestamp);
        line << ' ';
    }
    line << level_name(record.level) << ' ';
    if (!record.category.empty()) {
        line << '[' << record.category << "] ";
    }
    if (impl_->config.include_thread_id) {
        put_thread(line, record, false);
        line << ' ';
    }
    line << record.message;
    if (record.location.is_valid()) {
        line << " (" << record.location.file << ':' << record.location.line << ')';
    }
    line << '\n';
    const std::string text = line.str();

    std::lock_guard lock(impl_->mutex);
    if (!impl_->out.is_open()) {
        return;
    }
    impl_->out << text;
    impl_->bytes += text.size();

    if (impl_->config.max_file_size != 0 && impl_->bytes >= impl_->config.max_file_size) {
        impl_->rotate();
    }
}

void FileSink::flush() {
    std::lock_guard lock(impl_->mutex);
    if (impl_->out.is_open()) {
        impl_->out.flush();
    }
}

bool FileSink::is_ready() const noexcept {
    std::lock_guard lock(impl_->mutex);
    return impl_->out.is_open();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() noexcept {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    sinks_.push_back(std::make_shared<ConsoleSink>());
}

Logger::~Logger() {
    flush();
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (sink == nullptr) {
        return;
    }
    std::lock_guard lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(sinks_mutex_);
    sinks_.clear();
}

void Logger::replace_sinks(std::vector<std::shared_ptr<ILogSink>> sinks) {
    std::erase(sinks, nullptr);
    {
        std::lock_guard lock(sinks_mutex_);
        sinks_.swap(sinks);
    }
    for (const auto& sink : sinks) {
        sink->flush();
    }
}

std::vector<std::shared_ptr<ILogSink>> Logger::snapshot_sinks() const {
    std::lock_guard lock(sinks_mutex_);
    return sinks_;
}

size_t Logger::sink_count() const {
    std::lock_guard lock(sinks_mutex_);
    return sinks_.size();
}

void Logger::log(LogLevel level, std::string_view category, std::string message,
                 SourceLocation location) {
    if (!filter_.should_log(level, category)) {
        return;
    }

    LogRecord record;
    record.level       = level;
    record.category    = category;
    record.message     = std::move(message);
    record.location    = location;
    record.timestamp   = std::chrono::system_clock::now();
    record.thread_id   = platform::get_thread_id();
    record.thread_name = tls_thread_name;

    for (const auto& sink : snapshot_sinks()) {
        if (sink->is_ready()) {
            sink->write(record);
        }
    }
}

void Logger::flush() {
    for (const auto& sink : snapshot_sinks()) {
        sink->flush();
    }
}

void Logger::set_thread_name(std::string_view name) {
    tls_thread_name.assign(name.data(), name.size());

#if defined(TASKQ_OS_LINUX)
    // The kernel keeps at most 15 bytes of a thread name
    ::pthread_setname_np(::pthread_self(), tls_thread_name.substr(0, 15).c_str());
#elif defined(TASKQ_OS_MACOS)
    ::pthread_setname_np(tls_thread_name.c_str());
#endif
}

std::string_view Logger::get_thread_name() noexcept {
    return tls_thread_name;
}

void init_logging(LogLevel level) {
    const std::string from_env = platform::get_env("TASKQ_LOG_LEVEL");
    Logger::instance().set_level(from_env.empty() ? level : parse_log_level(from_env));
}

void shutdown_logging() {
    auto& logger = Logger::instance();
    logger.flush();
    logger.clear_sinks();
}

}  // namespace taskq::common::debug
