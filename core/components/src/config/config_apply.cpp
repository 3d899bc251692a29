#include <taskq/core/config/config_apply.hpp>

#include <taskq/common/debug.hpp>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>

namespace taskq::core::config {

using common::ErrorCode;
using common::Result;
namespace debug = common::debug;

PriorityTaskQueueConfig make_queue_config(const QueueConfig& config) {
    PriorityTaskQueueConfig queue_config;
    queue_config.name             = config.name;
    queue_config.empty_queue_mode = config.empty_queue_mode;
    return queue_config;
}

Result<void> apply_logging_config(const LoggingConfig& config) {
    std::string output = config.output;
    std::transform(output.begin(), output.end(), output.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    bool to_console = output == "console" || output == "both";
    bool to_file    = output == "file" || output == "both";
    if (!to_console && !to_file) {
        return Result<void>(ErrorCode::CONFIG_INVALID_VALUE,
                            "unknown logging output '" + config.output + "'");
    }

    std::vector<std::shared_ptr<debug::ILogSink>> sinks;

    if (to_console) {
        debug::ConsoleSink::Config console;
        console.use_colors        = config.use_colors;
        console.include_timestamp = config.include_timestamp;
        console.include_thread_id = config.include_thread_id;
        sinks.push_back(std::make_shared<debug::ConsoleSink>(console));
    }

    if (to_file) {
        if (config.file_path.empty()) {
            return Result<void>(ErrorCode::CONFIG_REQUIRED_MISSING,
                                "logging.file_path is required for output '" + output + "'");
        }

        debug::FileSink::Config file;
        file.file_path         = config.file_path;
        file.max_file_size     = static_cast<size_t>(config.max_file_size_mb) * 1024 * 1024;
        file.max_files         = config.max_files;
        file.include_timestamp = config.include_timestamp;
        file.include_thread_id = config.include_thread_id;

        auto sink = std::make_shared<debug::FileSink>(std::move(file));
        if (!sink->is_ready()) {
            return Result<void>(ErrorCode::OS_ERROR,
                                "cannot open log file " + config.file_path);
        }
        sinks.push_back(std::move(sink));
    }

    debug::Logger::instance().replace_sinks(std::move(sinks));
    debug::init_logging(debug::parse_log_level(config.level));

    TASKQ_LOG_DEBUG(debug::category::CONFIG,
                    "Logging configured: level=" << config.level << " output=" << output);
    return Result<void>();
}

}  // namespace taskq::core::config
