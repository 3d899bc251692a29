#pragma once

/**
 * @file config_types.hpp
 * @brief Configuration structures for taskq
 *
 * Structures map one-to-one onto the YAML/JSON layout:
 *
 *   queue:   { name, empty_queue_mode }
 *   logging: { level, output, file_path, max_file_size_mb, max_files,
 *              include_timestamp, include_thread_id, use_colors }
 */

#include <taskq/core/scheduler/priority.hpp>

#include <cstdint>
#include <string>

namespace taskq::core::config {

enum class ConfigFormat : uint8_t {
    AUTO,   ///< Auto-detect from file extension or content
    YAML,   ///< YAML format (default)
    JSON    ///< JSON format
};

/**
 * @brief Queue construction parameters
 */
struct QueueConfig {
    std::string name = "default";
    EmptyQueueMode empty_queue_mode = EmptyQueueMode::OPTIONAL;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";      ///< trace, debug, info, warn, error, fatal, off
    std::string output = "console";  ///< console, file, both
    std::string file_path;           ///< required for file and both
    uint32_t max_file_size_mb = 10;
    uint32_t max_files = 5;
    bool include_timestamp = true;
    bool include_thread_id = true;
    bool use_colors = true;
};

/**
 * @brief Complete configuration file contents
 */
struct TaskqConfig {
    QueueConfig queue;
    LoggingConfig logging;
};

}  // namespace taskq::core::config
