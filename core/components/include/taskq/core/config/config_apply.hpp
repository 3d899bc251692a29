#pragma once

/**
 * @file config_apply.hpp
 * @brief Turn loaded configuration into live objects
 */

#include <taskq/common/error.hpp>
#include <taskq/core/config/config_types.hpp>
#include <taskq/core/scheduler/priority_task_queue.hpp>

namespace taskq::core::config {

/**
 * @brief Constructor arguments for a PriorityTaskQueue
 */
PriorityTaskQueueConfig make_queue_config(const QueueConfig& config);

/**
 * @brief Replace the global logger's sinks and level
 *
 * Installs a ConsoleSink for "console", a rotating FileSink for "file", or
 * both. The TASKQ_LOG_LEVEL environment variable still overrides the level.
 * Fails with CONFIG_INVALID_VALUE for an unknown output and OS_ERROR when the
 * log file cannot be opened; on failure the logger is left unchanged.
 */
common::Result<void> apply_logging_config(const LoggingConfig& config);

}  // namespace taskq::core::config
