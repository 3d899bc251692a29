#pragma once

/**
 * @file config_loader.hpp
 * @brief Configuration loader for taskq
 *
 * Loads queue and logging configuration from YAML (default) or JSON.
 */

#include <taskq/common/error.hpp>
#include <taskq/core/config/config_types.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace taskq::core::config {

/**
 * @brief Configuration loader interface
 */
class ConfigLoader {
public:
    virtual ~ConfigLoader() = default;

    // ========================================================================
    // FORMAT DETECTION
    // ========================================================================

    /**
     * @brief Detect format from file extension
     * @return JSON for .json, YAML otherwise
     */
    static ConfigFormat detect_format(const std::filesystem::path& path);

    /**
     * @brief Detect format from content
     * @return JSON when the first non-blank character is '{' or '[', YAML otherwise
     */
    static ConfigFormat detect_format_from_content(std::string_view content);

    // ========================================================================
    // LOADING
    // ========================================================================

    /**
     * @brief Load and validate configuration from file
     * @param path Path to configuration file
     * @param format Format override (AUTO to detect from extension)
     */
    virtual common::Result<TaskqConfig> load(const std::filesystem::path& path,
                                             ConfigFormat format = ConfigFormat::AUTO) = 0;

    /**
     * @brief Parse and validate configuration from a string
     * @param format Format of content (AUTO to detect from content)
     */
    virtual common::Result<TaskqConfig> parse(std::string_view content,
                                              ConfigFormat format = ConfigFormat::AUTO) = 0;

    // ========================================================================
    // SERIALIZATION
    // ========================================================================

    virtual common::Result<std::string> serialize(const TaskqConfig& config,
                                                  ConfigFormat format = ConfigFormat::YAML) = 0;

    /**
     * @brief Serialize to file, creating parent directories as needed
     * @param format Format (AUTO to detect from extension)
     */
    virtual common::Result<void> save(const TaskqConfig& config, const std::filesystem::path& path,
                                      ConfigFormat format = ConfigFormat::AUTO) = 0;

    // ========================================================================
    // VALIDATION
    // ========================================================================

    virtual common::Result<void> validate(const TaskqConfig& config) = 0;
};

/**
 * @brief yaml-cpp / jsoncpp backed loader
 */
class ConfigLoaderImpl : public ConfigLoader {
public:
    ConfigLoaderImpl() = default;
    ~ConfigLoaderImpl() override = default;

    common::Result<TaskqConfig> load(const std::filesystem::path& path,
                                     ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<TaskqConfig> parse(std::string_view content,
                                      ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<std::string> serialize(const TaskqConfig& config,
                                          ConfigFormat format = ConfigFormat::YAML) override;

    common::Result<void> save(const TaskqConfig& config, const std::filesystem::path& path,
                              ConfigFormat format = ConfigFormat::AUTO) override;

    common::Result<void> validate(const TaskqConfig& config) override;

private:
    common::Result<std::string> read_file(const std::filesystem::path& path);
    common::Result<void> write_file(const std::filesystem::path& path, std::string_view content);
    ConfigFormat resolve_format(const std::filesystem::path& path, ConfigFormat format);
};

/**
 * @brief Create the default configuration loader
 */
std::unique_ptr<ConfigLoader> create_config_loader();

}  // namespace taskq::core::config
