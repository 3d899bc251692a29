/**
 * @file config_loader.cpp
 * @brief Configuration loader implementation
 */

#include <taskq/core/config/config_loader.hpp>

#include <taskq/common/debug.hpp>

#include <yaml-cpp/yaml.h>
#include <json/json.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>

namespace taskq::core::config {

using common::ErrorCode;
using common::Result;

namespace {
constexpr std::string_view LOG_CAT = common::debug::category::CONFIG;
}  // namespace

// ============================================================================
// FACTORY
// ============================================================================

std::unique_ptr<ConfigLoader> create_config_loader() {
    return std::make_unique<ConfigLoaderImpl>();
}

// ============================================================================
// FORMAT DETECTION
// ============================================================================

ConfigFormat ConfigLoader::detect_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return ConfigFormat::JSON;
    }

    return ConfigFormat::YAML;
}

ConfigFormat ConfigLoader::detect_format_from_content(std::string_view content) {
    size_t pos = 0;
    while (pos < content.size() && std::isspace(static_cast<unsigned char>(content[pos]))) {
        ++pos;
    }

    if (pos < content.size() && (content[pos] == '{' || content[pos] == '[')) {
        return ConfigFormat::JSON;
    }

    return ConfigFormat::YAML;
}

// ============================================================================
// SHARED HELPERS
// ============================================================================

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Names accepted by debug::parse_log_level
bool is_known_log_level(std::string_view level) {
    static constexpr std::array<std::string_view, 11> names = {
        "trace", "debug", "info", "warn", "warning", "error",
        "err",   "fatal", "critical", "off", "none"};
    auto lower = to_lower(level);
    return std::find(names.begin(), names.end(), lower) != names.end();
}

Result<EmptyQueueMode> read_empty_queue_mode(const std::string& text) {
    return parse_empty_queue_mode(text);
}

}  // namespace

// ============================================================================
// YAML PARSING HELPERS
// ============================================================================

namespace {

// Type mismatches throw YAML::Exception and surface as CONFIG_PARSE_ERROR
template<typename T>
T yaml_get(const YAML::Node& node, const std::string& key, T default_value) {
    const YAML::Node value = node[key];
    if (value && !value.IsNull()) {
        return value.as<T>();
    }
    return default_value;
}

Result<QueueConfig> parse_queue_config(const YAML::Node& node) {
    QueueConfig config;
    if (!node || node.IsNull()) return config;
    if (!node.IsMap()) {
        return common::err<QueueConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                        "'queue' must be a mapping");
    }

    config.name = yaml_get<std::string>(node, "name", config.name);

    auto mode = read_empty_queue_mode(yaml_get<std::string>(node, "empty_queue_mode", "optional"));
    if (!mode) {
        return mode.error();
    }
    config.empty_queue_mode = mode.value();

    return config;
}

Result<LoggingConfig> parse_logging_config(const YAML::Node& node) {
    LoggingConfig config;
    if (!node || node.IsNull()) return config;
    if (!node.IsMap()) {
        return common::err<LoggingConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                          "'logging' must be a mapping");
    }

    config.level = yaml_get<std::string>(node, "level", config.level);
    config.output = yaml_get<std::string>(node, "output", config.output);
    config.file_path = yaml_get<std::string>(node, "file_path", config.file_path);
    config.max_file_size_mb = yaml_get<uint32_t>(node, "max_file_size_mb", config.max_file_size_mb);
    config.max_files = yaml_get<uint32_t>(node, "max_files", config.max_files);
    config.include_timestamp = yaml_get(node, "include_timestamp", config.include_timestamp);
    config.include_thread_id = yaml_get(node, "include_thread_id", config.include_thread_id);
    config.use_colors = yaml_get(node, "use_colors", config.use_colors);

    return config;
}

Result<TaskqConfig> parse_config_from_yaml(const YAML::Node& root) {
    TaskqConfig config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) {
        return common::err<TaskqConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                        "configuration root must be a mapping");
    }

    QueueConfig queue;
    TASKQ_TRY_ASSIGN(queue, parse_queue_config(root["queue"]));
    LoggingConfig logging;
    TASKQ_TRY_ASSIGN(logging, parse_logging_config(root["logging"]));

    config.queue = std::move(queue);
    config.logging = std::move(logging);
    return config;
}

std::string serialize_to_yaml(const TaskqConfig& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "queue" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << config.queue.name;
    out << YAML::Key << "empty_queue_mode" << YAML::Value
        << std::string(empty_queue_mode_name(config.queue.empty_queue_mode));
    out << YAML::EndMap;

    const auto& log = config.logging;
    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << log.level;
    out << YAML::Key << "output" << YAML::Value << log.output;
    out << YAML::Key << "file_path" << YAML::Value << YAML::DoubleQuoted << log.file_path;
    out << YAML::Key << "max_file_size_mb" << YAML::Value << log.max_file_size_mb;
    out << YAML::Key << "max_files" << YAML::Value << log.max_files;
    out << YAML::Key << "include_timestamp" << YAML::Value << log.include_timestamp;
    out << YAML::Key << "include_thread_id" << YAML::Value << log.include_thread_id;
    out << YAML::Key << "use_colors" << YAML::Value << log.use_colors;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

}  // namespace

// ============================================================================
// JSON PARSING HELPERS
// ============================================================================

namespace {

template<typename T>
T json_get(const Json::Value& node, const std::string& key, T default_value);

template<>
std::string json_get<std::string>(const Json::Value& node, const std::string& key, std::string default_value) {
    return node.get(key, default_value).asString();
}

template<>
bool json_get<bool>(const Json::Value& node, const std::string& key, bool default_value) {
    return node.get(key, default_value).asBool();
}

template<>
uint32_t json_get<uint32_t>(const Json::Value& node, const std::string& key, uint32_t default_value) {
    return node.get(key, default_value).asUInt();
}

Result<QueueConfig> parse_queue_config_json(const Json::Value& node) {
    QueueConfig config;
    if (node.isNull()) return config;
    if (!node.isObject()) {
        return common::err<QueueConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                        "'queue' must be an object");
    }

    config.name = json_get<std::string>(node, "name", config.name);

    auto mode = read_empty_queue_mode(json_get<std::string>(node, "empty_queue_mode", "optional"));
    if (!mode) {
        return mode.error();
    }
    config.empty_queue_mode = mode.value();

    return config;
}

Result<LoggingConfig> parse_logging_config_json(const Json::Value& node) {
    LoggingConfig config;
    if (node.isNull()) return config;
    if (!node.isObject()) {
        return common::err<LoggingConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                          "'logging' must be an object");
    }

    config.level = json_get<std::string>(node, "level", config.level);
    config.output = json_get<std::string>(node, "output", config.output);
    config.file_path = json_get<std::string>(node, "file_path", config.file_path);
    config.max_file_size_mb = json_get<uint32_t>(node, "max_file_size_mb", config.max_file_size_mb);
    config.max_files = json_get<uint32_t>(node, "max_files", config.max_files);
    config.include_timestamp = json_get<bool>(node, "include_timestamp", config.include_timestamp);
    config.include_thread_id = json_get<bool>(node, "include_thread_id", config.include_thread_id);
    config.use_colors = json_get<bool>(node, "use_colors", config.use_colors);

    return config;
}

Result<TaskqConfig> parse_config_from_json(const Json::Value& root) {
    if (!root.isObject()) {
        return common::err<TaskqConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                        "configuration root must be an object");
    }

    TaskqConfig config;
    QueueConfig queue;
    TASKQ_TRY_ASSIGN(queue, parse_queue_config_json(root["queue"]));
    LoggingConfig logging;
    TASKQ_TRY_ASSIGN(logging, parse_logging_config_json(root["logging"]));

    config.queue = std::move(queue);
    config.logging = std::move(logging);
    return config;
}

std::string serialize_to_json(const TaskqConfig& config) {
    Json::Value root(Json::objectValue);

    Json::Value& queue = root["queue"];
    queue["name"] = config.queue.name;
    queue["empty_queue_mode"] = std::string(empty_queue_mode_name(config.queue.empty_queue_mode));

    const auto& log = config.logging;
    Json::Value& logging = root["logging"];
    logging["level"] = log.level;
    logging["output"] = log.output;
    logging["file_path"] = log.file_path;
    logging["max_file_size_mb"] = Json::UInt(log.max_file_size_mb);
    logging["max_files"] = Json::UInt(log.max_files);
    logging["include_timestamp"] = log.include_timestamp;
    logging["include_thread_id"] = log.include_thread_id;
    logging["use_colors"] = log.use_colors;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root) + "\n";
}

}  // namespace

// ============================================================================
// IMPLEMENTATION
// ============================================================================

Result<std::string> ConfigLoaderImpl::read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Result<std::string>(
            ErrorCode::CONFIG_FILE_NOT_FOUND,
            "Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<std::string>(
            ErrorCode::OS_ERROR,
            "Failed to open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return Result<std::string>(buffer.str());
}

Result<void> ConfigLoaderImpl::write_file(const std::filesystem::path& path,
                                          std::string_view content) {
    auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Result<void>(
                ErrorCode::OS_ERROR,
                "Failed to create directory: " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return Result<void>(
            ErrorCode::OS_ERROR,
            "Failed to open file for writing: " + path.string());
    }

    file << content;
    file.flush();
    if (!file.good()) {
        return Result<void>(
            ErrorCode::OS_ERROR,
            "Failed to write to file: " + path.string());
    }

    return Result<void>();
}

ConfigFormat ConfigLoaderImpl::resolve_format(const std::filesystem::path& path, ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        return detect_format(path);
    }
    return format;
}

// ============================================================================
// LOADING
// ============================================================================

Result<TaskqConfig> ConfigLoaderImpl::load(const std::filesystem::path& path, ConfigFormat format) {
    auto content_result = read_file(path);
    if (!content_result) {
        TASKQ_LOG_ERROR(LOG_CAT, content_result.error_message());
        return content_result.error();
    }

    auto result = parse(content_result.value(), resolve_format(path, format));
    if (!result) {
        TASKQ_LOG_ERROR(LOG_CAT, "Rejected " << path.string() << ": " << result.error_message());
        common::Error error = result.error();
        error.with_context("file", path.string());
        return error;
    }

    TASKQ_LOG_INFO(LOG_CAT, "Loaded configuration from " << path.string()
                                << " (queue=" << result.value().queue.name << ")");
    return result;
}

Result<TaskqConfig> ConfigLoaderImpl::parse(std::string_view content, ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        format = detect_format_from_content(content);
    }

    Result<TaskqConfig> parsed = ErrorCode::UNKNOWN_ERROR;
    try {
        if (format == ConfigFormat::JSON) {
            Json::Value root;
            Json::CharReaderBuilder builder;
            std::string errors;
            std::istringstream stream{std::string{content}};

            if (!Json::parseFromStream(builder, stream, &root, &errors)) {
                return Result<TaskqConfig>(
                    ErrorCode::CONFIG_PARSE_ERROR,
                    "JSON parse error: " + errors);
            }

            parsed = parse_config_from_json(root);
        } else {
            YAML::Node root = YAML::Load(std::string(content));
            parsed = parse_config_from_yaml(root);
        }
    } catch (const std::exception& e) {
        return Result<TaskqConfig>(
            ErrorCode::CONFIG_PARSE_ERROR,
            std::string("Parse error: ") + e.what());
    }

    if (!parsed) {
        return parsed;
    }

    TASKQ_TRY(validate(parsed.value()));
    return parsed;
}

// ============================================================================
// SERIALIZATION
// ============================================================================

Result<std::string> ConfigLoaderImpl::serialize(const TaskqConfig& config, ConfigFormat format) {
    try {
        if (format == ConfigFormat::JSON) {
            return Result<std::string>(serialize_to_json(config));
        }
        return Result<std::string>(serialize_to_yaml(config));
    } catch (const std::exception& e) {
        return Result<std::string>(
            ErrorCode::CONFIG_INVALID,
            std::string("Serialization error: ") + e.what());
    }
}

Result<void> ConfigLoaderImpl::save(const TaskqConfig& config, const std::filesystem::path& path,
                                    ConfigFormat format) {
    TASKQ_TRY(validate(config));

    auto result = serialize(config, resolve_format(path, format));
    if (!result) {
        return result.error();
    }

    TASKQ_TRY(write_file(path, result.value()));
    TASKQ_LOG_DEBUG(LOG_CAT, "Saved configuration to " << path.string());
    return Result<void>();
}

// ============================================================================
// VALIDATION
// ============================================================================

Result<void> ConfigLoaderImpl::validate(const TaskqConfig& config) {
    if (config.queue.name.empty()) {
        return Result<void>(
            ErrorCode::CONFIG_REQUIRED_MISSING,
            "queue.name is required");
    }

    if (config.queue.empty_queue_mode != EmptyQueueMode::OPTIONAL &&
        config.queue.empty_queue_mode != EmptyQueueMode::STRICT) {
        return Result<void>(
            ErrorCode::CONFIG_INVALID_VALUE,
            "queue.empty_queue_mode must be 'optional' or 'strict'");
    }

    const auto& log = config.logging;
    if (!is_known_log_level(log.level)) {
        return Result<void>(
            ErrorCode::CONFIG_INVALID_VALUE,
            "logging.level '" + log.level + "' is not a log level");
    }

    auto output = to_lower(log.output);
    if (output != "console" && output != "file" && output != "both") {
        return Result<void>(
            ErrorCode::CONFIG_INVALID_VALUE,
            "logging.output must be console, file or both, got '" + log.output + "'");
    }

    if (output != "console" && log.file_path.empty()) {
        return Result<void>(
            ErrorCode::CONFIG_REQUIRED_MISSING,
            "logging.file_path is required when logging.output is " + output);
    }

    if (log.max_files == 0) {
        return Result<void>(
            ErrorCode::CONFIG_INVALID_VALUE,
            "logging.max_files must be at least 1");
    }

    return Result<void>();
}

}  // namespace taskq::core::config
