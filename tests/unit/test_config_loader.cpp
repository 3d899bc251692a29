/**
 * @file test_config_loader.cpp
 * @brief Unit tests for configuration loading and application
 *
 * Tests coverage for:
 * - Format detection from extension and content
 * - YAML and JSON parsing with defaults
 * - Validation failures
 * - Serialization, save and reload
 * - make_queue_config / apply_logging_config
 */

#include <taskq/common/debug.hpp>
#include <taskq/core/config/config_apply.hpp>
#include <taskq/core/config/config_loader.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

using namespace taskq::core;
using namespace taskq::core::config;
using namespace taskq::common;

namespace {

constexpr const char* FULL_YAML = R"(
queue:
  name: jobs
  empty_queue_mode: strict
logging:
  level: debug
  output: both
  file_path: /tmp/taskq.log
  max_file_size_mb: 20
  max_files: 3
  include_timestamp: false
  include_thread_id: false
  use_colors: false
)";

constexpr const char* FULL_JSON = R"({
  "queue": { "name": "jobs", "empty_queue_mode": "strict" },
  "logging": {
    "level": "debug",
    "output": "both",
    "file_path": "/tmp/taskq.log",
    "max_file_size_mb": 20,
    "max_files": 3,
    "include_timestamp": false,
    "include_thread_id": false,
    "use_colors": false
  }
})";

void expect_full_config(const TaskqConfig& config) {
    EXPECT_EQ(config.queue.name, "jobs");
    EXPECT_EQ(config.queue.empty_queue_mode, EmptyQueueMode::STRICT);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.output, "both");
    EXPECT_EQ(config.logging.file_path, "/tmp/taskq.log");
    EXPECT_EQ(config.logging.max_file_size_mb, 20u);
    EXPECT_EQ(config.logging.max_files, 3u);
    EXPECT_FALSE(config.logging.include_timestamp);
    EXPECT_FALSE(config.logging.include_thread_id);
    EXPECT_FALSE(config.logging.use_colors);
}

}  // namespace

// ============================================================================
// Format Detection Tests
// ============================================================================

class FormatDetectionTest : public ::testing::Test {};

TEST_F(FormatDetectionTest, FromExtension) {
    EXPECT_EQ(ConfigLoader::detect_format("taskq.yaml"), ConfigFormat::YAML);
    EXPECT_EQ(ConfigLoader::detect_format("taskq.yml"), ConfigFormat::YAML);
    EXPECT_EQ(ConfigLoader::detect_format("taskq.JSON"), ConfigFormat::JSON);
    EXPECT_EQ(ConfigLoader::detect_format("taskq"), ConfigFormat::YAML);
}

TEST_F(FormatDetectionTest, FromContent) {
    EXPECT_EQ(ConfigLoader::detect_format_from_content("  \n{ }"), ConfigFormat::JSON);
    EXPECT_EQ(ConfigLoader::detect_format_from_content("[1]"), ConfigFormat::JSON);
    EXPECT_EQ(ConfigLoader::detect_format_from_content("---\nqueue: {}"), ConfigFormat::YAML);
    EXPECT_EQ(ConfigLoader::detect_format_from_content(""), ConfigFormat::YAML);
}

// ============================================================================
// Parsing Tests
// ============================================================================

class ConfigParseTest : public ::testing::Test {
protected:
    std::unique_ptr<ConfigLoader> loader_ = create_config_loader();
};

TEST_F(ConfigParseTest, YamlAllFields) {
    auto result = loader_->parse(FULL_YAML);
    ASSERT_TRUE(result.is_success()) << result.error().to_string();
    expect_full_config(result.value());
}

TEST_F(ConfigParseTest, JsonAllFields) {
    auto result = loader_->parse(FULL_JSON);
    ASSERT_TRUE(result.is_success()) << result.error().to_string();
    expect_full_config(result.value());
}

TEST_F(ConfigParseTest, EmptyDocumentGivesDefaults) {
    auto result = loader_->parse("");
    ASSERT_TRUE(result.is_success()) << result.error().to_string();

    const auto& config = result.value();
    EXPECT_EQ(config.queue.name, "default");
    EXPECT_EQ(config.queue.empty_queue_mode, EmptyQueueMode::OPTIONAL);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.logging.output, "console");
    EXPECT_EQ(config.logging.max_file_size_mb, 10u);
    EXPECT_EQ(config.logging.max_files, 5u);
    EXPECT_TRUE(config.logging.use_colors);
}

TEST_F(ConfigParseTest, PartialSectionKeepsDefaults) {
    auto result = loader_->parse("queue:\n  name: mail\n");
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value().queue.name, "mail");
    EXPECT_EQ(result.value().queue.empty_queue_mode, EmptyQueueMode::OPTIONAL);
    EXPECT_EQ(result.value().logging.level, "info");
}

TEST_F(ConfigParseTest, MalformedYaml) {
    auto result = loader_->parse("queue: [unclosed", ConfigFormat::YAML);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_PARSE_ERROR);
}

TEST_F(ConfigParseTest, MalformedJson) {
    auto result = loader_->parse("{ \"queue\": ", ConfigFormat::JSON);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_PARSE_ERROR);
}

TEST_F(ConfigParseTest, WrongValueType) {
    auto result = loader_->parse("logging:\n  max_files: many\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_PARSE_ERROR);
}

TEST_F(ConfigParseTest, NonMappingRoot) {
    EXPECT_EQ(loader_->parse("just a string").code(), ErrorCode::CONFIG_PARSE_ERROR);
    EXPECT_EQ(loader_->parse("[1, 2]").code(), ErrorCode::CONFIG_PARSE_ERROR);
}

TEST_F(ConfigParseTest, UnknownEmptyQueueMode) {
    auto yaml = loader_->parse("queue:\n  empty_queue_mode: lenient\n");
    EXPECT_EQ(yaml.code(), ErrorCode::CONFIG_INVALID_VALUE);

    auto json = loader_->parse(R"({"queue": {"empty_queue_mode": "lenient"}})");
    EXPECT_EQ(json.code(), ErrorCode::CONFIG_INVALID_VALUE);
}

// ============================================================================
// Validation Tests
// ============================================================================

class ConfigValidateTest : public ::testing::Test {
protected:
    ConfigLoaderImpl loader_;
    TaskqConfig config_;
};

TEST_F(ConfigValidateTest, DefaultsAreValid) {
    EXPECT_TRUE(loader_.validate(config_).is_success());
}

TEST_F(ConfigValidateTest, EmptyQueueName) {
    config_.queue.name.clear();
    EXPECT_EQ(loader_.validate(config_).code(), ErrorCode::CONFIG_REQUIRED_MISSING);
}

TEST_F(ConfigValidateTest, UnknownLogLevel) {
    config_.logging.level = "verbose";
    EXPECT_EQ(loader_.validate(config_).code(), ErrorCode::CONFIG_INVALID_VALUE);

    config_.logging.level = "WARNING";
    EXPECT_TRUE(loader_.validate(config_).is_success());
}

TEST_F(ConfigValidateTest, UnknownOutput) {
    config_.logging.output = "syslog";
    EXPECT_EQ(loader_.validate(config_).code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(ConfigValidateTest, FileOutputNeedsPath) {
    config_.logging.output = "file";
    EXPECT_EQ(loader_.validate(config_).code(), ErrorCode::CONFIG_REQUIRED_MISSING);

    config_.logging.file_path = "/tmp/taskq.log";
    EXPECT_TRUE(loader_.validate(config_).is_success());
}

TEST_F(ConfigValidateTest, ZeroMaxFiles) {
    config_.logging.max_files = 0;
    EXPECT_EQ(loader_.validate(config_).code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(ConfigValidateTest, ParseRunsValidation) {
    auto result = loader_.parse("logging:\n  output: file\n");
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_REQUIRED_MISSING);
}

// ============================================================================
// File Tests
// ============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("taskq_config_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void write(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }

    std::filesystem::path dir_;
    std::unique_ptr<ConfigLoader> loader_ = create_config_loader();
};

TEST_F(ConfigFileTest, LoadYamlFile) {
    auto path = dir_ / "taskq.yaml";
    write(path, FULL_YAML);

    auto result = loader_->load(path);
    ASSERT_TRUE(result.is_success()) << result.error().to_string();
    expect_full_config(result.value());
}

TEST_F(ConfigFileTest, LoadJsonFileByExtension) {
    auto path = dir_ / "taskq.json";
    write(path, FULL_JSON);

    auto result = loader_->load(path);
    ASSERT_TRUE(result.is_success()) << result.error().to_string();
    expect_full_config(result.value());
}

TEST_F(ConfigFileTest, MissingFile) {
    auto result = loader_->load(dir_ / "absent.yaml");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_FILE_NOT_FOUND);
}

TEST_F(ConfigFileTest, InvalidFileNamesPathInError) {
    auto path = dir_ / "bad.yaml";
    write(path, "queue:\n  name: \"\"\n");

    auto result = loader_->load(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_REQUIRED_MISSING);
    EXPECT_NE(result.error().to_string().find("bad.yaml"), std::string::npos);
}

TEST_F(ConfigFileTest, SaveAndReloadYaml) {
    TaskqConfig config;
    config.queue.name             = "reports";
    config.queue.empty_queue_mode = EmptyQueueMode::STRICT;
    config.logging.level          = "warn";
    config.logging.max_files      = 9;

    auto path = dir_ / "nested" / "saved.yaml";
    ASSERT_TRUE(loader_->save(config, path).is_success());
    ASSERT_TRUE(std::filesystem::exists(path));

    auto reloaded = loader_->load(path);
    ASSERT_TRUE(reloaded.is_success()) << reloaded.error().to_string();
    EXPECT_EQ(reloaded.value().queue.name, "reports");
    EXPECT_EQ(reloaded.value().queue.empty_queue_mode, EmptyQueueMode::STRICT);
    EXPECT_EQ(reloaded.value().logging.level, "warn");
    EXPECT_EQ(reloaded.value().logging.max_files, 9u);
    EXPECT_EQ(reloaded.value().logging.file_path, "");
}

TEST_F(ConfigFileTest, SaveAndReloadJson) {
    TaskqConfig config;
    config.queue.name         = "reports";
    config.logging.output     = "file";
    config.logging.file_path  = "/var/log/taskq.log";
    config.logging.use_colors = false;

    auto path = dir_ / "saved.json";
    ASSERT_TRUE(loader_->save(config, path).is_success());

    std::ifstream in(path);
    char first = 0;
    in >> first;
    EXPECT_EQ(first, '{');

    auto reloaded = loader_->load(path);
    ASSERT_TRUE(reloaded.is_success()) << reloaded.error().to_string();
    EXPECT_EQ(reloaded.value().logging.output, "file");
    EXPECT_EQ(reloaded.value().logging.file_path, "/var/log/taskq.log");
    EXPECT_FALSE(reloaded.value().logging.use_colors);
}

TEST_F(ConfigFileTest, SaveRejectsInvalidConfig) {
    TaskqConfig config;
    config.logging.output = "nowhere";

    auto path = dir_ / "invalid.yaml";
    EXPECT_EQ(loader_->save(config, path).code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ConfigFileTest, SerializeHonoursRequestedFormat) {
    TaskqConfig config;
    auto yaml = loader_->serialize(config, ConfigFormat::YAML);
    auto json = loader_->serialize(config, ConfigFormat::JSON);
    ASSERT_TRUE(yaml.is_success());
    ASSERT_TRUE(json.is_success());

    EXPECT_EQ(ConfigLoader::detect_format_from_content(yaml.value()), ConfigFormat::YAML);
    EXPECT_EQ(ConfigLoader::detect_format_from_content(json.value()), ConfigFormat::JSON);
    EXPECT_NE(yaml.value().find("empty_queue_mode: optional"), std::string::npos);
}

// ============================================================================
// Apply Tests
// ============================================================================

class ConfigApplyTest : public ::testing::Test {
protected:
    void TearDown() override {
        auto& logger = debug::Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::make_shared<debug::ConsoleSink>());
        logger.filter().reset();

        std::error_code ec;
        std::filesystem::remove(log_path_, ec);
    }

    std::filesystem::path log_path_ =
        std::filesystem::temp_directory_path() / "taskq_config_apply_test.log";
};

TEST_F(ConfigApplyTest, MakeQueueConfig) {
    QueueConfig config;
    config.name             = "jobs";
    config.empty_queue_mode = EmptyQueueMode::STRICT;

    PriorityTaskQueue<int> queue(make_queue_config(config));
    EXPECT_EQ(queue.name(), "jobs");
    EXPECT_EQ(queue.mode(), EmptyQueueMode::STRICT);
    EXPECT_EQ(queue.take().code(), ErrorCode::QUEUE_EMPTY);
}

TEST_F(ConfigApplyTest, ConsoleOutput) {
    LoggingConfig config;
    config.level = "error";

    ASSERT_TRUE(apply_logging_config(config).is_success());
    EXPECT_EQ(debug::Logger::instance().sink_count(), 1u);
    EXPECT_FALSE(debug::Logger::instance().is_enabled(debug::LogLevel::WARN));
    EXPECT_TRUE(debug::Logger::instance().is_enabled(debug::LogLevel::ERROR));
}

TEST_F(ConfigApplyTest, BothOutputsWriteToFile) {
    LoggingConfig config;
    config.level     = "info";
    config.output    = "both";
    config.file_path = log_path_.string();

    ASSERT_TRUE(apply_logging_config(config).is_success());
    EXPECT_EQ(debug::Logger::instance().sink_count(), 2u);

    TASKQ_LOG_WARN(debug::category::QUEUE, "written to file");
    debug::Logger::instance().flush();

    std::ifstream in(log_path_);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("written to file"), std::string::npos);
}

TEST_F(ConfigApplyTest, FailureLeavesLoggerUntouched) {
    auto before = debug::Logger::instance().sink_count();

    LoggingConfig bad_output;
    bad_output.output = "syslog";
    EXPECT_EQ(apply_logging_config(bad_output).code(), ErrorCode::CONFIG_INVALID_VALUE);

    LoggingConfig unopenable;
    unopenable.output    = "file";
    unopenable.file_path = "/nonexistent-taskq-dir/sub/log.txt";
    EXPECT_EQ(apply_logging_config(unopenable).code(), ErrorCode::OS_ERROR);

    EXPECT_EQ(debug::Logger::instance().sink_count(), before);
}
