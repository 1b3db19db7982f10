#include <cstdlib>
#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/engine_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "test_support.hpp"

namespace {

using inobridge::core::config::apply_environment_overrides;
using inobridge::core::config::EngineConfig;
using inobridge::core::config::load_config_file;
using inobridge::core::config::validate_config;
using inobridge::core::errors::get_error;
using inobridge::core::errors::get_value;
using inobridge::core::errors::is_error;
using inobridge::core::logging::LogLevel;
using inobridge::testing::TempWorkspace;
using inobridge::testing::write_file;

TEST(EngineConfigTest, DefaultsMatchToolchainConventions) {
    EngineConfig config;
    EXPECT_EQ(config.cli_binary, "arduino-cli");
    EXPECT_EQ(config.max_attempts, 3);
    EXPECT_TRUE(config.verbose_compile);
    EXPECT_TRUE(config.allow_stale_fallback);
    config.working_directory = "/work";
    EXPECT_EQ(config.effective_cache_directory(),
              std::filesystem::path("/work/.inobridge_cache"));
    config.cache_directory = std::filesystem::path("/var/cache/ino");
    EXPECT_EQ(config.effective_cache_directory(), std::filesystem::path("/var/cache/ino"));
}

TEST(EngineConfigTest, LoadsKnownKeysAndKeepsOthers) {
    TempWorkspace workspace;
    const auto path = workspace.root() / "inobridge.json";
    write_file(path, R"({
        "cli_binary": "/opt/arduino/arduino-cli",
        "max_attempts": 5,
        "allow_stale_fallback": false,
        "log_level": "debug"
    })");

    auto loaded = load_config_file(path);
    ASSERT_FALSE(is_error(loaded));
    const auto& config = get_value(loaded);
    EXPECT_EQ(config.cli_binary, "/opt/arduino/arduino-cli");
    EXPECT_EQ(config.max_attempts, 5);
    EXPECT_FALSE(config.allow_stale_fallback);
    EXPECT_TRUE(config.verbose_compile);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    EXPECT_FALSE(config.cache_directory.has_value());
}

TEST(EngineConfigTest, MissingFileIsReported) {
    TempWorkspace workspace;
    auto loaded = load_config_file(workspace.root() / "absent.json");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "config_open_failed");
}

TEST(EngineConfigTest, MalformedJsonIsReported) {
    TempWorkspace workspace;
    const auto path = workspace.root() / "bad.json";
    write_file(path, "{ \"cli_binary\": ");
    auto loaded = load_config_file(path);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "config_parse_failed");
}

TEST(EngineConfigTest, NonObjectRootIsReported) {
    TempWorkspace workspace;
    const auto path = workspace.root() / "list.json";
    write_file(path, "[1, 2, 3]");
    auto loaded = load_config_file(path);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "config_parse_failed");
}

TEST(EngineConfigTest, WrongFieldTypeIsReported) {
    TempWorkspace workspace;
    const auto path = workspace.root() / "typed.json";
    write_file(path, R"({"max_attempts": "three"})");
    auto loaded = load_config_file(path);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "config_type_error");
}

TEST(EngineConfigTest, FractionalAttemptCountIsReported) {
    TempWorkspace workspace;
    const auto path = workspace.root() / "fraction.json";
    write_file(path, R"({"max_attempts": 2.7})");
    auto loaded = load_config_file(path);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "config_type_error");
}

TEST(EngineConfigTest, UnknownLogLevelIsReported) {
    TempWorkspace workspace;
    const auto path = workspace.root() / "level.json";
    write_file(path, R"({"log_level": "chatty"})");
    auto loaded = load_config_file(path);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_log_level");
}

TEST(EngineConfigTest, EnvironmentOverridesFileValues) {
    ::setenv("INOBRIDGE_CLI", "/usr/local/bin/arduino-cli", 1);
    ::setenv("INOBRIDGE_CACHE_DIR", "/tmp/inobridge-cache", 1);
    ::setenv("INOBRIDGE_WORKDIR", "", 1);

    EngineConfig base;
    base.working_directory = "/work";
    const auto config = apply_environment_overrides(base);

    ::unsetenv("INOBRIDGE_CLI");
    ::unsetenv("INOBRIDGE_CACHE_DIR");
    ::unsetenv("INOBRIDGE_WORKDIR");

    EXPECT_EQ(config.cli_binary, "/usr/local/bin/arduino-cli");
    ASSERT_TRUE(config.cache_directory.has_value());
    EXPECT_EQ(config.cache_directory.value(), std::filesystem::path("/tmp/inobridge-cache"));
    // Empty variables are ignored.
    EXPECT_EQ(config.working_directory, std::filesystem::path("/work"));
}

TEST(EngineConfigTest, ValidationRejectsBadValues) {
    EngineConfig empty_cli;
    empty_cli.cli_binary = "";
    auto result = validate_config(empty_cli);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_cli_binary");

    EngineConfig too_many;
    too_many.max_attempts = 11;
    result = validate_config(too_many);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(EngineConfigTest, ValidationCreatesAndCanonicalizesWorkdir) {
    TempWorkspace workspace;
    EngineConfig config;
    config.working_directory = workspace.root() / "nested" / "projects";

    auto result = validate_config(config);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).working_directory,
              std::filesystem::canonical(workspace.root() / "nested" / "projects"));
}

TEST(EngineConfigTest, ValidationRejectsFileAsWorkdir) {
    TempWorkspace workspace;
    const auto file = workspace.root() / "plain.txt";
    write_file(file, "x");
    EngineConfig config;
    config.working_directory = file;

    auto result = validate_config(config);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

}  // namespace
