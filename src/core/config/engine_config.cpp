#include "core/config/engine_config.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace inobridge::core::config {

using errors::BridgeError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

errors::Result<EngineConfig> load_config_file(const std::filesystem::path& path,
                                              EngineConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return BridgeError{ErrorCategory::Input,
                           "Unable to open config file: " + path.string(),
                           "config_open_failed"};
    }

    json payload;
    try {
        payload = json::parse(in);
    } catch (const json::parse_error& ex) {
        return BridgeError{ErrorCategory::Input,
                           "Config file is not valid JSON: " + std::string(ex.what()),
                           "config_parse_failed"};
    }
    if (!payload.is_object()) {
        return BridgeError{ErrorCategory::Input, "Config root must be a JSON object.",
                           "config_parse_failed"};
    }

    try {
        if (payload.contains("cli_binary")) {
            base.cli_binary = payload.at("cli_binary").get<std::string>();
        }
        if (payload.contains("working_directory")) {
            base.working_directory = payload.at("working_directory").get<std::string>();
        }
        if (payload.contains("cache_directory")) {
            base.cache_directory =
                std::filesystem::path(payload.at("cache_directory").get<std::string>());
        }
        if (payload.contains("home_directory")) {
            base.home_directory =
                std::filesystem::path(payload.at("home_directory").get<std::string>());
        }
        if (payload.contains("max_attempts")) {
            const auto& attempts = payload.at("max_attempts");
            if (!attempts.is_number_integer()) {
                return BridgeError{ErrorCategory::Input,
                                   "max_attempts must be an integer, got " + attempts.dump(),
                                   "config_type_error"};
            }
            base.max_attempts = attempts.get<int>();
        }
        if (payload.contains("verbose_compile")) {
            base.verbose_compile = payload.at("verbose_compile").get<bool>();
        }
        if (payload.contains("allow_stale_fallback")) {
            base.allow_stale_fallback = payload.at("allow_stale_fallback").get<bool>();
        }
        if (payload.contains("log_level")) {
            const auto level = payload.at("log_level").get<std::string>();
            if (!logging::parse_log_level(level, base.log_level)) {
                return BridgeError{ErrorCategory::Input, "Unknown log level: " + level,
                                   "invalid_log_level",
                                   "Use one of debug, info, warn, error."};
            }
        }
    } catch (const json::type_error& ex) {
        return BridgeError{ErrorCategory::Input,
                           "Config field has the wrong type: " + std::string(ex.what()),
                           "config_type_error"};
    }

    return base;
}

EngineConfig apply_environment_overrides(EngineConfig config) {
    if (auto cli = env_value("INOBRIDGE_CLI")) {
        config.cli_binary = cli.value();
    }
    if (auto workdir = env_value("INOBRIDGE_WORKDIR")) {
        config.working_directory = workdir.value();
    }
    if (auto cache_dir = env_value("INOBRIDGE_CACHE_DIR")) {
        config.cache_directory = std::filesystem::path(cache_dir.value());
    }
    return config;
}

errors::Result<EngineConfig> validate_config(EngineConfig config) {
    if (config.cli_binary.empty()) {
        return BridgeError{ErrorCategory::Input, "cli_binary cannot be empty.",
                           "invalid_cli_binary"};
    }
    if (config.max_attempts < 1 || config.max_attempts > 10) {
        return BridgeError{ErrorCategory::Input, "max_attempts out of bounds",
                           "bounds_error", "Must be between 1 and 10."};
    }

    std::error_code ec;
    if (!std::filesystem::exists(config.working_directory, ec) || ec) {
        std::filesystem::create_directories(config.working_directory, ec);
        if (ec) {
            return BridgeError{ErrorCategory::Input,
                               "Working directory does not exist and cannot be created: " +
                                   config.working_directory.string(),
                               "invalid_path"};
        }
    }
    if (!std::filesystem::is_directory(config.working_directory, ec) || ec) {
        return BridgeError{ErrorCategory::Input,
                           "Working directory is not a directory: " +
                               config.working_directory.string(),
                           "invalid_path"};
    }

    auto canonical = std::filesystem::canonical(config.working_directory, ec);
    if (ec) {
        return BridgeError{ErrorCategory::Input,
                           "Failed to canonicalize working directory",
                           "invalid_path"};
    }
    config.working_directory = std::move(canonical);
    return config;
}

}  // namespace inobridge::core::config
