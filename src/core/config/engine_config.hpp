#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"

namespace inobridge::core::config {

struct EngineConfig {
    std::string cli_binary = "arduino-cli";
    std::filesystem::path working_directory = std::filesystem::current_path();
    // Defaults to <working_directory>/.inobridge_cache when unset.
    std::optional<std::filesystem::path> cache_directory;
    std::optional<std::filesystem::path> home_directory;
    int max_attempts = 3;
    bool verbose_compile = true;
    bool allow_stale_fallback = true;
    logging::LogLevel log_level = logging::LogLevel::INFO;

    std::filesystem::path effective_cache_directory() const {
        return cache_directory.has_value() ? cache_directory.value()
                                           : working_directory / ".inobridge_cache";
    }
};

// Reads a JSON object; keys absent from the file keep their defaults.
errors::Result<EngineConfig> load_config_file(const std::filesystem::path& path,
                                              EngineConfig base = {});

// INOBRIDGE_CLI, INOBRIDGE_WORKDIR and INOBRIDGE_CACHE_DIR.
EngineConfig apply_environment_overrides(EngineConfig config);

errors::Result<EngineConfig> validate_config(EngineConfig config);

}  // namespace inobridge::core::config
