#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "protocol/operation_request.hpp"

namespace inobridge::invocation {

class InvocationBuilder {
public:
    InvocationBuilder(std::string cli_binary, std::filesystem::path working_directory);

    // Same operation and params yield the same argv as long as the build
    // directory existence does not change in between.
    core::errors::Result<protocol::InvocationSpec> build(
        protocol::Operation operation, const protocol::OperationParams& params) const;

    // <workdir>/build_<project>, where project is the sketch's parent directory name.
    std::filesystem::path build_directory_for(
        const std::filesystem::path& sketch_path) const;

    static std::string project_name(const std::filesystem::path& sketch_path);
    static std::string compile_cache_key(const std::string& fqbn,
                                         const std::string& project);
    // Bare "esp32" is a common shorthand for the esp32:esp32 core.
    static std::string canonical_platform_id(const std::string& platform_id);

    // POSIX shell-style split: single and double quotes, backslash escapes
    // outside quotes and before " or \ inside double quotes. Returns an empty
    // vector on an unterminated quote or a trailing backslash.
    static std::vector<std::string> split_command_line(const std::string& command);

    const std::string& cli_binary() const { return cli_binary_; }
    const std::filesystem::path& working_directory() const { return working_directory_; }

private:
    core::errors::Result<std::filesystem::path> ensure_directory(
        const std::filesystem::path& dir) const;

    std::string cli_binary_;
    std::filesystem::path working_directory_;
};

}  // namespace inobridge::invocation
