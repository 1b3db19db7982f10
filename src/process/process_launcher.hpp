#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "environment/environment_resolver.hpp"

namespace inobridge::process {

struct ProcessCapture {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Starts one child process and blocks until it exits. A child that cannot be
// started is reported as an ErrorCategory::Launch error, never as an exit code.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    virtual core::errors::Result<ProcessCapture> launch(
        const std::vector<std::string>& argv,
        const environment::EnvironmentMap& environment,
        const std::filesystem::path& working_directory) const = 0;
};

class PosixProcessLauncher final : public ProcessLauncher {
public:
    core::errors::Result<ProcessCapture> launch(
        const std::vector<std::string>& argv,
        const environment::EnvironmentMap& environment,
        const std::filesystem::path& working_directory) const override;
};

}  // namespace inobridge::process
