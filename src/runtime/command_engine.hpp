#pragma once

#include <memory>
#include <string>
#include "cache/result_cache.hpp"
#include "core/config/engine_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "environment/environment_resolver.hpp"
#include "invocation/invocation_builder.hpp"
#include "process/process_launcher.hpp"
#include "process/process_runner.hpp"
#include "protocol/command_contract.hpp"
#include "protocol/operation_request.hpp"

namespace inobridge::runtime {

// Caller-facing facade: builder -> resolver -> runner -> classifier -> cache.
// Invocations sharing a build directory must be serialized by the caller.
class CommandEngine {
public:
    CommandEngine(core::config::EngineConfig config,
                  std::shared_ptr<cache::ResultCache> cache,
                  std::shared_ptr<const process::ProcessLauncher> launcher);

    // Read side only: the stored result, or the "not yet executed" sentinel.
    protocol::CommandResult execute(const std::string& logical_command);

    core::errors::Result<protocol::CommandResult> run_command(
        const std::string& command_text);

    core::errors::Result<protocol::BuildReport> build_and_run(
        protocol::Operation operation, const protocol::OperationParams& params);

    core::errors::Result<bool> save_result(const std::string& logical_command,
                                           const protocol::CommandResult& result);

    // Records a result produced outside the engine, e.g. in a terminal. A
    // failed durable write is returned as a Storage error; the in-memory copy
    // alone would not outlive the process.
    core::errors::Result<protocol::CommandResult> store_result(const std::string& command,
                                                               const std::string& output,
                                                               const std::string& error,
                                                               bool success);

    const core::config::EngineConfig& config() const { return config_; }
    const invocation::InvocationBuilder& builder() const { return builder_; }
    const environment::EnvironmentResolver& resolver() const { return resolver_; }

private:
    core::errors::Result<protocol::BuildReport> run_spec(
        const protocol::InvocationSpec& spec);

    core::config::EngineConfig config_;
    std::shared_ptr<cache::ResultCache> cache_;
    invocation::InvocationBuilder builder_;
    environment::EnvironmentResolver resolver_;
    process::ProcessRunner runner_;
};

}  // namespace inobridge::runtime
