#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/bridge_errors.hpp"
#include "environment/environment_resolver.hpp"
#include "process/process_launcher.hpp"
#include "protocol/command_contract.hpp"
#include "protocol/operation_request.hpp"

namespace inobridge::process {

struct RetryPolicy {
    int max_attempts = 3;
    // Toolchain temp-file handling fails intermittently; only this is retried.
    std::string transient_signature = "temporary file";
    // ctags preprocessing failures get the color-disabling workaround.
    std::string mutation_signature = "ctags";
    std::string mutation_flag = "--no-color";
};

// Attempt(n) -> Done | Attempt(n+1) | MutateAndRetry -> Attempt(n+1) | GiveUp
enum class RetryState {
    Attempt,
    MutateAndRetry,
    GiveUp,
    Done
};

struct RunOutcome {
    protocol::CommandResult result;
    int attempts = 0;
    bool argv_mutated = false;
    // argv of the last attempt, after any mutation.
    std::vector<std::string> final_argv;
};

bool is_transient_failure(const protocol::CommandResult& result,
                          const RetryPolicy& policy);

class ProcessRunner {
public:
    explicit ProcessRunner(std::shared_ptr<const ProcessLauncher> launcher,
                           RetryPolicy policy = {});

    // Runs the invocation until it succeeds, fails for a non-transient reason, or the
    // attempt budget is spent. The returned result is always the last attempt's.
    core::errors::Result<RunOutcome> run(
        const protocol::InvocationSpec& spec,
        const environment::EnvironmentMap& environment,
        const std::filesystem::path& working_directory) const;

    // Transition after an attempt that ran to completion.
    RetryState after_completed_attempt(int attempt,
                                       const protocol::CommandResult& result) const;
    // Transition after an attempt that could not be launched.
    RetryState after_launch_failure(int attempt) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    std::shared_ptr<const ProcessLauncher> launcher_;
    RetryPolicy policy_;
};

std::string to_string(RetryState state);

}  // namespace inobridge::process
