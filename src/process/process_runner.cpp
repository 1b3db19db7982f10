#include "process/process_runner.hpp"

#include <algorithm>
#include <optional>
#include <utility>
#include "core/logging/logger.hpp"

namespace inobridge::process {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using protocol::CommandResult;

bool is_transient_failure(const CommandResult& result, const RetryPolicy& policy) {
    return !result.success &&
           result.stderr_text.find(policy.transient_signature) != std::string::npos;
}

std::string to_string(const RetryState state) {
    switch (state) {
        case RetryState::Attempt:
            return "attempt";
        case RetryState::MutateAndRetry:
            return "mutate_and_retry";
        case RetryState::GiveUp:
            return "give_up";
        case RetryState::Done:
            return "done";
        default:
            return "unknown";
    }
}

ProcessRunner::ProcessRunner(std::shared_ptr<const ProcessLauncher> launcher,
                             RetryPolicy policy)
    : launcher_(std::move(launcher)), policy_(std::move(policy)) {}

RetryState ProcessRunner::after_completed_attempt(const int attempt,
                                                  const CommandResult& result) const {
    if (result.success || !is_transient_failure(result, policy_)) {
        return RetryState::Done;
    }
    if (attempt >= policy_.max_attempts) {
        return RetryState::GiveUp;
    }
    if (result.stderr_text.find(policy_.mutation_signature) != std::string::npos) {
        return RetryState::MutateAndRetry;
    }
    return RetryState::Attempt;
}

RetryState ProcessRunner::after_launch_failure(const int attempt) const {
    return attempt >= policy_.max_attempts ? RetryState::GiveUp : RetryState::Attempt;
}

core::errors::Result<RunOutcome> ProcessRunner::run(
    const protocol::InvocationSpec& spec,
    const environment::EnvironmentMap& environment,
    const std::filesystem::path& working_directory) const {
    if (!launcher_) {
        return BridgeError{ErrorCategory::Internal, "No process launcher configured.",
                           "missing_launcher"};
    }

    // The caller's invocation stays untouched; mutations apply to this copy only.
    std::vector<std::string> argv = spec.argv;
    bool mutated = false;
    std::optional<CommandResult> last_result;
    std::optional<BridgeError> last_launch_error;

    int attempt = 0;
    RetryState state = RetryState::Attempt;
    while (state == RetryState::Attempt || state == RetryState::MutateAndRetry) {
        if (state == RetryState::MutateAndRetry) {
            if (std::find(argv.begin(), argv.end(), policy_.mutation_flag) == argv.end()) {
                argv.push_back(policy_.mutation_flag);
                mutated = true;
                LOG_INFO("ProcessRunner: ctags failure detected, appending " +
                         policy_.mutation_flag);
            }
        }

        ++attempt;
        LOG_INFO("ProcessRunner: executing '" + spec.logical_command + "' (attempt " +
                 std::to_string(attempt) + "/" + std::to_string(policy_.max_attempts) +
                 ")");

        auto launched = launcher_->launch(argv, environment, working_directory);
        if (core::errors::is_error(launched)) {
            const auto& err = core::errors::get_error(launched);
            if (err.category != ErrorCategory::Launch) {
                return err;
            }
            LOG_ERROR("ProcessRunner: launch failed: " + err.message);
            last_launch_error = err;
            last_result.reset();
            state = after_launch_failure(attempt);
            continue;
        }

        const auto& capture = core::errors::get_value(launched);
        CommandResult result;
        result.logical_command = spec.logical_command;
        result.success = capture.exit_code == 0;
        result.stdout_text = capture.stdout_text;
        result.stderr_text = capture.stderr_text;
        LOG_INFO("ProcessRunner: exit code " + std::to_string(capture.exit_code) +
                 " (success: " + (result.success ? "true" : "false") + ")");

        last_launch_error.reset();
        state = after_completed_attempt(attempt, result);
        last_result = std::move(result);
        if (state == RetryState::Attempt || state == RetryState::MutateAndRetry) {
            LOG_WARN("ProcessRunner: transient failure, retrying (" +
                     std::to_string(attempt) + "/" +
                     std::to_string(policy_.max_attempts) + ")");
        }
    }

    if (state == RetryState::GiveUp) {
        LOG_WARN("ProcessRunner: retry budget exhausted after " +
                 std::to_string(attempt) + " attempts");
    }

    if (!last_result.has_value()) {
        if (last_launch_error.has_value()) {
            return last_launch_error.value();
        }
        return BridgeError{ErrorCategory::Internal, "No attempt was made.",
                           "no_attempt"};
    }

    RunOutcome outcome;
    outcome.result = std::move(last_result.value());
    outcome.attempts = attempt;
    outcome.argv_mutated = mutated;
    outcome.final_argv = std::move(argv);
    return outcome;
}

}  // namespace inobridge::process
