#include "runtime/command_engine.hpp"

#include <optional>
#include <utility>
#include "classify/output_classifier.hpp"
#include "core/logging/logger.hpp"

namespace inobridge::runtime {

using protocol::BuildReport;
using protocol::CommandResult;
using protocol::InvocationSpec;
using protocol::Operation;
using protocol::OperationParams;
using protocol::ResultOrigin;

namespace {

process::RetryPolicy policy_from(const core::config::EngineConfig& config) {
    process::RetryPolicy policy;
    policy.max_attempts = config.max_attempts;
    return policy;
}

}  // namespace

CommandEngine::CommandEngine(core::config::EngineConfig config,
                             std::shared_ptr<cache::ResultCache> cache,
                             std::shared_ptr<const process::ProcessLauncher> launcher)
    : config_(std::move(config)),
      cache_(cache ? std::move(cache) : std::make_shared<cache::ResultCache>()),
      builder_(config_.cli_binary, config_.working_directory),
      resolver_(environment::EnvironmentResolver::default_candidates(
          config_.working_directory,
          config_.home_directory.has_value()
              ? config_.home_directory.value()
              : environment::EnvironmentResolver::home_directory())),
      runner_(std::move(launcher), policy_from(config_)) {}

CommandResult CommandEngine::execute(const std::string& logical_command) {
    return cache_->get_or_report_unexecuted(logical_command);
}

core::errors::Result<bool> CommandEngine::save_result(const std::string& logical_command,
                                                      const CommandResult& result) {
    return cache_->save(logical_command, result);
}

core::errors::Result<CommandResult> CommandEngine::store_result(const std::string& command,
                                                               const std::string& output,
                                                               const std::string& error,
                                                               const bool success) {
    CommandResult result;
    result.logical_command = config_.cli_binary + " " + command;
    result.success = success;
    result.stdout_text = output;
    result.stderr_text = error;

    auto saved = cache_->save(command, result);
    if (core::errors::is_error(saved)) {
        const auto& err = core::errors::get_error(saved);
        LOG_ERROR("CommandEngine: could not store result for '" + command + "' [" +
                  err.code + "]: " + err.message);
        return err;
    }
    return result;
}

core::errors::Result<CommandResult> CommandEngine::run_command(
    const std::string& command_text) {
    OperationParams params;
    params.raw_command = command_text;
    auto report = build_and_run(Operation::Raw, params);
    if (core::errors::is_error(report)) {
        return core::errors::get_error(report);
    }
    return core::errors::get_value(report).command;
}

core::errors::Result<BuildReport> CommandEngine::build_and_run(
    const Operation operation, const OperationParams& params) {
    OperationParams effective = params;
    if (protocol::is_compile_operation(operation) && config_.verbose_compile) {
        effective.verbose = true;
    }

    auto spec = builder_.build(operation, effective);
    if (core::errors::is_error(spec)) {
        const auto& err = core::errors::get_error(spec);
        LOG_ERROR("CommandEngine: cannot build " + protocol::to_string(operation) +
                  " [" + err.code + "]: " + err.message);
        return err;
    }
    return run_spec(core::errors::get_value(spec));
}

core::errors::Result<BuildReport> CommandEngine::run_spec(const InvocationSpec& spec) {
    // Read before running: the write-through below replaces the entry.
    std::optional<CommandResult> previous;
    if (protocol::is_compile_operation(spec.operation) && config_.allow_stale_fallback) {
        previous = cache_->get(spec.logical_command);
    }

    const auto environment = resolver_.resolve(spec.env_overrides);
    auto ran = runner_.run(spec, environment.variables, config_.working_directory);
    if (core::errors::is_error(ran)) {
        const auto& err = core::errors::get_error(ran);
        LOG_ERROR("CommandEngine: '" + spec.logical_command + "' could not run [" +
                  err.code + "]: " + err.message);
        return err;
    }
    const auto& outcome = core::errors::get_value(ran);

    BuildReport report;
    report.attempts = outcome.attempts;

    if (!outcome.result.success && previous.has_value() && previous->success &&
        process::is_transient_failure(outcome.result, runner_.policy())) {
        // Known-good output from an earlier run stands in for a toolchain that
        // keeps failing on its temp files. The sketch may have changed since.
        LOG_WARN("CommandEngine: using STALE cached success for '" +
                 spec.logical_command + "' after transient failure");
        report.command = previous.value();
        report.origin = ResultOrigin::StaleFallback;
        report.outcome = classify::classify(report.command, spec.operation);
        return report;
    }

    auto saved = cache_->save(spec.logical_command, outcome.result);
    if (core::errors::is_error(saved)) {
        LOG_WARN("CommandEngine: result kept in memory only [" +
                 core::errors::get_error(saved).code + "]");
    }

    report.command = outcome.result;
    report.origin = ResultOrigin::Executed;
    report.outcome = classify::classify(report.command, spec.operation);
    if (report.outcome.success) {
        LOG_INFO("CommandEngine: '" + spec.logical_command + "' succeeded");
    } else {
        LOG_INFO("CommandEngine: '" + spec.logical_command + "' failed (" +
                 protocol::to_string(report.outcome.error_kind) + ")");
    }
    return report;
}

}  // namespace inobridge::runtime
