#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "cache/result_cache.hpp"
#include "cache/result_store.hpp"
#include "classify/diagnostics.hpp"
#include "core/config/engine_config.hpp"
#include "core/config/invocation_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "process/process_launcher.hpp"
#include "protocol/command_result_codec.hpp"
#include "runtime/command_engine.hpp"
#include "tools/toolchain_queries.hpp"

namespace {

using inobridge::core::errors::BridgeError;
using inobridge::core::errors::ErrorCategory;
using inobridge::core::errors::get_error;
using inobridge::core::errors::get_value;
using inobridge::core::errors::is_error;
using inobridge::protocol::CliCommand;
using inobridge::protocol::CliRequest;
using inobridge::protocol::Operation;
using inobridge::protocol::OperationParams;
using nlohmann::json;

int exit_code_for(const BridgeError& err) {
    switch (err.category) {
        case ErrorCategory::Input:
            return 2;
        case ErrorCategory::Launch:
            return 3;
        default:
            return 1;
    }
}

int report_error(const std::string& context, const BridgeError& err) {
    LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    json out;
    out["success"] = false;
    out["category"] = inobridge::core::errors::to_string(err.category);
    out["code"] = err.code;
    out["error"] = err.message;
    std::cout << out.dump(2) << std::endl;
    return exit_code_for(err);
}

inobridge::core::errors::Result<inobridge::core::config::EngineConfig> load_config(
    const CliRequest& req) {
    inobridge::core::config::EngineConfig config;
    if (req.config_file.has_value()) {
        auto loaded = inobridge::core::config::load_config_file(req.config_file.value());
        if (is_error(loaded)) {
            return get_error(loaded);
        }
        config = get_value(loaded);
    }
    config = inobridge::core::config::apply_environment_overrides(config);

    if (req.working_directory.has_value()) config.working_directory = req.working_directory.value();
    if (req.cli_binary.has_value()) config.cli_binary = req.cli_binary.value();
    if (req.max_attempts.has_value()) config.max_attempts = static_cast<int>(req.max_attempts.value());
    if (req.verbose) config.log_level = inobridge::core::logging::LogLevel::DEBUG;

    return inobridge::core::config::validate_config(config);
}

json diagnosis_to_json(const inobridge::classify::Diagnosis& diagnosis) {
    json categories = json::array();
    for (const auto category : diagnosis.categories) {
        categories.push_back(inobridge::classify::to_string(category));
    }
    json payload;
    payload["categories"] = categories;
    payload["missing_headers"] = diagnosis.missing_headers;
    payload["undefined_symbols"] = diagnosis.undefined_symbols;
    payload["suggestions"] = diagnosis.suggestions;
    return payload;
}

int print_report(const inobridge::protocol::BuildReport& report) {
    json out = inobridge::protocol::report_to_json(report);
    if (!report.outcome.success) {
        out["diagnosis"] = diagnosis_to_json(inobridge::classify::diagnose(
            report.command.stderr_text + "\n" + report.command.stdout_text));
    }
    std::cout << out.dump(2) << std::endl;
    return report.outcome.success ? 0 : 1;
}

int print_command(const inobridge::protocol::CommandResult& result) {
    json out = result;
    std::cout << out.dump(2) << std::endl;
    return result.success ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this process
    inobridge::core::logging::Logger::get().set_invocation_id(
        inobridge::core::config::generate_invocation_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = inobridge::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        return report_error("Input error", get_error(parsed));
    }
    const auto& req = get_value(parsed);

    // 3. Layer config file, environment and flags
    auto configured = load_config(req);
    if (is_error(configured)) {
        return report_error("Configuration error", get_error(configured));
    }
    const auto config = get_value(configured);
    inobridge::core::logging::Logger::get().set_level(config.log_level);
    LOG_DEBUG("Working directory: " + config.working_directory.string());
    LOG_DEBUG("Cache directory: " + config.effective_cache_directory().string());

    auto store = std::make_shared<inobridge::cache::FileResultStore>(
        config.effective_cache_directory());
    auto cache = std::make_shared<inobridge::cache::ResultCache>(store);
    inobridge::runtime::CommandEngine engine(
        config, cache, std::make_shared<inobridge::process::PosixProcessLauncher>());
    inobridge::tools::ToolchainQueries queries(engine);

    switch (req.command) {
        case CliCommand::Compile: {
            OperationParams params;
            params.sketch_path = req.sketch_path;
            params.fqbn = req.fqbn;
            auto report = engine.build_and_run(Operation::Compile, params);
            if (is_error(report)) {
                return report_error("Compile failed to run", get_error(report));
            }
            return print_report(get_value(report));
        }
        case CliCommand::Upload: {
            OperationParams params;
            params.sketch_path = req.sketch_path;
            params.hex_path = req.hex_path;
            params.port = req.port;
            params.fqbn = req.fqbn;
            const auto operation = req.hex_path.has_value() ? Operation::UploadHex : Operation::Upload;
            auto report = engine.build_and_run(operation, params);
            if (is_error(report)) {
                return report_error("Upload failed to run", get_error(report));
            }
            return print_report(get_value(report));
        }
        case CliCommand::CompileUpload: {
            auto result = queries.compile_and_upload(req.sketch_path.value(), req.port, req.fqbn);
            if (is_error(result)) {
                return report_error("Compile and upload failed to run", get_error(result));
            }
            const auto& report = get_value(result);
            json out;
            out["success"] = report.compile_success && report.upload_success;
            out["compile_success"] = report.compile_success;
            out["upload_success"] = report.upload_success;
            out["hex_path"] = report.artifact.has_value() ? report.artifact->string() : "";
            out["error"] = report.error;
            out["compile"] = inobridge::protocol::report_to_json(report.compile);
            if (report.upload.has_value()) {
                out["upload"] = inobridge::protocol::report_to_json(report.upload.value());
            }
            std::cout << out.dump(2) << std::endl;
            return out["success"].get<bool>() ? 0 : 1;
        }
        case CliCommand::Boards: {
            auto boards = queries.list_boards();
            if (is_error(boards)) {
                return report_error("Board listing failed", get_error(boards));
            }
            json out = json::array();
            for (const auto& board : get_value(boards)) {
                out.push_back({{"port", board.port}, {"board_name", board.board_name}, {"fqbn", board.fqbn}});
            }
            std::cout << out.dump(2) << std::endl;
            return 0;
        }
        case CliCommand::Cores: {
            auto platforms = queries.core_platforms();
            if (is_error(platforms)) {
                return report_error("Core listing failed", get_error(platforms));
            }
            std::cout << json(get_value(platforms)).dump(2) << std::endl;
            return 0;
        }
        case CliCommand::Version: {
            auto version = queries.check_version();
            if (is_error(version)) {
                return report_error("Version check failed", get_error(version));
            }
            std::cout << json{{"success", true}, {"version", get_value(version)}}.dump(2) << std::endl;
            return 0;
        }
        case CliCommand::Run: {
            auto result = engine.run_command(req.command_text);
            if (is_error(result)) {
                return report_error("Command failed to run", get_error(result));
            }
            return print_command(get_value(result));
        }
        case CliCommand::Lookup:
            return print_command(engine.execute(req.command_text));
        case CliCommand::Store: {
            auto stored = engine.store_result(req.command_text, req.output, req.error, req.stored_success);
            if (is_error(stored)) {
                return report_error("Store failed", get_error(stored));
            }
            std::cout << json(get_value(stored)).dump(2) << std::endl;
            return 0;
        }
        case CliCommand::Monitor: {
            auto report = queries.monitor_port(req.port, req.baud_rate, req.monitor_timeout_s);
            if (is_error(report)) {
                return report_error("Monitor failed to run", get_error(report));
            }
            return print_report(get_value(report));
        }
        case CliCommand::InstallCore: {
            auto installed = queries.install_core(req.platform_id);
            if (is_error(installed)) {
                return report_error("Core install failed to run", get_error(installed));
            }
            const auto& report = get_value(installed);
            json out;
            out["success"] = report.success;
            out["platform"] = report.platform_id;
            out["already_installed"] = report.already_installed;
            out["message"] = report.message;
            std::cout << out.dump(2) << std::endl;
            return report.success ? 0 : 1;
        }
        case CliCommand::AddBoardUrl: {
            auto report = queries.add_board_url(req.url);
            if (is_error(report)) {
                return report_error("Adding board URL failed to run", get_error(report));
            }
            return print_report(get_value(report));
        }
        case CliCommand::SetupEsp32: {
            auto steps = queries.setup_esp32();
            if (is_error(steps)) {
                return report_error("ESP32 setup failed to run", get_error(steps));
            }
            json out;
            bool all_ok = true;
            for (const auto& step : get_value(steps)) {
                out["steps"][step.name] = inobridge::protocol::report_to_json(step.report);
                all_ok = all_ok && step.report.outcome.success;
            }
            out["success"] = all_ok;
            std::cout << out.dump(2) << std::endl;
            return all_ok ? 0 : 1;
        }
        case CliCommand::ListAll: {
            auto available = queries.list_available_boards();
            if (is_error(available)) {
                return report_error("Board listing failed", get_error(available));
            }
            const auto& boards = get_value(available);
            json connected = json::array();
            for (const auto& board : boards.connected) {
                connected.push_back({{"port", board.port}, {"board_name", board.board_name}, {"fqbn", board.fqbn}});
            }
            json out;
            out["connected"] = connected;
            out["platforms"] = boards.platforms;
            out["all_boards"] = boards.all_boards;
            std::cout << out.dump(2) << std::endl;
            return 0;
        }
        case CliCommand::Diagnose: {
            std::ifstream in(req.input_file.value());
            if (!in.is_open()) {
                return report_error("Diagnose", BridgeError{ErrorCategory::Input,
                                                            "Unable to open " + req.input_file->string(),
                                                            "input_open_failed"});
            }
            std::ostringstream buffer;
            buffer << in.rdbuf();
            std::cout << diagnosis_to_json(inobridge::classify::diagnose(buffer.str())).dump(2) << std::endl;
            return 0;
        }
    }

    return report_error("Dispatch", BridgeError{ErrorCategory::Internal, "Unhandled command.", "unhandled_command"});
}
