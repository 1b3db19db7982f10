#include "tools/toolchain_queries.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include "classify/output_classifier.hpp"
#include "core/logging/logger.hpp"

namespace inobridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using protocol::BuildReport;
using protocol::CommandResult;
using protocol::Operation;
using protocol::OperationParams;

namespace {

std::vector<std::string> split_whitespace(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> parts;
    std::string part;
    while (in >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> data_lines(const std::string& output) {
    std::istringstream in(output);
    std::vector<std::string> lines;
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) {
            header = false;
            continue;
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        lines.push_back(line);
    }
    return lines;
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Execution errors mean the tool ran and failed; callers that only enrich a
// report carry on with an empty value.
template <typename T>
core::errors::Result<T> tolerate_tool_failure(core::errors::Result<T> result,
                                              const std::string& what) {
    if (core::errors::is_error(result) &&
        core::errors::get_error(result).category == ErrorCategory::Execution) {
        LOG_WARN("ToolchainQueries: " + what + " unavailable: " +
                 core::errors::get_error(result).message);
        return T{};
    }
    return result;
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

bool is_regular_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

}  // namespace

std::vector<BoardInfo> parse_board_list(const std::string& output) {
    std::vector<BoardInfo> boards;
    for (const auto& line : data_lines(output)) {
        const auto parts = split_whitespace(line);
        BoardInfo board;
        board.port = parts[0];
        if (parts.size() > 1) {
            board.fqbn = parts.back();
        }
        for (std::size_t i = 2; i + 1 < parts.size(); ++i) {
            if (!board.board_name.empty()) {
                board.board_name.push_back(' ');
            }
            board.board_name += parts[i];
        }
        boards.push_back(board);
    }
    return boards;
}

std::vector<std::string> parse_core_list(const std::string& output) {
    std::vector<std::string> platforms;
    for (const auto& line : data_lines(output)) {
        platforms.push_back(split_whitespace(line).front());
    }
    return platforms;
}

std::optional<std::filesystem::path> find_artifact(const std::filesystem::path& dir,
                                                   const std::string& extension) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return std::nullopt;
    }
    std::filesystem::directory_iterator it(dir, ec);
    const std::filesystem::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }
        if (it->path().extension() == extension) {
            return it->path();
        }
    }
    if (ec) {
        LOG_WARN("find_artifact: error searching " + dir.string() + ": " + ec.message());
    }
    return std::nullopt;
}

ToolchainQueries::ToolchainQueries(runtime::CommandEngine& engine) : engine_(engine) {}

core::errors::Result<BuildReport> ToolchainQueries::run_operation(
    const Operation operation, const OperationParams& params) {
    return engine_.build_and_run(operation, params);
}

core::errors::Result<CommandResult> ToolchainQueries::run_listing(const Operation operation,
                                                                  const std::string& code) {
    auto report = run_operation(operation);
    if (core::errors::is_error(report)) {
        return core::errors::get_error(report);
    }
    const auto& command = core::errors::get_value(report).command;
    if (!command.success) {
        return BridgeError{ErrorCategory::Execution,
                           "'" + command.logical_command +
                               "' failed: " + classify::failure_text(command),
                           code};
    }
    return command;
}

core::errors::Result<std::vector<BoardInfo>> ToolchainQueries::list_boards() {
    auto listed = run_listing(Operation::BoardList, "board_list_failed");
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    return parse_board_list(core::errors::get_value(listed).stdout_text);
}

core::errors::Result<std::vector<std::string>> ToolchainQueries::core_platforms() {
    auto listed = run_listing(Operation::CoreList, "core_list_failed");
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    return parse_core_list(core::errors::get_value(listed).stdout_text);
}

core::errors::Result<std::string> ToolchainQueries::check_version() {
    auto listed = run_listing(Operation::Version, "version_failed");
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    return trim(core::errors::get_value(listed).stdout_text);
}

core::errors::Result<std::vector<std::string>> ToolchainQueries::installed_platforms() {
    return tolerate_tool_failure(core_platforms(), "core list");
}

core::errors::Result<BuildReport> ToolchainQueries::monitor_port(const std::string& port,
                                                                 const uint32_t baud_rate,
                                                                 const uint32_t timeout_s) {
    OperationParams params;
    params.port = port;
    params.baud_rate = baud_rate;
    params.monitor_timeout_s = timeout_s;
    return run_operation(Operation::Monitor, params);
}

core::errors::Result<BuildReport> ToolchainQueries::update_index() {
    return run_operation(Operation::CoreUpdateIndex);
}

core::errors::Result<BuildReport> ToolchainQueries::list_all_boards(
    const std::string& platform_id) {
    OperationParams params;
    params.platform_id = platform_id;
    return run_operation(Operation::BoardListAll, params);
}

core::errors::Result<BuildReport> ToolchainQueries::add_board_url(const std::string& url) {
    if (url.empty()) {
        return BridgeError{ErrorCategory::Input, "A board manager URL is required.",
                           "missing_url"};
    }
    auto init = run_operation(Operation::ConfigInit);
    if (core::errors::is_error(init) || !core::errors::get_value(init).command.success) {
        return init;
    }

    OperationParams params;
    params.url = url;
    return run_operation(Operation::ConfigAddBoardUrl, params);
}

core::errors::Result<InstallReport> ToolchainQueries::install_core(
    const std::string& platform_id) {
    if (platform_id.empty()) {
        return BridgeError{ErrorCategory::Input, "A platform id is required.",
                           "missing_platform", "For example: arduino:avr or esp32:esp32."};
    }

    InstallReport report;
    report.platform_id = invocation::InvocationBuilder::canonical_platform_id(platform_id);

    auto before = installed_platforms();
    if (core::errors::is_error(before)) {
        return core::errors::get_error(before);
    }
    if (contains(core::errors::get_value(before), report.platform_id)) {
        report.success = true;
        report.already_installed = true;
        report.message = "Platform " + report.platform_id + " is already installed";
        return report;
    }

    auto updated = update_index();
    if (core::errors::is_error(updated)) {
        return core::errors::get_error(updated);
    }
    const auto& update_command = core::errors::get_value(updated).command;
    if (!update_command.success) {
        report.message = "Failed to update index: " + classify::failure_text(update_command);
        return report;
    }

    OperationParams params;
    params.platform_id = report.platform_id;
    auto installed = run_operation(Operation::CoreInstall, params);
    if (core::errors::is_error(installed)) {
        return core::errors::get_error(installed);
    }
    const auto& install_command = core::errors::get_value(installed).command;
    if (!install_command.success) {
        report.message = "Failed to install " + report.platform_id + ": " +
                         classify::failure_text(install_command);
        return report;
    }

    auto after = installed_platforms();
    if (core::errors::is_error(after)) {
        return core::errors::get_error(after);
    }
    if (contains(core::errors::get_value(after), report.platform_id)) {
        report.success = true;
        report.message = "Successfully installed " + report.platform_id;
    } else {
        report.message = "Installation command succeeded but " + report.platform_id +
                         " not found in installed platforms";
    }
    LOG_INFO("ToolchainQueries: " + report.message);
    return report;
}

core::errors::Result<std::vector<SetupStep>> ToolchainQueries::setup_esp32() {
    std::vector<SetupStep> steps;
    auto record = [&steps](const std::string& name,
                           core::errors::Result<BuildReport> result)
        -> std::optional<BridgeError> {
        if (core::errors::is_error(result)) {
            return core::errors::get_error(result);
        }
        steps.push_back(SetupStep{name, core::errors::get_value(result)});
        return std::nullopt;
    };

    OperationParams install;
    install.platform_id = "esp32:esp32";
    if (auto err = record("add_url", add_board_url(kEsp32BoardUrl))) return err.value();
    if (auto err = record("update_index", update_index())) return err.value();
    if (auto err = record("install_core", run_operation(Operation::CoreInstall, install))) {
        return err.value();
    }
    if (auto err = record("list_cores", run_operation(Operation::CoreList))) return err.value();
    return steps;
}

core::errors::Result<AvailableBoards> ToolchainQueries::list_available_boards() {
    AvailableBoards boards;

    auto connected = tolerate_tool_failure(list_boards(), "board list");
    if (core::errors::is_error(connected)) {
        return core::errors::get_error(connected);
    }
    boards.connected = core::errors::get_value(connected);

    auto platforms = installed_platforms();
    if (core::errors::is_error(platforms)) {
        return core::errors::get_error(platforms);
    }
    boards.platforms = core::errors::get_value(platforms);

    auto all = list_all_boards();
    if (core::errors::is_error(all)) {
        return core::errors::get_error(all);
    }
    const auto& listing = core::errors::get_value(all).command;
    if (listing.success) {
        boards.all_boards = listing.stdout_text;
    }
    return boards;
}

std::optional<std::filesystem::path> ToolchainQueries::resolve_artifact(
    const std::filesystem::path& sketch_path,
    const protocol::ClassifiedOutcome& outcome) const {
    const auto build_dir = engine_.builder().build_directory_for(sketch_path);
    if (outcome.artifact_path.has_value()) {
        const std::filesystem::path reported = trim(outcome.artifact_path.value());
        if (reported.is_absolute() && tools::is_regular_file(reported)) {
            return reported;
        }
        if (tools::is_regular_file(build_dir / reported.filename())) {
            return build_dir / reported.filename();
        }
    }

    for (const auto& dir : {build_dir, sketch_path.parent_path() / "build"}) {
        auto found = find_artifact(dir, ".hex");
        if (found.has_value()) {
            LOG_INFO("ToolchainQueries: found artifact in build directory: " +
                     found->string());
            return found;
        }
    }
    return std::nullopt;
}

core::errors::Result<CompileUploadReport> ToolchainQueries::compile_and_upload(
    const std::filesystem::path& sketch_path, const std::string& port,
    const std::string& fqbn) {
    CompileUploadReport report;

    OperationParams compile_params;
    compile_params.sketch_path = sketch_path;
    compile_params.fqbn = fqbn;
    auto compiled = engine_.build_and_run(Operation::Compile, compile_params);
    if (core::errors::is_error(compiled)) {
        return core::errors::get_error(compiled);
    }
    report.compile = core::errors::get_value(compiled);
    report.compile_success = report.compile.outcome.success;
    if (!report.compile_success) {
        report.error = "Compilation failed: " + report.compile.outcome.error_detail;
        return report;
    }

    report.artifact = resolve_artifact(sketch_path, report.compile.outcome);
    if (!report.artifact.has_value()) {
        report.error = "Compilation succeeded but couldn't find the .hex file for uploading";
        return report;
    }

    OperationParams upload_params;
    upload_params.hex_path = report.artifact;
    upload_params.port = port;
    upload_params.fqbn = fqbn;
    auto uploaded = engine_.build_and_run(Operation::UploadHex, upload_params);
    if (core::errors::is_error(uploaded)) {
        return core::errors::get_error(uploaded);
    }
    report.upload = core::errors::get_value(uploaded);
    report.upload_success = report.upload->outcome.success;
    if (!report.upload_success) {
        report.error = "Upload failed: " + report.upload->outcome.error_detail;
    }
    return report;
}

}  // namespace inobridge::tools
