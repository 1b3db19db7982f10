#include "invocation/invocation_builder.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace inobridge::invocation {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using protocol::InvocationSpec;
using protocol::Operation;
using protocol::OperationParams;

namespace {

constexpr const char* kBuildPathFlag = "--build-path";
constexpr const char* kTempVariables[] = {"TMPDIR", "TMP", "TEMP"};

bool has_token(const std::vector<std::string>& argv, const std::string& token) {
    return std::find(argv.begin(), argv.end(), token) != argv.end();
}

std::string join_tail(const std::vector<std::string>& argv) {
    std::string joined;
    for (std::size_t i = 1; i < argv.size(); ++i) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += argv[i];
    }
    return joined;
}

BridgeError missing_parameter(const std::string& name, Operation operation) {
    return BridgeError{ErrorCategory::Input,
                       "Missing required parameter '" + name + "' for " +
                           protocol::to_string(operation),
                       "missing_" + name};
}

}  // namespace

InvocationBuilder::InvocationBuilder(std::string cli_binary,
                                     std::filesystem::path working_directory)
    : cli_binary_(std::move(cli_binary)),
      working_directory_(std::move(working_directory)) {}

std::string InvocationBuilder::project_name(const std::filesystem::path& sketch_path) {
    return sketch_path.parent_path().filename().string();
}

std::string InvocationBuilder::compile_cache_key(const std::string& fqbn,
                                                 const std::string& project) {
    return "compile -b " + fqbn + " " + project;
}

std::string InvocationBuilder::canonical_platform_id(const std::string& platform_id) {
    return platform_id == "esp32" ? "esp32:esp32" : platform_id;
}

std::filesystem::path InvocationBuilder::build_directory_for(
    const std::filesystem::path& sketch_path) const {
    return working_directory_ / ("build_" + project_name(sketch_path));
}

core::errors::Result<std::filesystem::path> InvocationBuilder::ensure_directory(
    const std::filesystem::path& dir) const {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec) && !ec) {
        return dir;
    }
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return BridgeError{ErrorCategory::Internal,
                           "Unable to create build directory " + dir.string() + ": " +
                               ec.message(),
                           "build_dir_create_failed"};
    }
    LOG_DEBUG("InvocationBuilder: created build directory " + dir.string());
    return dir;
}

std::vector<std::string> InvocationBuilder::split_command_line(const std::string& command) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool quoted = false;

    auto flush = [&]() {
        if (!cur.empty() || quoted) {
            out.push_back(cur);
            cur.clear();
        }
        quoted = false;
    };

    for (const char c : command) {
        if (esc) {
            // Inside double quotes only \ and \" are escapes.
            if (st == DQ && c != '"' && c != '\\') {
                cur.push_back('\\');
            }
            cur.push_back(c);
            esc = false;
            continue;
        }
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '\'') { st = SQ; quoted = true; continue; }
            if (c == '"') { st = DQ; quoted = true; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM || esc) {
        return {};
    }
    flush();
    return out;
}

core::errors::Result<InvocationSpec> InvocationBuilder::build(
    const Operation operation, const OperationParams& params) const {
    InvocationSpec spec;
    spec.operation = operation;
    spec.argv.push_back(cli_binary_);

    switch (operation) {
        case Operation::Compile: {
            if (!params.sketch_path.has_value()) {
                return missing_parameter("sketch", operation);
            }
            const auto& sketch = params.sketch_path.value();
            spec.argv.insert(spec.argv.end(), {"compile", sketch.string()});
            if (!params.fqbn.empty()) {
                spec.argv.insert(spec.argv.end(), {"--fqbn", params.fqbn});
            }

            const auto build_dir = params.build_path.has_value()
                                       ? params.build_path.value()
                                       : build_directory_for(sketch);
            auto ensured = ensure_directory(build_dir);
            if (core::errors::is_error(ensured)) {
                return core::errors::get_error(ensured);
            }
            spec.argv.insert(spec.argv.end(), {kBuildPathFlag, build_dir.string()});
            if (params.verbose) {
                spec.argv.push_back("-v");
            }
            for (const char* name : kTempVariables) {
                spec.env_overrides[name] = build_dir.string();
            }
            spec.logical_command = compile_cache_key(params.fqbn, project_name(sketch));
            return spec;
        }
        case Operation::Upload:
            if (!params.sketch_path.has_value()) {
                return missing_parameter("sketch", operation);
            }
            if (params.port.empty()) {
                return missing_parameter("port", operation);
            }
            spec.argv.insert(spec.argv.end(),
                             {"upload", "-p", params.port, params.sketch_path->string()});
            if (!params.fqbn.empty()) {
                spec.argv.insert(spec.argv.end(), {"--fqbn", params.fqbn});
            }
            break;
        case Operation::UploadHex:
            if (!params.hex_path.has_value()) {
                return missing_parameter("hex", operation);
            }
            if (params.port.empty()) {
                return missing_parameter("port", operation);
            }
            spec.argv.insert(spec.argv.end(),
                             {"upload", "-i", params.hex_path->string(), "-p", params.port});
            if (!params.fqbn.empty()) {
                spec.argv.insert(spec.argv.end(), {"--fqbn", params.fqbn});
            }
            break;
        case Operation::Monitor:
            if (params.port.empty()) {
                return missing_parameter("port", operation);
            }
            spec.argv.insert(spec.argv.end(),
                             {"monitor", "-p", params.port, "-c",
                              "baudrate=" + std::to_string(params.baud_rate), "--timeout",
                              std::to_string(params.monitor_timeout_s)});
            break;
        case Operation::BoardList:
            spec.argv.insert(spec.argv.end(), {"board", "list"});
            break;
        case Operation::BoardListAll:
            spec.argv.insert(spec.argv.end(), {"board", "listall"});
            if (!params.platform_id.empty()) {
                spec.argv.push_back(params.platform_id);
            }
            break;
        case Operation::CoreList:
            spec.argv.insert(spec.argv.end(), {"core", "list"});
            break;
        case Operation::CoreInstall: {
            if (params.platform_id.empty()) {
                return missing_parameter("platform", operation);
            }
            spec.argv.insert(spec.argv.end(),
                             {"core", "install", canonical_platform_id(params.platform_id)});
            break;
        }
        case Operation::CoreUpdateIndex:
            spec.argv.insert(spec.argv.end(), {"core", "update-index"});
            break;
        case Operation::ConfigInit:
            spec.argv.insert(spec.argv.end(), {"config", "init"});
            break;
        case Operation::ConfigAddBoardUrl:
            if (params.url.empty()) {
                return missing_parameter("url", operation);
            }
            spec.argv.insert(spec.argv.end(),
                             {"config", "add", "board_manager.additional_urls", params.url});
            break;
        case Operation::Version:
            spec.argv.push_back("version");
            break;
        case Operation::Raw: {
            if (params.raw_command.empty()) {
                return missing_parameter("command", operation);
            }
            if (params.raw_command.find_first_not_of(" \t\n\r") == std::string::npos) {
                return BridgeError{ErrorCategory::Input, "Command contains only whitespace.",
                                   "empty_command"};
            }
            auto tokens = split_command_line(params.raw_command);
            if (tokens.empty()) {
                return BridgeError{ErrorCategory::Input,
                                   "Unable to parse command: " + params.raw_command,
                                   "unbalanced_quotes",
                                   "Check that every quote in the command is closed."};
            }
            spec.argv.insert(spec.argv.end(), tokens.begin(), tokens.end());
            spec.logical_command = params.raw_command;

            if (tokens.front() == "compile" && !has_token(tokens, kBuildPathFlag)) {
                const auto build_dir = working_directory_ / "build_output";
                auto ensured = ensure_directory(build_dir);
                if (core::errors::is_error(ensured)) {
                    return core::errors::get_error(ensured);
                }
                spec.argv.insert(spec.argv.end(), {kBuildPathFlag, build_dir.string()});
                LOG_DEBUG("InvocationBuilder: added build path " + build_dir.string());
            }
            return spec;
        }
    }

    spec.logical_command = join_tail(spec.argv);
    return spec;
}

}  // namespace inobridge::invocation
