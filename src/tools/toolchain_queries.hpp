#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "protocol/command_contract.hpp"
#include "runtime/command_engine.hpp"

namespace inobridge::tools {

struct BoardInfo {
    std::string port;
    std::string board_name;
    std::string fqbn;
};

struct CompileUploadReport {
    bool compile_success = false;
    bool upload_success = false;
    std::optional<std::filesystem::path> artifact;
    protocol::BuildReport compile;
    std::optional<protocol::BuildReport> upload;
    std::string error;
};

struct InstallReport {
    bool success = false;
    bool already_installed = false;
    std::string platform_id;
    std::string message;
};

// One named step of a multi-command setup; later steps run even when an
// earlier one failed.
struct SetupStep {
    std::string name;
    protocol::BuildReport report;
};

struct AvailableBoards {
    std::vector<BoardInfo> connected;
    std::vector<std::string> platforms;
    // Raw `board listall` table; empty when the listing failed.
    std::string all_boards;
};

inline constexpr const char* kEsp32BoardUrl =
    "https://raw.githubusercontent.com/espressif/arduino-esp32/gh-pages/"
    "package_esp32_index.json";

// Header line skipped; port is the first column and fqbn the last.
std::vector<BoardInfo> parse_board_list(const std::string& output);

// Header line skipped; the platform id is the first column.
std::vector<std::string> parse_core_list(const std::string& output);

// First regular file in dir whose extension equals `extension`.
std::optional<std::filesystem::path> find_artifact(const std::filesystem::path& dir,
                                                   const std::string& extension = ".hex");

class ToolchainQueries {
public:
    explicit ToolchainQueries(runtime::CommandEngine& engine);

    core::errors::Result<std::vector<BoardInfo>> list_boards();
    core::errors::Result<std::vector<std::string>> core_platforms();
    core::errors::Result<std::string> check_version();

    // Bounded read of a serial port; the tool's own --timeout ends it.
    core::errors::Result<protocol::BuildReport> monitor_port(const std::string& port,
                                                             uint32_t baud_rate = 9600,
                                                             uint32_t timeout_s = 10);
    core::errors::Result<protocol::BuildReport> update_index();
    core::errors::Result<protocol::BuildReport> list_all_boards(
        const std::string& platform_id = "");

    // Runs `config init` first; its report is returned when it fails.
    core::errors::Result<protocol::BuildReport> add_board_url(const std::string& url);

    // Skips installed platforms, otherwise update-index, install, then checks
    // `core list` for the platform.
    core::errors::Result<InstallReport> install_core(const std::string& platform_id);

    core::errors::Result<std::vector<SetupStep>> setup_esp32();

    // Tool failures leave the affected part empty; launch errors still fail.
    core::errors::Result<AvailableBoards> list_available_boards();

    core::errors::Result<CompileUploadReport> compile_and_upload(
        const std::filesystem::path& sketch_path, const std::string& port,
        const std::string& fqbn);

private:
    core::errors::Result<protocol::BuildReport> run_operation(
        protocol::Operation operation, const protocol::OperationParams& params = {});
    core::errors::Result<std::vector<std::string>> installed_platforms();
    core::errors::Result<protocol::CommandResult> run_listing(protocol::Operation operation,
                                                              const std::string& code);
    std::optional<std::filesystem::path> resolve_artifact(
        const std::filesystem::path& sketch_path,
        const protocol::ClassifiedOutcome& outcome) const;

    runtime::CommandEngine& engine_;
};

}  // namespace inobridge::tools
