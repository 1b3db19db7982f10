#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace inobridge::protocol {

    enum class CliCommand {
        Compile,
        Upload,
        CompileUpload,
        Boards,
        Cores,
        Version,
        Run,
        Lookup,
        Store,
        Diagnose,
        Monitor,
        InstallCore,
        AddBoardUrl,
        SetupEsp32,
        ListAll
    };

    // Validated command-line input. Paths are canonical when present.
    struct CliRequest {
        CliCommand command = CliCommand::Version;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> working_directory;
        std::optional<std::string> cli_binary;
        std::optional<uint32_t> max_attempts;
        std::optional<std::filesystem::path> sketch_path;
        std::optional<std::filesystem::path> hex_path;
        std::optional<std::filesystem::path> input_file;
        std::string fqbn = "arduino:avr:uno";
        std::string port;
        std::string platform_id;
        std::string url;
        uint32_t baud_rate = 9600;
        uint32_t monitor_timeout_s = 10;
        std::string command_text;
        std::string output;
        std::string error;
        bool stored_success = true;
        bool verbose = false;
    };

} // namespace inobridge::protocol
