#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace inobridge::protocol {

    // Logical toolchain operations the builder knows how to spell.
    enum class Operation {
        Compile,
        Upload,
        UploadHex,
        Monitor,
        BoardList,
        BoardListAll,
        CoreList,
        CoreInstall,
        CoreUpdateIndex,
        ConfigInit,
        ConfigAddBoardUrl,
        Version,
        Raw
    };

    // Parameters for one operation. Paths are expected to be absolute already.
    struct OperationParams {
        std::optional<std::filesystem::path> sketch_path;
        std::optional<std::filesystem::path> hex_path;
        std::optional<std::filesystem::path> build_path;
        std::string fqbn;
        std::string port;
        std::string platform_id;
        std::string url;
        std::string raw_command;
        uint32_t baud_rate = 9600;
        uint32_t monitor_timeout_s = 10;
        bool verbose = false;
    };

    // Fully resolved invocation. Built fresh per call; the runner copies it.
    struct InvocationSpec {
        Operation operation = Operation::Raw;
        std::string logical_command;
        std::vector<std::string> argv;
        std::map<std::string, std::string> env_overrides;
    };

    inline bool is_compile_operation(const Operation op) {
        return op == Operation::Compile;
    }

    inline std::string to_string(const Operation op) {
        switch (op) {
            case Operation::Compile:           return "compile";
            case Operation::Upload:            return "upload";
            case Operation::UploadHex:         return "upload_hex";
            case Operation::Monitor:           return "monitor";
            case Operation::BoardList:         return "board_list";
            case Operation::BoardListAll:      return "board_listall";
            case Operation::CoreList:          return "core_list";
            case Operation::CoreInstall:       return "core_install";
            case Operation::CoreUpdateIndex:   return "core_update_index";
            case Operation::ConfigInit:        return "config_init";
            case Operation::ConfigAddBoardUrl: return "config_add_board_url";
            case Operation::Version:           return "version";
            case Operation::Raw:               return "raw";
            default: return "unknown";
        }
    }

} // namespace inobridge::protocol
