#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <string>
#include <map>
#include <optional>
#include <system_error>
#include <vector>

namespace inobridge::app::cli {

    using namespace inobridge::core::errors;
    using inobridge::protocol::CliCommand;
    using inobridge::protocol::CliRequest;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> config;
            std::optional<std::string> workdir;
            std::optional<std::string> cli;
            std::optional<std::string> max_attempts;
            std::optional<std::string> sketch;
            std::optional<std::string> hex;
            std::optional<std::string> file;
            std::optional<std::string> fqbn;
            std::optional<std::string> port;
            std::optional<std::string> command;
            std::optional<std::string> output;
            std::optional<std::string> error;
            std::optional<std::string> platform;
            std::optional<std::string> url;
            std::optional<std::string> baud;
            std::optional<std::string> timeout;
            bool failed = false;
            bool verbose = false;
        };

        const std::map<std::string, CliCommand>& known_commands() {
            static const std::map<std::string, CliCommand> kCommands = {
                {"compile", CliCommand::Compile},
                {"upload", CliCommand::Upload},
                {"compile-upload", CliCommand::CompileUpload},
                {"boards", CliCommand::Boards},
                {"cores", CliCommand::Cores},
                {"version", CliCommand::Version},
                {"run", CliCommand::Run},
                {"lookup", CliCommand::Lookup},
                {"store", CliCommand::Store},
                {"diagnose", CliCommand::Diagnose},
                {"monitor", CliCommand::Monitor},
                {"install-core", CliCommand::InstallCore},
                {"add-board-url", CliCommand::AddBoardUrl},
                {"setup-esp32", CliCommand::SetupEsp32},
                {"list-all", CliCommand::ListAll}};
            return kCommands;
        }

        Result<std::filesystem::path> existing_file(const std::string& raw, const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(p, ec);
            if (ec || !is_file) {
                return BridgeError{ErrorCategory::Input, "File given to " + flag + " does not exist: " + raw, "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, ec);
            if (ec) {
                return BridgeError{ErrorCategory::Input, "Failed to canonicalize " + raw, "invalid_path"};
            }
            return canonical_path;
        }

        // Exception-free integer parsing
        Result<uint32_t> bounded_uint(const std::string& raw, const std::string& flag, uint32_t min, uint32_t max) {
            uint32_t value = 0;
            const char* begin = raw.data();
            const char* end = raw.data() + raw.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return BridgeError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < min || value > max) {
                return BridgeError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                   "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

    } // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return BridgeError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: inobridge compile --sketch path/to/sketch.ino --fqbn arduino:avr:uno"};
        }

        const std::string command = argv[1];
        const auto known = known_commands().find(command);
        if (known == known_commands().end()) {
            return BridgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command",
                               "Commands: compile, upload, compile-upload, boards, cores, version, run, lookup, store, diagnose, "
                               "monitor, install-core, add-board-url, setup-esp32, list-all."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        const std::map<std::string, std::optional<std::string>*> valued_flags = {
            {"--config", &raw.config},   {"--workdir", &raw.workdir},
            {"--cli", &raw.cli},         {"--max-attempts", &raw.max_attempts},
            {"--sketch", &raw.sketch},   {"--hex", &raw.hex},
            {"--file", &raw.file},       {"--fqbn", &raw.fqbn},
            {"--port", &raw.port},       {"--command", &raw.command},
            {"--output", &raw.output},   {"--error", &raw.error},
            {"--platform", &raw.platform}, {"--url", &raw.url},
            {"--baud", &raw.baud},       {"--timeout", &raw.timeout}};

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const auto flag = valued_flags.find(args[i]);
            if (flag != valued_flags.end()) {
                if (i + 1 < args.size()) *flag->second = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            } else if (args[i] == "--failed") {
                raw.failed = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliRequest req;
        req.command = known->second;
        req.verbose = raw.verbose;
        req.stored_success = !raw.failed;
        if (raw.cli) req.cli_binary = raw.cli.value();
        if (raw.fqbn) req.fqbn = raw.fqbn.value();
        if (raw.port) req.port = raw.port.value();
        if (raw.command) req.command_text = raw.command.value();
        if (raw.output) req.output = raw.output.value();
        if (raw.error) req.error = raw.error.value();
        if (raw.platform) req.platform_id = raw.platform.value();
        if (raw.url) req.url = raw.url.value();

        if (req.fqbn.empty()) {
            return BridgeError{ErrorCategory::Input, "--fqbn cannot be empty", "missing_value"};
        }

        switch (req.command) {
            case CliCommand::Compile:
                if (!raw.sketch) return BridgeError{ErrorCategory::Input, "compile requires --sketch", "missing_required_flag"};
                break;
            case CliCommand::Upload:
                if (!raw.port) return BridgeError{ErrorCategory::Input, "upload requires --port", "missing_required_flag"};
                if (!raw.sketch && !raw.hex) return BridgeError{ErrorCategory::Input, "Either --sketch or --hex is required", "missing_required_flag"};
                break;
            case CliCommand::CompileUpload:
                if (!raw.sketch || !raw.port) return BridgeError{ErrorCategory::Input, "compile-upload requires --sketch and --port", "missing_required_flag"};
                break;
            case CliCommand::Run:
            case CliCommand::Lookup:
            case CliCommand::Store:
                if (!raw.command || raw.command->empty()) return BridgeError{ErrorCategory::Input, command + " requires --command", "missing_required_flag"};
                break;
            case CliCommand::Diagnose:
                if (!raw.file) return BridgeError{ErrorCategory::Input, "diagnose requires --file", "missing_required_flag"};
                break;
            case CliCommand::Monitor:
                if (!raw.port) return BridgeError{ErrorCategory::Input, "monitor requires --port", "missing_required_flag"};
                break;
            case CliCommand::InstallCore:
                if (!raw.platform || raw.platform->empty()) return BridgeError{ErrorCategory::Input, "install-core requires --platform", "missing_required_flag"};
                break;
            case CliCommand::AddBoardUrl:
                if (!raw.url || raw.url->empty()) return BridgeError{ErrorCategory::Input, "add-board-url requires --url", "missing_required_flag"};
                break;
            default:
                break;
        }

        if (raw.sketch) {
            auto sketch = existing_file(raw.sketch.value(), "--sketch");
            if (is_error(sketch)) return get_error(sketch);
            if (get_value(sketch).extension() != ".ino") {
                return BridgeError{ErrorCategory::Input, "Sketch file must have .ino extension: " + raw.sketch.value(), "invalid_sketch"};
            }
            req.sketch_path = get_value(sketch);
        }
        if (raw.hex) {
            auto hex = existing_file(raw.hex.value(), "--hex");
            if (is_error(hex)) return get_error(hex);
            req.hex_path = get_value(hex);
        }
        if (raw.file) {
            auto file = existing_file(raw.file.value(), "--file");
            if (is_error(file)) return get_error(file);
            req.input_file = get_value(file);
        }
        if (raw.config) {
            auto config = existing_file(raw.config.value(), "--config");
            if (is_error(config)) return get_error(config);
            req.config_file = get_value(config);
        }
        if (raw.workdir) {
            req.working_directory = std::filesystem::path(raw.workdir.value());
        }

        if (raw.max_attempts) {
            auto attempts = bounded_uint(raw.max_attempts.value(), "--max-attempts", 1, 10);
            if (is_error(attempts)) return get_error(attempts);
            req.max_attempts = get_value(attempts);
        }
        if (raw.baud) {
            auto baud = bounded_uint(raw.baud.value(), "--baud", 300, 4000000);
            if (is_error(baud)) return get_error(baud);
            req.baud_rate = get_value(baud);
        }
        if (raw.timeout) {
            auto timeout = bounded_uint(raw.timeout.value(), "--timeout", 1, 3600);
            if (is_error(timeout)) return get_error(timeout);
            req.monitor_timeout_s = get_value(timeout);
        }

        return req;
    }

} // namespace inobridge::app::cli
