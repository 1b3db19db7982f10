#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/bridge_errors.hpp"
#include "test_support.hpp"

namespace {

using inobridge::app::cli::parse_and_validate;
using inobridge::core::errors::ErrorCategory;
using inobridge::core::errors::get_error;
using inobridge::core::errors::get_value;
using inobridge::core::errors::is_error;
using inobridge::protocol::CliCommand;
using inobridge::protocol::CliRequest;
using inobridge::testing::TempWorkspace;
using inobridge::testing::write_file;

inobridge::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("inobridge");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"flash"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"version", "--colour"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"boards", "--workdir"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, CompileRequiresSketch) {
    auto result = parse_tokens({"compile", "--fqbn", "arduino:avr:mega"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, UploadRequiresPort) {
    auto result = parse_tokens({"upload", "--hex", "firmware.hex"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, RunRequiresCommandText) {
    auto result = parse_tokens({"run", "--command", ""});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenSketchMissingOnDisk) {
    const auto missing =
        std::filesystem::current_path() / "__definitely_missing_sketch__" / "a.ino";
    auto result = parse_tokens({"compile", "--sketch", missing.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenSketchHasWrongExtension) {
    TempWorkspace workspace;
    const auto source = workspace.root() / "Blink" / "Blink.cpp";
    write_file(source, "int main() {}\n");
    auto result = parse_tokens({"compile", "--sketch", source.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_sketch");
}

TEST(CliParserTest, FailsWhenMaxAttemptsNotNumeric) {
    auto result = parse_tokens({"version", "--max-attempts", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxAttemptsHasTrailingCharacters) {
    auto result = parse_tokens({"version", "--max-attempts", "3x"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxAttemptsOutOfBounds) {
    auto result = parse_tokens({"version", "--max-attempts", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, ParsesValidCompileRequest) {
    TempWorkspace workspace;
    const auto sketch = workspace.root() / "Blink" / "Blink.ino";
    write_file(sketch, "void setup() {}\nvoid loop() {}\n");

    auto result = parse_tokens({"compile", "--sketch", sketch.string(), "--fqbn",
                                "arduino:avr:nano", "--max-attempts", "5", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Compile);
    ASSERT_TRUE(req.sketch_path.has_value());
    EXPECT_EQ(req.sketch_path.value(), std::filesystem::canonical(sketch));
    EXPECT_EQ(req.fqbn, "arduino:avr:nano");
    ASSERT_TRUE(req.max_attempts.has_value());
    EXPECT_EQ(req.max_attempts.value(), 5u);
    EXPECT_TRUE(req.verbose);
}

TEST(CliParserTest, ParsesStoreRequestWithDefaults) {
    auto result = parse_tokens({"store", "--command", "board list", "--output", "none",
                                "--failed"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Store);
    EXPECT_EQ(req.command_text, "board list");
    EXPECT_EQ(req.output, "none");
    EXPECT_FALSE(req.stored_success);
    EXPECT_EQ(req.fqbn, "arduino:avr:uno");
    EXPECT_FALSE(req.verbose);
    EXPECT_FALSE(req.max_attempts.has_value());
}

TEST(CliParserTest, MonitorRequiresPortAndParsesSerialSettings) {
    auto missing = parse_tokens({"monitor", "--baud", "115200"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_required_flag");

    auto result = parse_tokens({"monitor", "--port", "/dev/ttyACM0", "--baud", "115200",
                                "--timeout", "30"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Monitor);
    EXPECT_EQ(req.port, "/dev/ttyACM0");
    EXPECT_EQ(req.baud_rate, 115200u);
    EXPECT_EQ(req.monitor_timeout_s, 30u);
}

TEST(CliParserTest, MonitorDefaultsSerialSettings) {
    auto result = parse_tokens({"monitor", "--port", "/dev/ttyACM0"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).baud_rate, 9600u);
    EXPECT_EQ(get_value(result).monitor_timeout_s, 10u);
}

TEST(CliParserTest, FailsWhenTimeoutOutOfBounds) {
    auto result = parse_tokens({"monitor", "--port", "/dev/ttyACM0", "--timeout", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, InstallCoreRequiresPlatform) {
    auto missing = parse_tokens({"install-core"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_required_flag");

    auto result = parse_tokens({"install-core", "--platform", "esp32"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, CliCommand::InstallCore);
    EXPECT_EQ(get_value(result).platform_id, "esp32");
}

TEST(CliParserTest, AddBoardUrlRequiresUrl) {
    auto missing = parse_tokens({"add-board-url", "--url", ""});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_required_flag");

    auto result = parse_tokens({"add-board-url", "--url", "https://example.com/index.json"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).url, "https://example.com/index.json");
}

TEST(CliParserTest, ParsesFlaglessSetupCommands) {
    auto setup = parse_tokens({"setup-esp32"});
    ASSERT_FALSE(is_error(setup));
    EXPECT_EQ(get_value(setup).command, CliCommand::SetupEsp32);

    auto list = parse_tokens({"list-all"});
    ASSERT_FALSE(is_error(list));
    EXPECT_EQ(get_value(list).command, CliCommand::ListAll);
}

}  // namespace
