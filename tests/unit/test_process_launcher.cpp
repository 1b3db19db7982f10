#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/bridge_errors.hpp"
#include "process/process_launcher.hpp"
#include "test_support.hpp"

namespace {

using inobridge::core::errors::ErrorCategory;
using inobridge::core::errors::get_error;
using inobridge::core::errors::get_value;
using inobridge::core::errors::is_error;
using inobridge::environment::EnvironmentMap;
using inobridge::process::PosixProcessLauncher;
using inobridge::testing::TempWorkspace;

const EnvironmentMap kMinimalEnv = {{"PATH", "/usr/bin:/bin"}, {"HOME", "/tmp"}};

TEST(PosixProcessLauncherTest, CapturesStreamsAndExitCode) {
    TempWorkspace workspace;
    PosixProcessLauncher launcher;

    auto result = launcher.launch(
        {"/bin/sh", "-c", "printf 'to stdout'; printf 'to stderr' >&2; exit 3"},
        kMinimalEnv, workspace.root());
    ASSERT_FALSE(is_error(result));
    const auto& capture = get_value(result);
    EXPECT_EQ(capture.exit_code, 3);
    EXPECT_EQ(capture.stdout_text, "to stdout");
    EXPECT_EQ(capture.stderr_text, "to stderr");
    EXPECT_GE(capture.duration_ms, 0.0);
}

TEST(PosixProcessLauncherTest, PassesEnvironmentAndResolvesPath) {
    TempWorkspace workspace;
    PosixProcessLauncher launcher;

    EnvironmentMap env = kMinimalEnv;
    env["INOBRIDGE_PROBE"] = "probe-value";
    auto result = launcher.launch({"sh", "-c", "printf '%s' \"$INOBRIDGE_PROBE\""}, env,
                                  workspace.root());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_EQ(get_value(result).stdout_text, "probe-value");
}

TEST(PosixProcessLauncherTest, RunsInWorkingDirectory) {
    TempWorkspace workspace;
    PosixProcessLauncher launcher;

    auto result = launcher.launch({"/bin/sh", "-c", "pwd -P"}, kMinimalEnv, workspace.root());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text,
              std::filesystem::canonical(workspace.root()).string() + "\n");
}

TEST(PosixProcessLauncherTest, CapturesLargeOutputWithoutBlocking) {
    TempWorkspace workspace;
    PosixProcessLauncher launcher;

    auto result = launcher.launch(
        {"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; i=$((i+1)); done"},
        kMinimalEnv, workspace.root());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_NE(get_value(result).stdout_text.find("line19999"), std::string::npos);
    EXPECT_NE(get_value(result).stderr_text.find("err19999"), std::string::npos);
}

TEST(PosixProcessLauncherTest, MissingBinaryIsLaunchError) {
    TempWorkspace workspace;
    PosixProcessLauncher launcher;

    auto result = launcher.launch({"inobridge-definitely-missing-binary", "version"},
                                  kMinimalEnv, workspace.root());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Launch);
    EXPECT_EQ(get_error(result).code, "launch_failed");
}

TEST(PosixProcessLauncherTest, MissingWorkingDirectoryIsLaunchError) {
    TempWorkspace workspace;
    PosixProcessLauncher launcher;

    auto result = launcher.launch({"/bin/sh", "-c", "true"}, kMinimalEnv,
                                  workspace.root() / "does-not-exist");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Launch);
    EXPECT_EQ(get_error(result).code, "chdir_failed");
}

TEST(PosixProcessLauncherTest, RejectsEmptyArgv) {
    PosixProcessLauncher launcher;
    auto result = launcher.launch({}, kMinimalEnv, "");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_argv");
}

}  // namespace
