#include <string>
#include <gtest/gtest.h>
#include "classify/output_classifier.hpp"

namespace {

using inobridge::classify::classify;
using inobridge::classify::classify_failure_text;
using inobridge::classify::extract_artifact_path;
using inobridge::classify::extract_error_detail;
using inobridge::classify::failure_text;
using inobridge::protocol::CommandResult;
using inobridge::protocol::ErrorKind;
using inobridge::protocol::Operation;

CommandResult failed(const std::string& out, const std::string& err) {
    return CommandResult{"compile -b arduino:avr:uno Blink", false, out, err};
}

TEST(OutputClassifierTest, UndefinedReferenceWinsOverEverythingElse) {
    const auto outcome = classify(
        failed("", "main.cpp:(.text+0x8): undefined reference to `setup'\n"
                   "Foo.h: No such file or directory"),
        Operation::Compile);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::UndefinedReference);
}

TEST(OutputClassifierTest, MissingHeaderIsMissingDependency) {
    EXPECT_EQ(classify_failure_text(
                  "Blink.ino:1:10: fatal error: Servo.h: No such file or directory"),
              ErrorKind::MissingDependency);
}

TEST(OutputClassifierTest, MissingDependencyOutranksUnknownBoard) {
    EXPECT_EQ(classify_failure_text("Unknown board; Foo.h: No such file or directory"),
              ErrorKind::MissingDependency);
}

TEST(OutputClassifierTest, LibraryNotFoundIsCaseInsensitive) {
    EXPECT_EQ(classify_failure_text("Error: LIBRARY 'WiFiNINA' NOT FOUND"),
              ErrorKind::MissingDependency);
}

TEST(OutputClassifierTest, BoardProblemsAreUnsupportedTarget) {
    EXPECT_EQ(classify_failure_text("Error during build: Board FOO:BAR:baz is UNKNOWN"),
              ErrorKind::UnsupportedTarget);
    EXPECT_EQ(classify_failure_text("platform for board not found"),
              ErrorKind::UnsupportedTarget);
}

TEST(OutputClassifierTest, OtherFailuresDefaultToSyntaxError) {
    EXPECT_EQ(classify_failure_text("Blink.ino:5:1: error: expected ';' before '}' token"),
              ErrorKind::SyntaxError);
    EXPECT_EQ(classify_failure_text(""), ErrorKind::SyntaxError);
}

TEST(OutputClassifierTest, SuccessExtractsArtifactName) {
    CommandResult result{"compile", true, "Sketch uses 1024 bytes\nfoo.ino.hex\n", ""};
    const auto outcome = classify(result, Operation::Compile);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::None);
    ASSERT_TRUE(outcome.artifact_path.has_value());
    EXPECT_EQ(outcome.artifact_path.value(), "foo.ino.hex");
}

TEST(OutputClassifierTest, ArtifactPatternToleratesCarriageReturns) {
    const auto path = extract_artifact_path(
        "Sketch uses 924 bytes (2%) of program storage space.\r\n"
        "/tmp/build/Blink.ino.elf\r\n");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), "/tmp/build/Blink.ino.elf");
}

TEST(OutputClassifierTest, SuccessWithoutArtifactLeavesPathEmpty) {
    CommandResult result{"compile", true, "Sketch uses 1024 bytes\nGlobal variables use 9\n",
                         ""};
    const auto outcome = classify(result, Operation::Compile);
    EXPECT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.artifact_path.has_value());
}

TEST(OutputClassifierTest, NonCompileOperationsNeverReportArtifacts) {
    CommandResult result{"board list", true, "Sketch uses 1\nfoo.ino.hex\n", ""};
    EXPECT_FALSE(classify(result, Operation::BoardList).artifact_path.has_value());
}

TEST(OutputClassifierTest, StdoutIsClassifiedWhenStderrIsEmpty) {
    const auto result = failed("Compiling sketch...\n"
                               "Blink.ino:3:1: error: 'foo' was not declared\n"
                               "Blink.ino:4:1: error: undefined reference to `bar'\n",
                               "");
    EXPECT_EQ(&failure_text(result), &result.stdout_text);

    const auto outcome = classify(result, Operation::Compile);
    EXPECT_EQ(outcome.error_kind, ErrorKind::UndefinedReference);
    EXPECT_EQ(outcome.error_detail,
              "Blink.ino:3:1: error: 'foo' was not declared\n"
              "Blink.ino:4:1: error: undefined reference to `bar'");
}

TEST(OutputClassifierTest, SilentFailureGetsGenericDetail) {
    const auto outcome = classify(failed("Compiling sketch...\n", ""), Operation::Compile);
    EXPECT_EQ(outcome.error_kind, ErrorKind::SyntaxError);
    EXPECT_EQ(outcome.error_detail, "Compilation failed with unknown error");
}

TEST(OutputClassifierTest, ErrorDetailIgnoresNonErrorLines) {
    EXPECT_EQ(extract_error_detail("warning: unused\nnote: here\n"), "");
}

}  // namespace
