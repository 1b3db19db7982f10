#pragma once

#include <optional>
#include <string>

namespace inobridge::protocol {

// What the toolchain process produced for one logical command.
struct CommandResult {
    std::string logical_command;
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
};

inline bool operator==(const CommandResult& lhs, const CommandResult& rhs) {
    return lhs.logical_command == rhs.logical_command &&
           lhs.success == rhs.success && lhs.stdout_text == rhs.stdout_text &&
           lhs.stderr_text == rhs.stderr_text;
}

inline bool operator!=(const CommandResult& lhs, const CommandResult& rhs) {
    return !(lhs == rhs);
}

enum class ErrorKind {
    None,
    SyntaxError,
    UndefinedReference,
    MissingDependency,
    UnsupportedTarget
};

struct ClassifiedOutcome {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::optional<std::string> artifact_path;
    // Error lines pulled from the output when stderr was empty.
    std::string error_detail;
};

enum class ResultOrigin {
    Executed,
    Cached,
    StaleFallback
};

struct BuildReport {
    CommandResult command;
    ClassifiedOutcome outcome;
    ResultOrigin origin = ResultOrigin::Executed;
    int attempts = 0;
};

inline std::string to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::SyntaxError:
            return "syntax_error";
        case ErrorKind::UndefinedReference:
            return "undefined_reference";
        case ErrorKind::MissingDependency:
            return "missing_dependency";
        case ErrorKind::UnsupportedTarget:
            return "unsupported_target";
        default:
            return "unknown";
    }
}

inline std::string to_string(const ResultOrigin origin) {
    switch (origin) {
        case ResultOrigin::Executed:
            return "executed";
        case ResultOrigin::Cached:
            return "cached";
        case ResultOrigin::StaleFallback:
            return "stale_fallback";
        default:
            return "unknown";
    }
}

}  // namespace inobridge::protocol
