#pragma once

#include <optional>
#include <string>
#include <vector>
#include "protocol/command_contract.hpp"
#include "protocol/operation_request.hpp"

namespace inobridge::classify {

// Any term of the group may match.
struct TermGroup {
    std::vector<std::string> any_of;
};

// Every group of the clause must match.
struct Clause {
    std::vector<TermGroup> all_of;
    bool case_insensitive = false;
};

struct ClassificationRule {
    protocol::ErrorKind kind;
    std::vector<Clause> any_clause;
};

// Failure rules in precedence order; the first matching rule wins and
// SyntaxError is the fallback.
const std::vector<ClassificationRule>& failure_rules();

protocol::ErrorKind classify_failure_text(const std::string& text);

// stderr when it has content, stdout otherwise.
const std::string& failure_text(const protocol::CommandResult& result);

// Looks for "Sketch uses ..." followed by a "<name>.ino.<ext>" line.
std::optional<std::string> extract_artifact_path(const std::string& stdout_text);

// Lines of stdout containing "error:", used when stderr is silent.
std::string extract_error_detail(const std::string& stdout_text);

// Pure: no I/O, never fails.
protocol::ClassifiedOutcome classify(const protocol::CommandResult& result,
                                     protocol::Operation operation);

}  // namespace inobridge::classify
