#include "classify/output_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace inobridge::classify {

using protocol::ClassifiedOutcome;
using protocol::CommandResult;
using protocol::ErrorKind;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool group_matches(const TermGroup& group, const std::string& text,
                   const bool case_insensitive) {
    for (const auto& term : group.any_of) {
        const std::string needle = case_insensitive ? lowercase(term) : term;
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool clause_matches(const Clause& clause, const std::string& text,
                    const std::string& lowered) {
    const std::string& haystack = clause.case_insensitive ? lowered : text;
    for (const auto& group : clause.all_of) {
        if (!group_matches(group, haystack, clause.case_insensitive)) {
            return false;
        }
    }
    return !clause.all_of.empty();
}

bool produces_artifact(const protocol::Operation operation) {
    return operation == protocol::Operation::Compile ||
           operation == protocol::Operation::Raw;
}

}  // namespace

const std::vector<ClassificationRule>& failure_rules() {
    static const std::vector<ClassificationRule> kRules = {
        {ErrorKind::UndefinedReference,
         {Clause{{TermGroup{{"undefined reference"}}}, false}}},
        {ErrorKind::MissingDependency,
         {Clause{{TermGroup{{"No such file or directory"}}}, false},
          Clause{{TermGroup{{"library"}}, TermGroup{{"not found"}}}, true}}},
        {ErrorKind::UnsupportedTarget,
         {Clause{{TermGroup{{"board"}}, TermGroup{{"unknown", "not found"}}}, true}}},
    };
    return kRules;
}

ErrorKind classify_failure_text(const std::string& text) {
    const std::string lowered = lowercase(text);
    for (const auto& rule : failure_rules()) {
        for (const auto& clause : rule.any_clause) {
            if (clause_matches(clause, text, lowered)) {
                return rule.kind;
            }
        }
    }
    return ErrorKind::SyntaxError;
}

const std::string& failure_text(const CommandResult& result) {
    return result.stderr_text.empty() ? result.stdout_text : result.stderr_text;
}

std::optional<std::string> extract_artifact_path(const std::string& stdout_text) {
    static const std::regex kArtifactPattern(R"(Sketch uses .*\r?\n(.*\.ino\..*?)\r?\n)");
    std::smatch match;
    if (std::regex_search(stdout_text, match, kArtifactPattern) && match.size() > 1) {
        return match[1].str();
    }
    return std::nullopt;
}

std::string extract_error_detail(const std::string& stdout_text) {
    std::istringstream in(stdout_text);
    std::string line;
    std::string detail;
    while (std::getline(in, line)) {
        if (line.find("error:") == std::string::npos) {
            continue;
        }
        if (!detail.empty()) {
            detail.push_back('\n');
        }
        detail += line;
    }
    return detail;
}

ClassifiedOutcome classify(const CommandResult& result,
                           const protocol::Operation operation) {
    ClassifiedOutcome outcome;
    outcome.success = result.success;

    if (result.success) {
        outcome.error_kind = ErrorKind::None;
        if (produces_artifact(operation)) {
            outcome.artifact_path = extract_artifact_path(result.stdout_text);
        }
        return outcome;
    }

    outcome.error_kind = classify_failure_text(failure_text(result));
    if (result.stderr_text.empty()) {
        outcome.error_detail = extract_error_detail(result.stdout_text);
        if (outcome.error_detail.empty()) {
            outcome.error_detail = "Compilation failed with unknown error";
        }
    } else {
        outcome.error_detail = result.stderr_text;
    }
    return outcome;
}

}  // namespace inobridge::classify
