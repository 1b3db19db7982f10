#include "classify/diagnostics.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

namespace inobridge::classify {

namespace {

void push_unique(std::vector<std::string>& values, const std::string& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

void add_category(Diagnosis& diagnosis, const DiagnosticCategory category) {
    if (std::find(diagnosis.categories.begin(), diagnosis.categories.end(), category) ==
        diagnosis.categories.end()) {
        diagnosis.categories.push_back(category);
    }
}

std::string header_stem(const std::string& header) {
    const auto slash = header.find_last_of('/');
    std::string name = slash == std::string::npos ? header : header.substr(slash + 1);
    const auto dot = name.find('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

}  // namespace

std::string to_string(const DiagnosticCategory category) {
    switch (category) {
        case DiagnosticCategory::MissingInclude:
            return "missing_include";
        case DiagnosticCategory::UndefinedReference:
            return "undefined_reference";
        case DiagnosticCategory::Syntax:
            return "syntax";
        default:
            return "unknown";
    }
}

Diagnosis diagnose(const std::string& text) {
    static const std::regex kMissingHeader(
        R"(([A-Za-z0-9_./+\-]+\.(?:h|hpp|hh)): No such file or directory)");
    static const std::regex kUndefinedSymbol(R"(undefined reference to [`']([^'`]+)[`'])");

    Diagnosis diagnosis;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::smatch match;
        if (std::regex_search(line, match, kMissingHeader)) {
            add_category(diagnosis, DiagnosticCategory::MissingInclude);
            push_unique(diagnosis.missing_headers, match[1].str());
            continue;
        }
        if (std::regex_search(line, match, kUndefinedSymbol)) {
            add_category(diagnosis, DiagnosticCategory::UndefinedReference);
            push_unique(diagnosis.undefined_symbols, match[1].str());
            continue;
        }
        if (line.find("error:") != std::string::npos) {
            add_category(diagnosis, DiagnosticCategory::Syntax);
        }
    }

    for (const auto& header : diagnosis.missing_headers) {
        diagnosis.suggestions.push_back(
            "Header '" + header + "' was not found: install the library that provides it "
            "(try 'arduino-cli lib search " + header_stem(header) +
            "') or fix the #include spelling.");
    }
    for (const auto& symbol : diagnosis.undefined_symbols) {
        if (symbol == "setup" || symbol == "loop") {
            diagnosis.suggestions.push_back("The sketch must define both setup() and loop().");
            continue;
        }
        diagnosis.suggestions.push_back(
            "'" + symbol + "' is declared but never defined: add its definition or "
            "install the library that implements it.");
    }
    if (std::find(diagnosis.categories.begin(), diagnosis.categories.end(),
                  DiagnosticCategory::Syntax) != diagnosis.categories.end()) {
        diagnosis.suggestions.push_back(
            "Check the reported lines for missing semicolons, unbalanced braces or "
            "undeclared identifiers.");
    }
    return diagnosis;
}

}  // namespace inobridge::classify
