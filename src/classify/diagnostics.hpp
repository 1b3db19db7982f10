#pragma once

#include <string>
#include <vector>

namespace inobridge::classify {

enum class DiagnosticCategory {
    MissingInclude,
    UndefinedReference,
    Syntax
};

struct Diagnosis {
    std::vector<DiagnosticCategory> categories;
    std::vector<std::string> missing_headers;
    std::vector<std::string> undefined_symbols;
    std::vector<std::string> suggestions;

    bool empty() const { return categories.empty(); }
};

// Explains compiler output for a human. Independent of classify(): it may
// report several categories for the same text.
Diagnosis diagnose(const std::string& text);

std::string to_string(DiagnosticCategory category);

}  // namespace inobridge::classify
