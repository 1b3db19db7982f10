#pragma once
#include <string>
#include <variant>

namespace inobridge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., a required parameter is missing
        Launch,     // E.g., the toolchain binary could not be started
        Execution,  // E.g., a workflow step failed after the tool ran
        Storage,    // E.g., a cache record could not be written
        Internal    // E.g., pipe or fork failure
    };

    // The standardized error payload
    struct BridgeError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Launch:    return "launch";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Storage:   return "storage";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace inobridge::core::errors
