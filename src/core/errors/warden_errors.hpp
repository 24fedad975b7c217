#pragma once
#include <string>
#include <variant>

namespace warden::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., a missing CLI flag or an empty command
        Config,     // E.g., unreadable config file or a malformed blocklist
        Policy,     // E.g., access denied by the guard or a blocked command
        Io,         // E.g., the audit log could not be rewritten
        Internal    // E.g., fork() failed
    };

    // The standardized error payload
    struct WardenError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a WardenError.
    template <typename T>
    using Result = std::variant<T, WardenError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<WardenError>(result);
    }

    template <typename T>
    const WardenError& get_error(const Result<T>& result) {
        return std::get<WardenError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Config:   return "config";
            case ErrorCategory::Policy:   return "policy";
            case ErrorCategory::Io:       return "io";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace warden::core::errors
