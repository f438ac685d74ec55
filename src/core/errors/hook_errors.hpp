#pragma once
#include <string>
#include <variant>

namespace hookguard::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,       // E.g., Payload is valid JSON but not an object
        Parse,       // E.g., Standard input is not JSON at all
        Processing,  // E.g., "command" is a number when a rule needs text
        Internal     // E.g., Stream failure or an unexpected exception
    };

    // The standardized error payload
    struct HookError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a HookError.
    template <typename T>
    using Result = std::variant<T, HookError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<HookError>(result);
    }

    template <typename T>
    const HookError& get_error(const Result<T>& result) {
        return std::get<HookError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Parse:
                return "parse";
            case ErrorCategory::Processing:
                return "processing";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace hookguard::core::errors
