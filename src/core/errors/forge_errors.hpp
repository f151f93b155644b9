#pragma once
#include <string>
#include <variant>

namespace protoforge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,            // Bad CLI flag, unreadable config, missing spec
        Conflict,         // Patch could not apply to the base snapshot
        Validation,       // Malformed, oversized or empty patch
        Execution,        // Test harness could not run the command at all
        Timeout,          // Test run or generation call exceeded its bound
        Provider,         // Generation service failed to answer
        Policy,           // Path or command rejected by the policy guard
        BudgetExhausted,  // Iteration budget used up without success
        Cancelled,        // Session cancelled from outside
        Internal          // Infrastructure fault, e.g. snapshot store corruption
    };

    // The standardized error payload
    struct ForgeError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a ForgeError.
    template <typename T>
    using Result = std::variant<T, ForgeError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ForgeError>(result);
    }

    template <typename T>
    const ForgeError& get_error(const Result<T>& result) {
        return std::get<ForgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Conditions that end a session instead of feeding back into the loop.
    inline bool is_terminal(const ErrorCategory category) {
        return category == ErrorCategory::BudgetExhausted ||
               category == ErrorCategory::Cancelled ||
               category == ErrorCategory::Internal;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Conflict: return "conflict";
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::Provider: return "provider";
            case ErrorCategory::Policy: return "policy";
            case ErrorCategory::BudgetExhausted: return "budget_exhausted";
            case ErrorCategory::Cancelled: return "cancelled";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace protoforge::core::errors
