#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tollgate::core::errors {

    // 1. Typed error categories. Callers branch on these, never on message text.
    enum class ErrorCategory {
        Input,             // Malformed request (empty command, bad JSON, unknown tool)
        PolicyDenied,      // Write/edit refused by the path access controller
        QuotaExceeded,     // A size or count cap was hit
        AmbiguousEdit,     // old_string matched zero or several times
        NotFound,          // Missing file or directory
        IOError,           // Filesystem or process-level failure
        CommandBlocked,    // Dangerous command pattern matched
        Timeout,           // Subprocess exceeded its wall-clock bound
        InvalidSpecifier,  // Package specifier failed validation
        Internal           // Logic bug or unexpected library failure
    };

    // The standardized error payload. Structured fields are filled where the
    // category carries them (limit/actual for quotas, permitted for ownership,
    // pattern for blocked commands).
    struct ToolError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
            std::string path = "";
            std::string pattern = "";
            std::optional<std::uintmax_t> limit;
            std::optional<std::uintmax_t> actual;
            std::vector<std::string> permitted;
        };

    // 2. Propagation strategy: a Result holds either a value of type T or a ToolError.
    template <typename T>
    using Result = std::variant<T, ToolError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ToolError>(result);
    }

    template <typename T>
    const ToolError& get_error(const Result<T>& result) {
        return std::get<ToolError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::PolicyDenied: return "policy_denied";
            case ErrorCategory::QuotaExceeded: return "quota_exceeded";
            case ErrorCategory::AmbiguousEdit: return "ambiguous_edit";
            case ErrorCategory::NotFound: return "not_found";
            case ErrorCategory::IOError: return "io_error";
            case ErrorCategory::CommandBlocked: return "command_blocked";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::InvalidSpecifier: return "invalid_specifier";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

    // 3. Human-readable rendering for LLM callers. BLOCKED prefix for policy
    // outcomes, "Error:" for everything else.
    inline std::string render(const ToolError& error) {
        std::string text;
        switch (error.category) {
            case ErrorCategory::PolicyDenied:
            case ErrorCategory::CommandBlocked:
                text = "BLOCKED: " + error.message;
                break;
            default:
                text = "Error: " + error.message;
                break;
        }
        if (!error.hint.empty()) {
            text += " " + error.hint;
        }
        return text;
    }

} // namespace tollgate::core::errors
