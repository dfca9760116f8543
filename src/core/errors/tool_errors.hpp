#pragma once
#include <string>
#include <variant>
#include <utility>

namespace tclhub::core::errors {

    // 1. Typed error categories shared by every component
    enum class ErrorCategory {
        Input,                     // E.g., bad flag or malformed request
        PathFormat,                // E.g., "/a/b/c/d" or "user_x___y"
        NamespaceViolation,        // E.g., adding a tool under /bin
        DuplicateTool,
        NotFound,
        MissingRequiredParameter,
        InterpreterFault,          // Propagated verbatim from the runtime
        PersistenceFault,          // I/O or serialization failure on the store
        DiscoveryIO,               // Aborts the current scan only
        Internal                   // E.g., actor already shut down
    };

    // The standardized error payload
    struct ToolError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a ToolError.
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

    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string category_name(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::PathFormat: return "path_format";
            case ErrorCategory::NamespaceViolation: return "namespace_violation";
            case ErrorCategory::DuplicateTool: return "duplicate_tool";
            case ErrorCategory::NotFound: return "not_found";
            case ErrorCategory::MissingRequiredParameter: return "missing_required_parameter";
            case ErrorCategory::InterpreterFault: return "interpreter_fault";
            case ErrorCategory::PersistenceFault: return "persistence_fault";
            case ErrorCategory::DiscoveryIO: return "discovery_io";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace tclhub::core::errors
