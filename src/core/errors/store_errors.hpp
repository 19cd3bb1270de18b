#pragma once
#include <string>
#include <variant>
#include <utility>

namespace runvault::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        NotFound,        // E.g., run, artifact or archive absent
        AlreadyExists,   // E.g., duplicate start_run or restore collision
        InvalidState,    // E.g., turn recorded against a run that is not active
        Io,              // E.g., filesystem or compression failure
        InvalidArchive,  // E.g., path traversal or corrupt tar/gzip stream
        Input,           // E.g., bad CLI flag or config value
        Internal         // E.g., logic bug or unexpected subprocess failure
    };

    // The standardized error payload
    struct StoreError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T or a StoreError.
    template <typename T>
    using Result = std::variant<T, StoreError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<StoreError>(result);
    }

    template <typename T>
    const StoreError& get_error(const Result<T>& result) {
        return std::get<StoreError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::NotFound:       return "not_found";
            case ErrorCategory::AlreadyExists:  return "already_exists";
            case ErrorCategory::InvalidState:   return "invalid_state";
            case ErrorCategory::Io:             return "io_error";
            case ErrorCategory::InvalidArchive: return "invalid_archive";
            case ErrorCategory::Input:          return "input";
            case ErrorCategory::Internal:       return "internal";
            default: return "unknown";
        }
    }

} // namespace runvault::core::errors
