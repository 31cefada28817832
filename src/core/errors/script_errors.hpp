#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace agentic::core::errors {

    // Position of a construct in the script source (1-based).
    struct SourceLocation {
        std::size_t line = 1;
        std::size_t column = 1;
    };

    enum class ErrorCategory {
        Syntax,    // Malformed source text
        Semantic,  // Name and lookup errors (duplicate_name, unknown_agent, ...)
        Type,      // Bad operand or value type
        Tool,      // Tool assignment or tool execution failures
        Timeout,   // An ask exceeded its deadline
        Input,     // Invalid CLI flag or option
        Internal   // Runtime plumbing failures (I/O, mailbox closed, ...)
    };

    struct ScriptError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        std::optional<SourceLocation> location = std::nullopt;
    };

    // A Result holds either a successful value of type T, OR a ScriptError.
    template <typename T>
    using Result = std::variant<T, ScriptError>;

    // Result for operations that produce no value.
    using Status = Result<std::monostate>;

    inline Status ok() { return std::monostate{}; }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ScriptError>(result);
    }

    template <typename T>
    const ScriptError& get_error(const Result<T>& result) {
        return std::get<ScriptError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T&& take_value(Result<T>& result) {
        return std::get<T>(std::move(result));
    }

    // Attaches a source position unless the error already carries one.
    inline ScriptError at(ScriptError error, const SourceLocation& location) {
        if (!error.location.has_value()) {
            error.location = location;
        }
        return error;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Syntax:   return "syntax";
            case ErrorCategory::Semantic: return "semantic";
            case ErrorCategory::Type:     return "type";
            case ErrorCategory::Tool:     return "tool";
            case ErrorCategory::Timeout:  return "timeout";
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

    // "line 3, column 7: message" style rendering used by the CLI and journal.
    inline std::string describe(const ScriptError& error) {
        std::string text;
        if (error.location.has_value()) {
            text += "line " + std::to_string(error.location->line) + ", column " +
                    std::to_string(error.location->column) + ": ";
        }
        text += error.message + " [" + error.code + "]";
        return text;
    }

} // namespace agentic::core::errors
