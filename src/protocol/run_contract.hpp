#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/script_errors.hpp"

namespace agentic::protocol {

enum class RunStatus {
    Completed,
    Failed
};

// Outcome of one top-level statement.
struct StatementOutcome {
    std::size_t index = 0;
    std::size_t line = 0;
    bool success = false;
    std::optional<core::errors::ScriptError> error;
};

struct RunOutcome {
    RunStatus status = RunStatus::Completed;
    std::size_t statements_completed = 0;
    std::vector<StatementOutcome> statements;
    std::optional<core::errors::ScriptError> error;
    std::string summary;
};

inline std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Completed:
            return "completed";
        case RunStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

}  // namespace agentic::protocol
