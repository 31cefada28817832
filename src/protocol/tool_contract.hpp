#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "runtime/value.hpp"

namespace agentic::protocol {

    // What the interpreter hands to a tool handler.
    struct ToolInvocation {
        std::string tool_name;
        std::string caller_id;                  // id of the agent running the tool
        std::vector<runtime::Value> args;
        std::vector<runtime::AgentRef> targets; // bound targets from the caller's tool spec
    };

    // Read-only snapshot of a registration and its usage counters.
    struct ToolStats {
        std::string name;
        std::string description;
        std::vector<std::string> tags;
        bool accepts_targets = false;
        bool serialized = false;
        bool enabled = true;
        std::uint64_t call_count = 0;
        std::uint64_t failure_count = 0;
        std::optional<std::chrono::system_clock::time_point> last_used;
    };

} // namespace agentic::protocol
