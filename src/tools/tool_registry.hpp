#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/script_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/value.hpp"

namespace agentic::tools {

// Must be reentrant unless the registration asks to be serialized.
using ToolHandler =
    std::function<core::errors::Result<runtime::Value>(const protocol::ToolInvocation&)>;

struct ToolRegistration {
    std::string name;
    std::string description;
    std::vector<std::string> tags;
    bool accepts_targets = false;  // may be bound to agents: Tool{ a, b }
    bool serialized = false;       // at most one invocation at a time
    ToolHandler handler;
};

// Name-keyed table of invocable tools. Registrations are permanent for the
// life of the registry; handlers run outside the registry lock.
class ToolRegistry {
public:
    core::errors::Status register_tool(ToolRegistration registration);

    // Fails with unknown_tool or tool_disabled; handler failures become
    // tool_execution_error.
    core::errors::Result<runtime::Value> execute(const std::string& name,
                                                 const protocol::ToolInvocation& invocation);

    bool is_registered(const std::string& name) const;

    // A disabled tool stays registered and assignable but cannot run.
    core::errors::Status set_enabled(const std::string& name, bool enabled);
    bool is_enabled(const std::string& name) const;
    core::errors::Result<bool> accepts_targets(const std::string& name) const;

    // Registration order.
    std::vector<std::string> list_tools() const;

    // Tools carrying at least one of `tags` (any tool when `tags` is empty).
    std::vector<std::string> list_tools(const std::vector<std::string>& tags,
                                        bool enabled_only = true) const;
    std::vector<protocol::ToolStats> stats() const;
    core::errors::Result<protocol::ToolStats> stats(const std::string& name) const;

private:
    struct Entry {
        ToolRegistration registration;
        std::mutex call_mutex;
        bool enabled = true;
        std::uint64_t call_count = 0;
        std::uint64_t failure_count = 0;
        std::optional<std::chrono::system_clock::time_point> last_used;
    };

    static protocol::ToolStats to_stats(const Entry& entry);
    static core::errors::ScriptError unknown_tool(const std::string& name);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::vector<std::string> order_;
};

}  // namespace agentic::tools
