#pragma once

#include <chrono>
#include <memory>
#include "core/errors/script_errors.hpp"
#include "protocol/run_options.hpp"
#include "runtime/agent_table.hpp"
#include "runtime/message_bus.hpp"
#include "runtime/module_system.hpp"
#include "tools/tool_registry.hpp"

namespace agentic::runtime {

// Everything one session shares: bus, agent table, tool registry and module
// system. Members are destroyed in reverse order, so agents stop before the
// bus goes away.
class RuntimeContext {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    // Only create() can name the key.
    RuntimeContext(ConstructionKey, const protocol::RunOptions& options);

    // Builds the context and registers the built-in tools.
    static core::errors::Result<std::unique_ptr<RuntimeContext>> create(
        const protocol::RunOptions& options);

    MessageBus& bus() { return bus_; }
    AgentTable& agents() { return agents_; }
    tools::ToolRegistry& tools() { return tools_; }
    ModuleSystem& modules() { return modules_; }
    const MessageBus& bus() const { return bus_; }
    const AgentTable& agents() const { return agents_; }
    const tools::ToolRegistry& tools() const { return tools_; }
    const ModuleSystem& modules() const { return modules_; }

    std::chrono::milliseconds default_ask_timeout() const { return default_ask_timeout_; }

    // Stops every agent worker. Safe to call more than once.
    void shutdown();

private:
    const std::chrono::milliseconds default_ask_timeout_;
    MessageBus bus_;
    tools::ToolRegistry tools_;
    AgentTable agents_;
    ModuleSystem modules_;
};

}  // namespace agentic::runtime
