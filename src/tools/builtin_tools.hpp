#pragma once

#include <string>
#include "core/errors/script_errors.hpp"
#include "runtime/message_bus.hpp"
#include "tools/tool_registry.hpp"

namespace agentic::tools {

// Registers WebSearch, FileManager, Calculator and AgentRouting. AgentRouting
// sends through `bus`, which must outlive the registry's use of it.
core::errors::Status register_builtin_tools(ToolRegistry& registry, runtime::MessageBus& bus);

// Arithmetic over + - * / with parentheses and unary minus.
core::errors::Result<double> evaluate_arithmetic(const std::string& expression);

}  // namespace agentic::tools
