#include "tools/tool_registry.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace agentic::tools {

using core::errors::ErrorCategory;
using core::errors::ScriptError;
using protocol::ToolInvocation;
using protocol::ToolStats;
using runtime::Value;

namespace {

bool has_any_tag(const std::vector<std::string>& own, const std::vector<std::string>& wanted) {
    return std::any_of(wanted.begin(), wanted.end(), [&own](const std::string& tag) {
        return std::find(own.begin(), own.end(), tag) != own.end();
    });
}

}  // namespace

core::errors::ScriptError ToolRegistry::unknown_tool(const std::string& name) {
    return ScriptError{ErrorCategory::Tool, "Unknown tool '" + name + "'", "unknown_tool",
                       "Registered tools can be listed with list_tools()."};
}

core::errors::Status ToolRegistry::register_tool(ToolRegistration registration) {
    if (registration.name.empty()) {
        return ScriptError{ErrorCategory::Input, "Tool name cannot be empty.", "invalid_argument"};
    }
    if (!registration.handler) {
        return ScriptError{ErrorCategory::Input,
                           "Tool '" + registration.name + "' has no handler.",
                           "invalid_argument"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.find(registration.name) != entries_.end()) {
        return ScriptError{ErrorCategory::Tool,
                           "Tool '" + registration.name + "' is already registered",
                           "duplicate_tool"};
    }

    const std::string name = registration.name;
    auto entry = std::make_shared<Entry>();
    entry->registration = std::move(registration);
    entries_.emplace(name, std::move(entry));
    order_.push_back(name);
    LOG_DEBUG("ToolRegistry: registered " + name);
    return core::errors::ok();
}

core::errors::Result<Value> ToolRegistry::execute(const std::string& name,
                                                  const ToolInvocation& invocation) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            return unknown_tool(name);
        }
        entry = it->second;
        if (!entry->enabled) {
            return ScriptError{ErrorCategory::Tool, "Tool '" + name + "' is disabled",
                               "tool_disabled"};
        }
        ++entry->call_count;
        entry->last_used = std::chrono::system_clock::now();
    }

    core::errors::Result<Value> result = Value::null();
    if (entry->registration.serialized) {
        std::lock_guard<std::mutex> call_lock(entry->call_mutex);
        result = entry->registration.handler(invocation);
    } else {
        result = entry->registration.handler(invocation);
    }

    if (!core::errors::is_error(result)) {
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++entry->failure_count;
    }
    const ScriptError& cause = core::errors::get_error(result);
    LOG_WARN("ToolRegistry: " + name + " failed for " + invocation.caller_id + " [" +
             cause.code + "]: " + cause.message);
    return ScriptError{ErrorCategory::Tool, name + " failed: " + cause.message,
                       "tool_execution_error", cause.hint};
}

bool ToolRegistry::is_registered(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(name) != entries_.end();
}

core::errors::Status ToolRegistry::set_enabled(const std::string& name, const bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return unknown_tool(name);
    }
    it->second->enabled = enabled;
    LOG_INFO("ToolRegistry: " + name + (enabled ? " enabled" : " disabled"));
    return core::errors::ok();
}

bool ToolRegistry::is_enabled(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    return it != entries_.end() && it->second->enabled;
}

core::errors::Result<bool> ToolRegistry::accepts_targets(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return unknown_tool(name);
    }
    return it->second->registration.accepts_targets;
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

std::vector<std::string> ToolRegistry::list_tools(const std::vector<std::string>& tags,
                                                  const bool enabled_only) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& name : order_) {
        const Entry& entry = *entries_.at(name);
        if (enabled_only && !entry.enabled) {
            continue;
        }
        if (tags.empty() || has_any_tag(entry.registration.tags, tags)) {
            out.push_back(name);
        }
    }
    return out;
}

ToolStats ToolRegistry::to_stats(const Entry& entry) {
    ToolStats stats;
    stats.name = entry.registration.name;
    stats.description = entry.registration.description;
    stats.tags = entry.registration.tags;
    stats.accepts_targets = entry.registration.accepts_targets;
    stats.serialized = entry.registration.serialized;
    stats.enabled = entry.enabled;
    stats.call_count = entry.call_count;
    stats.failure_count = entry.failure_count;
    stats.last_used = entry.last_used;
    return stats;
}

std::vector<ToolStats> ToolRegistry::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolStats> out;
    out.reserve(order_.size());
    for (const auto& name : order_) {
        out.push_back(to_stats(*entries_.at(name)));
    }
    return out;
}

core::errors::Result<ToolStats> ToolRegistry::stats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return unknown_tool(name);
    }
    return to_stats(*it->second);
}

}  // namespace agentic::tools
