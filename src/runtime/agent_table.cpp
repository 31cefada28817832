#include "runtime/agent_table.hpp"

#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace agentic::runtime {

using core::errors::ErrorCategory;
using core::errors::ScriptError;

AgentTable::AgentTable(MessageBus& bus, const std::chrono::milliseconds processing_delay)
    : bus_(bus), processing_delay_(processing_delay) {}

AgentTable::~AgentTable() { shutdown(); }

core::errors::Result<std::shared_ptr<Agent>> AgentTable::spawn(const std::string& name,
                                                               const std::string& kind,
                                                               const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (names_.find(name) != names_.end()) {
        return ScriptError{ErrorCategory::Semantic, "Agent '" + name + "' already exists",
                           "duplicate_name"};
    }

    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string agent_id = core::config::generate_id(name);
        if (agents_.find(agent_id) != agents_.end()) {
            continue;
        }

        auto registered = bus_.register_agent(agent_id);
        if (core::errors::is_error(registered)) {
            continue;
        }

        auto agent = std::make_shared<Agent>(agent_id, name, kind, model);
        agent->start(bus_, processing_delay_);
        agents_.emplace(agent_id, agent);
        names_.emplace(name, agent_id);
        order_.push_back(agent_id);
        LOG_INFO("AgentTable: spawned " + name + " as " + agent_id);
        return agent;
    }

    return ScriptError{ErrorCategory::Internal, "Unable to allocate unique agent ID.",
                       "agent_id_generation_failed"};
}

core::errors::Result<std::shared_ptr<Agent>> AgentTable::find_by_name(
    const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_.find(name);
    if (it == names_.end()) {
        return ScriptError{ErrorCategory::Semantic, "Unknown agent '" + name + "'",
                           "unknown_agent"};
    }
    return agents_.at(it->second);
}

core::errors::Result<std::shared_ptr<Agent>> AgentTable::find_by_id(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return ScriptError{ErrorCategory::Semantic, "Unknown agent id '" + id + "'",
                           "unknown_agent"};
    }
    return it->second;
}

bool AgentTable::contains_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.find(name) != names_.end();
}

std::vector<AgentSnapshot> AgentTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AgentSnapshot> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        const auto& agent = agents_.at(id);
        AgentSnapshot snap;
        snap.id = agent->id();
        snap.name = agent->name();
        snap.kind = agent->kind();
        snap.model = agent->model();
        snap.status = agent->status();
        for (const auto& [key, value] : agent->properties()) {
            snap.properties.emplace_back(key, value.to_display());
        }
        for (const auto& spec : agent->tools()) {
            snap.tools.push_back(spec.name);
        }
        snap.received = agent->received_count();
        out.push_back(std::move(snap));
    }
    return out;
}

std::size_t AgentTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

void AgentTable::shutdown() {
    std::vector<std::shared_ptr<Agent>> stopping;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : order_) {
            stopping.push_back(agents_.at(id));
        }
    }
    // Workers may block on the bus; stop them without holding the table lock.
    for (auto& agent : stopping) {
        agent->stop();
    }
}

}  // namespace agentic::runtime
