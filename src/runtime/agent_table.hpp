#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/errors/script_errors.hpp"
#include "runtime/agent.hpp"
#include "runtime/message_bus.hpp"

namespace agentic::runtime {

// Read-only view of one agent for introspection and the session journal.
struct AgentSnapshot {
    std::string id;
    std::string name;
    std::string kind;
    std::string model;
    AgentStatus status = AgentStatus::Idle;
    std::vector<std::pair<std::string, std::string>> properties;  // display text
    std::vector<std::string> tools;
    std::size_t received = 0;
};

// Owns every live agent of a session. Spawning registers the agent with the
// bus and starts its worker; agents are stopped only by shutdown().
class AgentTable {
public:
    AgentTable(MessageBus& bus, std::chrono::milliseconds processing_delay);
    ~AgentTable();

    AgentTable(const AgentTable&) = delete;
    AgentTable& operator=(const AgentTable&) = delete;

    core::errors::Result<std::shared_ptr<Agent>> spawn(const std::string& name,
                                                       const std::string& kind,
                                                       const std::string& model);

    core::errors::Result<std::shared_ptr<Agent>> find_by_name(const std::string& name) const;
    core::errors::Result<std::shared_ptr<Agent>> find_by_id(const std::string& id) const;
    bool contains_name(const std::string& name) const;

    std::vector<AgentSnapshot> snapshot() const;
    std::size_t size() const;

    void shutdown();

private:
    MessageBus& bus_;
    const std::chrono::milliseconds processing_delay_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Agent>> agents_;  // by id
    std::unordered_map<std::string, std::string> names_;              // name -> id
    std::vector<std::string> order_;                                  // spawn order
};

}  // namespace agentic::runtime
