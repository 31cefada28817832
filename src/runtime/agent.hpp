#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "core/errors/script_errors.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/value.hpp"

namespace agentic::runtime {

class MessageBus;
class Agent;

enum class AgentStatus {
    Idle,
    Active,  // running a tool
    Busy,    // handling a message
    Error    // last handler failed; the worker keeps running
};

std::string to_string(AgentStatus status);

// Computes the reply (or the error) for one incoming message.
using MessageHandler =
    std::function<core::errors::Result<Value>(Agent&, const protocol::Message&)>;

// "Hello from <name>! Received: <payload>"
core::errors::Result<Value> default_message_handler(Agent& agent,
                                                    const protocol::Message& message);

// A live agent. Identity is fixed at spawn; properties, tools, status and
// the handler are guarded so that the interpreter thread and the agent's
// own worker can touch them concurrently.
class Agent {
public:
    Agent(std::string id, std::string name, std::string kind, std::string model);
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& kind() const { return kind_; }
    const std::string& model() const { return model_; }
    AgentRef ref() const { return AgentRef{id_, name_}; }

    AgentStatus status() const { return status_.load(); }
    // Returns the status it replaced.
    AgentStatus set_status(AgentStatus status);

    // Sets `status` only if the current status is still `expected`.
    bool restore_status_if(AgentStatus expected, AgentStatus status);

    // Null for unset keys.
    Value property(const std::string& key) const;
    bool has_property(const std::string& key) const;
    void set_property(const std::string& key, Value value);
    std::vector<std::pair<std::string, Value>> properties() const;

    ToolSet tools() const;
    void set_tools(ToolSet tools);
    bool has_tool(const std::string& name) const;
    std::optional<ToolSpec> find_tool(const std::string& name) const;

    void set_handler(MessageHandler handler);

    // Most recent messages handled by the worker, oldest first.
    std::vector<protocol::Message> received() const;
    std::size_t received_count() const;

    // Starts the worker. The agent must already be registered with `bus`.
    void start(MessageBus& bus, std::chrono::milliseconds processing_delay);

    // Unregisters from the bus (closing the mailbox) and joins the worker.
    void stop();
    bool running() const { return worker_.joinable(); }

private:
    void run_worker(std::chrono::milliseconds processing_delay);

    static constexpr std::size_t kReceivedLogLimit = 100;

    const std::string id_;
    const std::string name_;
    const std::string kind_;
    const std::string model_;
    std::atomic<AgentStatus> status_{AgentStatus::Idle};

    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, Value>> properties_;
    ToolSet tools_;
    MessageHandler handler_;
    std::deque<protocol::Message> received_;
    std::size_t received_total_ = 0;

    MessageBus* bus_ = nullptr;
    std::thread worker_;
};

}  // namespace agentic::runtime
