#include "runtime/agent.hpp"

#include "core/logging/logger.hpp"
#include "runtime/message_bus.hpp"

namespace agentic::runtime {

using protocol::Message;
using protocol::MessageKind;

std::string to_string(const AgentStatus status) {
    switch (status) {
        case AgentStatus::Idle:
            return "idle";
        case AgentStatus::Active:
            return "active";
        case AgentStatus::Busy:
            return "busy";
        case AgentStatus::Error:
            return "error";
        default:
            return "unknown";
    }
}

core::errors::Result<Value> default_message_handler(Agent& agent, const Message& message) {
    return Value::from_string("Hello from " + agent.name() +
                              "! Received: " + message.payload.to_display());
}

Agent::Agent(std::string id, std::string name, std::string kind, std::string model)
    : id_(std::move(id)),
      name_(std::move(name)),
      kind_(std::move(kind)),
      model_(std::move(model)),
      handler_(default_message_handler) {}

Agent::~Agent() { stop(); }

AgentStatus Agent::set_status(const AgentStatus status) {
    const AgentStatus previous = status_.exchange(status);
    if (previous != status) {
        LOG_DEBUG("Agent " + id_ + ": " + to_string(previous) + " -> " + to_string(status));
    }
    return previous;
}

bool Agent::restore_status_if(AgentStatus expected, const AgentStatus status) {
    if (!status_.compare_exchange_strong(expected, status)) {
        return false;
    }
    if (expected != status) {
        LOG_DEBUG("Agent " + id_ + ": " + to_string(expected) + " -> " + to_string(status));
    }
    return true;
}

Value Agent::property(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : properties_) {
        if (entry.first == key) {
            return entry.second;
        }
    }
    return Value::null();
}

bool Agent::has_property(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : properties_) {
        if (entry.first == key) {
            return true;
        }
    }
    return false;
}

void Agent::set_property(const std::string& key, Value value) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : properties_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    properties_.emplace_back(key, std::move(value));
}

std::vector<std::pair<std::string, Value>> Agent::properties() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return properties_;
}

ToolSet Agent::tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_;
}

void Agent::set_tools(ToolSet tools) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_ = std::move(tools);
}

bool Agent::has_tool(const std::string& name) const {
    return find_tool(name).has_value();
}

std::optional<ToolSpec> Agent::find_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& spec : tools_) {
        if (spec.name == name) {
            return spec;
        }
    }
    return std::nullopt;
}

void Agent::set_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

std::vector<Message> Agent::received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Message>(received_.begin(), received_.end());
}

std::size_t Agent::received_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_total_;
}

void Agent::start(MessageBus& bus, const std::chrono::milliseconds processing_delay) {
    if (worker_.joinable()) {
        return;
    }
    bus_ = &bus;
    worker_ = std::thread(&Agent::run_worker, this, processing_delay);
    LOG_INFO("Agent " + name_ + " (" + id_ + ") started, kind=" + kind_ + ", model=" + model_);
}

void Agent::stop() {
    if (!worker_.joinable()) {
        return;
    }
    auto unregistered = bus_->unregister_agent(id_);
    if (core::errors::is_error(unregistered)) {
        // Bus already shut down; the mailbox is closed either way.
        LOG_DEBUG("Agent " + id_ + ": " + core::errors::get_error(unregistered).message);
    }
    worker_.join();
    LOG_INFO("Agent " + name_ + " (" + id_ + ") stopped");
}

void Agent::run_worker(const std::chrono::milliseconds processing_delay) {
    while (auto message = bus_->receive(id_)) {
        set_status(AgentStatus::Busy);

        MessageHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(*message);
            ++received_total_;
            if (received_.size() > kReceivedLogLimit) {
                received_.pop_front();
            }
            handler = handler_;
        }

        if (processing_delay.count() > 0) {
            std::this_thread::sleep_for(processing_delay);
        }

        core::errors::Result<Value> outcome = handler(*this, *message);
        if (core::errors::is_error(outcome)) {
            const auto& err = core::errors::get_error(outcome);
            LOG_ERROR("Agent " + name_ + " failed to handle " +
                      protocol::to_string(message->kind) + " #" + std::to_string(message->id) +
                      " [" + err.code + "]: " + err.message);
            set_status(AgentStatus::Error);
        } else {
            set_status(AgentStatus::Idle);
        }

        bus_->complete(*message, outcome);
    }
}

}  // namespace agentic::runtime
