#include "runtime/message_bus.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace agentic::runtime {

using core::errors::ErrorCategory;
using core::errors::ScriptError;
using protocol::Clock;
using protocol::DeliveryState;
using protocol::Message;
using protocol::MessageKind;

namespace {

std::string flow_key(const Message& message) {
    return message.sender + "->" + message.recipient;
}

ScriptError unknown_recipient(const std::string& recipient) {
    return ScriptError{ErrorCategory::Semantic, "No agent registered as '" + recipient + "'",
                       "unknown_agent"};
}

ScriptError ask_timeout(const std::string& recipient, const std::chrono::milliseconds timeout) {
    return ScriptError{ErrorCategory::Timeout,
                       "ask to '" + recipient + "' timed out after " +
                           std::to_string(timeout.count()) + " ms",
                       "timeout", "Raise the timeout or check that the agent is responsive."};
}

}  // namespace

MessageBus::MessageBus(const std::size_t mailbox_capacity, const std::size_t history_limit)
    : mailbox_capacity_(mailbox_capacity), history_limit_(history_limit) {}

MessageBus::~MessageBus() { shutdown(); }

core::errors::Status MessageBus::register_agent(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mailboxes_.count(agent_id) != 0) {
        return ScriptError{ErrorCategory::Semantic,
                           "Agent '" + agent_id + "' is already registered", "duplicate_name"};
    }
    mailboxes_.emplace(agent_id, std::make_shared<Mailbox>(mailbox_capacity_));
    LOG_DEBUG("MessageBus: registered " + agent_id);
    return core::errors::ok();
}

core::errors::Status MessageBus::unregister_agent(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mailboxes_.find(agent_id);
    if (it == mailboxes_.end()) {
        return ScriptError{ErrorCategory::Internal, "Agent '" + agent_id + "' is not registered",
                           "agent_not_registered"};
    }
    auto drained = it->second->close();
    mailboxes_.erase(it);
    fail_drained_locked(std::move(drained), "recipient unregistered");
    LOG_DEBUG("MessageBus: unregistered " + agent_id);
    return core::errors::ok();
}

bool MessageBus::is_registered(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mailboxes_.count(agent_id) != 0;
}

core::errors::Result<std::uint64_t> MessageBus::send(
    const std::string& sender, const std::string& recipient, Value payload,
    const MessageKind kind, const std::optional<std::chrono::milliseconds> timeout) {
    Message message;
    message.sender = sender;
    message.recipient = recipient;
    message.payload = std::move(payload);
    message.kind = kind;
    if (kind == MessageKind::Ask) {
        message.timeout = timeout;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (kind == MessageKind::Ask) {
        message.correlation = next_token_++;
    }
    return enqueue_locked(std::move(message));
}

core::errors::Result<std::uint64_t> MessageBus::tell(const std::string& sender,
                                                     const std::string& recipient,
                                                     Value payload) {
    return send(sender, recipient, std::move(payload), MessageKind::Tell);
}

std::vector<std::uint64_t> MessageBus::broadcast(const std::string& sender, const Value& payload,
                                                 const std::vector<std::string>& exclude) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> recipients;
    for (const auto& entry : mailboxes_) {
        if (entry.first != sender &&
            std::find(exclude.begin(), exclude.end(), entry.first) == exclude.end()) {
            recipients.push_back(entry.first);
        }
    }
    std::sort(recipients.begin(), recipients.end());

    std::vector<std::uint64_t> queued;
    for (const auto& recipient : recipients) {
        Message message;
        message.sender = sender;
        message.recipient = recipient;
        message.payload = payload;
        message.kind = MessageKind::Tell;
        auto id = enqueue_locked(std::move(message));
        if (!core::errors::is_error(id)) {
            queued.push_back(core::errors::get_value(id));
        }
    }
    LOG_DEBUG("MessageBus: broadcast from " + sender + " queued " +
              std::to_string(queued.size()) + " of " + std::to_string(recipients.size()));
    return queued;
}

core::errors::Result<Value> MessageBus::ask(const std::string& sender,
                                            const std::string& recipient, Value payload,
                                            const std::chrono::milliseconds timeout) {
    Message message;
    message.sender = sender;
    message.recipient = recipient;
    message.payload = std::move(payload);
    message.kind = MessageKind::Ask;
    message.timeout = timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    const std::uint64_t token = next_token_++;
    message.correlation = token;

    if (timeout.count() <= 0) {
        ++total_sent_;
        ++flows_[flow_key(message)].sent;
        if (mailboxes_.count(recipient) == 0) {
            const ScriptError error = unknown_recipient(recipient);
            fail_locked(std::move(message), error);
            return error;
        }
        message.id = next_id_++;
        message.state = DeliveryState::TimedOut;
        message.note = "non-positive timeout";
        ++timed_out_;
        store_locked(std::move(message));
        LOG_WARN("MessageBus: ask " + sender + "->" + recipient + " timed out immediately");
        return ask_timeout(recipient, timeout);
    }

    waiters_.emplace(token, Waiter{});
    auto queued = enqueue_locked(std::move(message));
    if (core::errors::is_error(queued)) {
        waiters_.erase(token);
        return core::errors::get_error(queued);
    }
    const std::uint64_t message_id = core::errors::get_value(queued);

    const auto deadline = Clock::now() + std::min(timeout, kMaxAskTimeout);
    const bool answered = replies_.wait_until(lock, deadline, [this, token] {
        auto it = waiters_.find(token);
        return it->second.outcome.has_value();
    });

    // Unregister and shutdown also resolve the waiter, with an error outcome.
    auto waiter = waiters_.find(token);
    if (answered && waiter->second.outcome.has_value()) {
        core::errors::Result<Value> outcome = std::move(*waiter->second.outcome);
        waiters_.erase(waiter);
        return outcome;
    }

    waiters_.erase(waiter);
    ++timed_out_;
    auto record = records_.find(message_id);
    if (record != records_.end()) {
        if (record->second.state == DeliveryState::Pending) {
            expired_.insert(message_id);
            --pending_;
            idle_.notify_all();
        }
        record->second.state = DeliveryState::TimedOut;
        record->second.note = "no reply within " + std::to_string(timeout.count()) + " ms";
    }
    LOG_WARN("MessageBus: ask " + sender + "->" + recipient + " timed out after " +
             std::to_string(timeout.count()) + " ms");
    return ask_timeout(recipient, timeout);
}

std::optional<Message> MessageBus::receive(const std::string& agent_id) {
    while (true) {
        std::shared_ptr<Mailbox> mailbox;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = mailboxes_.find(agent_id);
            if (it == mailboxes_.end()) {
                return std::nullopt;
            }
            mailbox = it->second;
        }

        auto next = mailbox->pop();
        if (!next.has_value()) {
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (expired_.erase(next->id) != 0) {
            LOG_DEBUG("MessageBus: skipping expired ask #" + std::to_string(next->id));
            continue;
        }

        const auto now = Clock::now();
        next->state = DeliveryState::Delivered;
        next->delivered_at = now;
        auto record = records_.find(next->id);
        if (record != records_.end()) {
            record->second.state = DeliveryState::Delivered;
            record->second.delivered_at = now;
        }
        --pending_;
        ++in_progress_;
        ++delivered_;
        ++flows_[flow_key(*next)].delivered;
        latency_total_ms_ +=
            std::chrono::duration<double, std::milli>(now - next->created_at).count();
        return next;
    }
}

void MessageBus::complete(const Message& message, const core::errors::Result<Value>& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (core::errors::is_error(outcome)) {
        auto record = records_.find(message.id);
        if (record != records_.end()) {
            record->second.note = core::errors::get_error(outcome).message;
        }
    }

    if (message.kind == MessageKind::Ask && message.correlation.has_value()) {
        Message reply;
        reply.id = next_id_++;
        reply.sender = message.recipient;
        reply.recipient = message.sender;
        reply.kind = MessageKind::Reply;
        reply.correlation = message.correlation;
        if (!core::errors::is_error(outcome)) {
            reply.payload = core::errors::get_value(outcome);
        }

        auto waiter = waiters_.find(*message.correlation);
        if (waiter != waiters_.end() && !waiter->second.outcome.has_value()) {
            waiter->second.outcome = outcome;
            reply.state = DeliveryState::Delivered;
            reply.delivered_at = Clock::now();
            ++replies_count_;
            replies_.notify_all();
        } else {
            reply.state = DeliveryState::Failed;
            reply.note = "late or duplicate reply discarded";
            ++discarded_replies_;
            LOG_DEBUG("MessageBus: discarded reply for token " +
                      std::to_string(*message.correlation));
        }
        store_locked(std::move(reply));
    }

    if (in_progress_ > 0) {
        --in_progress_;
    }
    idle_.notify_all();
}

BusStats MessageBus::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BusStats snapshot;
    snapshot.total_sent = total_sent_;
    snapshot.delivered = delivered_;
    snapshot.failed = failed_;
    snapshot.timed_out = timed_out_;
    snapshot.replies = replies_count_;
    snapshot.discarded_replies = discarded_replies_;
    snapshot.pending = pending_;
    snapshot.registered_agents = mailboxes_.size();
    snapshot.average_latency_ms =
        delivered_ == 0 ? 0.0 : latency_total_ms_ / static_cast<double>(delivered_);
    snapshot.flows = flows_;
    return snapshot;
}

std::vector<Message> MessageBus::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Message> out;
    out.reserve(records_.size());
    for (const auto& entry : records_) {
        out.push_back(entry.second);
    }
    return out;
}

std::size_t MessageBus::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

bool MessageBus::wait_until_idle(const std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return pending_ == 0 && in_progress_ == 0; });
}

void MessageBus::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : mailboxes_) {
        fail_drained_locked(entry.second->close(), "bus shut down");
    }
    mailboxes_.clear();
    for (auto& entry : waiters_) {
        if (!entry.second.outcome.has_value()) {
            entry.second.outcome = core::errors::Result<Value>(ScriptError{
                ErrorCategory::Internal, "Message bus shut down", "agent_not_registered"});
        }
    }
    replies_.notify_all();
    idle_.notify_all();
}

core::errors::Result<std::uint64_t> MessageBus::enqueue_locked(Message message) {
    message.id = next_id_++;
    message.created_at = Clock::now();
    const std::uint64_t id = message.id;

    ++total_sent_;
    ++flows_[flow_key(message)].sent;

    auto it = mailboxes_.find(message.recipient);
    if (it == mailboxes_.end()) {
        const ScriptError error = unknown_recipient(message.recipient);
        fail_locked(std::move(message), error);
        return error;
    }

    Message queued = message;
    auto pushed = it->second->push(std::move(queued));
    if (core::errors::is_error(pushed)) {
        const ScriptError error = core::errors::get_error(pushed);
        fail_locked(std::move(message), error);
        return error;
    }

    ++pending_;
    LOG_DEBUG("MessageBus: " + protocol::to_string(message.kind) + " #" + std::to_string(id) +
              " " + flow_key(message));
    store_locked(std::move(message));
    return id;
}

void MessageBus::store_locked(Message message) {
    const std::uint64_t id = message.id;
    records_[id] = std::move(message);
    evict_locked();
}

void MessageBus::fail_locked(Message message, const ScriptError& error) {
    if (message.id == 0) {
        message.id = next_id_++;
    }
    message.state = DeliveryState::Failed;
    message.note = error.message;
    ++failed_;
    ++flows_[flow_key(message)].failed;
    LOG_WARN("MessageBus: " + protocol::to_string(message.kind) + " " + flow_key(message) +
             " failed [" + error.code + "]: " + error.message);
    store_locked(std::move(message));
}

void MessageBus::fail_drained_locked(std::vector<Message> drained, const std::string& reason) {
    for (auto& message : drained) {
        if (expired_.erase(message.id) != 0) {
            continue;
        }
        --pending_;
        ++failed_;
        ++flows_[flow_key(message)].failed;
        auto record = records_.find(message.id);
        if (record != records_.end()) {
            record->second.state = DeliveryState::Failed;
            record->second.note = reason;
        }
        if (message.correlation.has_value()) {
            auto waiter = waiters_.find(*message.correlation);
            if (waiter != waiters_.end() && !waiter->second.outcome.has_value()) {
                waiter->second.outcome = core::errors::Result<Value>(ScriptError{
                    ErrorCategory::Internal,
                    "Agent '" + message.recipient + "' was unregistered before replying",
                    "agent_not_registered"});
            }
        }
    }
    if (!drained.empty()) {
        replies_.notify_all();
        idle_.notify_all();
    }
}

void MessageBus::evict_locked() {
    auto it = records_.begin();
    while (records_.size() > history_limit_ && it != records_.end()) {
        if (it->second.state == DeliveryState::Pending) {
            ++it;
            continue;
        }
        it = records_.erase(it);
    }
}

}  // namespace agentic::runtime
