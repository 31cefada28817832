#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "core/errors/script_errors.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/mailbox.hpp"
#include "runtime/value.hpp"

namespace agentic::runtime {

struct FlowStats {
    std::uint64_t sent = 0;
    std::uint64_t delivered = 0;
    std::uint64_t failed = 0;
};

struct BusStats {
    std::uint64_t total_sent = 0;  // asks and tells; replies are counted separately
    std::uint64_t delivered = 0;
    std::uint64_t failed = 0;
    std::uint64_t timed_out = 0;
    std::uint64_t replies = 0;
    std::uint64_t discarded_replies = 0;
    std::size_t pending = 0;
    std::size_t registered_agents = 0;
    double average_latency_ms = 0.0;
    std::map<std::string, FlowStats> flows;  // "sender->recipient"
};

// Central router for agent messages.
//
//  * per-recipient FIFO within a kind, queued Asks ahead of queued Tells
//  * a message that cannot be queued is recorded as Failed and the error is
//    returned to the caller; nothing is dropped silently
//  * one reply per correlation token; late and duplicate replies are
//    discarded and counted
//  * history keeps the newest `history_limit` records, never evicting Pending
class MessageBus {
public:
    // Longest wait an ask will honour; longer timeouts are clamped.
    static constexpr std::chrono::milliseconds kMaxAskTimeout = std::chrono::hours(24);

    explicit MessageBus(std::size_t mailbox_capacity = 1000, std::size_t history_limit = 1000);
    ~MessageBus();

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    core::errors::Status register_agent(const std::string& agent_id);

    // Closes the agent's mailbox and fails whatever was still queued.
    core::errors::Status unregister_agent(const std::string& agent_id);
    bool is_registered(const std::string& agent_id) const;

    // Queues a message and returns its id.
    core::errors::Result<std::uint64_t> send(
        const std::string& sender, const std::string& recipient, Value payload,
        protocol::MessageKind kind,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    core::errors::Result<std::uint64_t> tell(const std::string& sender,
                                             const std::string& recipient, Value payload);

    // Tells every registered agent except `sender` and those in `exclude`,
    // in id order. Returns the ids of the messages that were queued; a
    // recipient whose mailbox refuses the message is recorded as Failed.
    std::vector<std::uint64_t> broadcast(const std::string& sender, const Value& payload,
                                         const std::vector<std::string>& exclude = {});

    // Blocks until the recipient replies or `timeout` passes. A timeout of
    // zero or less resolves to `timeout` without queuing anything.
    // Timeouts above kMaxAskTimeout are clamped.
    core::errors::Result<Value> ask(const std::string& sender, const std::string& recipient,
                                    Value payload, std::chrono::milliseconds timeout);

    // Worker side. Blocks until the next live message for `agent_id`; asks
    // whose caller already gave up are skipped. Returns nullopt once the
    // agent's mailbox has been closed.
    std::optional<protocol::Message> receive(const std::string& agent_id);

    // Worker side. Finishes a message returned by receive(); for an Ask the
    // outcome becomes the reply to the waiting caller.
    void complete(const protocol::Message& message, const core::errors::Result<Value>& outcome);

    BusStats stats() const;
    std::vector<protocol::Message> history() const;
    std::size_t pending_count() const;

    // True once no message is queued or being handled, false on timeout.
    bool wait_until_idle(std::chrono::milliseconds timeout) const;

    // Closes every mailbox and fails every outstanding ask.
    void shutdown();

private:
    struct Waiter {
        std::optional<core::errors::Result<Value>> outcome;
    };

    core::errors::Result<std::uint64_t> enqueue_locked(protocol::Message message);
    void store_locked(protocol::Message message);
    void fail_locked(protocol::Message message, const core::errors::ScriptError& error);
    void fail_drained_locked(std::vector<protocol::Message> drained, const std::string& reason);
    void evict_locked();

    const std::size_t mailbox_capacity_;
    const std::size_t history_limit_;

    mutable std::mutex mutex_;
    std::condition_variable replies_;
    mutable std::condition_variable idle_;

    std::unordered_map<std::string, std::shared_ptr<Mailbox>> mailboxes_;
    std::map<std::uint64_t, protocol::Message> records_;
    std::unordered_map<std::uint64_t, Waiter> waiters_;  // correlation token -> caller
    std::unordered_set<std::uint64_t> expired_;          // ask ids abandoned while queued

    std::uint64_t next_id_ = 1;
    std::uint64_t next_token_ = 1;
    std::size_t pending_ = 0;
    std::size_t in_progress_ = 0;

    std::uint64_t total_sent_ = 0;
    std::uint64_t delivered_ = 0;
    std::uint64_t failed_ = 0;
    std::uint64_t timed_out_ = 0;
    std::uint64_t replies_count_ = 0;
    std::uint64_t discarded_replies_ = 0;
    double latency_total_ms_ = 0.0;
    std::map<std::string, FlowStats> flows_;
};

}  // namespace agentic::runtime
