#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>
#include "core/errors/script_errors.hpp"
#include "protocol/message_contract.hpp"

namespace agentic::runtime {

// Bounded per-agent inbox. Asks are served before Tells; each kind is FIFO.
// pop() blocks the worker until a message arrives or the mailbox closes.
class Mailbox {
public:
    explicit Mailbox(std::size_t capacity);

    // Fails with mailbox_full at capacity, agent_not_registered once closed.
    core::errors::Status push(protocol::Message message);

    // Returns nullopt only after close() once the queue is empty.
    std::optional<protocol::Message> pop();

    // Stops accepting messages, wakes the worker and returns whatever was
    // still queued so the caller can fail it.
    std::vector<protocol::Message> close();

    std::size_t size() const;
    bool closed() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<protocol::Message> asks_;
    std::deque<protocol::Message> tells_;
    bool closed_ = false;
};

}  // namespace agentic::runtime
