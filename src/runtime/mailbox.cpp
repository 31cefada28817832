#include "runtime/mailbox.hpp"

#include <utility>

namespace agentic::runtime {

using core::errors::ErrorCategory;
using core::errors::ScriptError;
using protocol::Message;
using protocol::MessageKind;

Mailbox::Mailbox(const std::size_t capacity) : capacity_(capacity) {}

core::errors::Status Mailbox::push(Message message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return ScriptError{ErrorCategory::Internal,
                               "Mailbox of '" + message.recipient + "' is closed",
                               "agent_not_registered"};
        }
        if (asks_.size() + tells_.size() >= capacity_) {
            return ScriptError{ErrorCategory::Internal,
                               "Mailbox of '" + message.recipient + "' is full (" +
                                   std::to_string(capacity_) + " messages)",
                               "mailbox_full"};
        }
        if (message.kind == MessageKind::Ask) {
            asks_.push_back(std::move(message));
        } else {
            tells_.push_back(std::move(message));
        }
    }
    ready_.notify_one();
    return core::errors::ok();
}

std::optional<Message> Mailbox::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return closed_ || !asks_.empty() || !tells_.empty(); });

    auto& queue = !asks_.empty() ? asks_ : tells_;
    if (queue.empty()) {
        return std::nullopt;
    }
    Message next = std::move(queue.front());
    queue.pop_front();
    return next;
}

std::vector<Message> Mailbox::close() {
    std::vector<Message> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        for (auto& message : asks_) {
            drained.push_back(std::move(message));
        }
        for (auto& message : tells_) {
            drained.push_back(std::move(message));
        }
        asks_.clear();
        tells_.clear();
    }
    ready_.notify_all();
    return drained;
}

std::size_t Mailbox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return asks_.size() + tells_.size();
}

bool Mailbox::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace agentic::runtime
