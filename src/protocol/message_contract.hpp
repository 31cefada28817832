#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "runtime/value.hpp"

namespace agentic::protocol {

    enum class MessageKind {
        Ask,    // Synchronous request; the sender waits for a Reply
        Tell,   // Fire-and-forget
        Reply   // Answer to an Ask, matched by correlation token
    };

    enum class DeliveryState {
        Pending,    // Queued in the recipient's mailbox
        Delivered,  // Handed to the recipient's worker
        Failed,     // Rejected (unknown recipient, full mailbox, unregistered)
        TimedOut    // Ask whose deadline passed before a reply arrived
    };

    using Clock = std::chrono::steady_clock;

    // The bus-internal message record. Only the bus mutates `state`.
    struct Message {
        std::uint64_t id = 0;
        std::string sender;
        std::string recipient;
        runtime::Value payload;
        MessageKind kind = MessageKind::Tell;

        // Ask only.
        std::optional<std::chrono::milliseconds> timeout;

        // Shared by an Ask and its Reply.
        std::optional<std::uint64_t> correlation;

        Clock::time_point created_at = Clock::now();
        std::optional<Clock::time_point> delivered_at;
        DeliveryState state = DeliveryState::Pending;
        std::string note;
    };

    inline std::string to_string(const MessageKind kind) {
        switch (kind) {
            case MessageKind::Ask:   return "ask";
            case MessageKind::Tell:  return "tell";
            case MessageKind::Reply: return "reply";
            default: return "unknown";
        }
    }

    inline std::string to_string(const DeliveryState state) {
        switch (state) {
            case DeliveryState::Pending:   return "pending";
            case DeliveryState::Delivered: return "delivered";
            case DeliveryState::Failed:    return "failed";
            case DeliveryState::TimedOut:  return "timed_out";
            default: return "unknown";
        }
    }

} // namespace agentic::protocol
