#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/script_errors.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/message_bus.hpp"

namespace {

using agentic::core::errors::ErrorCategory;
using agentic::core::errors::get_error;
using agentic::core::errors::get_value;
using agentic::core::errors::is_error;
using agentic::protocol::DeliveryState;
using agentic::protocol::MessageKind;
using agentic::runtime::MessageBus;
using agentic::runtime::Value;
using namespace std::chrono_literals;

// Stands in for an agent worker: answers `count` messages with an echo.
std::thread echo_worker(MessageBus& bus, const std::string& agent_id, int count,
                        std::chrono::milliseconds delay = 0ms) {
    return std::thread([&bus, agent_id, count, delay] {
        for (int i = 0; i < count; ++i) {
            auto message = bus.receive(agent_id);
            if (!message.has_value()) {
                return;
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            bus.complete(*message, Value::from_string("echo: " + message->payload.to_display()));
        }
    });
}

TEST(MessageBusTest, RejectsDuplicateRegistration) {
    MessageBus bus;
    ASSERT_FALSE(is_error(bus.register_agent("a_1")));

    auto duplicate = bus.register_agent("a_1");
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_name");
    EXPECT_TRUE(bus.is_registered("a_1"));
}

TEST(MessageBusTest, TellToUnknownRecipientIsRecordedAsFailed) {
    MessageBus bus;
    auto sent = bus.tell("system", "ghost", Value::from_string("hi"));

    ASSERT_TRUE(is_error(sent));
    EXPECT_EQ(get_error(sent).code, "unknown_agent");

    const auto stats = bus.stats();
    EXPECT_EQ(stats.total_sent, 1u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.pending, 0u);
    EXPECT_EQ(stats.flows.at("system->ghost").failed, 1u);

    const auto history = bus.history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].state, DeliveryState::Failed);
}

TEST(MessageBusTest, AskReturnsReplyFromWorker) {
    MessageBus bus;
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));
    std::thread worker = echo_worker(bus, "b_1", 1);

    auto reply = bus.ask("system", "b_1", Value::from_string("ping"), 2000ms);
    worker.join();

    ASSERT_FALSE(is_error(reply));
    EXPECT_EQ(get_value(reply).as_string(), "echo: ping");

    const auto stats = bus.stats();
    EXPECT_EQ(stats.total_sent, 1u);
    EXPECT_EQ(stats.delivered, 1u);
    EXPECT_EQ(stats.replies, 1u);
    EXPECT_EQ(stats.pending, 0u);
    EXPECT_EQ(stats.flows.at("system->b_1").delivered, 1u);
}

TEST(MessageBusTest, HandlerErrorIsReturnedToAsker) {
    MessageBus bus;
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));
    std::thread worker([&bus] {
        auto message = bus.receive("b_1");
        ASSERT_TRUE(message.has_value());
        bus.complete(*message, agentic::core::errors::ScriptError{
                                   ErrorCategory::Internal, "boom", "handler_error"});
    });

    auto reply = bus.ask("system", "b_1", Value::from_string("ping"), 2000ms);
    worker.join();

    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "handler_error");
}

TEST(MessageBusTest, NonPositiveTimeoutFailsImmediately) {
    MessageBus bus;
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));

    auto reply = bus.ask("system", "b_1", Value::from_string("ping"), 0ms);
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).category, ErrorCategory::Timeout);
    EXPECT_EQ(get_error(reply).code, "timeout");

    const auto stats = bus.stats();
    EXPECT_EQ(stats.timed_out, 1u);
    EXPECT_EQ(stats.pending, 0u);
    ASSERT_EQ(bus.history().size(), 1u);
    EXPECT_EQ(bus.history()[0].state, DeliveryState::TimedOut);
}

TEST(MessageBusTest, UnansweredAskTimesOutAndIsNeverDelivered) {
    MessageBus bus;
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));

    auto reply = bus.ask("system", "b_1", Value::from_string("ping"), 30ms);
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "timeout");
    EXPECT_EQ(bus.pending_count(), 0u);

    // The expired ask is skipped; the worker gets the next live message.
    ASSERT_FALSE(is_error(bus.tell("system", "b_1", Value::from_string("later"))));
    auto next = bus.receive("b_1");
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->kind, MessageKind::Tell);
    bus.complete(*next, Value::null());
    EXPECT_EQ(bus.stats().delivered, 1u);
}

TEST(MessageBusTest, LateReplyIsDiscarded) {
    MessageBus bus;
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));
    std::thread worker = echo_worker(bus, "b_1", 1, 300ms);

    auto reply = bus.ask("system", "b_1", Value::from_string("slow"), 100ms);
    std::this_thread::sleep_for(400ms);
    bus.shutdown();
    worker.join();

    ASSERT_TRUE(is_error(reply));
    const auto stats = bus.stats();
    EXPECT_EQ(stats.timed_out, 1u);
    EXPECT_EQ(stats.discarded_replies, 1u);
    EXPECT_EQ(stats.replies, 0u);
}

TEST(MessageBusTest, UnregisterFailsQueuedMessages) {
    MessageBus bus;
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));
    ASSERT_FALSE(is_error(bus.tell("system", "b_1", Value::from_number(1))));
    ASSERT_FALSE(is_error(bus.tell("system", "b_1", Value::from_number(2))));
    EXPECT_EQ(bus.pending_count(), 2u);

    ASSERT_FALSE(is_error(bus.unregister_agent("b_1")));
    EXPECT_FALSE(bus.is_registered("b_1"));

    const auto stats = bus.stats();
    EXPECT_EQ(stats.pending, 0u);
    EXPECT_EQ(stats.failed, 2u);
    for (const auto& record : bus.history()) {
        EXPECT_EQ(record.state, DeliveryState::Failed);
        EXPECT_EQ(record.note, "recipient unregistered");
    }

    auto again = bus.unregister_agent("b_1");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "agent_not_registered");
}

TEST(MessageBusTest, FullMailboxRejectsSend) {
    MessageBus bus(1, 100);
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));
    ASSERT_FALSE(is_error(bus.tell("system", "b_1", Value::from_number(1))));

    auto rejected = bus.tell("system", "b_1", Value::from_number(2));
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).code, "mailbox_full");
    EXPECT_EQ(bus.stats().failed, 1u);
    EXPECT_EQ(bus.pending_count(), 1u);
}

TEST(MessageBusTest, HistoryKeepsNewestRecords) {
    MessageBus bus(1000, 2);
    for (int i = 0; i < 5; ++i) {
        auto sent = bus.tell("system", "ghost", Value::from_number(i));
        EXPECT_TRUE(is_error(sent));
    }

    const auto history = bus.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].payload.as_number(), 3.0);
    EXPECT_EQ(history[1].payload.as_number(), 4.0);
    EXPECT_EQ(bus.stats().total_sent, 5u);
}

TEST(MessageBusTest, WaitUntilIdleTracksInFlightWork) {
    MessageBus bus;
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));
    ASSERT_FALSE(is_error(bus.tell("system", "b_1", Value::from_string("work"))));
    EXPECT_FALSE(bus.wait_until_idle(10ms));

    std::thread worker = echo_worker(bus, "b_1", 1);
    EXPECT_TRUE(bus.wait_until_idle(2000ms));
    worker.join();
}

TEST(MessageBusTest, ShutdownReleasesWaitingAsker) {
    MessageBus bus;
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));
    std::thread stopper([&bus] {
        std::this_thread::sleep_for(30ms);
        bus.shutdown();
    });

    auto reply = bus.ask("system", "b_1", Value::from_string("ping"), 5000ms);
    stopper.join();

    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "agent_not_registered");
}

TEST(MessageBusTest, HugeAskTimeoutIsClamped) {
    MessageBus bus;
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));
    std::thread worker = echo_worker(bus, "b_1", 1);

    auto reply = bus.ask("system", "b_1", Value::from_string("ping"),
                         std::chrono::milliseconds::max());
    worker.join();

    ASSERT_FALSE(is_error(reply));
    EXPECT_EQ(get_value(reply).as_string(), "echo: ping");
}

TEST(MessageBusTest, BroadcastSkipsSenderAndExcludedAgents) {
    MessageBus bus;
    for (const char* id : {"a_1", "b_1", "c_1", "d_1"}) {
        ASSERT_FALSE(is_error(bus.register_agent(id)));
    }

    const std::vector<std::uint64_t> queued =
        bus.broadcast("a_1", Value::from_string("news"), {"c_1"});

    ASSERT_EQ(queued.size(), 2u);
    const auto stats = bus.stats();
    EXPECT_EQ(stats.pending, 2u);
    EXPECT_EQ(stats.flows.at("a_1->b_1").sent, 1u);
    EXPECT_EQ(stats.flows.at("a_1->d_1").sent, 1u);
    EXPECT_EQ(stats.flows.count("a_1->c_1"), 0u);
    EXPECT_EQ(stats.flows.count("a_1->a_1"), 0u);

    const auto history = bus.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].recipient, "b_1");
    EXPECT_EQ(history[0].kind, MessageKind::Tell);
    EXPECT_EQ(history[1].recipient, "d_1");
}

TEST(MessageBusTest, BroadcastRecordsRefusedRecipientsAsFailed) {
    MessageBus bus(1, 100);
    ASSERT_FALSE(is_error(bus.register_agent("b_1")));
    ASSERT_FALSE(is_error(bus.register_agent("c_1")));
    ASSERT_FALSE(is_error(bus.tell("system", "b_1", Value::from_number(1))));

    const auto queued = bus.broadcast("system", Value::from_string("all hands"));

    ASSERT_EQ(queued.size(), 1u);
    const auto stats = bus.stats();
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.flows.at("system->b_1").failed, 1u);
    EXPECT_EQ(stats.flows.at("system->c_1").sent, 1u);
}

}  // namespace
