#include <chrono>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "core/errors/script_errors.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/mailbox.hpp"

namespace {

using agentic::core::errors::get_error;
using agentic::core::errors::is_error;
using agentic::protocol::Message;
using agentic::protocol::MessageKind;
using agentic::runtime::Mailbox;
using agentic::runtime::Value;

Message make_message(std::uint64_t id, MessageKind kind) {
    Message message;
    message.id = id;
    message.sender = "system";
    message.recipient = "a_1";
    message.kind = kind;
    message.payload = Value::from_number(static_cast<double>(id));
    return message;
}

TEST(MailboxTest, ServesAsksBeforeTellsFifoWithinKind) {
    Mailbox mailbox(10);
    ASSERT_FALSE(is_error(mailbox.push(make_message(1, MessageKind::Tell))));
    ASSERT_FALSE(is_error(mailbox.push(make_message(2, MessageKind::Ask))));
    ASSERT_FALSE(is_error(mailbox.push(make_message(3, MessageKind::Tell))));
    ASSERT_FALSE(is_error(mailbox.push(make_message(4, MessageKind::Ask))));

    EXPECT_EQ(mailbox.pop()->id, 2u);
    EXPECT_EQ(mailbox.pop()->id, 4u);
    EXPECT_EQ(mailbox.pop()->id, 1u);
    EXPECT_EQ(mailbox.pop()->id, 3u);
    EXPECT_EQ(mailbox.size(), 0u);
}

TEST(MailboxTest, RejectsPushAtCapacity) {
    Mailbox mailbox(1);
    ASSERT_FALSE(is_error(mailbox.push(make_message(1, MessageKind::Tell))));

    auto full = mailbox.push(make_message(2, MessageKind::Tell));
    ASSERT_TRUE(is_error(full));
    EXPECT_EQ(get_error(full).code, "mailbox_full");
}

TEST(MailboxTest, CloseDrainsQueueAndRejectsNewMessages) {
    Mailbox mailbox(10);
    ASSERT_FALSE(is_error(mailbox.push(make_message(1, MessageKind::Tell))));
    ASSERT_FALSE(is_error(mailbox.push(make_message(2, MessageKind::Ask))));

    const auto drained = mailbox.close();
    EXPECT_EQ(drained.size(), 2u);
    EXPECT_TRUE(mailbox.closed());
    EXPECT_FALSE(mailbox.pop().has_value());

    auto rejected = mailbox.push(make_message(3, MessageKind::Tell));
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).code, "agent_not_registered");
}

TEST(MailboxTest, PopBlocksUntilMessageArrives) {
    Mailbox mailbox(10);
    std::thread producer([&mailbox] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        auto pushed = mailbox.push(make_message(7, MessageKind::Tell));
        EXPECT_FALSE(is_error(pushed));
    });

    auto message = mailbox.pop();
    producer.join();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->id, 7u);
}

TEST(MailboxTest, CloseWakesBlockedWorker) {
    Mailbox mailbox(10);
    std::thread closer([&mailbox] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        mailbox.close();
    });

    EXPECT_FALSE(mailbox.pop().has_value());
    closer.join();
}

}  // namespace
