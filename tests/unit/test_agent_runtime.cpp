#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "core/errors/script_errors.hpp"
#include "runtime/agent.hpp"
#include "runtime/agent_table.hpp"
#include "runtime/message_bus.hpp"

namespace {

using agentic::core::errors::ErrorCategory;
using agentic::core::errors::ScriptError;
using agentic::core::errors::get_error;
using agentic::core::errors::get_value;
using agentic::core::errors::is_error;
using agentic::protocol::Message;
using agentic::runtime::Agent;
using agentic::runtime::AgentStatus;
using agentic::runtime::AgentTable;
using agentic::runtime::MessageBus;
using agentic::runtime::ToolSet;
using agentic::runtime::ToolSpec;
using agentic::runtime::Value;
using namespace std::chrono_literals;

std::shared_ptr<Agent> spawn(AgentTable& table, const std::string& name) {
    auto spawned = table.spawn(name, "Agent", "openai/gpt-4o");
    EXPECT_FALSE(is_error(spawned));
    if (is_error(spawned)) {
        return nullptr;
    }
    return get_value(spawned);
}

TEST(AgentRuntimeTest, SpawnRegistersAndStartsWorker) {
    MessageBus bus;
    AgentTable table(bus, 0ms);

    auto agent = spawn(table, "researcher");
    ASSERT_NE(agent, nullptr);
    EXPECT_EQ(agent->name(), "researcher");
    EXPECT_EQ(agent->id().rfind("researcher_", 0), 0u);
    EXPECT_EQ(agent->status(), AgentStatus::Idle);
    EXPECT_TRUE(agent->running());
    EXPECT_TRUE(bus.is_registered(agent->id()));
    EXPECT_EQ(table.size(), 1u);
}

TEST(AgentRuntimeTest, RejectsDuplicateName) {
    MessageBus bus;
    AgentTable table(bus, 0ms);
    ASSERT_NE(spawn(table, "a"), nullptr);

    auto duplicate = table.spawn("a", "Agent", "m");
    ASSERT_TRUE(is_error(duplicate));
    EXPECT_EQ(get_error(duplicate).code, "duplicate_name");
    EXPECT_EQ(table.size(), 1u);
}

TEST(AgentRuntimeTest, LookupByNameAndId) {
    MessageBus bus;
    AgentTable table(bus, 0ms);
    auto agent = spawn(table, "a");
    ASSERT_NE(agent, nullptr);

    auto by_name = table.find_by_name("a");
    ASSERT_FALSE(is_error(by_name));
    EXPECT_EQ(get_value(by_name)->id(), agent->id());

    auto by_id = table.find_by_id(agent->id());
    ASSERT_FALSE(is_error(by_id));
    EXPECT_EQ(get_value(by_id)->name(), "a");

    auto ghost = table.find_by_name("ghost");
    ASSERT_TRUE(is_error(ghost));
    EXPECT_EQ(get_error(ghost).code, "unknown_agent");
}

TEST(AgentRuntimeTest, DefaultHandlerGreetsSender) {
    MessageBus bus;
    AgentTable table(bus, 0ms);
    auto agent = spawn(table, "a");
    ASSERT_NE(agent, nullptr);

    auto reply = bus.ask("system", agent->id(), Value::from_string("hello"), 2000ms);
    ASSERT_FALSE(is_error(reply));
    EXPECT_EQ(get_value(reply).as_string(), "Hello from a! Received: hello");
    EXPECT_EQ(agent->received_count(), 1u);
    EXPECT_EQ(agent->status(), AgentStatus::Idle);
}

TEST(AgentRuntimeTest, HandlerFailureSetsErrorAndWorkerSurvives) {
    MessageBus bus;
    AgentTable table(bus, 0ms);
    auto agent = spawn(table, "a");
    ASSERT_NE(agent, nullptr);

    agent->set_handler([](Agent&, const Message&) -> agentic::core::errors::Result<Value> {
        return ScriptError{ErrorCategory::Internal, "model unavailable", "handler_error"};
    });
    auto failed = bus.ask("system", agent->id(), Value::from_string("x"), 2000ms);
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).code, "handler_error");
    EXPECT_EQ(agent->status(), AgentStatus::Error);

    agent->set_handler(agentic::runtime::default_message_handler);
    auto recovered = bus.ask("system", agent->id(), Value::from_string("y"), 2000ms);
    ASSERT_FALSE(is_error(recovered));
    EXPECT_EQ(agent->status(), AgentStatus::Idle);
}

TEST(AgentRuntimeTest, ConcurrentAsksAreServedOneAtATime) {
    MessageBus bus;
    AgentTable table(bus, 50ms);
    auto agent = spawn(table, "a");
    ASSERT_NE(agent, nullptr);

    agentic::core::errors::Result<Value> first = Value::null();
    agentic::core::errors::Result<Value> second = Value::null();
    std::thread one([&] { first = bus.ask("system", agent->id(), Value::from_string("1"), 2000ms); });
    std::thread two([&] { second = bus.ask("system", agent->id(), Value::from_string("2"), 2000ms); });
    one.join();
    two.join();

    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(agent->received_count(), 2u);
    EXPECT_EQ(bus.stats().replies, 2u);
}

TEST(AgentRuntimeTest, PropertiesAndToolsAreTracked) {
    Agent agent("a_1", "a", "Agent", "m");

    EXPECT_TRUE(agent.property("goal").is_null());
    agent.set_property("goal", Value::from_string("ship"));
    agent.set_property("goal", Value::from_string("ship it"));
    EXPECT_TRUE(agent.has_property("goal"));
    EXPECT_EQ(agent.property("goal").as_string(), "ship it");
    EXPECT_EQ(agent.properties().size(), 1u);

    EXPECT_FALSE(agent.has_tool("WebSearch"));
    agent.set_tools(ToolSet{ToolSpec{"WebSearch", {}}});
    EXPECT_TRUE(agent.has_tool("WebSearch"));
    EXPECT_FALSE(agent.find_tool("Calculator").has_value());
}

TEST(AgentRuntimeTest, SnapshotListsAgentsInSpawnOrder) {
    MessageBus bus;
    AgentTable table(bus, 0ms);
    auto first = spawn(table, "first");
    auto second = spawn(table, "second");
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    first->set_property("goal", Value::from_string("lead"));

    const auto snapshot = table.snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].name, "first");
    EXPECT_EQ(snapshot[1].name, "second");
    ASSERT_EQ(snapshot[0].properties.size(), 1u);
    EXPECT_EQ(snapshot[0].properties[0].second, "lead");
}

TEST(AgentRuntimeTest, ShutdownStopsWorkersAndUnregisters) {
    MessageBus bus;
    AgentTable table(bus, 0ms);
    auto agent = spawn(table, "a");
    ASSERT_NE(agent, nullptr);

    table.shutdown();
    EXPECT_FALSE(agent->running());
    EXPECT_FALSE(bus.is_registered(agent->id()));

    auto reply = bus.ask("system", agent->id(), Value::from_string("hi"), 100ms);
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "unknown_agent");
}

}  // namespace
