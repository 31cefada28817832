#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/script_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/message_bus.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

using agentic::core::errors::get_error;
using agentic::core::errors::get_value;
using agentic::core::errors::is_error;
using agentic::protocol::ToolInvocation;
using agentic::runtime::AgentRef;
using agentic::runtime::MessageBus;
using agentic::runtime::Value;
using agentic::tools::ToolRegistry;
using agentic::tools::evaluate_arithmetic;
using agentic::tools::register_builtin_tools;

class BuiltinToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(is_error(register_builtin_tools(registry_, bus_)));
    }

    ToolInvocation call(const std::string& tool, std::vector<Value> args) const {
        ToolInvocation invocation;
        invocation.tool_name = tool;
        invocation.caller_id = "coordinator_1";
        invocation.args = std::move(args);
        return invocation;
    }

    MessageBus bus_;
    ToolRegistry registry_;
};

TEST(ArithmeticTest, RespectsPrecedence) {
    auto result = evaluate_arithmetic("2 + 2 * 3");
    ASSERT_FALSE(is_error(result));
    EXPECT_DOUBLE_EQ(get_value(result), 8.0);
}

TEST(ArithmeticTest, HandlesParenthesesAndUnaryMinus) {
    EXPECT_DOUBLE_EQ(get_value(evaluate_arithmetic("(1 + 2) * 3")), 9.0);
    EXPECT_DOUBLE_EQ(get_value(evaluate_arithmetic("-4 + 10 / 4")), -1.5);
    EXPECT_DOUBLE_EQ(get_value(evaluate_arithmetic("-(2 - 5)")), 3.0);
}

TEST(ArithmeticTest, RejectsDivisionByZeroAndMalformedInput) {
    auto divide = evaluate_arithmetic("1 / 0");
    ASSERT_TRUE(is_error(divide));
    EXPECT_EQ(get_error(divide).code, "invalid_argument");

    EXPECT_TRUE(is_error(evaluate_arithmetic("2 +")));
    EXPECT_TRUE(is_error(evaluate_arithmetic("(2 + 3")));
    EXPECT_TRUE(is_error(evaluate_arithmetic("2 3")));
    EXPECT_TRUE(is_error(evaluate_arithmetic("abc")));
}

TEST(ArithmeticTest, AcceptsOnlyDecimalLiterals) {
    EXPECT_DOUBLE_EQ(get_value(evaluate_arithmetic("1.5e2 - .5")), 149.5);
    EXPECT_DOUBLE_EQ(get_value(evaluate_arithmetic("2.5E-1 * 4")), 1.0);

    auto hex = evaluate_arithmetic("2 + 0x10");
    ASSERT_TRUE(is_error(hex));
    EXPECT_EQ(get_error(hex).code, "invalid_argument");
    EXPECT_TRUE(is_error(evaluate_arithmetic("0x1p3")));
    EXPECT_TRUE(is_error(evaluate_arithmetic("inf")));
    EXPECT_TRUE(is_error(evaluate_arithmetic("2e")));
    EXPECT_TRUE(is_error(evaluate_arithmetic(". + 1")));
}

TEST_F(BuiltinToolsTest, BuiltinsAreTagged) {
    const std::vector<std::string> web = {"WebSearch"};
    EXPECT_EQ(registry_.list_tools({"web"}), web);
    const std::vector<std::string> routing = {"AgentRouting"};
    EXPECT_EQ(registry_.list_tools({"agents"}), routing);
}

TEST_F(BuiltinToolsTest, RegistersTheStandardTools) {
    const std::vector<std::string> expected = {"WebSearch", "FileManager", "Calculator",
                                               "AgentRouting"};
    EXPECT_EQ(registry_.list_tools(), expected);
    EXPECT_TRUE(get_value(registry_.accepts_targets("AgentRouting")));
    EXPECT_FALSE(get_value(registry_.accepts_targets("Calculator")));
}

TEST_F(BuiltinToolsTest, CalculatorEvaluatesExpressions) {
    auto result = registry_.execute("Calculator", call("Calculator", {Value::from_string("2 + 2 * 3")}));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).as_number(), 8.0);

    auto bad = registry_.execute("Calculator", call("Calculator", {Value::from_bool(true)}));
    ASSERT_TRUE(is_error(bad));
    EXPECT_EQ(get_error(bad).code, "tool_execution_error");
}

TEST_F(BuiltinToolsTest, MockToolsEchoTheirInput) {
    auto search = registry_.execute("WebSearch", call("WebSearch", {Value::from_string("rust")}));
    ASSERT_FALSE(is_error(search));
    EXPECT_EQ(get_value(search).as_string(), "Mock search results for: rust");

    auto files = registry_.execute("FileManager", call("FileManager", {Value::from_string("ls")}));
    ASSERT_FALSE(is_error(files));
    EXPECT_EQ(get_value(files).as_string(), "Mock file operation: ls");
}

TEST_F(BuiltinToolsTest, AgentRoutingTellsEveryBoundTarget) {
    ASSERT_FALSE(is_error(bus_.register_agent("x_1")));
    ASSERT_FALSE(is_error(bus_.register_agent("y_1")));

    ToolInvocation invocation = call("AgentRouting", {Value::from_string("start")});
    invocation.targets = {AgentRef{"x_1", "x"}, AgentRef{"y_1", "y"}};
    auto result = registry_.execute("AgentRouting", invocation);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).as_string(), "Routed to 2 agent(s): x, y");

    const auto stats = bus_.stats();
    EXPECT_EQ(stats.flows.at("coordinator_1->x_1").sent, 1u);
    EXPECT_EQ(stats.flows.at("coordinator_1->y_1").sent, 1u);
    EXPECT_EQ(stats.pending, 2u);
}

TEST_F(BuiltinToolsTest, AgentRoutingCanSelectOneTarget) {
    ASSERT_FALSE(is_error(bus_.register_agent("x_1")));
    ASSERT_FALSE(is_error(bus_.register_agent("y_1")));

    ToolInvocation invocation =
        call("AgentRouting", {Value::from_string("only you"), Value::from_string("y")});
    invocation.targets = {AgentRef{"x_1", "x"}, AgentRef{"y_1", "y"}};
    auto result = registry_.execute("AgentRouting", invocation);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).as_string(), "Routed to 1 agent(s): y");
    EXPECT_EQ(bus_.stats().flows.count("coordinator_1->x_1"), 0u);
}

TEST_F(BuiltinToolsTest, AgentRoutingWithoutTargetsFails) {
    auto result = registry_.execute("AgentRouting", call("AgentRouting", {Value::from_string("go")}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "tool_execution_error");
    EXPECT_EQ(get_value(registry_.stats("AgentRouting")).failure_count, 1u);
}

}  // namespace
