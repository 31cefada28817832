#include <gtest/gtest.h>
#include "runtime/value.hpp"

namespace {

using agentic::runtime::AgentRef;
using agentic::runtime::Mapping;
using agentic::runtime::ToolSet;
using agentic::runtime::ToolSpec;
using agentic::runtime::Value;
using agentic::runtime::format_number;

TEST(ValueTest, DefaultIsNull) {
    Value value;
    EXPECT_TRUE(value.is_null());
    EXPECT_EQ(value.to_display(), "null");
}

TEST(ValueTest, NumbersDisplayWithoutTrailingZeros) {
    EXPECT_EQ(format_number(8.0), "8");
    EXPECT_EQ(format_number(-3.0), "-3");
    EXPECT_EQ(format_number(2.5), "2.5");
    EXPECT_EQ(Value::from_number(0.1).to_display(), "0.1");
}

TEST(ValueTest, DisplaysAgentsToolsAndMappings) {
    EXPECT_EQ(Value::from_agent(AgentRef{"a_0001", "a"}).to_display(), "<agent a>");

    ToolSet tools;
    tools.push_back(ToolSpec{"WebSearch", {}});
    tools.push_back(ToolSpec{"AgentRouting", {AgentRef{"b_1", "b"}, AgentRef{"c_1", "c"}}});
    EXPECT_EQ(Value::from_tools(tools).to_display(), "{WebSearch, AgentRouting{b, c}}");

    Mapping mapping;
    mapping.entries.emplace_back("role", Value::from_string("lead"));
    mapping.entries.emplace_back("rank", Value::from_number(1));
    EXPECT_EQ(Value::from_mapping(mapping).to_display(), "{role: \"lead\", rank: 1}");
}

TEST(ValueTest, EqualityIsTypedAndAgentsCompareById) {
    EXPECT_EQ(Value::from_string("1"), Value::from_string("1"));
    EXPECT_NE(Value::from_string("1"), Value::from_number(1));
    EXPECT_EQ(Value::null(), Value());
    EXPECT_EQ(Value::from_agent(AgentRef{"id_1", "a"}), Value::from_agent(AgentRef{"id_1", "renamed"}));
    EXPECT_NE(Value::from_agent(AgentRef{"id_1", "a"}), Value::from_agent(AgentRef{"id_2", "a"}));
}

TEST(ValueTest, MappingFindReturnsNullptrForMissingKey) {
    Mapping mapping;
    mapping.entries.emplace_back("goal", Value::from_string("ship"));

    ASSERT_NE(mapping.find("goal"), nullptr);
    EXPECT_EQ(mapping.find("goal")->as_string(), "ship");
    EXPECT_EQ(mapping.find("missing"), nullptr);
}

TEST(ValueTest, CopiesShareImmutableMapping) {
    Mapping mapping;
    mapping.entries.emplace_back("k", Value::from_bool(true));
    const Value original = Value::from_mapping(mapping);
    const Value copy = original;

    EXPECT_EQ(&original.as_mapping(), &copy.as_mapping());
    EXPECT_EQ(copy.type(), Value::Type::Mapping);
}

}  // namespace
