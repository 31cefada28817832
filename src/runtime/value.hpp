#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace agentic::runtime {

// Handle to a live agent. Agents themselves are owned by the agent table.
struct AgentRef {
    std::string id;
    std::string name;
};

// One entry of an agent's tool set: the tool name plus the agents it is
// bound to (only AgentRouting-style tools carry targets).
struct ToolSpec {
    std::string name;
    std::vector<AgentRef> targets;
};

using ToolSet = std::vector<ToolSpec>;

struct Mapping;

// Immutable runtime value produced by evaluating an expression.
class Value {
public:
    enum class Type { Null, String, Number, Boolean, Agent, Tools, Mapping };

    Value() = default;

    static Value null() { return Value(); }
    static Value from_string(std::string text);
    static Value from_number(double number);
    static Value from_bool(bool flag);
    static Value from_agent(AgentRef agent);
    static Value from_tools(ToolSet tools);
    static Value from_mapping(Mapping mapping);

    Type type() const;
    bool is(Type type) const { return this->type() == type; }
    bool is_null() const { return is(Type::Null); }

    // Accessors assume the matching type; check with is() first.
    const std::string& as_string() const;
    double as_number() const;
    bool as_bool() const;
    const AgentRef& as_agent() const;
    const ToolSet& as_tools() const;
    const Mapping& as_mapping() const;

    // Text used by print, f-string interpolation and the default reply.
    std::string to_display() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, std::string, double, bool, AgentRef, ToolSet,
                                 std::shared_ptr<const Mapping>>;

    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

// Insertion-ordered key/value pairs.
struct Mapping {
    std::vector<std::pair<std::string, Value>> entries;

    const Value* find(const std::string& key) const;
};

const char* to_string(Value::Type type);

// Whole numbers print without a fractional part ("8", not "8.000000").
std::string format_number(double number);

}  // namespace agentic::runtime
