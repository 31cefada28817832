#include "runtime/interpreter.hpp"

#include <chrono>
#include <cmath>
#include <type_traits>
#include <utility>
#include "core/logging/logger.hpp"

namespace agentic::runtime {

namespace ast = parser::ast;

using core::errors::ErrorCategory;
using core::errors::ScriptError;

namespace {

ScriptError type_error(const std::string& message) {
    return ScriptError{ErrorCategory::Type, message, "type_error"};
}

ScriptError invalid_argument(const std::string& message) {
    return ScriptError{ErrorCategory::Input, message, "invalid_argument"};
}

bool is_read_only(const std::string& key) {
    return key == "status" || key == "model" || key == "name" || key == "id";
}

// Keeps an agent Active while it runs a tool, then restores its status.
// If the worker changed the status meanwhile, the worker's value stands.
class ActiveStatusScope {
public:
    explicit ActiveStatusScope(Agent& agent)
        : agent_(agent), previous_(agent.set_status(AgentStatus::Active)) {}
    ~ActiveStatusScope() { agent_.restore_status_if(AgentStatus::Active, previous_); }

    ActiveStatusScope(const ActiveStatusScope&) = delete;
    ActiveStatusScope& operator=(const ActiveStatusScope&) = delete;

private:
    Agent& agent_;
    AgentStatus previous_;
};

ToolSet merge_tools(ToolSet existing, const ToolSet& added) {
    for (const auto& spec : added) {
        bool replaced = false;
        for (auto& current : existing) {
            if (current.name == spec.name) {
                current.targets = spec.targets;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            existing.push_back(spec);
        }
    }
    return existing;
}

Mapping merge_mappings(const Mapping& existing, const Mapping& added) {
    Mapping merged = existing;
    for (const auto& [key, value] : added.entries) {
        bool replaced = false;
        for (auto& entry : merged.entries) {
            if (entry.first == key) {
                entry.second = value;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            merged.entries.emplace_back(key, value);
        }
    }
    return merged;
}

}  // namespace

Interpreter::Interpreter(RuntimeContext& context, std::ostream& out)
    : context_(context), out_(out) {}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

core::errors::Status Interpreter::execute(const ast::Statement& statement) {
    core::errors::Status status = std::visit(
        [this](const auto& node) -> core::errors::Status {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::ImportStatement>) {
                return exec_import(node);
            } else if constexpr (std::is_same_v<T, ast::AgentDeclaration>) {
                return exec_agent(node);
            } else if constexpr (std::is_same_v<T, ast::PropertyAssignment>) {
                return exec_property(node);
            } else if constexpr (std::is_same_v<T, ast::Assignment>) {
                return exec_assignment(node);
            } else if constexpr (std::is_same_v<T, ast::PrintStatement>) {
                return exec_print(node);
            } else if constexpr (std::is_same_v<T, ast::IfStatement>) {
                return exec_if(node);
            } else {
                auto value = evaluate(*node.expression);
                if (core::errors::is_error(value)) {
                    return core::errors::get_error(value);
                }
                return core::errors::ok();
            }
        },
        statement.node);

    if (core::errors::is_error(status)) {
        return core::errors::at(core::errors::get_error(status), statement.location);
    }
    return status;
}

protocol::RunOutcome Interpreter::run(const ast::Program& program,
                                      const StatementObserver& observer) {
    protocol::RunOutcome outcome;
    for (std::size_t i = 0; i < program.statements.size(); ++i) {
        const ast::Statement& statement = *program.statements[i];
        auto status = execute(statement);

        protocol::StatementOutcome step;
        step.index = i;
        step.line = statement.location.line;
        step.success = !core::errors::is_error(status);
        if (!step.success) {
            step.error = core::errors::get_error(status);
        }
        outcome.statements.push_back(step);
        if (observer) {
            observer(step);
        }

        if (!step.success) {
            const ScriptError& err = core::errors::get_error(status);
            LOG_ERROR("Interpreter: statement " + std::to_string(i + 1) + " failed: " +
                      core::errors::describe(err));
            outcome.status = protocol::RunStatus::Failed;
            outcome.error = err;
            outcome.summary = "Stopped at statement " + std::to_string(i + 1) + " of " +
                              std::to_string(program.statements.size()) + ": " +
                              core::errors::describe(err);
            return outcome;
        }
        ++outcome.statements_completed;
    }

    outcome.status = protocol::RunStatus::Completed;
    outcome.summary = "Executed " + std::to_string(outcome.statements_completed) + " statement(s)";
    return outcome;
}

core::errors::Status Interpreter::execute_block(const ast::Block& block) {
    Environment::ScopeGuard scope(environment_);
    for (const auto& statement : block) {
        auto status = execute(*statement);
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

core::errors::Status Interpreter::exec_import(const ast::ImportStatement& stmt) {
    auto imported = context_.modules().import_module(stmt.module_path, stmt.names);
    if (core::errors::is_error(imported)) {
        return core::errors::get_error(imported);
    }
    return core::errors::ok();
}

core::errors::Status Interpreter::exec_agent(const ast::AgentDeclaration& stmt) {
    if (environment_.contains(stmt.name) || context_.agents().contains_name(stmt.name)) {
        return ScriptError{ErrorCategory::Semantic, "Name '" + stmt.name + "' is already defined",
                           "duplicate_name"};
    }
    if (!context_.modules().is_agent_type(stmt.kind)) {
        return ScriptError{ErrorCategory::Semantic, "Unknown agent type '" + stmt.kind + "'",
                           "unknown_agent_type",
                           "Use Agent, or import the type from agentic.stdlib.agents."};
    }

    std::vector<std::pair<std::string, Value>> config;
    for (const auto& [key, expression] : stmt.config) {
        auto value = evaluate(*expression);
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        auto prepared = prepare_property(key, Value::null(), core::errors::take_value(value), false);
        if (core::errors::is_error(prepared)) {
            return core::errors::at(core::errors::get_error(prepared), expression->location);
        }
        config.emplace_back(key, core::errors::take_value(prepared));
    }

    auto spawned = context_.agents().spawn(stmt.name, stmt.kind, stmt.model);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    const std::shared_ptr<Agent> agent = core::errors::get_value(spawned);
    for (auto& [key, value] : config) {
        if (key == "tools") {
            agent->set_tools(value.as_tools());
        } else {
            agent->set_property(key, std::move(value));
        }
    }

    environment_.declare(stmt.name, Value::from_agent(agent->ref()));
    return core::errors::ok();
}

core::errors::Status Interpreter::exec_property(const ast::PropertyAssignment& stmt) {
    auto resolved = resolve_agent(stmt.agent);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::shared_ptr<Agent> agent = core::errors::get_value(resolved);

    if (is_read_only(stmt.property)) {
        return ScriptError{ErrorCategory::Semantic,
                           "Property '" + stmt.property + "' of agent '" + stmt.agent +
                               "' is read-only",
                           "read_only_property"};
    }

    auto value = evaluate(*stmt.value);
    if (core::errors::is_error(value)) {
        return core::errors::get_error(value);
    }

    const bool append = stmt.mode == ast::AssignMode::Append;
    const Value existing = stmt.property == "tools" ? Value::from_tools(agent->tools())
                                                    : agent->property(stmt.property);
    auto prepared =
        prepare_property(stmt.property, existing, core::errors::take_value(value), append);
    if (core::errors::is_error(prepared)) {
        return core::errors::at(core::errors::get_error(prepared), stmt.value->location);
    }

    Value stored = core::errors::take_value(prepared);
    if (stmt.property == "tools") {
        agent->set_tools(stored.as_tools());
    } else {
        agent->set_property(stmt.property, stored);
    }
    LOG_DEBUG("Interpreter: " + agent->name() + "->" + stmt.property +
              (append ? " += " : " = ") + stored.to_display());
    return core::errors::ok();
}

core::errors::Status Interpreter::exec_assignment(const ast::Assignment& stmt) {
    auto value = evaluate(*stmt.value);
    if (core::errors::is_error(value)) {
        return core::errors::get_error(value);
    }
    if (stmt.declare) {
        environment_.declare(stmt.name, core::errors::take_value(value));
        return core::errors::ok();
    }
    return environment_.assign(stmt.name, core::errors::take_value(value));
}

core::errors::Status Interpreter::exec_print(const ast::PrintStatement& stmt) {
    auto value = evaluate(*stmt.expression);
    if (core::errors::is_error(value)) {
        return core::errors::get_error(value);
    }
    out_ << core::errors::get_value(value).to_display() << std::endl;
    return core::errors::ok();
}

core::errors::Status Interpreter::exec_if(const ast::IfStatement& stmt) {
    auto condition = evaluate(*stmt.condition);
    if (core::errors::is_error(condition)) {
        return core::errors::get_error(condition);
    }
    const Value& flag = core::errors::get_value(condition);
    if (!flag.is(Value::Type::Boolean)) {
        return core::errors::at(
            type_error(std::string("if condition must be a boolean, got ") +
                       to_string(flag.type())),
            stmt.condition->location);
    }

    if (flag.as_bool()) {
        return execute_block(stmt.then_block);
    }
    if (stmt.else_block.has_value()) {
        return execute_block(*stmt.else_block);
    }
    return core::errors::ok();
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

core::errors::Result<Value> Interpreter::evaluate(const ast::Expression& expression) {
    auto result = eval_node(expression);
    if (core::errors::is_error(result)) {
        return core::errors::at(core::errors::get_error(result), expression.location);
    }
    return result;
}

core::errors::Result<Value> Interpreter::eval_node(const ast::Expression& expression) {
    return std::visit(
        [this](const auto& node) -> core::errors::Result<Value> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::StringLiteral>) {
                return Value::from_string(node.value);
            } else if constexpr (std::is_same_v<T, ast::NumberLiteral>) {
                return Value::from_number(node.value);
            } else if constexpr (std::is_same_v<T, ast::BooleanLiteral>) {
                return Value::from_bool(node.value);
            } else if constexpr (std::is_same_v<T, ast::NullLiteral>) {
                return Value::null();
            } else if constexpr (std::is_same_v<T, ast::Identifier>) {
                return environment_.lookup(node.name);
            } else if constexpr (std::is_same_v<T, ast::InterpolatedString>) {
                return eval_interpolated(node);
            } else if constexpr (std::is_same_v<T, ast::PropertyAccess>) {
                return eval_property_access(node);
            } else if constexpr (std::is_same_v<T, ast::MethodCall>) {
                return eval_method_call(node);
            } else if constexpr (std::is_same_v<T, ast::BooleanExpression>) {
                return eval_boolean(node);
            } else if constexpr (std::is_same_v<T, ast::ComparisonExpression>) {
                return eval_comparison(node);
            } else if constexpr (std::is_same_v<T, ast::NotExpression>) {
                return eval_not(node);
            } else if constexpr (std::is_same_v<T, ast::ToolListLiteral>) {
                return eval_tool_list(node);
            } else {
                return eval_mapping(node);
            }
        },
        expression.node);
}

core::errors::Result<Value> Interpreter::eval_interpolated(const ast::InterpolatedString& node) {
    std::string text;
    for (const auto& segment : node.segments) {
        if (!segment.expression) {
            text += segment.text;
            continue;
        }
        auto value = evaluate(*segment.expression);
        if (core::errors::is_error(value)) {
            return value;
        }
        text += core::errors::get_value(value).to_display();
    }
    return Value::from_string(text);
}

core::errors::Result<Value> Interpreter::eval_property_access(const ast::PropertyAccess& node) {
    auto object = evaluate(*node.object);
    if (core::errors::is_error(object)) {
        return object;
    }
    const Value& target = core::errors::get_value(object);

    if (target.is(Value::Type::Mapping)) {
        const Value* found = target.as_mapping().find(node.property);
        return found != nullptr ? *found : Value::null();
    }
    if (!target.is(Value::Type::Agent)) {
        return type_error("Cannot read property '" + node.property + "' of a " +
                          to_string(target.type()));
    }

    auto resolved = live_agent(target.as_agent());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const Agent& agent = *core::errors::get_value(resolved);

    if (node.property == "status") {
        return Value::from_string(to_string(agent.status()));
    }
    if (node.property == "model") {
        return Value::from_string(agent.model());
    }
    if (node.property == "name") {
        return Value::from_string(agent.name());
    }
    if (node.property == "id") {
        return Value::from_string(agent.id());
    }
    if (node.property == "tools") {
        return Value::from_tools(agent.tools());
    }
    return agent.property(node.property);
}

core::errors::Result<Value> Interpreter::eval_method_call(const ast::MethodCall& node) {
    auto receiver = evaluate(*node.receiver);
    if (core::errors::is_error(receiver)) {
        return receiver;
    }
    const Value& target = core::errors::get_value(receiver);
    if (!target.is(Value::Type::Agent)) {
        return type_error("Cannot call '" + node.method + "' on a " + to_string(target.type()));
    }

    auto resolved = live_agent(target.as_agent());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::shared_ptr<Agent> agent = core::errors::get_value(resolved);

    std::vector<Value> args;
    for (const auto& arg : node.arguments) {
        auto value = evaluate(*arg);
        if (core::errors::is_error(value)) {
            return value;
        }
        args.push_back(core::errors::take_value(value));
    }
    std::vector<std::pair<std::string, Value>> named;
    for (const auto& arg : node.named_arguments) {
        auto value = evaluate(*arg.value);
        if (core::errors::is_error(value)) {
            return value;
        }
        named.emplace_back(arg.name, core::errors::take_value(value));
    }

    if (node.method != "ask" && !named.empty()) {
        return invalid_argument("'" + node.method + "' does not take named arguments");
    }

    if (node.method == "ask") {
        return call_ask(*agent, args, named);
    }
    if (node.method == "tell") {
        return call_tell(*agent, args);
    }
    if (node.method == "has_tool") {
        return call_has_tool(*agent, args);
    }
    if (node.method == "execute_tool") {
        return call_execute_tool(*agent, args);
    }
    return ScriptError{ErrorCategory::Semantic, "Unknown method '" + node.method + "'",
                       "unknown_method", "Agents support ask, tell, has_tool and execute_tool."};
}

core::errors::Result<Value> Interpreter::eval_boolean(const ast::BooleanExpression& node) {
    auto left = evaluate(*node.left);
    if (core::errors::is_error(left)) {
        return left;
    }
    const Value& lhs = core::errors::get_value(left);
    if (!lhs.is(Value::Type::Boolean)) {
        return core::errors::at(type_error(std::string("'") + ast::to_string(node.op) +
                                           "' expects booleans, got " + to_string(lhs.type())),
                                node.left->location);
    }

    const bool is_and = node.op == ast::BooleanOperator::And;
    if (is_and != lhs.as_bool()) {
        // false and ... / true or ...
        return lhs;
    }

    auto right = evaluate(*node.right);
    if (core::errors::is_error(right)) {
        return right;
    }
    const Value& rhs = core::errors::get_value(right);
    if (!rhs.is(Value::Type::Boolean)) {
        return core::errors::at(type_error(std::string("'") + ast::to_string(node.op) +
                                           "' expects booleans, got " + to_string(rhs.type())),
                                node.right->location);
    }
    return rhs;
}

core::errors::Result<Value> Interpreter::eval_comparison(const ast::ComparisonExpression& node) {
    auto left = evaluate(*node.left);
    if (core::errors::is_error(left)) {
        return left;
    }
    auto right = evaluate(*node.right);
    if (core::errors::is_error(right)) {
        return right;
    }
    const Value& lhs = core::errors::get_value(left);
    const Value& rhs = core::errors::get_value(right);

    if (node.op == ast::ComparisonOperator::Equal || node.op == ast::ComparisonOperator::NotEqual) {
        if (lhs.type() != rhs.type() && !lhs.is_null() && !rhs.is_null()) {
            return type_error(std::string("Cannot compare ") + to_string(lhs.type()) + " with " +
                              to_string(rhs.type()));
        }
        const bool equal = lhs == rhs;
        return Value::from_bool(node.op == ast::ComparisonOperator::Equal ? equal : !equal);
    }

    int order = 0;
    if (lhs.is(Value::Type::Number) && rhs.is(Value::Type::Number)) {
        order = lhs.as_number() < rhs.as_number() ? -1 : (lhs.as_number() > rhs.as_number() ? 1 : 0);
    } else if (lhs.is(Value::Type::String) && rhs.is(Value::Type::String)) {
        const int cmp = lhs.as_string().compare(rhs.as_string());
        order = cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    } else {
        return type_error(std::string("'") + ast::to_string(node.op) +
                          "' needs two numbers or two strings, got " + to_string(lhs.type()) +
                          " and " + to_string(rhs.type()));
    }

    switch (node.op) {
        case ast::ComparisonOperator::Less:
            return Value::from_bool(order < 0);
        case ast::ComparisonOperator::LessEqual:
            return Value::from_bool(order <= 0);
        case ast::ComparisonOperator::Greater:
            return Value::from_bool(order > 0);
        default:
            return Value::from_bool(order >= 0);
    }
}

core::errors::Result<Value> Interpreter::eval_not(const ast::NotExpression& node) {
    auto operand = evaluate(*node.operand);
    if (core::errors::is_error(operand)) {
        return operand;
    }
    const Value& value = core::errors::get_value(operand);
    if (!value.is(Value::Type::Boolean)) {
        return type_error(std::string("'not' expects a boolean, got ") + to_string(value.type()));
    }
    return Value::from_bool(!value.as_bool());
}

core::errors::Result<Value> Interpreter::eval_tool_list(const ast::ToolListLiteral& node) {
    ToolSet tools;
    for (const auto& literal : node.tools) {
        if (!context_.tools().is_registered(literal.name)) {
            return core::errors::at(
                ScriptError{ErrorCategory::Tool, "Unknown tool '" + literal.name + "'",
                            "unknown_tool"},
                literal.location);
        }

        ToolSpec spec;
        spec.name = literal.name;
        if (literal.routed) {
            auto accepts = context_.tools().accepts_targets(literal.name);
            if (core::errors::is_error(accepts)) {
                return core::errors::at(core::errors::get_error(accepts), literal.location);
            }
            if (!core::errors::get_value(accepts)) {
                return core::errors::at(
                    invalid_argument("Tool '" + literal.name + "' cannot be bound to agents"),
                    literal.location);
            }
            for (const auto& target : literal.targets) {
                auto agent = resolve_agent(target);
                if (core::errors::is_error(agent)) {
                    return core::errors::at(core::errors::get_error(agent), literal.location);
                }
                spec.targets.push_back(core::errors::get_value(agent)->ref());
            }
        }
        tools.push_back(std::move(spec));
    }
    return Value::from_tools(std::move(tools));
}

core::errors::Result<Value> Interpreter::eval_mapping(const ast::MappingLiteral& node) {
    Mapping mapping;
    for (const auto& [key, expression] : node.entries) {
        auto value = evaluate(*expression);
        if (core::errors::is_error(value)) {
            return value;
        }
        Mapping single;
        single.entries.emplace_back(key, core::errors::take_value(value));
        mapping = merge_mappings(mapping, single);
    }
    return Value::from_mapping(std::move(mapping));
}

// ---------------------------------------------------------------------------
// Agent methods
// ---------------------------------------------------------------------------

core::errors::Result<Value> Interpreter::call_ask(
    Agent& agent, const std::vector<Value>& args,
    const std::vector<std::pair<std::string, Value>>& named) {
    if (args.empty() || args.size() > 2) {
        return invalid_argument("ask expects a message and an optional timeout");
    }

    std::optional<Value> timeout_arg;
    if (args.size() == 2) {
        timeout_arg = args[1];
    }
    for (const auto& [name, value] : named) {
        if (name != "timeout") {
            return invalid_argument("ask has no parameter named '" + name + "'");
        }
        if (timeout_arg.has_value()) {
            return invalid_argument("ask timeout given twice");
        }
        timeout_arg = value;
    }

    std::chrono::milliseconds timeout = context_.default_ask_timeout();
    if (timeout_arg.has_value()) {
        if (!timeout_arg->is(Value::Type::Number)) {
            return type_error(std::string("ask timeout must be a number of seconds, got ") +
                              to_string(timeout_arg->type()));
        }
        const double seconds = timeout_arg->as_number();
        const double limit = std::chrono::duration<double>(MessageBus::kMaxAskTimeout).count();
        if (!std::isfinite(seconds) || seconds > limit) {
            return invalid_argument("ask timeout must be at most " +
                                    std::to_string(static_cast<long long>(limit)) + " seconds");
        }
        timeout = seconds <= 0.0 ? std::chrono::milliseconds(0)
                                 : std::chrono::milliseconds(std::llround(seconds * 1000.0));
    }

    LOG_DEBUG("Interpreter: ask " + agent.name() + " (timeout " +
              std::to_string(timeout.count()) + " ms)");
    return context_.bus().ask(kSystemSender, agent.id(), args.front(), timeout);
}

core::errors::Result<Value> Interpreter::call_tell(Agent& agent, const std::vector<Value>& args) {
    if (args.size() != 1) {
        return invalid_argument("tell expects exactly one message");
    }
    auto sent = context_.bus().tell(kSystemSender, agent.id(), args.front());
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    return Value::null();
}

core::errors::Result<Value> Interpreter::call_has_tool(Agent& agent,
                                                       const std::vector<Value>& args) {
    if (args.size() != 1 || !args.front().is(Value::Type::String)) {
        return invalid_argument("has_tool expects a tool name");
    }
    return Value::from_bool(agent.has_tool(args.front().as_string()));
}

core::errors::Result<Value> Interpreter::call_execute_tool(Agent& agent,
                                                           const std::vector<Value>& args) {
    if (args.empty() || !args.front().is(Value::Type::String)) {
        return invalid_argument("execute_tool expects a tool name");
    }
    const std::string& tool_name = args.front().as_string();

    auto spec = agent.find_tool(tool_name);
    if (!spec.has_value()) {
        return ScriptError{ErrorCategory::Tool,
                           "Agent '" + agent.name() + "' has no tool '" + tool_name + "'",
                           "tool_not_assigned",
                           "Assign it first: *" + agent.name() + "->tools += { " + tool_name +
                               " }"};
    }

    protocol::ToolInvocation invocation;
    invocation.tool_name = tool_name;
    invocation.caller_id = agent.id();
    invocation.args.assign(args.begin() + 1, args.end());
    invocation.targets = spec->targets;

    ActiveStatusScope active(agent);
    return context_.tools().execute(tool_name, invocation);
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

core::errors::Result<std::shared_ptr<Agent>> Interpreter::resolve_agent(
    const std::string& name) const {
    auto bound = environment_.lookup(name);
    if (!core::errors::is_error(bound) && core::errors::get_value(bound).is(Value::Type::Agent)) {
        return live_agent(core::errors::get_value(bound).as_agent());
    }
    auto agent = context_.agents().find_by_name(name);
    if (core::errors::is_error(agent)) {
        return ScriptError{ErrorCategory::Semantic, "Unknown agent '" + name + "'",
                           "unknown_agent"};
    }
    return agent;
}

core::errors::Result<std::shared_ptr<Agent>> Interpreter::live_agent(const AgentRef& ref) const {
    auto agent = context_.agents().find_by_id(ref.id);
    if (core::errors::is_error(agent)) {
        return ScriptError{ErrorCategory::Semantic, "Agent '" + ref.name + "' is not live",
                           "unknown_agent"};
    }
    return agent;
}

core::errors::Result<Value> Interpreter::prepare_property(const std::string& key,
                                                          const Value& existing, Value value,
                                                          const bool append) const {
    if (is_read_only(key)) {
        return ScriptError{ErrorCategory::Semantic, "Property '" + key + "' is read-only",
                           "read_only_property"};
    }

    if (append) {
        if (!value.is(Value::Type::Tools) && !value.is(Value::Type::Mapping)) {
            return type_error("'+=' needs a tool list or mapping, got " +
                              std::string(to_string(value.type())));
        }
        if (existing.is_null()) {
            // Unset counts as empty.
        } else if (existing.type() != value.type()) {
            return type_error("Cannot append a " + std::string(to_string(value.type())) +
                              " to a " + to_string(existing.type()));
        } else if (value.is(Value::Type::Tools)) {
            value = Value::from_tools(merge_tools(existing.as_tools(), value.as_tools()));
        } else {
            value = Value::from_mapping(merge_mappings(existing.as_mapping(), value.as_mapping()));
        }
    }

    if (key == "tools" && !value.is(Value::Type::Tools)) {
        return type_error("'tools' must be a tool list, got " +
                          std::string(to_string(value.type())));
    }
    if (key == "temperature") {
        if (!value.is(Value::Type::Number) || value.as_number() < 0.0 ||
            value.as_number() > 2.0) {
            return type_error("'temperature' must be a number between 0 and 2");
        }
    }
    if (key == "max_tokens") {
        if (!value.is(Value::Type::Number) || value.as_number() <= 0.0 ||
            std::floor(value.as_number()) != value.as_number()) {
            return type_error("'max_tokens' must be a positive whole number");
        }
    }
    return value;
}

}  // namespace agentic::runtime
