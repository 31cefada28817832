#include "tools/builtin_tools.hpp"

#include <cctype>
#include <cstddef>
#include <locale>
#include <sstream>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace agentic::tools {

using core::errors::ErrorCategory;
using core::errors::ScriptError;
using protocol::ToolInvocation;
using runtime::AgentRef;
using runtime::Value;

namespace {

ScriptError invalid_argument(const std::string& message) {
    return ScriptError{ErrorCategory::Input, message, "invalid_argument"};
}

core::errors::Result<std::string> first_text_argument(const ToolInvocation& invocation,
                                                      const std::string& what) {
    if (invocation.args.empty()) {
        return invalid_argument(invocation.tool_name + " expects " + what);
    }
    return invocation.args.front().to_display();
}

// Recursive descent over one arithmetic expression:
//   expr   := term (('+' | '-') term)*
//   term   := unary (('*' | '/') unary)*
//   unary  := '-' unary | '+' unary | primary
//   primary:= NUMBER | '(' expr ')'
class ArithmeticEvaluator {
public:
    explicit ArithmeticEvaluator(const std::string& text) : text_(text) {}

    core::errors::Result<double> evaluate() {
        auto value = parse_expr();
        if (core::errors::is_error(value)) {
            return value;
        }
        skip_spaces();
        if (pos_ < text_.size()) {
            return fail("unexpected '" + std::string(1, text_[pos_]) + "'");
        }
        return value;
    }

private:
    core::errors::Result<double> parse_expr() {
        auto lhs = parse_term();
        if (core::errors::is_error(lhs)) {
            return lhs;
        }
        double value = core::errors::get_value(lhs);
        while (true) {
            skip_spaces();
            if (pos_ >= text_.size() || (text_[pos_] != '+' && text_[pos_] != '-')) {
                return value;
            }
            const char op = text_[pos_++];
            auto rhs = parse_term();
            if (core::errors::is_error(rhs)) {
                return rhs;
            }
            value = op == '+' ? value + core::errors::get_value(rhs)
                              : value - core::errors::get_value(rhs);
        }
    }

    core::errors::Result<double> parse_term() {
        auto lhs = parse_unary();
        if (core::errors::is_error(lhs)) {
            return lhs;
        }
        double value = core::errors::get_value(lhs);
        while (true) {
            skip_spaces();
            if (pos_ >= text_.size() || (text_[pos_] != '*' && text_[pos_] != '/')) {
                return value;
            }
            const char op = text_[pos_++];
            auto rhs = parse_unary();
            if (core::errors::is_error(rhs)) {
                return rhs;
            }
            const double divisor = core::errors::get_value(rhs);
            if (op == '/') {
                if (divisor == 0.0) {
                    return fail("division by zero");
                }
                value /= divisor;
            } else {
                value *= divisor;
            }
        }
    }

    core::errors::Result<double> parse_unary() {
        skip_spaces();
        if (pos_ < text_.size() && (text_[pos_] == '-' || text_[pos_] == '+')) {
            const bool negate = text_[pos_++] == '-';
            auto operand = parse_unary();
            if (core::errors::is_error(operand) || !negate) {
                return operand;
            }
            return -core::errors::get_value(operand);
        }
        return parse_primary();
    }

    core::errors::Result<double> parse_primary() {
        skip_spaces();
        if (pos_ >= text_.size()) {
            return fail("unexpected end of expression");
        }
        if (text_[pos_] == '(') {
            ++pos_;
            auto inner = parse_expr();
            if (core::errors::is_error(inner)) {
                return inner;
            }
            skip_spaces();
            if (pos_ >= text_.size() || text_[pos_] != ')') {
                return fail("missing ')'");
            }
            ++pos_;
            return inner;
        }

        // Decimal literals only: digits, an optional fraction and exponent.
        const std::size_t start = pos_;
        std::size_t end = scan_digits(pos_);
        if (end < text_.size() && text_[end] == '.') {
            end = scan_digits(end + 1);
        }
        if (end == start || (end == start + 1 && text_[start] == '.')) {
            return fail("expected a number at position " + std::to_string(start + 1));
        }
        if (end < text_.size() && (text_[end] == 'e' || text_[end] == 'E')) {
            std::size_t exponent = end + 1;
            if (exponent < text_.size() && (text_[exponent] == '+' || text_[exponent] == '-')) {
                ++exponent;
            }
            const std::size_t exponent_end = scan_digits(exponent);
            if (exponent_end == exponent) {
                return fail("malformed exponent at position " + std::to_string(end + 1));
            }
            end = exponent_end;
        }

        std::istringstream in(text_.substr(start, end - start));
        in.imbue(std::locale::classic());
        double number = 0.0;
        in >> number;
        if (in.fail()) {
            return fail("number out of range at position " + std::to_string(start + 1));
        }
        pos_ = end;
        return number;
    }

    std::size_t scan_digits(std::size_t from) const {
        while (from < text_.size() && std::isdigit(static_cast<unsigned char>(text_[from]))) {
            ++from;
        }
        return from;
    }

    void skip_spaces() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    ScriptError fail(const std::string& message) const {
        return invalid_argument("Cannot evaluate '" + text_ + "': " + message);
    }

    const std::string& text_;
    std::size_t pos_ = 0;
};

core::errors::Result<Value> web_search(const ToolInvocation& invocation) {
    auto query = first_text_argument(invocation, "a query");
    if (core::errors::is_error(query)) {
        return core::errors::get_error(query);
    }
    return Value::from_string("Mock search results for: " + core::errors::get_value(query));
}

core::errors::Result<Value> file_manager(const ToolInvocation& invocation) {
    auto operation = first_text_argument(invocation, "an operation");
    if (core::errors::is_error(operation)) {
        return core::errors::get_error(operation);
    }
    return Value::from_string("Mock file operation: " + core::errors::get_value(operation));
}

core::errors::Result<Value> calculator(const ToolInvocation& invocation) {
    if (invocation.args.empty()) {
        return invalid_argument("Calculator expects an expression");
    }
    const Value& input = invocation.args.front();
    if (input.is(Value::Type::Number)) {
        return input;
    }
    if (!input.is(Value::Type::String)) {
        return invalid_argument(std::string("Calculator expects a string, got ") +
                                runtime::to_string(input.type()));
    }
    ArithmeticEvaluator evaluator(input.as_string());
    auto result = evaluator.evaluate();
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return Value::from_number(core::errors::get_value(result));
}

core::errors::Result<Value> agent_routing(runtime::MessageBus& bus,
                                          const ToolInvocation& invocation) {
    if (invocation.args.empty()) {
        return invalid_argument("AgentRouting expects a payload");
    }
    if (invocation.targets.empty()) {
        return invalid_argument("AgentRouting has no bound target agents");
    }

    std::vector<AgentRef> recipients;
    if (invocation.args.size() > 1) {
        const std::string wanted = invocation.args[1].is(Value::Type::Agent)
                                       ? invocation.args[1].as_agent().name
                                       : invocation.args[1].to_display();
        for (const auto& target : invocation.targets) {
            if (target.name == wanted) {
                recipients.push_back(target);
            }
        }
        if (recipients.empty()) {
            return invalid_argument("'" + wanted + "' is not a bound target of AgentRouting");
        }
    } else {
        recipients = invocation.targets;
    }

    std::string names;
    for (const auto& target : recipients) {
        auto sent = bus.tell(invocation.caller_id, target.id, invocation.args.front());
        if (core::errors::is_error(sent)) {
            return core::errors::get_error(sent);
        }
        names += (names.empty() ? "" : ", ") + target.name;
    }
    return Value::from_string("Routed to " + std::to_string(recipients.size()) +
                              " agent(s): " + names);
}

}  // namespace

core::errors::Result<double> evaluate_arithmetic(const std::string& expression) {
    ArithmeticEvaluator evaluator(expression);
    return evaluator.evaluate();
}

core::errors::Status register_builtin_tools(ToolRegistry& registry, runtime::MessageBus& bus) {
    std::vector<ToolRegistration> builtins;
    builtins.push_back(ToolRegistration{"WebSearch", "Search the web (mock results).",
                                        {"search", "web"}, false, false, web_search});
    builtins.push_back(ToolRegistration{"FileManager", "File operations (mock).",
                                        {"files"}, false, false, file_manager});
    builtins.push_back(ToolRegistration{"Calculator", "Evaluate arithmetic expressions.",
                                        {"math"}, false, false, calculator});
    builtins.push_back(ToolRegistration{
        "AgentRouting", "Forward a payload to bound target agents.", {"routing", "agents"},
        true, false,
        [&bus](const ToolInvocation& invocation) { return agent_routing(bus, invocation); }});

    for (auto& registration : builtins) {
        auto registered = registry.register_tool(std::move(registration));
        if (core::errors::is_error(registered)) {
            return registered;
        }
    }
    LOG_DEBUG("Built-in tools registered");
    return core::errors::ok();
}

}  // namespace agentic::tools
