#include "parser/ast_printer.hpp"

#include <sstream>
#include <type_traits>

namespace agentic::parser {

namespace ast {

const char* to_string(const ComparisonOperator op) {
    switch (op) {
        case ComparisonOperator::Equal:        return "==";
        case ComparisonOperator::NotEqual:     return "!=";
        case ComparisonOperator::Less:         return "<";
        case ComparisonOperator::LessEqual:    return "<=";
        case ComparisonOperator::Greater:      return ">";
        case ComparisonOperator::GreaterEqual: return ">=";
        default: return "?";
    }
}

const char* to_string(const BooleanOperator op) {
    switch (op) {
        case BooleanOperator::And: return "and";
        case BooleanOperator::Or:  return "or";
        default: return "?";
    }
}

}  // namespace ast

namespace {

std::string tag(const char* name, const ast::SourceLocation& location) {
    return std::string(name) + "@" + std::to_string(location.line) + ":" +
           std::to_string(location.column);
}

std::string quoted(const std::string& text) {
    std::string out = "\"";
    for (const char c : text) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string format_number(const double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

}  // namespace

std::string AstPrinter::print(const ast::Program& program) const {
    std::string out = "(program";
    for (const auto& stmt : program.statements) {
        out += " " + print(*stmt);
    }
    return out + ")";
}

std::string AstPrinter::print_block(const ast::Block& block) const {
    std::string out = "(block";
    for (const auto& stmt : block) {
        out += " " + print(*stmt);
    }
    return out + ")";
}

std::string AstPrinter::print(const ast::Statement& statement) const {
    const ast::SourceLocation& loc = statement.location;
    return std::visit(
        [&](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::ImportStatement>) {
                std::string path;
                for (const auto& part : node.module_path) {
                    path += path.empty() ? part : "." + part;
                }
                std::string out = "(" + tag("import", loc) + " " + path;
                for (const auto& name : node.names) {
                    out += " " + name;
                }
                return out + ")";
            } else if constexpr (std::is_same_v<T, ast::AgentDeclaration>) {
                std::string out = "(" + tag("agent", loc) + " " + node.name + " " + node.kind +
                                  " " + quoted(node.model);
                for (const auto& [key, value] : node.config) {
                    out += " (" + key + " " + print(*value) + ")";
                }
                return out + ")";
            } else if constexpr (std::is_same_v<T, ast::PropertyAssignment>) {
                const char* op = node.mode == ast::AssignMode::Append ? "+=" : "=";
                return "(" + tag("set", loc) + " " + node.agent + "->" + node.property + " " + op +
                       " " + print(*node.value) + ")";
            } else if constexpr (std::is_same_v<T, ast::Assignment>) {
                return "(" + tag(node.declare ? "let" : "assign", loc) + " " + node.name + " " +
                       print(*node.value) + ")";
            } else if constexpr (std::is_same_v<T, ast::PrintStatement>) {
                return "(" + tag("print", loc) + " " + print(*node.expression) + ")";
            } else if constexpr (std::is_same_v<T, ast::IfStatement>) {
                std::string out = "(" + tag("if", loc) + " " + print(*node.condition) + " " +
                                  print_block(node.then_block);
                if (node.else_block.has_value()) {
                    out += " " + print_block(*node.else_block);
                }
                return out + ")";
            } else {
                return "(" + tag("expr", loc) + " " + print(*node.expression) + ")";
            }
        },
        statement.node);
}

std::string AstPrinter::print(const ast::Expression& expression) const {
    const ast::SourceLocation& loc = expression.location;
    return std::visit(
        [&](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::StringLiteral>) {
                return "(" + tag("string", loc) + " " + quoted(node.value) + ")";
            } else if constexpr (std::is_same_v<T, ast::NumberLiteral>) {
                return "(" + tag("number", loc) + " " + format_number(node.value) + ")";
            } else if constexpr (std::is_same_v<T, ast::BooleanLiteral>) {
                return "(" + tag("boolean", loc) + (node.value ? " true)" : " false)");
            } else if constexpr (std::is_same_v<T, ast::NullLiteral>) {
                return "(" + tag("null", loc) + ")";
            } else if constexpr (std::is_same_v<T, ast::Identifier>) {
                return "(" + tag("id", loc) + " " + node.name + ")";
            } else if constexpr (std::is_same_v<T, ast::InterpolatedString>) {
                std::string out = "(" + tag("fstring", loc);
                for (const auto& segment : node.segments) {
                    out += " " + (segment.expression ? print(*segment.expression)
                                                     : quoted(segment.text));
                }
                return out + ")";
            } else if constexpr (std::is_same_v<T, ast::PropertyAccess>) {
                return "(" + tag("get", loc) + " " + print(*node.object) + " " + node.property +
                       ")";
            } else if constexpr (std::is_same_v<T, ast::MethodCall>) {
                std::string out =
                    "(" + tag("call", loc) + " " + print(*node.receiver) + " " + node.method;
                for (const auto& arg : node.arguments) {
                    out += " " + print(*arg);
                }
                for (const auto& named : node.named_arguments) {
                    out += " (" + named.name + "= " + print(*named.value) + ")";
                }
                return out + ")";
            } else if constexpr (std::is_same_v<T, ast::BooleanExpression>) {
                return "(" + tag(ast::to_string(node.op), loc) + " " + print(*node.left) + " " +
                       print(*node.right) + ")";
            } else if constexpr (std::is_same_v<T, ast::ComparisonExpression>) {
                return "(" + tag(ast::to_string(node.op), loc) + " " + print(*node.left) + " " +
                       print(*node.right) + ")";
            } else if constexpr (std::is_same_v<T, ast::NotExpression>) {
                return "(" + tag("not", loc) + " " + print(*node.operand) + ")";
            } else if constexpr (std::is_same_v<T, ast::ToolListLiteral>) {
                std::string out = "(" + tag("tools", loc);
                for (const auto& spec : node.tools) {
                    if (!spec.routed) {
                        out += " " + spec.name;
                        continue;
                    }
                    out += " (" + spec.name;
                    for (const auto& target : spec.targets) {
                        out += " " + target;
                    }
                    out += ")";
                }
                return out + ")";
            } else {
                std::string out = "(" + tag("mapping", loc);
                for (const auto& [key, value] : node.entries) {
                    out += " (" + key + " " + print(*value) + ")";
                }
                return out + ")";
            }
        },
        expression.node);
}

}  // namespace agentic::parser
