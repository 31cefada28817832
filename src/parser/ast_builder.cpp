#include "parser/ast_builder.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>
#include "parser/grammar_parser.hpp"

namespace agentic::parser {

namespace {

template <typename NodeT>
ast::ExpressionPtr make_expression(NodeT node, const SourceLocation location) {
    auto expr = std::make_unique<ast::Expression>();
    expr->node = std::move(node);
    expr->location = location;
    return expr;
}

template <typename NodeT>
ast::StatementPtr make_statement(NodeT node, const SourceLocation location) {
    auto stmt = std::make_unique<ast::Statement>();
    stmt->node = std::move(node);
    stmt->location = location;
    return stmt;
}

ast::ComparisonOperator comparison_operator(const TokenType type) {
    switch (type) {
        case TokenType::EQ: return ast::ComparisonOperator::Equal;
        case TokenType::NE: return ast::ComparisonOperator::NotEqual;
        case TokenType::LT: return ast::ComparisonOperator::Less;
        case TokenType::LE: return ast::ComparisonOperator::LessEqual;
        case TokenType::GT: return ast::ComparisonOperator::Greater;
        case TokenType::GE: return ast::ComparisonOperator::GreaterEqual;
        default:
            throw std::invalid_argument("not a comparison operator");
    }
}

std::invalid_argument unexpected(const ParseNode& node) {
    return std::invalid_argument("unexpected parse node '" + node.rule + "'");
}

}  // namespace

ast::Program AstBuilder::build(const ParseNode& program) const {
    ast::Program result;
    for (const auto& child : program.children) {
        result.statements.push_back(build_statement(child));
    }
    return result;
}

ast::Block AstBuilder::build_block(const ParseNode& node) const {
    ast::Block block;
    for (const auto& child : node.children) {
        block.push_back(build_statement(child));
    }
    return block;
}

ast::StatementPtr AstBuilder::build_statement(const ParseNode& node) const {
    const std::string& rule = node.rule;

    if (rule == "import_statement") {
        ast::ImportStatement stmt;
        for (const auto& part : node.child(0).children) {
            stmt.module_path.push_back(part.token.lexeme);
        }
        for (const auto& name : node.child(1).children) {
            stmt.names.push_back(name.token.lexeme);
        }
        return make_statement(std::move(stmt), node.location);
    }

    if (rule == "agent_declaration") {
        ast::AgentDeclaration stmt;
        stmt.name = node.child(0).token.lexeme;
        stmt.kind = node.child(1).token.lexeme;
        stmt.model = node.child(2).token.lexeme;
        for (std::size_t i = 3; i < node.size(); ++i) {
            const ParseNode& pair = node.child(i);
            stmt.config.emplace_back(pair.child(0).token.lexeme,
                                     build_expression(pair.child(1)));
        }
        return make_statement(std::move(stmt), node.location);
    }

    if (rule == "property_assignment") {
        ast::PropertyAssignment stmt;
        stmt.agent = node.child(0).token.lexeme;
        stmt.property = node.child(1).token.lexeme;
        stmt.mode = node.child(2).token.type == TokenType::PLUS_ASSIGN ? ast::AssignMode::Append
                                                                       : ast::AssignMode::Set;
        stmt.value = build_expression(node.child(3));
        return make_statement(std::move(stmt), node.location);
    }

    if (rule == "assignment" || rule == "let_declaration") {
        ast::Assignment stmt;
        stmt.name = node.child(0).token.lexeme;
        stmt.value = build_expression(node.child(1));
        stmt.declare = rule == "let_declaration";
        return make_statement(std::move(stmt), node.location);
    }

    if (rule == "print_statement") {
        ast::PrintStatement stmt;
        stmt.expression = build_expression(node.child(0));
        return make_statement(std::move(stmt), node.location);
    }

    if (rule == "if_statement") {
        ast::IfStatement stmt;
        stmt.condition = build_expression(node.child(0));
        stmt.then_block = build_block(node.child(1));
        if (node.size() > 2) {
            const ParseNode& alternative = node.child(2);
            if (alternative.rule == "if_statement") {
                ast::Block nested;
                nested.push_back(build_statement(alternative));
                stmt.else_block = std::move(nested);
            } else {
                stmt.else_block = build_block(alternative);
            }
        }
        return make_statement(std::move(stmt), node.location);
    }

    if (rule == "expression_statement") {
        ast::ExpressionStatement stmt;
        stmt.expression = build_expression(node.child(0));
        return make_statement(std::move(stmt), node.location);
    }

    throw unexpected(node);
}

ast::ToolListLiteral AstBuilder::build_tool_list(const ParseNode& node) const {
    ast::ToolListLiteral list;
    for (const auto& entry : node.children) {
        ast::ToolSpecLiteral spec;
        spec.name = entry.child(0).token.lexeme;
        spec.location = entry.location;
        if (entry.rule == "agent_routing") {
            spec.routed = true;
            for (const auto& target : entry.child(1).children) {
                spec.targets.push_back(target.token.lexeme);
            }
        }
        list.tools.push_back(std::move(spec));
    }
    return list;
}

ast::ExpressionPtr AstBuilder::build_expression(const ParseNode& node) const {
    const std::string& rule = node.rule;

    if (rule == "string") {
        return make_expression(ast::StringLiteral{node.token.lexeme}, node.location);
    }
    if (rule == "number") {
        return make_expression(
            ast::NumberLiteral{std::strtod(node.token.lexeme.c_str(), nullptr)}, node.location);
    }
    if (rule == "boolean") {
        return make_expression(ast::BooleanLiteral{node.token.type == TokenType::KW_TRUE},
                               node.location);
    }
    if (rule == "null") {
        return make_expression(ast::NullLiteral{}, node.location);
    }
    if (rule == "identifier") {
        return make_expression(ast::Identifier{node.token.lexeme}, node.location);
    }

    if (rule == "f_string") {
        ast::InterpolatedString interpolated;
        for (const auto& part : node.children) {
            ast::InterpolatedString::Segment segment;
            if (part.rule == "f_text") {
                segment.text = part.token.lexeme;
            } else {
                segment.expression = build_expression(part.child(0));
            }
            interpolated.segments.push_back(std::move(segment));
        }
        return make_expression(std::move(interpolated), node.location);
    }

    if (rule == "property_access") {
        ast::PropertyAccess access;
        access.object = build_expression(node.child(0));
        access.property = node.child(1).token.lexeme;
        return make_expression(std::move(access), node.location);
    }

    if (rule == "method_call") {
        ast::MethodCall call;
        call.receiver = build_expression(node.child(0));
        call.method = node.child(1).token.lexeme;
        for (const auto& arg : node.child(2).children) {
            if (arg.rule == "named_argument") {
                call.named_arguments.push_back(
                    ast::NamedArgument{arg.child(0).token.lexeme, build_expression(arg.child(1))});
            } else {
                call.arguments.push_back(build_expression(arg));
            }
        }
        return make_expression(std::move(call), node.location);
    }

    if (rule == "boolean_expression") {
        ast::BooleanExpression expr;
        expr.op = node.token.type == TokenType::KW_AND ? ast::BooleanOperator::And
                                                       : ast::BooleanOperator::Or;
        expr.left = build_expression(node.child(0));
        expr.right = build_expression(node.child(1));
        return make_expression(std::move(expr), node.location);
    }

    if (rule == "comparison_expression") {
        ast::ComparisonExpression expr;
        expr.op = comparison_operator(node.token.type);
        expr.left = build_expression(node.child(0));
        expr.right = build_expression(node.child(1));
        return make_expression(std::move(expr), node.location);
    }

    if (rule == "not_expression") {
        ast::NotExpression expr;
        expr.operand = build_expression(node.child(0));
        return make_expression(std::move(expr), node.location);
    }

    if (rule == "tool_list") {
        return make_expression(build_tool_list(node), node.location);
    }

    if (rule == "mapping") {
        ast::MappingLiteral mapping;
        for (const auto& pair : node.children) {
            mapping.entries.emplace_back(pair.child(0).token.lexeme,
                                         build_expression(pair.child(1)));
        }
        return make_expression(std::move(mapping), node.location);
    }

    throw unexpected(node);
}

core::errors::Result<ast::Program> parse_program(const std::string& source) {
    auto tree = parse_source(source);
    if (core::errors::is_error(tree)) {
        return core::errors::get_error(tree);
    }
    AstBuilder builder;
    return builder.build(core::errors::get_value(tree));
}

}  // namespace agentic::parser
