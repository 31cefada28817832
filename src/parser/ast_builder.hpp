#pragma once

#include <string>
#include "core/errors/script_errors.hpp"
#include "parser/ast.hpp"
#include "parser/parse_tree.hpp"

namespace agentic::parser {

// Maps the generic parse tree onto the typed AST. Performs no evaluation and
// no name resolution; every node keeps the position of its parse node.
class AstBuilder {
public:
    ast::Program build(const ParseNode& program) const;

    ast::StatementPtr build_statement(const ParseNode& node) const;
    ast::ExpressionPtr build_expression(const ParseNode& node) const;

private:
    ast::Block build_block(const ParseNode& node) const;
    ast::ToolListLiteral build_tool_list(const ParseNode& node) const;
};

// Source text -> AST in one call: lexer, grammar parser, AST builder.
core::errors::Result<ast::Program> parse_program(const std::string& source);

}  // namespace agentic::parser
