#pragma once

#include <string>
#include <vector>
#include "core/errors/script_errors.hpp"
#include "parser/parse_tree.hpp"
#include "parser/token.hpp"

namespace agentic::parser {

// Recursive descent parser for the AgenticScript grammar. Produces a generic
// ParseNode tree ("program" at the root) or a syntax_error with position.
//
//   statement   := import | agent_decl | property_assign | let | assignment
//                | print | if | expression
//   expression  := or_expr
//   or_expr     := and_expr ('or' and_expr)*
//   and_expr    := not_expr ('and' not_expr)*
//   not_expr    := 'not' not_expr | comparison
//   comparison  := postfix (('=='|'!='|'<'|'<='|'>'|'>=') postfix)?
//   postfix     := primary ('.' IDENT ('(' arguments? ')')?)*
class GrammarParser {
public:
    explicit GrammarParser(std::vector<Token> tokens);

    core::errors::Result<ParseNode> parse_program();

    // Parses a single expression spanning the whole token stream. Used for
    // the embedded segments of interpolated strings.
    core::errors::Result<ParseNode> parse_standalone_expression();

private:
    const Token& peek(std::size_t offset = 0) const;
    const Token& consume();
    bool check(TokenType type) const;
    bool match(TokenType type);
    const Token& expect(TokenType type, const std::string& context);
    bool is_at_end() const;

    ParseNode parse_statement();
    ParseNode parse_import();
    ParseNode parse_agent_declaration();
    ParseNode parse_property_assignment();
    ParseNode parse_let();
    ParseNode parse_assignment();
    ParseNode parse_print();
    ParseNode parse_if();
    ParseNode parse_block();

    ParseNode parse_expression();
    ParseNode parse_or();
    ParseNode parse_and();
    ParseNode parse_not();
    ParseNode parse_comparison();
    ParseNode parse_postfix();
    ParseNode parse_primary();
    ParseNode parse_arguments();
    ParseNode parse_mapping();
    ParseNode parse_tool_list();
    ParseNode parse_fstring(const Token& token);

    static ParseNode leaf(const std::string& rule, const Token& token);
    static ParseNode node(const std::string& rule, SourceLocation location);

    std::vector<Token> tokens_;
    std::size_t current_ = 0;
};

// Convenience: tokenize and parse a complete source text.
core::errors::Result<ParseNode> parse_source(const std::string& source);

}  // namespace agentic::parser
