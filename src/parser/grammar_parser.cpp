#include "parser/grammar_parser.hpp"

#include <stdexcept>
#include <utility>
#include "parser/lexer.hpp"

namespace agentic::parser {

using core::errors::ErrorCategory;
using core::errors::ScriptError;

namespace {

// Unwinds the recursive descent on the first syntax error; converted back to
// a Result at the public entry points.
class SyntaxFailure : public std::runtime_error {
public:
    explicit SyntaxFailure(ScriptError err)
        : std::runtime_error(err.message), error(std::move(err)) {}

    ScriptError error;
};

[[noreturn]] void fail(const std::string& message, const SourceLocation location) {
    throw SyntaxFailure(
        ScriptError{ErrorCategory::Syntax, message, "syntax_error", "", location});
}

bool is_comparison(const TokenType type) {
    return type == TokenType::EQ || type == TokenType::NE || type == TokenType::LT ||
           type == TokenType::LE || type == TokenType::GT || type == TokenType::GE;
}

}  // namespace

GrammarParser::GrammarParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::END_OF_FILE) {
        const SourceLocation end = tokens_.empty() ? SourceLocation{} : tokens_.back().location;
        tokens_.push_back(Token{TokenType::END_OF_FILE, "", end});
    }
}

// ---------------------------------------------------------------------------
// Token stream
// ---------------------------------------------------------------------------

const Token& GrammarParser::peek(const std::size_t offset) const {
    const std::size_t index = current_ + offset;
    if (index >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[index];
}

const Token& GrammarParser::consume() {
    if (!is_at_end()) {
        ++current_;
    }
    return tokens_[current_ - 1];
}

bool GrammarParser::check(const TokenType type) const {
    return peek().type == type;
}

bool GrammarParser::match(const TokenType type) {
    if (check(type) && !is_at_end()) {
        consume();
        return true;
    }
    return false;
}

const Token& GrammarParser::expect(const TokenType type, const std::string& context) {
    if (!check(type) || (type != TokenType::END_OF_FILE && is_at_end())) {
        fail("expected " + std::string(to_string(type)) + " " + context + ", found " +
                 describe(peek()),
             peek().location);
    }
    return consume();
}

bool GrammarParser::is_at_end() const {
    return peek().type == TokenType::END_OF_FILE;
}

ParseNode GrammarParser::leaf(const std::string& rule, const Token& token) {
    ParseNode result;
    result.rule = rule;
    result.token = token;
    result.location = token.location;
    return result;
}

ParseNode GrammarParser::node(const std::string& rule, const SourceLocation location) {
    ParseNode result;
    result.rule = rule;
    result.location = location;
    return result;
}

// ---------------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------------

core::errors::Result<ParseNode> GrammarParser::parse_program() {
    try {
        ParseNode program = node("program", peek().location);
        while (true) {
            while (match(TokenType::SEMICOLON)) {
            }
            if (is_at_end()) {
                break;
            }
            program.children.push_back(parse_statement());
        }
        return program;
    } catch (const SyntaxFailure& failure) {
        return failure.error;
    }
}

core::errors::Result<ParseNode> GrammarParser::parse_standalone_expression() {
    try {
        if (is_at_end()) {
            fail("expected an expression, found end of input", peek().location);
        }
        ParseNode expr = parse_expression();
        if (!is_at_end()) {
            fail("unexpected " + describe(peek()) + " after expression", peek().location);
        }
        return expr;
    } catch (const SyntaxFailure& failure) {
        return failure.error;
    }
}

core::errors::Result<ParseNode> parse_source(const std::string& source) {
    Lexer lexer(source);
    auto tokens = lexer.tokenize();
    if (core::errors::is_error(tokens)) {
        return core::errors::get_error(tokens);
    }
    GrammarParser parser(core::errors::take_value(tokens));
    return parser.parse_program();
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

ParseNode GrammarParser::parse_statement() {
    switch (peek().type) {
        case TokenType::KW_IMPORT: return parse_import();
        case TokenType::KW_AGENT: return parse_agent_declaration();
        case TokenType::STAR: return parse_property_assignment();
        case TokenType::KW_LET: return parse_let();
        case TokenType::KW_PRINT: return parse_print();
        case TokenType::KW_IF: return parse_if();
        default: break;
    }

    if (check(TokenType::IDENTIFIER) && peek(1).type == TokenType::ASSIGN) {
        return parse_assignment();
    }

    ParseNode statement = node("expression_statement", peek().location);
    statement.children.push_back(parse_expression());
    return statement;
}

// import agentic.stdlib.tools { WebSearch, Calculator }
ParseNode GrammarParser::parse_import() {
    ParseNode statement = node("import_statement", consume().location);

    ParseNode path = node("module_path", peek().location);
    path.children.push_back(leaf("identifier", expect(TokenType::IDENTIFIER, "as module name")));
    while (match(TokenType::DOT)) {
        path.children.push_back(
            leaf("identifier", expect(TokenType::IDENTIFIER, "after '.' in module path")));
    }

    ParseNode names = node("import_list", peek().location);
    expect(TokenType::LBRACE, "before import list");
    do {
        names.children.push_back(leaf("identifier", expect(TokenType::IDENTIFIER, "in import list")));
    } while (match(TokenType::COMMA));
    expect(TokenType::RBRACE, "to close import list");

    statement.children.push_back(std::move(path));
    statement.children.push_back(std::move(names));
    return statement;
}

// agent a = spawn Agent{ openai/gpt-4o, temperature: 0.3 }
ParseNode GrammarParser::parse_agent_declaration() {
    ParseNode statement = node("agent_declaration", consume().location);
    statement.children.push_back(leaf("identifier", expect(TokenType::IDENTIFIER, "as agent name")));
    expect(TokenType::ASSIGN, "after agent name");
    expect(TokenType::KW_SPAWN, "in agent declaration");
    statement.children.push_back(leaf("identifier", expect(TokenType::IDENTIFIER, "as agent type")));
    expect(TokenType::LBRACE, "to open agent constructor");

    if (check(TokenType::MODEL_PATH) || check(TokenType::STRING) ||
        check(TokenType::IDENTIFIER)) {
        statement.children.push_back(leaf("model_spec", consume()));
    } else {
        fail("expected model descriptor in agent constructor, found " + describe(peek()),
             peek().location);
    }

    while (match(TokenType::COMMA)) {
        if (check(TokenType::RBRACE)) {
            break;
        }
        ParseNode pair = node("config_pair", peek().location);
        pair.children.push_back(leaf("identifier", expect(TokenType::IDENTIFIER, "as config key")));
        expect(TokenType::COLON, "after config key");
        pair.children.push_back(parse_expression());
        statement.children.push_back(std::move(pair));
    }
    expect(TokenType::RBRACE, "to close agent constructor");
    return statement;
}

// *agent->property = value   |   *agent->property += value
ParseNode GrammarParser::parse_property_assignment() {
    ParseNode statement = node("property_assignment", consume().location);
    statement.children.push_back(leaf("identifier", expect(TokenType::IDENTIFIER, "after '*'")));
    expect(TokenType::ARROW, "after agent name");
    const Token& property = expect(TokenType::IDENTIFIER, "as property name");
    statement.children.push_back(leaf("identifier", property));

    if (check(TokenType::ASSIGN) || check(TokenType::PLUS_ASSIGN)) {
        statement.children.push_back(leaf("assign_op", consume()));
    } else {
        fail("expected '=' or '+=' after property name, found " + describe(peek()),
             peek().location);
    }

    if (property.lexeme == "tools" && check(TokenType::LBRACE)) {
        statement.children.push_back(parse_tool_list());
    } else {
        statement.children.push_back(parse_expression());
    }
    return statement;
}

ParseNode GrammarParser::parse_let() {
    ParseNode statement = node("let_declaration", consume().location);
    statement.children.push_back(leaf("identifier", expect(TokenType::IDENTIFIER, "after 'let'")));
    expect(TokenType::ASSIGN, "in let declaration");
    statement.children.push_back(parse_expression());
    return statement;
}

ParseNode GrammarParser::parse_assignment() {
    ParseNode statement = node("assignment", peek().location);
    statement.children.push_back(leaf("identifier", consume()));
    consume();  // '='
    statement.children.push_back(parse_expression());
    return statement;
}

ParseNode GrammarParser::parse_print() {
    ParseNode statement = node("print_statement", consume().location);
    expect(TokenType::LPAREN, "after 'print'");
    statement.children.push_back(parse_expression());
    expect(TokenType::RPAREN, "to close print");
    return statement;
}

ParseNode GrammarParser::parse_if() {
    ParseNode statement = node("if_statement", consume().location);
    statement.children.push_back(parse_expression());
    statement.children.push_back(parse_block());
    if (match(TokenType::KW_ELSE)) {
        if (check(TokenType::KW_IF)) {
            statement.children.push_back(parse_if());
        } else {
            statement.children.push_back(parse_block());
        }
    }
    return statement;
}

ParseNode GrammarParser::parse_block() {
    ParseNode block = node("block", peek().location);
    expect(TokenType::LBRACE, "to open block");
    while (true) {
        while (match(TokenType::SEMICOLON)) {
        }
        if (check(TokenType::RBRACE) || is_at_end()) {
            break;
        }
        block.children.push_back(parse_statement());
    }
    expect(TokenType::RBRACE, "to close block");
    return block;
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

ParseNode GrammarParser::parse_expression() {
    return parse_or();
}

ParseNode GrammarParser::parse_or() {
    ParseNode left = parse_and();
    while (check(TokenType::KW_OR)) {
        ParseNode combined = leaf("boolean_expression", consume());
        combined.location = left.location;
        combined.children.push_back(std::move(left));
        combined.children.push_back(parse_and());
        left = std::move(combined);
    }
    return left;
}

ParseNode GrammarParser::parse_and() {
    ParseNode left = parse_not();
    while (check(TokenType::KW_AND)) {
        ParseNode combined = leaf("boolean_expression", consume());
        combined.location = left.location;
        combined.children.push_back(std::move(left));
        combined.children.push_back(parse_not());
        left = std::move(combined);
    }
    return left;
}

ParseNode GrammarParser::parse_not() {
    if (check(TokenType::KW_NOT)) {
        ParseNode negation = node("not_expression", consume().location);
        negation.children.push_back(parse_not());
        return negation;
    }
    return parse_comparison();
}

ParseNode GrammarParser::parse_comparison() {
    ParseNode left = parse_postfix();
    if (is_comparison(peek().type)) {
        ParseNode comparison = leaf("comparison_expression", consume());
        comparison.location = left.location;
        comparison.children.push_back(std::move(left));
        comparison.children.push_back(parse_postfix());
        return comparison;
    }
    return left;
}

ParseNode GrammarParser::parse_postfix() {
    ParseNode expr = parse_primary();
    while (match(TokenType::DOT)) {
        const Token& name = expect(TokenType::IDENTIFIER, "after '.'");
        if (match(TokenType::LPAREN)) {
            ParseNode call = node("method_call", expr.location);
            call.children.push_back(std::move(expr));
            call.children.push_back(leaf("identifier", name));
            ParseNode args = node("arguments", peek().location);
            if (!check(TokenType::RPAREN)) {
                args = parse_arguments();
            }
            expect(TokenType::RPAREN, "to close argument list");
            call.children.push_back(std::move(args));
            expr = std::move(call);
        } else {
            ParseNode access = node("property_access", expr.location);
            access.children.push_back(std::move(expr));
            access.children.push_back(leaf("identifier", name));
            expr = std::move(access);
        }
    }
    return expr;
}

ParseNode GrammarParser::parse_arguments() {
    ParseNode args = node("arguments", peek().location);
    do {
        if (check(TokenType::IDENTIFIER) && peek(1).type == TokenType::ASSIGN) {
            ParseNode named = node("named_argument", peek().location);
            named.children.push_back(leaf("identifier", consume()));
            consume();  // '='
            named.children.push_back(parse_expression());
            args.children.push_back(std::move(named));
        } else {
            args.children.push_back(parse_expression());
        }
    } while (match(TokenType::COMMA));
    return args;
}

ParseNode GrammarParser::parse_primary() {
    const Token& token = peek();
    switch (token.type) {
        case TokenType::STRING:
            return leaf("string", consume());
        case TokenType::FSTRING:
            return parse_fstring(consume());
        case TokenType::NUMBER:
            return leaf("number", consume());
        case TokenType::MINUS: {
            const SourceLocation location = consume().location;
            Token number = expect(TokenType::NUMBER, "after unary '-'");
            number.lexeme = "-" + number.lexeme;
            number.location = location;
            return leaf("number", number);
        }
        case TokenType::KW_TRUE:
        case TokenType::KW_FALSE:
            return leaf("boolean", consume());
        case TokenType::KW_NULL:
            return leaf("null", consume());
        case TokenType::IDENTIFIER:
            return leaf("identifier", consume());
        case TokenType::LPAREN: {
            consume();
            ParseNode inner = parse_expression();
            expect(TokenType::RPAREN, "to close parenthesised expression");
            return inner;
        }
        case TokenType::LBRACE:
            return parse_mapping();
        default:
            break;
    }
    fail("expected an expression, found " + describe(token), token.location);
}

// { key: expr, "other key": expr }
ParseNode GrammarParser::parse_mapping() {
    ParseNode mapping = node("mapping", consume().location);
    while (!check(TokenType::RBRACE)) {
        ParseNode pair = node("mapping_pair", peek().location);
        if (check(TokenType::IDENTIFIER) || check(TokenType::STRING)) {
            pair.children.push_back(leaf("key", consume()));
        } else {
            fail("expected mapping key, found " + describe(peek()), peek().location);
        }
        expect(TokenType::COLON, "after mapping key");
        pair.children.push_back(parse_expression());
        mapping.children.push_back(std::move(pair));
        if (!match(TokenType::COMMA)) {
            break;
        }
    }
    expect(TokenType::RBRACE, "to close mapping");
    return mapping;
}

// { WebSearch, AgentRouting{ researcher, analyzer } }
ParseNode GrammarParser::parse_tool_list() {
    ParseNode tools = node("tool_list", consume().location);
    while (!check(TokenType::RBRACE)) {
        const Token& name = expect(TokenType::IDENTIFIER, "as tool name");
        if (match(TokenType::LBRACE)) {
            ParseNode routing = node("agent_routing", name.location);
            routing.children.push_back(leaf("identifier", name));
            ParseNode targets = node("identifier_list", peek().location);
            while (!check(TokenType::RBRACE)) {
                targets.children.push_back(
                    leaf("identifier", expect(TokenType::IDENTIFIER, "as routing target")));
                if (!match(TokenType::COMMA)) {
                    break;
                }
            }
            expect(TokenType::RBRACE, "to close routing targets");
            routing.children.push_back(std::move(targets));
            tools.children.push_back(std::move(routing));
        } else {
            ParseNode spec = node("tool_spec", name.location);
            spec.children.push_back(leaf("identifier", name));
            tools.children.push_back(std::move(spec));
        }
        if (!match(TokenType::COMMA)) {
            break;
        }
    }
    expect(TokenType::RBRACE, "to close tool list");
    return tools;
}

// Splits the raw f-string body into f_text leaves and f_expr nodes. Embedded
// expressions are lexed and parsed on their own, keeping source columns.
ParseNode GrammarParser::parse_fstring(const Token& token) {
    ParseNode fstring = node("f_string", token.location);
    const std::string& raw = token.lexeme;
    const std::size_t body_column = token.location.column + 2;  // after f"

    std::string text;
    SourceLocation text_start{token.location.line, body_column};
    auto flush_text = [&]() {
        if (text.empty()) {
            return;
        }
        Token text_token{TokenType::STRING, text, text_start};
        fstring.children.push_back(leaf("f_text", text_token));
        text.clear();
    };

    std::size_t i = 0;
    while (i < raw.size()) {
        const char c = raw[i];
        if (text.empty()) {
            text_start = SourceLocation{token.location.line, body_column + i};
        }
        if (c == '\\' && i + 1 < raw.size()) {
            const char escaped = raw[i + 1];
            switch (escaped) {
                case 'n': text += '\n'; break;
                case 't': text += '\t'; break;
                case 'r': text += '\r'; break;
                default: text += escaped; break;
            }
            i += 2;
            continue;
        }
        if (c == '{' && i + 1 < raw.size() && raw[i + 1] == '{') {
            text += '{';
            i += 2;
            continue;
        }
        if (c == '}' && i + 1 < raw.size() && raw[i + 1] == '}') {
            text += '}';
            i += 2;
            continue;
        }
        if (c == '}') {
            fail("single '}' in interpolated string", SourceLocation{token.location.line, body_column + i});
        }
        if (c != '{') {
            text += c;
            ++i;
            continue;
        }

        // Find the matching '}' while skipping nested string literals.
        const std::size_t open = i;
        int depth = 1;
        bool in_string = false;
        std::size_t j = i + 1;
        for (; j < raw.size() && depth > 0; ++j) {
            const char inner = raw[j];
            if (in_string) {
                if (inner == '\\') {
                    ++j;
                } else if (inner == '"') {
                    in_string = false;
                }
                continue;
            }
            if (inner == '"') {
                in_string = true;
            } else if (inner == '{') {
                ++depth;
            } else if (inner == '}') {
                --depth;
            }
        }
        const SourceLocation expr_location{token.location.line, body_column + open + 1};
        if (depth != 0) {
            fail("unterminated '{' in interpolated string", expr_location);
        }

        flush_text();
        const std::string expr_text = raw.substr(open + 1, j - open - 2);
        Lexer lexer(expr_text, expr_location);
        auto tokens = lexer.tokenize();
        if (core::errors::is_error(tokens)) {
            throw SyntaxFailure(core::errors::get_error(tokens));
        }
        GrammarParser inner_parser(core::errors::take_value(tokens));
        auto expr = inner_parser.parse_standalone_expression();
        if (core::errors::is_error(expr)) {
            throw SyntaxFailure(core::errors::get_error(expr));
        }
        ParseNode segment = node("f_expr", expr_location);
        segment.children.push_back(core::errors::take_value(expr));
        fstring.children.push_back(std::move(segment));
        i = j;
    }
    flush_text();
    return fstring;
}

}  // namespace agentic::parser
