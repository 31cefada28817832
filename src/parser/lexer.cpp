#include "parser/lexer.hpp"

#include <cctype>
#include <utility>

namespace agentic::parser {

using core::errors::ErrorCategory;
using core::errors::ScriptError;

const char* to_string(const TokenType type) {
    switch (type) {
        case TokenType::IDENTIFIER: return "identifier";
        case TokenType::STRING: return "string";
        case TokenType::FSTRING: return "interpolated string";
        case TokenType::NUMBER: return "number";
        case TokenType::MODEL_PATH: return "model path";
        case TokenType::KW_IMPORT: return "'import'";
        case TokenType::KW_AGENT: return "'agent'";
        case TokenType::KW_SPAWN: return "'spawn'";
        case TokenType::KW_IF: return "'if'";
        case TokenType::KW_ELSE: return "'else'";
        case TokenType::KW_PRINT: return "'print'";
        case TokenType::KW_LET: return "'let'";
        case TokenType::KW_TRUE: return "'true'";
        case TokenType::KW_FALSE: return "'false'";
        case TokenType::KW_NULL: return "'null'";
        case TokenType::KW_AND: return "'and'";
        case TokenType::KW_OR: return "'or'";
        case TokenType::KW_NOT: return "'not'";
        case TokenType::ASSIGN: return "'='";
        case TokenType::PLUS_ASSIGN: return "'+='";
        case TokenType::ARROW: return "'->'";
        case TokenType::STAR: return "'*'";
        case TokenType::MINUS: return "'-'";
        case TokenType::EQ: return "'=='";
        case TokenType::NE: return "'!='";
        case TokenType::LT: return "'<'";
        case TokenType::LE: return "'<='";
        case TokenType::GT: return "'>'";
        case TokenType::GE: return "'>='";
        case TokenType::LPAREN: return "'('";
        case TokenType::RPAREN: return "')'";
        case TokenType::LBRACE: return "'{'";
        case TokenType::RBRACE: return "'}'";
        case TokenType::COMMA: return "','";
        case TokenType::DOT: return "'.'";
        case TokenType::COLON: return "':'";
        case TokenType::SEMICOLON: return "';'";
        case TokenType::END_OF_FILE: return "end of input";
        default: return "unknown token";
    }
}

std::string describe(const Token& token) {
    switch (token.type) {
        case TokenType::IDENTIFIER:
        case TokenType::NUMBER:
        case TokenType::MODEL_PATH:
            return std::string(to_string(token.type)) + " '" + token.lexeme + "'";
        case TokenType::STRING:
            return "string \"" + token.lexeme + "\"";
        case TokenType::UNKNOWN:
            return "unexpected character '" + token.lexeme + "'";
        default:
            return to_string(token.type);
    }
}

Lexer::Lexer(std::string source, const SourceLocation origin)
    : source_(std::move(source)), line_(origin.line), column_(origin.column) {
    keywords_["import"] = TokenType::KW_IMPORT;
    keywords_["agent"] = TokenType::KW_AGENT;
    keywords_["spawn"] = TokenType::KW_SPAWN;
    keywords_["if"] = TokenType::KW_IF;
    keywords_["else"] = TokenType::KW_ELSE;
    keywords_["print"] = TokenType::KW_PRINT;
    keywords_["let"] = TokenType::KW_LET;
    keywords_["true"] = TokenType::KW_TRUE;
    keywords_["false"] = TokenType::KW_FALSE;
    keywords_["null"] = TokenType::KW_NULL;
    keywords_["and"] = TokenType::KW_AND;
    keywords_["or"] = TokenType::KW_OR;
    keywords_["not"] = TokenType::KW_NOT;
}

core::errors::Result<std::vector<Token>> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        auto token = next_token();
        if (core::errors::is_error(token)) {
            return core::errors::get_error(token);
        }
        tokens.push_back(core::errors::get_value(token));
        if (tokens.back().type == TokenType::END_OF_FILE) {
            break;
        }
    }
    return tokens;
}

char Lexer::peek() const {
    if (is_at_end()) {
        return '\0';
    }
    return source_[current_];
}

char Lexer::peek_next() const {
    if (current_ + 1 >= source_.size()) {
        return '\0';
    }
    return source_[current_ + 1];
}

char Lexer::advance() {
    const char c = source_[current_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

bool Lexer::match(const char expected) {
    if (is_at_end() || source_[current_] != expected) {
        return false;
    }
    advance();
    return true;
}

SourceLocation Lexer::current_location() const {
    return SourceLocation{line_, column_};
}

Token Lexer::make_token(const TokenType type, std::string lexeme,
                        const SourceLocation start) const {
    return Token{type, std::move(lexeme), start};
}

ScriptError Lexer::error_at(const std::string& message,
                            const SourceLocation location) const {
    return ScriptError{ErrorCategory::Syntax, message, "syntax_error", "", location};
}

void Lexer::skip_trivia() {
    while (!is_at_end()) {
        const char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
            continue;
        }
        if (c == '/' && peek_next() == '/') {
            while (!is_at_end() && peek() != '\n') {
                advance();
            }
            continue;
        }
        break;
    }
}

core::errors::Result<Token> Lexer::next_token() {
    skip_trivia();
    const SourceLocation start = current_location();
    if (is_at_end()) {
        return make_token(TokenType::END_OF_FILE, "", start);
    }

    const char c = peek();
    if (c == '"' || c == '\'') {
        return scan_string(start);
    }
    if (c == 'f' && peek_next() == '"') {
        return scan_fstring(start);
    }
    if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
        return scan_number(start);
    }
    if (std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_') {
        return scan_word(start);
    }
    return scan_operator(start);
}

core::errors::Result<Token> Lexer::scan_string(const SourceLocation start) {
    const char quote = advance();
    std::string value;

    while (!is_at_end() && peek() != quote) {
        const char c = advance();
        if (c == '\n') {
            return error_at("unterminated string literal", start);
        }
        if (c != '\\') {
            value += c;
            continue;
        }
        if (is_at_end()) {
            break;
        }
        const char escaped = advance();
        switch (escaped) {
            case 'n': value += '\n'; break;
            case 't': value += '\t'; break;
            case 'r': value += '\r'; break;
            default: value += escaped; break;
        }
    }

    if (is_at_end()) {
        return error_at("unterminated string literal", start);
    }
    advance();  // closing quote
    return make_token(TokenType::STRING, value, start);
}

// The body is kept raw; quotes nested inside {...} segments do not end it.
core::errors::Result<Token> Lexer::scan_fstring(const SourceLocation start) {
    advance();  // f
    advance();  // "
    std::string raw;
    int depth = 0;

    while (!is_at_end()) {
        const char c = peek();
        if (depth == 0 && c == '"') {
            break;
        }
        if (c == '\n') {
            return error_at("unterminated interpolated string", start);
        }
        if (c == '\\' && depth == 0) {
            raw += advance();
            if (!is_at_end()) {
                raw += advance();
            }
            continue;
        }
        if (c == '{') {
            if (depth == 0 && peek_next() == '{') {
                raw += advance();
                raw += advance();
                continue;
            }
            ++depth;
        } else if (c == '}' && depth > 0) {
            --depth;
        } else if (c == '"' && depth > 0) {
            raw += advance();
            while (!is_at_end() && peek() != '"' && peek() != '\n') {
                if (peek() == '\\') {
                    raw += advance();
                }
                if (!is_at_end()) {
                    raw += advance();
                }
            }
            if (is_at_end() || peek() == '\n') {
                return error_at("unterminated string inside interpolation", start);
            }
        }
        raw += advance();
    }

    if (is_at_end()) {
        return error_at("unterminated interpolated string", start);
    }
    if (depth != 0) {
        return error_at("unbalanced '{' in interpolated string", start);
    }
    advance();  // closing quote
    return make_token(TokenType::FSTRING, raw, start);
}

Token Lexer::scan_number(const SourceLocation start) {
    std::string value;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
        value += advance();
    }
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek_next())) != 0) {
        value += advance();
        while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
            value += advance();
        }
    }
    return make_token(TokenType::NUMBER, value, start);
}

// Identifiers, keywords, and model paths such as `openai/gpt-4o`. A word is a
// model path when it is directly followed by '/' and another word character.
Token Lexer::scan_word(const SourceLocation start) {
    std::string value;
    while (std::isalnum(static_cast<unsigned char>(peek())) != 0 || peek() == '_') {
        value += advance();
    }

    if (peek() == '/' && std::isalnum(static_cast<unsigned char>(peek_next())) != 0) {
        while (true) {
            const char c = peek();
            const bool path_char = std::isalnum(static_cast<unsigned char>(c)) != 0 ||
                                   c == '_' || c == '-' || c == '.' || c == ':';
            const bool separator =
                c == '/' && std::isalnum(static_cast<unsigned char>(peek_next())) != 0;
            if (!path_char && !separator) {
                break;
            }
            value += advance();
        }
        return make_token(TokenType::MODEL_PATH, value, start);
    }

    const auto keyword = keywords_.find(value);
    if (keyword != keywords_.end()) {
        return make_token(keyword->second, value, start);
    }
    return make_token(TokenType::IDENTIFIER, value, start);
}

Token Lexer::scan_operator(const SourceLocation start) {
    const char c = advance();
    switch (c) {
        case '=':
            if (match('=')) return make_token(TokenType::EQ, "==", start);
            return make_token(TokenType::ASSIGN, "=", start);
        case '+':
            if (match('=')) return make_token(TokenType::PLUS_ASSIGN, "+=", start);
            break;
        case '-':
            if (match('>')) return make_token(TokenType::ARROW, "->", start);
            return make_token(TokenType::MINUS, "-", start);
        case '*': return make_token(TokenType::STAR, "*", start);
        case '!':
            if (match('=')) return make_token(TokenType::NE, "!=", start);
            return make_token(TokenType::KW_NOT, "!", start);
        case '<':
            if (match('=')) return make_token(TokenType::LE, "<=", start);
            return make_token(TokenType::LT, "<", start);
        case '>':
            if (match('=')) return make_token(TokenType::GE, ">=", start);
            return make_token(TokenType::GT, ">", start);
        case '&':
            if (match('&')) return make_token(TokenType::KW_AND, "&&", start);
            break;
        case '|':
            if (match('|')) return make_token(TokenType::KW_OR, "||", start);
            break;
        case '(': return make_token(TokenType::LPAREN, "(", start);
        case ')': return make_token(TokenType::RPAREN, ")", start);
        case '{': return make_token(TokenType::LBRACE, "{", start);
        case '}': return make_token(TokenType::RBRACE, "}", start);
        case ',': return make_token(TokenType::COMMA, ",", start);
        case '.': return make_token(TokenType::DOT, ".", start);
        case ':': return make_token(TokenType::COLON, ":", start);
        case ';': return make_token(TokenType::SEMICOLON, ";", start);
        default:
            break;
    }
    return make_token(TokenType::UNKNOWN, std::string(1, c), start);
}

}  // namespace agentic::parser
