#pragma once

#include <string>
#include "core/errors/script_errors.hpp"

namespace agentic::parser {

using core::errors::SourceLocation;

enum class TokenType {
    // Literals
    IDENTIFIER,
    STRING,
    FSTRING,      // f"..." raw body, split into segments by the grammar parser
    NUMBER,
    MODEL_PATH,   // openai/gpt-4o

    // Keywords
    KW_IMPORT,
    KW_AGENT,
    KW_SPAWN,
    KW_IF,
    KW_ELSE,
    KW_PRINT,
    KW_LET,
    KW_TRUE,
    KW_FALSE,
    KW_NULL,
    KW_AND,       // and, &&
    KW_OR,        // or, ||
    KW_NOT,       // not, !

    // Operators
    ASSIGN,       // =
    PLUS_ASSIGN,  // +=
    ARROW,        // ->
    STAR,         // *
    MINUS,        // -
    EQ,           // ==
    NE,           // !=
    LT,           // <
    LE,           // <=
    GT,           // >
    GE,           // >=

    // Delimiters
    LPAREN,
    RPAREN,
    LBRACE,
    RBRACE,
    COMMA,
    DOT,
    COLON,
    SEMICOLON,

    END_OF_FILE,
    UNKNOWN
};

struct Token {
    TokenType type = TokenType::UNKNOWN;
    std::string lexeme;
    SourceLocation location;
};

// Human readable token name used in "expected X, found Y" diagnostics.
const char* to_string(TokenType type);

std::string describe(const Token& token);

}  // namespace agentic::parser
