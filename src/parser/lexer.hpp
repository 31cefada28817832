#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/script_errors.hpp"
#include "parser/token.hpp"

namespace agentic::parser {

// Converts AgenticScript source into a token stream. Whitespace and newlines
// are insignificant; `//` starts a comment that runs to the end of the line.
class Lexer {
public:
    explicit Lexer(std::string source, SourceLocation origin = {});

    // Always ends with an END_OF_FILE token on success.
    core::errors::Result<std::vector<Token>> tokenize();

private:
    char peek() const;
    char peek_next() const;
    char advance();
    bool match(char expected);
    bool is_at_end() const { return current_ >= source_.size(); }
    SourceLocation current_location() const;

    void skip_trivia();
    core::errors::Result<Token> next_token();
    core::errors::Result<Token> scan_string(SourceLocation start);
    core::errors::Result<Token> scan_fstring(SourceLocation start);
    Token scan_number(SourceLocation start);
    Token scan_word(SourceLocation start);
    Token scan_operator(SourceLocation start);

    Token make_token(TokenType type, std::string lexeme, SourceLocation start) const;
    core::errors::ScriptError error_at(const std::string& message,
                                       SourceLocation location) const;

    std::string source_;
    std::size_t current_ = 0;
    std::size_t line_;
    std::size_t column_;
    std::unordered_map<std::string, TokenType> keywords_;
};

}  // namespace agentic::parser
