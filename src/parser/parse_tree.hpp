#pragma once

#include <string>
#include <vector>
#include "parser/token.hpp"

namespace agentic::parser {

// Generic concrete parse tree produced by the grammar parser. Interior nodes
// carry the grammar rule name; leaves additionally carry the matched token.
struct ParseNode {
    std::string rule;
    Token token;
    SourceLocation location;
    std::vector<ParseNode> children;

    const ParseNode& child(std::size_t index) const { return children.at(index); }
    std::size_t size() const { return children.size(); }
};

}  // namespace agentic::parser
