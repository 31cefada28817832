#pragma once

#include <string>
#include "parser/ast.hpp"

namespace agentic::parser {

// Renders the AST as nested s-expressions with source positions, e.g.
//   (program (print@1:1 (string@1:7 "hi")))
// Two structurally identical trees render to identical text.
class AstPrinter {
public:
    std::string print(const ast::Program& program) const;
    std::string print(const ast::Statement& statement) const;
    std::string print(const ast::Expression& expression) const;

private:
    std::string print_block(const ast::Block& block) const;
};

}  // namespace agentic::parser
