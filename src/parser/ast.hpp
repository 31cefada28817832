#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "core/errors/script_errors.hpp"

namespace agentic::parser::ast {

using core::errors::SourceLocation;

struct Expression;
struct Statement;
using ExpressionPtr = std::unique_ptr<Expression>;
using StatementPtr = std::unique_ptr<Statement>;
using Block = std::vector<StatementPtr>;

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

struct StringLiteral {
    std::string value;
};

struct NumberLiteral {
    double value = 0.0;
};

struct BooleanLiteral {
    bool value = false;
};

struct NullLiteral {};

struct Identifier {
    std::string name;
};

// f"Hello {a.name}!" -> [text "Hello ", expr a.name, text "!"]
struct InterpolatedString {
    struct Segment {
        std::string text;
        ExpressionPtr expression;  // set for embedded expressions, null for text
    };
    std::vector<Segment> segments;
};

struct PropertyAccess {
    ExpressionPtr object;
    std::string property;
};

struct NamedArgument {
    std::string name;
    ExpressionPtr value;
};

struct MethodCall {
    ExpressionPtr receiver;
    std::string method;
    std::vector<ExpressionPtr> arguments;
    std::vector<NamedArgument> named_arguments;
};

enum class BooleanOperator { And, Or };

struct BooleanExpression {
    BooleanOperator op;
    ExpressionPtr left;
    ExpressionPtr right;
};

enum class ComparisonOperator { Equal, NotEqual, Less, LessEqual, Greater, GreaterEqual };

struct ComparisonExpression {
    ComparisonOperator op;
    ExpressionPtr left;
    ExpressionPtr right;
};

struct NotExpression {
    ExpressionPtr operand;
};

struct ToolSpecLiteral {
    std::string name;
    std::vector<std::string> targets;  // AgentRouting{ a, b }
    bool routed = false;
    SourceLocation location;
};

struct ToolListLiteral {
    std::vector<ToolSpecLiteral> tools;
};

struct MappingLiteral {
    std::vector<std::pair<std::string, ExpressionPtr>> entries;
};

struct Expression {
    using Node = std::variant<StringLiteral, NumberLiteral, BooleanLiteral, NullLiteral,
                              Identifier, InterpolatedString, PropertyAccess, MethodCall,
                              BooleanExpression, ComparisonExpression, NotExpression,
                              ToolListLiteral, MappingLiteral>;

    Node node;
    SourceLocation location;
};

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

struct ImportStatement {
    std::vector<std::string> module_path;
    std::vector<std::string> names;
};

struct AgentDeclaration {
    std::string name;
    std::string kind;   // constructor type, e.g. "Agent"
    std::string model;  // opaque descriptor, e.g. "openai/gpt-4o"
    std::vector<std::pair<std::string, ExpressionPtr>> config;
};

enum class AssignMode { Set, Append };

struct PropertyAssignment {
    std::string agent;
    std::string property;
    ExpressionPtr value;
    AssignMode mode = AssignMode::Set;
};

// `x = expr` (declare == false) or `let x = expr` (declare == true)
struct Assignment {
    std::string name;
    ExpressionPtr value;
    bool declare = false;
};

struct PrintStatement {
    ExpressionPtr expression;
};

struct IfStatement {
    ExpressionPtr condition;
    Block then_block;
    std::optional<Block> else_block;
};

struct ExpressionStatement {
    ExpressionPtr expression;
};

struct Statement {
    using Node = std::variant<ImportStatement, AgentDeclaration, PropertyAssignment, Assignment,
                              PrintStatement, IfStatement, ExpressionStatement>;

    Node node;
    SourceLocation location;
};

struct Program {
    std::vector<StatementPtr> statements;
};

const char* to_string(ComparisonOperator op);
const char* to_string(BooleanOperator op);

}  // namespace agentic::parser::ast
