#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "core/errors/script_errors.hpp"
#include "parser/ast.hpp"
#include "protocol/run_contract.hpp"
#include "runtime/environment.hpp"
#include "runtime/runtime_context.hpp"
#include "runtime/value.hpp"

namespace agentic::runtime {

// Called after every top-level statement run() executes.
using StatementObserver = std::function<void(const protocol::StatementOutcome&)>;

// Tree-walking evaluator. Runs on the caller's thread; the environment is
// private to it, everything shared lives in the RuntimeContext. The
// interpreter sends messages as "system".
class Interpreter {
public:
    static constexpr const char* kSystemSender = "system";

    Interpreter(RuntimeContext& context, std::ostream& out);

    // One top-level statement. An error aborts only this statement and
    // carries the position of the construct that failed.
    core::errors::Status execute(const parser::ast::Statement& statement);

    // Statements in order, stopping at the first error.
    protocol::RunOutcome run(const parser::ast::Program& program,
                             const StatementObserver& observer = StatementObserver());

    core::errors::Result<Value> evaluate(const parser::ast::Expression& expression);

    Environment& environment() { return environment_; }

private:
    using Location = parser::ast::SourceLocation;

    core::errors::Status execute_block(const parser::ast::Block& block);

    core::errors::Status exec_import(const parser::ast::ImportStatement& stmt);
    core::errors::Status exec_agent(const parser::ast::AgentDeclaration& stmt);
    core::errors::Status exec_property(const parser::ast::PropertyAssignment& stmt);
    core::errors::Status exec_assignment(const parser::ast::Assignment& stmt);
    core::errors::Status exec_print(const parser::ast::PrintStatement& stmt);
    core::errors::Status exec_if(const parser::ast::IfStatement& stmt);

    core::errors::Result<Value> eval_node(const parser::ast::Expression& expression);
    core::errors::Result<Value> eval_interpolated(const parser::ast::InterpolatedString& node);
    core::errors::Result<Value> eval_property_access(const parser::ast::PropertyAccess& node);
    core::errors::Result<Value> eval_method_call(const parser::ast::MethodCall& node);
    core::errors::Result<Value> eval_boolean(const parser::ast::BooleanExpression& node);
    core::errors::Result<Value> eval_comparison(const parser::ast::ComparisonExpression& node);
    core::errors::Result<Value> eval_not(const parser::ast::NotExpression& node);
    core::errors::Result<Value> eval_tool_list(const parser::ast::ToolListLiteral& node);
    core::errors::Result<Value> eval_mapping(const parser::ast::MappingLiteral& node);

    core::errors::Result<Value> call_ask(Agent& agent, const std::vector<Value>& args,
                                         const std::vector<std::pair<std::string, Value>>& named);
    core::errors::Result<Value> call_tell(Agent& agent, const std::vector<Value>& args);
    core::errors::Result<Value> call_has_tool(Agent& agent, const std::vector<Value>& args);
    core::errors::Result<Value> call_execute_tool(Agent& agent, const std::vector<Value>& args);

    // Name in the script -> live agent. Bound AgentRefs win over agent names.
    core::errors::Result<std::shared_ptr<Agent>> resolve_agent(const std::string& name) const;
    core::errors::Result<std::shared_ptr<Agent>> live_agent(const AgentRef& ref) const;

    // Reserved-key and read-only checks for writing `key` on an agent whose
    // current value is `existing`. Returns the value to store (the merged
    // value for Append).
    core::errors::Result<Value> prepare_property(const std::string& key, const Value& existing,
                                                 Value value, bool append) const;

    RuntimeContext& context_;
    std::ostream& out_;
    Environment environment_;
};

}  // namespace agentic::runtime
