#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/script_errors.hpp"
#include "protocol/run_contract.hpp"
#include "protocol/run_options.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/agent_table.hpp"
#include "runtime/message_bus.hpp"
#include "runtime/runtime_context.hpp"

namespace agentic::session {

// Read-only introspection of a session: agents, bus and tool counters.
struct SessionSnapshot {
    std::vector<runtime::AgentSnapshot> agents;
    runtime::BusStats bus;
    std::vector<protocol::ToolStats> tools;
    std::vector<std::string> imported_modules;
};

SessionSnapshot capture_snapshot(const runtime::RuntimeContext& context);

// Appends one JSON object per line to <journal_dir>/<session_id>.jsonl.
class SessionJournal {
public:
    explicit SessionJournal(std::filesystem::path journal_dir);

    core::errors::Result<std::filesystem::path> write_session_start(
        const std::string& session_id, const protocol::RunOptions& options) const;

    core::errors::Result<std::filesystem::path> write_statement(
        const std::string& session_id, const protocol::StatementOutcome& outcome) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& session_id, const protocol::RunOutcome& outcome,
        const SessionSnapshot& snapshot) const;

    core::errors::Result<std::filesystem::path> journal_path(
        const std::string& session_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& session_id, const std::string& event_json) const;

    std::filesystem::path journal_dir_;
};

}  // namespace agentic::session
