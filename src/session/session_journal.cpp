#include "session/session_journal.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace agentic::session {

using core::errors::ErrorCategory;
using core::errors::ScriptError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json error_to_json(const ScriptError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    payload["hint"] = error.hint;
    if (error.location.has_value()) {
        payload["line"] = error.location->line;
        payload["column"] = error.location->column;
    }
    return payload;
}

json options_to_json(const protocol::RunOptions& options) {
    json payload;
    payload["script_path"] = options.script_path.string();
    payload["ask_timeout_ms"] = options.ask_timeout_ms;
    payload["mailbox_capacity"] = options.mailbox_capacity;
    payload["history_limit"] = options.history_limit;
    payload["processing_delay_ms"] = options.processing_delay_ms;
    payload["journal_dir"] = options.journal_dir.string();
    payload["verbose"] = options.verbose;
    return payload;
}

json snapshot_to_json(const SessionSnapshot& snapshot) {
    json agents = json::array();
    for (const auto& agent : snapshot.agents) {
        json entry;
        entry["id"] = agent.id;
        entry["name"] = agent.name;
        entry["kind"] = agent.kind;
        entry["model"] = agent.model;
        entry["status"] = runtime::to_string(agent.status);
        json properties = json::object();
        for (const auto& [key, text] : agent.properties) {
            properties[key] = text;
        }
        entry["properties"] = properties;
        entry["tools"] = agent.tools;
        entry["received"] = agent.received;
        agents.push_back(entry);
    }

    json bus;
    bus["total_sent"] = snapshot.bus.total_sent;
    bus["delivered"] = snapshot.bus.delivered;
    bus["failed"] = snapshot.bus.failed;
    bus["timed_out"] = snapshot.bus.timed_out;
    bus["replies"] = snapshot.bus.replies;
    bus["discarded_replies"] = snapshot.bus.discarded_replies;
    bus["pending"] = snapshot.bus.pending;
    bus["average_latency_ms"] = snapshot.bus.average_latency_ms;
    json flows = json::object();
    for (const auto& [pair, flow] : snapshot.bus.flows) {
        flows[pair] = {{"sent", flow.sent}, {"delivered", flow.delivered}, {"failed", flow.failed}};
    }
    bus["flows"] = flows;

    json tools = json::array();
    for (const auto& tool : snapshot.tools) {
        json entry;
        entry["name"] = tool.name;
        entry["description"] = tool.description;
        entry["tags"] = tool.tags;
        entry["accepts_targets"] = tool.accepts_targets;
        entry["enabled"] = tool.enabled;
        entry["call_count"] = tool.call_count;
        entry["failure_count"] = tool.failure_count;
        if (tool.last_used.has_value()) {
            entry["last_used_unix_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                                             tool.last_used->time_since_epoch())
                                             .count();
        } else {
            entry["last_used_unix_ms"] = nullptr;
        }
        tools.push_back(entry);
    }

    json payload;
    payload["agents"] = agents;
    payload["bus"] = bus;
    payload["tools"] = tools;
    payload["imported_modules"] = snapshot.imported_modules;
    return payload;
}

}  // namespace

SessionSnapshot capture_snapshot(const runtime::RuntimeContext& context) {
    SessionSnapshot snapshot;
    snapshot.agents = context.agents().snapshot();
    snapshot.bus = context.bus().stats();
    snapshot.tools = context.tools().stats();
    snapshot.imported_modules = context.modules().imported_modules();
    return snapshot;
}

SessionJournal::SessionJournal(std::filesystem::path journal_dir)
    : journal_dir_(std::move(journal_dir)) {}

core::errors::Result<std::filesystem::path> SessionJournal::journal_path(
    const std::string& session_id) const {
    if (session_id.empty()) {
        return ScriptError{ErrorCategory::Input, "Session ID cannot be empty.",
                           "invalid_session_id"};
    }

    std::error_code ec;
    if (std::filesystem::exists(journal_dir_, ec) &&
        !std::filesystem::is_directory(journal_dir_, ec)) {
        return ScriptError{ErrorCategory::Input,
                           "Journal path is not a directory: " + journal_dir_.string(),
                           "invalid_journal_dir"};
    }

    std::filesystem::create_directories(journal_dir_, ec);
    if (ec) {
        return ScriptError{ErrorCategory::Internal,
                           "Unable to create journal directory: " + journal_dir_.string(),
                           "journal_dir_create_failed"};
    }

    return journal_dir_ / (session_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> SessionJournal::append_event(
    const std::string& session_id, const std::string& event_json) const {
    auto path_result = journal_path(session_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return ScriptError{ErrorCategory::Internal, "Unable to open journal: " + path.string(),
                           "journal_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return ScriptError{ErrorCategory::Internal,
                           "Unable to write journal event: " + path.string(),
                           "journal_write_failed"};
    }

    return path;
}

core::errors::Result<std::filesystem::path> SessionJournal::write_session_start(
    const std::string& session_id, const protocol::RunOptions& options) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "session_start";
    event["session_id"] = session_id;
    event["payload"] = options_to_json(options);
    return append_event(session_id, event.dump());
}

core::errors::Result<std::filesystem::path> SessionJournal::write_statement(
    const std::string& session_id, const protocol::StatementOutcome& outcome) const {
    json payload;
    payload["index"] = outcome.index;
    payload["line"] = outcome.line;
    payload["outcome"] = outcome.success ? "ok" : "error";
    if (outcome.error.has_value()) {
        payload["error"] = error_to_json(*outcome.error);
    }

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "statement";
    event["session_id"] = session_id;
    event["payload"] = payload;
    return append_event(session_id, event.dump());
}

core::errors::Result<std::filesystem::path> SessionJournal::write_final(
    const std::string& session_id, const protocol::RunOutcome& outcome,
    const SessionSnapshot& snapshot) const {
    json payload;
    payload["status"] = protocol::to_string(outcome.status);
    payload["summary"] = outcome.summary;
    payload["statements_completed"] = outcome.statements_completed;
    payload["error"] = outcome.error.has_value() ? error_to_json(*outcome.error) : json(nullptr);
    payload["snapshot"] = snapshot_to_json(snapshot);

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "final";
    event["session_id"] = session_id;
    event["payload"] = payload;
    return append_event(session_id, event.dump());
}

}  // namespace agentic::session
