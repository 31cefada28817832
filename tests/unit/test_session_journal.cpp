#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/id_generator.hpp"
#include "core/errors/script_errors.hpp"
#include "protocol/run_contract.hpp"
#include "protocol/run_options.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/runtime_context.hpp"
#include "session/session_journal.hpp"

namespace {

using agentic::core::errors::ErrorCategory;
using agentic::core::errors::ScriptError;
using agentic::core::errors::get_error;
using agentic::core::errors::get_value;
using agentic::core::errors::is_error;
using agentic::core::errors::take_value;
using agentic::protocol::RunOptions;
using agentic::protocol::RunOutcome;
using agentic::protocol::RunStatus;
using agentic::protocol::StatementOutcome;
using agentic::protocol::ToolInvocation;
using agentic::runtime::RuntimeContext;
using agentic::runtime::Value;
using agentic::session::SessionJournal;
using agentic::session::SessionSnapshot;
using agentic::session::capture_snapshot;
using nlohmann::json;
using namespace std::chrono_literals;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_session_journal_" + agentic::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<json> read_events(const std::filesystem::path& file_path) {
    std::vector<json> events;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        events.push_back(json::parse(line));
    }
    return events;
}

// A small live session: one agent with a goal, one Calculator call and one
// answered ask.
SessionSnapshot busy_snapshot() {
    auto created = RuntimeContext::create(RunOptions{});
    EXPECT_FALSE(is_error(created));
    if (is_error(created)) {
        return SessionSnapshot{};
    }
    std::unique_ptr<RuntimeContext> context = take_value(created);

    auto spawned = context->agents().spawn("a", "Agent", "openai/gpt-4o");
    EXPECT_FALSE(is_error(spawned));
    if (is_error(spawned)) {
        return SessionSnapshot{};
    }
    auto agent = get_value(spawned);
    agent->set_property("goal", Value::from_string("ship"));

    ToolInvocation invocation;
    invocation.tool_name = "Calculator";
    invocation.caller_id = agent->id();
    invocation.args.push_back(Value::from_string("1 + 1"));
    EXPECT_FALSE(is_error(context->tools().execute("Calculator", invocation)));
    EXPECT_FALSE(is_error(
        context->bus().ask("system", agent->id(), Value::from_string("hello"), 2000ms)));

    SessionSnapshot snapshot = capture_snapshot(*context);
    context->shutdown();
    return snapshot;
}

TEST(SessionJournalTest, WritesStartStatementAndFinalEvents) {
    TempWorkspace workspace;
    SessionJournal journal(workspace.root() / "sessions");
    const std::string session_id = "session_0000abcd";

    RunOptions options;
    options.script_path = "demo.ags";
    options.ask_timeout_ms = 1500;
    const auto start = journal.write_session_start(session_id, options);
    ASSERT_FALSE(is_error(start));
    const auto log_path = get_value(start);
    EXPECT_EQ(log_path, workspace.root() / "sessions" / "session_0000abcd.jsonl");
    EXPECT_TRUE(std::filesystem::exists(log_path));

    StatementOutcome first;
    first.index = 0;
    first.line = 1;
    first.success = true;
    ASSERT_FALSE(is_error(journal.write_statement(session_id, first)));

    StatementOutcome second;
    second.index = 1;
    second.line = 2;
    second.error = ScriptError{ErrorCategory::Semantic, "Unknown agent 'ghost'", "unknown_agent"};
    ASSERT_FALSE(is_error(journal.write_statement(session_id, second)));

    RunOutcome outcome;
    outcome.status = RunStatus::Failed;
    outcome.statements_completed = 1;
    outcome.error = second.error;
    outcome.summary = "Stopped at statement 2 of 2";
    ASSERT_FALSE(is_error(journal.write_final(session_id, outcome, busy_snapshot())));

    const auto events = read_events(log_path);
    ASSERT_EQ(events.size(), 4u);
    for (const auto& event : events) {
        EXPECT_EQ(event.at("session_id").get<std::string>(), session_id);
        EXPECT_TRUE(event.at("ts_unix_ms").is_number_integer());
    }

    EXPECT_EQ(events[0].at("event").get<std::string>(), "session_start");
    EXPECT_EQ(events[0].at("payload").at("script_path").get<std::string>(), "demo.ags");
    EXPECT_EQ(events[0].at("payload").at("ask_timeout_ms").get<int>(), 1500);

    EXPECT_EQ(events[1].at("event").get<std::string>(), "statement");
    EXPECT_EQ(events[1].at("payload").at("outcome").get<std::string>(), "ok");
    EXPECT_FALSE(events[1].at("payload").contains("error"));
    EXPECT_EQ(events[2].at("payload").at("outcome").get<std::string>(), "error");
    EXPECT_EQ(events[2].at("payload").at("error").at("code").get<std::string>(), "unknown_agent");
    EXPECT_EQ(events[2].at("payload").at("error").at("category").get<std::string>(), "semantic");

    const auto& final_payload = events[3].at("payload");
    EXPECT_EQ(events[3].at("event").get<std::string>(), "final");
    EXPECT_EQ(final_payload.at("status").get<std::string>(), "failed");
    EXPECT_EQ(final_payload.at("statements_completed").get<int>(), 1);
    EXPECT_EQ(final_payload.at("error").at("code").get<std::string>(), "unknown_agent");

    const auto& snapshot = final_payload.at("snapshot");
    ASSERT_EQ(snapshot.at("agents").size(), 1u);
    EXPECT_EQ(snapshot.at("agents")[0].at("name").get<std::string>(), "a");
    EXPECT_EQ(snapshot.at("agents")[0].at("properties").at("goal").get<std::string>(), "ship");
    EXPECT_EQ(snapshot.at("agents")[0].at("received").get<int>(), 1);
    EXPECT_EQ(snapshot.at("bus").at("replies").get<int>(), 1);
    EXPECT_EQ(snapshot.at("bus").at("flows").size(), 1u);

    bool saw_calculator = false;
    for (const auto& tool : snapshot.at("tools")) {
        EXPECT_TRUE(tool.at("enabled").get<bool>());
        if (tool.at("name").get<std::string>() != "Calculator") {
            EXPECT_TRUE(tool.at("last_used_unix_ms").is_null());
            continue;
        }
        saw_calculator = true;
        EXPECT_EQ(tool.at("call_count").get<int>(), 1);
        EXPECT_TRUE(tool.at("last_used_unix_ms").is_number_integer());
    }
    EXPECT_TRUE(saw_calculator);
}

TEST(SessionJournalTest, CompletedRunHasNullError) {
    TempWorkspace workspace;
    SessionJournal journal(workspace.root());

    RunOutcome outcome;
    outcome.summary = "Executed 0 statement(s)";
    const auto written = journal.write_final("session_1", outcome, SessionSnapshot{});
    ASSERT_FALSE(is_error(written));

    const auto events = read_events(get_value(written));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].at("payload").at("status").get<std::string>(), "completed");
    EXPECT_TRUE(events[0].at("payload").at("error").is_null());
    EXPECT_TRUE(events[0].at("payload").at("snapshot").at("agents").empty());
}

TEST(SessionJournalTest, RejectsEmptySessionId) {
    TempWorkspace workspace;
    SessionJournal journal(workspace.root());

    auto result = journal.write_session_start("", RunOptions{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_session_id");
}

TEST(SessionJournalTest, RejectsFileAsJournalDirectory) {
    TempWorkspace workspace;
    const auto blocker = workspace.root() / "not_a_dir";
    std::ofstream(blocker) << "x";

    SessionJournal journal(blocker);
    auto result = journal.journal_path("session_2");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_journal_dir");
}

}  // namespace
