#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/id_generator.hpp"
#include "core/errors/script_errors.hpp"
#include "core/logging/logger.hpp"
#include "parser/ast_builder.hpp"
#include "protocol/run_contract.hpp"
#include "runtime/interpreter.hpp"
#include "runtime/runtime_context.hpp"
#include "session/session_journal.hpp"

int main(int argc, char* argv[]) {
    // 1. Generate a session ID and register it with the global logger
    const std::string session_id = agentic::core::config::generate_session_id();
    agentic::core::logging::Logger::get().set_session_id(session_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = agentic::app::cli::parse_and_validate(argc, argv);
    if (agentic::core::errors::is_error(parsed)) {
        const auto& err = agentic::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = agentic::core::errors::get_value(parsed);
    if (options.verbose) {
        agentic::core::logging::Logger::get().set_level(agentic::core::logging::LogLevel::DEBUG);
    }

    // 3. Read the script
    std::ifstream in(options.script_path);
    if (!in.is_open()) {
        LOG_ERROR("Unable to open script: " + options.script_path.string());
        return 2;
    }
    std::ostringstream source;
    source << in.rdbuf();

    // 4. Start the runtime and the journal
    auto created = agentic::runtime::RuntimeContext::create(options);
    if (agentic::core::errors::is_error(created)) {
        const auto& err = agentic::core::errors::get_error(created);
        LOG_ERROR("Failed to start runtime [" + err.code + "]: " + err.message);
        return 3;
    }
    auto& context = *agentic::core::errors::get_value(created);

    agentic::session::SessionJournal journal(options.journal_dir);
    auto started = journal.write_session_start(session_id, options);
    if (agentic::core::errors::is_error(started)) {
        const auto& err = agentic::core::errors::get_error(started);
        LOG_ERROR("Failed to write journal [" + err.code + "]: " + err.message);
        return 6;
    }
    LOG_INFO("Session started: " + options.script_path.string());

    // 5. Parse, then execute journaling every statement
    bool journal_ok = true;
    agentic::protocol::RunOutcome outcome;
    auto program = agentic::parser::parse_program(source.str());
    if (agentic::core::errors::is_error(program)) {
        const auto& err = agentic::core::errors::get_error(program);
        LOG_ERROR(options.script_path.string() + ": " + agentic::core::errors::describe(err));
        outcome.status = agentic::protocol::RunStatus::Failed;
        outcome.error = err;
        outcome.summary = "Parse failed: " + agentic::core::errors::describe(err);
    } else {
        agentic::runtime::Interpreter interpreter(context, std::cout);
        outcome = interpreter.run(
            agentic::core::errors::get_value(program),
            [&](const agentic::protocol::StatementOutcome& step) {
                auto written = journal.write_statement(session_id, step);
                if (agentic::core::errors::is_error(written)) {
                    const auto& err = agentic::core::errors::get_error(written);
                    LOG_ERROR("Failed to write statement event [" + err.code + "]: " + err.message);
                    journal_ok = false;
                }
            });
    }

    // Let outstanding tells drain before the final snapshot.
    if (!context.bus().wait_until_idle(std::chrono::milliseconds(options.ask_timeout_ms))) {
        LOG_WARN("Messages still in flight at session end: " +
                 std::to_string(context.bus().pending_count()));
    }
    const auto snapshot = agentic::session::capture_snapshot(context);
    context.shutdown();

    auto final_event = journal.write_final(session_id, outcome, snapshot);
    if (agentic::core::errors::is_error(final_event)) {
        const auto& err = agentic::core::errors::get_error(final_event);
        LOG_ERROR("Failed to write final event [" + err.code + "]: " + err.message);
        return 6;
    }
    LOG_INFO("Journal: " + agentic::core::errors::get_value(final_event).string());

    if (outcome.status == agentic::protocol::RunStatus::Failed) {
        LOG_ERROR("Run summary: " + outcome.summary);
        return 1;
    }
    LOG_INFO("Run summary: " + outcome.summary);
    return journal_ok ? 0 : 6;
}
