#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace agentic::protocol {

    // Validated configuration for one script session.
    struct RunOptions {
        std::filesystem::path script_path;
        std::uint32_t ask_timeout_ms = 5000;      // default for ask() without timeout=
        std::size_t mailbox_capacity = 1000;      // per agent
        std::size_t history_limit = 1000;         // bus message records retained
        std::uint32_t processing_delay_ms = 0;    // simulated work per message
        std::filesystem::path journal_dir = ".agentic_sessions";
        bool verbose = false;
    };

} // namespace agentic::protocol
