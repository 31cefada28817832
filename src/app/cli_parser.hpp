#pragma once
#include "protocol/run_options.hpp"
#include "core/errors/script_errors.hpp"

namespace agentic::app::cli {
    agentic::core::errors::Result<agentic::protocol::RunOptions> parse_and_validate(int argc, char* argv[]);
}
