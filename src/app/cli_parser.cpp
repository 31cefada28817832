#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace agentic::app::cli {

    using namespace agentic::core::errors;
    using agentic::protocol::RunOptions;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> script;
        std::optional<std::string> ask_timeout_ms;
        std::optional<std::string> history_limit;
        std::optional<std::string> processing_delay_ms;
        std::optional<std::string> journal_dir;
        bool verbose = false;
    };

    // Exception-free integer parsing with inclusive bounds.
    Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                        std::uint32_t min, std::uint32_t max) {
        std::uint32_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return ScriptError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
        }
        if (value < min || value > max) {
            return ScriptError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                               "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
        }
        return value;
    }

    }  // namespace

    Result<RunOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ScriptError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: agentic run --script <file>"};
        }

        std::string command = argv[1];
        if (command != "run") {
            return ScriptError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--script") {
                if (i + 1 < args.size()) raw.script = args[++i];
                else return ScriptError{ErrorCategory::Input, "Missing value for --script", "missing_value"};
            } else if (args[i] == "--ask-timeout-ms") {
                if (i + 1 < args.size()) raw.ask_timeout_ms = args[++i];
                else return ScriptError{ErrorCategory::Input, "Missing value for --ask-timeout-ms", "missing_value"};
            } else if (args[i] == "--history-limit") {
                if (i + 1 < args.size()) raw.history_limit = args[++i];
                else return ScriptError{ErrorCategory::Input, "Missing value for --history-limit", "missing_value"};
            } else if (args[i] == "--processing-delay-ms") {
                if (i + 1 < args.size()) raw.processing_delay_ms = args[++i];
                else return ScriptError{ErrorCategory::Input, "Missing value for --processing-delay-ms", "missing_value"};
            } else if (args[i] == "--journal-dir") {
                if (i + 1 < args.size()) raw.journal_dir = args[++i];
                else return ScriptError{ErrorCategory::Input, "Missing value for --journal-dir", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ScriptError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        RunOptions options;
        options.verbose = raw.verbose;

        if (!raw.script.has_value()) {
            return ScriptError{ErrorCategory::Input, "Must provide --script", "missing_required_flag"};
        }

        if (raw.ask_timeout_ms) {
            auto parsed = parse_bounded("--ask-timeout-ms", *raw.ask_timeout_ms, 0, 3600000);
            if (is_error(parsed)) return get_error(parsed);
            options.ask_timeout_ms = get_value(parsed);
        }
        if (raw.history_limit) {
            auto parsed = parse_bounded("--history-limit", *raw.history_limit, 1, 1000000);
            if (is_error(parsed)) return get_error(parsed);
            options.history_limit = get_value(parsed);
        }
        if (raw.processing_delay_ms) {
            auto parsed = parse_bounded("--processing-delay-ms", *raw.processing_delay_ms, 0, 60000);
            if (is_error(parsed)) return get_error(parsed);
            options.processing_delay_ms = get_value(parsed);
        }

        // Path validation
        std::filesystem::path script(raw.script.value());
        std::error_code path_ec;
        const bool exists = std::filesystem::exists(script, path_ec);
        if (path_ec || !exists) {
            return ScriptError{ErrorCategory::Input, "Script does not exist or is not a regular file", "invalid_path"};
        }
        const bool is_file = std::filesystem::is_regular_file(script, path_ec);
        if (path_ec || !is_file) {
            return ScriptError{ErrorCategory::Input, "Script does not exist or is not a regular file", "invalid_path"};
        }
        options.script_path = std::move(script);

        if (raw.journal_dir) {
            std::filesystem::path dir(raw.journal_dir.value());
            const bool dir_exists = std::filesystem::exists(dir, path_ec);
            if (path_ec || (dir_exists && !std::filesystem::is_directory(dir, path_ec))) {
                return ScriptError{ErrorCategory::Input, "Journal directory is not a directory", "invalid_path"};
            }
            options.journal_dir = std::move(dir);
        }

        return options;
    }

} // namespace agentic::app::cli
