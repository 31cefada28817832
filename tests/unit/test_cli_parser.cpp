#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/id_generator.hpp"
#include "core/errors/script_errors.hpp"

namespace {

using agentic::app::cli::parse_and_validate;
using agentic::core::errors::ErrorCategory;
using agentic::core::errors::get_error;
using agentic::core::errors::get_value;
using agentic::core::errors::is_error;
using agentic::protocol::RunOptions;

agentic::core::errors::Result<RunOptions> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("agentic");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

class TempScript {
public:
    TempScript() {
        path_ = std::filesystem::current_path() /
                (".tmp_cli_script_" + agentic::core::config::generate_id("cli") + ".agentic");
        std::ofstream out(path_);
        out << "print(\"hi\")\n";
    }

    ~TempScript() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenScriptMissing) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"run", "--script"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    TempScript script;
    auto result = parse_tokens({"run", "--script", script.path(), "--fast"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenTimeoutNotNumeric) {
    TempScript script;
    auto result = parse_tokens({"run", "--script", script.path(), "--ask-timeout-ms", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenTimeoutHasTrailingCharacters) {
    TempScript script;
    auto result = parse_tokens({"run", "--script", script.path(), "--ask-timeout-ms", "12ms"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenHistoryLimitOutOfBounds) {
    TempScript script;
    auto result = parse_tokens({"run", "--script", script.path(), "--history-limit", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenScriptDoesNotExist) {
    const auto missing =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_script__.agentic";
    auto result = parse_tokens({"run", "--script", missing.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenScriptIsADirectory) {
    auto result = parse_tokens({"run", "--script", std::filesystem::current_path().string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenJournalDirIsAFile) {
    TempScript script;
    auto result = parse_tokens({"run", "--script", script.path(), "--journal-dir", script.path()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesFullRunOptions) {
    TempScript script;
    auto result = parse_tokens({"run", "--script", script.path(), "--ask-timeout-ms", "250",
                                "--history-limit", "64", "--processing-delay-ms", "5",
                                "--journal-dir", "journals", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.script_path.string(), script.path());
    EXPECT_EQ(options.ask_timeout_ms, 250u);
    EXPECT_EQ(options.history_limit, 64u);
    EXPECT_EQ(options.processing_delay_ms, 5u);
    EXPECT_EQ(options.journal_dir.string(), "journals");
    EXPECT_TRUE(options.verbose);
}

TEST(CliParserTest, AppliesDefaults) {
    TempScript script;
    auto result = parse_tokens({"run", "--script", script.path()});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.ask_timeout_ms, 5000u);
    EXPECT_EQ(options.mailbox_capacity, 1000u);
    EXPECT_EQ(options.history_limit, 1000u);
    EXPECT_EQ(options.processing_delay_ms, 0u);
    EXPECT_EQ(options.journal_dir.string(), ".agentic_sessions");
    EXPECT_FALSE(options.verbose);
}

}  // namespace
