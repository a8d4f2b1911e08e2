// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "logveil/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace logveil::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args)
        : Args(std::vector<std::string>(args)) {}

    explicit Args(std::vector<std::string> args) : strings(std::move(args)) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

ParseResult parse_args(std::vector<std::string> list) {
    Args args(std::move(list));
    return parse(args.argc(), args.argv());
}

const RedactCommand& redact_of(const ParseResult& result) {
    return std::get<RedactCommand>(result.command);
}

// ==============================================================================
// Глобальные опции, help, version
// ==============================================================================

TEST(CliTest, Parse_NoArgs_HelpToStderr) {
    // Arrange
    Args args{"logveil"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: logveil [OPTIONS] <COMMAND>"),
              std::string::npos);
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    ParseResult result = parse_args({"logveil", "--help"});

    EXPECT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_HelpSubcommand) {
    ParseResult result = parse_args({"logveil", "help", "redact"});

    ASSERT_TRUE(result.ok);
    const auto& help = std::get<HelpCommand>(result.command);
    ASSERT_TRUE(help.command.has_value());
    EXPECT_EQ(*help.command, "redact");
}

TEST(CliTest, Parse_RedactHelpFlag) {
    ParseResult result = parse_args({"logveil", "redact", "app.log", "-h"});

    ASSERT_TRUE(result.ok);
    const auto& help = std::get<HelpCommand>(result.command);
    ASSERT_TRUE(help.command.has_value());
    EXPECT_EQ(*help.command, "redact");
}

TEST(CliTest, Parse_Version) {
    ParseResult result = parse_args({"logveil", "-V"});

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_EQ(render_version(), std::string("logveil ") + VERSION + "\n");
}

TEST(CliTest, Parse_GlobalFlags) {
    ParseResult result = parse_args(
        {"logveil", "--no-banner", "--num-threads", "3", "-vv", "redact", "-q", "a.log"});

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_TRUE(result.global.no_banner);
    EXPECT_EQ(result.global.num_threads, 3);
    EXPECT_EQ(result.global.verbose, 2);
    EXPECT_TRUE(result.global.quiet);
}

TEST(CliTest, Parse_NumThreadsInvalid) {
    ParseResult result = parse_args({"logveil", "--num-threads", "many", "profiles"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: invalid value 'many' for '--num-threads <NUM_THREADS>': "
              "invalid digit found in string\n\nFor more information, try '--help'.\n");
}

TEST(CliTest, Parse_UnknownSubcommand) {
    ParseResult result = parse_args({"logveil", "scrub"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unrecognized subcommand 'scrub'\n\n"
              "Usage: logveil [OPTIONS] <COMMAND>\n\n"
              "For more information, try '--help'.\n");
}

// ==============================================================================
// redact
// ==============================================================================

TEST(CliRedactTest, Parse_AllOptions) {
    ParseResult result = parse_args({"logveil", "redact", "-p", "nginx", "--rules=team.yml",
                                     "--profiles-dir", "profiles", "--entropy-threshold", "3.5",
                                     "--entropy-min-length=24", "--keys", "user.email,,auth.token",
                                     "-o", "clean", "--trace", "audit.jsonl", "--trace-format",
                                     "jsonl", "--stats", "--engine", "parallel", "--extension",
                                     "log", "--skip-errors", "--preview", "a.log", "logs"});

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const RedactCommand& cmd = redact_of(result);
    ASSERT_TRUE(cmd.profile.has_value());
    EXPECT_EQ(*cmd.profile, "nginx");
    EXPECT_EQ(cmd.rules->string(), "team.yml");
    EXPECT_EQ(cmd.profiles_dir->string(), "profiles");
    EXPECT_DOUBLE_EQ(*cmd.entropy_threshold, 3.5);
    EXPECT_EQ(*cmd.entropy_min_length, 24u);
    ASSERT_EQ(cmd.keys.size(), 2u);
    EXPECT_EQ(cmd.keys[1], "auth.token");
    EXPECT_EQ(cmd.output->string(), "clean");
    EXPECT_EQ(cmd.trace->string(), "audit.jsonl");
    EXPECT_EQ(cmd.trace_format, "jsonl");
    EXPECT_TRUE(cmd.stats);
    EXPECT_EQ(cmd.engine, "parallel");
    ASSERT_EQ(cmd.extensions.size(), 1u);
    EXPECT_TRUE(cmd.skip_errors);
    EXPECT_TRUE(cmd.preview);
    ASSERT_EQ(cmd.paths.size(), 2u);
    EXPECT_FALSE(cmd.from_stdin);
}

TEST(CliRedactTest, Parse_HtmlReport) {
    ParseResult result = parse_args({"logveil", "redact", "--html-report=report.html", "a.log"});

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    ASSERT_TRUE(redact_of(result).html_report.has_value());
    EXPECT_EQ(redact_of(result).html_report->string(), "report.html");
    EXPECT_FALSE(redact_of(result).preview);
}

TEST(CliRedactTest, Parse_Defaults) {
    ParseResult result = parse_args({"logveil", "redact", "app.log"});

    ASSERT_TRUE(result.ok);
    const RedactCommand& cmd = redact_of(result);
    EXPECT_FALSE(cmd.profile.has_value());
    EXPECT_EQ(cmd.trace_format, "json");
    EXPECT_EQ(cmd.engine, "auto");
    EXPECT_FALSE(cmd.inplace);
    EXPECT_FALSE(cmd.disable_entropy);
    EXPECT_FALSE(cmd.html_report.has_value());
}

TEST(CliRedactTest, Parse_Stdin) {
    ParseResult result = parse_args({"logveil", "redact", "--rules", "r.yml", "-"});

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(redact_of(result).from_stdin);
    EXPECT_TRUE(redact_of(result).paths.empty());
}

TEST(CliRedactTest, Parse_InplaceWithBackup) {
    ParseResult result = parse_args({"logveil", "redact", "--inplace", "--backup", "a.log"});

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(redact_of(result).inplace);
    EXPECT_TRUE(redact_of(result).backup);
}

TEST(CliRedactTest, Parse_MissingPath) {
    ParseResult result = parse_args({"logveil", "redact", "--stats"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: the following required arguments were not provided:\n"
              "  <PATH>...\n\n"
              "Usage: logveil redact [OPTIONS] <PATH>...\n\n"
              "For more information, try '--help'.\n");
}

TEST(CliRedactTest, Parse_MissingValue) {
    ParseResult result = parse_args({"logveil", "redact", "a.log", "--profile"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: a value is required for '--profile <PROFILE>' but none was supplied"
              "\n\nFor more information, try '--help'.\n");
}

TEST(CliRedactTest, Parse_UnexpectedArgument) {
    ParseResult result = parse_args({"logveil", "redact", "--colour", "a.log"});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unexpected argument '--colour' found\n\n"
              "Usage: logveil redact [OPTIONS] <PATH>...\n\n"
              "For more information, try '--help'.\n");
}

TEST(CliRedactTest, Parse_InvalidValues) {
    struct Case {
        std::vector<std::string> args;
        std::string message;
    };
    std::vector<Case> cases{
        {{"logveil", "redact", "--trace-format", "csv", "a.log"},
         "invalid value 'csv' for '--trace-format <FORMAT>': unknown format, must be: json or "
         "jsonl"},
        {{"logveil", "redact", "--engine", "fork", "a.log"},
         "invalid value 'fork' for '--engine <ENGINE>': unknown engine, must be: auto, "
         "sequential or parallel"},
        {{"logveil", "redact", "--entropy-threshold", "high", "a.log"},
         "invalid value 'high' for '--entropy-threshold <THRESHOLD>': invalid float literal"},
        {{"logveil", "redact", "--entropy-min-length", "-3", "a.log"},
         "invalid value '-3' for '--entropy-min-length <LENGTH>': invalid digit found in "
         "string"},
    };

    for (const auto& c : cases) {
        ParseResult result = parse_args(c.args);

        EXPECT_FALSE(result.ok);
        EXPECT_EQ(result.diagnostic.exit_code, 2);
        EXPECT_EQ(result.diagnostic.stderr_message,
                  "error: " + c.message + "\n\nFor more information, try '--help'.\n");
    }
}

TEST(CliRedactTest, Parse_Conflicts) {
    struct Case {
        std::vector<std::string> args;
        std::string message;
    };
    std::vector<Case> cases{
        {{"logveil", "redact", "-", "a.log"},
         "'-' (stdin) cannot be used together with other paths"},
        {{"logveil", "redact", "--inplace", "-"},
         "the argument '--inplace' cannot be used when reading from stdin"},
        {{"logveil", "redact", "--inplace", "-o", "out", "a.log"},
         "the argument '--inplace' cannot be used with '--output <OUTPUT>'"},
        {{"logveil", "redact", "--inplace", "--dry-run", "a.log"},
         "the argument '--dry-run' cannot be used with '--inplace'"},
        {{"logveil", "redact", "--backup", "a.log"},
         "the argument '--backup' requires '--inplace'"},
        {{"logveil", "redact", "--html-report", "r.html", "-"},
         "the argument '--html-report <FILE>' cannot be used when reading from stdin"},
    };

    for (const auto& c : cases) {
        ParseResult result = parse_args(c.args);

        EXPECT_FALSE(result.ok);
        EXPECT_EQ(result.diagnostic.exit_code, 2);
        EXPECT_EQ(result.diagnostic.stderr_message,
                  "error: " + c.message + "\n\nFor more information, try '--help'.\n");
    }
}

// ==============================================================================
// lint, profiles
// ==============================================================================

TEST(CliTest, Parse_Lint) {
    ParseResult result = parse_args({"logveil", "lint", "team.yml"});

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<LintCommand>(result.command).path.string(), "team.yml");
}

TEST(CliTest, Parse_LintMissingPath) {
    ParseResult result = parse_args({"logveil", "lint"});

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("<PROFILE>"), std::string::npos);
}

TEST(CliTest, Parse_LintSecondPathRejected) {
    ParseResult result = parse_args({"logveil", "lint", "a.yml", "b.yml"});

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument 'b.yml'"),
              std::string::npos);
}

TEST(CliTest, Parse_Profiles) {
    ParseResult result = parse_args({"logveil", "profiles", "--profiles-dir=custom"});

    ASSERT_TRUE(result.ok);
    const auto& cmd = std::get<ProfilesCommand>(result.command);
    ASSERT_TRUE(cmd.profiles_dir.has_value());
    EXPECT_EQ(cmd.profiles_dir->string(), "custom");
}

// ==============================================================================
// render_help
// ==============================================================================

TEST(CliTest, RenderHelp) {
    std::string general = render_help(std::nullopt);
    EXPECT_EQ(general.rfind(ABOUT, 0), 0u);
    EXPECT_NE(general.find("Commands:"), std::string::npos);
    EXPECT_NE(general.find("Examples:"), std::string::npos);

    EXPECT_NE(render_help(std::string("redact")).find("--trace-format <FORMAT>"),
              std::string::npos);
    EXPECT_NE(render_help(std::string("lint")).find("Usage: logveil lint <PROFILE>"),
              std::string::npos);
    EXPECT_EQ(render_help(std::string("nope")), "error: unrecognized subcommand 'nope'\n");
}

}  // namespace logveil::cli::test
