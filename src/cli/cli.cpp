// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "logveil/cli.hpp"

#include "logveil/platform.hpp"

#include <cstdlib>
#include <cstring>
#include <string_view>

namespace logveil::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

constexpr const char* MORE_INFO = "\n\nFor more information, try '--help'.\n";

void fail(ParseResult& result, const std::string& message) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = "error: " + message + MORE_INFO;
}

void fail_invalid(ParseResult& result, const char* value, const char* arg, const char* reason) {
    fail(result,
         std::string("invalid value '") + value + "' for '" + arg + "': " + reason);
}

/// Опция со значением: "--name VALUE" или "--name=VALUE".
/// Возвращает значение либо nullptr (опция не совпала или ошибка в result).
class ArgCursor {
public:
    ArgCursor(int argc, char** argv, int& index) : argc_(argc), argv_(argv), i_(index) {}

    /// Совпадает ли текущий аргумент с опцией (short может быть nullptr)
    const char* value(const char* short_name, const char* long_name, const char* display,
                      ParseResult& result) {
        const char* arg = argv_[i_];
        if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
            if (i_ + 1 >= argc_) {
                fail(result, std::string("a value is required for '") + display +
                                 "' but none was supplied");
                failed_ = true;
                return nullptr;
            }
            ++i_;
            return argv_[i_];
        }
        std::string prefix = std::string(long_name) + "=";
        if (starts_with(arg, prefix.c_str())) {
            return arg + prefix.size();
        }
        return nullptr;
    }

    bool failed() const { return failed_; }

private:
    int argc_;
    char** argv_;
    int& i_;
    bool failed_ = false;
};

bool parse_size(const char* text, std::size_t& out) {
    if (text == nullptr || *text == '\0' || *text == '-' || *text == '+') {
        return false;
    }
    char* end = nullptr;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
}

bool parse_double(const char* text, double& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    char* end = nullptr;
    double v = std::strtod(text, &end);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = v;
    return true;
}

/// Разделить "a,b,,c" на непустые элементы
void split_csv(const char* text, std::vector<std::string>& out) {
    std::string_view rest(text);
    while (!rest.empty()) {
        auto comma = rest.find(',');
        std::string_view item = rest.substr(0, comma);
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }
}

/// Глобальные флаги допустимы и до, и после подкоманды
bool parse_global_flag(const char* arg, GlobalOptions& global) {
    if (str_eq(arg, "--no-banner")) {
        global.no_banner = true;
        return true;
    }
    if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        global.quiet = true;
        return true;
    }
    if (arg[0] == '-' && arg[1] == 'v' && arg[2] != '\0' &&
        std::strspn(arg + 1, "v") == std::strlen(arg + 1)) {
        // -vv, -vvv
        global.verbose += static_cast<int>(std::strlen(arg + 1));
        return true;
    }
    if (str_eq(arg, "-v") || str_eq(arg, "--verbose")) {
        global.verbose++;
        return true;
    }
    return false;
}

std::string usage_line(const char* command) {
    if (str_eq(command, "redact")) {
        return "Usage: logveil redact [OPTIONS] <PATH>...";
    }
    if (str_eq(command, "lint")) {
        return "Usage: logveil lint <PROFILE>";
    }
    return "Usage: logveil [OPTIONS] <COMMAND>";
}

void fail_unexpected(ParseResult& result, const char* arg, const char* command) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = std::string("error: unexpected argument '") + arg +
                                       "' found\n\n" + usage_line(command) +
                                       "\n\nFor more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// redact
// ----------------------------------------------------------------------------

void parse_redact(int argc, char** argv, int start, ParseResult& result) {
    RedactCommand cmd;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        ArgCursor cur(argc, argv, i);

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"redact"};
            return;
        }
        if (parse_global_flag(arg, result.global)) {
            continue;
        }

        if (const char* v = cur.value("-p", "--profile", "--profile <PROFILE>", result)) {
            cmd.profile = v;
        } else if (const char* v = cur.value(nullptr, "--rules", "--rules <FILE>", result)) {
            cmd.rules = platform::path_from_utf8(v);
        } else if (const char* v =
                       cur.value(nullptr, "--profiles-dir", "--profiles-dir <DIR>", result)) {
            cmd.profiles_dir = platform::path_from_utf8(v);
        } else if (const char* v = cur.value(nullptr, "--entropy-threshold",
                                             "--entropy-threshold <THRESHOLD>", result)) {
            double threshold = 0.0;
            if (!parse_double(v, threshold)) {
                fail_invalid(result, v, "--entropy-threshold <THRESHOLD>", "invalid float literal");
                return;
            }
            cmd.entropy_threshold = threshold;
        } else if (const char* v = cur.value(nullptr, "--entropy-min-length",
                                             "--entropy-min-length <LENGTH>", result)) {
            std::size_t length = 0;
            if (!parse_size(v, length)) {
                fail_invalid(result, v, "--entropy-min-length <LENGTH>",
                             "invalid digit found in string");
                return;
            }
            cmd.entropy_min_length = length;
        } else if (str_eq(arg, "--disable-entropy")) {
            cmd.disable_entropy = true;
        } else if (const char* v = cur.value(nullptr, "--keys", "--keys <PATHS>", result)) {
            split_csv(v, cmd.keys);
        } else if (const char* v = cur.value("-o", "--output", "--output <OUTPUT>", result)) {
            cmd.output = platform::path_from_utf8(v);
        } else if (str_eq(arg, "--inplace")) {
            cmd.inplace = true;
        } else if (str_eq(arg, "--backup")) {
            cmd.backup = true;
        } else if (str_eq(arg, "--dry-run")) {
            cmd.dry_run = true;
        } else if (str_eq(arg, "--preview")) {
            cmd.preview = true;
        } else if (const char* v = cur.value(nullptr, "--trace", "--trace <FILE>", result)) {
            cmd.trace = platform::path_from_utf8(v);
        } else if (const char* v =
                       cur.value(nullptr, "--trace-format", "--trace-format <FORMAT>", result)) {
            if (!str_eq(v, "json") && !str_eq(v, "jsonl")) {
                fail_invalid(result, v, "--trace-format <FORMAT>",
                             "unknown format, must be: json or jsonl");
                return;
            }
            cmd.trace_format = v;
        } else if (const char* v =
                       cur.value(nullptr, "--html-report", "--html-report <FILE>", result)) {
            cmd.html_report = platform::path_from_utf8(v);
        } else if (str_eq(arg, "--stats")) {
            cmd.stats = true;
        } else if (const char* v = cur.value(nullptr, "--engine", "--engine <ENGINE>", result)) {
            if (!str_eq(v, "auto") && !str_eq(v, "sequential") && !str_eq(v, "parallel")) {
                fail_invalid(result, v, "--engine <ENGINE>",
                             "unknown engine, must be: auto, sequential or parallel");
                return;
            }
            cmd.engine = v;
        } else if (const char* v =
                       cur.value(nullptr, "--extension", "--extension <EXTENSION>", result)) {
            cmd.extensions.emplace_back(v);
        } else if (str_eq(arg, "--skip-errors")) {
            cmd.skip_errors = true;
        } else if (cur.failed()) {
            return;
        } else if (str_eq(arg, "-")) {
            cmd.from_stdin = true;
        } else if (arg[0] == '-') {
            fail_unexpected(result, arg, "redact");
            return;
        } else {
            cmd.paths.push_back(platform::path_from_utf8(arg));
        }

        if (cur.failed()) {
            return;
        }
    }

    if (cmd.paths.empty() && !cmd.from_stdin) {
        result.ok = false;
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            "error: the following required arguments were not provided:\n"
            "  <PATH>...\n\n" +
            usage_line("redact") + "\n\nFor more information, try '--help'.\n";
        return;
    }
    if (cmd.from_stdin && !cmd.paths.empty()) {
        fail(result, "'-' (stdin) cannot be used together with other paths");
        return;
    }
    if (cmd.from_stdin && cmd.inplace) {
        fail(result, "the argument '--inplace' cannot be used when reading from stdin");
        return;
    }
    if (cmd.inplace && cmd.output.has_value()) {
        fail(result, "the argument '--inplace' cannot be used with '--output <OUTPUT>'");
        return;
    }
    if (cmd.dry_run && cmd.inplace) {
        fail(result, "the argument '--dry-run' cannot be used with '--inplace'");
        return;
    }
    if (cmd.from_stdin && cmd.html_report.has_value()) {
        fail(result,
             "the argument '--html-report <FILE>' cannot be used when reading from stdin");
        return;
    }
    if (cmd.backup && !cmd.inplace) {
        fail(result, "the argument '--backup' requires '--inplace'");
        return;
    }

    result.ok = true;
    result.command = std::move(cmd);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("logveil ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: logveil [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  redact    Redact sensitive data from log files, directories or stdin\n"
               "  lint      Validate a profile file\n"
               "  profiles  List the available profiles\n"
               "  help      Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner                  Hide logveil's banner\n"
               "      --num-threads <NUM_THREADS>  Limit the thread number (default: num of CPUs)\n"
               "  -v...                            Print verbose output\n"
               "  -q                               Suppress informational output\n"
               "  -h, --help                       Print help\n"
               "  -V, --version                    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Redact a directory of logs into a sanitized copy:\n"
               "        ./logveil redact logs/ -o clean/ --trace audit.json\n"
               "\n"
               "    Preview what would change with the nginx profile:\n"
               "        ./logveil redact -p nginx --dry-run --preview access.log\n"
               "\n"
               "    Sanitize a live stream, reloading rules on SIGHUP:\n"
               "        tail -f app.log | ./logveil redact --rules team.yml -\n";
    }
    if (*command == "redact") {
        return "Redact sensitive data from log files, directories or stdin\n"
               "\n"
               "Usage: logveil redact [OPTIONS] <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Files or directories to redact, or '-' for stdin\n"
               "\n"
               "Options:\n"
               "  -p, --profile <PROFILE>          Profile name, or 'auto' to pick by file name\n"
               "      --rules <FILE>               Load the profile from a YAML or JSON file\n"
               "      --profiles-dir <DIR>         Load additional profiles from a directory\n"
               "      --entropy-threshold <THRESHOLD>\n"
               "                                   Override the entropy threshold (bits per "
               "symbol)\n"
               "      --entropy-min-length <LENGTH>\n"
               "                                   Override the minimum token length for "
               "entropy\n"
               "      --disable-entropy            Disable entropy detection\n"
               "      --keys <PATHS>               Extra key paths to redact (comma separated)\n"
               "  -o, --output <OUTPUT>            Output file (single input) or directory\n"
               "      --inplace                    Replace input files with redacted output\n"
               "      --backup                     Keep a <file>.bak copy when using --inplace\n"
               "      --dry-run                    Do not write any output\n"
               "      --preview                    Show changed lines as -/+ pairs\n"
               "      --trace <FILE>               Write the redaction audit trail to a file\n"
               "      --trace-format <FORMAT>      Audit trail format: json or jsonl\n"
               "      --stats                      Print redaction statistics\n"
               "      --html-report <FILE>         Write changed lines side by side as HTML\n"
               "      --engine <ENGINE>            Batch engine: auto, sequential or parallel\n"
               "      --extension <EXTENSION>      Only process files with this extension\n"
               "      --skip-errors                Skip unreadable files and continue\n"
               "  -h, --help                       Print help\n";
    }
    if (*command == "lint") {
        return "Validate a profile file\n"
               "\n"
               "Usage: logveil lint <PROFILE>\n"
               "\n"
               "Arguments:\n"
               "  <PROFILE>  Path to a YAML or JSON profile\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }
    if (*command == "profiles") {
        return "List the available profiles\n"
               "\n"
               "Usage: logveil profiles [OPTIONS]\n"
               "\n"
               "Options:\n"
               "      --profiles-dir <DIR>  Also load profiles from a directory\n"
               "  -h, --help                Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        ArgCursor cur(argc, argv, i);

        if (parse_global_flag(arg, result.global)) {
            continue;
        }
        if (const char* v =
                cur.value(nullptr, "--num-threads", "--num-threads <NUM_THREADS>", result)) {
            std::size_t n = 0;
            if (!parse_size(v, n) || n > 4096) {
                fail_invalid(result, v, "--num-threads <NUM_THREADS>",
                             "invalid digit found in string");
                return result;
            }
            result.global.num_threads = static_cast<int>(n);
            continue;
        }
        if (cur.failed()) {
            return result;
        }
        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        }
        if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        }
        if (arg[0] == '-') {
            fail_unexpected(result, arg, "");
            return result;
        }
        cmd_idx = i;
        break;
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "redact")) {
        parse_redact(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "lint")) {
        LintCommand lint_cmd;
        bool have_path = false;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"lint"};
                return result;
            }
            if (parse_global_flag(arg, result.global)) {
                continue;
            }
            if (arg[0] == '-' || have_path) {
                fail_unexpected(result, arg, "lint");
                return result;
            }
            lint_cmd.path = platform::path_from_utf8(arg);
            have_path = true;
        }

        if (!have_path) {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                "error: the following required arguments were not provided:\n"
                "  <PROFILE>\n\n"
                "Usage: logveil lint <PROFILE>\n\n"
                "For more information, try '--help'.\n";
            return result;
        }
        result.ok = true;
        result.command = lint_cmd;
    } else if (str_eq(cmd, "profiles")) {
        ProfilesCommand profiles_cmd;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            ArgCursor cur(argc, argv, i);
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"profiles"};
                return result;
            }
            if (parse_global_flag(arg, result.global)) {
                continue;
            }
            if (const char* v =
                    cur.value(nullptr, "--profiles-dir", "--profiles-dir <DIR>", result)) {
                profiles_cmd.profiles_dir = platform::path_from_utf8(v);
                continue;
            }
            if (cur.failed()) {
                return result;
            }
            fail_unexpected(result, arg, "profiles");
            return result;
        }
        result.ok = true;
        result.command = profiles_cmd;
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = std::string("error: unrecognized subcommand '") + cmd +
                                           "'\n\n" + usage_line("") +
                                           "\n\nFor more information, try '--help'.\n";
    }

    return result;
}

}  // namespace logveil::cli
