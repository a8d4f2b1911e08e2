// ==============================================================================
// logveil/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv в типизированные команды
// - Генерация --help / --version
// - Диагностические ошибки CLI в стиле clap (exit code 2)
//
// Парсер не обращается к файловой системе: существование путей и
// корректность профилей проверяются при выполнении команды.
//
// ==============================================================================

#ifndef LOGVEIL_CLI_HPP
#define LOGVEIL_CLI_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace logveil::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int num_threads = 0;     // --num-threads (0 = по числу CPU)
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// redact - санитизация файлов, директорий или stdin
struct RedactCommand {
    std::vector<std::filesystem::path> paths;
    bool from_stdin = false;  // единственный путь "-"

    // Профиль
    std::optional<std::string> profile;                  // -p, --profile (имя или "auto")
    std::optional<std::filesystem::path> rules;          // --rules
    std::optional<std::filesystem::path> profiles_dir;   // --profiles-dir
    std::optional<double> entropy_threshold;             // --entropy-threshold
    std::optional<std::size_t> entropy_min_length;       // --entropy-min-length
    bool disable_entropy = false;                        // --disable-entropy
    std::vector<std::string> keys;                       // --keys a.b,c.d

    // Вывод
    std::optional<std::filesystem::path> output;  // -o, --output
    bool inplace = false;                         // --inplace
    bool backup = false;                          // --backup
    bool dry_run = false;                         // --dry-run
    bool preview = false;                         // --preview
    std::optional<std::filesystem::path> trace;   // --trace
    std::string trace_format = "json";            // --trace-format
    bool stats = false;                           // --stats
    std::optional<std::filesystem::path> html_report;  // --html-report

    // Обработка
    std::string engine = "auto";          // --engine
    std::vector<std::string> extensions;  // --extension
    bool skip_errors = false;             // --skip-errors
};

/// lint - проверка файла профиля
struct LintCommand {
    std::filesystem::path path;
};

/// profiles - список доступных профилей
struct ProfilesCommand {
    std::optional<std::filesystem::path> profiles_dir;  // --profiles-dir
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command =
    std::variant<RedactCommand, LintCommand, ProfilesCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика и результат
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.3.0";

constexpr const char* ABOUT = "Redact secrets and personal data from log files";

}  // namespace logveil::cli

#endif  // LOGVEIL_CLI_HPP
