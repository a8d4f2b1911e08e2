// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv через cli
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// ==============================================================================

#include "logveil/batch.hpp"
#include "logveil/cli.hpp"
#include "logveil/discovery.hpp"
#include "logveil/engine.hpp"
#include "logveil/output.hpp"
#include "logveil/platform.hpp"
#include "logveil/profile.hpp"
#include "logveil/reader.hpp"
#include "logveil/report.hpp"
#include "logveil/trace.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace {

namespace fs = std::filesystem;

// ----------------------------------------------------------------------------
// ASCII Banner
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
    ██╗      ██████╗  ██████╗ ██╗   ██╗███████╗██╗██╗
    ██║     ██╔═══██╗██╔════╝ ██║   ██║██╔════╝██║██║
    ██║     ██║   ██║██║  ███╗██║   ██║█████╗  ██║██║
    ██║     ██║   ██║██║   ██║╚██╗ ██╔╝██╔══╝  ██║██║
    ███████╗╚██████╔╝╚██████╔╝ ╚████╔╝ ███████╗██║███████╗
    ╚══════╝ ╚═════╝  ╚═════╝   ╚═══╝  ╚══════╝╚═╝╚══════╝
)";

void print_banner(logveil::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(logveil::output::Stream::Stderr, BANNER);
    writer.write_line(logveil::output::Stream::Stderr, "");
}

std::string format_entropy(const logveil::entropy::EntropyConfig& cfg) {
    if (!cfg.enabled) {
        return "off";
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f/%zu", cfg.threshold, cfg.min_length);
    return buf;
}

std::string format_note(const logveil::trace::Note& note) {
    std::string s = note.source;
    if (note.line.has_value()) {
        s += ":" + std::to_string(*note.line);
    }
    s += " - " + note.code + ": " + note.message;
    return s;
}

logveil::profile::Overrides make_overrides(const logveil::cli::RedactCommand& cmd) {
    logveil::profile::Overrides ov;
    ov.entropy_threshold = cmd.entropy_threshold;
    ov.entropy_min_length = cmd.entropy_min_length;
    ov.disable_entropy = cmd.disable_entropy;
    ov.extra_keys = cmd.keys;
    return ov;
}

// ----------------------------------------------------------------------------
// Выбор профиля
// ----------------------------------------------------------------------------

/// Реестр: встроенные профили + --profiles-dir. Ошибки каталога - предупреждения.
logveil::profile::ProfileRegistry
build_registry(const std::optional<fs::path>& profiles_dir,
               const logveil::profile::Overrides& overrides, logveil::output::Writer& writer) {
    using namespace logveil;

    auto registry = profile::ProfileRegistry::with_builtins(overrides);
    if (profiles_dir.has_value()) {
        std::vector<profile::Error> errors;
        std::size_t loaded = registry.load_directory(*profiles_dir, errors, overrides);
        for (const auto& err : errors) {
            writer.warn(err.format());
        }
        writer.debug("Loaded " + std::to_string(loaded) + " profile(s) from " +
                     platform::path_to_utf8(*profiles_dir));
    }
    return registry;
}

// ----------------------------------------------------------------------------
// Сопоставление входов и выходов
// ----------------------------------------------------------------------------

struct Input {
    fs::path file;
    fs::path root;  // путь, через который файл был найден
};

std::vector<Input> collect_inputs(const logveil::cli::RedactCommand& cmd,
                                  logveil::output::Writer& writer) {
    using namespace logveil;

    io::DiscoveryOptions opt;
    opt.skip_errors = cmd.skip_errors;
    opt.on_warning = [&writer](const std::string& msg) { writer.warn(msg); };
    if (!cmd.extensions.empty()) {
        std::unordered_set<std::string> exts;
        for (const auto& e : cmd.extensions) {
            exts.insert(io::normalize_extension(e));
        }
        opt.extensions = std::move(exts);
    }

    std::vector<Input> inputs;
    std::set<fs::path> seen;
    for (const auto& root : cmd.paths) {
        for (auto& file : io::discover_files({root}, opt)) {
            if (seen.insert(file).second) {
                inputs.push_back(Input{std::move(file), root});
            }
        }
    }
    return inputs;
}

/// Цель записи для файла при -o: каталог повторяет структуру входа
fs::path output_for(const Input& input, const fs::path& output_dir) {
    std::error_code ec;
    if (fs::is_directory(input.root, ec)) {
        return output_dir / input.file.lexically_relative(input.root);
    }
    return output_dir / input.file.filename();
}

// ----------------------------------------------------------------------------
// Статистика и аудит
// ----------------------------------------------------------------------------

void print_stats(const logveil::trace::Stats& stats, std::size_t files,
                 logveil::output::Writer& writer) {
    using namespace logveil;

    output::Table table;
    table.set_headers({"Rule", "Redactions"});
    for (const auto& [rule, count] : stats.by_rule) {
        table.add_row({rule, std::to_string(count)});
    }
    writer.write(output::Stream::Stderr, table.to_string());

    writer.info("Files: " + std::to_string(files) + ", redactions: " +
                std::to_string(stats.total) + " (pattern: " + std::to_string(stats.pattern) +
                ", entropy: " + std::to_string(stats.entropy) +
                ", key_path: " + std::to_string(stats.key_path) +
                "), notes: " + std::to_string(stats.notes));
}

bool write_html_report(const std::filesystem::path& path,
                       const std::vector<logveil::batch::FileReport>& reports,
                       logveil::output::Writer& writer) {
    using namespace logveil;

    std::vector<report::DiffSection> sections;
    std::size_t rows = 0;
    for (const auto& r : reports) {
        if (!r.ok || r.cancelled) {
            continue;
        }
        report::DiffSection section;
        section.title = platform::path_to_utf8(r.input);
        for (const auto& p : r.previews) {
            section.rows.push_back(report::DiffRow{p.line, p.before, p.after});
        }
        rows += section.rows.size();
        sections.push_back(std::move(section));
    }

    std::string error;
    if (!report::write_html(path, sections, &error)) {
        writer.error(error);
        return false;
    }
    writer.info("HTML report written to " + platform::path_to_utf8(path) + " (" +
                std::to_string(rows) + " changed line(s))");
    return true;
}

bool export_trace(const logveil::cli::RedactCommand& cmd,
                  const logveil::trace::TraceAggregator& traces, logveil::output::Writer& writer) {
    using namespace logveil;

    if (!cmd.trace.has_value()) {
        return true;
    }
    std::string error;
    auto format = trace::parse_export_format(cmd.trace_format);
    if (!traces.write_file(*cmd.trace, format, &error)) {
        writer.error("failed to write audit trail " + platform::path_to_utf8(*cmd.trace) + " - " +
                     error);
        return false;
    }
    writer.info("Audit trail written to " + platform::path_to_utf8(*cmd.trace) + " (" +
                std::to_string(traces.size()) + " records)");
    return true;
}

// ----------------------------------------------------------------------------
// redact: stdin
// ----------------------------------------------------------------------------

int run_redact_stdin(const logveil::cli::RedactCommand& cmd,
                     std::shared_ptr<const logveil::profile::Profile> initial,
                     const logveil::profile::Overrides& overrides,
                     logveil::output::Writer& writer) {
    using namespace logveil;

    engine::ProfileStore store(std::move(initial));
    // Поток может не кончаться: трассы копятся только для экспорта
    std::unique_ptr<trace::TraceAggregator> traces;
    if (cmd.trace.has_value()) {
        traces = std::make_unique<trace::TraceAggregator>();
    }

    batch::StreamOptions opt;
    opt.should_cancel = platform::interrupt_requested;
    opt.on_note = [&writer](const trace::Note& note) { writer.warn(format_note(note)); };
    if (cmd.rules.has_value()) {
        platform::install_reload_signal();
        const fs::path rules = *cmd.rules;
        opt.should_reload = platform::take_reload_request;
        opt.reload = [rules, overrides]() { return profile::load_file(rules, overrides); };
        opt.on_reloaded = [&writer](const profile::Profile& p) {
            writer.info("Reloaded profile '" + p.name() + "'");
        };
        opt.on_reload_failed = [&writer](const profile::Error& err) {
            writer.warn("reload failed, keeping the active profile: " + err.format());
        };
    }

    writer.debug("Reading from stdin with profile '" + store.snapshot()->name() + "'");
    auto stats = batch::redact_stream(std::cin, std::cout, store, opt, traces.get());

    if (cmd.stats) {
        print_stats(stats.summary, 1, writer);
    }
    if (traces && !export_trace(cmd, *traces, writer)) {
        return 1;
    }
    if (stats.cancelled) {
        writer.error("interrupted");
        return 1;
    }
    writer.debug("Processed " + std::to_string(stats.lines) + " line(s), " +
                 std::to_string(stats.redactions) + " redaction(s), " +
                 std::to_string(stats.reloads) + " reload(s)");
    return 0;
}

// ----------------------------------------------------------------------------
// redact
// ----------------------------------------------------------------------------

int run_redact(const logveil::cli::RedactCommand& cmd, const logveil::cli::GlobalOptions& global,
               logveil::output::Writer& writer) {
    using namespace logveil;

    platform::install_interrupt_signal();

    const profile::Overrides overrides = make_overrides(cmd);
    auto registry = build_registry(cmd.profiles_dir, overrides, writer);

    // Явный файл правил имеет приоритет над --profile
    std::shared_ptr<const profile::Profile> fixed;
    bool auto_select = false;
    if (cmd.rules.has_value()) {
        auto loaded = profile::load_file(*cmd.rules, overrides);
        if (!loaded.ok) {
            writer.error(loaded.error.format());
            return 1;
        }
        fixed = loaded.profile;
    } else {
        std::string name = cmd.profile.value_or(profile::DEFAULT_PROFILE);
        if (name == "auto") {
            auto_select = true;
        } else {
            fixed = registry.find(name);
            if (!fixed) {
                std::string available;
                for (const auto& n : registry.names()) {
                    available += available.empty() ? n : ", " + n;
                }
                writer.error("unknown profile '" + name + "', available: " + available);
                return 1;
            }
        }
    }

    if (cmd.from_stdin) {
        if (auto_select) {
            fixed = registry.find(profile::DEFAULT_PROFILE);
        }
        return run_redact_stdin(cmd, fixed, overrides, writer);
    }

    // Поиск файлов
    std::vector<Input> inputs = collect_inputs(cmd, writer);
    if (inputs.empty()) {
        writer.warn("No files found to redact");
        return 0;
    }

    // -o: один файл -> файл, иначе каталог
    bool output_is_file = false;
    if (cmd.output.has_value()) {
        std::error_code ec;
        output_is_file = inputs.size() == 1 && cmd.paths.size() == 1 &&
                         !fs::is_directory(cmd.paths.front(), ec) &&
                         !fs::is_directory(*cmd.output, ec);
    }

    std::vector<batch::FileJob> jobs;
    jobs.reserve(inputs.size());
    for (const auto& input : inputs) {
        batch::FileJob job;
        job.input = input.file;
        job.profile = auto_select ? registry.match_for_file(input.file) : fixed;
        job.kind = io::document_kind_from_path(input.file, job.profile->format());
        if (cmd.output.has_value()) {
            job.output = output_is_file ? *cmd.output : output_for(input, *cmd.output);
        }
        writer.trace(platform::path_to_utf8(input.file) + " -> profile '" + job.profile->name() +
                     "', " + io::document_kind_to_string(job.kind));
        jobs.push_back(std::move(job));
    }

    batch::Options opt;
    opt.inplace = cmd.inplace;
    opt.backup = cmd.backup;
    opt.dry_run = cmd.dry_run;
    opt.preview = cmd.preview || cmd.html_report.has_value();
    // Без места назначения результат идёт в stdout (кроме --preview)
    const bool to_stdout =
        !cmd.output.has_value() && !cmd.inplace && !cmd.dry_run && !cmd.preview;
    opt.keep_content = to_stdout;
    opt.should_cancel = platform::interrupt_requested;

    auto backend = batch::make_backend(batch::parse_backend(cmd.engine),
                                       static_cast<std::size_t>(global.num_threads), jobs.size());
    writer.info("Redacting " + std::to_string(jobs.size()) + " file(s) with the " +
                backend->name() + " engine");

    trace::TraceAggregator traces;
    auto reports = backend->run(jobs, opt, traces);

    // Отчёты в порядке файлов
    std::size_t failed = 0;
    bool cancelled = false;
    for (const auto& report : reports) {
        const std::string name = platform::path_to_utf8(report.input);
        if (report.cancelled) {
            cancelled = true;
            continue;
        }
        if (!report.ok) {
            ++failed;
            if (cmd.skip_errors) {
                writer.warn(report.error);
            } else {
                writer.error(report.error);
            }
            continue;
        }

        for (const auto& note : report.notes) {
            writer.warn(format_note(note));
        }
        if (to_stdout) {
            writer.write(output::Stream::Stdout, report.content);
        }
        if (cmd.preview && !report.previews.empty()) {
            writer.info(name);
            for (const auto& p : report.previews) {
                writer.preview_pair(p.before, p.after);
            }
        }
        if (report.written.has_value()) {
            writer.debug(name + " -> " + platform::path_to_utf8(*report.written) + " (" +
                         std::to_string(report.redactions) + " redaction(s))");
        }
    }

    if (cmd.stats) {
        print_stats(traces.stats(), reports.size() - failed, writer);
    }
    if (cancelled) {
        writer.error("interrupted, unfinished files were not written");
        return 1;
    }
    if (!export_trace(cmd, traces, writer)) {
        return 1;
    }
    if (cmd.html_report.has_value() && !write_html_report(*cmd.html_report, reports, writer)) {
        return 1;
    }
    if (failed > 0 && !cmd.skip_errors) {
        return 1;
    }

    writer.info("Done, " + std::to_string(traces.size()) + " redaction(s) in " +
                std::to_string(reports.size() - failed) + " file(s)");
    return 0;
}

// ----------------------------------------------------------------------------
// lint
// ----------------------------------------------------------------------------

int run_lint(const logveil::cli::LintCommand& cmd, logveil::output::Writer& writer) {
    using namespace logveil;

    auto loaded = profile::load_file(cmd.path);
    if (!loaded.ok) {
        writer.error(loaded.error.format());
        return 1;
    }

    const auto& p = *loaded.profile;
    writer.info("Validated profile '" + p.name() + "': " + std::to_string(p.rules().size()) +
                " pattern rule(s), entropy " + format_entropy(p.entropy()) + ", " +
                std::to_string(p.key_paths().size()) + " key path(s)");
    for (const auto& r : p.rules().rules()) {
        writer.debug(r.name + ": " + r.pattern);
    }
    return 0;
}

// ----------------------------------------------------------------------------
// profiles
// ----------------------------------------------------------------------------

int run_profiles(const logveil::cli::ProfilesCommand& cmd, logveil::output::Writer& writer) {
    using namespace logveil;

    auto registry = build_registry(cmd.profiles_dir, {}, writer);

    output::Table table;
    table.set_headers({"Name", "Format", "Patterns", "Entropy", "Key paths", "Description"});
    for (const auto& p : registry.profiles()) {
        table.add_row({p->name(), profile::to_string(p->format()),
                       std::to_string(p->rules().size()), format_entropy(p->entropy()),
                       std::to_string(p->key_paths().size()), p->description()});
    }
    table.print(writer);
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace logveil;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // Диагностика парсера выводится как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                std::string help_text = cli::render_help(cmd.command);
                if (help_text.rfind("error:", 0) == 0) {
                    writer.write(output::Stream::Stderr, help_text);
                    return 2;
                }
                writer.write(output::Stream::Stdout, help_text);
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::RedactCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_redact(cmd, parse_result.global, writer);
            } else if constexpr (std::is_same_v<T, cli::LintCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_lint(cmd, writer);
            } else {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_profiles(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Перехват исключений на границе приложения
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
