// ==============================================================================
// logveil/batch.hpp - Batch Processor
// ==============================================================================
//
// Назначение:
// - Обработка одного файла: чтение, санитизация, атомарная запись результата
// - Бэкенды пакетной обработки: последовательный и пул потоков
// - Потоковый режим (stdin) с горячей перезагрузкой профиля
//
// Публикация результата:
// - Выход пишется во временный файл рядом с целью и переименовывается
//   на место только после последней строки
// - При ошибке или отмене временный файл удаляется: частичный результат
//   никогда не виден
// - Трассы файла попадают в TraceAggregator одним блоком после завершения
//
// Оба бэкенда дают одинаковые выходные файлы и одинаковый экспорт трасс.
//
// ==============================================================================

#ifndef LOGVEIL_BATCH_HPP
#define LOGVEIL_BATCH_HPP

#include "logveil/engine.hpp"
#include "logveil/profile.hpp"
#include "logveil/reader.hpp"
#include "logveil/trace.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace logveil::batch {

// ----------------------------------------------------------------------------
// Задание и параметры
// ----------------------------------------------------------------------------

enum class BackendKind { Auto, Sequential, Parallel };

/// @throws std::invalid_argument для неизвестного бэкенда
BackendKind parse_backend(std::string_view s);

const char* to_string(BackendKind kind);

struct FileJob {
    std::filesystem::path input;
    std::optional<std::filesystem::path> output;  // цель записи (без --inplace)
    io::DocumentKind kind = io::DocumentKind::Text;
    std::shared_ptr<const profile::Profile> profile;
};

struct Options {
    bool inplace = false;       // заменить исходный файл
    bool backup = false;        // перед заменой скопировать в <file>.bak
    bool dry_run = false;       // ничего не записывать
    bool keep_content = false;  // сохранить результат в FileReport::content
    bool preview = false;       // собрать пары до/после для изменённых строк

    /// Проверяется между записями; true прерывает файл
    std::function<bool()> should_cancel;
};

/// Изменённая запись для --preview
struct Preview {
    std::optional<std::size_t> line;
    std::string before;
    std::string after;
};

struct FileReport {
    std::filesystem::path input;
    std::optional<std::filesystem::path> written;
    bool ok = false;
    bool cancelled = false;
    std::string error;

    std::string content;  // при Options::keep_content
    std::size_t records = 0;
    std::size_t changed_records = 0;
    std::size_t redactions = 0;
    std::vector<Preview> previews;
    std::vector<trace::Note> notes;
};

/// Обработать один файл. Исключения не выходят наружу: ошибка в FileReport::error.
FileReport process_file(const FileJob& job, const Options& opt, trace::TraceAggregator& traces);

// ----------------------------------------------------------------------------
// Backend
// ----------------------------------------------------------------------------

class Backend {
public:
    virtual ~Backend() = default;

    virtual const char* name() const = 0;

    /// Обработать задания; отчёты возвращаются в порядке заданий
    virtual std::vector<FileReport> run(const std::vector<FileJob>& jobs, const Options& opt,
                                        trace::TraceAggregator& traces) = 0;
};

class SequentialBackend : public Backend {
public:
    const char* name() const override { return "sequential"; }

    std::vector<FileReport> run(const std::vector<FileJob>& jobs, const Options& opt,
                                trace::TraceAggregator& traces) override;
};

/// Потоки забирают файлы целиком из общего атомарного индекса
class ThreadPoolBackend : public Backend {
public:
    /// threads == 0: по числу аппаратных потоков
    explicit ThreadPoolBackend(std::size_t threads);

    const char* name() const override { return "parallel"; }

    std::size_t threads() const { return threads_; }

    std::vector<FileReport> run(const std::vector<FileJob>& jobs, const Options& opt,
                                trace::TraceAggregator& traces) override;

private:
    std::size_t threads_;
};

/// Auto: пул потоков при нескольких файлах и threads != 1, иначе последовательно
std::unique_ptr<Backend> make_backend(BackendKind kind, std::size_t threads,
                                      std::size_t job_count);

// ----------------------------------------------------------------------------
// Потоковый режим
// ----------------------------------------------------------------------------

struct StreamOptions {
    std::string source = "<stdin>";

    /// Запрошена ли перезагрузка (проверяется перед каждой строкой)
    std::function<bool()> should_reload;

    /// Загрузить новый профиль
    std::function<profile::LoadResult()> reload;

    /// Уведомления о перезагрузке
    std::function<void(const profile::Profile&)> on_reloaded;
    std::function<void(const profile::Error&)> on_reload_failed;

    std::function<bool()> should_cancel;

    /// Примечание к строке, сразу после записи этой строки
    std::function<void(const trace::Note&)> on_note;
};

struct StreamStats {
    std::size_t lines = 0;
    std::size_t changed_lines = 0;
    std::size_t redactions = 0;
    std::size_t reloads = 0;
    std::size_t failed_reloads = 0;
    bool cancelled = false;

    /// Сводка по правилам; растёт с числом правил, а не строк
    trace::Stats summary;
};

/// Санитизировать поток построчно; каждая строка пишется и сбрасывается сразу.
/// Неудачная перезагрузка оставляет активным прежний профиль.
/// Трассы сохраняются только при traces != nullptr: поток может быть бесконечным.
/// Примечания не накапливаются, а отдаются через opt.on_note.
/// @throws std::runtime_error при ошибке чтения или записи
StreamStats redact_stream(std::istream& in, std::ostream& out, engine::ProfileStore& store,
                          const StreamOptions& opt, trace::TraceAggregator* traces = nullptr);

}  // namespace logveil::batch

#endif  // LOGVEIL_BATCH_HPP
