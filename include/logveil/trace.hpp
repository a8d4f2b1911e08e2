// ==============================================================================
// logveil/trace.hpp - Redaction Trace и экспорт
// ==============================================================================
//
// Назначение:
// - Запись о каждой выполненной замене (RedactionTrace)
// - Диагностические заметки (Note): невалидный UTF-8, откат структурного разбора
// - Потокобезопасный сборщик трасс для пакетной обработки
// - Экспорт в JSON (массив) и JSONL (объект на строку) через RapidJSON
//
// Порядок экспорта: (source, line, порядок обнаружения). Он не зависит от
// порядка, в котором воркеры сдают результаты, поэтому экспорт побайтно
// совпадает для последовательного и параллельного бэкенда.
//
// ==============================================================================

#ifndef LOGVEIL_TRACE_HPP
#define LOGVEIL_TRACE_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logveil::trace {

// ----------------------------------------------------------------------------
// Причина замены
// ----------------------------------------------------------------------------

enum class Reason { Pattern, Entropy, KeyPath };

/// "pattern", "entropy", "key_path"
const char* to_string(Reason reason);

// ----------------------------------------------------------------------------
// RedactionTrace
// ----------------------------------------------------------------------------

struct RedactionTrace {
    std::string source;                 // имя файла или "<stdin>"
    std::optional<std::size_t> line;    // 1-based; нет для структурных документов
    std::optional<std::string> path;    // конкретный путь в документе
    std::string original;
    std::string redacted;
    std::string rule;                   // id правила, "entropy" или путь правила
    Reason reason = Reason::Pattern;
    std::optional<double> entropy;      // только для Reason::Entropy
    std::size_t sequence = 0;           // порядок обнаружения внутри единицы
};

/// Некритичное событие обработки
struct Note {
    std::string source;
    std::optional<std::size_t> line;
    std::string code;  // "invalid_utf8", "structured_parse_failed"
    std::string message;
};

constexpr const char* NOTE_INVALID_UTF8 = "invalid_utf8";
constexpr const char* NOTE_STRUCTURED_PARSE_FAILED = "structured_parse_failed";

/// Результат санитизации одной единицы (строки или документа)
struct SanitizedResult {
    std::string text;
    std::vector<RedactionTrace> traces;
    std::vector<Note> notes;

    bool changed() const { return !traces.empty(); }
};

// ----------------------------------------------------------------------------
// Экспорт
// ----------------------------------------------------------------------------

enum class ExportFormat { Json, Jsonl };

/// @throws std::invalid_argument для неизвестного формата
ExportFormat parse_export_format(std::string_view s);

/// Сводка по трассам
struct Stats {
    std::size_t total = 0;
    std::size_t pattern = 0;
    std::size_t entropy = 0;
    std::size_t key_path = 0;
    std::size_t notes = 0;
    std::map<std::string, std::size_t> by_rule;
};

/// Учесть одну трассу в сводке
void tally(Stats& stats, const RedactionTrace& trace);

/// Упорядочить трассы по (source, line, sequence); line без значения идёт первой
void sort_traces(std::vector<RedactionTrace>& traces);

std::string to_json(const std::vector<RedactionTrace>& traces);
std::string to_jsonl(const std::vector<RedactionTrace>& traces);

// ----------------------------------------------------------------------------
// TraceAggregator
// ----------------------------------------------------------------------------

/// Сборщик трасс от нескольких воркеров.
/// append() вызывается целым блоком для завершённого файла.
class TraceAggregator {
public:
    TraceAggregator() = default;

    TraceAggregator(const TraceAggregator&) = delete;
    TraceAggregator& operator=(const TraceAggregator&) = delete;

    void append(std::vector<RedactionTrace> traces, std::vector<Note> notes = {});

    /// Копия трасс в порядке экспорта
    std::vector<RedactionTrace> ordered() const;

    std::vector<Note> notes() const;

    Stats stats() const;

    std::size_t size() const;

    std::string render(ExportFormat format) const;

    /// Записать экспорт в файл; при ошибке false и текст в error
    bool write_file(const std::filesystem::path& path, ExportFormat format,
                    std::string* error) const;

private:
    mutable std::mutex mutex_;
    std::vector<RedactionTrace> traces_;
    std::vector<Note> notes_;
};

}  // namespace logveil::trace

#endif  // LOGVEIL_TRACE_HPP
