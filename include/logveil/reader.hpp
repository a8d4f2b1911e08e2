// ==============================================================================
// logveil/reader.hpp - Reader Framework
// ==============================================================================
//
// Назначение:
// - DocumentKind: как обрабатывается входной файл
// - Record: строка журнала или целый документ
// - Reader: итерация по записям файла или потока
//
// Text и Jsonl читаются построчно (поток, без загрузки файла целиком);
// Json и Yaml читаются целиком одной записью. Окончание строки ("\n",
// "\r\n" или пусто для последней строки) сохраняется отдельно от текста,
// чтобы выход повторял исходные переводы строк.
//
// ==============================================================================

#ifndef LOGVEIL_READER_HPP
#define LOGVEIL_READER_HPP

#include "logveil/profile.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logveil::io {

// ----------------------------------------------------------------------------
// DocumentKind
// ----------------------------------------------------------------------------

enum class DocumentKind {
    Text,   // построчно, свободный текст
    Json,   // один JSON документ (.json)
    Jsonl,  // JSON объект на строку (.jsonl, .ndjson)
    Yaml    // один YAML документ (.yaml, .yml)
};

const char* document_kind_to_string(DocumentKind kind);

/// @throws std::invalid_argument для неизвестного вида
DocumentKind parse_document_kind(std::string_view s);

/// Вид по расширению без точки; nullopt, если расширение не распознано
std::optional<DocumentKind> document_kind_from_extension(std::string_view ext);

/// Вид по пути: сначала расширение, затем формат профиля
/// (plaintext -> Text, json/jsonl -> Jsonl, yaml -> Yaml)
DocumentKind document_kind_from_path(const std::filesystem::path& path,
                                     profile::FormatHint hint = profile::FormatHint::Plaintext);

// ----------------------------------------------------------------------------
// Record
// ----------------------------------------------------------------------------

struct Record {
    std::string text;
    std::string ending;                // "\n", "\r\n", "\r" или ""
    std::optional<std::size_t> line;   // 1-based; nullopt для целого документа
};

/// Строка внутри буфера (для построчного отката структурных документов)
struct Line {
    std::string_view text;
    std::string_view ending;
};

/// Разбить буфер на строки; последняя строка без перевода имеет пустой ending
std::vector<Line> split_lines(std::string_view data);

// ----------------------------------------------------------------------------
// ReaderError
// ----------------------------------------------------------------------------

enum class ReaderErrorKind {
    FileNotFound,
    PermissionDenied,
    IoError,
};

struct ReaderError {
    ReaderErrorKind kind = ReaderErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to read file '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Reader
// ----------------------------------------------------------------------------

struct ReaderResult {
    bool ok = false;
    std::unique_ptr<class Reader> reader;
    ReaderError error;

    explicit operator bool() const { return ok; }
};

/// Итерация по записям источника.
///
/// @code
///   auto result = Reader::open(path, DocumentKind::Text);
///   if (!result) {
///       return result.error.format();
///   }
///   Record rec;
///   while (result.reader->next(rec)) {
///       ...
///   }
///   if (result.reader->last_error()) { ... }
/// @endcode
class Reader {
public:
    virtual ~Reader() = default;

    /// Открыть файл
    static ReaderResult open(const std::filesystem::path& file, DocumentKind kind);

    /// Построчное чтение из внешнего потока (stdin); поток должен пережить Reader
    static std::unique_ptr<Reader> from_stream(std::istream& in, std::string source);

    /// Следующая запись; false при конце данных или ошибке
    virtual bool next(Record& out) = 0;

    virtual DocumentKind kind() const = 0;

    /// Ошибка чтения, прервавшая итерацию (nullptr если её не было)
    const ReaderError* last_error() const { return error_ ? &*error_ : nullptr; }

protected:
    std::optional<ReaderError> error_;
};

/// Прочитать файл целиком
/// @throws std::runtime_error при ошибке открытия или чтения
std::string read_file(const std::filesystem::path& path);

}  // namespace logveil::io

#endif  // LOGVEIL_READER_HPP
