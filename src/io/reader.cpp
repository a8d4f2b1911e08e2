// ==============================================================================
// reader.cpp - Reader Framework
// ==============================================================================

#include "logveil/reader.hpp"

#include "logveil/platform.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace logveil::io {

namespace fs = std::filesystem;

// ============================================================================
// DocumentKind
// ============================================================================

const char* document_kind_to_string(DocumentKind kind) {
    switch (kind) {
    case DocumentKind::Text:
        return "text";
    case DocumentKind::Json:
        return "json";
    case DocumentKind::Jsonl:
        return "jsonl";
    case DocumentKind::Yaml:
        return "yaml";
    }
    return "text";
}

DocumentKind parse_document_kind(std::string_view s) {
    if (s == "text" || s == "plaintext") {
        return DocumentKind::Text;
    }
    if (s == "json") {
        return DocumentKind::Json;
    }
    if (s == "jsonl") {
        return DocumentKind::Jsonl;
    }
    if (s == "yaml") {
        return DocumentKind::Yaml;
    }
    throw std::invalid_argument("unknown document kind '" + std::string(s) + "'");
}

std::optional<DocumentKind> document_kind_from_extension(std::string_view ext) {
    if (ext == "json") {
        return DocumentKind::Json;
    }
    if (ext == "jsonl" || ext == "ndjson") {
        return DocumentKind::Jsonl;
    }
    if (ext == "yaml" || ext == "yml") {
        return DocumentKind::Yaml;
    }
    if (ext == "log" || ext == "txt") {
        return DocumentKind::Text;
    }
    return std::nullopt;
}

DocumentKind document_kind_from_path(const fs::path& path, profile::FormatHint hint) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    if (auto kind = document_kind_from_extension(ext)) {
        // .log у JSON-профиля (docker) - это JSON Lines
        if (*kind != DocumentKind::Text || hint == profile::FormatHint::Plaintext) {
            return *kind;
        }
    }

    switch (hint) {
    case profile::FormatHint::Plaintext:
        return DocumentKind::Text;
    case profile::FormatHint::Json:
    case profile::FormatHint::Jsonl:
        return DocumentKind::Jsonl;
    case profile::FormatHint::Yaml:
        return DocumentKind::Yaml;
    }
    return DocumentKind::Text;
}

// ============================================================================
// Строки
// ============================================================================

std::vector<Line> split_lines(std::string_view data) {
    std::vector<Line> lines;
    std::size_t start = 0;
    while (start < data.size()) {
        std::size_t nl = data.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(Line{data.substr(start), std::string_view()});
            break;
        }
        std::size_t end = nl;
        if (end > start && data[end - 1] == '\r') {
            --end;
        }
        lines.push_back(Line{data.substr(start, end - start), data.substr(end, nl + 1 - end)});
        start = nl + 1;
    }
    return lines;
}

// ============================================================================
// ReaderError
// ============================================================================

std::string ReaderError::format() const {
    return "failed to read file '" + path + "' - " + message;
}

namespace {

ReaderError open_error(const fs::path& path) {
    int err = errno;
    ReaderErrorKind kind = ReaderErrorKind::IoError;
    if (err == ENOENT) {
        kind = ReaderErrorKind::FileNotFound;
    } else if (err == EACCES || err == EPERM) {
        kind = ReaderErrorKind::PermissionDenied;
    }
    std::string message = err != 0 ? std::strerror(err) : "could not open file";
    return ReaderError{kind, message, platform::path_to_utf8(path)};
}

// ============================================================================
// LineReader - построчное чтение (Text, Jsonl)
// ============================================================================

class LineReader : public Reader {
public:
    LineReader(std::istream& in, std::string source, DocumentKind kind)
        : in_(in), source_(std::move(source)), kind_(kind) {}

    bool next(Record& out) override {
        std::string text;
        if (!std::getline(in_, text)) {
            if (in_.bad()) {
                error_ = ReaderError{ReaderErrorKind::IoError, "read error", source_};
            }
            return false;
        }

        ++line_no_;
        std::string ending = in_.eof() ? "" : "\n";
        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
            ending.insert(ending.begin(), '\r');
        }

        out.text = std::move(text);
        out.ending = std::move(ending);
        out.line = line_no_;
        return true;
    }

    DocumentKind kind() const override { return kind_; }

private:
    std::istream& in_;
    std::string source_;
    DocumentKind kind_;
    std::size_t line_no_ = 0;
};

/// Файловый вариант: владеет std::ifstream
class FileLineReader : public LineReader {
public:
    FileLineReader(std::unique_ptr<std::ifstream> file, std::string source, DocumentKind kind)
        : LineReader(*file, std::move(source), kind), file_(std::move(file)) {}

private:
    std::unique_ptr<std::ifstream> file_;
};

// ============================================================================
// DocumentReader - документ целиком (Json, Yaml)
// ============================================================================

class DocumentReader : public Reader {
public:
    DocumentReader(std::string content, DocumentKind kind)
        : content_(std::move(content)), kind_(kind) {}

    bool next(Record& out) override {
        if (consumed_) {
            return false;
        }
        consumed_ = true;
        out.text = std::move(content_);
        out.ending.clear();
        out.line.reset();
        return true;
    }

    DocumentKind kind() const override { return kind_; }

private:
    std::string content_;
    DocumentKind kind_;
    bool consumed_ = false;
};

}  // namespace

// ============================================================================
// Reader
// ============================================================================

ReaderResult Reader::open(const fs::path& file, DocumentKind kind) {
    ReaderResult result;
    std::string source = platform::path_to_utf8(file);

    std::error_code ec;
    if (fs::is_directory(file, ec)) {
        result.error = ReaderError{ReaderErrorKind::IoError, "is a directory", source};
        return result;
    }

    errno = 0;
    auto stream = std::make_unique<std::ifstream>(file, std::ios::binary);
    if (!stream->is_open()) {
        result.error = open_error(file);
        return result;
    }

    if (kind == DocumentKind::Json || kind == DocumentKind::Yaml) {
        std::ostringstream buffer;
        buffer << stream->rdbuf();
        if (stream->bad()) {
            result.error = ReaderError{ReaderErrorKind::IoError, "read error", source};
            return result;
        }
        result.reader = std::make_unique<DocumentReader>(buffer.str(), kind);
    } else {
        result.reader = std::make_unique<FileLineReader>(std::move(stream), source, kind);
    }
    result.ok = true;
    return result;
}

std::unique_ptr<Reader> Reader::from_stream(std::istream& in, std::string source) {
    return std::make_unique<LineReader>(in, std::move(source), DocumentKind::Text);
}

std::string read_file(const fs::path& path) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error(open_error(path).format());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("failed to read file '" + platform::path_to_utf8(path) +
                                 "' - read error");
    }
    return buffer.str();
}

}  // namespace logveil::io
