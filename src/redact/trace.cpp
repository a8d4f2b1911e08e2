// ==============================================================================
// trace.cpp - Redaction Trace и экспорт
// ==============================================================================

#include "logveil/trace.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <tuple>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace logveil::trace {

namespace {

template <typename W>
void write_string(W& w, const std::string& s) {
    w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

/// Один объект трассы; набор полей одинаков для JSON и JSONL
template <typename W>
void write_trace(W& w, const RedactionTrace& t) {
    w.StartObject();
    w.Key("source");
    write_string(w, t.source);
    w.Key("line");
    if (t.line.has_value()) {
        w.Uint64(static_cast<std::uint64_t>(*t.line));
    } else {
        w.Null();
    }
    w.Key("path");
    if (t.path.has_value()) {
        write_string(w, *t.path);
    } else {
        w.Null();
    }
    w.Key("original_value");
    write_string(w, t.original);
    w.Key("redacted_value");
    write_string(w, t.redacted);
    w.Key("rule");
    write_string(w, t.rule);
    w.Key("reason");
    w.String(to_string(t.reason));
    if (t.entropy.has_value()) {
        // 4 знака после запятой: стабильный текст экспорта
        w.Key("entropy");
        w.Double(std::round(*t.entropy * 10000.0) / 10000.0);
    }
    w.EndObject();
}

bool trace_less(const RedactionTrace& a, const RedactionTrace& b) {
    // nullopt < любое значение: структурные трассы файла идут первыми
    return std::tie(a.source, a.line, a.sequence) < std::tie(b.source, b.line, b.sequence);
}

}  // namespace

const char* to_string(Reason reason) {
    switch (reason) {
    case Reason::Pattern:
        return "pattern";
    case Reason::Entropy:
        return "entropy";
    case Reason::KeyPath:
        return "key_path";
    }
    return "pattern";
}

ExportFormat parse_export_format(std::string_view s) {
    if (s == "json") {
        return ExportFormat::Json;
    }
    if (s == "jsonl") {
        return ExportFormat::Jsonl;
    }
    throw std::invalid_argument("unknown trace format '" + std::string(s) +
                                "', must be: json or jsonl");
}

void tally(Stats& stats, const RedactionTrace& trace) {
    ++stats.total;
    switch (trace.reason) {
    case Reason::Pattern:
        ++stats.pattern;
        break;
    case Reason::Entropy:
        ++stats.entropy;
        break;
    case Reason::KeyPath:
        ++stats.key_path;
        break;
    }
    ++stats.by_rule[trace.rule];
}

void sort_traces(std::vector<RedactionTrace>& traces) {
    std::stable_sort(traces.begin(), traces.end(), trace_less);
}

std::string to_json(const std::vector<RedactionTrace>& traces) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    writer.StartArray();
    for (const auto& t : traces) {
        write_trace(writer, t);
    }
    writer.EndArray();
    std::string out(buffer.GetString(), buffer.GetSize());
    out += '\n';
    return out;
}

std::string to_jsonl(const std::vector<RedactionTrace>& traces) {
    std::string out;
    for (const auto& t : traces) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write_trace(writer, t);
        out.append(buffer.GetString(), buffer.GetSize());
        out += '\n';
    }
    return out;
}

// ----------------------------------------------------------------------------
// TraceAggregator
// ----------------------------------------------------------------------------

void TraceAggregator::append(std::vector<RedactionTrace> traces, std::vector<Note> notes) {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.insert(traces_.end(), std::make_move_iterator(traces.begin()),
                   std::make_move_iterator(traces.end()));
    notes_.insert(notes_.end(), std::make_move_iterator(notes.begin()),
                  std::make_move_iterator(notes.end()));
}

std::vector<RedactionTrace> TraceAggregator::ordered() const {
    std::vector<RedactionTrace> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = traces_;
    }
    sort_traces(copy);
    return copy;
}

std::vector<Note> TraceAggregator::notes() const {
    std::vector<Note> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = notes_;
    }
    std::stable_sort(copy.begin(), copy.end(), [](const Note& a, const Note& b) {
        return std::tie(a.source, a.line) < std::tie(b.source, b.line);
    });
    return copy;
}

Stats TraceAggregator::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s;
    s.notes = notes_.size();
    for (const auto& t : traces_) {
        tally(s, t);
    }
    return s;
}

std::size_t TraceAggregator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_.size();
}

std::string TraceAggregator::render(ExportFormat format) const {
    auto traces = ordered();
    return format == ExportFormat::Json ? to_json(traces) : to_jsonl(traces);
}

bool TraceAggregator::write_file(const std::filesystem::path& path, ExportFormat format,
                                 std::string* error) const {
    std::string body = render(format);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        if (error != nullptr) {
            *error = "failed to open trace file " + path.string() + ": " + std::strerror(errno);
        }
        return false;
    }
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.flush();
    if (!out) {
        if (error != nullptr) {
            *error = "failed to write trace file " + path.string();
        }
        return false;
    }
    return true;
}

}  // namespace logveil::trace
