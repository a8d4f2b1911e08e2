// ==============================================================================
// engine.cpp - Redaction Engine
// ==============================================================================

#include "logveil/engine.hpp"

#include "logveil/entropy.hpp"
#include "logveil/keypath.hpp"
#include "logveil/reader.hpp"
#include "logveil/utf8.hpp"
#include "logveil/value.hpp"

#include <stdexcept>

namespace logveil::engine {

namespace {

void add_note(trace::SanitizedResult& out, const std::string& source,
              std::optional<std::size_t> line, const char* code, std::string message) {
    out.notes.push_back(trace::Note{source, line, code, std::move(message)});
}

/// Нормализовать UTF-8; при замене добавить заметку
std::string normalize(std::string_view text, const std::string& source,
                      std::optional<std::size_t> line, trace::SanitizedResult& out) {
    if (utf8::is_valid(text)) {
        return std::string(text);
    }
    auto decoded = utf8::sanitize(text);
    add_note(out, source, line, trace::NOTE_INVALID_UTF8,
             std::to_string(decoded.invalid) + " invalid UTF-8 sequence(s) replaced with U+FFFD");
    return std::move(decoded.text);
}

}  // namespace

// ============================================================================
// Engine
// ============================================================================

Engine::Engine(std::shared_ptr<const profile::Profile> profile) : profile_(std::move(profile)) {
    if (!profile_) {
        throw std::invalid_argument("engine requires a compiled profile");
    }
}

trace::SanitizedResult Engine::redact(const Unit& unit) const {
    switch (unit.kind) {
    case UnitKind::Line:
        return redact_line(unit.text, unit.source, unit.line);
    case UnitKind::Json:
    case UnitKind::Yaml:
        return redact_document(unit.text, unit.kind, unit.source, unit.line);
    }
    return redact_line(unit.text, unit.source, unit.line);
}

std::string Engine::redact_text(std::string_view text, const std::string& source,
                                std::optional<std::size_t> line,
                                const std::optional<std::string>& path,
                                trace::SanitizedResult& out) const {
    // 1. Pattern-правила в порядке профиля
    auto matched = profile_->rules().match_and_replace(text);
    for (auto& sub : matched.substitutions) {
        trace::RedactionTrace t;
        t.source = source;
        t.line = line;
        t.path = path;
        t.original = std::move(sub.original);
        t.redacted = std::move(sub.replacement);
        t.rule = std::move(sub.rule_id);
        t.reason = trace::Reason::Pattern;
        t.sequence = out.traces.size();
        out.traces.push_back(std::move(t));
    }

    // 2. Энтропия по тексту после правил: уже заменённое не оценивается повторно
    std::string current = std::move(matched.text);
    auto findings = entropy::scan(current, profile_->entropy());
    if (findings.empty()) {
        return current;
    }

    std::string result;
    result.reserve(current.size());
    std::size_t pos = 0;
    for (const auto& f : findings) {
        result.append(current, pos, f.offset - pos);
        result += entropy::SECRET_MARKER;

        trace::RedactionTrace t;
        t.source = source;
        t.line = line;
        t.path = path;
        t.original = current.substr(f.offset, f.length);
        t.redacted = entropy::SECRET_MARKER;
        t.rule = entropy::RULE_TAG;
        t.reason = trace::Reason::Entropy;
        t.entropy = f.score;
        t.sequence = out.traces.size();
        out.traces.push_back(std::move(t));

        pos = f.offset + f.length;
    }
    result.append(current, pos, std::string::npos);
    return result;
}

trace::SanitizedResult Engine::redact_line(std::string_view line, const std::string& source,
                                           std::optional<std::size_t> line_no) const {
    trace::SanitizedResult out;
    std::string text = normalize(line, source, line_no, out);
    out.text = redact_text(text, source, line_no, std::nullopt, out);
    return out;
}

trace::SanitizedResult Engine::redact_lines(std::string_view text, const std::string& source) const {
    trace::SanitizedResult out;
    std::size_t line_no = 0;
    for (const auto& line : io::split_lines(text)) {
        auto part = redact_line(line.text, source, ++line_no);
        out.text += part.text;
        out.text.append(line.ending);
        for (auto& t : part.traces) {
            out.traces.push_back(std::move(t));
        }
        for (auto& n : part.notes) {
            out.notes.push_back(std::move(n));
        }
    }
    return out;
}

trace::SanitizedResult Engine::redact_document(std::string_view text, UnitKind kind,
                                               const std::string& source,
                                               std::optional<std::size_t> line) const {
    trace::SanitizedResult out;
    std::string normalized = normalize(text, source, line, out);

    ParseResult parsed =
        kind == UnitKind::Yaml ? parse_yaml(normalized) : parse_json(normalized);

    if (!parsed.ok) {
        const char* label = kind == UnitKind::Yaml ? "YAML" : "JSON";
        std::string message = std::string(label) + " parse failed (" + parsed.error +
                              "), redacting as plain text";

        trace::SanitizedResult fallback;
        if (line.has_value()) {
            fallback = redact_line(normalized, source, line);
        } else {
            fallback = redact_lines(normalized, source);
        }
        fallback.notes.insert(fallback.notes.begin(), out.notes.begin(), out.notes.end());
        add_note(fallback, source, line, trace::NOTE_STRUCTURED_PARSE_FAILED, std::move(message));
        return fallback;
    }

    Value& root = parsed.value;

    auto on_hit = [&](const keypath::Hit& hit) {
        trace::RedactionTrace t;
        t.source = source;
        t.line = line;
        t.path = hit.path;
        t.original = hit.original;
        t.redacted = hit.redacted;
        t.rule = hit.rule_path;
        t.reason = trace::Reason::KeyPath;
        t.sequence = out.traces.size();
        out.traces.push_back(std::move(t));
    };

    auto on_text = [&](const std::string& path,
                       const std::string& leaf) -> std::optional<std::string> {
        std::size_t before = out.traces.size();
        std::string redacted = redact_text(leaf, source, line, path, out);
        if (out.traces.size() == before) {
            return std::nullopt;
        }
        return redacted;
    };

    keypath::redact_tree(root, profile_->key_paths(), on_text, on_hit);

    if (!out.changed()) {
        // Без замен документ выводится байт в байт как был прочитан
        out.text = std::move(normalized);
        return out;
    }

    if (kind == UnitKind::Yaml) {
        out.text = to_yaml_string(root);
    } else {
        out.text = to_json_string(root, !line.has_value());
    }
    if (!line.has_value() && !normalized.empty() && normalized.back() == '\n' &&
        (out.text.empty() || out.text.back() != '\n')) {
        out.text += '\n';
    }
    return out;
}

// ============================================================================
// ProfileStore
// ============================================================================

ProfileStore::ProfileStore(std::shared_ptr<const profile::Profile> initial)
    : current_(std::move(initial)) {}

std::shared_ptr<const profile::Profile> ProfileStore::snapshot() const {
    return std::atomic_load(&current_);
}

void ProfileStore::publish(std::shared_ptr<const profile::Profile> next) {
    std::atomic_store(&current_, std::move(next));
    generation_.fetch_add(1);
}

}  // namespace logveil::engine
