// ==============================================================================
// keypath.cpp - Structured-Path Redactor
// ==============================================================================

#include "logveil/keypath.hpp"

#include "logveil/rule.hpp"

#include <stdexcept>

namespace logveil::keypath {

namespace {

/// Первое правило, совпавшее с путём (порядок списка = приоритет)
const KeyPathRule* first_match(const std::vector<KeyPathRule>& rules,
                               const std::vector<std::string>& keys) {
    for (const auto& rule : rules) {
        if (path_matches(rule.segments, keys)) {
            return &rule;
        }
    }
    return nullptr;
}

std::string render(const Value& v) {
    return v.is_scalar() ? scalar_text(v) : to_json_string(v);
}

/// Применить действие к полю obj[index]; true, если поле удалено
bool apply(const KeyPathRule& rule, ValueObject& obj, std::size_t index, const std::string& path,
           std::vector<Hit>& hits, const HitVisitor& on_hit) {
    const std::size_t before = hits.size();
    bool erased = false;
    Value& child = obj[index].second;

    switch (rule.action) {
    case Action::Redact: {
        std::string marker = rule.marker();
        const auto* s = child.get_string();
        if (s != nullptr && *s == marker) {
            break;
        }
        hits.push_back(Hit{path, rule.path, rule.action, render(child), marker});
        child = Value(std::move(marker));
        break;
    }
    case Action::Mask: {
        std::string original = render(child);
        std::string masked = mask_value(original);
        if (child.is_string() && masked == original) {
            break;
        }
        hits.push_back(Hit{path, rule.path, rule.action, std::move(original), masked});
        child = Value(std::move(masked));
        break;
    }
    case Action::Remove:
        hits.push_back(Hit{path, rule.path, rule.action, render(child), REMOVED_MARKER});
        obj.erase(obj.begin() + static_cast<std::ptrdiff_t>(index));
        erased = true;
        break;
    }

    if (on_hit && hits.size() > before) {
        on_hit(hits.back());
    }
    return erased;
}

void walk(Value& node, std::vector<std::string>& keys, const std::string& path,
          const std::vector<KeyPathRule>& rules, const LeafVisitor& on_text,
          const HitVisitor& on_hit, std::vector<Hit>& hits) {
    if (node.is_object()) {
        ValueObject& obj = node.as_object_mut();
        std::size_t i = 0;
        while (i < obj.size()) {
            keys.push_back(obj[i].first);
            std::string child_path = join_path(path, obj[i].first);

            bool erased = false;
            if (const KeyPathRule* rule = first_match(rules, keys)) {
                erased = apply(*rule, obj, i, child_path, hits, on_hit);
            } else {
                walk(obj[i].second, keys, child_path, rules, on_text, on_hit, hits);
            }

            keys.pop_back();
            if (!erased) {
                ++i;
            }
        }
        return;
    }

    if (node.is_array()) {
        ValueArray& arr = node.as_array_mut();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            // Индекс виден в пути трассы, но не в ключах для сопоставления
            walk(arr[i], keys, path + "[" + std::to_string(i) + "]", rules, on_text, on_hit,
                 hits);
        }
        return;
    }

    if (on_text) {
        if (const auto* s = node.get_string()) {
            auto replaced = on_text(path.empty() ? std::string("$") : path, *s);
            if (replaced.has_value()) {
                node = Value(std::move(*replaced));
            }
        }
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Action
// ----------------------------------------------------------------------------

Action parse_action(std::string_view s) {
    if (s == "redact") {
        return Action::Redact;
    }
    if (s == "mask") {
        return Action::Mask;
    }
    if (s == "remove") {
        return Action::Remove;
    }
    throw std::invalid_argument("unknown key path action '" + std::string(s) +
                                "', must be: redact, mask or remove");
}

const char* to_string(Action action) {
    switch (action) {
    case Action::Redact:
        return "redact";
    case Action::Mask:
        return "mask";
    case Action::Remove:
        return "remove";
    }
    return "redact";
}

// ----------------------------------------------------------------------------
// KeyPathRule
// ----------------------------------------------------------------------------

std::string KeyPathRule::marker() const {
    if (replacement.has_value()) {
        return *replacement;
    }
    if (segments.empty() || segments.back() == "*") {
        return "[REDACTED]";
    }
    return rule::default_replacement(segments.back());
}

std::vector<std::string> split_path(std::string_view path) {
    if (path.empty()) {
        throw std::invalid_argument("key path must not be empty");
    }
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        std::size_t dot = path.find('.', start);
        std::string_view segment = path.substr(
            start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (segment.empty()) {
            throw std::invalid_argument("key path '" + std::string(path) +
                                        "' contains an empty segment");
        }
        segments.emplace_back(segment);
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return segments;
}

KeyPathRule make_rule(std::string path, Action action, std::optional<std::string> replacement) {
    KeyPathRule rule;
    rule.segments = split_path(path);
    rule.path = std::move(path);
    rule.action = action;
    rule.replacement = std::move(replacement);
    return rule;
}

bool path_matches(const std::vector<std::string>& pattern, const std::vector<std::string>& keys) {
    if (pattern.size() != keys.size()) {
        return false;
    }
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != "*" && pattern[i] != keys[i]) {
            return false;
        }
    }
    return true;
}

std::string mask_value(std::string_view value) {
    // Границы символов UTF-8: маска не разрезает многобайтовые символы
    std::vector<std::size_t> starts;
    for (std::size_t i = 0; i < value.size(); ++i) {
        if ((static_cast<unsigned char>(value[i]) & 0xC0) != 0x80) {
            starts.push_back(i);
        }
    }
    const std::size_t n = starts.size();
    auto prefix = [&](std::size_t chars) {
        return value.substr(0, chars < n ? starts[chars] : value.size());
    };
    auto suffix = [&](std::size_t chars) { return value.substr(starts[n - chars]); };

    if (n <= 2) {
        return std::string(n, '*');
    }
    std::size_t keep = n <= 4 ? 1 : 2;
    std::string out(prefix(keep));
    out.append(n - 2 * keep, '*');
    out.append(suffix(keep));
    return out;
}

// ----------------------------------------------------------------------------
// Обход
// ----------------------------------------------------------------------------

std::string join_path(const std::string& parent, std::string_view key) {
    if (parent.empty()) {
        return std::string(key);
    }
    std::string out = parent;
    out += '.';
    out.append(key);
    return out;
}

std::vector<Hit> redact_tree(Value& root, const std::vector<KeyPathRule>& rules,
                             const LeafVisitor& on_text, const HitVisitor& on_hit) {
    std::vector<Hit> hits;
    std::vector<std::string> keys;
    walk(root, keys, std::string(), rules, on_text, on_hit, hits);
    return hits;
}

}  // namespace logveil::keypath
