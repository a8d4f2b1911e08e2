// ==============================================================================
// rule.cpp - Pattern Rule Set
// ==============================================================================
//
// std::regex (ECMAScript). Каждое правило компилируется один раз в build().
//
// ==============================================================================

#include "logveil/rule.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace logveil::rule {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/// Ссылка на группу в синтаксисе std::regex: всегда две цифры, чтобы
/// следующая за ссылкой литеральная цифра не стала частью номера
std::string group_ref(std::size_t n) {
    std::string ref = "$";
    if (n < 10) {
        ref += '0';
    }
    ref += std::to_string(n);
    return ref;
}

/// Прочитать 1-2 цифры начиная с pos; pos сдвигается за них
std::size_t read_group_number(std::string_view s, std::size_t& pos) {
    std::size_t n = static_cast<std::size_t>(s[pos] - '0');
    ++pos;
    if (pos < s.size() && is_digit(s[pos])) {
        n = n * 10 + static_cast<std::size_t>(s[pos] - '0');
        ++pos;
    }
    return n;
}

/// "(?i)" в начале шаблона: Python-совместимый флаг без учёта регистра
bool strip_inline_icase(std::string& pattern) {
    static constexpr std::string_view prefix = "(?i)";
    if (pattern.compare(0, prefix.size(), prefix) == 0) {
        pattern.erase(0, prefix.size());
        return true;
    }
    return false;
}

/// Символ слова в смысле \b для ECMAScript
bool is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || is_digit(c) || c == '_';
}

/// Продлить найденное совпадение до самого длинного с тем же началом.
/// Концы перебираются от конца строки к found[0].second; первый
/// полный regex_match на [start, stop) и есть самый длинный.
/// Для stop внутри строки $ не срабатывает, а \b на границе запрещён,
/// если stop разрезает слово.
std::smatch extend_to_longest(const std::regex& re, const std::string& text,
                              const std::smatch& found) {
    const auto start = found[0].first;
    auto base = std::regex_constants::match_default;
    if (start != text.cbegin()) {
        base |= std::regex_constants::match_prev_avail;
    }

    std::smatch longer;
    for (auto stop = text.cend(); stop != found[0].second; --stop) {
        auto flags = base;
        if (stop != text.cend()) {
            flags |= std::regex_constants::match_not_eol;
            if (is_word_char(*(stop - 1)) && is_word_char(*stop)) {
                flags |= std::regex_constants::match_not_eow;
            }
        }
        if (std::regex_match(start, stop, longer, re, flags)) {
            return longer;
        }
    }
    return found;
}

}  // namespace

// ----------------------------------------------------------------------------
// Шаблоны замены
// ----------------------------------------------------------------------------

std::string default_replacement(std::string_view name) {
    std::string out = "[REDACTED_";
    for (char c : name) {
        if (c == '-' || c == ' ' || c == '.') {
            out += '_';
        } else {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    out += ']';
    return out;
}

TemplateResult compile_replacement(std::string_view tmpl) {
    TemplateResult result;
    std::string& out = result.format;
    out.reserve(tmpl.size() + 8);

    auto whole_match_error = [&]() {
        result.error = "replacement template must not reproduce the whole match";
        return result;
    };

    std::size_t i = 0;
    while (i < tmpl.size()) {
        char c = tmpl[i];

        if (c == '\\' && i + 1 < tmpl.size()) {
            char next = tmpl[i + 1];
            if (is_digit(next)) {
                std::size_t pos = i + 1;
                std::size_t n = read_group_number(tmpl, pos);
                if (n == 0) {
                    return whole_match_error();
                }
                out += group_ref(n);
                result.max_group = std::max(result.max_group, n);
                i = pos;
                continue;
            }
            if (next == 'g' && i + 2 < tmpl.size() && tmpl[i + 2] == '<') {
                std::size_t close = tmpl.find('>', i + 3);
                std::string_view digits =
                    close == std::string_view::npos ? std::string_view{} : tmpl.substr(i + 3, close - i - 3);
                bool numeric = !digits.empty() && digits.size() <= 2;
                for (char d : digits) {
                    numeric = numeric && is_digit(d);
                }
                if (!numeric) {
                    result.error = "unsupported group reference in replacement template: " +
                                   std::string(tmpl.substr(i));
                    return result;
                }
                std::size_t pos = 0;
                std::size_t n = read_group_number(digits, pos);
                if (n == 0) {
                    return whole_match_error();
                }
                out += group_ref(n);
                result.max_group = std::max(result.max_group, n);
                i = close + 1;
                continue;
            }
            if (next == '\\') {
                out += '\\';
            } else if (next == 'n') {
                out += '\n';
            } else if (next == 't') {
                out += '\t';
            } else {
                out += '\\';
                out += next == '$' ? std::string("$$") : std::string(1, next);
            }
            i += 2;
            continue;
        }

        if (c == '$' && i + 1 < tmpl.size()) {
            char next = tmpl[i + 1];
            if (next == '$') {
                out += "$$";
                i += 2;
                continue;
            }
            if (next == '&' || next == '`' || next == '\'') {
                return whole_match_error();
            }
            if (is_digit(next)) {
                std::size_t pos = i + 1;
                std::size_t n = read_group_number(tmpl, pos);
                if (n == 0) {
                    return whole_match_error();
                }
                out += group_ref(n);
                result.max_group = std::max(result.max_group, n);
                i = pos;
                continue;
            }
            if (next == '{') {
                std::size_t close = tmpl.find('}', i + 2);
                std::string_view digits =
                    close == std::string_view::npos ? std::string_view{} : tmpl.substr(i + 2, close - i - 2);
                bool numeric = !digits.empty() && digits.size() <= 2;
                for (char d : digits) {
                    numeric = numeric && is_digit(d);
                }
                if (!numeric) {
                    result.error = "unsupported group reference in replacement template: " +
                                   std::string(tmpl.substr(i));
                    return result;
                }
                std::size_t pos = 0;
                std::size_t n = read_group_number(digits, pos);
                if (n == 0) {
                    return whole_match_error();
                }
                out += group_ref(n);
                result.max_group = std::max(result.max_group, n);
                i = close + 1;
                continue;
            }
        }

        if (c == '$') {
            out += "$$";
        } else {
            out += c;
        }
        ++i;
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// RuleSetBuilder
// ----------------------------------------------------------------------------

RuleSetBuilder& RuleSetBuilder::add(RuleDef def) {
    defs_.push_back(std::move(def));
    return *this;
}

RuleSetBuilder& RuleSetBuilder::rules(std::vector<RuleDef> defs) {
    for (auto& def : defs) {
        defs_.push_back(std::move(def));
    }
    return *this;
}

RuleSetBuilder::BuildResult RuleSetBuilder::build() const {
    BuildResult result;
    result.ok = false;

    std::unordered_set<std::string> seen;
    std::vector<PatternRule> compiled;
    compiled.reserve(defs_.size());

    for (std::size_t index = 0; index < defs_.size(); ++index) {
        const RuleDef& def = defs_[index];

        if (def.name.empty()) {
            result.error = "rule #" + std::to_string(index + 1) + " has no name";
            return result;
        }
        if (!seen.insert(def.name).second) {
            result.error = "duplicate rule name '" + def.name + "'";
            return result;
        }
        if (def.pattern.empty()) {
            result.error = "rule '" + def.name + "' has an empty pattern";
            return result;
        }

        PatternRule rule;
        rule.id = def.name;
        rule.pattern = def.pattern;
        rule.enabled = def.enabled;
        rule.priority = index;
        rule.description = def.description;

        std::string pattern = def.pattern;
        bool icase = strip_inline_icase(pattern) || def.ignore_case;
        try {
            std::regex::flag_type flags = std::regex::ECMAScript | std::regex::optimize;
            if (icase) {
                flags |= std::regex::icase;
            }
            rule.matcher = std::regex(pattern, flags);
        } catch (const std::regex_error& e) {
            result.error = "rule '" + def.name + "': invalid regex pattern '" + def.pattern +
                           "': " + e.what();
            return result;
        }

        rule.replacement = def.replacement.value_or(default_replacement(def.name));
        TemplateResult tmpl = compile_replacement(rule.replacement);
        if (!tmpl.ok) {
            result.error = "rule '" + def.name + "': " + tmpl.error;
            return result;
        }
        if (tmpl.max_group > rule.matcher.mark_count()) {
            result.error = "rule '" + def.name + "': replacement references group " +
                           std::to_string(tmpl.max_group) + " but the pattern has " +
                           std::to_string(rule.matcher.mark_count());
            return result;
        }
        rule.format = std::move(tmpl.format);

        compiled.push_back(std::move(rule));
    }

    result.rules.rules_ = std::move(compiled);
    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// RuleSet
// ----------------------------------------------------------------------------

std::size_t RuleSet::enabled_count() const {
    std::size_t n = 0;
    for (const auto& r : rules_) {
        if (r.enabled) {
            ++n;
        }
    }
    return n;
}

const PatternRule* RuleSet::find(std::string_view id) const {
    for (const auto& r : rules_) {
        if (r.id == id) {
            return &r;
        }
    }
    return nullptr;
}

MatchResult RuleSet::match_and_replace(std::string_view line) const {
    MatchResult result;
    result.text.assign(line.data(), line.size());

    for (const auto& rule : rules_) {
        if (!rule.enabled) {
            continue;
        }

        const std::string& current = result.text;
        auto it = current.cbegin();
        const auto end = current.cend();

        std::string out;
        bool changed = false;
        std::smatch m;
        // Пустые совпадения ничего не редактируют и запрещены
        auto flags = std::regex_constants::match_default | std::regex_constants::match_not_null;

        while (std::regex_search(it, end, m, rule.matcher, flags)) {
            // Из альтернатив с общим началом берётся самая длинная
            m = extend_to_longest(rule.matcher, current, m);
            out.append(it, m[0].first);

            std::string original = m.str(0);
            std::string replacement = m.format(rule.format);

            // Замена, совпадающая с оригиналом, ничего не меняет: без трассы.
            // Так повторный прогон по уже санитизированному тексту молчит.
            if (replacement != original) {
                result.substitutions.push_back(
                    Substitution{rule.id, std::move(original), replacement, out.size()});
                changed = true;
            }
            out += replacement;

            it = m[0].second;
            // Предыдущий символ доступен: \b и ^ учитывают его
            flags |= std::regex_constants::match_prev_avail;
        }

        if (changed) {
            out.append(it, end);
            result.text = std::move(out);
        }
    }

    return result;
}

// ----------------------------------------------------------------------------
// Встроенные категории
// ----------------------------------------------------------------------------
//
// Порядок значим: более специфичные правила раньше (JWT до общих токенов,
// SHA-256 до SHA-1 до MD5, номер карты до телефона).
//

std::vector<RuleDef> builtin_rules() {
    std::vector<RuleDef> defs;

    defs.push_back({"private_key", R"(-----BEGIN\s+(?:(?:RSA|EC|DSA|OPENSSH)\s+)?PRIVATE\s+KEY-----)",
                    std::nullopt, true, false, "PEM private key header"});
    defs.push_back({"jwt", R"(\beyJ[a-zA-Z0-9_-]+\.[a-zA-Z0-9_-]+\.[a-zA-Z0-9_-]+)",
                    std::nullopt, true, false, "JSON Web Token"});
    defs.push_back({"bearer_token", R"(\b(Bearer\s+)[A-Za-z0-9._~+/-]+=*)",
                    std::string("$1[REDACTED_BEARER_TOKEN]"), true, false,
                    "HTTP bearer token (keeps the scheme)"});
    defs.push_back({"aws_access_key", R"(\b(?:AKIA|ASIA)[0-9A-Z]{16}\b)", std::nullopt, true,
                    false, "AWS access key id"});
    defs.push_back({"password", R"(\b(password|passwd|pwd)([\s=:]+)[^\s&,;"']+)",
                    std::string("$1$2[REDACTED_PASSWORD]"), true, true,
                    "password assignments (keeps the key)"});
    defs.push_back({"email", R"(\b[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}\b)",
                    std::nullopt, true, false, "email address"});
    defs.push_back({"uuid",
                    R"(\b[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[1-5][0-9a-fA-F]{3}-[89abAB][0-9a-fA-F]{3}-[0-9a-fA-F]{12}\b)",
                    std::nullopt, true, false, "RFC 4122 UUID"});
    defs.push_back({"sha256", R"(\b[a-fA-F0-9]{64}\b)", std::nullopt, true, false,
                    "SHA-256 hex digest"});
    defs.push_back({"sha1", R"(\b[a-fA-F0-9]{40}\b)", std::nullopt, true, false,
                    "SHA-1 hex digest"});
    defs.push_back({"md5", R"(\b[a-fA-F0-9]{32}\b)", std::nullopt, true, false,
                    "MD5 hex digest"});
    defs.push_back({"credit_card",
                    R"(\b(?:4[0-9]{12}(?:[0-9]{3})?|5[1-5][0-9]{14}|3[47][0-9]{13}|3[0-9]{13}|6(?:011|5[0-9]{2})[0-9]{12})\b)",
                    std::nullopt, true, false, "Visa, MasterCard, Amex, Diners, Discover numbers"});
    defs.push_back({"ssn", R"(\b[0-9]{3}-[0-9]{2}-[0-9]{4}\b)", std::nullopt, true, false,
                    "US social security number"});
    defs.push_back({"ip_address", R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)",
                    std::string("[REDACTED_IP]"), true, false, "IPv4 address"});
    defs.push_back({"phone",
                    R"((?:\+?1[-.\s]?)?\(?\b[0-9]{3}\)?[-.\s]?[0-9]{3}[-.\s]?[0-9]{4}\b)",
                    std::nullopt, true, false, "North American phone number"});
    // Широкие шаблоны в конце: более узкие категории уже заменены маркерами
    defs.push_back({"api_key", R"(\b[a-zA-Z0-9]{32,}\b)", std::nullopt, true, false,
                    "generic API key (32+ alphanumerics)"});
    defs.push_back({"aws_secret_key", R"(\b[0-9a-zA-Z/+]{40}\b)", std::nullopt, true, false,
                    "AWS secret access key"});

    return defs;
}

}  // namespace logveil::rule
