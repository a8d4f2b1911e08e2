// ==============================================================================
// logveil/rule.hpp - Pattern Rule Set
// ==============================================================================
//
// Назначение:
// - Описание правила (RuleDef) в том виде, в каком его даёт профиль
// - Компиляция правил в упорядоченный RuleSet (один раз, при загрузке профиля)
// - match_and_replace: применение правил к строке с трассой замен
//
// Политика приоритета:
// - Правила применяются строго в порядке профиля, каждое к ТЕКУЩЕМУ
//   состоянию строки: замены правила k видны правилу k+1
// - Внутри одного правила: один проход слева направо, все непересекающиеся
//   совпадения заменяются, сканирование продолжается сразу после конца
//   совпадения. Один проход гарантирует завершение при любом содержимом правила.
// - Отключённые правила не участвуют в сопоставлении
//
// Ошибки определения правила (некорректный regex, пустое или повторное имя,
// шаблон, воспроизводящий всё совпадение) обнаруживаются при build() и
// никогда не проявляются при обработке строки.
//
// ==============================================================================

#ifndef LOGVEIL_RULE_HPP
#define LOGVEIL_RULE_HPP

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace logveil::rule {

// ============================================================================
// RuleDef - декларативное описание правила
// ============================================================================

struct RuleDef {
    std::string name;                        // уникальный идентификатор
    std::string pattern;                     // ECMAScript regex
    std::optional<std::string> replacement;  // по умолчанию [REDACTED_<NAME>]
    bool enabled = true;
    bool ignore_case = false;
    std::string description;
};

// ============================================================================
// PatternRule - скомпилированное правило
// ============================================================================

struct PatternRule {
    std::string id;
    std::string pattern;       // исходный текст regex (для lint/listing)
    std::regex matcher;
    std::string replacement;   // исходный шаблон
    std::string format;        // шаблон в синтаксисе std::regex format ($1)
    bool enabled = true;
    std::size_t priority = 0;  // позиция в профиле; меньше = раньше
    std::string description;
};

/// Одна выполненная замена
struct Substitution {
    std::string rule_id;
    std::string original;     // совпавшая подстрока
    std::string replacement;  // вставленный текст
    std::size_t offset = 0;   // позиция вставки в строке после этого правила
};

struct MatchResult {
    std::string text;
    std::vector<Substitution> substitutions;  // в порядке обнаружения
};

// ============================================================================
// RuleSet
// ============================================================================

class RuleSet {
public:
    RuleSet() = default;

    /// Применить все включённые правила к строке
    MatchResult match_and_replace(std::string_view line) const;

    const std::vector<PatternRule>& rules() const { return rules_; }

    std::size_t size() const { return rules_.size(); }

    bool empty() const { return rules_.empty(); }

    /// Число включённых правил
    std::size_t enabled_count() const;

    /// Найти правило по идентификатору
    const PatternRule* find(std::string_view id) const;

private:
    friend class RuleSetBuilder;

    std::vector<PatternRule> rules_;
};

// ============================================================================
// RuleSetBuilder
// ============================================================================

class RuleSetBuilder {
public:
    static RuleSetBuilder create() { return RuleSetBuilder(); }

    /// Добавить правило в конец (самый низкий приоритет)
    RuleSetBuilder& add(RuleDef def);

    /// Добавить набор правил в заданном порядке
    RuleSetBuilder& rules(std::vector<RuleDef> defs);

    /// Собрать RuleSet
    /// @return Результат с RuleSet или ошибкой конфигурации
    struct BuildResult {
        bool ok = false;
        RuleSet rules;
        std::string error;
    };
    BuildResult build() const;

private:
    RuleSetBuilder() = default;

    std::vector<RuleDef> defs_;
};

// ============================================================================
// Вспомогательные функции
// ============================================================================

/// Маркер по умолчанию: "[REDACTED_<NAME>]", имя в верхнем регистре
std::string default_replacement(std::string_view name);

/// Преобразовать шаблон замены в синтаксис std::regex format.
/// Принимаются ссылки \1..\99, \g<N>, $1..$99 и ${N}; "\\" и "$$" дают
/// литеральные "\" и "$". Ссылки на всё совпадение ($&, $0, \0, \g<0>)
/// и на текст вокруг него ($`, $') отвергаются.
struct TemplateResult {
    bool ok = false;
    std::string format;
    std::size_t max_group = 0;  // наибольший номер группы в шаблоне
    std::string error;
};
TemplateResult compile_replacement(std::string_view tmpl);

/// Встроенные категории правил в порядке приоритета
std::vector<RuleDef> builtin_rules();

}  // namespace logveil::rule

#endif  // LOGVEIL_RULE_HPP
