// ==============================================================================
// logveil/keypath.hpp - Structured-Path Redactor
// ==============================================================================
//
// Назначение:
// - Правила по точечным путям в структурированном документе
// - Обход дерева Value и замена значений по совпавшим путям
// - Передача прочих строковых листьев вызывающему коду (свободный текст)
//
// Сопоставление:
// - Путь = ключи объектов от корня, соединённые точкой
// - Индексы массивов в сопоставлении не участвуют: правило "users.email"
//   действует на каждый элемент массива users
// - Сегмент "*" совпадает ровно с одним ключом любого имени
// - Сопоставление только по пути, содержимое значения не анализируется
//
// Совпавший узел заменяется целиком и дальше не обходится.
//
// ==============================================================================

#ifndef LOGVEIL_KEYPATH_HPP
#define LOGVEIL_KEYPATH_HPP

#include "logveil/value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logveil::keypath {

// ----------------------------------------------------------------------------
// Действие над совпавшим значением
// ----------------------------------------------------------------------------

enum class Action {
    Redact,  // заменить маркером
    Mask,    // оставить края строки, середину закрыть '*'
    Remove   // удалить поле
};

/// @throws std::invalid_argument для неизвестного действия
Action parse_action(std::string_view s);

const char* to_string(Action action);

/// Значение, записываемое в трассу для удалённого поля
constexpr const char* REMOVED_MARKER = "[REMOVED]";

// ----------------------------------------------------------------------------
// KeyPathRule
// ----------------------------------------------------------------------------

struct KeyPathRule {
    std::string path;                        // "user.email"
    std::vector<std::string> segments;       // {"user", "email"}
    Action action = Action::Redact;
    std::optional<std::string> replacement;  // только для Redact

    /// Маркер для Redact: replacement или "[REDACTED_<ПОСЛЕДНИЙ СЕГМЕНТ>]"
    std::string marker() const;
};

/// Разбить путь на сегменты. Пустой сегмент (".a", "a..b", "a.") - ошибка.
/// @throws std::invalid_argument при некорректном пути
std::vector<std::string> split_path(std::string_view path);

/// Собрать правило с проверкой пути
/// @throws std::invalid_argument при некорректном пути
KeyPathRule make_rule(std::string path, Action action = Action::Redact,
                      std::optional<std::string> replacement = std::nullopt);

/// Совпадает ли последовательность ключей с шаблоном правила
bool path_matches(const std::vector<std::string>& pattern, const std::vector<std::string>& keys);

/// Маскирование: длина <= 2 - все '*'; <= 4 - первый и последний символ;
/// иначе первые два и последние два
std::string mask_value(std::string_view value);

// ----------------------------------------------------------------------------
// Обход дерева
// ----------------------------------------------------------------------------

/// Одно срабатывание правила пути
struct Hit {
    std::string path;       // конкретный путь с индексами: "users[1].email"
    std::string rule_path;  // путь из правила: "users.email"
    Action action = Action::Redact;
    std::string original;   // исходное значение (строка как есть, прочее как JSON)
    std::string redacted;   // новое значение или REMOVED_MARKER
};

/// Вызывается для строкового листа, не покрытого ни одним правилом.
/// Возвращает новый текст листа или nullopt, если лист не меняется.
using LeafVisitor =
    std::function<std::optional<std::string>(const std::string& path, const std::string& text)>;

/// Вызывается в момент срабатывания правила, в порядке обхода
using HitVisitor = std::function<void(const Hit& hit)>;

/// Обойти дерево, применить правила (первое совпавшее в порядке списка),
/// для прочих строковых листьев вызвать on_text.
/// Узел, уже содержащий результат действия, не меняется и не даёт Hit.
/// @return срабатывания в порядке обхода документа
std::vector<Hit> redact_tree(Value& root, const std::vector<KeyPathRule>& rules,
                             const LeafVisitor& on_text = nullptr,
                             const HitVisitor& on_hit = nullptr);

/// Конкретный путь для трасс: корень обозначается "$"
std::string join_path(const std::string& parent, std::string_view key);

}  // namespace logveil::keypath

#endif  // LOGVEIL_KEYPATH_HPP
