// ==============================================================================
// logveil/value.hpp - Каноническая модель структурированного документа (Value)
// ==============================================================================
//
// Назначение:
// - Единое представление JSON и YAML документов для Structured-Path Redactor
// - Конверсия из/в RapidJSON Value
// - Конверсия из/в YAML (yaml-cpp)
// - Явная типизация чисел: UInt64 -> Int64 -> Double
//
// Object хранит ключи в порядке появления: сериализация санитизированного
// документа сохраняет исходный порядок полей, и вывод детерминирован.
//
// ==============================================================================

#ifndef LOGVEIL_VALUE_HPP
#define LOGVEIL_VALUE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace YAML {
class Node;
}  // namespace YAML

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace logveil {

// ----------------------------------------------------------------------------
// Value - каноническая модель документа
// ----------------------------------------------------------------------------

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта: пары ключ-значение в порядке вставки
using ValueObject = std::vector<std::pair<std::string, Value>>;

class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    // Копия Value глубокая: санитизация копии не должна менять оригинал
    Value(const Value& other);
    Value& operator=(const Value& other);
    Value(Value&&) noexcept = default;
    Value& operator=(Value&&) noexcept = default;
    ~Value() = default;

    static Value make_null() { return Value(); }
    static Value make_string(std::string v) { return Value(std::move(v)); }
    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    bool is_number() const { return is_int() || is_uint() || is_double(); }

    /// Скаляр = не массив и не объект
    bool is_scalar() const { return !is_array() && !is_object(); }

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    Array& as_array_mut() { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }
    Object& as_object_mut() { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const String* get_string() const { return std::get_if<String>(&data_); }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом
    // -------------------------------------------------------------------------

    void push_back(Value v) {
        if (auto* arr = get_array_mut()) {
            arr->push_back(std::move(v));
        }
    }

    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    const Value* at(std::size_t index) const {
        if (const auto* arr = get_array()) {
            if (index < arr->size()) {
                return &(*arr)[index];
            }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с объектом
    // -------------------------------------------------------------------------

    /// Установить поле: заменяет существующее значение на месте,
    /// новый ключ добавляется в конец
    void set(const std::string& key, Value v);

    /// Получить поле по ключу (nullptr если не найдено или не объект)
    const Value* get(std::string_view key) const;

    /// Получить изменяемое поле по ключу
    Value* get_mut(std::string_view key);

    /// Получить вложенное поле по пути "a.b.c"
    const Value* find_path(std::string_view dotted) const;

    bool has(std::string_view key) const { return get(key) != nullptr; }

    /// Удалить поле; возвращает true, если оно было
    bool erase(std::string_view key);

    std::size_t object_size() const {
        if (const auto* obj = get_object()) {
            return obj->size();
        }
        return 0;
    }

    // -------------------------------------------------------------------------
    // Сравнение (структурное; порядок ключей объекта значим)
    // -------------------------------------------------------------------------

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -------------------------------------------------------------------------
    // Конверсия RapidJSON
    // -------------------------------------------------------------------------

    /// Number -> UInt64 -> Int64 -> Double
    static Value from_rapidjson(const rapidjson::Value& json);

    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    rapidjson::Document to_rapidjson_document() const;

    // -------------------------------------------------------------------------
    // Конверсия YAML
    // -------------------------------------------------------------------------

    /// Скаляры в кавычках остаются строками; plain-скаляры распознаются как
    /// null (~, null, пусто), bool (true/false), целые и вещественные числа
    static Value from_yaml(const YAML::Node& node);

private:
    Array* get_array_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Object* get_object_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }
};

// ----------------------------------------------------------------------------
// Парсинг и сериализация
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    Value value;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать JSON текст (ровно один документ; хвостовые пробелы допустимы)
ParseResult parse_json(std::string_view text);

/// Разобрать YAML текст (ровно один документ)
ParseResult parse_yaml(std::string_view text);

/// Сериализовать в JSON: компактно или с отступом 2 пробела
std::string to_json_string(const Value& value, bool pretty = false);

/// Сериализовать в YAML (block style)
std::string to_yaml_string(const Value& value);

/// Строковое представление скаляра для трасс: строка как есть, прочее как JSON
std::string scalar_text(const Value& value);

}  // namespace logveil

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // LOGVEIL_VALUE_HPP
