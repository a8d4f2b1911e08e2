// ==============================================================================
// value.cpp - Реализация Value (каноническая модель документа)
// ==============================================================================
//
// RapidJSON для JSON, yaml-cpp для YAML.
//
// ==============================================================================

#include "logveil/value.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <stdexcept>

#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <yaml-cpp/yaml.h>

namespace logveil {

namespace {

// ----------------------------------------------------------------------------
// Распознавание plain-скаляров YAML
// ----------------------------------------------------------------------------

bool is_yaml_null(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

bool is_yaml_true(const std::string& s) {
    return s == "true" || s == "True" || s == "TRUE";
}

bool is_yaml_false(const std::string& s) {
    return s == "false" || s == "False" || s == "FALSE";
}

/// Каноническое целое: без ведущих нулей и без '+', иначе при повторной
/// сериализации текст изменился бы ("007" -> "7")
bool is_canonical_int(const std::string& s) {
    static const std::regex re("-?(0|[1-9][0-9]*)");
    return std::regex_match(s, re);
}

bool looks_like_float(const std::string& s) {
    static const std::regex re(
        "[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?|[-+]?\\.(inf|Inf|INF)|\\.(nan|NaN|NAN)");
    return std::regex_match(s, re);
}

Value plain_scalar(const std::string& s) {
    if (is_yaml_null(s)) {
        return Value();
    }
    if (is_yaml_true(s)) {
        return Value(true);
    }
    if (is_yaml_false(s)) {
        return Value(false);
    }
    if (is_canonical_int(s)) {
        errno = 0;
        if (s[0] == '-') {
            long long v = std::strtoll(s.c_str(), nullptr, 10);
            if (errno == 0) {
                return Value(static_cast<std::int64_t>(v));
            }
        } else {
            unsigned long long v = std::strtoull(s.c_str(), nullptr, 10);
            if (errno == 0) {
                return Value(static_cast<std::uint64_t>(v));
            }
        }
    }
    // Вещественные числа остаются строками: plain-эмиссия сохраняет их текст
    return Value(s);
}

/// Строка, которую при plain-эмиссии прочитали бы как не-строку
bool needs_quotes(const std::string& s) {
    if (s.empty()) {
        return true;
    }
    if (is_yaml_null(s) || is_yaml_true(s) || is_yaml_false(s) || is_canonical_int(s)) {
        return true;
    }
    return looks_like_float(s);
}

void emit_yaml(YAML::Emitter& out, const Value& v) {
    if (v.is_null()) {
        out << YAML::Null;
    } else if (v.is_bool()) {
        out << v.as_bool();
    } else if (v.is_int()) {
        out << static_cast<long long>(v.as_int());
    } else if (v.is_uint()) {
        out << static_cast<unsigned long long>(v.as_uint());
    } else if (v.is_double()) {
        // Вещественные приходят только из JSON; текст берём у RapidJSON
        out << to_json_string(v);
    } else if (v.is_string()) {
        const auto& s = v.as_string();
        if (needs_quotes(s)) {
            out << YAML::DoubleQuoted << s;
        } else {
            out << s;
        }
    } else if (v.is_array()) {
        out << YAML::BeginSeq;
        for (const auto& item : v.as_array()) {
            emit_yaml(out, item);
        }
        out << YAML::EndSeq;
    } else if (v.is_object()) {
        out << YAML::BeginMap;
        for (const auto& [key, child] : v.as_object()) {
            out << YAML::Key << key << YAML::Value;
            emit_yaml(out, child);
        }
        out << YAML::EndMap;
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Копирование и сравнение
// ----------------------------------------------------------------------------

Value::Value(const Value& other) : data_(Null{}) {
    *this = other;
}

Value& Value::operator=(const Value& other) {
    if (this == &other) {
        return *this;
    }
    if (const auto* arr = other.get_array()) {
        data_ = std::make_shared<Array>(*arr);
    } else if (const auto* obj = other.get_object()) {
        data_ = std::make_shared<Object>(*obj);
    } else {
        data_ = other.data_;
    }
    return *this;
}

bool Value::operator==(const Value& other) const {
    if (data_.index() != other.data_.index()) {
        return false;
    }
    if (is_array()) {
        return as_array() == other.as_array();
    }
    if (is_object()) {
        return as_object() == other.as_object();
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_int()) {
        return as_int() == other.as_int();
    }
    if (is_uint()) {
        return as_uint() == other.as_uint();
    }
    if (is_double()) {
        return as_double() == other.as_double();
    }
    return as_string() == other.as_string();
}

// ----------------------------------------------------------------------------
// Операции с объектом
// ----------------------------------------------------------------------------

void Value::set(const std::string& key, Value v) {
    auto* obj = get_object_mut();
    if (obj == nullptr) {
        return;
    }
    for (auto& entry : *obj) {
        if (entry.first == key) {
            entry.second = std::move(v);
            return;
        }
    }
    obj->emplace_back(key, std::move(v));
}

const Value* Value::get(std::string_view key) const {
    if (const auto* obj = get_object()) {
        for (const auto& entry : *obj) {
            if (entry.first == key) {
                return &entry.second;
            }
        }
    }
    return nullptr;
}

Value* Value::get_mut(std::string_view key) {
    if (auto* obj = get_object_mut()) {
        for (auto& entry : *obj) {
            if (entry.first == key) {
                return &entry.second;
            }
        }
    }
    return nullptr;
}

const Value* Value::find_path(std::string_view dotted) const {
    const Value* current = this;
    std::size_t start = 0;
    while (current != nullptr && start <= dotted.size()) {
        std::size_t dot = dotted.find('.', start);
        std::string_view segment =
            dotted.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        current = current->get(segment);
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return current;
}

bool Value::erase(std::string_view key) {
    auto* obj = get_object_mut();
    if (obj == nullptr) {
        return false;
    }
    for (auto it = obj->begin(); it != obj->end(); ++it) {
        if (it->first == key) {
            obj->erase(it);
            return true;
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson
// ----------------------------------------------------------------------------

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
        if (json.IsUint64()) {
            return Value(json.GetUint64());
        }
        if (json.IsInt64()) {
            return Value(json.GetInt64());
        }
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    if (json.IsArray()) {
        Array arr;
        arr.reserve(json.Size());
        for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
            arr.push_back(from_rapidjson(json[i]));
        }
        return Value(std::move(arr));
    }

    if (json.IsObject()) {
        Object obj;
        obj.reserve(json.MemberCount());
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            obj.emplace_back(std::string(it->name.GetString(), it->name.GetStringLength()),
                             from_rapidjson(it->value));
        }
        return Value(std::move(obj));
    }

    return Value();
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
        return;
    }

    if (is_bool()) {
        out.SetBool(as_bool());
        return;
    }

    if (is_int()) {
        out.SetInt64(as_int());
        return;
    }

    if (is_uint()) {
        out.SetUint64(as_uint());
        return;
    }

    if (is_double()) {
        double d = as_double();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
        return;
    }

    if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
        return;
    }

    out.SetObject();
    for (const auto& [key, val] : as_object()) {
        rapidjson::Value k;
        k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
        rapidjson::Value v;
        val.to_rapidjson(v, alloc);
        out.AddMember(k, v, alloc);
    }
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

// ----------------------------------------------------------------------------
// Value::from_yaml
// ----------------------------------------------------------------------------

Value Value::from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return Value();
    case YAML::NodeType::Scalar:
        // Тег "!" yaml-cpp ставит скалярам в кавычках
        if (node.Tag() == "!") {
            return Value(node.Scalar());
        }
        return plain_scalar(node.Scalar());
    case YAML::NodeType::Sequence: {
        Array arr;
        arr.reserve(node.size());
        for (const auto& item : node) {
            arr.push_back(from_yaml(item));
        }
        return Value(std::move(arr));
    }
    case YAML::NodeType::Map: {
        Object obj;
        obj.reserve(node.size());
        for (auto it = node.begin(); it != node.end(); ++it) {
            obj.emplace_back(it->first.as<std::string>(), from_yaml(it->second));
        }
        return Value(std::move(obj));
    }
    }
    return Value();
}

// ----------------------------------------------------------------------------
// Парсинг и сериализация
// ----------------------------------------------------------------------------

ParseResult parse_json(std::string_view text) {
    ParseResult result;
    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError()) {
        result.error = std::string(rapidjson::GetParseError_En(doc.GetParseError())) +
                       " (offset " + std::to_string(doc.GetErrorOffset()) + ")";
        return result;
    }
    result.value = Value::from_rapidjson(doc);
    result.ok = true;
    return result;
}

ParseResult parse_yaml(std::string_view text) {
    ParseResult result;
    try {
        std::vector<YAML::Node> docs = YAML::LoadAll(std::string(text));
        if (docs.size() != 1) {
            result.error = "expected exactly one YAML document, found " + std::to_string(docs.size());
            return result;
        }
        result.value = Value::from_yaml(docs.front());
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = e.what();
    }
    return result;
}

std::string to_json_string(const Value& value, bool pretty) {
    rapidjson::Document doc = value.to_rapidjson_document();
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string to_yaml_string(const Value& value) {
    YAML::Emitter out;
    emit_yaml(out, value);
    if (!out.good()) {
        throw std::runtime_error("failed to emit YAML: " + out.GetLastError());
    }
    return std::string(out.c_str(), out.size());
}

std::string scalar_text(const Value& value) {
    if (const auto* s = value.get_string()) {
        return *s;
    }
    return to_json_string(value);
}

}  // namespace logveil
