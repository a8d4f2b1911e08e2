// ==============================================================================
// logveil/profile.hpp - Rule Profile
// ==============================================================================
//
// Назначение:
// - Разбор определения профиля из YAML или JSON (yaml-cpp)
// - Валидация и компиляция в неизменяемый Profile
// - Встроенные профили и реестр профилей с автоподбором по имени файла
//
// Profile создаётся только через compile(): все ошибки конфигурации
// (regex, шаблоны замен, порог энтропии, пути ключей) обнаруживаются здесь.
// Скомпилированный профиль не меняется и безопасно разделяется потоками.
//
// Формат файла:
//   name: nginx                  # обязательно
//   description: ...
//   version: "1.0"
//   format: plaintext            # plaintext | json | jsonl | yaml
//   filename_patterns: ["*.access.log"]
//   patterns:
//     - name: email
//       pattern: '[a-z]+@[a-z]+\.com'
//       replacement: "[REDACTED_EMAIL]"
//       enabled: true
//       ignore_case: false
//   entropy:                     # синоним: entropy_config
//     enabled: true
//     threshold: 4.5
//     min_length: 16
//   key_paths:
//     - user.password
//     - { path: user.email, action: mask }
//
// ==============================================================================

#ifndef LOGVEIL_PROFILE_HPP
#define LOGVEIL_PROFILE_HPP

#include "logveil/entropy.hpp"
#include "logveil/keypath.hpp"
#include "logveil/rule.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logveil::profile {

// ----------------------------------------------------------------------------
// Описание профиля
// ----------------------------------------------------------------------------

/// Ожидаемый формат журналов, к которым применяется профиль
enum class FormatHint { Plaintext, Json, Jsonl, Yaml };

/// @throws std::invalid_argument для неизвестного формата
FormatHint parse_format_hint(std::string_view s);

const char* to_string(FormatHint hint);

struct KeyPathDef {
    std::string path;
    std::string action = "redact";
    std::optional<std::string> replacement;
};

/// Определение профиля до компиляции
struct ProfileData {
    std::string name;
    std::string description;
    std::string version;
    FormatHint format = FormatHint::Plaintext;
    std::vector<std::string> filename_patterns;
    std::vector<rule::RuleDef> patterns;
    entropy::EntropyConfig entropy;
    std::vector<KeyPathDef> key_paths;
};

// ----------------------------------------------------------------------------
// Profile
// ----------------------------------------------------------------------------

class Profile;

struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct ParseResult {
    bool ok = false;
    ProfileData data;
    Error error;

    explicit operator bool() const { return ok; }
};

struct LoadResult {
    bool ok = false;
    std::shared_ptr<const Profile> profile;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Скомпилировать определение; origin попадает в Error::path
LoadResult compile(ProfileData data, const std::string& origin = "");

class Profile {
public:
    const std::string& name() const { return data_.name; }
    const std::string& description() const { return data_.description; }
    const std::string& version() const { return data_.version; }
    FormatHint format() const { return data_.format; }
    const std::vector<std::string>& filename_patterns() const { return data_.filename_patterns; }

    const rule::RuleSet& rules() const { return rules_; }
    const entropy::EntropyConfig& entropy() const { return data_.entropy; }
    const std::vector<keypath::KeyPathRule>& key_paths() const { return key_paths_; }

    /// Исходное определение (для lint и списка профилей)
    const ProfileData& data() const { return data_; }

    /// Подходит ли профиль для файла по filename_patterns
    bool matches_file(std::string_view filename) const;

private:
    friend LoadResult compile(ProfileData data, const std::string& origin);

    Profile() = default;

    ProfileData data_;
    rule::RuleSet rules_;
    std::vector<keypath::KeyPathRule> key_paths_;
};

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

/// Разобрать определение профиля из текста YAML/JSON
ParseResult parse_string(std::string_view text, const std::string& origin = "");

/// Разобрать файл профиля (.yml, .yaml или .json)
ParseResult parse_file(const std::filesystem::path& path);

/// Переопределения из командной строки
struct Overrides {
    std::optional<double> entropy_threshold;
    std::optional<std::size_t> entropy_min_length;
    bool disable_entropy = false;
    std::vector<std::string> extra_keys;  // добавляются с действием redact
};

void apply(ProfileData& data, const Overrides& overrides);

/// parse_file + apply + compile
LoadResult load_file(const std::filesystem::path& path, const Overrides& overrides = {});

// ----------------------------------------------------------------------------
// Встроенные профили и реестр
// ----------------------------------------------------------------------------

constexpr const char* DEFAULT_PROFILE = "default";

/// default, nginx, docker, cloudtrail, application
std::vector<ProfileData> builtin_profiles();

/// Сопоставление имени файла с glob-шаблоном ('*', '?'), без учёта регистра
bool glob_match(std::string_view pattern, std::string_view name);

class ProfileRegistry {
public:
    ProfileRegistry() = default;

    /// Реестр со встроенными профилями, к которым применены overrides
    /// @throws std::runtime_error если встроенный профиль не компилируется
    static ProfileRegistry with_builtins(const Overrides& overrides = {});

    /// Добавить профиль; профиль с тем же именем заменяется на месте
    void add(std::shared_ptr<const Profile> profile);

    std::shared_ptr<const Profile> find(std::string_view name) const;

    /// Имена в порядке реестра
    std::vector<std::string> names() const;

    const std::vector<std::shared_ptr<const Profile>>& profiles() const { return profiles_; }

    /// Загрузить все .yml/.yaml/.json из каталога (без рекурсии, по имени файла).
    /// Ошибочные файлы пропускаются и попадают в errors.
    /// @return число загруженных профилей
    std::size_t load_directory(const std::filesystem::path& dir, std::vector<Error>& errors,
                               const Overrides& overrides = {});

    /// Первый профиль, чьи filename_patterns совпали с именем файла, иначе default
    std::shared_ptr<const Profile> match_for_file(const std::filesystem::path& path) const;

private:
    std::vector<std::shared_ptr<const Profile>> profiles_;
};

}  // namespace logveil::profile

#endif  // LOGVEIL_PROFILE_HPP
