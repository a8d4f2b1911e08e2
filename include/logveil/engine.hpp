// ==============================================================================
// logveil/engine.hpp - Redaction Engine
// ==============================================================================
//
// Назначение:
// - Санитизация одной единицы: строки журнала или структурного документа
// - Порядок для свободного текста: нормализация UTF-8 -> pattern-правила
//   (в порядке профиля) -> поиск секретов по энтропии
// - Структурные документы: правила путей ключей, затем свободный текст
//   в каждом строковом листе
// - Трасса на каждую фактическую замену
//
// Engine не хранит изменяемого состояния: один экземпляр обслуживает
// любое число потоков. Профиль для горячей перезагрузки публикуется через
// ProfileStore; каждая единица обрабатывается одним снимком профиля.
//
// ==============================================================================

#ifndef LOGVEIL_ENGINE_HPP
#define LOGVEIL_ENGINE_HPP

#include "logveil/profile.hpp"
#include "logveil/trace.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace logveil::engine {

// ----------------------------------------------------------------------------
// Unit - единица обработки
// ----------------------------------------------------------------------------

enum class UnitKind {
    Line,  // строка свободного текста (без перевода строки)
    Json,  // JSON документ или JSONL запись
    Yaml   // YAML документ
};

struct Unit {
    UnitKind kind = UnitKind::Line;
    std::string_view text;
    std::string source;
    std::optional<std::size_t> line;  // для JSON: есть у JSONL записи, нет у документа
};

// ----------------------------------------------------------------------------
// Engine
// ----------------------------------------------------------------------------

class Engine {
public:
    explicit Engine(std::shared_ptr<const profile::Profile> profile);

    const profile::Profile& profile() const { return *profile_; }

    /// Санитизировать единицу согласно её виду
    trace::SanitizedResult redact(const Unit& unit) const;

    /// Строка свободного текста
    trace::SanitizedResult redact_line(std::string_view line, const std::string& source,
                                       std::optional<std::size_t> line_no) const;

    /// Структурный документ. line задан для JSONL записи: вывод компактный,
    /// при ошибке разбора запись обрабатывается как одна строка.
    /// Без line документ выводится с отступом 2, при ошибке разбора
    /// обрабатывается построчно.
    trace::SanitizedResult redact_document(std::string_view text, UnitKind kind,
                                           const std::string& source,
                                           std::optional<std::size_t> line = std::nullopt) const;

private:
    /// Правила и энтропия над текстом; трассы дописываются в out
    std::string redact_text(std::string_view text, const std::string& source,
                            std::optional<std::size_t> line,
                            const std::optional<std::string>& path,
                            trace::SanitizedResult& out) const;

    trace::SanitizedResult redact_lines(std::string_view text, const std::string& source) const;

    std::shared_ptr<const profile::Profile> profile_;
};

// ----------------------------------------------------------------------------
// ProfileStore - атомарная публикация профиля
// ----------------------------------------------------------------------------

class ProfileStore {
public:
    explicit ProfileStore(std::shared_ptr<const profile::Profile> initial);

    ProfileStore(const ProfileStore&) = delete;
    ProfileStore& operator=(const ProfileStore&) = delete;

    /// Текущий профиль; снимок остаётся валидным после publish()
    std::shared_ptr<const profile::Profile> snapshot() const;

    /// Заменить профиль; уже взятые снимки не меняются
    void publish(std::shared_ptr<const profile::Profile> next);

    /// Число выполненных publish()
    std::uint64_t generation() const { return generation_.load(); }

private:
    std::shared_ptr<const profile::Profile> current_;
    std::atomic<std::uint64_t> generation_{0};
};

}  // namespace logveil::engine

#endif  // LOGVEIL_ENGINE_HPP
