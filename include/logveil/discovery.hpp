// ==============================================================================
// logveil/discovery.hpp - File Discovery
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход директорий для поиска журналов
// - Фильтрация по расширениям
// - Детерминированный порядок результатов (сортировка по пути)
// - Режим skip_errors: ошибки доступа становятся предупреждениями
//
// ==============================================================================

#ifndef LOGVEIL_DISCOVERY_HPP
#define LOGVEIL_DISCOVERY_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace logveil::io {

// ----------------------------------------------------------------------------
// DiscoveryOptions - параметры поиска файлов
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// Набор допустимых расширений (БЕЗ точки: "log", не ".log").
    /// nullopt означает все файлы
    std::optional<std::unordered_set<std::string>> extensions;

    /// true = предупреждения вместо ошибок
    bool skip_errors = false;

    /// Получатель предупреждений; без него они идут в stderr с префиксом "[!]"
    std::function<void(const std::string&)> on_warning;
};

// ----------------------------------------------------------------------------
// discover_files - основная функция поиска
// ----------------------------------------------------------------------------

/// Найти файлы по путям с фильтрацией по расширениям
///
/// @param inputs Вектор путей к файлам или директориям
/// @param opt Параметры поиска (расширения, skip_errors)
/// @return Отсортированный по пути список найденных файлов
///
/// - Если путь - файл: проверяет расширение и добавляет при совпадении
/// - Если путь - директория: рекурсивно обходит все поддиректории
/// - Расширения сравниваются с учётом регистра
/// - Пустой результат - не ошибка
///
/// @throws std::runtime_error при ошибке (если skip_errors=false)
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt);

/// Нормализовать расширение из командной строки: ".log" -> "log"
std::string normalize_extension(const std::string& ext);

}  // namespace logveil::io

#endif  // LOGVEIL_DISCOVERY_HPP
