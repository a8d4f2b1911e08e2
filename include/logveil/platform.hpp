// ==============================================================================
// logveil/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Временные файлы рядом с целевым (атомарная публикация через rename)
// - Сигналы: SIGHUP (перезагрузка профиля) и SIGINT (отмена пакета)
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef LOGVEIL_PLATFORM_HPP
#define LOGVEIL_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace logveil::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать path из UTF-8 строки (на Windows через UTF-16)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

/// Создать пустой временный файл в той же директории, что и target.
/// Имя: ".<filename>.logveil-XXXXXX". Один каталог гарантирует, что
/// последующий rename() не пересекает файловые системы.
/// @throws std::runtime_error если файл создать не удалось
std::filesystem::path make_sibling_temp_file(const std::filesystem::path& target);

// ----------------------------------------------------------------------------
// Сигналы
// ----------------------------------------------------------------------------

/// Установить обработчик SIGHUP (no-op на Windows)
void install_reload_signal();

/// Вернуть true, если с прошлого вызова пришёл запрос перезагрузки, и сбросить флаг
bool take_reload_request();

/// Поставить запрос перезагрузки вручную (то же, что SIGHUP)
void request_reload();

/// Установить обработчик SIGINT/SIGTERM, выставляющий флаг отмены
void install_interrupt_signal();

/// Был ли получен SIGINT/SIGTERM
bool interrupt_requested();

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name();

}  // namespace logveil::platform

#endif  // LOGVEIL_PLATFORM_HPP
