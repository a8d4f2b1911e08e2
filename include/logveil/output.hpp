// ==============================================================================
// logveil/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr для приложения
// - Сообщения с префиксами ([+], [!], [x], [*], [~])
// - Цветной вывод (ANSI escape codes) только на терминале
// - Таблицы (сводка --stats, список профилей)
// - Пары до/после для --preview
//
// Библиотечные модули сами ничего не печатают: предупреждения и заметки
// возвращаются вызывающему коду и выводятся через Writer.
//
// ==============================================================================

#ifndef LOGVEIL_OUTPUT_HPP
#define LOGVEIL_OUTPUT_HPP

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace logveil::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация, "+" в preview
    Yellow,  // Предупреждения
    Red,     // Ошибки, "-" в preview
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить informational stderr
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner: скрыть ASCII-баннер
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток как есть
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами (stderr)
    // -------------------------------------------------------------------------

    /// "[+] <message>" (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" (всегда)
    void error(std::string_view message);

    /// "[*] <message>" (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    void green_line(std::string_view message);

    void yellow_line(std::string_view message);

    void red_line(std::string_view message);

    /// Пара строк preview в stdout: "- before" красным, "+ after" зелёным
    void preview_pair(std::string_view before, std::string_view after);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    /// Записать с цветом
    void write_colored(Stream s, std::string_view message, Color color);

    /// Префикс сообщения (цветной на терминале) + текст
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    /// Добавить заголовки
    void set_headers(const std::vector<std::string>& headers);

    /// Добавить строку данных
    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer (Unicode box-drawing)
    void print(Writer& w) const;

    /// Вывести таблицу в строку
    std::string to_string() const;

    /// Количество строк (без заголовка)
    std::size_t row_count() const { return rows_.size(); }

private:
    /// Ширины столбцов в символах (не байтах)
    std::vector<std::size_t> column_widths() const;

    /// Горизонтальная линия: pos = 'T' (верх), 'M' (разделитель), 'B' (низ)
    std::string format_line(char pos, const std::vector<std::size_t>& widths) const;

    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<std::size_t>& widths) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Число символов UTF-8 (для выравнивания столбцов)
std::size_t display_width(std::string_view s);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Получить ANSI reset code
std::string ansi_reset_code();

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace logveil::output

#endif  // LOGVEIL_OUTPUT_HPP
