// ==============================================================================
// logveil/report.hpp - HTML-отчёт "до/после"
// ==============================================================================
//
// Назначение:
// - Самодостаточная HTML-страница: по разделу на файл, строки бок о бок
// - Только изменённые строки (те же пары, что и для --preview)
//
// Весь пользовательский текст экранируется: в логах бывают '<' и '&'.
//
// ==============================================================================

#ifndef LOGVEIL_REPORT_HPP
#define LOGVEIL_REPORT_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logveil::report {

/// Изменённая строка
struct DiffRow {
    std::optional<std::size_t> line;
    std::string before;
    std::string after;
};

/// Раздел отчёта (обычно один входной файл)
struct DiffSection {
    std::string title;
    std::vector<DiffRow> rows;
};

/// Экранировать & < > " '
std::string html_escape(std::string_view text);

/// Собрать страницу; разделы без строк пропускаются
std::string render_html(const std::vector<DiffSection>& sections);

/// Записать страницу в файл; при ошибке false и текст в error
bool write_html(const std::filesystem::path& path, const std::vector<DiffSection>& sections,
                std::string* error);

}  // namespace logveil::report

#endif  // LOGVEIL_REPORT_HPP
