// ==============================================================================
// logveil/utf8.hpp - Декодирование UTF-8 с best-effort заменой
// ==============================================================================
//
// Назначение:
// - Проверка входных байтов на корректный UTF-8
// - Замена некорректных последовательностей на U+FFFD
//
// Некорректный ввод не является ошибкой: вызывающая сторона получает флаг
// replaced и сама решает, как об этом сообщить.
//
// ==============================================================================

#ifndef LOGVEIL_UTF8_HPP
#define LOGVEIL_UTF8_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace logveil::utf8 {

/// U+FFFD REPLACEMENT CHARACTER в UTF-8
constexpr const char* REPLACEMENT = "\xef\xbf\xbd";

struct DecodeResult {
    std::string text;
    bool replaced = false;      // была ли хоть одна замена
    std::size_t invalid = 0;    // число заменённых последовательностей
};

/// Проверить, является ли буфер корректным UTF-8
bool is_valid(std::string_view bytes);

/// Декодировать байты: корректные последовательности копируются как есть,
/// каждая максимальная некорректная подпоследовательность заменяется на U+FFFD
DecodeResult sanitize(std::string_view bytes);

}  // namespace logveil::utf8

#endif  // LOGVEIL_UTF8_HPP
