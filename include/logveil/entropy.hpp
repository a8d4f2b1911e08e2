// ==============================================================================
// logveil/entropy.hpp - Entropy Analyzer
// ==============================================================================
//
// Назначение:
// - Энтропия Шеннона токена (бит на символ)
// - Решение "похоже на секрет": len >= min_length && score >= threshold
// - Токенизация строки по границам не-буквенно-цифровых символов
//
// Модуль без зависимостей; работает после pattern-правил, поэтому уже
// вставленные маркеры вида [REDACTED_EMAIL] распадаются на короткие токены
// и повторно не оцениваются.
//
// ==============================================================================

#ifndef LOGVEIL_ENTROPY_HPP
#define LOGVEIL_ENTROPY_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logveil::entropy {

/// Порог по умолчанию (бит на символ)
constexpr double DEFAULT_THRESHOLD = 4.2;

/// Минимальная длина токена по умолчанию
constexpr std::size_t DEFAULT_MIN_LENGTH = 12;

/// Верхняя граница порога: больше 8 бит на байт не бывает
constexpr double MAX_THRESHOLD = 8.0;

/// Маркер, которым заменяется высокоэнтропийный токен
constexpr const char* SECRET_MARKER = "[REDACTED_SECRET]";

/// Тег правила в трассах
constexpr const char* RULE_TAG = "entropy";

struct EntropyConfig {
    bool enabled = true;
    double threshold = DEFAULT_THRESHOLD;
    std::size_t min_length = DEFAULT_MIN_LENGTH;
};

/// Проверить конфигурацию; вызывается при загрузке профиля, не при сканировании.
/// @return сообщение об ошибке или nullopt
std::optional<std::string> validate(const EntropyConfig& cfg);

/// Энтропия Шеннона: -sum(p(c) * log2 p(c)) по наблюдаемому алфавиту.
/// Пустой токен имеет энтропию 0.
double score(std::string_view token);

/// len(token) >= min_length && score(token) >= threshold
bool is_secret(std::string_view token, const EntropyConfig& cfg);

/// Токен строки: смещение в байтах и текст (view в исходную строку)
struct Token {
    std::size_t offset = 0;
    std::string_view text;
};

/// Разбить строку на максимальные серии алфавита base64 [A-Za-z0-9+/];
/// хвостовые '=' перед разделителем или концом строки входят в токен
std::vector<Token> tokenize(std::string_view line);

/// Найденный высокоэнтропийный токен
struct Finding {
    std::size_t offset = 0;
    std::size_t length = 0;
    double score = 0.0;
};

/// Оценить каждый токен строки ровно один раз; пусто, если cfg.enabled == false
std::vector<Finding> scan(std::string_view line, const EntropyConfig& cfg);

}  // namespace logveil::entropy

#endif  // LOGVEIL_ENTROPY_HPP
