// ==============================================================================
// utf8.cpp - Декодирование UTF-8 с best-effort заменой
// ==============================================================================
//
// Замена выполняется по "maximal subpart" (Unicode 3.9, WHATWG): валидный
// префикс оборванной последовательности даёт ровно один U+FFFD.
//
// ==============================================================================

#include "logveil/utf8.hpp"

#include <cstdint>

namespace logveil::utf8 {

namespace {

/// Длина последовательности и допустимый диапазон второго байта
struct LeadInfo {
    std::size_t length = 0;  // 0 = недопустимый ведущий байт
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;
};

LeadInfo classify(std::uint8_t b) {
    if (b < 0x80) {
        return {1, 0, 0};
    }
    if (b >= 0xC2 && b <= 0xDF) {
        return {2, 0x80, 0xBF};
    }
    if (b == 0xE0) {
        return {3, 0xA0, 0xBF};  // без overlong
    }
    if ((b >= 0xE1 && b <= 0xEC) || b == 0xEE || b == 0xEF) {
        return {3, 0x80, 0xBF};
    }
    if (b == 0xED) {
        return {3, 0x80, 0x9F};  // без суррогатов
    }
    if (b == 0xF0) {
        return {4, 0x90, 0xBF};
    }
    if (b >= 0xF1 && b <= 0xF3) {
        return {4, 0x80, 0xBF};
    }
    if (b == 0xF4) {
        return {4, 0x80, 0x8F};  // не выше U+10FFFF
    }
    return {};
}

/// Сколько байт, начиная с pos, образуют корректную последовательность.
/// Возвращает 0 и длину валидного префикса в consumed, если последовательность битая.
std::size_t valid_length(std::string_view bytes, std::size_t pos, std::size_t& consumed) {
    auto b0 = static_cast<std::uint8_t>(bytes[pos]);
    LeadInfo info = classify(b0);
    consumed = 1;
    if (info.length == 0) {
        return 0;
    }
    if (info.length == 1) {
        return 1;
    }

    for (std::size_t i = 1; i < info.length; ++i) {
        if (pos + i >= bytes.size()) {
            return 0;
        }
        auto b = static_cast<std::uint8_t>(bytes[pos + i]);
        std::uint8_t lo = (i == 1) ? info.lo : 0x80;
        std::uint8_t hi = (i == 1) ? info.hi : 0xBF;
        if (b < lo || b > hi) {
            return 0;
        }
        consumed = i + 1;
    }
    return info.length;
}

}  // namespace

bool is_valid(std::string_view bytes) {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        std::size_t consumed = 0;
        std::size_t len = valid_length(bytes, pos, consumed);
        if (len == 0) {
            return false;
        }
        pos += len;
    }
    return true;
}

DecodeResult sanitize(std::string_view bytes) {
    DecodeResult result;

    // Быстрый путь: чистый ввод копируется целиком
    if (is_valid(bytes)) {
        result.text.assign(bytes.data(), bytes.size());
        return result;
    }

    result.text.reserve(bytes.size() + 8);
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        std::size_t consumed = 0;
        std::size_t len = valid_length(bytes, pos, consumed);
        if (len > 0) {
            result.text.append(bytes.data() + pos, len);
            pos += len;
            continue;
        }
        result.text.append(REPLACEMENT);
        result.replaced = true;
        ++result.invalid;
        pos += consumed;
    }
    return result;
}

}  // namespace logveil::utf8
