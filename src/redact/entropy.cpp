// ==============================================================================
// entropy.cpp - Entropy Analyzer
// ==============================================================================

#include "logveil/entropy.hpp"

#include <array>
#include <cmath>

namespace logveil::entropy {

namespace {

bool is_alnum_ascii(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

/// Алфавит base64: [A-Za-z0-9+/]
bool is_token_char(char c) {
    return is_alnum_ascii(c) || c == '+' || c == '/';
}

}  // namespace

std::optional<std::string> validate(const EntropyConfig& cfg) {
    if (!(cfg.threshold > 0.0)) {
        return std::string("entropy threshold must be positive, got ") +
               std::to_string(cfg.threshold);
    }
    if (cfg.threshold > MAX_THRESHOLD) {
        return std::string("entropy threshold must not exceed 8 bits per symbol, got ") +
               std::to_string(cfg.threshold);
    }
    if (cfg.min_length == 0) {
        return std::string("entropy min_length must be positive");
    }
    return std::nullopt;
}

double score(std::string_view token) {
    if (token.empty()) {
        return 0.0;
    }

    std::array<std::size_t, 256> counts{};
    for (char c : token) {
        ++counts[static_cast<unsigned char>(c)];
    }

    const double n = static_cast<double>(token.size());
    double h = 0.0;
    for (std::size_t count : counts) {
        if (count == 0) {
            continue;
        }
        double p = static_cast<double>(count) / n;
        h -= p * std::log2(p);
    }
    return h;
}

bool is_secret(std::string_view token, const EntropyConfig& cfg) {
    return token.size() >= cfg.min_length && score(token) >= cfg.threshold;
}

std::vector<Token> tokenize(std::string_view line) {
    std::vector<Token> tokens;
    std::size_t i = 0;
    while (i < line.size()) {
        if (!is_token_char(line[i])) {
            ++i;
            continue;
        }
        std::size_t start = i;
        while (i < line.size() && is_token_char(line[i])) {
            ++i;
        }
        // '=' входит в токен только как хвостовое выравнивание base64:
        // "abc==" один токен, "key=value" два
        std::size_t pad = i;
        while (pad < line.size() && line[pad] == '=') {
            ++pad;
        }
        if (pad > i && (pad == line.size() || !is_token_char(line[pad]))) {
            i = pad;
        }
        tokens.push_back(Token{start, line.substr(start, i - start)});
    }
    return tokens;
}

std::vector<Finding> scan(std::string_view line, const EntropyConfig& cfg) {
    std::vector<Finding> findings;
    if (!cfg.enabled) {
        return findings;
    }
    for (const auto& token : tokenize(line)) {
        // Длина проверяется до подсчёта: короткие токены не оцениваются вовсе
        if (token.text.size() < cfg.min_length) {
            continue;
        }
        double h = score(token.text);
        if (h >= cfg.threshold) {
            findings.push_back(Finding{token.offset, token.text.size(), h});
        }
    }
    return findings;
}

}  // namespace logveil::entropy
