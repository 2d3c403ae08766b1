// strata/cpp/common/text_common.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

struct TokenSpan {
    uint32_t start{0};
    uint32_t len{0};
};

// Длина UTF-8 символа, начинающегося с s[i] (в байтах).
// Невалидная последовательность => 1 (байт проходит как отдельный символ).
size_t utf8_char_len(std::string_view s, size_t i);

inline bool is_ascii_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Токенизация по пробельным символам (space, tab, CR...)
void split_ws_spans(std::string_view s, std::vector<TokenSpan>& out);

std::vector<std::string> split_ws(std::string_view s);

// Склеить слова через sep (пробелы схлопываются)
std::string collapse_ws(std::string_view s, std::string_view sep = " ");

std::string_view trim_ws(std::string_view s);
