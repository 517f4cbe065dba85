#pragma once

#include <string>

namespace text {

// Invalid sequences decode to U+FFFD.
std::u32string decode_utf8(const std::string& s);
std::string encode_utf8(const std::u32string& s);

// Lowercases ASCII, Latin-1, Cyrillic; folds Ё to е.
char32_t fold_char(char32_t c);
std::u32string fold(const std::u32string& s);
std::string fold_utf8(const std::string& s);

bool is_upper(char32_t c);
bool is_letter(char32_t c);
bool is_digit(char32_t c);
bool is_space(char32_t c);

std::string trim(const std::string& s);

}
