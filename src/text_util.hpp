#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pdf_mt {

// Invalid sequences decode to U+FFFD.
std::u32string utf8_to_runes(std::string_view text);
std::string runes_to_utf8(std::u32string_view runes);
void append_utf8(std::string& out, std::uint32_t rune);

bool is_cjk_rune(std::uint32_t rune);
bool is_space_rune(std::uint32_t rune);

// Alphabetic or ideographic. Digits, punctuation and symbol blocks are not letters.
bool is_letter_rune(std::uint32_t rune);
bool has_letters(std::u32string_view runes);

// Collapses whitespace runs to one space and trims both ends.
std::u32string normalize_whitespace(std::u32string_view runes);

}  // namespace pdf_mt
