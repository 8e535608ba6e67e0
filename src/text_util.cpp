#include "text_util.hpp"

namespace pdf_mt {

namespace {

constexpr std::uint32_t kReplacementRune = 0xFFFD;

bool in_range(std::uint32_t rune, std::uint32_t first, std::uint32_t last) {
    return rune >= first && rune <= last;
}

}  // namespace

std::u32string utf8_to_runes(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::uint32_t rune = 0;
        std::size_t extra = 0;
        if (lead < 0x80) {
            rune = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            rune = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            rune = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            rune = lead & 0x07;
            extra = 3;
        } else {
            out.push_back(kReplacementRune);
            ++i;
            continue;
        }

        if (i + extra >= text.size()) {
            out.push_back(kReplacementRune);
            break;
        }

        bool valid = true;
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            rune = (rune << 6) | (cont & 0x3F);
        }

        if (!valid) {
            out.push_back(kReplacementRune);
            ++i;
            continue;
        }
        out.push_back(rune);
        i += extra + 1;
    }

    return out;
}

void append_utf8(std::string& out, std::uint32_t rune) {
    if (rune > 0x10FFFF || in_range(rune, 0xD800, 0xDFFF)) {
        rune = kReplacementRune;
    }
    if (rune < 0x80) {
        out.push_back(static_cast<char>(rune));
    } else if (rune < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (rune >> 6)));
        out.push_back(static_cast<char>(0x80 | (rune & 0x3F)));
    } else if (rune < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (rune >> 12)));
        out.push_back(static_cast<char>(0x80 | ((rune >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (rune & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (rune >> 18)));
        out.push_back(static_cast<char>(0x80 | ((rune >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((rune >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (rune & 0x3F)));
    }
}

std::string runes_to_utf8(std::u32string_view runes) {
    std::string out;
    out.reserve(runes.size());
    for (const char32_t rune : runes) {
        append_utf8(out, static_cast<std::uint32_t>(rune));
    }
    return out;
}

bool is_cjk_rune(std::uint32_t rune) {
    return in_range(rune, 0x2E80, 0x2FDF) ||   // radicals
        in_range(rune, 0x3040, 0x30FF) ||      // kana
        in_range(rune, 0x3100, 0x312F) ||      // bopomofo
        in_range(rune, 0x3130, 0x318F) ||      // hangul jamo
        in_range(rune, 0x3400, 0x4DBF) ||
        in_range(rune, 0x4E00, 0x9FFF) ||
        in_range(rune, 0xAC00, 0xD7AF) ||      // hangul syllables
        in_range(rune, 0xF900, 0xFAFF) ||
        in_range(rune, 0x20000, 0x2FA1F);
}

bool is_space_rune(std::uint32_t rune) {
    return rune == ' ' || rune == '\t' || rune == '\n' || rune == '\r' || rune == '\f' || rune == 0xA0 ||
        rune == 0x3000 || in_range(rune, 0x2000, 0x200B);
}

bool is_letter_rune(std::uint32_t rune) {
    if (rune < 0x80) {
        return (rune >= 'a' && rune <= 'z') || (rune >= 'A' && rune <= 'Z');
    }
    if (is_cjk_rune(rune)) {
        return true;
    }
    if (rune == 0xD7 || rune == 0xF7 || rune == kReplacementRune) {
        return false;
    }
    // Latin-1 punctuation, general punctuation through misc symbols, CJK punctuation, fullwidth ASCII symbols.
    if (in_range(rune, 0x80, 0xBF) || in_range(rune, 0x2000, 0x2BFF) || in_range(rune, 0x3000, 0x303F) ||
        in_range(rune, 0xFF00, 0xFF20) || in_range(rune, 0xE000, 0xF8FF)) {
        return false;
    }
    return true;
}

bool has_letters(std::u32string_view runes) {
    for (const char32_t rune : runes) {
        if (is_letter_rune(static_cast<std::uint32_t>(rune))) {
            return true;
        }
    }
    return false;
}

std::u32string normalize_whitespace(std::u32string_view runes) {
    std::u32string out;
    out.reserve(runes.size());
    bool in_space = false;

    for (const char32_t rune : runes) {
        if (is_space_rune(static_cast<std::uint32_t>(rune))) {
            if (!in_space && !out.empty()) {
                out.push_back(U' ');
            }
            in_space = true;
        } else {
            out.push_back(rune);
            in_space = false;
        }
    }

    while (!out.empty() && out.back() == U' ') {
        out.pop_back();
    }
    return out;
}

}  // namespace pdf_mt
