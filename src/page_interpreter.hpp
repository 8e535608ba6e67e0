#pragma once

#include "cached_translator.hpp"
#include "content_stream.hpp"
#include "region_mask.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pdf_mt {

// Resource name the overlay text selects; the assembler registers the target font under it.
constexpr const char* kOverlayFontName = "PMTF0";

struct Point {
    double x = 0.0;
    double y = 0.0;
};

// PDF row-vector affine matrix: [x y 1] * [a b 0; c d 0; e f 1].
struct Matrix {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
    double d = 1.0;
    double e = 0.0;
    double f = 0.0;

    static Matrix translation(double tx, double ty);
    Point apply(double x, double y) const;
};

// Applies first, then second.
Matrix concat(const Matrix& first, const Matrix& second);

struct Rect {
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;
    bool empty = true;

    void include(const Point& p);
    double width() const { return empty ? 0.0 : x1 - x0; }
    double height() const { return empty ? 0.0 : y1 - y0; }
};

struct DecodedGlyph {
    std::u32string unicode;
    // Horizontal advance in thousandths of a text space unit.
    double width = 0.0;
    // Single-byte code 32: word spacing applies.
    bool word_space = false;
};

// A font of the source page, able to split shown strings into glyphs.
class PdfFontInfo {
public:
    virtual ~PdfFontInfo() = default;

    virtual std::vector<DecodedGlyph> decode(std::string_view bytes) const = 0;
    virtual bool is_type3() const = 0;
};

// The font the translated text is drawn with.
class TargetFont {
public:
    virtual ~TargetFont() = default;

    // Advance of the rune at font size 1.
    virtual double advance(std::uint32_t rune) const = 0;
    // Shown-string bytes for the rune; empty when the font cannot draw it.
    virtual std::string encode(std::uint32_t rune) const = 0;
};

using FontMap = std::map<std::string, std::shared_ptr<const PdfFontInfo>>;

struct PageContent {
    int page_index = 0;
    // Contents of the page, array parts joined in order.
    std::string content;
    FontMap fonts;
    // Page user space to raster pixels, y pointing down.
    Matrix user_to_device;
};

struct InterpreterOptions {
    double min_font_scale = 0.5;
    bool strict = false;
};

struct PageStats {
    std::size_t spans_translated = 0;
    std::size_t spans_cached = 0;
    std::size_t spans_fallback = 0;
    std::size_t spans_protected = 0;
    std::size_t spans_skipped = 0;

    PageStats& operator+=(const PageStats& other);
};

struct PageOutput {
    std::string content;
    bool modified = false;
    PageStats stats;
};

// Rewrites one page content stream: translatable text runs become invisible
// cursor advances plus an overlay with the translation, everything else is kept verbatim.
class PageInterpreter {
public:
    PageInterpreter(CachedTranslator& translator, const TargetFont& target_font, InterpreterOptions options = {});

    bool interpret(const PageContent& page, const RegionMask& mask, PageOutput& out, std::string& error);

private:
    CachedTranslator& translator_;
    const TargetFont& target_font_;
    InterpreterOptions options_;
};

// Greedy wrap at spaces and between CJK characters. A single word wider than max_width keeps its own line.
std::vector<std::u32string> wrap_text(
    const std::u32string& text,
    double max_width,
    double font_size,
    const TargetFont& font
);

}  // namespace pdf_mt
