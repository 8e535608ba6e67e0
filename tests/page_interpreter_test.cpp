#include "page_interpreter.hpp"

#include "fake_translator.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace pdf_mt {
namespace {

using test_support::ScriptedTranslator;

// One byte per glyph, every glyph 500 units wide.
class FixedWidthFont final : public PdfFontInfo {
public:
    explicit FixedWidthFont(bool type3 = false) : type3_(type3) {}

    std::vector<DecodedGlyph> decode(std::string_view bytes) const override {
        std::vector<DecodedGlyph> glyphs;
        for (const char c : bytes) {
            DecodedGlyph glyph;
            glyph.unicode.push_back(static_cast<char32_t>(static_cast<unsigned char>(c)));
            glyph.width = 500.0;
            glyph.word_space = c == ' ';
            glyphs.push_back(glyph);
        }
        return glyphs;
    }

    bool is_type3() const override { return type3_; }

private:
    bool type3_ = false;
};

// Half an em per rune; only ASCII can be drawn.
class AsciiTargetFont final : public TargetFont {
public:
    double advance(std::uint32_t /*rune*/) const override { return 0.5; }

    std::string encode(std::uint32_t rune) const override {
        if (rune >= 128) {
            return {};
        }
        return std::string(1, static_cast<char>(rune));
    }
};

Matrix page_to_device() {
    Matrix m;
    m.d = -1.0;
    m.f = 792.0;
    return m;
}

class PageInterpreterTest : public ::testing::Test {
protected:
    PageInterpreterTest() : cache_(nullptr, "scripted") {}

    PageContent make_page(const std::string& content) const {
        PageContent page;
        page.page_index = 0;
        page.content = content;
        page.fonts["F1"] = std::make_shared<FixedWidthFont>();
        page.fonts["T3"] = std::make_shared<FixedWidthFont>(true);
        page.user_to_device = page_to_device();
        return page;
    }

    bool run(const std::string& content, PageOutput& out, std::string& error, InterpreterOptions options = {}) {
        CachedTranslatorOptions retry;
        retry.retry_delay = std::chrono::milliseconds(0);
        CachedTranslator translator(backend_, cache_, retry);
        PageInterpreter interpreter(translator, target_, options);
        return interpreter.interpret(make_page(content), mask_, out, error);
    }

    ScriptedTranslator backend_;
    TranslationCache cache_;
    AsciiTargetFont target_;
    RegionMask mask_ = build_region_mask(792, 612, {});
};

TEST_F(PageInterpreterTest, ReplacesTextRunWithAdvanceAndOverlay) {
    backend_.script.push_back(TranslateResult::success("HELLO WORLD"));
    PageOutput out;
    std::string error;
    ASSERT_TRUE(run("BT /F1 12 Tf 72 700 Td (Hello world) Tj ET\n", out, error)) << error;

    ASSERT_EQ(backend_.inputs.size(), 1u);
    EXPECT_EQ(backend_.inputs[0], "Hello world");
    EXPECT_TRUE(out.modified);
    EXPECT_EQ(out.stats.spans_translated, 1u);

    EXPECT_EQ(out.content.rfind("q\n", 0), 0u);
    EXPECT_EQ(out.content.find("(Hello world) Tj"), std::string::npos);
    // 11 glyphs of 6pt each, expressed in thousandths of the 12pt size.
    EXPECT_NE(out.content.find("[-5500] TJ"), std::string::npos);
    EXPECT_NE(out.content.find("BT /PMTF0 12 Tf 1 0 0 1 72 700 Tm <48454C4C4F20574F524C44> Tj ET"), std::string::npos);

    const auto body_end = out.content.find("Q\nBT /PMTF0");
    ASSERT_NE(body_end, std::string::npos);
}

TEST_F(PageInterpreterTest, ProtectedRegionIsKeptVerbatim) {
    mask_ = build_region_mask(792, 612, {LayoutBox{LayoutCategory::Figure, 0.0, 0.0, 612.0, 400.0, 1.0}});
    const std::string content = "q BT /F1 12 Tf 72 200 Td (Figure 1 axis) Tj ET Q\n";

    PageOutput out;
    std::string error;
    ASSERT_TRUE(run(content, out, error)) << error;

    EXPECT_FALSE(out.modified);
    EXPECT_EQ(out.content, content);
    EXPECT_EQ(out.stats.spans_protected, 1u);
    EXPECT_EQ(backend_.calls, 0);
}

TEST_F(PageInterpreterTest, MixedPageTranslatesOnlyOrdinaryText) {
    mask_ = build_region_mask(792, 612, {LayoutBox{LayoutCategory::Figure, 0.0, 0.0, 612.0, 400.0, 1.0}});
    backend_.script.push_back(TranslateResult::success("BODY"));
    const std::string content =
        "BT /F1 12 Tf 72 700 Td (body text) Tj ET\n"
        "BT /F1 12 Tf 72 200 Td (figure text) Tj ET\n";

    PageOutput out;
    std::string error;
    ASSERT_TRUE(run(content, out, error)) << error;

    EXPECT_TRUE(out.modified);
    EXPECT_EQ(backend_.inputs, (std::vector<std::string>{"body text"}));
    EXPECT_EQ(out.content.find("(body text) Tj"), std::string::npos);
    EXPECT_NE(out.content.find("(figure text) Tj"), std::string::npos);
    EXPECT_EQ(out.stats.spans_translated, 1u);
    EXPECT_EQ(out.stats.spans_protected, 1u);
}

TEST_F(PageInterpreterTest, LinesOfOneRunAreTranslatedTogether) {
    const std::string content = "BT /F1 10 Tf 72 700 Td (first line) Tj 0 -12 Td (second line) Tj ET";

    PageOutput out;
    std::string error;
    ASSERT_TRUE(run(content, out, error)) << error;

    EXPECT_EQ(backend_.inputs, (std::vector<std::string>{"first line second line"}));
    // The line move stays between the two advances.
    const auto first = out.content.find("] TJ");
    const auto move = out.content.find("0 -12 Td");
    const auto second = out.content.find("] TJ", first + 1);
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(move, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, move);
    EXPECT_LT(move, second);
}

TEST_F(PageInterpreterTest, LargeKernBecomesWordSpace) {
    PageOutput out;
    std::string error;
    ASSERT_TRUE(run("BT /F1 12 Tf 72 700 Td [(Hel) -300 (lo) -20 (!)] TJ ET", out, error)) << error;
    EXPECT_EQ(backend_.inputs, (std::vector<std::string>{"Hel lo!"}));
}

TEST_F(PageInterpreterTest, FailedTranslationKeepsOriginal) {
    backend_.script.push_back(TranslateResult::fatal("HTTP 400"));
    const std::string content = "BT /F1 12 Tf 72 700 Td (Hello) Tj ET";

    PageOutput out;
    std::string error;
    ASSERT_TRUE(run(content, out, error)) << error;
    EXPECT_FALSE(out.modified);
    EXPECT_EQ(out.content, content);
    EXPECT_EQ(out.stats.spans_fallback, 1u);
}

TEST_F(PageInterpreterTest, StrictModeFailsOnTranslationError) {
    backend_.script.push_back(TranslateResult::fatal("HTTP 400"));
    InterpreterOptions options;
    options.strict = true;

    PageOutput out;
    std::string error;
    EXPECT_FALSE(run("BT /F1 12 Tf 72 700 Td (Hello) Tj ET", out, error, options));
    EXPECT_NE(error.find("HTTP 400"), std::string::npos);
}

TEST_F(PageInterpreterTest, NumbersOnlySpanIsNotSent) {
    const std::string content = "BT /F1 12 Tf 72 700 Td (12.5 %) Tj ET";
    PageOutput out;
    std::string error;
    ASSERT_TRUE(run(content, out, error)) << error;
    EXPECT_FALSE(out.modified);
    EXPECT_EQ(out.content, content);
    EXPECT_EQ(out.stats.spans_skipped, 1u);
    EXPECT_EQ(backend_.calls, 0);
}

TEST_F(PageInterpreterTest, UnusableFontsAreLeftAlone) {
    for (const std::string content : {
             "BT /T3 12 Tf 72 700 Td (Type three) Tj ET",
             "BT /F9 12 Tf 72 700 Td (Missing font) Tj ET",
             "BT /F1 12 Tf 3 Tr 72 700 Td (Invisible) Tj ET",
         }) {
        PageOutput out;
        std::string error;
        ASSERT_TRUE(run(content, out, error)) << error;
        EXPECT_FALSE(out.modified) << content;
        EXPECT_EQ(out.content, content);
    }
    EXPECT_EQ(backend_.calls, 0);
}

TEST_F(PageInterpreterTest, UnbalancedSavesAreClosedBeforeOverlay) {
    PageOutput out;
    std::string error;
    ASSERT_TRUE(run("q 1 0 0 1 10 0 cm BT /F1 12 Tf 72 700 Td (Hello) Tj ET", out, error)) << error;
    ASSERT_TRUE(out.modified);
    EXPECT_NE(out.content.find("\nQ\nQ\nBT /PMTF0 12 Tf 1 0 0 1 82 700 Tm"), std::string::npos);
}

TEST_F(PageInterpreterTest, OverflowShrinksToMinimumScale) {
    backend_.script.push_back(TranslateResult::success("a much longer translated sentence here"));
    PageOutput out;
    std::string error;
    ASSERT_TRUE(run("BT /F1 12 Tf 72 700 Td (Hello) Tj ET", out, error)) << error;

    EXPECT_NE(out.content.find("BT /PMTF0 6 Tf"), std::string::npos);
    std::size_t overlays = 0;
    for (auto pos = out.content.find("/PMTF0"); pos != std::string::npos; pos = out.content.find("/PMTF0", pos + 1)) {
        ++overlays;
    }
    EXPECT_EQ(overlays, 1u);
}

TEST_F(PageInterpreterTest, MalformedStreamIsAnError) {
    PageOutput out;
    std::string error;
    EXPECT_FALSE(run("BT /F1 12 Tf (never closed Tj ET", out, error));
    EXPECT_NE(error.find("page 1"), std::string::npos);
}

TEST(WrapTextTest, BreaksAtSpaces) {
    AsciiTargetFont font;
    const auto lines = wrap_text(U"aaa bbb ccc", 8.0, 2.0, font);
    EXPECT_EQ(lines, (std::vector<std::u32string>{U"aaa bbb", U"ccc"}));
}

TEST(WrapTextTest, BreaksBetweenCjkCharacters) {
    AsciiTargetFont font;
    const auto lines = wrap_text(U"中文字", 2.0, 2.0, font);
    EXPECT_EQ(lines, (std::vector<std::u32string>{U"中文", U"字"}));
}

TEST(WrapTextTest, OverlongWordKeepsItsOwnLine) {
    AsciiTargetFont font;
    const auto lines = wrap_text(U"ab abcdefghij cd", 8.0, 2.0, font);
    EXPECT_EQ(lines, (std::vector<std::u32string>{U"ab", U"abcdefghij", U"cd"}));
    EXPECT_TRUE(wrap_text(U"   ", 8.0, 2.0, font).empty());
}

}  // namespace
}  // namespace pdf_mt
