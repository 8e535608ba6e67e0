#include "document_assembler.hpp"

#include "mupdf_context.hpp"
#include "test_pdf.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace pdf_mt {
namespace {

using test_support::make_test_pdf;
using test_support::pdf_page_count;
using test_support::pdf_page_text;

bool page_has_overlay_font(fz_context* ctx, const std::string& pdf_bytes, int page_index) {
    pdf_document* doc = nullptr;
    bool found = false;
    bool ok = true;

    fz_var(doc);
    fz_try(ctx) {
        doc = open_pdf_from_memory(ctx, pdf_bytes);
        pdf_obj* page = pdf_lookup_page_obj(ctx, doc, page_index);
        found = pdf_dict_getp(ctx, page, "Resources/Font/PMTF0") != nullptr;
    }
    fz_always(ctx) {
        pdf_drop_document(ctx, doc);
    }
    fz_catch(ctx) {
        ok = false;
    }
    return ok && found;
}

class DocumentAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string error;
        font_ = TargetFontSource::create(mupdf_.get(), "en", "", error);
        ASSERT_NE(font_, nullptr) << error;

        source_ = make_test_pdf(
            mupdf_.get(),
            {
                {"BT /F1 12 Tf 72 700 Td (First page) Tj ET"},
                {"BT /F1 12 Tf 72 700 Td (Second page) Tj ET"},
            }
        );
        document_ = WorkingDocument::open(mupdf_.get(), source_, error);
        ASSERT_NE(document_, nullptr) << error;
        options_.skip_subset_fonts = true;
    }

    void TearDown() override {
        document_.reset();
        font_.reset();
    }

    MuPdfContext mupdf_;
    std::unique_ptr<TargetFontSource> font_;
    std::string source_;
    std::unique_ptr<WorkingDocument> document_;
    AssembleOptions options_;
};

TEST_F(DocumentAssemblerTest, WithoutPatchesBothOutputsMirrorSource) {
    AssembledOutput out;
    std::string error;
    ASSERT_TRUE(assemble_document(mupdf_.get(), *document_, {}, *font_, options_, out, error)) << error;

    EXPECT_EQ(out.mono_pages, 2);
    EXPECT_EQ(out.dual_pages, 4);
    EXPECT_EQ(pdf_page_count(mupdf_.get(), out.mono), 2);
    EXPECT_EQ(pdf_page_count(mupdf_.get(), out.dual), 4);
    EXPECT_NE(pdf_page_text(mupdf_.get(), out.mono, 1).find("Second page"), std::string::npos);
    EXPECT_FALSE(page_has_overlay_font(mupdf_.get(), out.mono, 0));
}

TEST_F(DocumentAssemblerTest, PatchedPageIsRewrittenAndInterleaved) {
    fz_context* ctx = mupdf_.get();
    int object_number = 0;
    std::string error;
    ASSERT_TRUE(document_->commit_page_stream(ctx, 0, object_number, error)) << error;
    ASSERT_GT(object_number, 0);

    ObjectPatch patches;
    patches[object_number] = PagePatch{
        0,
        "BT /F1 12 Tf 72 700 Td (Patched body) Tj ET\nBT /PMTF0 12 Tf 1 0 0 1 72 600 Tm (Overlay) Tj ET\n",
    };

    AssembledOutput out;
    ASSERT_TRUE(assemble_document(ctx, *document_, patches, *font_, options_, out, error)) << error;

    const std::string mono_first = pdf_page_text(ctx, out.mono, 0);
    EXPECT_NE(mono_first.find("Patched body"), std::string::npos);
    EXPECT_NE(mono_first.find("Overlay"), std::string::npos);
    EXPECT_EQ(mono_first.find("First page"), std::string::npos);
    EXPECT_NE(pdf_page_text(ctx, out.mono, 1).find("Second page"), std::string::npos);
    EXPECT_TRUE(page_has_overlay_font(ctx, out.mono, 0));
    EXPECT_FALSE(page_has_overlay_font(ctx, out.mono, 1));

    ASSERT_EQ(pdf_page_count(ctx, out.dual), 4);
    EXPECT_NE(pdf_page_text(ctx, out.dual, 0).find("First page"), std::string::npos);
    EXPECT_NE(pdf_page_text(ctx, out.dual, 1).find("Patched body"), std::string::npos);
    EXPECT_NE(pdf_page_text(ctx, out.dual, 2).find("Second page"), std::string::npos);
    EXPECT_NE(pdf_page_text(ctx, out.dual, 3).find("Second page"), std::string::npos);
}

TEST_F(DocumentAssemblerTest, SubsettingDoesNotBreakOutput) {
    options_.skip_subset_fonts = false;
    fz_context* ctx = mupdf_.get();
    int object_number = 0;
    std::string error;
    ASSERT_TRUE(document_->commit_page_stream(ctx, 1, object_number, error)) << error;

    ObjectPatch patches;
    patches[object_number] = PagePatch{1, "BT /PMTF0 10 Tf 1 0 0 1 72 700 Tm (Zweite Seite) Tj ET\n"};

    AssembledOutput out;
    ASSERT_TRUE(assemble_document(ctx, *document_, patches, *font_, options_, out, error)) << error;
    EXPECT_EQ(pdf_page_count(ctx, out.mono), 2);
    EXPECT_NE(pdf_page_text(ctx, out.mono, 1).find("Zweite Seite"), std::string::npos);
}

TEST(WorkingDocumentTest, RejectsGarbage) {
    MuPdfContext mupdf;
    std::string error;
    EXPECT_EQ(WorkingDocument::open(mupdf.get(), "definitely not a pdf", error), nullptr);
    EXPECT_FALSE(error.empty());
}

TEST(WorkingDocumentTest, LoadsPageContentAndFonts) {
    MuPdfContext mupdf;
    const std::string bytes = make_test_pdf(mupdf.get(), {{"BT /F1 12 Tf 72 700 Td (Hello) Tj ET", 300.0f, 400.0f}});
    std::string error;
    auto document = WorkingDocument::open(mupdf.get(), bytes, error);
    ASSERT_NE(document, nullptr) << error;
    ASSERT_EQ(document->page_count(), 1);

    LoadedPage page;
    ASSERT_TRUE(document->load_page(mupdf.get(), 0, page, error)) << error;
    EXPECT_NE(page.content.content.find("(Hello) Tj"), std::string::npos);
    EXPECT_EQ(page.raster_width, 300u);
    EXPECT_EQ(page.raster_height, 400u);
    ASSERT_EQ(page.content.fonts.count("F1"), 1u);

    const auto glyphs = page.content.fonts.at("F1")->decode("Hi");
    ASSERT_EQ(glyphs.size(), 2u);
    EXPECT_EQ(glyphs[0].unicode, U"H");
    EXPECT_GT(glyphs[0].width, 0.0);

    // User space y=0 is the bottom of the page, which is the last raster row.
    const Point bottom = page.content.user_to_device.apply(0.0, 0.0);
    EXPECT_NEAR(bottom.y, 400.0, 1e-6);

    PageImage image;
    ASSERT_TRUE(document->render_page(mupdf.get(), 0, image, error)) << error;
    EXPECT_EQ(image.width, 300);
    EXPECT_EQ(image.height, 400);
    EXPECT_EQ(image.samples.size(), 300u * 400u * 3u);

    EXPECT_FALSE(document->load_page(mupdf.get(), 5, page, error));
}

}  // namespace
}  // namespace pdf_mt
