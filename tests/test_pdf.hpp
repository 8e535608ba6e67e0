#pragma once

#include <string>
#include <vector>

#include <mupdf/fitz.h>

namespace pdf_mt::test_support {

struct TestPage {
    // Content stream; /F1 is Helvetica with WinAnsi encoding.
    std::string content;
    float width = 612.0f;
    float height = 792.0f;
};

// Builds an uncompressed PDF in memory. Throws std::runtime_error on MuPDF errors.
std::string make_test_pdf(fz_context* ctx, const std::vector<TestPage>& pages);

int pdf_page_count(fz_context* ctx, const std::string& pdf_bytes);

// Text of one page as extracted by MuPDF.
std::string pdf_page_text(fz_context* ctx, const std::string& pdf_bytes, int page_index);

}  // namespace pdf_mt::test_support
