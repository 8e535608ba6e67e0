#pragma once

#include "mupdf_fonts.hpp"
#include "working_document.hpp"

#include <map>
#include <string>

#include <mupdf/fitz.h>

namespace pdf_mt {

struct PagePatch {
    int page_index = 0;
    std::string content;
};

// Object number of a page's new content stream -> the payload it receives.
using ObjectPatch = std::map<int, PagePatch>;

struct AssembleOptions {
    bool skip_subset_fonts = false;
};

struct AssembledOutput {
    std::string mono;
    std::string dual;
    int mono_pages = 0;
    int dual_pages = 0;
};

// Applies the patches to the translated document, registers the target font on
// every patched page and writes both outputs. The dual output interleaves each
// original page with its translation.
bool assemble_document(
    fz_context* ctx,
    WorkingDocument& document,
    const ObjectPatch& patches,
    const TargetFontSource& target_font,
    const AssembleOptions& options,
    AssembledOutput& out,
    std::string& error
);

// Serializes doc with compression, garbage collection and object streams.
bool write_pdf_to_string(fz_context* ctx, pdf_document* doc, std::string& out_bytes, std::string& error);

}  // namespace pdf_mt
