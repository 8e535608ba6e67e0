#pragma once

#include "page_interpreter.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

namespace pdf_mt {

// A loaded page font, decoded with the context of the worker that loaded it.
class MuPdfFontInfo final : public PdfFontInfo {
public:
    MuPdfFontInfo(fz_context* ctx, pdf_font_desc* desc);
    ~MuPdfFontInfo() override;

    MuPdfFontInfo(const MuPdfFontInfo&) = delete;
    MuPdfFontInfo& operator=(const MuPdfFontInfo&) = delete;

    std::vector<DecodedGlyph> decode(std::string_view bytes) const override;
    bool is_type3() const override;

private:
    fz_context* ctx_ = nullptr;
    pdf_font_desc* desc_ = nullptr;
};

enum class TargetFontKind {
    // Embedded as a Type0 font with Identity-H, two-byte glyph ids.
    Cid,
    // Times-Roman with WinAnsi encoding, one byte per character.
    Latin
};

// The font translated text is drawn with, chosen once per run from the
// target language and an optional font file.
class TargetFontSource {
public:
    ~TargetFontSource();

    TargetFontSource(const TargetFontSource&) = delete;
    TargetFontSource& operator=(const TargetFontSource&) = delete;

    // font_path wins; otherwise zh/ja/ko targets get the built-in CJK font, everything else Times-Roman.
    static std::unique_ptr<TargetFontSource> create(
        fz_context* ctx,
        const std::string& lang_out,
        const std::string& font_path,
        std::string& error
    );

    TargetFontKind kind() const { return kind_; }
    fz_font* font() const { return font_; }

    // Measuring and encoding view for one worker context.
    std::unique_ptr<TargetFont> bind(fz_context* ctx) const;

    // Adds the font to doc and returns a new reference to its dictionary; throws through fz_try.
    pdf_obj* add_to_document(fz_context* ctx, pdf_document* doc) const;

private:
    TargetFontSource(fz_context* ctx, fz_font* font, TargetFontKind kind);

    fz_context* ctx_ = nullptr;
    fz_font* font_ = nullptr;
    TargetFontKind kind_ = TargetFontKind::Latin;
};

}  // namespace pdf_mt
