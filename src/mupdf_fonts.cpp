#include "mupdf_fonts.hpp"

#include "log.hpp"

#include <stdexcept>

namespace pdf_mt {

namespace {

bool starts_with_language(const std::string& lang, const char* prefix) {
    const std::string p(prefix);
    return lang.size() >= p.size() && lang.compare(0, p.size(), p) == 0 &&
        (lang.size() == p.size() || lang[p.size()] == '-' || lang[p.size()] == '_');
}

int cjk_ordering_for(const std::string& lang) {
    if (starts_with_language(lang, "ja")) {
        return FZ_ADOBE_JAPAN;
    }
    if (starts_with_language(lang, "ko")) {
        return FZ_ADOBE_KOREA;
    }
    if (lang == "zh-TW" || lang == "zh-HK" || lang == "zh-Hant" || lang == "zh_TW") {
        return FZ_ADOBE_CNS;
    }
    if (starts_with_language(lang, "zh")) {
        return FZ_ADOBE_GB;
    }
    return -1;
}

class MuPdfTargetFont final : public TargetFont {
public:
    MuPdfTargetFont(fz_context* ctx, fz_font* font, TargetFontKind kind) : ctx_(ctx), font_(font), kind_(kind) {}

    double advance(std::uint32_t rune) const override {
        const auto cached = advances_.find(rune);
        if (cached != advances_.end()) {
            return cached->second;
        }

        std::uint32_t drawn = rune;
        if (kind_ == TargetFontKind::Latin && fz_windows_1252_from_unicode(static_cast<int>(rune)) <= 0) {
            drawn = '?';
        }

        const int gid = glyph_for(drawn);
        float width = 0.5f;
        fz_try(ctx_) {
            width = fz_advance_glyph(ctx_, font_, gid, 0);
        }
        fz_catch(ctx_) {
            log_debug(std::string("glyph advance failed: ") + fz_caught_message(ctx_));
            width = 0.5f;
        }

        advances_.emplace(rune, static_cast<double>(width));
        return width;
    }

    std::string encode(std::uint32_t rune) const override {
        if (kind_ == TargetFontKind::Latin) {
            int code = fz_windows_1252_from_unicode(static_cast<int>(rune));
            if (code <= 0) {
                code = '?';
            }
            return std::string(1, static_cast<char>(code));
        }

        const int gid = glyph_for(rune);
        if (gid <= 0) {
            return {};
        }
        std::string out;
        out.push_back(static_cast<char>((gid >> 8) & 0xFF));
        out.push_back(static_cast<char>(gid & 0xFF));
        return out;
    }

private:
    int glyph_for(std::uint32_t rune) const {
        int gid = 0;
        fz_try(ctx_) {
            gid = fz_encode_character(ctx_, font_, static_cast<int>(rune));
        }
        fz_catch(ctx_) {
            gid = 0;
        }
        return gid;
    }

    fz_context* ctx_ = nullptr;
    fz_font* font_ = nullptr;
    TargetFontKind kind_ = TargetFontKind::Latin;
    mutable std::unordered_map<std::uint32_t, double> advances_;
};

}  // namespace

MuPdfFontInfo::MuPdfFontInfo(fz_context* ctx, pdf_font_desc* desc) : ctx_(ctx), desc_(desc) {}

MuPdfFontInfo::~MuPdfFontInfo() {
    if (desc_ != nullptr) {
        pdf_drop_font(ctx_, desc_);
        desc_ = nullptr;
    }
}

std::vector<DecodedGlyph> MuPdfFontInfo::decode(std::string_view bytes) const {
    std::vector<DecodedGlyph> glyphs;
    auto* s = reinterpret_cast<unsigned char*>(const_cast<char*>(bytes.data()));
    auto* end = s + bytes.size();

    while (s < end) {
        unsigned int cpt = *s;
        int len = 1;
        if (desc_->encoding != nullptr) {
            len = pdf_decode_cmap(desc_->encoding, s, end, &cpt);
            if (len <= 0) {
                len = 1;
                cpt = *s;
            }
        }
        const int cid = desc_->encoding != nullptr ? pdf_lookup_cmap(desc_->encoding, cpt) : static_cast<int>(cpt);

        DecodedGlyph glyph;
        glyph.word_space = len == 1 && cpt == 32;
        if (cid >= 0) {
            glyph.width = pdf_lookup_hmtx(ctx_, desc_, cid).w;

            int ucs[8] = {0};
            int count = 0;
            if (desc_->to_unicode != nullptr) {
                count = pdf_lookup_cmap_full(desc_->to_unicode, static_cast<unsigned int>(cid), ucs);
            }
            if (count <= 0 && desc_->cid_to_ucs != nullptr && static_cast<std::size_t>(cid) < desc_->cid_to_ucs_len) {
                ucs[0] = desc_->cid_to_ucs[cid];
                count = 1;
            }
            for (int i = 0; i < count && i < 8; ++i) {
                if (ucs[i] > 0) {
                    glyph.unicode.push_back(static_cast<char32_t>(ucs[i]));
                }
            }
        }

        glyphs.push_back(std::move(glyph));
        s += len;
    }

    return glyphs;
}

bool MuPdfFontInfo::is_type3() const {
    return desc_->font != nullptr && fz_font_t3_procs(ctx_, desc_->font) != nullptr;
}

TargetFontSource::TargetFontSource(fz_context* ctx, fz_font* font, TargetFontKind kind)
    : ctx_(ctx), font_(font), kind_(kind) {}

TargetFontSource::~TargetFontSource() {
    if (font_ != nullptr) {
        fz_drop_font(ctx_, font_);
        font_ = nullptr;
    }
}

std::unique_ptr<TargetFontSource> TargetFontSource::create(
    fz_context* ctx,
    const std::string& lang_out,
    const std::string& font_path,
    std::string& error
) {
    fz_font* font = nullptr;
    TargetFontKind kind = TargetFontKind::Latin;
    const int ordering = cjk_ordering_for(lang_out);

    fz_var(font);
    fz_try(ctx) {
        if (!font_path.empty()) {
            font = fz_new_font_from_file(ctx, nullptr, font_path.c_str(), 0, 0);
            kind = TargetFontKind::Cid;
        } else if (ordering >= 0) {
            font = fz_new_cjk_font(ctx, ordering);
            kind = TargetFontKind::Cid;
        } else {
            font = fz_new_base14_font(ctx, "Times-Roman");
            kind = TargetFontKind::Latin;
        }
    }
    fz_catch(ctx) {
        error = std::string("Failed to load target font: ") + fz_caught_message(ctx);
        return nullptr;
    }

    return std::unique_ptr<TargetFontSource>(new TargetFontSource(ctx, font, kind));
}

std::unique_ptr<TargetFont> TargetFontSource::bind(fz_context* ctx) const {
    return std::make_unique<MuPdfTargetFont>(ctx, font_, kind_);
}

pdf_obj* TargetFontSource::add_to_document(fz_context* ctx, pdf_document* doc) const {
    if (kind_ == TargetFontKind::Cid) {
        return pdf_add_cid_font(ctx, doc, font_);
    }
    return pdf_add_simple_font(ctx, doc, font_, PDF_SIMPLE_ENCODING_LATIN);
}

}  // namespace pdf_mt
