#include "working_document.hpp"

#include "log.hpp"
#include "mupdf_fonts.hpp"

#include <algorithm>
#include <utility>

namespace pdf_mt {

pdf_document* open_pdf_from_memory(fz_context* ctx, const std::string& bytes) {
    fz_buffer* buf = nullptr;
    fz_stream* stm = nullptr;
    pdf_document* doc = nullptr;

    fz_var(buf);
    fz_var(stm);
    fz_try(ctx) {
        buf = fz_new_buffer_from_copied_data(ctx, reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
        stm = fz_open_buffer(ctx, buf);
        doc = pdf_open_document_with_stream(ctx, stm);
    }
    fz_always(ctx) {
        fz_drop_stream(ctx, stm);
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        fz_rethrow(ctx);
    }
    return doc;
}

WorkingDocument::WorkingDocument(fz_context* ctx, std::string bytes) : ctx_(ctx), bytes_(std::move(bytes)) {}

WorkingDocument::~WorkingDocument() {
    pdf_drop_document(ctx_, translated_);
    pdf_drop_document(ctx_, original_);
    translated_ = nullptr;
    original_ = nullptr;
}

std::unique_ptr<WorkingDocument> WorkingDocument::open(fz_context* ctx, std::string bytes, std::string& error) {
    std::unique_ptr<WorkingDocument> doc(new WorkingDocument(ctx, std::move(bytes)));

    bool locked = false;
    fz_try(ctx) {
        doc->original_ = open_pdf_from_memory(ctx, doc->bytes_);
        doc->translated_ = open_pdf_from_memory(ctx, doc->bytes_);
        locked = pdf_needs_password(ctx, doc->translated_) != 0;
        if (!locked) {
            doc->page_count_ = pdf_count_pages(ctx, doc->translated_);
        }
    }
    fz_catch(ctx) {
        error = std::string("Failed to open PDF: ") + fz_caught_message(ctx);
        return nullptr;
    }

    if (locked) {
        error = "PDF is password protected";
        return nullptr;
    }
    return doc;
}

bool WorkingDocument::render_page(fz_context* ctx, int page_index, PageImage& out_image, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    fz_pixmap* pix = nullptr;
    fz_var(pix);
    fz_try(ctx) {
        pix = fz_new_pixmap_from_page_number(ctx, &original_->super, page_index, fz_identity, fz_device_rgb(ctx), 0);
    }
    fz_catch(ctx) {
        error = "Failed to render page " + std::to_string(page_index + 1) + ": " + fz_caught_message(ctx);
        return false;
    }

    out_image = PageImage{};
    out_image.page_index = page_index;
    out_image.width = fz_pixmap_width(ctx, pix);
    out_image.height = fz_pixmap_height(ctx, pix);
    out_image.components = fz_pixmap_components(ctx, pix);

    const std::size_t row_bytes = static_cast<std::size_t>(out_image.width) * static_cast<std::size_t>(out_image.components);
    const std::ptrdiff_t stride = fz_pixmap_stride(ctx, pix);
    const unsigned char* samples = fz_pixmap_samples(ctx, pix);
    out_image.samples.resize(row_bytes * static_cast<std::size_t>(out_image.height));
    for (int y = 0; y < out_image.height; ++y) {
        std::copy_n(samples + y * stride, row_bytes, out_image.samples.begin() + static_cast<std::ptrdiff_t>(row_bytes) * y);
    }

    fz_drop_pixmap(ctx, pix);
    return true;
}

bool WorkingDocument::load_page(fz_context* ctx, int page_index, LoadedPage& out_page, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    out_page = LoadedPage{};
    out_page.content.page_index = page_index;

    pdf_page* page = nullptr;
    fz_buffer* joined = nullptr;
    pdf_obj* resources = nullptr;
    fz_rect mediabox = fz_empty_rect;
    fz_matrix ctm = fz_identity;
    bool ok = true;

    fz_var(page);
    fz_var(joined);
    fz_try(ctx) {
        page = pdf_load_page(ctx, translated_, page_index);
        pdf_page_transform(ctx, page, &mediabox, &ctm);
        joined = fz_new_buffer(ctx, 4096);

        pdf_obj* contents = pdf_page_contents(ctx, page);
        if (pdf_is_array(ctx, contents)) {
            const int parts = pdf_array_len(ctx, contents);
            for (int i = 0; i < parts; ++i) {
                pdf_obj* part = pdf_array_get(ctx, contents, i);
                if (!pdf_is_stream(ctx, part)) {
                    continue;
                }
                fz_buffer* data = pdf_load_stream(ctx, part);
                fz_append_buffer(ctx, joined, data);
                fz_drop_buffer(ctx, data);
                // Parts may split an operator anywhere except inside a token.
                fz_append_byte(ctx, joined, '\n');
            }
        } else if (pdf_is_stream(ctx, contents)) {
            fz_buffer* data = pdf_load_stream(ctx, contents);
            fz_append_buffer(ctx, joined, data);
            fz_drop_buffer(ctx, data);
        }

        resources = pdf_page_resources(ctx, page);
    }
    fz_catch(ctx) {
        error = "Failed to load page " + std::to_string(page_index + 1) + ": " + fz_caught_message(ctx);
        ok = false;
    }

    if (ok) {
        unsigned char* data = nullptr;
        const std::size_t size = fz_buffer_storage(ctx, joined, &data);
        out_page.content.content.assign(reinterpret_cast<const char*>(data), size);

        out_page.content.user_to_device = Matrix{ctm.a, ctm.b, ctm.c, ctm.d, ctm.e, ctm.f};
        const fz_irect bounds = fz_round_rect(fz_transform_rect(mediabox, ctm));
        out_page.raster_width = static_cast<std::size_t>(std::max(0, bounds.x1 - bounds.x0));
        out_page.raster_height = static_cast<std::size_t>(std::max(0, bounds.y1 - bounds.y0));

        pdf_obj* font_dict = nullptr;
        int font_count = 0;
        fz_try(ctx) {
            font_dict = pdf_dict_get(ctx, resources, PDF_NAME(Font));
            font_count = pdf_dict_len(ctx, font_dict);
        }
        fz_catch(ctx) {
            log_debug("page " + std::to_string(page_index + 1) + ": unreadable font resources: " + fz_caught_message(ctx));
            font_count = 0;
        }

        for (int i = 0; i < font_count; ++i) {
            const char* name = nullptr;
            pdf_font_desc* desc = nullptr;
            fz_try(ctx) {
                name = pdf_to_name(ctx, pdf_dict_get_key(ctx, font_dict, i));
                desc = pdf_load_font(ctx, translated_, resources, pdf_dict_get_val(ctx, font_dict, i));
            }
            fz_catch(ctx) {
                log_debug("page " + std::to_string(page_index + 1) + ": font not loaded: " + fz_caught_message(ctx));
                continue;
            }
            if (desc != nullptr) {
                out_page.content.fonts[name] = std::make_shared<MuPdfFontInfo>(ctx, desc);
            }
        }
    }

    fz_drop_buffer(ctx, joined);
    pdf_drop_page(ctx, page);
    return ok;
}

bool WorkingDocument::commit_page_stream(fz_context* ctx, int page_index, int& out_object_number, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    pdf_obj* placeholder = nullptr;
    pdf_obj* ref = nullptr;
    int num = 0;

    fz_var(placeholder);
    fz_var(ref);
    fz_try(ctx) {
        pdf_obj* page_obj = pdf_lookup_page_obj(ctx, translated_, page_index);
        num = pdf_create_object(ctx, translated_);
        placeholder = pdf_new_dict(ctx, translated_, 1);
        pdf_update_object(ctx, translated_, num, placeholder);
        ref = pdf_new_indirect(ctx, translated_, num, 0);
        pdf_dict_put(ctx, page_obj, PDF_NAME(Contents), ref);
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, ref);
        pdf_drop_obj(ctx, placeholder);
    }
    fz_catch(ctx) {
        error = "Failed to allocate content stream for page " + std::to_string(page_index + 1) + ": " +
            fz_caught_message(ctx);
        return false;
    }

    out_object_number = num;
    return true;
}

}  // namespace pdf_mt
