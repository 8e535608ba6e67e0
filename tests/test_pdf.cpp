#include "test_pdf.hpp"

#include "document_assembler.hpp"
#include "working_document.hpp"

#include <stdexcept>

#include <mupdf/pdf.h>

namespace pdf_mt::test_support {

namespace {

pdf_document* open_or_throw(fz_context* ctx, const std::string& pdf_bytes) {
    pdf_document* doc = nullptr;
    fz_try(ctx) {
        doc = open_pdf_from_memory(ctx, pdf_bytes);
    }
    fz_catch(ctx) {
        throw std::runtime_error(std::string("test pdf open failed: ") + fz_caught_message(ctx));
    }
    return doc;
}

}  // namespace

std::string make_test_pdf(fz_context* ctx, const std::vector<TestPage>& pages) {
    pdf_document* doc = nullptr;
    pdf_obj* font = nullptr;
    pdf_obj* font_ref = nullptr;
    pdf_obj* resources = nullptr;
    pdf_obj* page_obj = nullptr;
    fz_buffer* contents = nullptr;
    bool ok = true;
    std::string message;

    fz_var(doc);
    fz_var(font);
    fz_var(font_ref);
    fz_var(resources);
    fz_var(page_obj);
    fz_var(contents);
    fz_try(ctx) {
        doc = pdf_create_document(ctx);

        font = pdf_new_dict(ctx, doc, 4);
        pdf_dict_put(ctx, font, PDF_NAME(Type), PDF_NAME(Font));
        pdf_dict_put(ctx, font, PDF_NAME(Subtype), PDF_NAME(Type1));
        pdf_dict_put_name(ctx, font, PDF_NAME(BaseFont), "Helvetica");
        pdf_dict_put(ctx, font, PDF_NAME(Encoding), PDF_NAME(WinAnsiEncoding));
        font_ref = pdf_add_object(ctx, doc, font);

        for (const TestPage& page : pages) {
            resources = pdf_new_dict(ctx, doc, 1);
            pdf_obj* fonts = pdf_dict_put_dict(ctx, resources, PDF_NAME(Font), 1);
            pdf_dict_puts(ctx, fonts, "F1", font_ref);

            contents = fz_new_buffer_from_copied_data(
                ctx,
                reinterpret_cast<const unsigned char*>(page.content.data()),
                page.content.size()
            );
            page_obj = pdf_add_page(ctx, doc, fz_make_rect(0, 0, page.width, page.height), 0, resources, contents);
            pdf_insert_page(ctx, doc, -1, page_obj);

            pdf_drop_obj(ctx, page_obj);
            page_obj = nullptr;
            fz_drop_buffer(ctx, contents);
            contents = nullptr;
            pdf_drop_obj(ctx, resources);
            resources = nullptr;
        }
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, page_obj);
        fz_drop_buffer(ctx, contents);
        pdf_drop_obj(ctx, resources);
        pdf_drop_obj(ctx, font_ref);
        pdf_drop_obj(ctx, font);
    }
    fz_catch(ctx) {
        ok = false;
        message = fz_caught_message(ctx);
    }

    if (!ok) {
        pdf_drop_document(ctx, doc);
        throw std::runtime_error("test pdf build failed: " + message);
    }

    std::string bytes;
    std::string error;
    const bool written = write_pdf_to_string(ctx, doc, bytes, error);
    pdf_drop_document(ctx, doc);
    if (!written) {
        throw std::runtime_error(error);
    }
    return bytes;
}

int pdf_page_count(fz_context* ctx, const std::string& pdf_bytes) {
    pdf_document* doc = open_or_throw(ctx, pdf_bytes);
    int count = 0;
    fz_try(ctx) {
        count = pdf_count_pages(ctx, doc);
    }
    fz_catch(ctx) {
        count = -1;
    }
    pdf_drop_document(ctx, doc);
    return count;
}

std::string pdf_page_text(fz_context* ctx, const std::string& pdf_bytes, int page_index) {
    pdf_document* doc = open_or_throw(ctx, pdf_bytes);
    fz_stext_page* text = nullptr;
    fz_buffer* buffer = nullptr;
    bool ok = true;
    std::string message;

    fz_var(text);
    fz_var(buffer);
    fz_try(ctx) {
        text = fz_new_stext_page_from_page_number(ctx, &doc->super, page_index, nullptr);
        buffer = fz_new_buffer_from_stext_page(ctx, text);
    }
    fz_catch(ctx) {
        ok = false;
        message = fz_caught_message(ctx);
    }

    std::string out;
    if (ok) {
        unsigned char* data = nullptr;
        const std::size_t size = fz_buffer_storage(ctx, buffer, &data);
        out.assign(reinterpret_cast<const char*>(data), size);
    }
    fz_drop_buffer(ctx, buffer);
    fz_drop_stext_page(ctx, text);
    pdf_drop_document(ctx, doc);

    if (!ok) {
        throw std::runtime_error("text extraction failed: " + message);
    }
    return out;
}

}  // namespace pdf_mt::test_support
