#include "document_assembler.hpp"

#include "log.hpp"
#include "page_interpreter.hpp"

#include <mutex>

namespace pdf_mt {

namespace {

bool apply_patches(
    fz_context* ctx,
    pdf_document* doc,
    const ObjectPatch& patches,
    const TargetFontSource& target_font,
    std::string& error
) {
    pdf_obj* font_ref = nullptr;
    pdf_obj* stream_ref = nullptr;
    fz_buffer* payload = nullptr;

    fz_var(font_ref);
    fz_var(stream_ref);
    fz_var(payload);
    fz_try(ctx) {
        font_ref = target_font.add_to_document(ctx, doc);

        for (auto it = patches.begin(); it != patches.end(); ++it) {
            const int object_number = it->first;
            const PagePatch& patch = it->second;

            payload = fz_new_buffer_from_copied_data(
                ctx,
                reinterpret_cast<const unsigned char*>(patch.content.data()),
                patch.content.size()
            );
            stream_ref = pdf_new_indirect(ctx, doc, object_number, 0);
            pdf_update_stream(ctx, doc, stream_ref, payload, 0);
            pdf_drop_obj(ctx, stream_ref);
            stream_ref = nullptr;
            fz_drop_buffer(ctx, payload);
            payload = nullptr;

            pdf_obj* page_obj = pdf_lookup_page_obj(ctx, doc, patch.page_index);
            pdf_obj* resources = pdf_dict_get(ctx, page_obj, PDF_NAME(Resources));
            if (resources == nullptr) {
                // Inherited resources are copied onto the page so the font entry stays local to it.
                pdf_obj* inherited = pdf_dict_get_inheritable(ctx, page_obj, PDF_NAME(Resources));
                pdf_obj* own = inherited != nullptr ? pdf_copy_dict(ctx, inherited) : pdf_new_dict(ctx, doc, 2);
                pdf_dict_put_drop(ctx, page_obj, PDF_NAME(Resources), own);
                resources = own;
            }

            pdf_obj* fonts = pdf_dict_get(ctx, resources, PDF_NAME(Font));
            if (fonts == nullptr) {
                fonts = pdf_dict_put_dict(ctx, resources, PDF_NAME(Font), 2);
            }
            if (pdf_dict_gets(ctx, fonts, kOverlayFontName) == nullptr) {
                pdf_dict_puts(ctx, fonts, kOverlayFontName, font_ref);
            }
        }
    }
    fz_always(ctx) {
        fz_drop_buffer(ctx, payload);
        pdf_drop_obj(ctx, stream_ref);
        pdf_drop_obj(ctx, font_ref);
    }
    fz_catch(ctx) {
        error = std::string("Failed to apply page patches: ") + fz_caught_message(ctx);
        return false;
    }
    return true;
}

void subset_fonts(fz_context* ctx, pdf_document* doc, const char* label) {
    fz_try(ctx) {
        pdf_subset_fonts(ctx, doc, 0, nullptr);
    }
    fz_catch(ctx) {
        log_warn(std::string("font subsetting skipped for ") + label + " output: " + fz_caught_message(ctx));
    }
}

bool build_dual(
    fz_context* ctx,
    const std::string& original_bytes,
    pdf_document* translated,
    int page_count,
    const AssembleOptions& options,
    AssembledOutput& out,
    std::string& error
) {
    pdf_document* dual = nullptr;
    pdf_graft_map* map = nullptr;
    bool ok = true;

    fz_var(dual);
    fz_var(map);
    fz_try(ctx) {
        dual = open_pdf_from_memory(ctx, original_bytes);
        map = pdf_new_graft_map(ctx, dual);
        // After k insertions original page k sits at 2k; its translation goes right behind it.
        for (int k = 0; k < page_count; ++k) {
            pdf_graft_mapped_page(ctx, map, 2 * k + 1, translated, k);
        }
        out.dual_pages = pdf_count_pages(ctx, dual);
    }
    fz_catch(ctx) {
        error = std::string("Failed to build dual document: ") + fz_caught_message(ctx);
        ok = false;
    }

    if (ok) {
        if (!options.skip_subset_fonts) {
            subset_fonts(ctx, dual, "dual");
        }
        ok = write_pdf_to_string(ctx, dual, out.dual, error);
    }

    pdf_drop_graft_map(ctx, map);
    pdf_drop_document(ctx, dual);
    return ok;
}

}  // namespace

bool write_pdf_to_string(fz_context* ctx, pdf_document* doc, std::string& out_bytes, std::string& error) {
    pdf_write_options opts = pdf_default_write_options;
    opts.do_compress = 1;
    opts.do_compress_fonts = 1;
    opts.do_compress_images = 0;
    opts.do_garbage = 3;
    opts.do_use_objstms = 1;

    fz_buffer* buffer = nullptr;
    fz_output* output = nullptr;
    bool ok = true;

    fz_var(buffer);
    fz_var(output);
    fz_try(ctx) {
        buffer = fz_new_buffer(ctx, 64 * 1024);
        output = fz_new_output_with_buffer(ctx, buffer);
        pdf_write_document(ctx, doc, output, &opts);
        fz_close_output(ctx, output);
    }
    fz_always(ctx) {
        fz_drop_output(ctx, output);
    }
    fz_catch(ctx) {
        error = std::string("Failed to serialize PDF: ") + fz_caught_message(ctx);
        ok = false;
    }

    if (ok) {
        unsigned char* data = nullptr;
        const std::size_t size = fz_buffer_storage(ctx, buffer, &data);
        out_bytes.assign(reinterpret_cast<const char*>(data), size);
    }
    fz_drop_buffer(ctx, buffer);
    return ok;
}

bool assemble_document(
    fz_context* ctx,
    WorkingDocument& document,
    const ObjectPatch& patches,
    const TargetFontSource& target_font,
    const AssembleOptions& options,
    AssembledOutput& out,
    std::string& error
) {
    std::lock_guard<std::mutex> lock(document.mutex());
    out = AssembledOutput{};
    pdf_document* translated = document.translated();

    if (!patches.empty() && !apply_patches(ctx, translated, patches, target_font, error)) {
        return false;
    }

    if (!options.skip_subset_fonts && !patches.empty()) {
        subset_fonts(ctx, translated, "mono");
    }

    if (!write_pdf_to_string(ctx, translated, out.mono, error)) {
        return false;
    }
    out.mono_pages = document.page_count();

    if (!build_dual(ctx, document.original_bytes(), translated, document.page_count(), options, out, error)) {
        return false;
    }

    if (out.dual_pages != 2 * out.mono_pages) {
        error = "Dual document has " + std::to_string(out.dual_pages) + " pages, expected " +
            std::to_string(2 * out.mono_pages);
        return false;
    }

    log_debug(
        "assembled " + std::to_string(patches.size()) + " patched pages, mono=" + std::to_string(out.mono.size()) +
        " bytes, dual=" + std::to_string(out.dual.size()) + " bytes"
    );
    return true;
}

}  // namespace pdf_mt
