#pragma once

#include "layout_detector.hpp"
#include "page_interpreter.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

namespace pdf_mt {

struct LoadedPage {
    PageContent content;
    // Page bounds in raster pixels at 72 dpi.
    std::size_t raster_width = 0;
    std::size_t raster_height = 0;
};

// The pristine original plus the translated copy of one input file.
// Every call takes the document mutex; the context argument is the caller's own clone.
class WorkingDocument {
public:
    ~WorkingDocument();

    WorkingDocument(const WorkingDocument&) = delete;
    WorkingDocument& operator=(const WorkingDocument&) = delete;

    static std::unique_ptr<WorkingDocument> open(fz_context* ctx, std::string bytes, std::string& error);

    int page_count() const { return page_count_; }
    const std::string& original_bytes() const { return bytes_; }

    bool render_page(fz_context* ctx, int page_index, PageImage& out_image, std::string& error);
    bool load_page(fz_context* ctx, int page_index, LoadedPage& out_page, std::string& error);

    // Allocates an empty object for the page's new content stream and points the
    // page's Contents at it. The stream payload itself is applied by the assembler.
    bool commit_page_stream(fz_context* ctx, int page_index, int& out_object_number, std::string& error);

    pdf_document* translated() const { return translated_; }
    std::mutex& mutex() { return mutex_; }

private:
    WorkingDocument(fz_context* ctx, std::string bytes);

    fz_context* ctx_ = nullptr;
    std::string bytes_;
    pdf_document* original_ = nullptr;
    pdf_document* translated_ = nullptr;
    int page_count_ = 0;
    std::mutex mutex_;
};

// Opens a PDF held in memory; throws through fz_try.
pdf_document* open_pdf_from_memory(fz_context* ctx, const std::string& bytes);

}  // namespace pdf_mt
