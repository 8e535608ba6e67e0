#include "pipeline.hpp"

#include "event_queue.hpp"
#include "log.hpp"
#include "region_mask.hpp"
#include "working_document.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace pdf_mt {

namespace {

constexpr std::chrono::milliseconds kEventPollInterval{50};

bool read_file_bytes(const std::filesystem::path& path, std::string& out_bytes, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Cannot open input file: " + path.string();
        return false;
    }
    out_bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "Failed to read input file: " + path.string();
        return false;
    }
    return true;
}

bool write_file_bytes(const std::filesystem::path& path, const std::string& bytes, std::string& error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "Cannot open output file: " + path.string();
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        error = "Failed to write output file: " + path.string();
        return false;
    }
    return true;
}

std::vector<int> select_pages(const std::vector<int>& requested, int page_count) {
    std::vector<int> selected;
    if (requested.empty()) {
        selected.reserve(static_cast<std::size_t>(page_count));
        for (int i = 0; i < page_count; ++i) {
            selected.push_back(i);
        }
        return selected;
    }

    for (const int index : requested) {
        if (index >= 0 && index < page_count) {
            selected.push_back(index);
        } else {
            log_warn("page " + std::to_string(index + 1) + " is beyond the document (" + std::to_string(page_count) +
                " pages), ignored");
        }
    }
    return selected;
}

// Shared between the workers of one document.
struct PageJob {
    PageJob(const PipelineContext& context, const PipelineOptions& options, WorkingDocument& document)
        : context(context), options(options), document(document) {}

    const PipelineContext& context;
    const PipelineOptions& options;
    WorkingDocument& document;
    std::vector<int> pages;

    std::atomic<std::size_t> next_index{0};
    std::atomic<std::size_t> finished{0};
    std::atomic<std::size_t> exited{0};
    std::atomic<bool> failed{false};

    std::mutex mutex;
    ObjectPatch patches;
    DocumentStats stats;
    std::string error;

    EventQueue events;

    void fail(const std::string& message, std::stop_source& abort) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!failed.exchange(true)) {
            error = message;
        }
        abort.request_stop();
    }

    void push_page_event(EventType type, int page_index, const std::string& message) {
        ProgressEvent event;
        event.type = type;
        event.page_index = page_index;
        event.message = message;
        event.done_pages = finished.fetch_add(1) + 1;
        event.total_pages = pages.size();
        events.push(event);
    }
};

class PageWorker {
public:
    PageWorker(PageJob& job, std::stop_source& abort)
        : job_(job),
          abort_(abort),
          ctx_(job.context.mupdf.clone()),
          translator_(job.context.translator.clone()),
          cached_(*translator_, job.context.cache, job.options.translation),
          font_(job.context.target_font.bind(ctx_->get())),
          interpreter_(cached_, *font_, job.options.interpreter) {}

    void run(std::stop_token stop_token) {
        while (!stop_token.stop_requested()) {
            const std::size_t slot = job_.next_index.fetch_add(1);
            if (slot >= job_.pages.size()) {
                return;
            }
            process(job_.pages[slot]);
        }
    }

private:
    void process(int page_index) {
        fz_context* ctx = ctx_->get();
        std::string error;

        LoadedPage loaded;
        if (!job_.document.load_page(ctx, page_index, loaded, error)) {
            page_failed(page_index, error);
            return;
        }

        PageImage image;
        image.page_index = page_index;
        image.width = static_cast<int>(loaded.raster_width);
        image.height = static_cast<int>(loaded.raster_height);
        if (job_.context.detector.needs_raster() && !job_.document.render_page(ctx, page_index, image, error)) {
            log_warn("page " + std::to_string(page_index + 1) + ": " + error + "; translating the whole page");
            image.samples.clear();
        }

        std::vector<LayoutBox> boxes;
        std::string layout_error;
        if (!job_.context.detector.detect(image, layout_tile_size(image.height), boxes, layout_error)) {
            log_warn("page " + std::to_string(page_index + 1) + ": layout detection failed: " + layout_error +
                "; translating the whole page");
            boxes.clear();
        }
        const RegionMask mask = build_region_mask(loaded.raster_height, loaded.raster_width, boxes);

        PageOutput output;
        if (!interpreter_.interpret(loaded.content, mask, output, error)) {
            page_failed(page_index, error);
            return;
        }

        int object_number = 0;
        if (!job_.document.commit_page_stream(ctx, page_index, object_number, error)) {
            page_failed(page_index, error);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(job_.mutex);
            job_.patches[object_number] = PagePatch{page_index, std::move(output.content)};
            job_.stats.spans += output.stats;
            ++(output.modified ? job_.stats.pages_translated : job_.stats.pages_unchanged);
        }
        job_.push_page_event(EventType::PageDone, page_index, {});
    }

    void page_failed(int page_index, const std::string& error) {
        {
            std::lock_guard<std::mutex> lock(job_.mutex);
            ++job_.stats.pages_failed;
        }
        if (job_.options.interpreter.strict) {
            job_.fail(error, abort_);
        } else {
            log_warn("page " + std::to_string(page_index + 1) + " kept as is: " + error);
        }
        job_.push_page_event(EventType::PageFailed, page_index, error);
    }

    PageJob& job_;
    std::stop_source& abort_;
    std::unique_ptr<MuPdfContext> ctx_;
    std::unique_ptr<Translator> translator_;
    CachedTranslator cached_;
    std::unique_ptr<TargetFont> font_;
    PageInterpreter interpreter_;
};

}  // namespace

const char* pipeline_state_name(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:
            return "idle";
        case PipelineState::Opening:
            return "opening";
        case PipelineState::PerPage:
            return "per_page";
        case PipelineState::Assembling:
            return "assembling";
        case PipelineState::Done:
            return "done";
        case PipelineState::Cancelled:
            return "cancelled";
        case PipelineState::Failed:
            return "failed";
    }
    return "unknown";
}

std::filesystem::path mono_output_path(const std::filesystem::path& output_dir, const std::filesystem::path& input) {
    return output_dir / (input.stem().string() + "-mono.pdf");
}

std::filesystem::path dual_output_path(const std::filesystem::path& output_dir, const std::filesystem::path& input) {
    return output_dir / (input.stem().string() + "-dual.pdf");
}

PipelineOrchestrator::PipelineOrchestrator(PipelineContext context, PipelineOptions options)
    : context_(context), options_(std::move(options)) {}

DocumentResult PipelineOrchestrator::translate_bytes(
    std::string pdf_bytes,
    std::stop_token stop_token,
    const ProgressCallback& callback
) {
    DocumentResult result;
    const auto started = std::chrono::steady_clock::now();

    if (stop_token.stop_requested()) {
        result.state = PipelineState::Cancelled;
        state_ = result.state;
        return result;
    }

    state_ = PipelineState::Opening;
    fz_context* ctx = context_.mupdf.get();
    auto document = WorkingDocument::open(ctx, std::move(pdf_bytes), result.error);
    if (!document) {
        result.state = PipelineState::Failed;
        state_ = result.state;
        return result;
    }

    state_ = PipelineState::PerPage;
    PageJob job(context_, options_, *document);
    job.pages = select_pages(options_.pages, document->page_count());
    job.stats.pages_total = static_cast<std::size_t>(document->page_count());

    std::stop_source abort;
    std::stop_callback forward_cancel(stop_token, [&abort]() { abort.request_stop(); });

    const std::size_t workers_used = std::min(std::max<std::size_t>(1, options_.workers), job.pages.size());
    job.stats.workers_used = workers_used;

    auto deliver = [&](const std::vector<ProgressEvent>& events) {
        if (!callback) {
            return;
        }
        for (const auto& event : events) {
            callback(event);
        }
    };

    {
        std::vector<std::jthread> pool;
        pool.reserve(workers_used);

        auto worker_fn = [&](std::stop_token worker_stop) {
            try {
                PageWorker worker(job, abort);
                worker.run(worker_stop);
            } catch (const std::exception& ex) {
                job.fail(std::string("worker failed: ") + ex.what(), abort);
            }
            job.exited.fetch_add(1);
        };

        for (std::size_t i = 0; i < workers_used; ++i) {
            pool.emplace_back(worker_fn, abort.get_token());
        }

        while (job.exited.load() < workers_used) {
            deliver(job.events.wait_pop_all(kEventPollInterval));
        }

        for (auto& thread : pool) {
            thread.join();
        }
    }

    deliver(job.events.pop_all());

    // A claimed page always runs to completion, so unclaimed pages are the ones never started.
    for (std::size_t slot = std::min(job.next_index.load(), job.pages.size()); slot < job.pages.size(); ++slot) {
        job.push_page_event(EventType::PageSkipped, job.pages[slot], "not started");
    }
    deliver(job.events.pop_all());

    const std::size_t processed = job.stats.pages_translated + job.stats.pages_unchanged + job.stats.pages_failed;
    job.stats.pages_skipped = job.stats.pages_total - std::min(job.stats.pages_total, processed);
    result.patches = job.patches.size();

    if (job.failed.load()) {
        result.state = PipelineState::Failed;
        result.error = job.error;
    } else if (stop_token.stop_requested()) {
        log_info("cancelled after " + std::to_string(job.patches.size()) + " of " + std::to_string(job.pages.size()) +
            " pages; no output written");
        result.state = PipelineState::Cancelled;
    } else {
        state_ = PipelineState::Assembling;
        if (assemble_document(
                ctx,
                *document,
                job.patches,
                context_.target_font,
                options_.assemble,
                result.output,
                result.error
            )) {
            result.state = PipelineState::Done;
        } else {
            result.state = PipelineState::Failed;
        }
    }

    const auto ended = std::chrono::steady_clock::now();
    job.stats.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(ended - started);
    const double wall_seconds = static_cast<double>(job.stats.wall_time.count()) / 1000.0;
    if (wall_seconds > 0.0) {
        job.stats.pages_per_second = static_cast<double>(processed) / wall_seconds;
    }

    result.stats = job.stats;
    state_ = result.state;
    return result;
}

FileResult PipelineOrchestrator::run_file(
    const std::filesystem::path& input,
    std::stop_token stop_token,
    const ProgressCallback& callback
) {
    FileResult result;
    result.input = input;

    std::string bytes;
    if (!read_file_bytes(input, bytes, result.error)) {
        result.state = PipelineState::Failed;
        return result;
    }

    DocumentResult document = translate_bytes(std::move(bytes), stop_token, callback);
    result.state = document.state;
    result.error = document.error;
    result.stats = document.stats;
    if (document.state != PipelineState::Done) {
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.output_dir, ec);
    if (ec) {
        result.state = PipelineState::Failed;
        result.error = "Failed to create output directory " + options_.output_dir.string() + ": " + ec.message();
        return result;
    }

    result.mono_path = mono_output_path(options_.output_dir, input);
    result.dual_path = dual_output_path(options_.output_dir, input);
    if (!write_file_bytes(result.mono_path, document.output.mono, result.error) ||
        !write_file_bytes(result.dual_path, document.output.dual, result.error)) {
        result.state = PipelineState::Failed;
        return result;
    }
    result.mono_size = document.output.mono.size();
    result.dual_size = document.output.dual.size();
    return result;
}

BatchResult PipelineOrchestrator::run(
    const std::vector<std::filesystem::path>& files,
    std::stop_token stop_token,
    const ProgressCallback& callback,
    const FileResultCallback& file_callback
) {
    BatchResult batch;
    const auto started = std::chrono::steady_clock::now();

    auto emit = [&](ProgressEvent event) {
        if (callback) {
            callback(event);
        }
    };

    bool cancelled = false;
    bool any_failed = false;

    for (std::size_t file_index = 0; file_index < files.size(); ++file_index) {
        const auto& input = files[file_index];

        ProgressEvent base;
        base.path = input.string();
        base.file_index = file_index;
        base.total_files = files.size();

        FileResult file;
        if (cancelled || stop_token.stop_requested()) {
            cancelled = true;
            file.input = input;
            file.state = PipelineState::Cancelled;
        } else {
            ProgressEvent started_event = base;
            started_event.type = EventType::FileStarted;
            emit(started_event);

            auto page_callback = [&](const ProgressEvent& page_event) {
                ProgressEvent event = page_event;
                event.path = base.path;
                event.file_index = base.file_index;
                event.total_files = base.total_files;
                emit(event);
            };
            file = run_file(input, stop_token, page_callback);
        }

        ProgressEvent finished_event = base;
        finished_event.message = file.error;
        switch (file.state) {
            case PipelineState::Done:
                finished_event.type = EventType::FileDone;
                break;
            case PipelineState::Cancelled:
                cancelled = true;
                finished_event.type = EventType::FileCancelled;
                break;
            default:
                any_failed = true;
                finished_event.type = EventType::FileFailed;
                log_error(input.string() + ": " + file.error);
                break;
        }
        emit(finished_event);
        if (file_callback) {
            file_callback(file);
        }
        batch.files.push_back(std::move(file));
    }

    if (cancelled) {
        batch.state = PipelineState::Cancelled;
    } else if (any_failed) {
        batch.state = PipelineState::Failed;
    } else {
        batch.state = PipelineState::Done;
    }
    state_ = batch.state;

    ProgressEvent finished;
    finished.type = EventType::Finished;
    finished.total_files = files.size();
    finished.file_index = files.size();
    emit(finished);

    batch.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    return batch;
}

}  // namespace pdf_mt
