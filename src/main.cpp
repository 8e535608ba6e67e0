#include "config.hpp"
#include "layout_detector.hpp"
#include "log.hpp"
#include "mupdf_context.hpp"
#include "mupdf_fonts.hpp"
#include "pipeline.hpp"
#include "translation_cache.hpp"
#include "translator_registry.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace pdf_mt;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_sigint(int /*signal*/) {
    g_interrupted = 1;
}

bool has_pdf_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext == ".pdf";
}

bool collect_input_files(
    const std::filesystem::path& input,
    const std::filesystem::path& output_dir,
    std::vector<std::filesystem::path>& out_files,
    std::string& error
) {
    out_files.clear();

    if (!std::filesystem::exists(input)) {
        error = "Input path does not exist: " + input.string();
        return false;
    }

    if (std::filesystem::is_regular_file(input)) {
        if (!has_pdf_extension(input)) {
            error = "Input file is not a PDF: " + input.string();
            return false;
        }
        out_files.push_back(input);
        return true;
    }

    if (!std::filesystem::is_directory(input)) {
        error = "Input path is neither file nor directory: " + input.string();
        return false;
    }

    std::error_code ec;
    const auto input_abs = std::filesystem::weakly_canonical(input, ec);
    const auto output_abs = std::filesystem::weakly_canonical(output_dir, ec);
    const bool skip_output_subtree = !ec && output_abs.string().starts_with(input_abs.string());

    for (const auto& entry : std::filesystem::recursive_directory_iterator(input)) {
        if (entry.is_regular_file() && has_pdf_extension(entry.path())) {
            if (skip_output_subtree) {
                const auto entry_abs = std::filesystem::weakly_canonical(entry.path(), ec);
                if (!ec && entry_abs.string().starts_with(output_abs.string())) {
                    continue;
                }
            }
            out_files.push_back(entry.path());
        }
    }

    std::sort(out_files.begin(), out_files.end());

    if (out_files.empty()) {
        error = "No PDF files found under: " + input.string();
        return false;
    }

    return true;
}

std::string format_progress_bar(double ratio, std::size_t width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const std::size_t filled = static_cast<std::size_t>(ratio * static_cast<double>(width));
    std::string bar(width, '-');
    for (std::size_t i = 0; i < filled && i < width; ++i) {
        bar[i] = '=';
    }
    if (filled < width) {
        bar[filled] = '>';
    }
    return bar;
}

void print_progress(const ProgressEvent& event, bool done) {
    if (event.total_files == 0) {
        return;
    }

    const double page_fraction = event.total_pages > 0
        ? static_cast<double>(event.done_pages) / static_cast<double>(event.total_pages)
        : 0.0;
    double overall_fraction = 1.0;
    if (event.file_index < event.total_files) {
        overall_fraction = (static_cast<double>(event.file_index) + page_fraction) /
            static_cast<double>(event.total_files);
    }
    overall_fraction = std::clamp(overall_fraction, 0.0, 1.0);
    const auto pct = static_cast<int>(overall_fraction * 100.0);

    std::ostringstream line;
    line
        << "\r["
        << format_progress_bar(overall_fraction, 30)
        << "] "
        << std::setw(3) << pct << "% "
        << "files " << std::min(event.file_index + 1, event.total_files) << "/" << event.total_files
        << " pages " << event.done_pages << "/" << event.total_pages
        << " " << std::filesystem::path(event.path).filename().string();

    std::cerr << line.str();
    if (done) {
        std::cerr << "\n";
    }
    std::cerr.flush();
}

std::string format_megabytes(std::uintmax_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / (1024.0 * 1024.0) << "MB";
    return out.str();
}

void print_file_result(const FileResult& file) {
    const std::string name = file.input.filename().string();
    const DocumentStats& stats = file.stats;

    switch (file.state) {
        case PipelineState::Done:
            std::cout
                << "[ok] " << name
                << " mono=" << file.mono_path.string() << " (" << format_megabytes(file.mono_size) << ")"
                << " dual=" << file.dual_path.string() << " (" << format_megabytes(file.dual_size) << ")"
                << " pages=" << stats.pages_total
                << " translated=" << stats.pages_translated
                << " skipped=" << stats.pages_skipped
                << " failed=" << stats.pages_failed
                << " spans=" << stats.spans.spans_translated
                << " cached=" << stats.spans.spans_cached
                << " fallback=" << stats.spans.spans_fallback
                << " workers=" << stats.workers_used
                << " time_ms=" << stats.wall_time.count()
                << " pages_per_sec=" << stats.pages_per_second
                << "\n";
            break;
        case PipelineState::Cancelled:
            std::cout << "[cancelled] " << name << "\n";
            break;
        default:
            std::cout << "[error] " << name << ": " << file.error << "\n";
            break;
    }
}

std::unique_ptr<CacheStore> open_cache(const AppConfig& config) {
    const std::filesystem::path path = config.cache_db.empty() ? CacheStore::default_path() : config.cache_db;
    std::string error;

    if (config.reset_cache) {
        if (!CacheStore::reset(path, error)) {
            log_warn("cache reset failed: " + error);
        } else {
            log_info("cache reset: " + path.string());
        }
    }

    auto store = CacheStore::open(path, error);
    if (!store) {
        log_warn(error + "; continuing without a translation cache");
        return nullptr;
    }
    log_debug("translation cache: " + path.string());
    return store;
}

std::unique_ptr<LayoutDetector> make_detector(const AppConfig& config, std::string& error) {
    if (config.layout_path.empty()) {
        return std::make_unique<NullLayoutDetector>();
    }

    auto detector = std::make_unique<XmlLayoutDetector>();
    if (!XmlLayoutDetector::load(config.layout_path, *detector, error)) {
        return nullptr;
    }
    log_info("layout: " + std::to_string(detector->page_count()) + " pages from " + config.layout_path.string());
    return detector;
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string error;

    if (!parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        print_usage(argv[0]);
        return error == "help" ? 0 : 1;
    }

    if (config.show_version) {
        std::cout << "pdf_mt " << kPdfMtVersion << "\n";
        return 0;
    }

    set_log_level(config.debug ? LogLevel::Debug : LogLevel::Info);

    std::vector<std::filesystem::path> input_files;
    if (!collect_input_files(config.input_path, config.output_dir, input_files, error)) {
        std::cerr << error << "\n";
        return 1;
    }

    std::unique_ptr<CacheStore> store = open_cache(config);

    std::unique_ptr<Translator> translator = make_translator(config.translator, error);
    if (!translator) {
        std::cerr << "[fatal] " << error << "\n";
        return 1;
    }

    std::unique_ptr<TranslationCache> cache;
    std::unique_ptr<MuPdfContext> mupdf;
    try {
        cache = std::make_unique<TranslationCache>(store.get(), translator->engine_name(), translator->cache_params());
        mupdf = std::make_unique<MuPdfContext>();
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }

    auto target_font = TargetFontSource::create(mupdf->get(), config.translator.lang_out, config.font_path, error);
    if (!target_font) {
        std::cerr << "[fatal] " << error << "\n";
        return 1;
    }

    auto detector = make_detector(config, error);
    if (!detector) {
        std::cerr << "[fatal] failed to load layout: " << error << "\n";
        return 1;
    }

    PipelineOptions options;
    options.pages = config.pages;
    options.workers = config.workers;
    options.output_dir = config.output_dir;
    options.interpreter.min_font_scale = config.min_font_scale;
    options.interpreter.strict = config.strict;
    options.translation.ignore_cache = config.ignore_cache;
    options.assemble.skip_subset_fonts = config.skip_subset_fonts;

    log_info(
        std::string("service=") + service_name(config.translator.service) + " " + config.translator.lang_in + " -> " +
        config.translator.lang_out + " files=" + std::to_string(input_files.size()) +
        " workers=" + std::to_string(config.workers)
    );

    PipelineOrchestrator orchestrator(
        PipelineContext{*mupdf, *translator, *cache, *detector, *target_font},
        options
    );

    std::stop_source stop_source;
    std::signal(SIGINT, handle_sigint);
    std::jthread interrupt_watcher([&stop_source](std::stop_token stop_token) {
        while (!stop_token.stop_requested()) {
            if (g_interrupted != 0) {
                std::cerr << "\n[info] interrupt received, finishing pages in flight\n";
                stop_source.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto progress_callback = [&](const ProgressEvent& event) {
        if (!config.show_progress) {
            return;
        }
        switch (event.type) {
            case EventType::FileStarted:
            case EventType::PageDone:
            case EventType::PageFailed:
            case EventType::PageSkipped:
                print_progress(event, false);
                break;
            case EventType::FileDone:
            case EventType::FileCancelled:
            case EventType::FileFailed:
                print_progress(event, true);
                break;
            case EventType::Finished:
                break;
        }
    };

    const BatchResult batch = orchestrator.run(
        input_files,
        stop_source.get_token(),
        progress_callback,
        [](const FileResult& file) { print_file_result(file); }
    );

    interrupt_watcher.request_stop();

    std::size_t files_ok = 0;
    std::size_t files_failed = 0;
    std::size_t files_cancelled = 0;
    std::size_t total_pages = 0;
    for (const auto& file : batch.files) {
        total_pages += file.stats.pages_translated + file.stats.pages_unchanged;
        if (file.state == PipelineState::Done) {
            ++files_ok;
        } else if (file.state == PipelineState::Cancelled) {
            ++files_cancelled;
        } else {
            ++files_failed;
        }
    }

    const double total_seconds = static_cast<double>(batch.wall_time.count()) / 1000.0;
    const double total_pps = total_seconds > 0.0 ? static_cast<double>(total_pages) / total_seconds : 0.0;

    std::cout
        << "[summary] files=" << batch.files.size()
        << " ok=" << files_ok
        << " failed=" << files_failed
        << " cancelled=" << files_cancelled
        << " state=" << pipeline_state_name(batch.state)
        << " total_pages=" << total_pages
        << " total_time_ms=" << batch.wall_time.count()
        << " pages_per_sec=" << total_pps
        << "\n";

    if (batch.state == PipelineState::Cancelled) {
        return 130;
    }
    return batch.state == PipelineState::Failed ? 1 : 0;
}
