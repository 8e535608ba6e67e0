#pragma once

#include "cached_translator.hpp"
#include "document_assembler.hpp"
#include "layout_detector.hpp"
#include "mupdf_context.hpp"
#include "mupdf_fonts.hpp"
#include "page_interpreter.hpp"
#include "progress_event.hpp"
#include "translation_cache.hpp"
#include "translator.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace pdf_mt {

enum class PipelineState {
    Idle,
    Opening,
    PerPage,
    Assembling,
    Done,
    Cancelled,
    Failed
};

const char* pipeline_state_name(PipelineState state);

struct PipelineOptions {
    // 0-based page indices; empty selects every page.
    std::vector<int> pages;
    std::size_t workers = 1;
    std::filesystem::path output_dir = "output";
    InterpreterOptions interpreter;
    CachedTranslatorOptions translation;
    AssembleOptions assemble;
};

// Collaborators shared by every file of a run. The translator is a prototype; workers clone it.
struct PipelineContext {
    MuPdfContext& mupdf;
    const Translator& translator;
    const TranslationCache& cache;
    const LayoutDetector& detector;
    const TargetFontSource& target_font;
};

struct DocumentStats {
    std::size_t pages_total = 0;
    std::size_t pages_translated = 0;
    std::size_t pages_unchanged = 0;
    std::size_t pages_skipped = 0;
    std::size_t pages_failed = 0;
    std::size_t workers_used = 0;
    PageStats spans;
    std::chrono::milliseconds wall_time{0};
    double pages_per_second = 0.0;
};

struct DocumentResult {
    PipelineState state = PipelineState::Idle;
    std::string error;
    // Number of pages whose content stream was rewritten.
    std::size_t patches = 0;
    AssembledOutput output;
    DocumentStats stats;
};

struct FileResult {
    std::filesystem::path input;
    PipelineState state = PipelineState::Idle;
    std::string error;
    std::filesystem::path mono_path;
    std::filesystem::path dual_path;
    std::uintmax_t mono_size = 0;
    std::uintmax_t dual_size = 0;
    DocumentStats stats;
};

struct BatchResult {
    PipelineState state = PipelineState::Idle;
    std::vector<FileResult> files;
    std::chrono::milliseconds wall_time{0};
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;
// Called once per file, as soon as that file is finished.
using FileResultCallback = std::function<void(const FileResult&)>;

// Runs files one after another; pages of a file are spread over a bounded worker pool.
// Progress callbacks always run on the thread that called run() or translate_bytes().
class PipelineOrchestrator {
public:
    PipelineOrchestrator(PipelineContext context, PipelineOptions options);

    BatchResult run(
        const std::vector<std::filesystem::path>& files,
        std::stop_token stop_token,
        const ProgressCallback& callback = {},
        const FileResultCallback& file_callback = {}
    );

    // Translates one in-memory PDF without touching the filesystem.
    DocumentResult translate_bytes(
        std::string pdf_bytes,
        std::stop_token stop_token,
        const ProgressCallback& callback = {}
    );

    PipelineState state() const { return state_.load(); }
    const PipelineOptions& options() const { return options_; }

private:
    FileResult run_file(
        const std::filesystem::path& input,
        std::stop_token stop_token,
        const ProgressCallback& callback
    );

    PipelineContext context_;
    PipelineOptions options_;
    std::atomic<PipelineState> state_{PipelineState::Idle};
};

// Output names for an input file: <output_dir>/<stem>-mono.pdf and <stem>-dual.pdf.
std::filesystem::path mono_output_path(const std::filesystem::path& output_dir, const std::filesystem::path& input);
std::filesystem::path dual_output_path(const std::filesystem::path& output_dir, const std::filesystem::path& input);

}  // namespace pdf_mt
