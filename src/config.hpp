#pragma once

#include "translator_registry.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace pdf_mt {

constexpr const char* kPdfMtVersion = "0.3.0";

struct AppConfig {
    std::filesystem::path input_path;
    std::filesystem::path output_dir = "output";
    std::string page_ranges;
    // 0-based, filled from page_ranges; empty means every page.
    std::vector<int> pages;
    std::size_t workers = 0;

    TranslatorSettings translator;
    std::filesystem::path prompt_path;

    std::filesystem::path layout_path;
    std::string font_path;

    bool ignore_cache = false;
    bool reset_cache = false;
    std::filesystem::path cache_db;

    bool skip_subset_fonts = false;
    bool strict = false;
    double min_font_scale = 0.5;

    bool show_progress = true;
    bool debug = false;
    bool show_version = false;
    std::filesystem::path config_path;
};

void print_usage(const char* program_name);

// Settings file, then environment, then flags. "help" in error means usage was requested.
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);

// $XDG_CONFIG_HOME/pdf_mt/config.json, or ~/.config/pdf_mt/config.json.
std::filesystem::path default_settings_path();

// Reads the JSON settings file into config. Unknown keys are ignored.
bool load_settings_file(const std::filesystem::path& path, AppConfig& config, std::string& error);
bool load_settings_string(const std::string& text, AppConfig& config, std::string& error);

// PDF_MT_GOOGLE_ENDPOINT and PDF_MT_LLAMA_MODEL.
void apply_env_overrides(AppConfig& config);

}  // namespace pdf_mt
