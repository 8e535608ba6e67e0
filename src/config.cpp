#include "config.hpp"

#include "page_range.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

namespace pdf_mt {

namespace {

bool parse_int_arg(const std::string& key, const std::string& value, int& out, std::string& error) {
    try {
        std::size_t used = 0;
        out = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return true;
    } catch (const std::exception&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

bool parse_size_arg(const std::string& key, const std::string& value, std::size_t& out, std::string& error) {
    try {
        std::size_t used = 0;
        if (!value.empty() && value[0] == '-') {
            throw std::invalid_argument(value);
        }
        out = static_cast<std::size_t>(std::stoull(value, &used));
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return true;
    } catch (const std::exception&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

bool parse_double_arg(const std::string& key, const std::string& value, double& out, std::string& error) {
    try {
        std::size_t used = 0;
        out = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return true;
    } catch (const std::exception&) {
        error = "Invalid number for " + key + ": " + value;
        return false;
    }
}

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Cannot open " + path.string();
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

bool apply_settings(const nlohmann::json& root, AppConfig& config, std::string& error) {
    if (root.contains("default_service") &&
        !parse_service_id(root.at("default_service").get<std::string>(), config.translator.service, error)) {
        return false;
    }
    config.translator.lang_in = root.value("lang_in", config.translator.lang_in);
    config.translator.lang_out = root.value("lang_out", config.translator.lang_out);
    config.font_path = root.value("font_path", config.font_path);
    config.workers = root.value("workers", config.workers);

    const auto services = root.find("services");
    if (services == root.end() || !services->is_object()) {
        return true;
    }

    const auto google = services->find("google");
    if (google != services->end() && google->is_object()) {
        auto& g = config.translator.google;
        g.endpoint = google->value("endpoint", g.endpoint);
        g.timeout_seconds = google->value("timeout_seconds", g.timeout_seconds);
    }

    const auto llama = services->find("llama");
    if (llama != services->end() && llama->is_object()) {
        auto& l = config.translator.llama;
        l.model_path = llama->value("model_path", l.model_path);
        l.n_ctx = llama->value("n_ctx", l.n_ctx);
        l.n_gpu_layers = llama->value("n_gpu_layers", l.n_gpu_layers);
        l.n_threads = llama->value("n_threads", l.n_threads);
        l.max_tokens = llama->value("max_tokens", l.max_tokens);
    }
    return true;
}

}  // namespace

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " --input <pdf-file-or-dir> [options]\n\n"
        << "Options:\n"
        << "  --output <dir>          Output directory (default: output)\n"
        << "  --pages <ranges>        1-based pages, e.g. 1,3,5-7 (default: all)\n"
        << "  --service <name>        google or llama (default: google)\n"
        << "  --lang-in <code>        Source language (default: en)\n"
        << "  --lang-out <code>       Target language (default: zh-CN)\n"
        << "  --workers <n>           Worker threads (default: hardware concurrency)\n"
        << "  --layout <xml>          Precomputed layout boxes\n"
        << "  --font <ttf/otf>        Font for translated text\n"
        << "  --prompt <file>         Prompt template for llama (${text}, ${lang_in}, ${lang_out})\n"
        << "  --model <gguf>          llama.cpp model file\n"
        << "  --ignore-cache          Do not read cached translations\n"
        << "  --reset-cache           Delete the translation cache before starting\n"
        << "  --cache-db <path>       Translation cache database\n"
        << "  --skip-subset-fonts     Embed fonts without subsetting\n"
        << "  --strict                Fail a page on any translation error\n"
        << "  --min-font-scale <f>    Smallest font scale for translated text (default: 0.5)\n"
        << "  --no-progress           Disable progress bar output\n"
        << "  --config <file>         JSON settings file\n"
        << "  --debug                 Verbose logging\n"
        << "  --version               Print version\n"
        << "  -h, --help              Show this help\n";
}

std::filesystem::path default_settings_path() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        base = std::filesystem::path(home) / ".config";
    } else {
        return {};
    }
    return base / "pdf_mt" / "config.json";
}

bool load_settings_string(const std::string& text, AppConfig& config, std::string& error) {
    const nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        error = "settings are not valid JSON";
        return false;
    }
    if (!root.is_object()) {
        error = "settings must be a JSON object";
        return false;
    }

    try {
        if (!apply_settings(root, config, error)) {
            return false;
        }
    } catch (const nlohmann::json::exception& ex) {
        error = std::string("invalid settings value: ") + ex.what();
        return false;
    }
    return true;
}

bool load_settings_file(const std::filesystem::path& path, AppConfig& config, std::string& error) {
    std::string text;
    if (!read_text_file(path, text, error)) {
        return false;
    }
    if (!load_settings_string(text, config, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

void apply_env_overrides(AppConfig& config) {
    if (const char* endpoint = std::getenv("PDF_MT_GOOGLE_ENDPOINT"); endpoint != nullptr && *endpoint != '\0') {
        config.translator.google.endpoint = endpoint;
    }
    if (const char* model = std::getenv("PDF_MT_LLAMA_MODEL"); model != nullptr && *model != '\0') {
        config.translator.llama.model_path = model;
    }
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    // The settings file seeds every other option, so it is located first.
    bool explicit_config = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config.config_path = argv[i + 1];
            explicit_config = true;
        }
    }
    if (!explicit_config) {
        const auto fallback = default_settings_path();
        std::error_code ec;
        if (!fallback.empty() && std::filesystem::is_regular_file(fallback, ec)) {
            config.config_path = fallback;
        }
    }
    if (!config.config_path.empty() && !load_settings_file(config.config_path, config, error)) {
        return false;
    }
    apply_env_overrides(config);

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--input") {
            config.input_path = require_value(arg);
        } else if (arg == "--output") {
            config.output_dir = require_value(arg);
        } else if (arg == "--pages") {
            config.page_ranges = require_value(arg);
        } else if (arg == "--service") {
            const std::string name = require_value(arg);
            if (error.empty() && !parse_service_id(name, config.translator.service, error)) {
                return false;
            }
        } else if (arg == "--lang-in") {
            config.translator.lang_in = require_value(arg);
        } else if (arg == "--lang-out") {
            config.translator.lang_out = require_value(arg);
        } else if (arg == "--workers") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_size_arg(arg, value, config.workers, error)) {
                return false;
            }
        } else if (arg == "--layout") {
            config.layout_path = require_value(arg);
        } else if (arg == "--font") {
            config.font_path = require_value(arg);
        } else if (arg == "--prompt") {
            config.prompt_path = require_value(arg);
        } else if (arg == "--model") {
            config.translator.llama.model_path = require_value(arg);
        } else if (arg == "--ignore-cache") {
            config.ignore_cache = true;
        } else if (arg == "--reset-cache") {
            config.reset_cache = true;
        } else if (arg == "--cache-db") {
            config.cache_db = require_value(arg);
        } else if (arg == "--skip-subset-fonts") {
            config.skip_subset_fonts = true;
        } else if (arg == "--strict") {
            config.strict = true;
        } else if (arg == "--min-font-scale") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_double_arg(arg, value, config.min_font_scale, error)) {
                return false;
            }
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else if (arg == "--config") {
            require_value(arg);
        } else if (arg == "--debug") {
            config.debug = true;
        } else if (arg == "--version") {
            config.show_version = true;
        } else if (arg == "--n-gpu-layers") {
            const std::string value = require_value(arg);
            if (error.empty() && !parse_int_arg(arg, value, config.translator.llama.n_gpu_layers, error)) {
                return false;
            }
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (config.show_version) {
        return true;
    }

    if (config.workers == 0) {
        const auto hw = std::thread::hardware_concurrency();
        config.workers = hw == 0 ? 4 : static_cast<std::size_t>(hw);
    }

    if (config.input_path.empty()) {
        error = "--input is required";
        return false;
    }
    if (!(config.min_font_scale > 0.0 && config.min_font_scale <= 1.0)) {
        error = "--min-font-scale must be in (0, 1]";
        return false;
    }
    if (!parse_page_ranges(config.page_ranges, config.pages, error)) {
        error = "Invalid --pages: " + error;
        return false;
    }

    if (!config.prompt_path.empty()) {
        std::string prompt;
        if (!read_text_file(config.prompt_path, prompt, error)) {
            error = "Invalid --prompt: " + error;
            return false;
        }
        config.translator.llama.prompt_template = prompt;
    }

    return true;
}

}  // namespace pdf_mt
