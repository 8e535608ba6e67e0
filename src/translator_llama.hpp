#pragma once

#include "translator.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;

namespace pdf_mt {

constexpr const char* kDefaultLlamaPrompt =
    "Translate the following text from ${lang_in} to ${lang_out}.\n"
    "Output the translation only. Do not explain.\n\n"
    "${text}\n\n"
    "Translation:\n";

struct LlamaTranslatorConfig {
    std::string model_path;
    std::string lang_in = "en";
    std::string lang_out = "zh-CN";
    std::string prompt_template = kDefaultLlamaPrompt;
    int n_ctx = 2048;
    int n_gpu_layers = -1;
    int n_threads = 8;
    int max_tokens = 256;
};

// Substitutes ${text}, ${lang_in} and ${lang_out}; unknown placeholders are kept.
std::string render_prompt(
    const std::string& prompt_template,
    const std::string& text,
    const std::string& lang_in,
    const std::string& lang_out
);

// Drops carriage returns and an echoed "Translation:" prefix, then trims.
// Line breaks inside the translation are kept.
std::string clean_llama_output(std::string text);

class LlamaTranslator final : public Translator {
public:
    explicit LlamaTranslator(LlamaTranslatorConfig config);
    ~LlamaTranslator() override;

    std::unique_ptr<Translator> clone() const override;
    TranslateResult translate(const std::string& text) override;
    std::string engine_name() const override { return "llama"; }
    nlohmann::json cache_params() const override;

private:
    struct SharedModel;

    LlamaTranslator(LlamaTranslatorConfig config, std::shared_ptr<SharedModel> shared_model);

    static std::shared_ptr<SharedModel> load_shared_model(const LlamaTranslatorConfig& config);

    std::string generate(std::vector<int32_t> prompt_tokens);

    std::vector<int32_t> tokenize(const std::string& text, bool add_special, bool parse_special) const;
    std::string token_to_piece(int32_t token) const;

    void ensure_context_ready();

    LlamaTranslatorConfig config_;
    std::shared_ptr<SharedModel> shared_model_;

    llama_context* ctx_ = nullptr;
    llama_sampler* sampler_ = nullptr;
};

}  // namespace pdf_mt
