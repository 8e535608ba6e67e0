#pragma once

#include "translator.hpp"

#include <memory>
#include <string>

typedef void CURL;

namespace pdf_mt {

// Counted in code points.
constexpr std::size_t kGoogleMaxChars = 5000;

struct GoogleTranslatorConfig {
    std::string endpoint = "https://translate.google.com/m";
    std::string lang_in = "en";
    std::string lang_out = "zh-CN";
    long timeout_seconds = 30;
};

// Scrapes the mobile web translation page.
class GoogleTranslator final : public Translator {
public:
    explicit GoogleTranslator(GoogleTranslatorConfig config);
    ~GoogleTranslator() override;

    GoogleTranslator(const GoogleTranslator&) = delete;
    GoogleTranslator& operator=(const GoogleTranslator&) = delete;

    std::unique_ptr<Translator> clone() const override;
    TranslateResult translate(const std::string& text) override;
    std::string engine_name() const override { return "google"; }
    nlohmann::json cache_params() const override;

private:
    std::string build_url(const std::string& text) const;

    GoogleTranslatorConfig config_;
    CURL* curl_ = nullptr;
};

// "zh" is sent as "zh-CN"; other codes pass through.
std::string google_language_code(const std::string& lang);

// First t0/result-container payload of a response page, HTML-unescaped and trimmed.
bool extract_google_translation(const std::string& body, std::string& out_text);

std::string unescape_html(const std::string& text);

// 2xx -> Ok, 400 and other 4xx -> Fatal, 429 and 5xx -> Retryable.
TranslateStatus classify_http_status(long status);

}  // namespace pdf_mt
