#include "translator_google.hpp"

#include "log.hpp"
#include "text_util.hpp"

#include <curl/curl.h>

#include <cctype>
#include <cstdlib>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <utility>

namespace pdf_mt {

namespace {

constexpr const char* kUserAgent =
    "Mozilla/4.0 (compatible;MSIE 6.0;Windows NT 5.1;SV1;.NET CLR 1.1.4322;.NET CLR 2.0.50727;.NET CLR 3.0.04506.30)";

std::once_flag g_curl_once;

void initialize_curl_once() {
    std::call_once(g_curl_once, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

std::size_t write_body(char* data, std::size_t size, std::size_t nmemb, void* user_data) {
    auto* body = static_cast<std::string*>(user_data);
    body->append(data, size * nmemb);
    return size * nmemb;
}

std::string trim(std::string s) {
    auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_ws(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && is_ws(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }

    return s;
}

bool decode_entity(const std::string& entity, std::string& out) {
    if (entity.size() > 1 && entity[0] == '#') {
        const bool hex = entity[1] == 'x' || entity[1] == 'X';
        const std::string digits = entity.substr(hex ? 2 : 1);
        if (digits.empty()) {
            return false;
        }
        char* end = nullptr;
        const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
        if (end == nullptr || *end != '\0') {
            return false;
        }
        append_utf8(out, cp > 0x10FFFF ? 0xFFFD : static_cast<std::uint32_t>(cp));
        return true;
    }

    if (entity == "amp") {
        out.push_back('&');
    } else if (entity == "lt") {
        out.push_back('<');
    } else if (entity == "gt") {
        out.push_back('>');
    } else if (entity == "quot") {
        out.push_back('"');
    } else if (entity == "apos") {
        out.push_back('\'');
    } else if (entity == "nbsp") {
        append_utf8(out, 0xA0);
    } else {
        return false;
    }
    return true;
}

}  // namespace

std::string google_language_code(const std::string& lang) {
    if (lang == "zh") {
        return "zh-CN";
    }
    return lang;
}

std::string unescape_html(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            const std::size_t semi = text.find(';', i + 1);
            if (semi != std::string::npos && semi - i <= 10) {
                std::string decoded;
                if (decode_entity(text.substr(i + 1, semi - i - 1), decoded)) {
                    out += decoded;
                    i = semi + 1;
                    continue;
                }
            }
        }
        out.push_back(text[i]);
        ++i;
    }

    return out;
}

bool extract_google_translation(const std::string& body, std::string& out_text) {
    static const std::regex pattern(R"re(class="(?:t0|result-container)">([\s\S]*?)<)re");

    std::smatch match;
    if (!std::regex_search(body, match, pattern)) {
        return false;
    }
    out_text = trim(unescape_html(match[1].str()));
    return true;
}

TranslateStatus classify_http_status(long status) {
    if (status >= 200 && status < 300) {
        return TranslateStatus::Ok;
    }
    if (status == 429 || status >= 500) {
        return TranslateStatus::Retryable;
    }
    return TranslateStatus::Fatal;
}

GoogleTranslator::GoogleTranslator(GoogleTranslatorConfig config) : config_(std::move(config)) {
    initialize_curl_once();
    curl_ = curl_easy_init();
    if (curl_ == nullptr) {
        throw std::runtime_error("curl_easy_init failed");
    }
}

GoogleTranslator::~GoogleTranslator() {
    if (curl_ != nullptr) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

std::unique_ptr<Translator> GoogleTranslator::clone() const {
    return std::make_unique<GoogleTranslator>(config_);
}

nlohmann::json GoogleTranslator::cache_params() const {
    return nlohmann::json{
        {"lang_in", config_.lang_in},
        {"lang_out", config_.lang_out},
    };
}

std::string GoogleTranslator::build_url(const std::string& text) const {
    auto escape = [&](const std::string& value) {
        char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
        if (escaped == nullptr) {
            throw std::runtime_error("curl_easy_escape failed");
        }
        std::string out(escaped);
        curl_free(escaped);
        return out;
    };

    return config_.endpoint +
        "?tl=" + escape(google_language_code(config_.lang_out)) +
        "&sl=" + escape(google_language_code(config_.lang_in)) +
        "&q=" + escape(text);
}

TranslateResult GoogleTranslator::translate(const std::string& text) {
    const std::size_t length = utf8_to_runes(text).size();
    if (length > kGoogleMaxChars) {
        return TranslateResult::fatal(
            "Text too long for Google Translate (" + std::to_string(length) + " > " +
            std::to_string(kGoogleMaxChars) + " chars)"
        );
    }

    std::string url;
    try {
        url = build_url(text);
    } catch (const std::exception& ex) {
        return TranslateResult::retryable(ex.what());
    }

    std::string body;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, config_.timeout_seconds);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf);

    const CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        const std::string reason = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(res);
        return TranslateResult::retryable("Request failed: " + reason);
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    switch (classify_http_status(status)) {
        case TranslateStatus::Ok:
            break;
        case TranslateStatus::Retryable:
            return TranslateResult::retryable("Google Translate returned HTTP " + std::to_string(status));
        case TranslateStatus::Fatal:
            return TranslateResult::fatal("Google Translate returned HTTP " + std::to_string(status));
    }

    std::string translated;
    if (!extract_google_translation(body, translated)) {
        log_debug("unrecognized Google Translate response of " + std::to_string(body.size()) + " bytes");
        return TranslateResult::fatal("Failed to extract translation result");
    }

    return TranslateResult::success(std::move(translated));
}

}  // namespace pdf_mt
