#include "cached_translator.hpp"

#include "log.hpp"

#include <thread>
#include <utility>

namespace pdf_mt {

CachedTranslator::CachedTranslator(Translator& backend, const TranslationCache& cache, CachedTranslatorOptions options)
    : backend_(backend), cache_(cache), options_(options) {}

TranslateResult CachedTranslator::translate(const std::string& text, bool& from_cache) {
    from_cache = false;

    if (!options_.ignore_cache) {
        if (auto hit = cache_.get(text)) {
            from_cache = true;
            return TranslateResult::success(std::move(*hit));
        }
    }

    TranslateResult result;
    for (int attempt = 0;; ++attempt) {
        result = backend_.translate(text);
        if (result.status != TranslateStatus::Retryable || attempt >= options_.max_retries) {
            break;
        }
        log_debug(
            backend_.engine_name() + " retry " + std::to_string(attempt + 1) + "/" +
            std::to_string(options_.max_retries) + ": " + result.error
        );
        if (options_.retry_delay.count() > 0) {
            std::this_thread::sleep_for(options_.retry_delay * (attempt + 1));
        }
    }

    if (result.ok()) {
        cache_.set(text, result.text);
    }
    return result;
}

}  // namespace pdf_mt
