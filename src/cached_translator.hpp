#pragma once

#include "translation_cache.hpp"
#include "translator.hpp"

#include <chrono>
#include <string>

namespace pdf_mt {

struct CachedTranslatorOptions {
    bool ignore_cache = false;
    int max_retries = 2;
    std::chrono::milliseconds retry_delay{500};
};

// Cache lookup, backend call on a miss, cache store on success.
// Retryable failures are retried up to max_retries times before they are reported.
class CachedTranslator {
public:
    CachedTranslator(Translator& backend, const TranslationCache& cache, CachedTranslatorOptions options = {});

    TranslateResult translate(const std::string& text, bool& from_cache);

private:
    Translator& backend_;
    const TranslationCache& cache_;
    CachedTranslatorOptions options_;
};

}  // namespace pdf_mt
