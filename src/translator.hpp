#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace pdf_mt {

enum class TranslateStatus {
    Ok,
    Retryable,
    Fatal
};

struct TranslateResult {
    TranslateStatus status = TranslateStatus::Ok;
    std::string text;
    std::string error;

    bool ok() const { return status == TranslateStatus::Ok; }

    static TranslateResult success(std::string text);
    static TranslateResult retryable(std::string error);
    static TranslateResult fatal(std::string error);
};

class Translator {
public:
    virtual ~Translator() = default;

    // Per-thread isolation point: each worker gets its own translator clone.
    virtual std::unique_ptr<Translator> clone() const = 0;
    virtual TranslateResult translate(const std::string& text) = 0;

    // At most 20 characters; keys the translation cache together with cache_params().
    virtual std::string engine_name() const = 0;
    virtual nlohmann::json cache_params() const = 0;
};

}  // namespace pdf_mt
