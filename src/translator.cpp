#include "translator.hpp"

#include <utility>

namespace pdf_mt {

TranslateResult TranslateResult::success(std::string text) {
    TranslateResult result;
    result.status = TranslateStatus::Ok;
    result.text = std::move(text);
    return result;
}

TranslateResult TranslateResult::retryable(std::string error) {
    TranslateResult result;
    result.status = TranslateStatus::Retryable;
    result.error = std::move(error);
    return result;
}

TranslateResult TranslateResult::fatal(std::string error) {
    TranslateResult result;
    result.status = TranslateStatus::Fatal;
    result.error = std::move(error);
    return result;
}

}  // namespace pdf_mt
