#pragma once

#include "translator.hpp"
#include "translator_google.hpp"
#include "translator_llama.hpp"

#include <memory>
#include <string>

namespace pdf_mt {

enum class ServiceId {
    Google,
    Llama
};

bool parse_service_id(const std::string& name, ServiceId& out_service, std::string& error);
const char* service_name(ServiceId service);

struct TranslatorSettings {
    ServiceId service = ServiceId::Google;
    std::string lang_in = "en";
    std::string lang_out = "zh-CN";
    GoogleTranslatorConfig google;
    LlamaTranslatorConfig llama;
};

// Builds the prototype translator for the selected service. Workers clone it.
std::unique_ptr<Translator> make_translator(const TranslatorSettings& settings, std::string& error);

}  // namespace pdf_mt
