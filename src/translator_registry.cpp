#include "translator_registry.hpp"

#include <exception>
#include <filesystem>

namespace pdf_mt {

bool parse_service_id(const std::string& name, ServiceId& out_service, std::string& error) {
    if (name == "google") {
        out_service = ServiceId::Google;
        return true;
    }
    if (name == "llama") {
        out_service = ServiceId::Llama;
        return true;
    }
    error = "Unknown translation service: " + name + " (supported: google, llama)";
    return false;
}

const char* service_name(ServiceId service) {
    switch (service) {
        case ServiceId::Google:
            return "google";
        case ServiceId::Llama:
            return "llama";
    }
    return "unknown";
}

std::unique_ptr<Translator> make_translator(const TranslatorSettings& settings, std::string& error) {
    switch (settings.service) {
        case ServiceId::Google: {
            GoogleTranslatorConfig config = settings.google;
            config.lang_in = settings.lang_in;
            config.lang_out = settings.lang_out;
            try {
                return std::make_unique<GoogleTranslator>(std::move(config));
            } catch (const std::exception& ex) {
                error = std::string("failed to initialize google translator: ") + ex.what();
                return nullptr;
            }
        }
        case ServiceId::Llama: {
            LlamaTranslatorConfig config = settings.llama;
            config.lang_in = settings.lang_in;
            config.lang_out = settings.lang_out;
            if (config.model_path.empty()) {
                error = "llama service needs a model (--model or services.llama.model_path)";
                return nullptr;
            }
            std::error_code ec;
            if (!std::filesystem::is_regular_file(config.model_path, ec)) {
                error = "Model file not found: " + config.model_path;
                return nullptr;
            }
            try {
                return std::make_unique<LlamaTranslator>(std::move(config));
            } catch (const std::exception& ex) {
                error = std::string("failed to initialize llama translator: ") + ex.what();
                return nullptr;
            }
        }
    }
    error = "Unsupported translation service";
    return nullptr;
}

}  // namespace pdf_mt
