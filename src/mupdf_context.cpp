#include "mupdf_context.hpp"

#include "log.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace pdf_mt {

namespace {

void mupdf_lock_mutex(void* user, int lock) {
    auto* m = static_cast<std::mutex*>(user);
    m[lock].lock();
}

void mupdf_unlock_mutex(void* user, int lock) {
    auto* m = static_cast<std::mutex*>(user);
    m[lock].unlock();
}

void mupdf_warning(void* /*user*/, const char* message) {
    log_debug(std::string("mupdf: ") + (message != nullptr ? message : ""));
}

void mupdf_error(void* /*user*/, const char* message) {
    log_debug(std::string("mupdf error: ") + (message != nullptr ? message : ""));
}

void route_messages(fz_context* ctx) {
    fz_set_warning_callback(ctx, mupdf_warning, nullptr);
    fz_set_error_callback(ctx, mupdf_error, nullptr);
}

}  // namespace

MuPdfContext::MuPdfContext() : locks_(std::make_shared<Locks>()) {
    locks_->context.user = locks_->mutexes.data();
    locks_->context.lock = mupdf_lock_mutex;
    locks_->context.unlock = mupdf_unlock_mutex;

    ctx_ = fz_new_context(nullptr, &locks_->context, FZ_STORE_DEFAULT);
    if (ctx_ == nullptr) {
        throw std::runtime_error("fz_new_context failed");
    }
    route_messages(ctx_);

    bool registered = true;
    fz_try(ctx_) {
        fz_register_document_handlers(ctx_);
    }
    fz_catch(ctx_) {
        registered = false;
    }
    if (!registered) {
        const std::string message = fz_caught_message(ctx_);
        fz_drop_context(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("Failed to register MuPDF document handlers: " + message);
    }
}

MuPdfContext::MuPdfContext(fz_context* ctx, std::shared_ptr<Locks> locks) : locks_(std::move(locks)), ctx_(ctx) {
    route_messages(ctx_);
}

MuPdfContext::~MuPdfContext() {
    if (ctx_ != nullptr) {
        fz_drop_context(ctx_);
        ctx_ = nullptr;
    }
}

std::unique_ptr<MuPdfContext> MuPdfContext::clone() const {
    fz_context* cloned = fz_clone_context(ctx_);
    if (cloned == nullptr) {
        throw std::runtime_error("fz_clone_context failed");
    }
    return std::unique_ptr<MuPdfContext>(new MuPdfContext(cloned, locks_));
}

}  // namespace pdf_mt
