#pragma once

#include <array>
#include <memory>
#include <mutex>

#include <mupdf/fitz.h>

namespace pdf_mt {

// Owns one fz_context. The master is created with std::mutex backed locks;
// clones share the locks and the resource store, one per worker thread.
class MuPdfContext {
public:
    MuPdfContext();
    ~MuPdfContext();

    MuPdfContext(const MuPdfContext&) = delete;
    MuPdfContext& operator=(const MuPdfContext&) = delete;

    fz_context* get() const { return ctx_; }

    std::unique_ptr<MuPdfContext> clone() const;

private:
    struct Locks {
        std::array<std::mutex, FZ_LOCK_MAX> mutexes;
        fz_locks_context context{};
    };

    MuPdfContext(fz_context* ctx, std::shared_ptr<Locks> locks);

    std::shared_ptr<Locks> locks_;
    fz_context* ctx_ = nullptr;
};

}  // namespace pdf_mt
