#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

struct sqlite3;

namespace pdf_mt {

constexpr std::size_t kMaxEngineNameLength = 20;

// Durable translation table. One connection in serialized threading mode,
// shared by every worker.
class CacheStore {
public:
    ~CacheStore();

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    static std::unique_ptr<CacheStore> open(const std::filesystem::path& path, std::string& error);
    static std::unique_ptr<CacheStore> open_in_memory(std::string& error);

    // $XDG_CACHE_HOME/pdf_mt/cache.v1.db, else ~/.cache/pdf_mt/cache.v1.db.
    static std::filesystem::path default_path();

    // Deletes the database together with its -wal and -shm files.
    static bool reset(const std::filesystem::path& path, std::string& error);

    // nullopt with an empty error is a miss.
    std::optional<std::string> lookup(
        const std::string& engine,
        const std::string& params,
        const std::string& original_text,
        std::string& error
    );

    bool upsert(
        const std::string& engine,
        const std::string& params,
        const std::string& original_text,
        const std::string& translation,
        std::string& error
    );

    bool row_count(std::size_t& out_count, std::string& error);

private:
    explicit CacheStore(sqlite3* db);

    static std::unique_ptr<CacheStore> open_uri(const std::string& location, std::string& error);

    sqlite3* db_ = nullptr;
};

// Memoizes translations for one engine under a canonical parameter fingerprint.
// get/set are safe to call from many threads; storage failures degrade to misses.
class TranslationCache {
public:
    TranslationCache(CacheStore* store, std::string engine, nlohmann::json params = nlohmann::json::object());

    std::optional<std::string> get(const std::string& original_text) const;
    void set(const std::string& original_text, const std::string& translation) const;

    void replace_params(nlohmann::json params);
    void update_params(const std::string& key, nlohmann::json value);

    const std::string& engine() const { return engine_; }
    std::string fingerprint() const;

private:
    CacheStore* store_ = nullptr;
    std::string engine_;

    mutable std::mutex params_mutex_;
    nlohmann::json params_;
    std::string fingerprint_;
};

// Keys sorted at every depth, compact separators.
std::string canonical_params(const nlohmann::json& params);

}  // namespace pdf_mt
