#include "translation_cache.hpp"

#include "log.hpp"

#include <sqlite3.h>

#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace pdf_mt {

namespace {

constexpr const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS translation_cache ("
    " id INTEGER PRIMARY KEY,"
    " translate_engine VARCHAR(20) NOT NULL,"
    " translate_engine_params TEXT NOT NULL,"
    " original_text TEXT NOT NULL,"
    " translation TEXT NOT NULL,"
    " UNIQUE (translate_engine, translate_engine_params, original_text) ON CONFLICT REPLACE"
    ");";

constexpr const char* kLookupSql =
    "SELECT translation FROM translation_cache"
    " WHERE translate_engine = ?1 AND translate_engine_params = ?2 AND original_text = ?3;";

constexpr const char* kUpsertSql =
    "INSERT INTO translation_cache (translate_engine, translate_engine_params, original_text, translation)"
    " VALUES (?1, ?2, ?3, ?4);";

constexpr int kBusyTimeoutMs = 1000;

// Finalizes a prepared statement on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql, std::string& error) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            error = sqlite3_errmsg(db);
            stmt_ = nullptr;
        }
    }

    ~Statement() {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }
    explicit operator bool() const { return stmt_ != nullptr; }

    bool bind_text(int index, const std::string& value) {
        return sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) ==
            SQLITE_OK;
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

bool exec_sql(sqlite3* db, const char* sql, std::string& error) {
    char* message = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        error = message != nullptr ? message : sqlite3_errmsg(db);
        sqlite3_free(message);
        return false;
    }
    return true;
}

}  // namespace

CacheStore::CacheStore(sqlite3* db) : db_(db) {}

CacheStore::~CacheStore() {
    if (db_ != nullptr) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

std::unique_ptr<CacheStore> CacheStore::open_uri(const std::string& location, std::string& error) {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(location.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        error = "Failed to open translation cache " + location + ": " +
            (db != nullptr ? sqlite3_errmsg(db) : "out of memory");
        sqlite3_close_v2(db);
        return nullptr;
    }

    std::unique_ptr<CacheStore> store(new CacheStore(db));
    sqlite3_busy_timeout(db, kBusyTimeoutMs);

    std::string sql_error;
    if (!exec_sql(db, "PRAGMA journal_mode=WAL;", sql_error) || !exec_sql(db, kCreateTableSql, sql_error)) {
        error = "Failed to initialize translation cache " + location + ": " + sql_error;
        return nullptr;
    }

    return store;
}

std::unique_ptr<CacheStore> CacheStore::open(const std::filesystem::path& path, std::string& error) {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = "Failed to create cache directory " + parent.string() + ": " + ec.message();
            return nullptr;
        }
    }
    return open_uri(path.string(), error);
}

std::unique_ptr<CacheStore> CacheStore::open_in_memory(std::string& error) {
    return open_uri(":memory:", error);
}

std::filesystem::path CacheStore::default_path() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg != nullptr && *xdg != '\0') {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        base = std::filesystem::path(home) / ".cache";
    } else {
        base = std::filesystem::temp_directory_path();
    }
    return base / "pdf_mt" / "cache.v1.db";
}

bool CacheStore::reset(const std::filesystem::path& path, std::string& error) {
    for (const auto& suffix : {"", "-wal", "-shm"}) {
        const std::filesystem::path target = path.string() + suffix;
        std::error_code ec;
        std::filesystem::remove(target, ec);
        if (ec) {
            error = "Failed to remove " + target.string() + ": " + ec.message();
            return false;
        }
    }
    return true;
}

std::optional<std::string> CacheStore::lookup(
    const std::string& engine,
    const std::string& params,
    const std::string& original_text,
    std::string& error
) {
    Statement stmt(db_, kLookupSql, error);
    if (!stmt) {
        return std::nullopt;
    }
    if (!stmt.bind_text(1, engine) || !stmt.bind_text(2, params) || !stmt.bind_text(3, original_text)) {
        error = sqlite3_errmsg(db_);
        return std::nullopt;
    }

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        const auto* data = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
        const int size = sqlite3_column_bytes(stmt.get(), 0);
        return std::string(data != nullptr ? data : "", static_cast<std::size_t>(size));
    }
    if (rc != SQLITE_DONE) {
        error = sqlite3_errmsg(db_);
    }
    return std::nullopt;
}

bool CacheStore::upsert(
    const std::string& engine,
    const std::string& params,
    const std::string& original_text,
    const std::string& translation,
    std::string& error
) {
    Statement stmt(db_, kUpsertSql, error);
    if (!stmt) {
        return false;
    }
    if (!stmt.bind_text(1, engine) || !stmt.bind_text(2, params) || !stmt.bind_text(3, original_text) ||
        !stmt.bind_text(4, translation)) {
        error = sqlite3_errmsg(db_);
        return false;
    }
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        error = sqlite3_errmsg(db_);
        return false;
    }
    return true;
}

bool CacheStore::row_count(std::size_t& out_count, std::string& error) {
    Statement stmt(db_, "SELECT COUNT(*) FROM translation_cache;", error);
    if (!stmt) {
        return false;
    }
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        error = sqlite3_errmsg(db_);
        return false;
    }
    out_count = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
    return true;
}

std::string canonical_params(const nlohmann::json& params) {
    // nlohmann::json objects are std::map backed, so dump() is already key-sorted at every depth.
    return params.dump();
}

TranslationCache::TranslationCache(CacheStore* store, std::string engine, nlohmann::json params)
    : store_(store), engine_(std::move(engine)), params_(std::move(params)) {
    if (engine_.size() > kMaxEngineNameLength) {
        throw std::invalid_argument(
            "Translation engine name longer than " + std::to_string(kMaxEngineNameLength) + " characters: " + engine_
        );
    }
    if (params_.is_null()) {
        params_ = nlohmann::json::object();
    }
    fingerprint_ = canonical_params(params_);
}

std::optional<std::string> TranslationCache::get(const std::string& original_text) const {
    if (store_ == nullptr) {
        return std::nullopt;
    }

    const std::string params = fingerprint();
    std::string error;
    auto hit = store_->lookup(engine_, params, original_text, error);
    if (!error.empty()) {
        log_debug("cache lookup failed: " + error);
    }
    return hit;
}

void TranslationCache::set(const std::string& original_text, const std::string& translation) const {
    if (store_ == nullptr) {
        return;
    }

    const std::string params = fingerprint();
    std::string error;
    if (!store_->upsert(engine_, params, original_text, translation, error)) {
        log_debug("cache write dropped: " + error);
    }
}

void TranslationCache::replace_params(nlohmann::json params) {
    if (params.is_null()) {
        params = nlohmann::json::object();
    }
    std::lock_guard<std::mutex> lock(params_mutex_);
    params_ = std::move(params);
    fingerprint_ = canonical_params(params_);
}

void TranslationCache::update_params(const std::string& key, nlohmann::json value) {
    std::lock_guard<std::mutex> lock(params_mutex_);
    if (!params_.is_object()) {
        params_ = nlohmann::json::object();
    }
    params_[key] = std::move(value);
    fingerprint_ = canonical_params(params_);
}

std::string TranslationCache::fingerprint() const {
    std::lock_guard<std::mutex> lock(params_mutex_);
    return fingerprint_;
}

}  // namespace pdf_mt
