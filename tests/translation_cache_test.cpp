#include "translation_cache.hpp"

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace pdf_mt {
namespace {

std::unique_ptr<CacheStore> memory_store() {
    std::string error;
    auto store = CacheStore::open_in_memory(error);
    EXPECT_NE(store, nullptr) << error;
    return store;
}

std::filesystem::path temp_cache_path(const std::string& name) {
    return std::filesystem::temp_directory_path() /
        ("pdf_mt_" + name + "_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".db");
}

TEST(TranslationCacheTest, CanonicalParamsIgnoreKeyOrder) {
    const auto a = nlohmann::json::parse(R"({"b": 1, "a": {"y": [1, 2], "x": "s"}})");
    const auto b = nlohmann::json::parse(R"({"a": {"x": "s", "y": [1, 2]}, "b": 1})");
    EXPECT_EQ(canonical_params(a), canonical_params(b));
    EXPECT_EQ(canonical_params(a), R"({"a":{"x":"s","y":[1,2]},"b":1})");
}

TEST(TranslationCacheTest, MissThenHit) {
    auto store = memory_store();
    TranslationCache cache(store.get(), "google", {{"lang_out", "zh-CN"}});

    EXPECT_FALSE(cache.get("hello").has_value());
    cache.set("hello", "ni hao");
    const auto hit = cache.get("hello");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "ni hao");
}

TEST(TranslationCacheTest, SecondWriteReplacesFirst) {
    auto store = memory_store();
    TranslationCache cache(store.get(), "google");

    cache.set("hello", "one");
    cache.set("hello", "two");

    EXPECT_EQ(cache.get("hello").value_or(""), "two");
    std::size_t rows = 0;
    std::string error;
    ASSERT_TRUE(store->row_count(rows, error)) << error;
    EXPECT_EQ(rows, 1u);
}

TEST(TranslationCacheTest, EntriesArePartitionedByEngineAndParams) {
    auto store = memory_store();
    TranslationCache google(store.get(), "google", {{"lang_out", "zh-CN"}});
    TranslationCache google_ja(store.get(), "google", {{"lang_out", "ja"}});
    TranslationCache llama(store.get(), "llama", {{"lang_out", "zh-CN"}});

    google.set("hello", "ni hao");

    EXPECT_TRUE(google.get("hello").has_value());
    EXPECT_FALSE(google_ja.get("hello").has_value());
    EXPECT_FALSE(llama.get("hello").has_value());
}

TEST(TranslationCacheTest, PermutedParamsShareEntries) {
    auto store = memory_store();
    TranslationCache first(store.get(), "llama", nlohmann::json::parse(R"({"model": "m", "opts": {"t": 0, "k": 1}})"));
    TranslationCache second(store.get(), "llama", nlohmann::json::parse(R"({"opts": {"k": 1, "t": 0}, "model": "m"})"));

    first.set("text", "translated");
    EXPECT_EQ(second.get("text").value_or(""), "translated");
}

TEST(TranslationCacheTest, UpdateParamsChangesFingerprint) {
    auto store = memory_store();
    TranslationCache cache(store.get(), "google", {{"lang_out", "zh-CN"}});
    cache.set("hello", "ni hao");

    const std::string before = cache.fingerprint();
    cache.update_params("lang_out", "ja");
    EXPECT_NE(cache.fingerprint(), before);
    EXPECT_FALSE(cache.get("hello").has_value());

    cache.replace_params({{"lang_out", "zh-CN"}});
    EXPECT_EQ(cache.fingerprint(), before);
    EXPECT_TRUE(cache.get("hello").has_value());
}

TEST(TranslationCacheTest, RejectsLongEngineName) {
    EXPECT_THROW(TranslationCache(nullptr, std::string(21, 'e')), std::invalid_argument);
    EXPECT_NO_THROW(TranslationCache(nullptr, std::string(20, 'e')));
}

TEST(TranslationCacheTest, WithoutStoreEverythingMisses) {
    TranslationCache cache(nullptr, "google");
    cache.set("hello", "ni hao");
    EXPECT_FALSE(cache.get("hello").has_value());
}

TEST(TranslationCacheTest, PersistsAcrossReopen) {
    const auto path = temp_cache_path("cache");
    std::string error;
    ASSERT_TRUE(CacheStore::reset(path, error)) << error;

    {
        auto store = CacheStore::open(path, error);
        ASSERT_NE(store, nullptr) << error;
        TranslationCache cache(store.get(), "google");
        cache.set("hello", "ni hao");
    }
    {
        auto store = CacheStore::open(path, error);
        ASSERT_NE(store, nullptr) << error;
        TranslationCache cache(store.get(), "google");
        EXPECT_EQ(cache.get("hello").value_or(""), "ni hao");
    }

    ASSERT_TRUE(CacheStore::reset(path, error)) << error;
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(TranslationCacheTest, ConcurrentGetAndSetFromManyThreads) {
    const auto path = temp_cache_path("concurrent");
    std::string error;
    ASSERT_TRUE(CacheStore::reset(path, error)) << error;
    auto store = CacheStore::open(path, error);
    ASSERT_NE(store, nullptr) << error;
    TranslationCache cache(store.get(), "google", {{"lang_out", "zh-CN"}});

    constexpr int kThreads = 8;
    constexpr int kKeysPerThread = 50;
    {
        std::vector<std::jthread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&cache, t]() {
                for (int i = 0; i < kKeysPerThread; ++i) {
                    const std::string key = "text " + std::to_string(t) + "/" + std::to_string(i);
                    cache.set(key, "translated " + key);
                    cache.get(key);
                }
            });
        }
    }

    for (int t = 0; t < kThreads; ++t) {
        for (int i = 0; i < kKeysPerThread; ++i) {
            const std::string key = "text " + std::to_string(t) + "/" + std::to_string(i);
            EXPECT_EQ(cache.get(key).value_or(""), "translated " + key);
        }
    }
    std::size_t rows = 0;
    ASSERT_TRUE(store->row_count(rows, error)) << error;
    EXPECT_EQ(rows, static_cast<std::size_t>(kThreads * kKeysPerThread));

    store.reset();
    ASSERT_TRUE(CacheStore::reset(path, error)) << error;
}

TEST(TranslationCacheTest, BrokenStoreDegradesToMisses) {
    const auto path = temp_cache_path("broken");
    std::string error;
    ASSERT_TRUE(CacheStore::reset(path, error)) << error;
    auto store = CacheStore::open(path, error);
    ASSERT_NE(store, nullptr) << error;
    TranslationCache cache(store.get(), "google");
    cache.set("hello", "ni hao");
    ASSERT_TRUE(cache.get("hello").has_value());

    sqlite3* other = nullptr;
    ASSERT_EQ(sqlite3_open(path.string().c_str(), &other), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(other, "DROP TABLE translation_cache;", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(other);

    EXPECT_FALSE(cache.get("hello").has_value());
    EXPECT_NO_THROW(cache.set("hello", "again"));
    EXPECT_FALSE(cache.get("hello").has_value());

    std::string store_error;
    EXPECT_FALSE(store->upsert("google", "{}", "hello", "again", store_error));
    EXPECT_FALSE(store_error.empty());

    store.reset();
    ASSERT_TRUE(CacheStore::reset(path, error)) << error;
}

}  // namespace
}  // namespace pdf_mt
