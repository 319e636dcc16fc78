/// @file test_cache.cpp
/// Unit tests for cache.hpp: entry creation, keys and the in-memory FIFO cache.

#include "cache.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace refyne;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static CacheEntry makeEntry(const json& value, int64_t expiresAt,
                            std::optional<int> staleWhileRevalidate = std::nullopt) {
    CacheEntry e;
    e.value        = value;
    e.expiresAt    = expiresAt;
    e.cacheControl.maxAge = 60;
    e.cacheControl.staleWhileRevalidate = staleWhileRevalidate;
    return e;
}

static CacheEntry freshEntry(const json& value) {
    return makeEntry(value, nowEpochSeconds() + 3600);
}

// ============================================================================
// createCacheEntry
// ============================================================================

TEST(CreateCacheEntry, NoStoreIsNotCacheable) {
    EXPECT_FALSE(createCacheEntry(json{{"a", 1}}, "no-store").has_value());
    EXPECT_FALSE(createCacheEntry(json{{"a", 1}}, "no-store, max-age=60").has_value());
}

TEST(CreateCacheEntry, PrivateWithoutMaxAgeIsNotCacheable) {
    EXPECT_FALSE(createCacheEntry(json{{"a", 1}}, "private").has_value());
}

TEST(CreateCacheEntry, MissingHeaderIsNotCacheable) {
    EXPECT_FALSE(createCacheEntry(json{{"a", 1}}, "").has_value());
}

TEST(CreateCacheEntry, MaxAgeSetsExpiry) {
    const int64_t before = nowEpochSeconds();
    auto entry = createCacheEntry(json{{"a", 1}}, "max-age=3600");
    ASSERT_TRUE(entry.has_value());
    EXPECT_GE(entry->expiresAt, before + 3600);
    EXPECT_LE(entry->expiresAt, nowEpochSeconds() + 3600);
    EXPECT_EQ(entry->value, (json{{"a", 1}}));
    ASSERT_TRUE(entry->cacheControl.maxAge.has_value());
    EXPECT_EQ(*entry->cacheControl.maxAge, 3600);
}

TEST(CreateCacheEntry, KeepsStaleWhileRevalidate) {
    auto entry = createCacheEntry(json::array(), "max-age=10, stale-while-revalidate=20");
    ASSERT_TRUE(entry.has_value());
    ASSERT_TRUE(entry->cacheControl.staleWhileRevalidate.has_value());
    EXPECT_EQ(*entry->cacheControl.staleWhileRevalidate, 20);
}

// ============================================================================
// Keys
// ============================================================================

TEST(CacheKey, UppercasesMethodAndAppendsAuthHash) {
    EXPECT_EQ(generateCacheKey("get", "https://api.test/api/v1/jobs", "abc"),
              "GET:https://api.test/api/v1/jobs:abc");
}

TEST(CacheKey, OmitsEmptyAuthHash) {
    EXPECT_EQ(generateCacheKey("GET", "https://api.test/x", ""), "GET:https://api.test/x");
}

TEST(CacheKey, HashIsDeterministicAndKeySpecific) {
    EXPECT_EQ(hashApiKey("secret-key"), hashApiKey("secret-key"));
    EXPECT_NE(hashApiKey("secret-key"), hashApiKey("other-key"));
    EXPECT_EQ(hashApiKey(""), "0");
}

TEST(CacheKey, HashIsBase36OfStringHash) {
    // 'a' = 97 -> "2p"; "ab" = 97*31 + 98 = 3105 -> "2e9"
    EXPECT_EQ(hashApiKey("a"), "2p");
    EXPECT_EQ(hashApiKey("ab"), "2e9");
}

TEST(CacheKey, HashRunsOverCodePoints) {
    EXPECT_EQ(hashApiKey("\xC3\xA9"), "6h");            // U+00E9 = 233, not bytes C3 A9
    EXPECT_EQ(hashApiKey("\xE2\x82\xAC"), "6gc");       // U+20AC
    EXPECT_EQ(hashApiKey("\xF0\x9F\x98\x80"), "2r5s");  // U+1F600
    EXPECT_EQ(hashApiKey("k\xC3\xA9y"), "2d0b");
}

TEST(CacheKey, InvalidUtf8BytesHashAsReplacementCharacter) {
    EXPECT_EQ(hashApiKey("\xFF"), "1ekd");          // U+FFFD
    EXPECT_EQ(hashApiKey("\xE2\x82"), "18y3k");     // truncated: two U+FFFD
    EXPECT_EQ(hashApiKey("\xC0\xAF"), "18y3k");     // overlong '/'
}

// ============================================================================
// MemoryCache: basic operations
// ============================================================================

TEST(MemoryCache, ZeroCapacityRejected) {
    EXPECT_THROW(MemoryCache(0), std::invalid_argument);
}

TEST(MemoryCache, SetThenGet) {
    MemoryCache cache(10);
    cache.set("k", freshEntry(json{{"v", 1}}));

    auto got = cache.get("k");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->value, (json{{"v", 1}}));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(MemoryCache, MissingKeyNotFound) {
    MemoryCache cache(10);
    EXPECT_FALSE(cache.get("absent").has_value());
}

TEST(MemoryCache, RemoveDeletesEntry) {
    MemoryCache cache(10);
    cache.set("k", freshEntry(1));
    cache.remove("k");
    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST(MemoryCache, ClearEmptiesEverything) {
    MemoryCache cache(10);
    cache.set("a", freshEntry(1));
    cache.set("b", freshEntry(2));
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get("a").has_value());
}

TEST(MemoryCache, NoStoreEntryIgnored) {
    MemoryCache cache(10);
    CacheEntry e = freshEntry(1);
    e.cacheControl.noStore = true;
    cache.set("k", e);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get("k").has_value());
}

// ============================================================================
// MemoryCache: FIFO eviction
// ============================================================================

TEST(MemoryCache, EvictsFirstInsertedAtCapacity) {
    const std::size_t capacity = 3;
    MemoryCache cache(capacity);
    for (int i = 0; i <= static_cast<int>(capacity); ++i) {
        cache.set("key" + std::to_string(i), freshEntry(i));
    }

    EXPECT_EQ(cache.size(), capacity);
    EXPECT_FALSE(cache.get("key0").has_value());
    for (int i = 1; i <= static_cast<int>(capacity); ++i) {
        EXPECT_TRUE(cache.get("key" + std::to_string(i)).has_value()) << "key" << i;
    }
}

TEST(MemoryCache, ReadsDoNotPromoteEntries) {
    MemoryCache cache(2);
    cache.set("a", freshEntry(1));
    cache.set("b", freshEntry(2));
    ASSERT_TRUE(cache.get("a").has_value());   // no LRU promotion

    cache.set("c", freshEntry(3));
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_TRUE(cache.get("b").has_value());
    EXPECT_TRUE(cache.get("c").has_value());
}

TEST(MemoryCache, ReinsertKeepsOriginalPosition) {
    MemoryCache cache(2);
    cache.set("a", freshEntry(1));
    cache.set("b", freshEntry(2));
    cache.set("a", freshEntry(10));   // replace, still oldest
    EXPECT_EQ(cache.size(), 2u);

    auto a = cache.get("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->value, 10);

    cache.set("c", freshEntry(3));
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_TRUE(cache.get("b").has_value());
    EXPECT_TRUE(cache.get("c").has_value());
}

TEST(MemoryCache, RemovedKeyFreesItsSlot) {
    MemoryCache cache(2);
    cache.set("a", freshEntry(1));
    cache.set("b", freshEntry(2));
    cache.remove("a");
    cache.set("c", freshEntry(3));

    EXPECT_TRUE(cache.get("b").has_value());
    EXPECT_TRUE(cache.get("c").has_value());
}

// ============================================================================
// MemoryCache: expiry
// ============================================================================

TEST(MemoryCache, ExpiredEntryIsPurgedOnLookup) {
    MemoryCache cache(10);
    cache.set("k", makeEntry(1, nowEpochSeconds() - 10));
    ASSERT_EQ(cache.size(), 1u);

    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST(MemoryCache, StaleEntryServedWithinGraceWindow) {
    MemoryCache cache(10);
    cache.set("k", makeEntry(json{{"stale", true}}, nowEpochSeconds() - 10, 60));

    auto got = cache.get("k");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->value, (json{{"stale", true}}));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(MemoryCache, StaleEntryPurgedAfterGraceWindow) {
    MemoryCache cache(10);
    cache.set("k", makeEntry(1, nowEpochSeconds() - 100, 30));

    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

// ============================================================================
// MemoryCache: concurrency
// ============================================================================

TEST(MemoryCache, ConcurrentReadersAndWriters) {
    MemoryCache cache(50);
    std::atomic<int> hits{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, &hits, t] {
            for (int i = 0; i < 500; ++i) {
                const std::string key = "k" + std::to_string((i + t) % 80);
                if (i % 3 == 0) {
                    cache.set(key, freshEntry(i));
                } else if (i % 7 == 0) {
                    cache.remove(key);
                } else if (cache.get(key)) {
                    ++hits;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_LE(cache.size(), 50u);
    EXPECT_GT(hits.load(), 0);
}
