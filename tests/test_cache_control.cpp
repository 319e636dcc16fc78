/// @file test_cache_control.cpp
/// Unit tests for cache_control.hpp: Cache-Control header parsing.

#include "cache_control.hpp"

#include <gtest/gtest.h>

using namespace refyne;

// ============================================================================
// Recognized directives
// ============================================================================

TEST(ParseCacheControl, EmptyHeaderYieldsDefaults) {
    auto d = parseCacheControl("");
    EXPECT_FALSE(d.noStore);
    EXPECT_FALSE(d.noCache);
    EXPECT_FALSE(d.isPrivate);
    EXPECT_FALSE(d.maxAge.has_value());
    EXPECT_FALSE(d.staleWhileRevalidate.has_value());
}

TEST(ParseCacheControl, FlagDirectives) {
    EXPECT_TRUE(parseCacheControl("no-store").noStore);
    EXPECT_TRUE(parseCacheControl("no-cache").noCache);
    EXPECT_TRUE(parseCacheControl("private").isPrivate);
}

TEST(ParseCacheControl, MaxAge) {
    auto d = parseCacheControl("max-age=3600");
    ASSERT_TRUE(d.maxAge.has_value());
    EXPECT_EQ(*d.maxAge, 3600);
}

TEST(ParseCacheControl, MaxAgeZeroIsKept) {
    auto d = parseCacheControl("max-age=0");
    ASSERT_TRUE(d.maxAge.has_value());
    EXPECT_EQ(*d.maxAge, 0);
}

TEST(ParseCacheControl, CombinedDirectives) {
    auto d = parseCacheControl("private, max-age=60, stale-while-revalidate=30");
    EXPECT_TRUE(d.isPrivate);
    EXPECT_FALSE(d.noStore);
    ASSERT_TRUE(d.maxAge.has_value());
    EXPECT_EQ(*d.maxAge, 60);
    ASSERT_TRUE(d.staleWhileRevalidate.has_value());
    EXPECT_EQ(*d.staleWhileRevalidate, 30);
}

// ============================================================================
// Tolerance
// ============================================================================

TEST(ParseCacheControl, CaseAndWhitespaceInsensitive) {
    auto canonical = parseCacheControl("no-cache,max-age=60");
    EXPECT_EQ(parseCacheControl("  NO-CACHE ,\tMax-Age=60  "), canonical);
    EXPECT_EQ(parseCacheControl("No-Cache, MAX-AGE=60"), canonical);
}

TEST(ParseCacheControl, TokenOrderDoesNotMatter) {
    auto a = parseCacheControl("private, max-age=10, stale-while-revalidate=5, no-cache");
    auto b = parseCacheControl("no-cache, stale-while-revalidate=5, private, max-age=10");
    EXPECT_EQ(a, b);
}

TEST(ParseCacheControl, ParsingIsRepeatable) {
    const std::string header = "public, max-age=120, stale-while-revalidate=60";
    EXPECT_EQ(parseCacheControl(header), parseCacheControl(header));
}

TEST(ParseCacheControl, UnknownTokensIgnored) {
    auto d = parseCacheControl("public, must-revalidate, s-maxage=100, immutable");
    EXPECT_EQ(d, CacheControlDirectives{});
}

TEST(ParseCacheControl, MalformedValuesIgnored) {
    auto d = parseCacheControl("max-age=abc, stale-while-revalidate=");
    EXPECT_FALSE(d.maxAge.has_value());
    EXPECT_FALSE(d.staleWhileRevalidate.has_value());
}

TEST(ParseCacheControl, NegativeValuesIgnored) {
    auto d = parseCacheControl("max-age=-5");
    EXPECT_FALSE(d.maxAge.has_value());
}

TEST(ParseCacheControl, MalformedTokenDoesNotAffectOthers) {
    auto d = parseCacheControl("max-age=oops, no-store, stale-while-revalidate=15");
    EXPECT_TRUE(d.noStore);
    EXPECT_FALSE(d.maxAge.has_value());
    ASSERT_TRUE(d.staleWhileRevalidate.has_value());
    EXPECT_EQ(*d.staleWhileRevalidate, 15);
}

TEST(ParseCacheControl, EmptyTokensSkipped) {
    auto d = parseCacheControl(",, max-age=5 ,,");
    ASSERT_TRUE(d.maxAge.has_value());
    EXPECT_EQ(*d.maxAge, 5);
}
