#pragma once

#include "cache_control.hpp"

#include <cstdint>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace refyne {

/// A cached response document.
struct CacheEntry {
    nlohmann::json         value;
    int64_t                expiresAt = 0;   // unix epoch seconds
    CacheControlDirectives cacheControl;
};

/// Storage behind the response cache. Implementations must be safe to call
/// from several threads at once.
class Cache {
public:
    virtual ~Cache() = default;

    virtual std::optional<CacheEntry> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const CacheEntry& entry) = 0;
    virtual void remove(const std::string& key) = 0;
};

/// Bounded in-memory cache with first-in-first-out eviction.
/// Reads do not promote entries; only insertion order decides eviction.
class MemoryCache : public Cache {
public:
    static constexpr std::size_t kDefaultMaxEntries = 100;

    /// @throws std::invalid_argument if maxEntries is 0.
    explicit MemoryCache(std::size_t maxEntries = kDefaultMaxEntries);

    /// Fresh entries are returned as-is. Expired entries are still returned
    /// inside their stale-while-revalidate window, and purged after it.
    std::optional<CacheEntry> get(const std::string& key) override;

    /// No-op for entries marked no-store.
    void set(const std::string& key, const CacheEntry& entry) override;
    void remove(const std::string& key) override;

    void        clear();
    std::size_t size() const;
    std::size_t maxEntries() const { return mMaxEntries; }

private:
    struct Slot {
        CacheEntry                       entry;
        std::list<std::string>::iterator orderPos;
    };

    void eraseLocked(const std::string& key);

    std::size_t                           mMaxEntries;
    std::unordered_map<std::string, Slot> mStore;
    std::list<std::string>                mOrder;   // oldest first
    mutable std::shared_mutex             mMutex;
};

/// Current time as unix epoch seconds.
int64_t nowEpochSeconds();

/// Build a cache entry for a response, or std::nullopt when the
/// Cache-Control header forbids storage or gives no max-age.
std::optional<CacheEntry> createCacheEntry(const nlohmann::json& value,
                                           const std::string& cacheControlHeader);

/// Short, stable fingerprint of an API key (base-36 of a 32-bit string hash).
std::string hashApiKey(const std::string& apiKey);

/// "METHOD:url[:authHash]" with the method upper-cased.
std::string generateCacheKey(const std::string& method,
                             const std::string& url,
                             const std::string& authHash);

} // namespace refyne
