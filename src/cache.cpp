#include "cache.hpp"
#include "util.hpp"

#include <chrono>
#include <iterator>
#include <mutex>
#include <stdexcept>

namespace refyne {

namespace {

/// Fresh, or expired but still inside its stale-while-revalidate window.
bool isUsable(const CacheEntry& entry, int64_t now) {
    if (entry.expiresAt >= now) return true;
    return entry.cacheControl.staleWhileRevalidate &&
           now < entry.expiresAt + *entry.cacheControl.staleWhileRevalidate;
}

/// Decode the UTF-8 code point starting at s[i] and advance i past it.
/// Invalid or truncated sequences yield U+FFFD and consume one byte.
uint32_t nextCodePoint(const std::string& s, std::size_t& i) {
    constexpr uint32_t kReplacement = 0xFFFD;

    const auto lead = static_cast<unsigned char>(s[i]);
    if (lead < 0x80) {
        ++i;
        return lead;
    }

    std::size_t length;
    uint32_t    cp;
    uint32_t    smallest;
    if ((lead & 0xE0) == 0xC0) {
        length = 2; cp = lead & 0x1F; smallest = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; cp = lead & 0x0F; smallest = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; cp = lead & 0x07; smallest = 0x10000;
    } else {
        ++i;
        return kReplacement;
    }

    if (s.size() - i < length) {
        ++i;
        return kReplacement;
    }
    for (std::size_t k = 1; k < length; ++k) {
        const auto c = static_cast<unsigned char>(s[i + k]);
        if ((c & 0xC0) != 0x80) {
            ++i;
            return kReplacement;
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF are invalid.
    if (cp < smallest || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++i;
        return kReplacement;
    }
    i += length;
    return cp;
}

} // namespace

// ---------------------------------------------------------------------------
// MemoryCache
// ---------------------------------------------------------------------------

MemoryCache::MemoryCache(std::size_t maxEntries)
    : mMaxEntries(maxEntries)
{
    if (mMaxEntries == 0) {
        throw std::invalid_argument("MemoryCache capacity must be at least 1");
    }
}

std::optional<CacheEntry> MemoryCache::get(const std::string& key) {
    const int64_t now = nowEpochSeconds();
    {
        std::shared_lock<std::shared_mutex> lock(mMutex);
        auto it = mStore.find(key);
        if (it == mStore.end()) {
            return std::nullopt;
        }

        if (isUsable(it->second.entry, now)) {
            return it->second.entry;
        }
    }

    // Fully expired. Re-check under the write lock: another thread may have
    // replaced the entry in between.
    std::unique_lock<std::shared_mutex> lock(mMutex);
    auto it = mStore.find(key);
    if (it != mStore.end() && !isUsable(it->second.entry, now)) {
        eraseLocked(key);
    }
    return std::nullopt;
}

void MemoryCache::set(const std::string& key, const CacheEntry& entry) {
    if (entry.cacheControl.noStore) return;

    std::unique_lock<std::shared_mutex> lock(mMutex);

    auto it = mStore.find(key);
    if (it != mStore.end()) {
        // Replacing keeps the original insertion position.
        it->second.entry = entry;
        return;
    }

    while (mStore.size() >= mMaxEntries && !mOrder.empty()) {
        eraseLocked(mOrder.front());
    }

    mOrder.push_back(key);
    mStore.emplace(key, Slot{entry, std::prev(mOrder.end())});
}

void MemoryCache::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mMutex);
    eraseLocked(key);
}

void MemoryCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mMutex);
    mStore.clear();
    mOrder.clear();
}

std::size_t MemoryCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mMutex);
    return mStore.size();
}

void MemoryCache::eraseLocked(const std::string& key) {
    auto it = mStore.find(key);
    if (it == mStore.end()) return;
    mOrder.erase(it->second.orderPos);
    mStore.erase(it);
}

// ---------------------------------------------------------------------------
// Entry creation and keys
// ---------------------------------------------------------------------------

int64_t nowEpochSeconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::optional<CacheEntry> createCacheEntry(const nlohmann::json& value,
                                           const std::string& cacheControlHeader) {
    const CacheControlDirectives cc = parseCacheControl(cacheControlHeader);

    // Only cache when the server gives an explicit freshness window.
    if (cc.noStore || !cc.maxAge) {
        return std::nullopt;
    }

    CacheEntry entry;
    entry.value        = value;
    entry.expiresAt    = nowEpochSeconds() + *cc.maxAge;
    entry.cacheControl = cc;
    return entry;
}

std::string hashApiKey(const std::string& apiKey) {
    // Unicode code points, not UTF-8 bytes, feed the hash.
    uint32_t h = 0;
    for (std::size_t i = 0; i < apiKey.size();) {
        h = (h << 5) - h + nextCodePoint(apiKey, i);
    }

    if (h == 0) return "0";

    static const char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    while (h > 0) {
        out.insert(out.begin(), kDigits[h % 36]);
        h /= 36;
    }
    return out;
}

std::string generateCacheKey(const std::string& method,
                             const std::string& url,
                             const std::string& authHash) {
    std::string key = toUpper(method) + ":" + url;
    if (!authHash.empty()) {
        key += ":" + authHash;
    }
    return key;
}

} // namespace refyne
