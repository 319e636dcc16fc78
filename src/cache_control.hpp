#pragma once

#include <optional>
#include <string>

namespace refyne {

/// Parsed Cache-Control response header.
struct CacheControlDirectives {
    bool               noStore = false;
    bool               noCache = false;
    bool               isPrivate = false;
    std::optional<int> maxAge;                 // seconds
    std::optional<int> staleWhileRevalidate;   // seconds

    bool operator==(const CacheControlDirectives& o) const {
        return noStore == o.noStore && noCache == o.noCache &&
               isPrivate == o.isPrivate && maxAge == o.maxAge &&
               staleWhileRevalidate == o.staleWhileRevalidate;
    }
    bool operator!=(const CacheControlDirectives& o) const { return !(*this == o); }
};

/// Parse a Cache-Control header value. Tokens are comma separated, matched
/// case-insensitively after trimming. Unknown tokens and directives with a
/// non-integer or negative value are ignored; an empty header yields defaults.
CacheControlDirectives parseCacheControl(const std::string& header);

} // namespace refyne
