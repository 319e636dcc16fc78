#include "cache_control.hpp"
#include "util.hpp"

#include <limits>

namespace refyne {

namespace {

std::optional<int> parseSeconds(const std::string& value) {
    const auto v = parseInteger(trim(value));
    if (!v || *v < 0 || *v > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

CacheControlDirectives parseCacheControl(const std::string& header) {
    static const std::string kMaxAge = "max-age=";
    static const std::string kStale  = "stale-while-revalidate=";

    CacheControlDirectives d;
    const std::string lowered = toLower(header);

    std::size_t start = 0;
    while (start <= lowered.size()) {
        auto comma = lowered.find(',', start);
        if (comma == std::string::npos) comma = lowered.size();
        const std::string token = trim(lowered.substr(start, comma - start));
        start = comma + 1;

        if (token == "no-store") {
            d.noStore = true;
        } else if (token == "no-cache") {
            d.noCache = true;
        } else if (token == "private") {
            d.isPrivate = true;
        } else if (startsWith(token, kMaxAge)) {
            if (auto v = parseSeconds(token.substr(kMaxAge.size()))) d.maxAge = v;
        } else if (startsWith(token, kStale)) {
            if (auto v = parseSeconds(token.substr(kStale.size()))) d.staleWhileRevalidate = v;
        }
    }
    return d;
}

} // namespace refyne
