#include "retry_policy.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdint>

namespace refyne {

std::chrono::seconds computeBackoff(int attempt) {
    attempt = std::max(attempt, 1);

    // 2^5 already exceeds the cap; avoid shifting into overflow territory.
    if (attempt > 6) return kMaxBackoff;

    const std::chrono::seconds backoff{int64_t{1} << (attempt - 1)};
    return std::min(backoff, kMaxBackoff);
}

std::chrono::seconds parseRetryAfter(const std::string& header) {
    const auto v = parseInteger(trim(header));
    if (!v || *v < 0) {
        return kDefaultRetryAfter;
    }
    if (*v > kMaxRetryAfter.count()) {
        return kMaxRetryAfter;
    }
    return std::chrono::seconds{*v};
}

} // namespace refyne
