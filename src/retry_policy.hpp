#pragma once

#include <chrono>
#include <string>

namespace refyne {

/// Upper bound for a single backoff wait.
constexpr std::chrono::seconds kMaxBackoff{30};

/// Wait used before retrying a 429 that carries no usable Retry-After.
constexpr std::chrono::seconds kDefaultRetryAfter{1};

/// Largest Retry-After honored; bigger server values are clamped to it.
constexpr std::chrono::seconds kMaxRetryAfter{24 * 60 * 60};

/// Exponential backoff: 2^(attempt-1) seconds, capped at kMaxBackoff.
/// attempt is 1-based; values below 1 are treated as 1.
std::chrono::seconds computeBackoff(int attempt);

/// Retry-After value in seconds. Empty, non-numeric or negative input gives
/// kDefaultRetryAfter; "0" means retry immediately. Values above
/// kMaxRetryAfter are clamped.
std::chrono::seconds parseRetryAfter(const std::string& header);

} // namespace refyne
