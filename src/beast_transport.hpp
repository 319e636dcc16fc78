#pragma once

#include "transport.hpp"
#include "util.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace refyne {

/// Default HTTP/1.1 transport built on Boost.Beast.
/// Each send() runs on a private io_context so a call never blocks another,
/// and polls the caller's context so cancellation is observed promptly.
class BeastTransport : public Transport {
public:
    explicit BeastTransport(bool verbose = false);

    /// @throws std::invalid_argument for https URLs when built without OpenSSL.
    HttpResponse send(const HttpRequest& request,
                      const CallContext& ctx,
                      CallContext::TimePoint deadline) override;

    void setVerbose(bool v) { mVerbose = v; }

    static bool supportsHttps();

    /// Largest response body accepted.
    static constexpr std::uint64_t kBodyLimit = 64ull * 1024 * 1024;

    /// How often a blocked attempt re-checks cancellation and deadline.
    static constexpr std::chrono::milliseconds kPollInterval{20};

private:
    bool mVerbose;

    HttpResponse doHttpRequest(const UrlParts& url, const HttpRequest& request,
                               const CallContext& ctx,
                               CallContext::TimePoint deadline);
    HttpResponse doHttpsRequest(const UrlParts& url, const HttpRequest& request,
                                const CallContext& ctx,
                                CallContext::TimePoint deadline);
};

} // namespace refyne
