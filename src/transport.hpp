#pragma once

#include "call_context.hpp"

#include <map>
#include <stdexcept>
#include <string>

namespace refyne {

/// Case-insensitive ordering for HTTP header names.
struct HeaderNameLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using Headers = std::map<std::string, std::string, HeaderNameLess>;

/// Value of header @p name, or "" when absent.
std::string headerValue(const Headers& headers, const std::string& name);

struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string url;      // absolute
    Headers     headers;
    std::string body;     // empty for no body
};

struct HttpResponse {
    unsigned int status = 0;
    Headers      headers;
    std::string  body;
};

/// Connection, I/O or timeout failure below the HTTP layer.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message, bool cancelled = false)
        : std::runtime_error(message), mCancelled(cancelled) {}

    /// The attempt was aborted by the caller's context rather than failing.
    bool isCancelled() const { return mCancelled; }

private:
    bool mCancelled;
};

/// Sends one HTTP request. Swap in your own for proxies, custom TLS or tests.
class Transport {
public:
    virtual ~Transport() = default;

    /// Perform a single attempt. Must give up at @p deadline and as soon as
    /// @p ctx is cancelled.
    /// @throws TransportError on any failure that produced no HTTP response.
    virtual HttpResponse send(const HttpRequest& request,
                              const CallContext& ctx,
                              CallContext::TimePoint deadline) = 0;
};

} // namespace refyne
