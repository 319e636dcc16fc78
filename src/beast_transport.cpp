#include "beast_transport.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef REFYNE_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <algorithm>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace refyne {

namespace {

using Clock = CallContext::Clock;

// ---------------------------------------------------------------------------
// Driving one asynchronous step to completion
// ---------------------------------------------------------------------------

/// Run @p ioc until @p done is set. On cancellation or deadline, call
/// @p abort (which must make the pending operation complete), let the
/// aborted handlers run, and throw.
void await(net::io_context& ioc, const bool& done,
           const CallContext& ctx, CallContext::TimePoint deadline,
           const std::function<void()>& abort)
{
    while (!done) {
        const bool cancelled = ctx.isCancelled();
        const bool expired   = Clock::now() >= deadline;
        if (cancelled || expired) {
            abort();
            ioc.restart();
            ioc.run();

            if (cancelled) {
                throw TransportError("request cancelled", true);
            }
            // The caller's own deadline is final; a per-attempt timeout is not.
            throw TransportError(ctx.isDone() ? "context deadline exceeded"
                                              : "request timed out",
                                 ctx.isDone());
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        ioc.run_for(std::min(remaining, BeastTransport::kPollInterval));
        if (ioc.stopped()) {
            ioc.restart();
        }
    }
}

void throwIfFailed(const beast::error_code& ec, const char* step) {
    if (ec) {
        throw TransportError(std::string(step) + " failed: " + ec.message());
    }
}

http::request<http::string_body> buildRequest(const UrlParts& url,
                                              const HttpRequest& request)
{
    http::request<http::string_body> req;
    req.version(11);
    req.target(url.target);

    const http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        req.method_string(request.method);
    } else {
        req.method(verb);
    }

    req.set(http::field::host, url.host);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

HttpResponse toResponse(http::response<http::string_body>& res) {
    HttpResponse response;
    response.status = res.result_int();
    for (const auto& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = std::move(res.body());
    return response;
}

/// Resolve the host and connect @p socketLayer to it.
void connect(net::io_context& ioc, beast::tcp_stream& socketLayer,
             const UrlParts& url, const CallContext& ctx,
             CallContext::TimePoint deadline)
{
    tcp::resolver resolver(ioc);
    tcp::resolver::results_type endpoints;
    beast::error_code ec;
    bool done = false;

    resolver.async_resolve(url.host, url.port,
        [&](const beast::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
            done = true;
        });
    await(ioc, done, ctx, deadline, [&] { resolver.cancel(); });
    throwIfFailed(ec, "resolve");

    done = false;
    socketLayer.async_connect(endpoints,
        [&](const beast::error_code& e, const tcp::endpoint&) {
            ec = e;
            done = true;
        });
    await(ioc, done, ctx, deadline, [&] { socketLayer.close(); });
    throwIfFailed(ec, "connect");
}

/// Write the request and read the full response on an established stream.
template <typename Stream>
HttpResponse exchange(net::io_context& ioc, Stream& stream,
                      beast::tcp_stream& socketLayer,
                      http::request<http::string_body>& req,
                      const CallContext& ctx, CallContext::TimePoint deadline)
{
    beast::error_code ec;
    bool done = false;

    http::async_write(stream, req,
        [&](const beast::error_code& e, std::size_t) {
            ec = e;
            done = true;
        });
    await(ioc, done, ctx, deadline, [&] { socketLayer.close(); });
    throwIfFailed(ec, "write");

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(BeastTransport::kBodyLimit);

    done = false;
    http::async_read(stream, buffer, parser,
        [&](const beast::error_code& e, std::size_t) {
            ec = e;
            done = true;
        });
    await(ioc, done, ctx, deadline, [&] { socketLayer.close(); });
    throwIfFailed(ec, "read");

    return toResponse(parser.get());
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport(bool verbose)
    : mVerbose(verbose) {}

bool BeastTransport::supportsHttps() {
#ifdef REFYNE_HAS_SSL
    return true;
#else
    return false;
#endif
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::send(const HttpRequest& request,
                                  const CallContext& ctx,
                                  CallContext::TimePoint deadline)
{
    const UrlParts url = parseUrl(request.url);

    if (url.scheme == "https" && !supportsHttps()) {
        throw std::invalid_argument(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
    }

    if (mVerbose) {
        std::cerr << "[BeastTransport] " << request.method << " " << url.host
                  << ":" << url.port << url.target << "\n";
        if (request.body.size() <= 300) {
            std::cerr << "[BeastTransport] Body: " << request.body << "\n";
        } else {
            std::cerr << "[BeastTransport] Body: " << request.body.substr(0, 300)
                      << " ...(truncated)\n";
        }
    }

    HttpResponse response = url.scheme == "https"
        ? doHttpsRequest(url, request, ctx, deadline)
        : doHttpRequest(url, request, ctx, deadline);

    if (mVerbose) {
        std::cerr << "[BeastTransport] HTTP " << response.status << "\n";
    }
    return response;
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpRequest(const UrlParts& url,
                                           const HttpRequest& request,
                                           const CallContext& ctx,
                                           CallContext::TimePoint deadline)
{
    net::io_context   ioc;
    beast::tcp_stream stream(ioc);

    connect(ioc, stream, url, ctx, deadline);

    auto req = buildRequest(url, request);
    HttpResponse response = exchange(ioc, stream, stream, req, ctx, deadline);

    // Graceful shutdown; the response is already complete.
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpsRequest(const UrlParts& url,
                                            const HttpRequest& request,
                                            const CallContext& ctx,
                                            CallContext::TimePoint deadline)
{
#ifdef REFYNE_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    sslCtx(ssl::context::tlsv12_client);
    sslCtx.set_default_verify_paths();
    sslCtx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, sslCtx);
    auto& socketLayer = beast::get_lowest_layer(stream);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw TransportError("failed to set SNI hostname");
    }

    connect(ioc, socketLayer, url, ctx, deadline);

    beast::error_code ec;
    bool done = false;
    stream.async_handshake(ssl::stream_base::client,
        [&](const beast::error_code& e) {
            ec = e;
            done = true;
        });
    await(ioc, done, ctx, deadline, [&] { socketLayer.close(); });
    throwIfFailed(ec, "TLS handshake");

    auto req = buildRequest(url, request);
    HttpResponse response = exchange(ioc, stream, socketLayer, req, ctx, deadline);

    // Skip the TLS close_notify exchange; the response is already complete.
    socketLayer.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
#else
    (void)url;
    (void)request;
    (void)ctx;
    (void)deadline;
    throw std::invalid_argument("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace refyne
