#include "client.hpp"
#include "beast_transport.hpp"
#include "retry_policy.hpp"
#include "util.hpp"

#include <stdexcept>

namespace refyne {

// ---------------------------------------------------------------------------
// OneShotGate
// ---------------------------------------------------------------------------

bool OneShotGate::runOnce(const std::function<void()>& check) {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mDone) {
        if (mFailure) std::rethrow_exception(mFailure);
        return false;
    }

    mDone = true;
    try {
        check();
    } catch (...) {
        mFailure = std::current_exception();
        throw;
    }
    return true;
}

bool OneShotGate::done() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mDone;
}

// ---------------------------------------------------------------------------
// User agent
// ---------------------------------------------------------------------------

namespace {

std::string compilerId() {
#if defined(__clang__)
    return "clang/" + std::to_string(__clang_major__) + "." +
           std::to_string(__clang_minor__);
#elif defined(__GNUC__)
    return "gcc/" + std::to_string(__GNUC__) + "." + std::to_string(__GNUC_MINOR__);
#elif defined(_MSC_VER)
    return "msvc/" + std::to_string(_MSC_VER);
#else
    return "unknown/0";
#endif
}

std::string platformId() {
#if defined(__linux__)
    std::string os = "linux";
#elif defined(__APPLE__)
    std::string os = "darwin";
#elif defined(_WIN32)
    std::string os = "windows";
#else
    std::string os = "unknown";
#endif

#if defined(__x86_64__) || defined(_M_X64)
    return os + "/amd64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return os + "/arm64";
#elif defined(__i386__) || defined(_M_IX86)
    return os + "/386";
#else
    return os + "/unknown";
#endif
}

bool isGet(const std::string& method) {
    return toUpper(method) == "GET";
}

} // namespace

std::string buildUserAgent(const std::string& suffix) {
    std::string ua = std::string("Refyne-SDK-Cpp/") + kSdkVersion +
                     " (" + compilerId() + "; " + platformId() + ")";
    if (!suffix.empty()) {
        ua += " " + suffix;
    }
    return ua;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Client::Client(std::string apiKey, ClientOptions options)
    : mApiKey(std::move(apiKey))
    , mAuthHash(hashApiKey(mApiKey))
    , mBaseUrl(trimTrailingSlashes(options.baseUrl))
    , mTimeout(options.timeout)
    , mMaxRetries(options.maxRetries)
    , mCacheEnabled(options.cacheEnabled)
    , mCache(std::move(options.cache))
    , mTransport(std::move(options.transport))
    , mLogger(std::move(options.logger))
    , mUserAgent(buildUserAgent(options.userAgentSuffix))
    , mMinApiVersion(std::move(options.minApiVersion))
    , mMaxKnownApiVersion(std::move(options.maxKnownApiVersion))
{
    if (mMaxRetries < 0) {
        throw std::invalid_argument("maxRetries must not be negative");
    }
    const UrlParts parts = parseUrl(mBaseUrl);

    if (!mCache)     mCache     = std::make_shared<MemoryCache>();
    if (!mTransport) mTransport = std::make_shared<BeastTransport>();
    if (!mLogger)    mLogger    = std::make_shared<NullLogger>();

    if (parts.scheme != "https") {
        mLogger->warn("API base URL is not using HTTPS. This is insecure.",
                      {{"baseUrl", mBaseUrl}});
    }
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

nlohmann::json Client::executeRaw(const std::string& method,
                                  const std::string& path,
                                  const nlohmann::json& body,
                                  const CallContext& ctx,
                                  bool skipCache)
{
    return fetch(method, path, body, ctx, skipCache).document;
}

Client::Fetched Client::fetch(const std::string& method,
                              const std::string& path,
                              const nlohmann::json& body,
                              const CallContext& ctx,
                              bool skipCache)
{
    const std::string url = mBaseUrl + path;
    const bool cacheable = isGet(method) && mCacheEnabled;

    Fetched result;
    result.cacheKey = generateCacheKey(method, url, mAuthHash);

    // --- cache lookup ---
    if (cacheable && !skipCache) {
        std::optional<CacheEntry> entry;
        try {
            entry = mCache->get(result.cacheKey);
        } catch (const std::exception& e) {
            mLogger->warn("Cache lookup failed; fetching from the API",
                          {{"key", result.cacheKey}, {"error", e.what()}});
        }
        if (entry) {
            mLogger->debug("Cache hit", {{"key", result.cacheKey}});
            result.document  = std::move(entry->value);
            result.fromCache = true;
            return result;
        }
    }

    // --- network ---
    const HttpRequest request = buildRequest(method, url, body);
    const HttpResponse response = sendWithRetry(request, ctx);

    checkApiVersionOnce(response);

    if (response.status >= 400) {
        throwApiError(static_cast<int>(response.status), response.body,
                      headerValue(response.headers, "Retry-After"));
    }

    if (!response.body.empty()) {
        try {
            result.document = nlohmann::json::parse(response.body);
        } catch (const nlohmann::json::parse_error& e) {
            throw RefyneError(std::string("failed to parse response: ") + e.what(),
                              static_cast<int>(response.status));
        }
    }

    // --- cache store ---
    if (cacheable) {
        const auto entry = createCacheEntry(
            result.document, headerValue(response.headers, "Cache-Control"));
        if (entry) {
            try {
                mCache->set(result.cacheKey, *entry);
                mLogger->debug("Cached response",
                               {{"key", result.cacheKey}, {"expiresAt", entry->expiresAt}});
            } catch (const std::exception& e) {
                mLogger->warn("Cache store failed",
                              {{"key", result.cacheKey}, {"error", e.what()}});
            }
        }
    }

    return result;
}

HttpRequest Client::buildRequest(const std::string& method,
                                 const std::string& url,
                                 const nlohmann::json& body) const
{
    HttpRequest request;
    request.method = toUpper(method);
    request.url    = url;
    request.headers["Authorization"] = "Bearer " + mApiKey;
    request.headers["Content-Type"]  = "application/json";
    request.headers["Accept"]        = "application/json";
    request.headers["User-Agent"]    = mUserAgent;

    if (!body.is_null()) {
        try {
            request.body = body.dump();
        } catch (const nlohmann::json::type_error& e) {
            throw RefyneError(std::string("failed to marshal request body: ") + e.what());
        }
    }
    return request;
}

HttpResponse Client::sendWithRetry(const HttpRequest& request, const CallContext& ctx) {
    for (int attempt = 1; ; ++attempt) {
        if (ctx.isDone()) {
            throw NetworkError(ctx.isCancelled() ? "request cancelled"
                                                 : "context deadline exceeded",
                               true);
        }

        HttpResponse response;
        try {
            response = mTransport->send(request, ctx, ctx.attemptDeadline(mTimeout));
        } catch (const TransportError& e) {
            if (e.isCancelled() || ctx.isDone()) {
                throw NetworkError(e.what(), true);
            }
            if (attempt > mMaxRetries) {
                throw NetworkError(e.what());
            }

            const auto backoff = computeBackoff(attempt);
            mLogger->warn("Network error. Retrying",
                          {{"error", e.what()},
                           {"attempt", attempt},
                           {"maxRetries", mMaxRetries},
                           {"backoffMs", std::chrono::milliseconds(backoff).count()}});
            waitBeforeRetry(ctx, backoff);
            continue;
        } catch (const std::exception& e) {
            // Not an I/O failure (e.g. an unsupported URL scheme); a retry
            // would fail the same way.
            mLogger->error("Transport failed", {{"error", e.what()}});
            throw NetworkError(e.what());
        }

        if (response.status == 429 && attempt <= mMaxRetries) {
            const auto retryAfter = parseRetryAfter(headerValue(response.headers, "Retry-After"));
            mLogger->warn("Rate limited. Retrying",
                          {{"retryAfter", retryAfter.count()},
                           {"attempt", attempt},
                           {"maxRetries", mMaxRetries}});
            waitBeforeRetry(ctx, retryAfter);
            continue;
        }

        if (response.status >= 500 && attempt <= mMaxRetries) {
            const auto backoff = computeBackoff(attempt);
            mLogger->warn("Server error. Retrying",
                          {{"status", response.status},
                           {"attempt", attempt},
                           {"maxRetries", mMaxRetries},
                           {"backoffMs", std::chrono::milliseconds(backoff).count()}});
            waitBeforeRetry(ctx, backoff);
            continue;
        }

        return response;
    }
}

void Client::waitBeforeRetry(const CallContext& ctx, std::chrono::seconds wait) {
    if (!ctx.sleepFor(wait)) {
        throw NetworkError(ctx.isCancelled() ? "request cancelled"
                                             : "context deadline exceeded",
                           true);
    }
}

void Client::checkApiVersionOnce(const HttpResponse& response) {
    mVersionGate.runOnce([&] {
        const std::string apiVersion = headerValue(response.headers, kApiVersionHeader);
        if (apiVersion.empty()) {
            mLogger->warn(std::string("API did not return ") + kApiVersionHeader + " header");
            return;
        }
        checkApiVersionCompatibility(apiVersion, mMinApiVersion,
                                     mMaxKnownApiVersion, *mLogger);
    });
}

// ---------------------------------------------------------------------------
// Convenience endpoints
// ---------------------------------------------------------------------------

ExtractResponse Client::extract(const ExtractRequest& request, const CallContext& ctx) {
    return execute<ExtractResponse>("POST", "/api/v1/extract", request, ctx);
}

CrawlJobCreated Client::crawl(const CrawlRequest& request, const CallContext& ctx) {
    return execute<CrawlJobCreated>("POST", "/api/v1/crawl", request, ctx);
}

AnalyzeResponse Client::analyze(const AnalyzeRequest& request, const CallContext& ctx) {
    return execute<AnalyzeResponse>("POST", "/api/v1/analyze", request, ctx);
}

UsageResponse Client::getUsage(const CallContext& ctx) {
    return execute<UsageResponse>("GET", "/api/v1/usage", nullptr, ctx);
}

} // namespace refyne
