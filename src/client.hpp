#pragma once

#include "cache.hpp"
#include "call_context.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "mapping.hpp"
#include "models.hpp"
#include "services.hpp"
#include "transport.hpp"
#include "version.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace refyne {

constexpr const char* kDefaultBaseUrl = "https://api.refyne.uk";

/// Client settings. Null collaborators are replaced by the defaults:
/// MemoryCache(100), BeastTransport and NullLogger.
struct ClientOptions {
    std::string                baseUrl    = kDefaultBaseUrl;
    std::chrono::milliseconds  timeout    = std::chrono::seconds(30);   // per attempt
    int                        maxRetries = 3;
    bool                       cacheEnabled = true;
    std::shared_ptr<Cache>     cache;
    std::shared_ptr<Transport> transport;
    std::shared_ptr<Logger>    logger;
    std::string                userAgentSuffix;
    std::string                minApiVersion      = kMinApiVersion;
    std::string                maxKnownApiVersion = kMaxKnownApiVersion;
};

/// Runs a check at most once, no matter how many threads race to trigger it.
/// The winner runs the check under the lock, so the others wait for it. If the
/// check threw, the same exception is rethrown to every later caller.
class OneShotGate {
public:
    /// @return true if this call ran @p check.
    bool runOnce(const std::function<void()>& check);

    bool done() const;

private:
    mutable std::mutex mMutex;
    bool               mDone = false;
    std::exception_ptr mFailure;
};

/// "Refyne-SDK-Cpp/<version> (<compiler>/<version>; <os>/<arch>)[ <suffix>]"
std::string buildUserAgent(const std::string& suffix = "");

/// Client for the Refyne web-extraction API.
///
/// Every call goes through one pipeline: bearer authentication, a response
/// cache for GET requests honoring Cache-Control, retries with backoff for
/// network errors, 429 and 5xx, a one-time API version check, and
/// translation of error responses into RefyneError subclasses.
///
/// A Client may be shared by many threads.
class Client {
public:
    /// @throws std::invalid_argument if the base URL is malformed or
    ///         maxRetries is negative.
    explicit Client(std::string apiKey, ClientOptions options = {});

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Run the request pipeline and return the decoded JSON body (null for an
    /// empty body).
    /// @param body       Request payload; null sends no body.
    /// @param skipCache  Bypass the cache lookup (the response is still stored).
    /// @throws RefyneError or one of its subclasses.
    nlohmann::json executeRaw(const std::string& method,
                              const std::string& path,
                              const nlohmann::json& body = nullptr,
                              const CallContext& ctx = {},
                              bool skipCache = false);

    /// executeRaw() decoded into @p T. A cached document that no longer
    /// decodes is dropped and fetched again from the server.
    template <typename T>
    T execute(const std::string& method,
              const std::string& path,
              const nlohmann::json& body = nullptr,
              const CallContext& ctx = {})
    {
        Fetched fetched = fetch(method, path, body, ctx, false);
        try {
            return fetched.document.template get<T>();
        } catch (const std::exception& e) {
            if (!fetched.fromCache) {
                throw RefyneError(std::string("failed to parse response: ") + e.what());
            }
            mLogger->warn("Discarding undecodable cache entry", {{"key", fetched.cacheKey}});
            mCache->remove(fetched.cacheKey);
        }

        fetched = fetch(method, path, body, ctx, true);
        try {
            return fetched.document.template get<T>();
        } catch (const std::exception& e) {
            throw RefyneError(std::string("failed to parse response: ") + e.what());
        }
    }

    // ---- convenience endpoints ----
    ExtractResponse extract(const ExtractRequest& request, const CallContext& ctx = {});
    CrawlJobCreated crawl(const CrawlRequest& request, const CallContext& ctx = {});
    AnalyzeResponse analyze(const AnalyzeRequest& request, const CallContext& ctx = {});
    UsageResponse   getUsage(const CallContext& ctx = {});

    JobsService&    jobs()    { return mJobs; }
    SchemasService& schemas() { return mSchemas; }
    SitesService&   sites()   { return mSites; }
    KeysService&    keys()    { return mKeys; }
    LlmService&     llm()     { return mLlm; }

    // ---- accessors ----
    const std::string&        baseUrl()    const { return mBaseUrl; }
    std::chrono::milliseconds timeout()    const { return mTimeout; }
    int                       maxRetries() const { return mMaxRetries; }
    bool                      cacheEnabled() const { return mCacheEnabled; }
    const std::string&        userAgent()  const { return mUserAgent; }
    Cache&                    cache()      { return *mCache; }
    bool                      apiVersionChecked() const { return mVersionGate.done(); }

private:
    struct Fetched {
        nlohmann::json document;
        bool           fromCache = false;
        std::string    cacheKey;
    };

    Fetched fetch(const std::string& method, const std::string& path,
                  const nlohmann::json& body, const CallContext& ctx,
                  bool skipCache);

    HttpRequest  buildRequest(const std::string& method, const std::string& url,
                              const nlohmann::json& body) const;
    HttpResponse sendWithRetry(const HttpRequest& request, const CallContext& ctx);
    void         waitBeforeRetry(const CallContext& ctx, std::chrono::seconds wait);
    void         checkApiVersionOnce(const HttpResponse& response);

    std::string                mApiKey;
    std::string                mAuthHash;
    std::string                mBaseUrl;
    std::chrono::milliseconds  mTimeout;
    int                        mMaxRetries;
    bool                       mCacheEnabled;
    std::shared_ptr<Cache>     mCache;
    std::shared_ptr<Transport> mTransport;
    std::shared_ptr<Logger>    mLogger;
    std::string                mUserAgent;
    std::string                mMinApiVersion;
    std::string                mMaxKnownApiVersion;
    OneShotGate                mVersionGate;

    JobsService    mJobs{*this};
    SchemasService mSchemas{*this};
    SitesService   mSites{*this};
    KeysService    mKeys{*this};
    LlmService     mLlm{*this};
};

} // namespace refyne
