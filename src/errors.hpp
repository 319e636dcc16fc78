#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace refyne {

/// Base class of every error the SDK throws.
/// status() is the HTTP status code, or 0 for local / network failures.
class RefyneError : public std::runtime_error {
public:
    explicit RefyneError(const std::string& message,
                         int status = 0,
                         const std::string& detail = "");

    const std::string& message() const { return mMessage; }
    int                status()  const { return mStatus; }
    const std::string& detail()  const { return mDetail; }

protected:
    RefyneError(const std::string& what, const std::string& message,
                int status, const std::string& detail);

private:
    std::string mMessage;
    int         mStatus;
    std::string mDetail;
};

/// Any >= 400 response without a more specific mapping.
class ApiError : public RefyneError {
public:
    ApiError(const std::string& message, int status, const std::string& detail = "");
};

/// 400: the request failed validation. fields() maps field name -> problem.
class ValidationError : public RefyneError {
public:
    ValidationError(const std::string& message,
                    std::map<std::string, std::string> fields);

    const std::map<std::string, std::string>& fields() const { return mFields; }

private:
    std::map<std::string, std::string> mFields;
};

/// 401: missing or invalid API key.
class AuthenticationError : public RefyneError {
public:
    explicit AuthenticationError(const std::string& message);
};

/// 403
class ForbiddenError : public RefyneError {
public:
    explicit ForbiddenError(const std::string& message);
};

/// 404
class NotFoundError : public RefyneError {
public:
    explicit NotFoundError(const std::string& message);
};

/// 429 that survived every retry. retryAfterSeconds() is the server's hint.
class RateLimitError : public RefyneError {
public:
    RateLimitError(const std::string& message, int retryAfterSeconds);

    int retryAfterSeconds() const { return mRetryAfter; }

private:
    int mRetryAfter;
};

/// The transport failed after every retry, or the call was cancelled.
class NetworkError : public RefyneError {
public:
    explicit NetworkError(const std::string& cause, bool cancelled = false);

    const std::string& cause()       const { return message(); }
    bool               isCancelled() const { return mCancelled; }

private:
    bool mCancelled;
};

/// The server speaks an API version older than this SDK supports.
class UnsupportedApiVersionError : public RefyneError {
public:
    UnsupportedApiVersionError(const std::string& apiVersion,
                               const std::string& minVersion,
                               const std::string& maxKnownVersion);

    const std::string& apiVersion()      const { return mApiVersion; }
    const std::string& minVersion()      const { return mMinVersion; }
    const std::string& maxKnownVersion() const { return mMaxKnownVersion; }

private:
    std::string mApiVersion;
    std::string mMinVersion;
    std::string mMaxKnownVersion;
};

/// Default reported to callers when a 429 carries no usable Retry-After.
constexpr int kDefaultRateLimitRetryAfterSeconds = 60;

/// Standard reason phrase for an HTTP status ("Not Found"), or "HTTP <code>"
/// for codes without one.
std::string statusText(int status);

/// Translate a terminal error response into the matching exception and throw it.
/// @param body              Raw response body; JSON with optional "error",
///                          "detail" and "errors" members. May be empty.
/// @param retryAfterHeader  Raw Retry-After header value (429 only).
void throwApiError(int status,
                   const std::string& body,
                   const std::string& retryAfterHeader = "");

} // namespace refyne
