#include "errors.hpp"
#include "retry_policy.hpp"
#include "util.hpp"

#include <boost/beast/http/status.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>

namespace refyne {

namespace http = boost::beast::http;

// ---------------------------------------------------------------------------
// Exception types
// ---------------------------------------------------------------------------

RefyneError::RefyneError(const std::string& message, int status,
                         const std::string& detail)
    : RefyneError(detail.empty() ? message : message + ": " + detail,
                  message, status, detail) {}

RefyneError::RefyneError(const std::string& what, const std::string& message,
                         int status, const std::string& detail)
    : std::runtime_error(what)
    , mMessage(message)
    , mStatus(status)
    , mDetail(detail) {}

ApiError::ApiError(const std::string& message, int status, const std::string& detail)
    : RefyneError(message, status, detail) {}

ValidationError::ValidationError(const std::string& message,
                                 std::map<std::string, std::string> fields)
    : RefyneError("validation error: " + message, message, 400, "")
    , mFields(std::move(fields)) {}

AuthenticationError::AuthenticationError(const std::string& message)
    : RefyneError("authentication error: " + message, message, 401, "") {}

ForbiddenError::ForbiddenError(const std::string& message)
    : RefyneError("forbidden: " + message, message, 403, "") {}

NotFoundError::NotFoundError(const std::string& message)
    : RefyneError("not found: " + message, message, 404, "") {}

RateLimitError::RateLimitError(const std::string& message, int retryAfterSeconds)
    : RefyneError("rate limit exceeded: " + message, message, 429, "")
    , mRetryAfter(retryAfterSeconds) {}

NetworkError::NetworkError(const std::string& cause, bool cancelled)
    : RefyneError("network error: " + cause, cause, 0, "")
    , mCancelled(cancelled) {}

UnsupportedApiVersionError::UnsupportedApiVersionError(
    const std::string& apiVersion,
    const std::string& minVersion,
    const std::string& maxKnownVersion)
    : RefyneError("API version " + apiVersion + " is not supported. "
                  "This SDK requires API version >= " + minVersion + ". "
                  "Please upgrade the API or use an older SDK version.",
                  "unsupported API version " + apiVersion, 0, "")
    , mApiVersion(apiVersion)
    , mMinVersion(minVersion)
    , mMaxKnownVersion(maxKnownVersion) {}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

std::string statusText(int status) {
    if (status >= 100 && status <= 999) {
        const auto code = http::int_to_status(static_cast<unsigned>(status));
        if (code != http::status::unknown) {
            return std::string(http::obsolete_reason(code));
        }
    }
    return "HTTP " + std::to_string(status);
}

namespace {

struct ErrorBody {
    std::string                        error;
    std::string                        detail;
    std::map<std::string, std::string> fields;
};

// Best effort: a body that is not the documented JSON shape yields empty fields.
ErrorBody parseErrorBody(const std::string& body) {
    ErrorBody out;
    const auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (!doc.is_object()) return out;

    auto it = doc.find("error");
    if (it != doc.end() && it->is_string()) out.error = it->get<std::string>();

    it = doc.find("detail");
    if (it != doc.end() && it->is_string()) out.detail = it->get<std::string>();

    it = doc.find("errors");
    if (it != doc.end() && it->is_object()) {
        for (const auto& item : it->items()) {
            if (item.value().is_string()) {
                out.fields[item.key()] = item.value().get<std::string>();
            } else {
                out.fields[item.key()] = item.value().dump();
            }
        }
    }
    return out;
}

} // namespace

void throwApiError(int status, const std::string& body,
                   const std::string& retryAfterHeader) {
    const ErrorBody parsed = parseErrorBody(body);
    const std::string message = parsed.error.empty() ? statusText(status) : parsed.error;

    switch (status) {
        case 400:
            throw ValidationError(message, parsed.fields);
        case 401:
            throw AuthenticationError(message);
        case 403:
            throw ForbiddenError(message);
        case 404:
            throw NotFoundError(message);
        case 429: {
            int retryAfter = kDefaultRateLimitRetryAfterSeconds;
            const auto v = parseInteger(trim(retryAfterHeader));
            if (v && *v >= 0) {
                retryAfter = static_cast<int>(
                    std::min<long long>(*v, kMaxRetryAfter.count()));
            }
            throw RateLimitError(message, retryAfter);
        }
        default:
            throw ApiError(message, status, parsed.detail);
    }
}

} // namespace refyne
