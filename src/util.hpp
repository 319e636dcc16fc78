#pragma once

#include <optional>
#include <string>

namespace refyne {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path + query (e.g. "/api/v1/jobs?limit=5")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

std::string toLower(std::string s);
std::string toUpper(std::string s);

/// Strip leading/trailing spaces and tabs.
std::string trim(const std::string& s);

/// Remove every trailing '/' from a base URL.
std::string trimTrailingSlashes(std::string s);

/// Parse a whole string as a base-10 integer with an optional sign.
/// Returns std::nullopt for empty input, stray characters or overflow.
std::optional<long long> parseInteger(const std::string& s);

} // namespace refyne
