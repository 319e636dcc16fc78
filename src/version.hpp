#pragma once

#include <string>

namespace refyne {

class Logger;

constexpr const char* kSdkVersion         = "0.1.0";
constexpr const char* kMinApiVersion      = "0.0.0";
constexpr const char* kMaxKnownApiVersion = "0.0.0";

/// Response header carrying the server's API version.
constexpr const char* kApiVersionHeader = "X-API-Version";

/// Semantic version. prerelease is kept for display only; it takes no part in
/// ordering.
struct SemVer {
    int         major = 0;
    int         minor = 0;
    int         patch = 0;
    std::string prerelease;
};

/// Parse "MAJOR.MINOR.PATCH[-prerelease]". Anything else parses as 0.0.0.
SemVer parseVersion(const std::string& version);

/// -1, 0 or 1 as a orders before, equal to, or after b (major, minor, patch).
int compareVersions(const std::string& a, const std::string& b);

/// Throws UnsupportedApiVersionError when serverVersion < minSupported.
/// Warns through @p logger, without failing, when the server's major version
/// is newer than maxKnown's.
void checkApiVersionCompatibility(const std::string& serverVersion,
                                  const std::string& minSupported,
                                  const std::string& maxKnown,
                                  Logger& logger);

} // namespace refyne
