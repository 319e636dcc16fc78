#include "version.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "util.hpp"

#include <limits>
#include <regex>

namespace refyne {

SemVer parseVersion(const std::string& version) {
    static const std::regex kPattern(R"(^(\d+)\.(\d+)\.(\d+)(?:-(.+))?$)");

    SemVer v;
    std::smatch m;
    if (!std::regex_match(version, m, kPattern)) {
        return v;
    }

    const auto major = parseInteger(m[1].str());
    const auto minor = parseInteger(m[2].str());
    const auto patch = parseInteger(m[3].str());
    constexpr long long kIntMax = std::numeric_limits<int>::max();
    if (!major || !minor || !patch ||
        *major > kIntMax || *minor > kIntMax || *patch > kIntMax) {
        return v;   // component overflowed
    }

    v.major = static_cast<int>(*major);
    v.minor = static_cast<int>(*minor);
    v.patch = static_cast<int>(*patch);
    if (m[4].matched) {
        v.prerelease = m[4].str();
    }
    return v;
}

int compareVersions(const std::string& a, const std::string& b) {
    const SemVer va = parseVersion(a);
    const SemVer vb = parseVersion(b);

    if (va.major != vb.major) return va.major < vb.major ? -1 : 1;
    if (va.minor != vb.minor) return va.minor < vb.minor ? -1 : 1;
    if (va.patch != vb.patch) return va.patch < vb.patch ? -1 : 1;
    return 0;
}

void checkApiVersionCompatibility(const std::string& serverVersion,
                                  const std::string& minSupported,
                                  const std::string& maxKnown,
                                  Logger& logger) {
    if (compareVersions(serverVersion, minSupported) < 0) {
        throw UnsupportedApiVersionError(serverVersion, minSupported, maxKnown);
    }

    if (parseVersion(serverVersion).major > parseVersion(maxKnown).major) {
        logger.warn("API version " + serverVersion +
                    " is newer than this SDK was built for (" + maxKnown +
                    "). There may be breaking changes. Consider upgrading the SDK.",
                    {{"apiVersion", serverVersion},
                     {"sdkVersion", kSdkVersion},
                     {"maxKnownVersion", maxKnown}});
    }
}

} // namespace refyne
