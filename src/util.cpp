#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace calllog_purge {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string pathFromUri(const std::string& uri) {
    if (uri.find("://") == std::string::npos) {
        return uri;
    }
    return parseUrl(uri).target;
}

std::string urlEncode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0')
                << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string buildTarget(const std::string& path, const QueryParams& params) {
    if (params.empty()) return path;

    std::string target = path;
    char sep = (path.find('?') == std::string::npos) ? '?' : '&';
    for (const auto& [key, value] : params) {
        target += sep;
        target += urlEncode(key);
        target += '=';
        target += urlEncode(value);
        sep = '&';
    }
    return target;
}

std::chrono::seconds computeBackoff(int attempt, int64_t maxSeconds) {
    // 2^attempt, clamped before the shift can overflow.
    if (attempt >= 62) return std::chrono::seconds(maxSeconds);
    int64_t backoff = int64_t{1} << std::max(attempt, 0);
    return std::chrono::seconds(std::min(backoff, maxSeconds));
}

std::string formatIsoUtc(std::chrono::system_clock::time_point tp) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            tp.time_since_epoch()).count() % 1000;
    const std::time_t secs = std::chrono::system_clock::to_time_t(tp);

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

std::string isoUtcDaysAgo(int days) {
    return formatIsoUtc(std::chrono::system_clock::now() -
                        std::chrono::hours(24) * days);
}

} // namespace calllog_purge
