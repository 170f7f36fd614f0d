#pragma once

#include "util.hpp"

#include <string>

namespace calllog_purge {
namespace endpoints {

/// Account-level call log; list with GET, one record per DELETE.
inline const std::string kCallLog = "/restapi/v1.0/account/~/call-log";

/// OAuth token exchange (JWT bearer grant).
inline const std::string kToken = "/restapi/oauth/token";

inline const std::string kJwtGrantType =
    "urn:ietf:params:oauth:grant-type:jwt-bearer";

/// @p id is percent-encoded; it comes from the server, not from a fixed set.
inline std::string callLogRecord(const std::string& id) {
    return kCallLog + "/" + urlEncode(id);
}

} // namespace endpoints
} // namespace calllog_purge
