#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace calllog_purge {

/// Result of parsing one page of the call-log list endpoint.
struct PageResult {
    std::vector<CallLogRecord>  records;
    std::optional<std::string>  nextPageUri;      // navigation.nextPage.uri
    int                         skippedMalformed = 0;
};

/// Parse a full list response body into a PageResult.
/// Records without an id are reported on stderr and skipped.
/// Throws MalformedResponseError if the body has no "records" array.
PageResult parseCallLogPage(const nlohmann::json& responseBody);

/// Map a single record JSON object into a CallLogRecord.
/// Throws MalformedResponseError if the node is not an object or has no id.
CallLogRecord parseCallLogRecord(const nlohmann::json& node);

Party     parseParty(const nlohmann::json& node);
Recording parseRecording(const nlohmann::json& node);
CallLeg   parseCallLeg(const nlohmann::json& node);

/// access_token from an OAuth token response.
/// Throws MalformedResponseError if it is missing.
std::string extractAccessToken(const nlohmann::json& responseBody);

} // namespace calllog_purge
