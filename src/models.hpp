#pragma once

#include <optional>
#include <string>
#include <vector>

namespace calllog_purge {

/// Caller / callee of a call.
struct Party {
    std::optional<std::string> phoneNumber;
    std::optional<std::string> name;
    std::optional<std::string> location;
};

/// Recording attached to a call; only present if the call was recorded.
struct Recording {
    std::optional<std::string> id;
    std::optional<std::string> type;         // "Automatic", "OnDemand"
    std::optional<std::string> contentUri;
};

struct ExtensionRef {
    std::optional<std::string> id;
    std::optional<std::string> uri;
};

/// One leg of a call; only returned with view=Detailed.
struct CallLeg {
    std::optional<std::string>  startTime;
    std::optional<long long>    duration;     // seconds
    std::optional<std::string>  type;
    std::optional<std::string>  direction;
    std::optional<std::string>  action;
    std::optional<std::string>  result;
    std::optional<Party>        to;
    std::optional<Party>        from;
    std::optional<std::string>  telephonySessionId;
    std::optional<std::string>  transport;
    std::optional<std::string>  legType;
    std::optional<ExtensionRef> extension;
    std::optional<Recording>    recording;
};

/// Mirrors a call-log record (subset of fields used by the tools).
struct CallLogRecord {
    std::string                 id;           // always present once parsed
    std::optional<std::string>  uri;
    std::optional<std::string>  sessionId;
    std::optional<std::string>  startTime;    // ISO-8601
    std::optional<long long>    duration;     // seconds
    std::optional<std::string>  type;         // "Voice", "Fax"
    std::optional<std::string>  direction;    // "Inbound", "Outbound"
    std::optional<std::string>  action;
    std::optional<std::string>  result;
    std::optional<Party>        to;
    std::optional<Party>        from;
    std::optional<std::string>  transport;
    std::optional<std::string>  lastModifiedTime;
    std::optional<Recording>    recording;
    std::vector<CallLeg>        legs;

    bool hasRecording() const { return recording.has_value(); }
};

} // namespace calllog_purge
