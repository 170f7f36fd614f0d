#include "mapping.hpp"
#include "errors.hpp"

#include <iostream>

namespace calllog_purge {

namespace {

using json = nlohmann::json;

/// String field, or nullopt when missing / null. Numbers are stringified.
std::optional<std::string> optString(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return std::nullopt;
}

std::optional<long long> optInteger(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_number()) return std::nullopt;
    return it->get<long long>();
}

std::optional<Party> optParty(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_object()) return std::nullopt;
    return parseParty(*it);
}

std::optional<Recording> optRecording(const json& node) {
    auto it = node.find("recording");
    if (it == node.end() || !it->is_object() || it->empty()) return std::nullopt;
    return parseRecording(*it);
}

} // namespace

Party parseParty(const json& node) {
    Party p;
    p.phoneNumber = optString(node, "phoneNumber");
    p.name        = optString(node, "name");
    p.location    = optString(node, "location");
    return p;
}

Recording parseRecording(const json& node) {
    Recording r;
    r.id         = optString(node, "id");
    r.type       = optString(node, "type");
    r.contentUri = optString(node, "contentUri");
    return r;
}

CallLeg parseCallLeg(const json& node) {
    CallLeg leg;
    leg.startTime          = optString(node, "startTime");
    leg.duration           = optInteger(node, "duration");
    leg.type               = optString(node, "type");
    leg.direction          = optString(node, "direction");
    leg.action             = optString(node, "action");
    leg.result             = optString(node, "result");
    leg.to                 = optParty(node, "to");
    leg.from               = optParty(node, "from");
    leg.telephonySessionId = optString(node, "telephonySessionId");
    leg.transport          = optString(node, "transport");
    leg.legType            = optString(node, "legType");
    leg.recording          = optRecording(node);

    auto ext = node.find("extension");
    if (ext != node.end() && ext->is_object()) {
        leg.extension = ExtensionRef{optString(*ext, "id"), optString(*ext, "uri")};
    }
    return leg;
}

CallLogRecord parseCallLogRecord(const json& node) {
    if (!node.is_object()) {
        throw MalformedResponseError("Call-log record is not an object");
    }

    auto id = optString(node, "id");
    if (!id || id->empty()) {
        throw MalformedResponseError("Call-log record has no 'id'");
    }

    CallLogRecord r;
    r.id               = *id;
    r.uri              = optString(node, "uri");
    r.sessionId        = optString(node, "sessionId");
    r.startTime        = optString(node, "startTime");
    r.duration         = optInteger(node, "duration");
    r.type             = optString(node, "type");
    r.direction        = optString(node, "direction");
    r.action           = optString(node, "action");
    r.result           = optString(node, "result");
    r.to               = optParty(node, "to");
    r.from             = optParty(node, "from");
    r.transport        = optString(node, "transport");
    r.lastModifiedTime = optString(node, "lastModifiedTime");
    r.recording        = optRecording(node);

    auto legs = node.find("legs");
    if (legs != node.end() && legs->is_array()) {
        for (const auto& leg : *legs) {
            if (leg.is_object()) {
                r.legs.push_back(parseCallLeg(leg));
            }
        }
    }
    return r;
}

PageResult parseCallLogPage(const json& responseBody) {
    PageResult result;

    if (!responseBody.is_object() || !responseBody.contains("records")) {
        throw MalformedResponseError("Response missing 'records' field");
    }
    const auto& records = responseBody["records"];
    if (!records.is_array()) {
        throw MalformedResponseError("Response field 'records' is not an array");
    }

    // --- records ---
    for (const auto& node : records) {
        try {
            result.records.push_back(parseCallLogRecord(node));
        } catch (const MalformedResponseError& e) {
            ++result.skippedMalformed;
            std::cerr << "[Mapping] Skipping record: " << e.what() << "\n";
        }
    }

    // --- navigation.nextPage.uri ---
    auto nav = responseBody.find("navigation");
    if (nav != responseBody.end() && nav->is_object()) {
        auto next = nav->find("nextPage");
        if (next != nav->end() && next->is_object()) {
            auto uri = optString(*next, "uri");
            if (uri && !uri->empty()) {
                result.nextPageUri = *uri;
            }
        }
    }

    return result;
}

std::string extractAccessToken(const json& responseBody) {
    if (!responseBody.is_object()) {
        throw MalformedResponseError("Token response is not a JSON object");
    }
    auto token = optString(responseBody, "access_token");
    if (!token || token->empty()) {
        throw MalformedResponseError("Token response missing 'access_token'");
    }
    return *token;
}

} // namespace calllog_purge
