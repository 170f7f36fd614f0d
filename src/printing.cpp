#include "printing.hpp"

namespace calllog_purge {

namespace {

template <typename T>
void printField(std::ostream& out, const char* label, const std::optional<T>& value) {
    out << label << ": ";
    if (value) {
        out << *value;
    } else {
        out << "None";
    }
    out << "\n";
}

} // namespace

void printParty(std::ostream& out, const std::string& label,
                const std::optional<Party>& party)
{
    if (!party) {
        out << label << ": None\n";
        return;
    }
    out << label << ": " << party->phoneNumber.value_or("None")
        << " (" << party->name.value_or("None") << ")";
    if (party->location && !party->location->empty()) {
        out << " | location: " << *party->location;
    }
    out << "\n";
}

void printRecording(std::ostream& out, const std::optional<Recording>& recording) {
    if (!recording) {
        out << "recording: None\n";
        return;
    }
    out << "recording: id=" << recording->id.value_or("None")
        << ", type=" << recording->type.value_or("None");
    if (recording->contentUri && !recording->contentUri->empty()) {
        out << ", contentUri=" << *recording->contentUri;
    }
    out << "\n";
}

void printLeg(std::ostream& out, int index, const CallLeg& leg) {
    out << "---- Leg " << index << " ----\n";
    printField(out, "startTime", leg.startTime);
    printField(out, "duration", leg.duration);
    printField(out, "type", leg.type);
    printField(out, "direction", leg.direction);
    printField(out, "action", leg.action);
    printField(out, "result", leg.result);
    printParty(out, "to", leg.to);
    printParty(out, "from", leg.from);
    printField(out, "telephonySessionId", leg.telephonySessionId);
    printField(out, "transport", leg.transport);
    printField(out, "legType", leg.legType);
    if (leg.extension) {
        out << "extension: id=" << leg.extension->id.value_or("None")
            << ", uri=" << leg.extension->uri.value_or("None") << "\n";
    }
    printRecording(out, leg.recording);
}

void printRecord(std::ostream& out, const CallLogRecord& record, bool withLegs) {
    out << "--------- Call Log Record ---------\n";
    out << "id: " << record.id << "\n";
    printField(out, "uri", record.uri);
    printField(out, "sessionId", record.sessionId);
    printField(out, "startTime", record.startTime);
    printField(out, "duration", record.duration);
    printField(out, "type", record.type);
    printField(out, "direction", record.direction);
    printField(out, "action", record.action);
    printField(out, "result", record.result);
    printParty(out, "to", record.to);
    printParty(out, "from", record.from);
    printField(out, "transport", record.transport);
    printField(out, "lastModifiedTime", record.lastModifiedTime);
    printRecording(out, record.recording);

    if (withLegs) {
        if (record.legs.empty()) {
            out << "legs: []\n";
        } else {
            out << "legs count: " << record.legs.size() << "\n";
            int i = 1;
            for (const auto& leg : record.legs) {
                printLeg(out, i++, leg);
            }
        }
    }
    out << "-----------------------------------\n";
}

} // namespace calllog_purge
