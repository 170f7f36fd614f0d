#pragma once

#include "models.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace calllog_purge {

/// "label: +15551234567 (Jane) | location: Denver, CO", or "label: None".
void printParty(std::ostream& out, const std::string& label,
                const std::optional<Party>& party);

/// "recording: id=..., type=...[, contentUri=...]", or "recording: None".
void printRecording(std::ostream& out, const std::optional<Recording>& recording);

void printLeg(std::ostream& out, int index, const CallLeg& leg);

/// Field-per-line dump of a record between separator lines.
/// @param withLegs  Also print the legs section (view=Detailed listings).
void printRecord(std::ostream& out, const CallLogRecord& record, bool withLegs = false);

} // namespace calllog_purge
