#include "audit_log.hpp"
#include "util.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace calllog_purge {

namespace {

std::string orNone(const std::optional<std::string>& v) {
    return v ? *v : "None";
}

std::string phoneOf(const std::optional<Party>& party) {
    return party ? orNone(party->phoneNumber) : "None";
}

} // namespace

std::string formatAuditEntry(const CallLogRecord& record,
                             std::chrono::system_clock::time_point when)
{
    std::ostringstream out;
    out << "Timestamp: "           << formatIsoUtc(when)          << "\n"
        << "Deleted Call Log ID: " << record.id                   << "\n"
        << "Start Time: "          << orNone(record.startTime)    << "\n"
        << "Direction: "           << orNone(record.direction)    << "\n"
        << "From: "                << phoneOf(record.from)        << "\n"
        << "To: "                  << phoneOf(record.to)          << "\n"
        << std::string(30, '-')                                   << "\n";
    return out.str();
}

FileAuditLog::FileAuditLog(const std::string& path)
    : mPath(path)
    , mOut(path, std::ios::out | std::ios::app)
{
    if (!mOut) {
        throw std::runtime_error("Cannot open audit log for append: " + path);
    }
}

void FileAuditLog::recordDeletion(const CallLogRecord& record,
                                  std::chrono::system_clock::time_point when)
{
    mOut << formatAuditEntry(record, when);
    mOut.flush();

    if (!mOut) {
        // The deletion already happened; report and keep going.
        std::cerr << "[AuditLog] Error writing entry for " << record.id
                  << " to " << mPath << "\n";
        mOut.clear();
    }
}

} // namespace calllog_purge
