#pragma once

#include "models.hpp"

#include <chrono>
#include <fstream>
#include <string>

namespace calllog_purge {

/// Receives one call per successfully deleted record.
class AuditLog {
public:
    virtual ~AuditLog() = default;

    virtual void recordDeletion(const CallLogRecord& record,
                                std::chrono::system_clock::time_point when) = 0;
};

/// Text block written for one deletion (timestamp, id, start time,
/// direction, from / to numbers, separator).
std::string formatAuditEntry(const CallLogRecord& record,
                             std::chrono::system_clock::time_point when);

/// Appends formatAuditEntry() blocks to a file, flushing after each one.
class FileAuditLog : public AuditLog {
public:
    static constexpr const char* kDefaultPath = "deleted_call_logs.log";

    /// @throws std::runtime_error if the file cannot be opened for append.
    explicit FileAuditLog(const std::string& path = kDefaultPath);

    void recordDeletion(const CallLogRecord& record,
                        std::chrono::system_clock::time_point when) override;

    const std::string& path() const { return mPath; }

private:
    std::string   mPath;
    std::ofstream mOut;
};

} // namespace calllog_purge
