#include "record_action.hpp"
#include "endpoints.hpp"
#include "printing.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace calllog_purge {

// ---------------------------------------------------------------------------
// Confirmers
// ---------------------------------------------------------------------------

ConsoleConfirmer::ConsoleConfirmer(std::istream& in, std::ostream& out)
    : mIn(in)
    , mOut(out) {}

bool ConsoleConfirmer::confirm(const CallLogRecord& /*record*/) {
    mOut << "Are you sure you want to delete this call log? (yes/no): ";
    mOut.flush();

    std::string answer;
    if (!std::getline(mIn, answer)) {
        return false;   // EOF: never delete without an explicit answer
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "yes";
}

ScriptedConfirmer::ScriptedConfirmer(bool answer)
    : mDecider([answer](const CallLogRecord&) { return answer; }) {}

ScriptedConfirmer::ScriptedConfirmer(Decider decider)
    : mDecider(std::move(decider)) {}

bool ScriptedConfirmer::confirm(const CallLogRecord& record) {
    ++mPrompts;
    return mDecider(record);
}

// ---------------------------------------------------------------------------
// RecordAction
// ---------------------------------------------------------------------------

RecordAction::RecordAction(HttpTransport& transport,
                           ThrottledExecutor& executor,
                           AuditLog& auditLog,
                           DeletionPolicy policy,
                           Confirmer* confirmer,
                           std::ostream& out,
                           bool dryRun)
    : mTransport(transport)
    , mExecutor(executor)
    , mAuditLog(auditLog)
    , mPolicy(policy)
    , mConfirmer(confirmer)
    , mOut(out)
    , mDryRun(dryRun)
{
    if (mPolicy == DeletionPolicy::Interactive && mConfirmer == nullptr) {
        throw std::invalid_argument("Interactive deletion requires a Confirmer");
    }
}

DeletionResult RecordAction::decide(const CallLogRecord& record) {
    printRecord(mOut, record);

    switch (mPolicy) {
    case DeletionPolicy::Interactive:
        if (!mConfirmer->confirm(record)) {
            mOut << "Skipping deletion of call log with ID: " << record.id << "\n";
            return DeletionResult::skipped("declined");
        }
        break;

    case DeletionPolicy::RecordingsOnly:
        if (!record.hasRecording()) {
            mOut << "Skipping call log " << record.id << " (no recording found).\n";
            return DeletionResult::skipped("no recording");
        }
        break;
    }

    if (mDryRun) {
        mOut << "Dry run: would delete call log with ID: " << record.id << "\n";
        return DeletionResult::skipped("dry run");
    }
    return remove(record);
}

DeletionResult RecordAction::remove(const CallLogRecord& record) {
    const std::string target = endpoints::callLogRecord(record.id);

    try {
        const HttpResponse resp = mExecutor.execute("DELETE " + target, [&]() {
            return mTransport.del(target);
        });

        if (resp.httpStatus != kNoContent) {
            mOut << "Failed to delete call log with ID: " << record.id
                 << ". Status code: " << resp.httpStatus << "\n";
            return DeletionResult::failed("Status code: " +
                                          std::to_string(resp.httpStatus));
        }
    } catch (const std::exception& e) {
        // Local to this record: report and let the workflow move on.
        mOut << "An error occurred while deleting call log " << record.id
             << ": " << e.what() << "\n";
        return DeletionResult::failed(e.what());
    }

    mOut << "Successfully deleted call log with ID: " << record.id << "\n";
    mAuditLog.recordDeletion(record, std::chrono::system_clock::now());
    return DeletionResult::deleted();
}

} // namespace calllog_purge
