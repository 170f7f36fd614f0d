#pragma once

#include "audit_log.hpp"
#include "models.hpp"
#include "throttled_executor.hpp"
#include "transport.hpp"

#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace calllog_purge {

/// Outcome of processing one record.
struct DeletionResult {
    enum class Kind { Deleted, Skipped, Failed };

    Kind        kind = Kind::Skipped;
    std::string detail;    // skip reason or failure cause

    static DeletionResult deleted()                     { return {Kind::Deleted, ""}; }
    static DeletionResult skipped(std::string reason)   { return {Kind::Skipped, std::move(reason)}; }
    static DeletionResult failed(std::string cause)     { return {Kind::Failed, std::move(cause)}; }
};

/// Asks whether a record may be deleted.
class Confirmer {
public:
    virtual ~Confirmer() = default;
    virtual bool confirm(const CallLogRecord& record) = 0;
};

/// Prompts on a terminal; only "yes" (any case) confirms.
class ConsoleConfirmer : public Confirmer {
public:
    explicit ConsoleConfirmer(std::istream& in = std::cin, std::ostream& out = std::cout);

    bool confirm(const CallLogRecord& record) override;

private:
    std::istream& mIn;
    std::ostream& mOut;
};

/// Answers from a fixed policy without any terminal interaction.
class ScriptedConfirmer : public Confirmer {
public:
    using Decider = std::function<bool(const CallLogRecord&)>;

    explicit ScriptedConfirmer(bool answer);
    explicit ScriptedConfirmer(Decider decider);

    bool confirm(const CallLogRecord& record) override;

    int prompts() const { return mPrompts; }

private:
    Decider mDecider;
    int     mPrompts = 0;
};

enum class DeletionPolicy {
    Interactive,      // show the record, delete only when confirmed
    RecordingsOnly    // unattended: delete records with a recording, skip the rest
};

/// Per-record decision + throttled DELETE + audit.
class RecordAction {
public:
    static constexpr unsigned int kNoContent = 204;

    /// @param confirmer  Required for DeletionPolicy::Interactive.
    /// @param dryRun     Report eligible records as skipped instead of deleting.
    RecordAction(HttpTransport& transport,
                 ThrottledExecutor& executor,
                 AuditLog& auditLog,
                 DeletionPolicy policy,
                 Confirmer* confirmer = nullptr,
                 std::ostream& out = std::cout,
                 bool dryRun = false);

    DeletionResult decide(const CallLogRecord& record);

    DeletionPolicy policy() const { return mPolicy; }

private:
    HttpTransport&     mTransport;
    ThrottledExecutor& mExecutor;
    AuditLog&          mAuditLog;
    DeletionPolicy     mPolicy;
    Confirmer*         mConfirmer;
    std::ostream&      mOut;
    bool               mDryRun;

    DeletionResult remove(const CallLogRecord& record);
};

} // namespace calllog_purge
