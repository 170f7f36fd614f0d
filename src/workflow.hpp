#pragma once

#include "pagination.hpp"
#include "record_action.hpp"

#include <iostream>
#include <vector>

namespace calllog_purge {

/// Fetches the complete record set, then applies the RecordAction to each
/// record in order. Fetching completes before the first DELETE because
/// page-number pagination would shift under concurrent deletions.
class DeletionWorkflow {
public:
    struct Summary {
        int seen    = 0;
        int deleted = 0;
        int skipped = 0;
        int failed  = 0;
    };

    DeletionWorkflow(PageWalker& walker,
                     RecordAction& action,
                     std::ostream& out = std::cout);

    /// Fetch failures propagate; per-record failures are counted.
    Summary run(const CallLogQuery& query);

    /// Results of the last run, one per record, in processing order.
    const std::vector<DeletionResult>& results() const { return mResults; }

private:
    PageWalker&                 mWalker;
    RecordAction&               mAction;
    std::ostream&               mOut;
    std::vector<DeletionResult> mResults;
};

} // namespace calllog_purge
