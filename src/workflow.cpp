#include "workflow.hpp"

#include <utility>

namespace calllog_purge {

DeletionWorkflow::DeletionWorkflow(PageWalker& walker,
                                   RecordAction& action,
                                   std::ostream& out)
    : mWalker(walker)
    , mAction(action)
    , mOut(out) {}

DeletionWorkflow::Summary DeletionWorkflow::run(const CallLogQuery& query) {
    Summary summary;
    mResults.clear();

    const std::vector<CallLogRecord> records = mWalker.fetchAll(query);
    summary.seen = static_cast<int>(records.size());

    for (const auto& record : records) {
        DeletionResult result = mAction.decide(record);

        switch (result.kind) {
        case DeletionResult::Kind::Deleted: ++summary.deleted; break;
        case DeletionResult::Kind::Skipped: ++summary.skipped; break;
        case DeletionResult::Kind::Failed:  ++summary.failed;  break;
        }
        mResults.push_back(std::move(result));
        mOut << "\n";
    }

    return summary;
}

} // namespace calllog_purge
