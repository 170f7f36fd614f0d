#include "pagination.hpp"
#include "endpoints.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <iostream>

namespace calllog_purge {

QueryParams CallLogQuery::toParams() const {
    QueryParams params;
    params.emplace_back("view", view);
    if (phoneNumber) params.emplace_back("phoneNumber", *phoneNumber);
    if (dateFrom)    params.emplace_back("dateFrom", *dateFrom);
    if (dateTo)      params.emplace_back("dateTo", *dateTo);
    params.emplace_back("recordingType", recordingType);
    params.emplace_back("perPage", std::to_string(perPage));
    params.emplace_back("page", std::to_string(page));
    return params;
}

PageWalker::PageWalker(HttpTransport& transport,
                       ThrottledExecutor& executor,
                       PaginationMode mode,
                       bool verbose,
                       int maxPages)
    : mTransport(transport)
    , mExecutor(executor)
    , mMode(mode)
    , mVerbose(verbose)
    , mMaxPages(maxPages) {}

// ---------------------------------------------------------------------------
// Public: traversal
// ---------------------------------------------------------------------------

void PageWalker::traverse(const CallLogQuery& query, const RecordSink& sink) {
    mStats = Stats{};

    if (mMode == PaginationMode::Cursor) {
        traverseByCursor(query, sink);
    } else {
        traverseByPageNumber(query, sink);
    }

    if (mVerbose) {
        std::cerr << "[PageWalker] Done: " << mStats.totalFetched
                  << " records in " << mStats.totalPages << " page(s)\n";
    }
}

std::vector<CallLogRecord> PageWalker::fetchAll(const CallLogQuery& query) {
    std::vector<CallLogRecord> records;
    traverse(query, [&records](const CallLogRecord& r) { records.push_back(r); });
    return records;
}

void PageWalker::traverseByCursor(const CallLogQuery& query, const RecordSink& sink) {
    std::string target = endpoints::kCallLog;
    QueryParams params = query.toParams();

    for (;;) {
        PageResult page = fetchPage(target, params);

        for (const auto& record : page.records) {
            sink(record);
        }

        // Only cursor absence ends the walk; an empty page that still
        // carries a cursor is followed.
        if (!page.nextPageUri) {
            if (mVerbose) {
                std::cerr << "[PageWalker] No more pages.\n";
            }
            return;
        }
        if (pageLimitReached()) return;

        target = pathFromUri(*page.nextPageUri);
        params.clear();   // the cursor already carries the query
    }
}

void PageWalker::traverseByPageNumber(const CallLogQuery& query, const RecordSink& sink) {
    CallLogQuery current = query;

    for (;;) {
        if (mVerbose) {
            std::cerr << "[PageWalker] Fetching page " << current.page;
            if (current.dateFrom) std::cerr << " dateFrom=" << *current.dateFrom;
            if (current.dateTo)   std::cerr << " dateTo=" << *current.dateTo;
            std::cerr << "\n";
        }

        PageResult page = fetchPage(endpoints::kCallLog, current.toParams());

        if (page.records.empty()) {
            if (mVerbose) {
                std::cerr << "[PageWalker] Empty page received; stopping.\n";
            }
            return;
        }

        for (const auto& record : page.records) {
            sink(record);
        }

        if (pageLimitReached()) return;
        ++current.page;
    }
}

// ---------------------------------------------------------------------------
// Private: one page
// ---------------------------------------------------------------------------

PageResult PageWalker::fetchPage(const std::string& target, const QueryParams& params) {
    const std::string label = "GET " + buildTarget(target, params);

    HttpResponse response = mExecutor.execute(label, [&]() {
        return mTransport.get(target, params);
    });

    if (response.body.is_null()) {
        throw MalformedResponseError(label + ": response body is not JSON");
    }

    PageResult page = parseCallLogPage(response.body);

    ++mStats.totalPages;
    mStats.totalFetched     += static_cast<int>(page.records.size());
    mStats.skippedMalformed += page.skippedMalformed;

    if (mVerbose) {
        std::cerr << "[PageWalker] Got " << page.records.size()
                  << " records (total so far: " << mStats.totalFetched << ")\n";
    }
    return page;
}

bool PageWalker::pageLimitReached() const {
    if (mMaxPages > 0 && mStats.totalPages >= mMaxPages) {
        std::cerr << "[PageWalker] Page limit (" << mMaxPages
                  << ") reached; stopping.\n";
        return true;
    }
    return false;
}

} // namespace calllog_purge
