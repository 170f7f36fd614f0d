#pragma once

#include "mapping.hpp"
#include "models.hpp"
#include "throttled_executor.hpp"
#include "transport.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace calllog_purge {

/// Filter parameters of the call-log list endpoint.
struct CallLogQuery {
    std::string                view          = "Simple";   // or "Detailed"
    std::optional<std::string> phoneNumber;
    std::optional<std::string> dateFrom;                    // ISO-8601
    std::optional<std::string> dateTo;                      // ISO-8601
    std::string                recordingType = "All";
    int                        perPage       = 100;
    int                        page          = 1;

    QueryParams toParams() const;
};

enum class PaginationMode {
    Cursor,       // follow navigation.nextPage.uri until absent
    PageNumber    // page = 1, 2, ... until a page has no records
};

/// Walks the list endpoint through the throttled executor and streams
/// records to the caller in server order.
class PageWalker {
public:
    struct Stats {
        int totalFetched     = 0;
        int totalPages       = 0;
        int skippedMalformed = 0;
    };

    using RecordSink = std::function<void(const CallLogRecord&)>;

    /// @param maxPages  Stop after this many pages; 0 = unbounded.
    PageWalker(HttpTransport& transport,
               ThrottledExecutor& executor,
               PaginationMode mode = PaginationMode::Cursor,
               bool verbose = false,
               int maxPages = 0);

    /// Every fetch goes through the executor; a surfaced fetch failure
    /// (or a malformed page) propagates and ends the traversal.
    void traverse(const CallLogQuery& query, const RecordSink& sink);

    /// traverse() into a vector.
    std::vector<CallLogRecord> fetchAll(const CallLogQuery& query);

    Stats          getStats() const { return mStats; }
    PaginationMode mode()     const { return mMode; }

private:
    HttpTransport&     mTransport;
    ThrottledExecutor& mExecutor;
    PaginationMode     mMode;
    bool               mVerbose;
    int                mMaxPages;
    Stats              mStats{};

    PageResult fetchPage(const std::string& target, const QueryParams& params);
    bool       pageLimitReached() const;

    void traverseByCursor(const CallLogQuery& query, const RecordSink& sink);
    void traverseByPageNumber(const CallLogQuery& query, const RecordSink& sink);
};

} // namespace calllog_purge
