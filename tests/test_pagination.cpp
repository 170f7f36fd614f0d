/// @file test_pagination.cpp
/// Unit tests for pagination.hpp — cursor and page-number traversal.

#include "pagination.hpp"
#include "endpoints.hpp"
#include "errors.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace calllog_purge;
using namespace calllog_purge::fakes;
using json = nlohmann::json;
using std::chrono::seconds;

namespace {

const std::string kHost = "https://platform.example.com";

std::string pageUri(int page) {
    return kHost + endpoints::kCallLog + "?view=Simple&perPage=100&page=" + std::to_string(page);
}

std::string pagePath(int page) {
    return endpoints::kCallLog + "?view=Simple&perPage=100&page=" + std::to_string(page);
}

class PageWalkerTest : public ::testing::Test {
protected:
    ManualClock          clock;
    SlidingWindowLimiter limiter{clock};
    ThrottledExecutor    executor{limiter, clock, RetryPolicy(3)};
    ScriptedTransport    transport;
};

} // namespace

// ============================================================================
// CallLogQuery
// ============================================================================

TEST(CallLogQuery, ToParamsIncludesOnlySetFilters) {
    CallLogQuery q;
    q.dateTo = "2025-11-30T23:59:59.999Z";

    auto params = q.toParams();
    QueryParams expected = {
        {"view", "Simple"},
        {"dateTo", "2025-11-30T23:59:59.999Z"},
        {"recordingType", "All"},
        {"perPage", "100"},
        {"page", "1"}
    };
    EXPECT_EQ(params, expected);
}

// ============================================================================
// Cursor mode
// ============================================================================

TEST_F(PageWalkerTest, CursorTraversalYieldsAllRecordsInOrder) {
    transport.setHandler([](const RecordedCall& call) {
        if (call.target == endpoints::kCallLog) {
            return makeResponse(200, makePage("a", 0, 100, pageUri(2)));
        }
        if (call.target == pagePath(2)) {
            return makeResponse(200, makePage("b", 0, 100, pageUri(3)));
        }
        if (call.target == pagePath(3)) {
            return makeResponse(200, makePage("c", 0, 37));
        }
        return makeResponse(404);
    });

    PageWalker walker(transport, executor, PaginationMode::Cursor);
    auto records = walker.fetchAll(CallLogQuery{});

    ASSERT_EQ(records.size(), 237u);
    EXPECT_EQ(records.front().id, "a0");
    EXPECT_EQ(records[99].id, "a99");
    EXPECT_EQ(records[100].id, "b0");
    EXPECT_EQ(records[200].id, "c0");
    EXPECT_EQ(records.back().id, "c36");

    // Exactly three requests: no probe after the cursor-less last page.
    ASSERT_EQ(transport.calls().size(), 3u);
    EXPECT_EQ(walker.getStats().totalPages, 3);
    EXPECT_EQ(walker.getStats().totalFetched, 237);
}

TEST_F(PageWalkerTest, FirstRequestCarriesFiltersAndCursorRequestsDoNot) {
    transport.setHandler([](const RecordedCall& call) {
        if (call.target == endpoints::kCallLog) {
            return makeResponse(200, makePage("a", 0, 1, pageUri(2)));
        }
        return makeResponse(200, makePage("b", 0, 1));
    });

    CallLogQuery q;
    q.phoneNumber = "+15551234567";
    q.dateFrom    = "2025-11-01T00:00:00.000Z";
    q.dateTo      = "2025-11-30T23:59:59.999Z";

    PageWalker walker(transport, executor, PaginationMode::Cursor);
    walker.fetchAll(q);

    ASSERT_EQ(transport.calls().size(), 2u);
    const auto& first = transport.calls()[0];
    EXPECT_EQ(first.param("view"), std::string("Simple"));
    EXPECT_EQ(first.param("phoneNumber"), std::string("+15551234567"));
    EXPECT_EQ(first.param("dateFrom"), std::string("2025-11-01T00:00:00.000Z"));
    EXPECT_EQ(first.param("dateTo"), std::string("2025-11-30T23:59:59.999Z"));
    EXPECT_EQ(first.param("recordingType"), std::string("All"));
    EXPECT_EQ(first.param("perPage"), std::string("100"));
    EXPECT_EQ(first.param("page"), std::string("1"));

    // Absolute next-page URI is reduced to path + query.
    const auto& second = transport.calls()[1];
    EXPECT_EQ(second.target, pagePath(2));
    EXPECT_TRUE(second.params.empty());
}

TEST_F(PageWalkerTest, RelativeCursorIsUsedAsIs) {
    transport.setHandler([](const RecordedCall& call) {
        if (call.target == endpoints::kCallLog) {
            return makeResponse(200, makePage("a", 0, 2, pagePath(2)));
        }
        return makeResponse(200, makePage("b", 0, 2));
    });

    PageWalker walker(transport, executor, PaginationMode::Cursor);
    auto records = walker.fetchAll(CallLogQuery{});

    EXPECT_EQ(records.size(), 4u);
    EXPECT_EQ(transport.calls()[1].target, pagePath(2));
}

TEST_F(PageWalkerTest, EmptyPageWithCursorIsFollowed) {
    transport.setHandler([](const RecordedCall& call) {
        if (call.target == endpoints::kCallLog) {
            return makeResponse(200, makePage("a", 0, 2, pageUri(2)));
        }
        if (call.target == pagePath(2)) {
            return makeResponse(200, makePage("b", 0, 0, pageUri(3)));
        }
        return makeResponse(200, makePage("c", 0, 3));
    });

    PageWalker walker(transport, executor, PaginationMode::Cursor);
    auto records = walker.fetchAll(CallLogQuery{});

    EXPECT_EQ(records.size(), 5u);
    EXPECT_EQ(transport.calls().size(), 3u);
}

TEST_F(PageWalkerTest, RecordsAreStreamedBeforeNextPageIsFetched) {
    std::vector<std::size_t> callsSeenAtRecord;
    transport.setHandler([](const RecordedCall& call) {
        if (call.target == endpoints::kCallLog) {
            return makeResponse(200, makePage("a", 0, 1, pageUri(2)));
        }
        return makeResponse(200, makePage("b", 0, 1));
    });

    PageWalker walker(transport, executor, PaginationMode::Cursor);
    walker.traverse(CallLogQuery{}, [&](const CallLogRecord&) {
        callsSeenAtRecord.push_back(transport.calls().size());
    });

    EXPECT_EQ(callsSeenAtRecord, (std::vector<std::size_t>{1, 2}));
}

TEST_F(PageWalkerTest, MaxPagesStopsTraversal) {
    int served = 0;
    transport.setHandler([&](const RecordedCall&) {
        ++served;
        return makeResponse(200, makePage("p" + std::to_string(served) + "-", 0, 5,
                                          pageUri(served + 1)));
    });

    PageWalker walker(transport, executor, PaginationMode::Cursor, false, /*maxPages=*/2);
    auto records = walker.fetchAll(CallLogQuery{});

    EXPECT_EQ(records.size(), 10u);
    EXPECT_EQ(served, 2);
}

// ============================================================================
// Page-number mode
// ============================================================================

TEST_F(PageWalkerTest, PageNumberTraversalStopsOnEmptyPage) {
    transport.setHandler([](const RecordedCall& call) {
        const auto page = call.param("page").value_or("?");
        if (page == "1") return makeResponse(200, makePage("a", 0, 250));
        if (page == "2") return makeResponse(200, makePage("b", 0, 250));
        return makeResponse(200, makePage("c", 0, 0));
    });

    CallLogQuery q;
    q.perPage = 250;

    PageWalker walker(transport, executor, PaginationMode::PageNumber);
    auto records = walker.fetchAll(q);

    ASSERT_EQ(records.size(), 500u);
    EXPECT_EQ(records.front().id, "a0");
    EXPECT_EQ(records.back().id, "b249");

    ASSERT_EQ(transport.calls().size(), 3u);
    EXPECT_EQ(transport.calls()[0].param("page"), std::string("1"));
    EXPECT_EQ(transport.calls()[1].param("page"), std::string("2"));
    EXPECT_EQ(transport.calls()[2].param("page"), std::string("3"));
    for (const auto& call : transport.calls()) {
        EXPECT_EQ(call.target, endpoints::kCallLog);
        EXPECT_EQ(call.param("perPage"), std::string("250"));
    }
}

TEST_F(PageWalkerTest, PageNumberModeIgnoresCursor) {
    transport.setHandler([](const RecordedCall& call) {
        if (call.param("page") == std::string("1")) {
            return makeResponse(200, makePage("a", 0, 3, pageUri(99)));
        }
        return makeResponse(200, makePage("b", 0, 0, pageUri(100)));
    });

    PageWalker walker(transport, executor, PaginationMode::PageNumber);
    auto records = walker.fetchAll(CallLogQuery{});

    EXPECT_EQ(records.size(), 3u);
    EXPECT_EQ(transport.calls().size(), 2u);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(PageWalkerTest, FetchFailurePropagatesAfterRetries) {
    transport.setHandler([](const RecordedCall&) { return makeResponse(503); });

    PageWalker walker(transport, executor, PaginationMode::Cursor);

    EXPECT_THROW(walker.fetchAll(CallLogQuery{}), HttpError);
    EXPECT_EQ(transport.calls().size(), 4u);
}

TEST_F(PageWalkerTest, PageWithoutRecordsArrayIsMalformed) {
    transport.setHandler([](const RecordedCall&) {
        return makeResponse(200, {{"navigation", json::object()}});
    });

    PageWalker walker(transport, executor, PaginationMode::Cursor);

    EXPECT_THROW(walker.fetchAll(CallLogQuery{}), MalformedResponseError);
}

TEST_F(PageWalkerTest, NonJsonBodyIsMalformed) {
    transport.setHandler([](const RecordedCall&) {
        HttpResponse r;
        r.httpStatus = 200;
        r.rawBody    = "<html>maintenance</html>";
        return r;
    });

    PageWalker walker(transport, executor, PaginationMode::Cursor);

    EXPECT_THROW(walker.fetchAll(CallLogQuery{}), MalformedResponseError);
}

TEST_F(PageWalkerTest, RecordsWithoutIdAreSkippedAndCounted) {
    transport.setHandler([](const RecordedCall&) {
        json page = makePage("a", 0, 2);
        page["records"].push_back({{"startTime", "2025-11-02T10:00:00.000Z"}});
        return makeResponse(200, page);
    });

    PageWalker walker(transport, executor, PaginationMode::Cursor);
    auto records = walker.fetchAll(CallLogQuery{});

    EXPECT_EQ(records.size(), 2u);
    EXPECT_EQ(walker.getStats().skippedMalformed, 1);
}

// ============================================================================
// Throttling across pages
// ============================================================================

TEST_F(PageWalkerTest, LongTraversalIsHeldToTheWindowQuota) {
    int served = 0;
    transport.setHandler([&](const RecordedCall&) {
        ++served;
        std::optional<std::string> next;
        if (served < 12) next = pageUri(served + 1);
        return makeResponse(200, makePage("p" + std::to_string(served) + "-", 0, 1, next));
    });

    PageWalker walker(transport, executor, PaginationMode::Cursor);
    auto records = walker.fetchAll(CallLogQuery{});

    EXPECT_EQ(records.size(), 12u);
    // Pages 1-10 go out at t=0; page 11 has to wait a full window.
    auto sleeps = clock.sleeps();
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], seconds(60));
}
