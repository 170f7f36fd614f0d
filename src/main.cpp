#include "audit_log.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "pagination.hpp"
#include "printing.hpp"
#include "rate_limiter.hpp"
#include "record_action.hpp"
#include "rest_client.hpp"
#include "retry_policy.hpp"
#include "throttled_executor.hpp"
#include "workflow.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace calllog_purge;

static CallLogQuery makeQuery(const Config& cfg) {
    CallLogQuery query;
    query.view        = cfg.view;
    query.phoneNumber = cfg.phoneNumber;
    query.dateFrom    = cfg.dateFrom;
    query.dateTo      = cfg.dateTo;
    query.perPage     = cfg.perPage;
    return query;
}

static void printSummary(const ThrottledExecutor& executor,
                         const SlidingWindowLimiter& limiter,
                         const DeletionWorkflow::Summary* summary,
                         int listed) {
    const auto stats = executor.getStats();

    std::cout << "\n=== Summary Report ===\n";
    if (summary) {
        std::cout
            << "Records seen:        " << summary->seen    << "\n"
            << "Deleted:             " << summary->deleted << "\n"
            << "Skipped:             " << summary->skipped << "\n"
            << "Failed:              " << summary->failed  << "\n";
    } else {
        std::cout << "Records listed:      " << listed << "\n";
    }
    std::cout
        << "Requests sent:       " << stats.totalRequests        << "\n"
        << "Retries:             " << stats.totalRetries         << "\n"
        << "HTTP 429 responses:  " << stats.rateLimitedResponses << "\n"
        << "Quota wait (s):      " << std::fixed << std::setprecision(2)
                                   << limiter.totalWaitSeconds()  << "\n"
        << "Backoff (s):         " << std::fixed << std::setprecision(2)
                                   << stats.totalBackoffSeconds  << "\n"
        << "======================\n";
}

int main(int argc, char* argv[]) {
    Config cfg;
    try {
        cfg = parseArgs(std::vector<std::string>(argv, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n";
        printUsage(std::cerr);
        return 1;
    }
    if (cfg.showHelp) {
        printUsage(std::cout);
        return 0;
    }
    applyDefaults(cfg);

    try {
        std::cout
            << "=== calllog_purge ===\n"
            << "Command:    " << commandName(cfg.command) << "\n"
            << "Date from:  " << cfg.dateFrom.value_or("-") << "\n"
            << "Date to:    " << cfg.dateTo.value_or("-") << "\n"
            << "Phone:      " << cfg.phoneNumber.value_or("(any)") << "\n"
            << "Page size:  " << cfg.perPage << "\n"
            << "Quota:      " << cfg.requestsPerWindow << " req / "
                              << cfg.windowSeconds << " s\n"
            << "Dry run:    " << (cfg.dryRun ? "yes" : "no") << "\n"
            << "=====================\n\n";

        // --- session ---
        const Credentials creds = loadCredentials();
        RestClient client(creds.serverUrl, cfg.timeoutMs);
        client.setVerbose(cfg.verbose);
        client.login(creds.clientId, creds.clientSecret, creds.jwt);

        // --- shared throttling envelope ---
        SteadyClock clock;
        SlidingWindowLimiter limiter(clock,
                                     static_cast<std::size_t>(cfg.requestsPerWindow),
                                     std::chrono::seconds(cfg.windowSeconds));
        ThrottledExecutor executor(limiter, clock, RetryPolicy(cfg.maxRetries), cfg.verbose);

        const CallLogQuery query = makeQuery(cfg);

        if (cfg.command == Command::List) {
            PageWalker walker(client, executor, PaginationMode::Cursor,
                              cfg.verbose, cfg.maxPages);
            int listed = 0;
            walker.traverse(query, [&](const CallLogRecord& record) {
                printRecord(std::cout, record, /*withLegs=*/true);
                std::cout << "\n";
                ++listed;
            });
            std::cout << "\nFinished printing call log records.\n";
            printSummary(executor, limiter, nullptr, listed);
            return 0;
        }

        // --- deletion ---
        const bool interactive = cfg.command == Command::Delete;
        PageWalker walker(client, executor,
                          interactive ? PaginationMode::Cursor
                                      : PaginationMode::PageNumber,
                          cfg.verbose, cfg.maxPages);

        std::unique_ptr<Confirmer> confirmer;
        if (cfg.assumeYes) {
            confirmer = std::make_unique<ScriptedConfirmer>(true);
        } else {
            confirmer = std::make_unique<ConsoleConfirmer>();
        }

        FileAuditLog auditLog(cfg.auditLogPath);
        RecordAction action(client, executor, auditLog,
                            interactive ? DeletionPolicy::Interactive
                                        : DeletionPolicy::RecordingsOnly,
                            confirmer.get(), std::cout, cfg.dryRun);
        DeletionWorkflow workflow(walker, action);

        const auto summary = workflow.run(query);

        if (summary.seen == 0) {
            std::cout << "No call logs found";
            if (cfg.phoneNumber) {
                std::cout << " for the specified phone number (" << *cfg.phoneNumber << ")";
            }
            std::cout << " between " << cfg.dateFrom.value_or("-")
                      << " and " << cfg.dateTo.value_or("-") << ".\n";
            return 0;
        }

        std::cout << "\nFinished processing call logs.\n";
        printSummary(executor, limiter, &summary, 0);
        return 0;

    } catch (const AuthenticationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
