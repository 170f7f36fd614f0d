#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace calllog_purge {

namespace {

constexpr const char* kListDateFrom  = "2025-11-01T00:00:00.000Z";
constexpr const char* kPurgeDateFrom = "2025-10-13T00:00:00.000Z";

// Keeps now - days inside the range of system_clock's nanosecond ticks.
constexpr int kMaxOlderThanDays = 36500;

int parseInt(const std::string& option, const std::string& value, int minimum,
             int maximum = std::numeric_limits<int>::max()) {
    std::size_t pos = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
    if (pos != value.size()) {
        throw std::invalid_argument("Invalid number for " + option + ": " + value);
    }
    if (parsed < minimum) {
        throw std::invalid_argument(option + " must be at least " +
                                    std::to_string(minimum));
    }
    if (parsed > maximum) {
        throw std::invalid_argument(option + " must be at most " +
                                    std::to_string(maximum));
    }
    return parsed;
}

Command parseCommand(const std::string& name) {
    if (name == "list")   return Command::List;
    if (name == "delete") return Command::Delete;
    if (name == "purge")  return Command::Purge;
    throw std::invalid_argument("Unknown command: " + name);
}

} // namespace

const char* commandName(Command command) {
    switch (command) {
    case Command::List:   return "list";
    case Command::Delete: return "delete";
    case Command::Purge:  return "purge";
    }
    return "unknown";
}

void printUsage(std::ostream& out) {
    out << "Usage: calllog_purge <list|delete|purge> [options]\n\n"
        << "Commands:\n"
        << "  list     Print call logs (follows next-page links)\n"
        << "  delete   Delete call logs for --phone_number, asking before each one\n"
        << "  purge    Delete recorded call logs older than --older_than_days\n\n"
        << "Options:\n"
        << "  --date_from ISO         Start of range, e.g. 2025-11-01T00:00:00.000Z\n"
        << "  --date_to ISO           End of range,   e.g. 2025-11-30T23:59:59.999Z\n"
        << "  --phone_number N        Filter by phone number (required for delete)\n"
        << "  --view Simple|Detailed  Record view for list   (default: Simple)\n"
        << "  --per_page N            Records per page        (default: 100, purge 250)\n"
        << "  --older_than_days N     Age cutoff for purge    (default: 30, max 36500)\n"
        << "  --max_pages N           Stop after N pages      (default: unbounded)\n"
        << "  --max_retries N         Retries per request     (default: 3)\n"
        << "  --requests_per_window N Client-side quota       (default: 10)\n"
        << "  --window_seconds N      Quota window            (default: 60)\n"
        << "  --timeout_ms N          HTTP timeout in ms      (default: 15000)\n"
        << "  --audit_log PATH        Deletion log            (default: deleted_call_logs.log)\n"
        << "  --dry-run               Report what would be deleted, delete nothing\n"
        << "  --yes                   Confirm every deletion without prompting\n"
        << "  --verbose               Enable verbose diagnostics\n"
        << "  --help, -h              Show this message\n\n"
        << "Environment: RC_CLIENT_ID, RC_CLIENT_SECRET, RC_JWT_TOKEN, RC_SERVER\n";
}

Config parseArgs(const std::vector<std::string>& args) {
    Config cfg;
    bool haveCommand = false;

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool hasValue = i + 1 < args.size();

        auto value = [&]() -> const std::string& {
            if (!hasValue) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cfg.showHelp = true;
            return cfg;
        } else if (arg == "--date_from") {
            cfg.dateFrom = value();
        } else if (arg == "--date_to") {
            cfg.dateTo = value();
        } else if (arg == "--phone_number") {
            cfg.phoneNumber = value();
        } else if (arg == "--view") {
            cfg.view = value();
            if (cfg.view != "Simple" && cfg.view != "Detailed") {
                throw std::invalid_argument("--view must be Simple or Detailed");
            }
        } else if (arg == "--per_page") {
            cfg.perPage = parseInt(arg, value(), 1);
        } else if (arg == "--older_than_days") {
            cfg.olderThanDays = parseInt(arg, value(), 0, kMaxOlderThanDays);
        } else if (arg == "--max_pages") {
            cfg.maxPages = parseInt(arg, value(), 0);
        } else if (arg == "--max_retries") {
            cfg.maxRetries = parseInt(arg, value(), 0);
        } else if (arg == "--requests_per_window") {
            cfg.requestsPerWindow = parseInt(arg, value(), 1);
        } else if (arg == "--window_seconds") {
            cfg.windowSeconds = parseInt(arg, value(), 1);
        } else if (arg == "--timeout_ms") {
            cfg.timeoutMs = parseInt(arg, value(), 1);
        } else if (arg == "--audit_log") {
            cfg.auditLogPath = value();
        } else if (arg == "--dry-run") {
            cfg.dryRun = true;
        } else if (arg == "--yes") {
            cfg.assumeYes = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (!haveCommand && !arg.empty() && arg[0] != '-') {
            cfg.command = parseCommand(arg);
            haveCommand = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (!haveCommand) {
        throw std::invalid_argument("Missing command (list, delete or purge)");
    }
    if (cfg.command == Command::Delete && !cfg.phoneNumber) {
        throw std::invalid_argument("delete requires --phone_number");
    }
    return cfg;
}

void applyDefaults(Config& cfg) {
    switch (cfg.command) {
    case Command::List:
        if (!cfg.dateFrom) cfg.dateFrom = kListDateFrom;
        if (!cfg.dateTo)   cfg.dateTo   = isoUtcDaysAgo(30);
        if (cfg.perPage == 0) cfg.perPage = 100;
        break;
    case Command::Delete:
        if (!cfg.dateFrom) cfg.dateFrom = isoUtcDaysAgo(1);
        if (!cfg.dateTo)   cfg.dateTo   = isoUtcDaysAgo(0);
        if (cfg.perPage == 0) cfg.perPage = 100;
        break;
    case Command::Purge:
        if (!cfg.dateFrom) cfg.dateFrom = kPurgeDateFrom;
        if (!cfg.dateTo)   cfg.dateTo   = isoUtcDaysAgo(cfg.olderThanDays);
        if (cfg.perPage == 0) cfg.perPage = 250;
        break;
    }
}

std::optional<std::string> systemEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
}

Credentials loadCredentials(const EnvLookup& env) {
    Credentials creds;
    std::string missing;

    auto read = [&](const char* name, std::string& into) {
        auto value = env(name);
        if (value) {
            into = *value;
        } else {
            missing += missing.empty() ? name : std::string(", ") + name;
        }
    };

    read("RC_CLIENT_ID", creds.clientId);
    read("RC_CLIENT_SECRET", creds.clientSecret);
    read("RC_JWT_TOKEN", creds.jwt);
    read("RC_SERVER", creds.serverUrl);

    if (!missing.empty()) {
        throw AuthenticationError("Missing environment variable(s): " + missing);
    }
    return creds;
}

} // namespace calllog_purge
