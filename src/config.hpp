#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace calllog_purge {

enum class Command {
    List,     // print every record (cursor pagination)
    Delete,   // interactive deletion for one phone number
    Purge     // unattended deletion of recorded calls older than N days
};

struct Config {
    Command                    command         = Command::List;
    std::optional<std::string> dateFrom;
    std::optional<std::string> dateTo;
    std::optional<std::string> phoneNumber;
    std::string                view            = "Simple";
    int                        perPage         = 0;       // 0: command default
    int                        olderThanDays   = 30;
    int                        maxRetries      = 3;
    int                        requestsPerWindow = 10;
    int                        windowSeconds   = 60;
    int                        timeoutMs       = 15000;
    int                        maxPages        = 0;
    std::string                auditLogPath    = "deleted_call_logs.log";
    bool                       dryRun          = false;
    bool                       assumeYes       = false;
    bool                       verbose         = false;
    bool                       showHelp        = false;
};

/// Values needed to open an authenticated session.
struct Credentials {
    std::string clientId;
    std::string clientSecret;
    std::string jwt;
    std::string serverUrl;
};

void printUsage(std::ostream& out);

/// Parse argv (argv[0] is skipped).
/// Throws std::invalid_argument on unknown options, missing values,
/// bad numbers, or a missing --phone_number for the delete command.
Config parseArgs(const std::vector<std::string>& args);

/// Fill dateFrom / dateTo / perPage with the per-command defaults.
void applyDefaults(Config& cfg);

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// std::getenv, with empty values treated as unset.
std::optional<std::string> systemEnv(const std::string& name);

/// Read RC_CLIENT_ID, RC_CLIENT_SECRET, RC_JWT_TOKEN and RC_SERVER.
/// Throws AuthenticationError naming every missing variable.
Credentials loadCredentials(const EnvLookup& env = systemEnv);

const char* commandName(Command command);

} // namespace calllog_purge
