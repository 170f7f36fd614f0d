#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace calllog_purge {

/// Ordered query parameters; order is preserved on the wire.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    unsigned int               httpStatus = 0;
    nlohmann::json             body;          // null when the body is empty or not JSON
    std::string                rawBody;
    std::optional<std::string> retryAfter;

    bool ok() const { return httpStatus >= 200 && httpStatus < 300; }
};

/// One network call per invocation; status codes are returned, not thrown.
/// Transport-level failures (resolve, connect, timeout) throw.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// @param target  Path, optionally already carrying a query string.
    virtual HttpResponse get(const std::string& target,
                             const QueryParams& params = {}) = 0;

    virtual HttpResponse del(const std::string& target) = 0;
};

} // namespace calllog_purge
