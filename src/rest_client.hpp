#pragma once

#include "transport.hpp"

#include <string>

namespace calllog_purge {

/// Low-level REST client built on Boost.Beast.
/// One connection per request; status codes are returned to the caller.
class RestClient : public HttpTransport {
public:
    /// @param serverUrl  scheme://host[:port], e.g. "https://platform.ringcentral.com"
    /// @param timeoutMs  Per-operation timeout in milliseconds
    explicit RestClient(const std::string& serverUrl, int timeoutMs = 15000);

    /// JWT bearer token exchange; stores the access token for later calls.
    /// @throws AuthenticationError on any failure.
    void login(const std::string& clientId,
               const std::string& clientSecret,
               const std::string& jwt);

    void setAccessToken(const std::string& token) { mAccessToken = token; }
    bool authenticated() const { return !mAccessToken.empty(); }

    /// @throws boost::system::system_error / std::runtime_error on network errors.
    HttpResponse get(const std::string& target,
                     const QueryParams& params = {}) override;

    HttpResponse del(const std::string& target) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    struct Outgoing {
        std::string method = "GET";
        std::string target;
        std::string body;
        std::string contentType;
        std::string authorization;
    };

    std::string mHost;
    std::string mPort;
    std::string mAccessToken;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    HttpResponse send(Outgoing request);
    HttpResponse doHttpRequest(const Outgoing& request);
    HttpResponse doHttpsRequest(const Outgoing& request);
};

} // namespace calllog_purge
