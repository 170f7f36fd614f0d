#include "rest_client.hpp"
#include "endpoints.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef CALLLOG_PURGE_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <iostream>
#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace calllog_purge {

namespace {

constexpr const char* kUserAgent = "calllog_purge/1.0";

std::string basicCredentials(const std::string& user, const std::string& password) {
    const std::string plain = user + ":" + password;
    std::string encoded(beast::detail::base64::encoded_size(plain.size()), '\0');
    encoded.resize(beast::detail::base64::encode(&encoded[0], plain.data(), plain.size()));
    return "Basic " + encoded;
}

template <class Request>
void setCommonHeaders(Request& req,
                      const std::string& host,
                      const std::string& contentType,
                      const std::string& authorization) {
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, kUserAgent);
    if (!contentType.empty()) {
        req.set(http::field::content_type, contentType);
    }
    if (!authorization.empty()) {
        req.set(http::field::authorization, authorization);
    }
}

HttpResponse toResponse(http::response<http::string_body>& res, bool verbose) {
    HttpResponse response;
    response.httpStatus = res.result_int();
    response.rawBody    = std::move(res.body());

    auto retryAfter = res.find(http::field::retry_after);
    if (retryAfter != res.end()) {
        const auto value = retryAfter->value();
        response.retryAfter = std::string(value.data(), value.size());
    }

    if (!response.rawBody.empty()) {
        try {
            response.body = nlohmann::json::parse(response.rawBody);
        } catch (const nlohmann::json::parse_error& e) {
            // Left null; callers that need JSON raise MalformedResponseError.
            if (verbose) {
                std::cerr << "[RestClient] Body is not JSON: " << e.what() << "\n";
            }
        }
    }
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

RestClient::RestClient(const std::string& serverUrl, int timeoutMs)
    : mTimeoutMs(timeoutMs)
{
    auto parts = parseUrl(serverUrl);
    if (parts.target != "/") {
        throw std::invalid_argument(
            "Server URL must not carry a path: " + serverUrl);
    }
    mHost   = parts.host;
    mPort   = parts.port;
    mUseSsl = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef CALLLOG_PURGE_HAS_SSL
        throw std::runtime_error(
            "HTTPS server requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

void RestClient::login(const std::string& clientId,
                       const std::string& clientSecret,
                       const std::string& jwt)
{
    Outgoing request;
    request.method        = "POST";
    request.target        = endpoints::kToken;
    request.contentType   = "application/x-www-form-urlencoded";
    request.authorization = basicCredentials(clientId, clientSecret);
    request.body          = "grant_type=" + urlEncode(endpoints::kJwtGrantType) +
                            "&assertion=" + urlEncode(jwt);

    HttpResponse resp;
    try {
        resp = send(std::move(request));
    } catch (const std::exception& e) {
        throw AuthenticationError(
            std::string("Unable to authenticate to platform: ") + e.what());
    }

    if (!resp.ok()) {
        throw AuthenticationError(
            "Unable to authenticate to platform: HTTP " +
            std::to_string(resp.httpStatus) + " " + resp.rawBody.substr(0, 256));
    }

    try {
        mAccessToken = extractAccessToken(resp.body);
    } catch (const MalformedResponseError& e) {
        throw AuthenticationError(
            std::string("Unable to authenticate to platform: ") + e.what());
    }

    if (mVerbose) {
        std::cerr << "[RestClient] Authenticated against " << mHost << "\n";
    }
}

HttpResponse RestClient::get(const std::string& target, const QueryParams& params) {
    Outgoing request;
    request.method = "GET";
    request.target = buildTarget(target, params);
    return send(std::move(request));
}

HttpResponse RestClient::del(const std::string& target) {
    Outgoing request;
    request.method = "DELETE";
    request.target = target;
    return send(std::move(request));
}

HttpResponse RestClient::send(Outgoing request) {
    if (request.authorization.empty() && !mAccessToken.empty()) {
        request.authorization = "Bearer " + mAccessToken;
    }

    if (mVerbose) {
        std::cerr << "[RestClient] " << request.method
                  << " " << mHost << ":" << mPort << request.target << "\n";
    }

    return mUseSsl ? doHttpsRequest(request) : doHttpRequest(request);
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse RestClient::doHttpRequest(const Outgoing& request) {
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    // Build request.
    http::request<http::string_body> req{
        http::string_to_verb(request.method), request.target, 11};
    setCommonHeaders(req, mHost, request.contentType, request.authorization);
    req.body() = request.body;
    req.prepare_payload();

    // Send.
    http::write(stream, req);

    // Receive.
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    HttpResponse response = toResponse(res, mVerbose);

    if (mVerbose) {
        std::cerr << "[RestClient] HTTP " << response.httpStatus << "\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpResponse RestClient::doHttpsRequest(const Outgoing& request) {
#ifdef CALLLOG_PURGE_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    http::request<http::string_body> req{
        http::string_to_verb(request.method), request.target, 11};
    setCommonHeaders(req, mHost, request.contentType, request.authorization);
    req.body() = request.body;
    req.prepare_payload();

    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    HttpResponse response = toResponse(res, mVerbose);

    if (mVerbose) {
        std::cerr << "[RestClient] HTTPS " << response.httpStatus << "\n";
    }

    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)request;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace calllog_purge
