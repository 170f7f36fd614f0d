#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace calllog_purge {

/// Root of the errors raised while talking to the call-log API.
struct ApiError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Token exchange failed, or the credentials needed for it are missing.
struct AuthenticationError : public ApiError {
    using ApiError::ApiError;
};

/// Non-2xx HTTP response.
struct HttpError : public ApiError {
    unsigned int               status;
    std::string                target;
    std::optional<std::string> retryAfter;   // raw header value
    std::string                bodyPreview;

    HttpError(unsigned int s,
              std::string t,
              std::optional<std::string> ra,
              std::string preview);
};

/// Response body is not JSON, or lacks a field the caller depends on.
struct MalformedResponseError : public ApiError {
    using ApiError::ApiError;
};

} // namespace calllog_purge
