#include "errors.hpp"

#include <utility>

namespace calllog_purge {

namespace {

constexpr std::size_t kPreviewLength = 256;

std::string describe(unsigned int status,
                     const std::string& target,
                     const std::string& preview) {
    std::string msg = "HTTP " + std::to_string(status) + " for " + target;
    if (!preview.empty()) {
        msg += ": " + preview;
    }
    return msg;
}

} // namespace

HttpError::HttpError(unsigned int s,
                     std::string t,
                     std::optional<std::string> ra,
                     std::string preview)
    : ApiError(describe(s, t, preview.substr(0, kPreviewLength)))
    , status(s)
    , target(std::move(t))
    , retryAfter(std::move(ra))
    , bodyPreview(preview.substr(0, kPreviewLength)) {}

} // namespace calllog_purge
