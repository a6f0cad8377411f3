#include "IndicatorSuite/UrlResolver.hpp"

#include "IndicatorSuite/Errors.hpp"
#include "IndicatorSuite/Url.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace indicators {

HttpUrlResolver::HttpUrlResolver(HttpClient client, std::chrono::milliseconds timeout)
    : httpClient(std::move(client)), requestTimeout(timeout) {}

std::string HttpUrlResolver::unshorten(const std::string &url, const CancellationToken &token) const {
    const auto parsed = parseUrl(url);
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return url;
    }

    auto timeout = requestTimeout;
    if (const auto remaining = token.remaining()) {
        timeout = std::min(timeout, std::chrono::duration_cast<std::chrono::milliseconds>(*remaining));
    }
    if (token.isCancelled() || timeout.count() <= 0) {
        throw TimeoutError("Deadline reached before resolving " + url);
    }

    const auto response = parsed.scheme == "https"
                              ? httpClient.headTls(url, timeout, token)
                              : httpClient.head(parsed.host, parsed.port, parsed.target, timeout, token);
    spdlog::debug("HEAD {} returned {} in {:.3f}s", url, response.statusCode, response.elapsedSeconds);

    if (!response.isRedirect()) {
        return url;
    }
    const auto location = response.headers.find("location");
    if (location == response.headers.end() || location->second.empty()) {
        return url;
    }

    return resolveReference(url, location->second);
}

} // namespace indicators
