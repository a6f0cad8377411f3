#pragma once

#include "Cancellation.hpp"
#include "HttpClient.hpp"

#include <chrono>
#include <string>

namespace indicators {

// Follows one hop of a shortened URL. Implementations return the URL unchanged
// when the service does not answer with a redirect and throw NetworkError or
// TimeoutError when the hop could not be resolved.
class UrlResolver {
  public:
    virtual ~UrlResolver() = default;
    virtual std::string unshorten(const std::string &url, const CancellationToken &token) const = 0;
};

// Issues a HEAD request with redirects disabled and reads the Location header.
// http URLs go through HttpClient's own socket code and https URLs through
// HttpClient::headTls.
class HttpUrlResolver : public UrlResolver {
  public:
    HttpUrlResolver(HttpClient client, std::chrono::milliseconds timeout);

    std::string unshorten(const std::string &url, const CancellationToken &token) const override;

  private:
    HttpClient httpClient;
    std::chrono::milliseconds requestTimeout;
};

} // namespace indicators
