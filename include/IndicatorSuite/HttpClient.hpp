#pragma once

#include "Cancellation.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace indicators {

struct HttpResponse {
    int statusCode{0};
    // Header names are lower-cased.
    std::map<std::string, std::string> headers;
    std::size_t bytesTransferred{0};
    double elapsedSeconds{0.0};

    bool isRedirect() const { return statusCode >= 300 && statusCode < 400; }
};

// Minimal HTTP/1.1 client over plain TCP, optionally tunnelled through a SOCKS5
// proxy such as Tor. Redirects are never followed and response bodies are never
// read. Throws TimeoutError when the deadline passes or the token is cancelled
// and NetworkError for any other transport failure.
class HttpClient {
  public:
    explicit HttpClient(std::string userAgent = "ioc-scan/1.0", std::string proxyHost = {},
                        std::uint16_t proxyPort = 0);

    HttpResponse head(const std::string &host, std::uint16_t port, const std::string &target,
                      std::chrono::milliseconds timeout, const CancellationToken &token = CancellationToken()) const;

    HttpResponse request(const std::string &method, const std::string &host, std::uint16_t port,
                         const std::string &target, const std::vector<std::pair<std::string, std::string>> &headers,
                         std::chrono::milliseconds timeout,
                         const CancellationToken &token = CancellationToken()) const;

    // HEAD over TLS. The request is delegated to the curl executable, which is
    // killed when the timeout passes or the token is cancelled.
    HttpResponse headTls(const std::string &url, std::chrono::milliseconds timeout,
                         const CancellationToken &token = CancellationToken()) const;

    // Program run for TLS requests, looked up in PATH. Defaults to "curl".
    void setCurlCommand(std::string command) { curlCommand = std::move(command); }

    bool usesProxy() const { return !proxyHost.empty(); }

  private:
    std::string userAgent;
    std::string proxyHost;
    std::uint16_t proxyPort;
    std::string curlCommand{"curl"};
};

} // namespace indicators
