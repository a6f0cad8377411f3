#pragma once

#include "PublicSuffixList.hpp"
#include "ShortenerRegistry.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace indicators {

// Startup tunables of the matching engine. Every field has a usable default;
// a JSON configuration file overrides the keys it names:
//
//   max_depth           int     shortener hops followed per URL (5)
//   request_timeout_ms  int     timeout of one HEAD request (5000)
//   unshorten           bool    resolve shortened URLs over the network (true)
//   shorteners          [str]   replaces the built-in shortener registry
//   shorteners_extra    [str]   added to the registry
//   shortener_file      str     text file with more shortener hosts
//   public_suffix_file  str     public_suffix_list.dat to use instead of the built-in table
//   proxy               str     "host:port" of a SOCKS5 proxy, empty for direct connections
//   user_agent          str     User-Agent of HEAD requests
//   log_level           str     spdlog level name (info)
struct MatcherConfig {
    static constexpr int kDefaultMaxDepth = 5;
    static constexpr int kDefaultTimeoutMs = 5000;

    int maxDepth{kDefaultMaxDepth};
    std::chrono::milliseconds requestTimeout{kDefaultTimeoutMs};
    bool unshorten{true};
    std::vector<std::string> shorteners{ShortenerRegistry::defaultHosts()};
    std::string shortenerFile;
    std::string publicSuffixFile;
    std::string proxyHost;
    std::uint16_t proxyPort{0};
    std::string userAgent{"ioc-scan/1.0"};
    std::string logLevel{"info"};

    static MatcherConfig fromFile(const std::string &path);
    static MatcherConfig fromString(const std::string &content, const std::string &source = "<memory>");

    // Parses "host:port"; throws ConfigError when malformed.
    void setProxy(const std::string &value);

    ShortenerRegistry buildShortenerRegistry() const;
    PublicSuffixList buildPublicSuffixList() const;
};

} // namespace indicators
