#pragma once

#include "PublicSuffixList.hpp"
#include "ShortenerRegistry.hpp"

#include <cstdint>
#include <string>

namespace indicators {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::uint16_t port{0};
    std::string target{"/"};
    bool ipLiteral{false};
};

struct NormalizedUrl {
    std::string raw;
    // Lower-cased host with a leading "www." removed.
    std::string host;
    // Registrable domain, one label left of the public suffix.
    std::string domain;
    std::string topLevelDomain;
    bool isShortened{false};
};

// Throws InvalidUrlError when the scheme or host is missing, the host is not a
// valid DNS name or IP literal, or a percent escape is malformed.
ParsedUrl parseUrl(const std::string &raw);

// Resolves a Location header value against the URL that produced it.
std::string resolveReference(const std::string &base, const std::string &reference);

class UrlNormalizer {
  public:
    UrlNormalizer(const ShortenerRegistry &shorteners, const PublicSuffixList &suffixes);

    NormalizedUrl normalize(const std::string &raw) const;
    bool isShortener(const std::string &host) const;

  private:
    const ShortenerRegistry &shorteners;
    const PublicSuffixList &suffixes;
};

} // namespace indicators
