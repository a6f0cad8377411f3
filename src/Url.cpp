#include "IndicatorSuite/Url.hpp"

#include "IndicatorSuite/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace indicators {

namespace {

constexpr std::size_t kMaxHostLength = 253;
constexpr std::size_t kMaxLabelLength = 63;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool isValidScheme(const std::string &scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '+' || ch == '-' || ch == '.';
    });
}

void validateCharacters(const std::string &raw) {
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const auto ch = static_cast<unsigned char>(raw[i]);
        if (ch <= 0x20 || ch == 0x7f) {
            throw InvalidUrlError("URL contains whitespace or control characters: " + raw);
        }
        if (ch == '%') {
            if (i + 2 >= raw.size() || !std::isxdigit(static_cast<unsigned char>(raw[i + 1])) ||
                !std::isxdigit(static_cast<unsigned char>(raw[i + 2]))) {
                throw InvalidUrlError("Malformed percent-encoding in URL: " + raw);
            }
        }
    }
}

std::vector<std::string> splitLabels(const std::string &host) {
    std::vector<std::string> labels;
    std::string label;
    std::istringstream stream(host);
    while (std::getline(stream, label, '.')) {
        labels.push_back(label);
    }
    if (!host.empty() && host.back() == '.') {
        labels.emplace_back();
    }
    return labels;
}

bool isIPv4(const std::vector<std::string> &labels) {
    if (labels.size() != 4) {
        return false;
    }
    for (const auto &label : labels) {
        if (label.empty() || label.size() > 3 ||
            !std::all_of(label.begin(), label.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
            return false;
        }
        if (std::stoi(label) > 255) {
            return false;
        }
    }
    return true;
}

bool isValidLabel(const std::string &label) {
    if (label.empty() || label.size() > kMaxLabelLength) {
        return false;
    }
    // Bytes above 0x7f are accepted so that UTF-8 internationalized names parse.
    return std::all_of(label.begin(), label.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '-' || ch == '_' || ch >= 0x80;
    });
}

std::uint16_t parsePort(const std::string &value, const std::string &raw) {
    if (value.empty() || value.size() > 5 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
        throw InvalidUrlError("Invalid port in URL: " + raw);
    }
    const int port = std::stoi(value);
    if (port <= 0 || port > 65535) {
        throw InvalidUrlError("Port out of range in URL: " + raw);
    }
    return static_cast<std::uint16_t>(port);
}

std::uint16_t defaultPort(const std::string &scheme) {
    if (scheme == "http") {
        return 80;
    }
    if (scheme == "https") {
        return 443;
    }
    return 0;
}

} // namespace

ParsedUrl parseUrl(const std::string &raw) {
    validateCharacters(raw);

    const auto schemeEnd = raw.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw InvalidUrlError("URL has no scheme: " + raw);
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(raw.substr(0, schemeEnd));
    if (!isValidScheme(parsed.scheme)) {
        throw InvalidUrlError("Invalid URL scheme: " + raw);
    }

    const auto rest = raw.substr(schemeEnd + 3);
    const auto authorityEnd = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authorityEnd);
    if (authorityEnd != std::string::npos) {
        auto target = rest.substr(authorityEnd);
        const auto fragment = target.find('#');
        if (fragment != std::string::npos) {
            target.erase(fragment);
        }
        if (target.empty() || target[0] != '/') {
            target.insert(target.begin(), '/');
        }
        parsed.target = target;
    }

    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    std::string portValue;
    if (!authority.empty() && authority[0] == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            throw InvalidUrlError("Unterminated IPv6 literal in URL: " + raw);
        }
        parsed.host = authority.substr(1, close - 1);
        parsed.ipLiteral = true;
        const auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                throw InvalidUrlError("Unexpected characters after IPv6 literal: " + raw);
            }
            portValue = after.substr(1);
        }
        if (parsed.host.empty() || parsed.host.find_first_not_of("0123456789abcdefABCDEF:.") != std::string::npos) {
            throw InvalidUrlError("Invalid IPv6 literal in URL: " + raw);
        }
    } else {
        const auto colon = authority.rfind(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            portValue = authority.substr(colon + 1);
        }
    }

    parsed.host = toLower(parsed.host);
    if (!parsed.ipLiteral) {
        if (!parsed.host.empty() && parsed.host.back() == '.') {
            parsed.host.pop_back();
        }
        if (parsed.host.empty() || parsed.host.size() > kMaxHostLength) {
            throw InvalidUrlError("URL has no valid host: " + raw);
        }
        const auto labels = splitLabels(parsed.host);
        if (isIPv4(labels)) {
            parsed.ipLiteral = true;
        } else if (!std::all_of(labels.begin(), labels.end(), isValidLabel)) {
            throw InvalidUrlError("Invalid host name in URL: " + raw);
        }
    }

    parsed.port = portValue.empty() ? defaultPort(parsed.scheme) : parsePort(portValue, raw);
    return parsed;
}

std::string resolveReference(const std::string &base, const std::string &reference) {
    if (reference.empty()) {
        return base;
    }
    if (reference.find("://") != std::string::npos) {
        return reference;
    }

    const auto schemeEnd = base.find("://");
    if (schemeEnd == std::string::npos) {
        return reference;
    }
    if (reference.rfind("//", 0) == 0) {
        return base.substr(0, schemeEnd + 1) + reference;
    }

    const auto authorityEnd = base.find_first_of("/?#", schemeEnd + 3);
    const auto origin = base.substr(0, authorityEnd);
    if (reference[0] == '/') {
        return origin + reference;
    }

    std::string path = (authorityEnd == std::string::npos) ? "/" : base.substr(authorityEnd);
    const auto queryStart = path.find_first_of("?#");
    if (queryStart != std::string::npos) {
        path.erase(queryStart);
    }
    if (path.empty()) {
        path = "/";
    }
    if (reference[0] == '?') {
        return origin + path + reference;
    }
    return origin + path.substr(0, path.rfind('/') + 1) + reference;
}

UrlNormalizer::UrlNormalizer(const ShortenerRegistry &shortenerRegistry, const PublicSuffixList &suffixList)
    : shorteners(shortenerRegistry), suffixes(suffixList) {}

NormalizedUrl UrlNormalizer::normalize(const std::string &raw) const {
    const auto parsed = parseUrl(raw);

    NormalizedUrl url;
    url.raw = raw;
    url.host = parsed.host;
    if (url.host.rfind("www.", 0) == 0 && url.host.size() > 4) {
        url.host.erase(0, 4);
    }

    if (parsed.ipLiteral) {
        url.domain = url.host;
    } else {
        url.topLevelDomain = suffixes.publicSuffix(url.host);
        url.domain = suffixes.registrableDomain(url.host);
        if (url.domain.empty()) {
            url.domain = url.host;
        }
    }

    url.isShortened = isShortener(url.host);
    return url;
}

bool UrlNormalizer::isShortener(const std::string &host) const {
    return shorteners.contains(host);
}

} // namespace indicators
