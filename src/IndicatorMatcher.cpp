#include "IndicatorSuite/IndicatorMatcher.hpp"

#include "IndicatorSuite/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace indicators {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string baseName(const std::string &path) {
    return fs::path(path).filename().string();
}

MatchFinding noMatch(IndicatorKind kind, const std::string &value) {
    MatchFinding finding;
    finding.indicatorKind = kind;
    finding.originalValue = value;
    return finding;
}

MatchFinding positive(IndicatorKind kind, MatchRule rule, const std::string &original, const std::string &matched,
                      const std::string &indicator, std::string detail) {
    MatchFinding finding;
    finding.matched = true;
    finding.indicatorKind = kind;
    finding.rule = rule;
    finding.originalValue = original;
    finding.matchedValue = matched;
    finding.indicator = indicator;
    finding.detail = std::move(detail);
    return finding;
}

std::shared_ptr<const UrlResolver> defaultResolver(const MatcherConfig &config) {
    if (!config.unshorten) {
        return nullptr;
    }
    HttpClient client(config.userAgent, config.proxyHost, config.proxyPort);
    return std::make_shared<HttpUrlResolver>(std::move(client), config.requestTimeout);
}

template <typename Check>
MatchFinding firstMatch(const std::vector<std::string> &values, IndicatorKind kind, Check check) {
    for (const auto &value : values) {
        auto finding = check(value);
        if (finding.matched) {
            return finding;
        }
    }
    return noMatch(kind, {});
}

} // namespace

std::string toString(MatchRule rule) {
    switch (rule) {
    case MatchRule::None:
        return "none";
    case MatchRule::FullDomain:
        return "full-domain";
    case MatchRule::SubDomain:
        return "sub-domain";
    case MatchRule::RawSubstring:
        return "raw-substring";
    case MatchRule::ExactName:
        return "exact-name";
    case MatchRule::TruncatedName:
        return "truncated-name";
    case MatchRule::ExactEmail:
        return "exact-email";
    }
    return "unknown";
}

IndicatorMatcher::IndicatorMatcher(const IndicatorSet &indicatorSet, const MatcherConfig &config,
                                   std::shared_ptr<const UrlResolver> urlResolver)
    : indicators(indicatorSet), shorteners(config.buildShortenerRegistry()), suffixes(config.buildPublicSuffixList()),
      resolver(urlResolver ? std::move(urlResolver) : defaultResolver(config)), defaultMaxDepth(config.maxDepth) {}

NormalizedUrl IndicatorMatcher::normalizeUrl(const std::string &url) const {
    return UrlNormalizer(shorteners, suffixes).normalize(url);
}

MatchFinding IndicatorMatcher::checkDomain(const std::string &url, const CancellationToken &token) const {
    return checkDomain(url, defaultMaxDepth, token);
}

MatchFinding IndicatorMatcher::checkDomain(const std::string &url, int maxDepth, const CancellationToken &token) const {
    if (url.empty()) {
        return noMatch(IndicatorKind::Domain, url);
    }

    try {
        NormalizedUrl current;
        try {
            current = normalizeUrl(url);
        } catch (const InvalidUrlError &ex) {
            spdlog::debug("Falling back to substring matching: {}", ex.what());
            return matchRawSubstring(url, {url});
        }

        std::vector<std::string> chain{url};
        std::unordered_set<std::string> visited{url};
        int hops = 0;
        while (current.isShortened && resolver) {
            if (hops >= maxDepth) {
                spdlog::warn("Stopped following {} after {} shortener hops", url, hops);
                break;
            }
            if (token.isCancelled()) {
                spdlog::debug("De-shortening of {} cancelled after {} hops", url, hops);
                break;
            }

            std::string next;
            try {
                next = resolver->unshorten(current.raw, token);
            } catch (const NetworkError &ex) {
                spdlog::warn("Unable to unshorten {}: {}", current.raw, ex.what());
                break;
            }
            ++hops;
            if (next == current.raw) {
                break;
            }
            spdlog::info("Found a shortened URL {} -> {}", current.raw, next);
            chain.push_back(next);

            try {
                current = normalizeUrl(next);
            } catch (const InvalidUrlError &ex) {
                spdlog::debug("Shortener destination is not a valid URL: {}", ex.what());
                auto finding = matchRawSubstring(next, chain);
                finding.originalValue = url;
                return finding;
            }

            if (!visited.insert(next).second) {
                spdlog::warn("Shortener redirect cycle detected at {}", next);
                break;
            }
        }

        return matchNormalized(current, url, std::move(chain));
    } catch (const std::exception &ex) {
        spdlog::error("Domain check of {} failed: {}", url, ex.what());
        return noMatch(IndicatorKind::Domain, url);
    }
}

MatchFinding IndicatorMatcher::matchRawSubstring(const std::string &url, std::vector<std::string> chain) const {
    // Indicators are stored lower-cased, so the candidate is lower-cased too.
    const auto lowered = toLower(url);
    for (const auto &ioc : indicators.domains()) {
        if (lowered.find(ioc) != std::string::npos) {
            spdlog::warn("Maybe found a known suspicious domain: {}", url);
            auto finding = positive(IndicatorKind::Domain, MatchRule::RawSubstring, url, url, ioc,
                                    "Unparsable URL contains suspicious domain " + ioc);
            finding.redirectChain = std::move(chain);
            return finding;
        }
    }
    auto finding = noMatch(IndicatorKind::Domain, url);
    finding.redirectChain = std::move(chain);
    return finding;
}

MatchFinding IndicatorMatcher::matchNormalized(const NormalizedUrl &resolved, const std::string &originalUrl,
                                               std::vector<std::string> chain) const {
    const bool shortened = chain.size() > 1;
    const auto suffix = shortened ? " shortened as " + originalUrl : std::string();

    if (indicators.hasDomain(resolved.host)) {
        const auto detail = shortened ? "Found a known suspicious domain " + resolved.raw + suffix
                                      : "Found a known suspicious domain: " + resolved.raw;
        spdlog::warn("{}", detail);
        auto finding = positive(IndicatorKind::Domain, MatchRule::FullDomain, originalUrl, resolved.raw, resolved.host,
                                detail);
        finding.redirectChain = std::move(chain);
        return finding;
    }

    // Walk the parent domains of the host down to the registrable domain.
    auto parent = resolved.host;
    while (parent.size() > resolved.domain.size()) {
        const auto dot = parent.find('.');
        if (dot == std::string::npos) {
            break;
        }
        parent.erase(0, dot + 1);
        if (indicators.hasDomain(parent)) {
            const auto detail = shortened ? "Found a sub-domain matching a suspicious top level " + resolved.raw + suffix
                                          : "Found a sub-domain matching a suspicious top level: " + resolved.raw;
            spdlog::warn("{}", detail);
            auto finding = positive(IndicatorKind::Domain, MatchRule::SubDomain, originalUrl, resolved.raw, parent,
                                    detail);
            finding.redirectChain = std::move(chain);
            return finding;
        }
    }

    auto finding = noMatch(IndicatorKind::Domain, originalUrl);
    finding.redirectChain = std::move(chain);
    return finding;
}

MatchFinding IndicatorMatcher::checkDomains(const std::vector<std::string> &urls, const CancellationToken &token) const {
    return firstMatch(urls, IndicatorKind::Domain, [&](const std::string &url) { return checkDomain(url, token); });
}

MatchFinding IndicatorMatcher::checkProcess(const std::string &processPath) const {
    if (processPath.empty()) {
        return noMatch(IndicatorKind::Process, processPath);
    }

    const auto name = baseName(processPath);
    if (name.empty()) {
        return noMatch(IndicatorKind::Process, processPath);
    }

    if (indicators.hasProcess(name)) {
        const auto detail = "Found a known suspicious process name \"" + processPath + "\"";
        spdlog::warn("{}", detail);
        return positive(IndicatorKind::Process, MatchRule::ExactName, processPath, name, name, detail);
    }

    if (name.size() == kTruncatedProcessNameLength) {
        for (const auto &ioc : indicators.processes()) {
            if (ioc.size() > name.size() && ioc.compare(0, name.size(), name) == 0) {
                const auto detail = "Found a truncated known suspicious process name \"" + processPath + "\"";
                spdlog::warn("{}", detail);
                return positive(IndicatorKind::Process, MatchRule::TruncatedName, processPath, name, ioc, detail);
            }
        }
    }

    return noMatch(IndicatorKind::Process, processPath);
}

MatchFinding IndicatorMatcher::checkProcesses(const std::vector<std::string> &processPaths) const {
    return firstMatch(processPaths, IndicatorKind::Process, [this](const std::string &path) { return checkProcess(path); });
}

MatchFinding IndicatorMatcher::checkEmail(const std::string &email) const {
    if (email.empty()) {
        return noMatch(IndicatorKind::Email, email);
    }

    const auto lowered = toLower(email);
    if (indicators.hasEmail(lowered)) {
        const auto detail = "Found a known suspicious email address: \"" + email + "\"";
        spdlog::warn("{}", detail);
        return positive(IndicatorKind::Email, MatchRule::ExactEmail, email, email, lowered, detail);
    }
    return noMatch(IndicatorKind::Email, email);
}

MatchFinding IndicatorMatcher::checkEmails(const std::vector<std::string> &emails) const {
    return firstMatch(emails, IndicatorKind::Email, [this](const std::string &email) { return checkEmail(email); });
}

MatchFinding IndicatorMatcher::checkFile(const std::string &filePath) const {
    if (filePath.empty()) {
        return noMatch(IndicatorKind::File, filePath);
    }

    const auto name = baseName(filePath);
    if (!name.empty() && indicators.hasFile(name)) {
        const auto detail = "Found a known suspicious file: \"" + filePath + "\"";
        spdlog::warn("{}", detail);
        return positive(IndicatorKind::File, MatchRule::ExactName, filePath, name, name, detail);
    }
    return noMatch(IndicatorKind::File, filePath);
}

MatchFinding IndicatorMatcher::checkFiles(const std::vector<std::string> &filePaths) const {
    return firstMatch(filePaths, IndicatorKind::File, [this](const std::string &path) { return checkFile(path); });
}

} // namespace indicators
