#pragma once

#include "Cancellation.hpp"
#include "IndicatorSet.hpp"
#include "MatcherConfig.hpp"
#include "PublicSuffixList.hpp"
#include "ShortenerRegistry.hpp"
#include "Url.hpp"
#include "UrlResolver.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace indicators {

// Process names are truncated to this many characters on the originating platform.
constexpr std::size_t kTruncatedProcessNameLength = 16;

enum class MatchRule {
    None,
    FullDomain,
    SubDomain,
    // Raw substring hit on a URL that could not be parsed; low confidence.
    RawSubstring,
    ExactName,
    TruncatedName,
    ExactEmail,
};

std::string toString(MatchRule rule);

struct MatchFinding {
    bool matched{false};
    IndicatorKind indicatorKind{IndicatorKind::Domain};
    MatchRule rule{MatchRule::None};
    // The candidate as supplied by the caller.
    std::string originalValue;
    // The artifact that triggered the match; for domains this is the last URL of
    // the redirect chain.
    std::string matchedValue;
    std::string indicator;
    std::string detail;
    // Every URL visited while de-shortening, starting with the original. Holds
    // a single entry when no shortener was involved.
    std::vector<std::string> redirectChain;

    bool lowConfidence() const { return rule == MatchRule::RawSubstring; }
    bool wasShortened() const { return redirectChain.size() > 1; }
};

// Stateless matching over a loaded IndicatorSet. All checks are const and safe
// to call from several threads; the only blocking call is the HEAD request
// issued while de-shortening. No exception escapes a check.
class IndicatorMatcher {
  public:
    // Without an explicit resolver an HttpUrlResolver is built from the
    // configuration, unless config.unshorten is false.
    IndicatorMatcher(const IndicatorSet &indicators, const MatcherConfig &config,
                     std::shared_ptr<const UrlResolver> resolver = nullptr);
    // The set is held by reference and must outlive the matcher.
    IndicatorMatcher(IndicatorSet &&indicators, const MatcherConfig &config,
                     std::shared_ptr<const UrlResolver> resolver = nullptr) = delete;

    MatchFinding checkDomain(const std::string &url, const CancellationToken &token = CancellationToken()) const;
    MatchFinding checkDomain(const std::string &url, int maxDepth, const CancellationToken &token) const;
    // First positive finding; later URLs are not evaluated.
    MatchFinding checkDomains(const std::vector<std::string> &urls,
                              const CancellationToken &token = CancellationToken()) const;

    MatchFinding checkProcess(const std::string &processPath) const;
    MatchFinding checkProcesses(const std::vector<std::string> &processPaths) const;

    MatchFinding checkEmail(const std::string &email) const;
    MatchFinding checkEmails(const std::vector<std::string> &emails) const;

    MatchFinding checkFile(const std::string &filePath) const;
    MatchFinding checkFiles(const std::vector<std::string> &filePaths) const;

    // Throws InvalidUrlError.
    NormalizedUrl normalizeUrl(const std::string &url) const;

    const IndicatorSet &indicatorSet() const { return indicators; }
    int maxDepth() const { return defaultMaxDepth; }

  private:
    MatchFinding matchRawSubstring(const std::string &url, std::vector<std::string> chain) const;
    MatchFinding matchNormalized(const NormalizedUrl &resolved, const std::string &originalUrl,
                                 std::vector<std::string> chain) const;

    const IndicatorSet &indicators;
    ShortenerRegistry shorteners;
    PublicSuffixList suffixes;
    std::shared_ptr<const UrlResolver> resolver;
    int defaultMaxDepth;
};

} // namespace indicators
