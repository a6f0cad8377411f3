#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>

namespace indicators {

enum class IndicatorKind { Domain, Process, Email, File };

std::string toString(IndicatorKind kind);

struct IndicatorSummary {
    std::size_t domains{0};
    std::size_t processes{0};
    std::size_t emails{0};
    std::size_t files{0};

    std::size_t total() const { return domains + processes + emails + files; }
};

// Four de-duplicated indicator categories parsed from STIX2 bundles. Domains and
// emails are stored lower-cased, process and file names keep their case.
// Loading is the only mutation; matchers hold the set by const reference.
class IndicatorSet {
  public:
    static IndicatorSet fromFile(const std::string &path);

    // Merges the indicators of a bundle file into this set.
    void loadBundle(const std::string &path);
    void loadBundleFromString(const std::string &content, const std::string &source = "<memory>");

    // Parses "[key = 'value']". Returns false for keys outside the four
    // supported kinds, throws BundleSchemaError for malformed patterns.
    bool addPattern(const std::string &pattern);
    bool addIndicator(IndicatorKind kind, const std::string &value);

    bool hasDomain(const std::string &value) const;
    bool hasProcess(const std::string &value) const;
    bool hasEmail(const std::string &value) const;
    bool hasFile(const std::string &value) const;

    const std::unordered_set<std::string> &domains() const { return domainIndicators; }
    const std::unordered_set<std::string> &processes() const { return processIndicators; }
    const std::unordered_set<std::string> &emails() const { return emailIndicators; }
    const std::unordered_set<std::string> &files() const { return fileIndicators; }

    IndicatorSummary summary() const;
    bool empty() const { return summary().total() == 0; }

  private:
    static std::string normalize(const std::string &value);
    static std::string trim(const std::string &value);

    std::unordered_set<std::string> domainIndicators;
    std::unordered_set<std::string> processIndicators;
    std::unordered_set<std::string> emailIndicators;
    std::unordered_set<std::string> fileIndicators;
};

} // namespace indicators
