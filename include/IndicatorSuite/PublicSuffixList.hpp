#pragma once

#include <string>
#include <unordered_set>

namespace indicators {

// Public suffix rules in the format of Mozilla's public_suffix_list.dat.
// A host that matches no rule falls back to the implicit "*" rule, so its last
// label is the suffix.
class PublicSuffixList {
  public:
    // Generic TLDs through the implicit rule plus the common multi-part
    // country and hosting suffixes.
    static const PublicSuffixList &builtin();

    static PublicSuffixList fromFile(const std::string &path);

    void loadFromString(const std::string &content);
    void addRule(const std::string &rule);

    // Both expect a lower-cased host without port. registrableDomain returns an
    // empty string when the host is itself a public suffix.
    std::string publicSuffix(const std::string &host) const;
    std::string registrableDomain(const std::string &host) const;

    std::size_t size() const { return rules.size() + wildcardRules.size() + exceptionRules.size(); }

  private:
    std::unordered_set<std::string> rules;
    std::unordered_set<std::string> wildcardRules;
    std::unordered_set<std::string> exceptionRules;
};

} // namespace indicators
