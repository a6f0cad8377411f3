#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace indicators {

// Hosts of URL shortening services. Lookups are case-insensitive.
class ShortenerRegistry {
  public:
    ShortenerRegistry() = default;
    explicit ShortenerRegistry(const std::vector<std::string> &hosts);

    static ShortenerRegistry defaults();
    static const std::vector<std::string> &defaultHosts();

    // One host per line, '#' starts a comment.
    void loadFromFile(const std::string &path);

    void add(const std::string &host);
    void clear() { hosts.clear(); }
    bool contains(const std::string &host) const;
    std::size_t size() const { return hosts.size(); }

  private:
    std::unordered_set<std::string> hosts;
};

} // namespace indicators
