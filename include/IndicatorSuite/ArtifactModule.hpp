#pragma once

#include "Cancellation.hpp"
#include "IndicatorMatcher.hpp"
#include "IndicatorSet.hpp"

#include <map>
#include <string>
#include <vector>

namespace indicators {

// One candidate artifact extracted from a device.
struct ArtifactRecord {
    IndicatorKind kind{IndicatorKind::Domain};
    std::string value;
    std::string timestamp;
    std::map<std::string, std::string> attributes;
};

struct TimelineEntry {
    std::string timestamp;
    std::string module;
    std::string event;
    std::string data;
};

struct ModuleDetection {
    ArtifactRecord record;
    MatchFinding finding;
};

// Producer of candidate artifacts. run() hands out a freshly allocated record
// list on every call; modules keep no results between runs.
class ArtifactModule {
  public:
    virtual ~ArtifactModule() = default;

    virtual std::string name() const = 0;
    virtual std::vector<ArtifactRecord> run() = 0;
    virtual TimelineEntry serialize(const ArtifactRecord &record) const = 0;

    // Matches every record against the indicator kind it carries.
    std::vector<ModuleDetection> checkIndicators(const IndicatorMatcher &matcher,
                                                 const std::vector<ArtifactRecord> &records,
                                                 const CancellationToken &token = CancellationToken()) const;
};

} // namespace indicators
