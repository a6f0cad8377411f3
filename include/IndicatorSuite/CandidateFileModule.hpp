#pragma once

#include "ArtifactModule.hpp"

#include <string>
#include <vector>

namespace indicators {

// Reads candidates written by external extraction tools. The file is a JSON
// object with optional "urls", "processes", "emails" and "files" arrays; each
// element is either a string or an object with "value" and optional
// "timestamp" and "source" keys.
class CandidateFileModule : public ArtifactModule {
  public:
    explicit CandidateFileModule(std::string path);

    std::string name() const override { return "CandidateFileModule"; }
    std::vector<ArtifactRecord> run() override;
    TimelineEntry serialize(const ArtifactRecord &record) const override;

  private:
    std::string path;
};

} // namespace indicators
