#pragma once

#include "ArtifactModule.hpp"

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace indicators {

struct ProcessInfo {
    int pid{0};
    int parentPid{0};
    std::string name;
    std::string cmdline;
    std::string exePath;
    std::string user;
    std::string startTime;
};

// Lists running processes from procfs and emits one process record per
// process, carrying the executable path when readable and the kernel name
// otherwise.
class ProcessModule : public ArtifactModule {
  public:
    explicit ProcessModule(std::string procRoot = "/proc");

    std::string name() const override { return "ProcessModule"; }
    std::vector<ArtifactRecord> run() override;
    TimelineEntry serialize(const ArtifactRecord &record) const override;

    // Throws ModuleError when the procfs root cannot be listed.
    std::vector<ProcessInfo> snapshotProcesses() const;

  private:
    // Seconds since the epoch at boot, from the btime line of <root>/stat.
    std::optional<std::time_t> bootTime() const;
    std::optional<ProcessInfo> readProcess(const std::filesystem::path &dir,
                                           const std::optional<std::time_t> &booted) const;

    std::filesystem::path procRoot;
};

} // namespace indicators
