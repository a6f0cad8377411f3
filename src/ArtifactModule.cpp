#include "IndicatorSuite/ArtifactModule.hpp"

#include <spdlog/spdlog.h>

namespace indicators {

std::vector<ModuleDetection> ArtifactModule::checkIndicators(const IndicatorMatcher &matcher,
                                                             const std::vector<ArtifactRecord> &records,
                                                             const CancellationToken &token) const {
    std::vector<ModuleDetection> detections;
    for (const auto &record : records) {
        MatchFinding finding;
        switch (record.kind) {
        case IndicatorKind::Domain:
            finding = matcher.checkDomain(record.value, token);
            break;
        case IndicatorKind::Process:
            finding = matcher.checkProcess(record.value);
            break;
        case IndicatorKind::Email:
            finding = matcher.checkEmail(record.value);
            break;
        case IndicatorKind::File:
            finding = matcher.checkFile(record.value);
            break;
        }
        if (finding.matched) {
            detections.push_back({record, std::move(finding)});
        }
    }

    if (!detections.empty()) {
        spdlog::warn("{} produced {} detections out of {} records", name(), detections.size(), records.size());
    }
    return detections;
}

} // namespace indicators
