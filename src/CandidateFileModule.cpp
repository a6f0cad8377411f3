#include "IndicatorSuite/CandidateFileModule.hpp"

#include "IndicatorSuite/Errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <utility>

namespace indicators {

namespace {

struct Section {
    const char *key;
    IndicatorKind kind;
    const char *event;
};

const Section kSections[] = {
    {"urls", IndicatorKind::Domain, "url"},
    {"processes", IndicatorKind::Process, "process"},
    {"emails", IndicatorKind::Email, "email"},
    {"files", IndicatorKind::File, "file"},
};

std::string eventFor(IndicatorKind kind) {
    for (const auto &section : kSections) {
        if (section.kind == kind) {
            return section.event;
        }
    }
    return "artifact";
}

ArtifactRecord parseRecord(const nlohmann::json &element, IndicatorKind kind, const std::string &source) {
    ArtifactRecord record;
    record.kind = kind;
    if (element.is_string()) {
        record.value = element.get<std::string>();
        return record;
    }
    if (!element.is_object() || !element.contains("value") || !element["value"].is_string()) {
        throw ModuleError("Candidate entries in " + source + " must be strings or objects with a value");
    }
    record.value = element["value"].get<std::string>();
    record.timestamp = element.value("timestamp", std::string());
    const auto origin = element.value("source", std::string());
    if (!origin.empty()) {
        record.attributes["source"] = origin;
    }
    return record;
}

} // namespace

CandidateFileModule::CandidateFileModule(std::string filePath) : path(std::move(filePath)) {}

std::vector<ArtifactRecord> CandidateFileModule::run() {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ModuleError("Unable to open candidate file: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error &ex) {
        throw ModuleError("Malformed candidate file " + path + ": " + ex.what());
    }
    if (!document.is_object()) {
        throw ModuleError("Candidate file " + path + " must contain a JSON object");
    }

    std::vector<ArtifactRecord> records;
    try {
        for (const auto &section : kSections) {
            if (!document.contains(section.key)) {
                continue;
            }
            const auto &entries = document[section.key];
            if (!entries.is_array()) {
                throw ModuleError(std::string("Section ") + section.key + " in " + path + " is not an array");
            }
            for (const auto &element : entries) {
                auto record = parseRecord(element, section.kind, path);
                if (!record.value.empty()) {
                    records.push_back(std::move(record));
                }
            }
        }
    } catch (const nlohmann::json::type_error &ex) {
        throw ModuleError("Invalid candidate entry in " + path + ": " + ex.what());
    }

    spdlog::info("Read {} candidates from {}", records.size(), path);
    return records;
}

TimelineEntry CandidateFileModule::serialize(const ArtifactRecord &record) const {
    std::string data = "Candidate " + eventFor(record.kind) + " " + record.value;
    const auto origin = record.attributes.find("source");
    if (origin != record.attributes.end()) {
        data += " from " + origin->second;
    }
    return {record.timestamp, name(), eventFor(record.kind), data};
}

} // namespace indicators
