#include "IndicatorSuite/IndicatorSet.hpp"

#include "IndicatorSuite/Errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace indicators {

namespace {

std::vector<std::string> split(const std::string &value, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(value);
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    if (!value.empty() && value.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::string stripChars(const std::string &value, const std::string &chars) {
    const auto start = value.find_first_not_of(chars);
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(chars);
    return value.substr(start, end - start + 1);
}

std::string readFile(const std::string &path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        throw BundleIOError("Unable to open indicator bundle: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw BundleIOError("Unable to read indicator bundle: " + path);
    }
    return buffer.str();
}

} // namespace

std::string toString(IndicatorKind kind) {
    switch (kind) {
    case IndicatorKind::Domain:
        return "domain";
    case IndicatorKind::Process:
        return "process";
    case IndicatorKind::Email:
        return "email";
    case IndicatorKind::File:
        return "file";
    }
    return "unknown";
}

IndicatorSet IndicatorSet::fromFile(const std::string &path) {
    IndicatorSet set;
    set.loadBundle(path);
    return set;
}

void IndicatorSet::loadBundle(const std::string &path) {
    loadBundleFromString(readFile(path), path);
}

void IndicatorSet::loadBundleFromString(const std::string &content, const std::string &source) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error &ex) {
        throw BundleParseError("Malformed indicator bundle " + source + ": " + ex.what());
    }

    if (!document.is_object() || !document.contains("objects") || !document["objects"].is_array()) {
        throw BundleParseError("Indicator bundle " + source + " has no objects array");
    }

    const auto before = summary().total();
    std::size_t skipped = 0;
    for (const auto &entry : document["objects"]) {
        if (!entry.is_object()) {
            continue;
        }
        const auto type = entry.find("type");
        if (type == entry.end() || !type->is_string() || type->get<std::string>() != "indicator") {
            continue;
        }
        const auto pattern = entry.find("pattern");
        if (pattern == entry.end()) {
            continue;
        }
        if (!pattern->is_string()) {
            throw BundleSchemaError("Indicator pattern in " + source + " is not a string");
        }
        if (!addPattern(pattern->get<std::string>())) {
            ++skipped;
        }
    }

    spdlog::info("Loaded {} new indicators from {} ({} skipped or duplicate)", summary().total() - before, source,
                 skipped);
}

bool IndicatorSet::addPattern(const std::string &pattern) {
    const auto stripped = stripChars(trim(pattern), "[]");
    const auto parts = split(stripped, '=');
    if (parts.size() != 2) {
        throw BundleSchemaError("Malformed indicator pattern: " + pattern);
    }

    const auto key = trim(parts[0]);
    const auto value = stripChars(trim(parts[1]), "'");

    if (key == "domain-name:value") {
        return addIndicator(IndicatorKind::Domain, value);
    }
    if (key == "process:name") {
        return addIndicator(IndicatorKind::Process, value);
    }
    if (key == "email-addr:value") {
        return addIndicator(IndicatorKind::Email, value);
    }
    if (key == "file:name") {
        return addIndicator(IndicatorKind::File, value);
    }

    spdlog::debug("Ignoring unsupported indicator key {}", key);
    return false;
}

bool IndicatorSet::addIndicator(IndicatorKind kind, const std::string &value) {
    const auto trimmed = trim(value);
    if (trimmed.empty()) {
        return false;
    }

    switch (kind) {
    case IndicatorKind::Domain:
        return domainIndicators.insert(normalize(trimmed)).second;
    case IndicatorKind::Process:
        return processIndicators.insert(trimmed).second;
    case IndicatorKind::Email:
        return emailIndicators.insert(normalize(trimmed)).second;
    case IndicatorKind::File:
        return fileIndicators.insert(trimmed).second;
    }
    return false;
}

bool IndicatorSet::hasDomain(const std::string &value) const {
    return domainIndicators.find(normalize(value)) != domainIndicators.end();
}

bool IndicatorSet::hasProcess(const std::string &value) const {
    return processIndicators.find(value) != processIndicators.end();
}

bool IndicatorSet::hasEmail(const std::string &value) const {
    return emailIndicators.find(normalize(value)) != emailIndicators.end();
}

bool IndicatorSet::hasFile(const std::string &value) const {
    return fileIndicators.find(value) != fileIndicators.end();
}

IndicatorSummary IndicatorSet::summary() const {
    return {domainIndicators.size(), processIndicators.size(), emailIndicators.size(), fileIndicators.size()};
}

std::string IndicatorSet::normalize(const std::string &value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return result;
}

std::string IndicatorSet::trim(const std::string &value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace indicators
