#include "IndicatorSuite/MatcherConfig.hpp"

#include "IndicatorSuite/Errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace indicators {

MatcherConfig MatcherConfig::fromFile(const std::string &path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ConfigError("Unable to open configuration file: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return fromString(buffer.str(), path);
}

MatcherConfig MatcherConfig::fromString(const std::string &content, const std::string &source) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigError("Malformed configuration " + source + ": " + ex.what());
    }
    if (!document.is_object()) {
        throw ConfigError("Configuration " + source + " must be a JSON object");
    }

    MatcherConfig config;
    try {
        if (document.contains("max_depth")) {
            config.maxDepth = document.at("max_depth").get<int>();
            if (config.maxDepth < 0) {
                throw ConfigError("max_depth must not be negative in " + source);
            }
        }
        if (document.contains("request_timeout_ms")) {
            const auto timeout = document.at("request_timeout_ms").get<int>();
            if (timeout <= 0) {
                throw ConfigError("request_timeout_ms must be positive in " + source);
            }
            config.requestTimeout = std::chrono::milliseconds(timeout);
        }
        if (document.contains("unshorten")) {
            config.unshorten = document.at("unshorten").get<bool>();
        }
        if (document.contains("shorteners")) {
            config.shorteners = document.at("shorteners").get<std::vector<std::string>>();
        }
        if (document.contains("shorteners_extra")) {
            const auto extra = document.at("shorteners_extra").get<std::vector<std::string>>();
            config.shorteners.insert(config.shorteners.end(), extra.begin(), extra.end());
        }
        if (document.contains("shortener_file")) {
            config.shortenerFile = document.at("shortener_file").get<std::string>();
        }
        if (document.contains("public_suffix_file")) {
            config.publicSuffixFile = document.at("public_suffix_file").get<std::string>();
        }
        if (document.contains("proxy")) {
            config.setProxy(document.at("proxy").get<std::string>());
        }
        if (document.contains("user_agent")) {
            config.userAgent = document.at("user_agent").get<std::string>();
        }
        if (document.contains("log_level")) {
            config.logLevel = document.at("log_level").get<std::string>();
            // from_str maps names it does not know to off.
            if (config.logLevel != "off" && spdlog::level::from_str(config.logLevel) == spdlog::level::off) {
                throw ConfigError("Unknown log_level '" + config.logLevel + "' in " + source);
            }
        }
    } catch (const nlohmann::json::type_error &ex) {
        throw ConfigError("Invalid value type in configuration " + source + ": " + ex.what());
    }

    spdlog::debug("Loaded configuration from {}", source);
    return config;
}

void MatcherConfig::setProxy(const std::string &value) {
    if (value.empty()) {
        proxyHost.clear();
        proxyPort = 0;
        return;
    }
    const auto colon = value.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == value.size()) {
        throw ConfigError("Proxy must be given as host:port, got " + value);
    }
    int port = 0;
    try {
        std::size_t consumed = 0;
        port = std::stoi(value.substr(colon + 1), &consumed);
        if (consumed != value.size() - colon - 1) {
            port = 0;
        }
    } catch (const std::exception &) {
        port = 0;
    }
    if (port <= 0 || port > 65535) {
        throw ConfigError("Invalid proxy port in " + value);
    }
    proxyHost = value.substr(0, colon);
    proxyPort = static_cast<std::uint16_t>(port);
}

ShortenerRegistry MatcherConfig::buildShortenerRegistry() const {
    ShortenerRegistry registry(shorteners);
    if (!shortenerFile.empty()) {
        registry.loadFromFile(shortenerFile);
    }
    return registry;
}

PublicSuffixList MatcherConfig::buildPublicSuffixList() const {
    if (publicSuffixFile.empty()) {
        return PublicSuffixList::builtin();
    }
    return PublicSuffixList::fromFile(publicSuffixFile);
}

} // namespace indicators
