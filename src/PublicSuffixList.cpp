#include "IndicatorSuite/PublicSuffixList.hpp"

#include "IndicatorSuite/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace indicators {

namespace {

const char *const kBuiltinRules[] = {
    // United Kingdom
    "co.uk", "org.uk", "me.uk", "ltd.uk", "plc.uk", "net.uk", "sch.uk", "ac.uk", "gov.uk", "nhs.uk", "police.uk",
    // Australia / New Zealand
    "com.au", "net.au", "org.au", "edu.au", "gov.au", "asn.au", "id.au", "co.nz", "net.nz", "org.nz", "govt.nz",
    "ac.nz",
    // Asia
    "co.jp", "ne.jp", "or.jp", "ac.jp", "go.jp", "gr.jp", "com.cn", "net.cn", "org.cn", "gov.cn", "edu.cn",
    "com.hk", "org.hk", "net.hk", "com.tw", "org.tw", "net.tw", "co.kr", "or.kr", "ne.kr", "go.kr", "co.in",
    "net.in", "org.in", "firm.in", "gen.in", "ind.in", "gov.in", "com.sg", "org.sg", "net.sg", "com.my",
    "net.my", "org.my", "com.ph", "net.ph", "org.ph", "com.pk", "net.pk", "org.pk", "co.id", "or.id", "web.id",
    "com.vn", "net.vn", "org.vn", "co.th", "in.th", "or.th", "com.sa", "net.sa", "org.sa", "co.il", "org.il",
    "net.il", "com.tr", "net.tr", "org.tr", "gen.tr", "co.ae", "net.ae", "org.ae", "com.qa", "com.kw", "com.bh",
    "com.lb", "com.jo", "com.kz", "org.kz", "com.az", "net.az", "com.ge",
    // Americas
    "com.br", "net.br", "org.br", "gov.br", "com.mx", "org.mx", "net.mx", "gob.mx", "com.ar", "net.ar", "org.ar",
    "com.co", "net.co", "org.co", "com.pe", "org.pe", "com.ve", "co.ve", "com.ec", "com.uy", "com.bo", "com.py",
    "co.cr", "com.gt", "com.sv", "com.ni", "com.do", "com.pr",
    // Africa
    "co.za", "org.za", "net.za", "gov.za", "com.eg", "org.eg", "com.ng", "org.ng", "co.ke", "or.ke", "co.tz",
    "co.ug", "com.gh", "co.ma", "com.tn", "co.zw", "co.mz", "com.et",
    // Europe
    "com.pl", "net.pl", "org.pl", "co.at", "or.at", "com.ua", "net.ua", "org.ua", "in.ua", "com.ru", "net.ru",
    "org.ru", "msk.ru", "spb.ru", "com.by", "com.gr", "com.cy", "com.mt", "co.hu", "com.pt", "com.es", "org.es",
    "com.ro", "co.rs", "com.hr", "co.me", "com.mk", "com.al",
    // Hosting providers listed in the private section of the PSL
    "github.io", "gitlab.io", "blogspot.com", "appspot.com", "herokuapp.com", "azurewebsites.net",
    "cloudfront.net", "cloudapp.net", "firebaseapp.com", "web.app", "netlify.app", "vercel.app", "pages.dev",
    "workers.dev", "ngrok.io", "ngrok-free.app", "duckdns.org", "no-ip.org", "ddns.net", "000webhostapp.com",
    "wixsite.com", "weebly.com", "s3.amazonaws.com", "glitch.me", "repl.co", "onrender.com", "fly.dev",
    "trycloudflare.com", "sharepoint.com",
    // Wildcard and exception examples from the PSL
    "*.ck", "!www.ck", "*.bd", "*.kawasaki.jp", "!city.kawasaki.jp",
};

std::vector<std::string> splitLabels(const std::string &host) {
    std::vector<std::string> labels;
    std::string label;
    std::istringstream stream(host);
    while (std::getline(stream, label, '.')) {
        labels.push_back(label);
    }
    return labels;
}

std::string joinLabels(const std::vector<std::string> &labels, std::size_t from) {
    std::string joined;
    for (std::size_t i = from; i < labels.size(); ++i) {
        if (!joined.empty()) {
            joined.push_back('.');
        }
        joined += labels[i];
    }
    return joined;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim(const std::string &value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace

const PublicSuffixList &PublicSuffixList::builtin() {
    static const PublicSuffixList list = [] {
        PublicSuffixList result;
        for (const auto *rule : kBuiltinRules) {
            result.addRule(rule);
        }
        return result;
    }();
    return list;
}

PublicSuffixList PublicSuffixList::fromFile(const std::string &path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ConfigError("Unable to open public suffix list: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    PublicSuffixList list;
    list.loadFromString(buffer.str());
    spdlog::info("Loaded {} public suffix rules from {}", list.size(), path);
    return list;
}

void PublicSuffixList::loadFromString(const std::string &content) {
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("//", 0) == 0) {
            continue;
        }
        // Only the first whitespace-delimited token of a line is the rule.
        const auto space = line.find_first_of(" \t");
        addRule(line.substr(0, space));
    }
}

void PublicSuffixList::addRule(const std::string &rule) {
    const auto lowered = toLower(trim(rule));
    if (lowered.empty()) {
        return;
    }
    if (lowered[0] == '!') {
        exceptionRules.insert(lowered.substr(1));
    } else if (lowered.rfind("*.", 0) == 0) {
        wildcardRules.insert(lowered.substr(2));
    } else {
        rules.insert(lowered);
    }
}

std::string PublicSuffixList::publicSuffix(const std::string &host) const {
    const auto labels = splitLabels(host);
    if (labels.empty()) {
        return {};
    }

    // Walk from the longest candidate to the shortest; the first hit is the
    // prevailing rule. Exceptions strip their leftmost label.
    for (std::size_t i = 0; i < labels.size(); ++i) {
        const auto candidate = joinLabels(labels, i);
        if (exceptionRules.count(candidate) != 0) {
            return joinLabels(labels, i + 1);
        }
        if (rules.count(candidate) != 0) {
            return candidate;
        }
        if (i + 1 < labels.size() && wildcardRules.count(joinLabels(labels, i + 1)) != 0) {
            return candidate;
        }
    }
    return labels.back();
}

std::string PublicSuffixList::registrableDomain(const std::string &host) const {
    const auto suffix = publicSuffix(host);
    if (suffix.empty() || suffix.size() >= host.size()) {
        return {};
    }

    const auto prefix = host.substr(0, host.size() - suffix.size() - 1);
    const auto dot = prefix.rfind('.');
    const auto label = (dot == std::string::npos) ? prefix : prefix.substr(dot + 1);
    if (label.empty()) {
        return {};
    }
    return label + "." + suffix;
}

} // namespace indicators
