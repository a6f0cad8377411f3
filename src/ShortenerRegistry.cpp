#include "IndicatorSuite/ShortenerRegistry.hpp"

#include "IndicatorSuite/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace indicators {

namespace {

std::string normalizeHost(const std::string &value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    auto host = value.substr(start, end - start + 1);
    std::transform(host.begin(), host.end(), host.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (host.rfind("www.", 0) == 0) {
        host.erase(0, 4);
    }
    return host;
}

} // namespace

ShortenerRegistry::ShortenerRegistry(const std::vector<std::string> &initial) {
    for (const auto &host : initial) {
        add(host);
    }
}

const std::vector<std::string> &ShortenerRegistry::defaultHosts() {
    static const std::vector<std::string> hosts = {
        "0rz.tw", "1url.com", "2.gp", "2big.at", "2tu.us", "3.ly", "4sq.com", "4url.cc", "6url.com", "7.ly",
        "a.gg", "a.nf", "aa.cx", "adf.ly", "adfoc.us", "aka.ms", "amzn.to", "bc.vc", "bit.do", "bit.ly",
        "bitly.com", "bitly.is", "bl.ink", "buff.ly", "budurl.com", "chilp.it", "chzb.gr", "clck.ru", "cli.gs",
        "cutt.ly", "db.tt", "dlvr.it", "fb.me", "flic.kr", "forms.gle", "g.co", "goo.gl", "gg.gg", "git.io",
        "hubs.ly", "ift.tt", "is.gd", "j.mp", "lnkd.in", "mcaf.ee", "moourl.com", "ow.ly", "po.st", "q.gs",
        "qr.ae", "rb.gy", "rebrand.ly", "s.id", "shorturl.at", "shorte.st", "smarturl.it", "snip.ly", "soo.gd",
        "t.co", "t.ly", "t2m.io", "tiny.cc", "tiny.one", "tinyurl.com", "tr.im", "trib.al", "u.to", "urlz.fr",
        "v.gd", "wp.me", "x.co", "y2u.be", "youtu.be", "zpr.io",
    };
    return hosts;
}

ShortenerRegistry ShortenerRegistry::defaults() {
    return ShortenerRegistry(defaultHosts());
}

void ShortenerRegistry::loadFromFile(const std::string &path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ConfigError("Unable to open shortener list: " + path);
    }

    const auto before = hosts.size();
    std::string line;
    while (std::getline(input, line)) {
        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        add(line);
    }
    spdlog::info("Loaded {} shortener hosts from {}", hosts.size() - before, path);
}

void ShortenerRegistry::add(const std::string &host) {
    auto normalized = normalizeHost(host);
    if (!normalized.empty()) {
        hosts.insert(std::move(normalized));
    }
}

bool ShortenerRegistry::contains(const std::string &host) const {
    return hosts.find(normalizeHost(host)) != hosts.end();
}

} // namespace indicators
