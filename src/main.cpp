#include "IndicatorSuite/ArtifactModule.hpp"
#include "IndicatorSuite/CandidateFileModule.hpp"
#include "IndicatorSuite/Cancellation.hpp"
#include "IndicatorSuite/Errors.hpp"
#include "IndicatorSuite/IndicatorMatcher.hpp"
#include "IndicatorSuite/IndicatorSet.hpp"
#include "IndicatorSuite/MatcherConfig.hpp"
#include "IndicatorSuite/ProcessModule.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

enum class CheckKind { Url, Process, Email, File };

struct SingleCheck {
    CheckKind kind;
    std::string value;
};

struct Options {
    std::vector<std::string> bundles;
    std::optional<std::string> configPath;
    std::vector<SingleCheck> checks;
    std::vector<std::string> candidateFiles;
    bool scanProcesses{false};
    bool jsonOutput{false};
    bool summary{false};
    bool verbose{false};
    std::optional<int> maxDepth;
    std::optional<int> timeoutMs;
    std::optional<int> deadlineSeconds;
    std::optional<std::string> proxy;
    bool noUnshorten{false};
};

struct ReportEntry {
    std::string module;
    indicators::MatchFinding finding;
    std::optional<indicators::TimelineEntry> timeline;
};

void usage(const std::string &program) {
    std::cout << "Usage: " << program << " --iocs <bundle> [options]\n"
              << "  --iocs <file>             Load a STIX2 indicator bundle (repeatable)\n"
              << "  --config <file>           Load matcher configuration (JSON)\n"
              << "  --check-url <url>         Check a URL against domain indicators\n"
              << "  --check-process <path>    Check a process name or path\n"
              << "  --check-email <address>   Check an email address\n"
              << "  --check-file <path>       Check a file name or path\n"
              << "  --candidates <file>       Check candidates listed in a JSON file (repeatable)\n"
              << "  --scan-processes          Check every running process\n"
              << "  --summary                 Print indicator counts\n"
              << "  --json                    Emit findings as JSON\n"
              << "  --max-depth <n>           Shortener hops followed per URL (default 5)\n"
              << "  --timeout <ms>            Timeout of one de-shortening request (default 5000)\n"
              << "  --deadline <seconds>      Stop de-shortening once the scan runs this long\n"
              << "  --proxy <host:port>       Send de-shortening requests through a SOCKS5 proxy\n"
              << "  --no-unshorten            Never contact URL shortening services\n"
              << "  --verbose                 Enable debug logging\n"
              << "  --help                    Show this help message\n"
              << "Exit status: 0 no detections, 2 indicators matched, 1 error\n";
}

bool parseInt(const std::string &value, int &out) {
    try {
        std::size_t consumed = 0;
        out = std::stoi(value, &consumed);
        return consumed == value.size();
    } catch (const std::exception &) {
        return false;
    }
}

void configureLogging(const std::string &level, bool verbose) {
    auto logger = spdlog::stderr_color_mt("ioc-scan");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(level));
}

nlohmann::json findingToJson(const ReportEntry &entry) {
    const auto &finding = entry.finding;
    nlohmann::json value = {
        {"module", entry.module},
        {"kind", indicators::toString(finding.indicatorKind)},
        {"rule", indicators::toString(finding.rule)},
        {"value", finding.originalValue},
        {"matched", finding.matchedValue},
        {"indicator", finding.indicator},
        {"detail", finding.detail},
        {"low_confidence", finding.lowConfidence()},
    };
    if (finding.wasShortened()) {
        value["redirect_chain"] = finding.redirectChain;
    }
    if (entry.timeline) {
        value["timeline"] = {
            {"timestamp", entry.timeline->timestamp},
            {"module", entry.timeline->module},
            {"event", entry.timeline->event},
            {"data", entry.timeline->data},
        };
    }
    return value;
}

void printSummary(const indicators::IndicatorSummary &summary, bool jsonOutput) {
    if (jsonOutput) {
        const nlohmann::json value = {
            {"domains", summary.domains},
            {"processes", summary.processes},
            {"emails", summary.emails},
            {"files", summary.files},
        };
        std::cout << value.dump(2) << "\n";
        return;
    }
    std::cout << "[*] Indicators loaded: " << summary.total() << "\n"
              << "    domains:   " << summary.domains << "\n"
              << "    processes: " << summary.processes << "\n"
              << "    emails:    " << summary.emails << "\n"
              << "    files:     " << summary.files << "\n";
}

void printReport(const std::vector<ReportEntry> &entries, bool jsonOutput) {
    if (jsonOutput) {
        auto array = nlohmann::json::array();
        for (const auto &entry : entries) {
            array.push_back(findingToJson(entry));
        }
        std::cout << array.dump(2) << "\n";
        return;
    }

    if (entries.empty()) {
        std::cout << "[+] No known indicators of compromise matched.\n";
        return;
    }
    for (const auto &entry : entries) {
        const auto &finding = entry.finding;
        std::cout << (finding.lowConfidence() ? "[? ]" : "[! ]") << ' ' << entry.module << ": "
                  << indicators::toString(finding.indicatorKind) << " (" << indicators::toString(finding.rule)
                  << ") " << finding.detail << "\n";
        if (finding.wasShortened()) {
            std::cout << "     redirect chain:";
            for (const auto &hop : finding.redirectChain) {
                std::cout << ' ' << hop;
            }
            std::cout << "\n";
        }
        if (entry.timeline) {
            std::cout << "     " << entry.timeline->timestamp << ' ' << entry.timeline->data << "\n";
        }
    }
}

indicators::MatchFinding runSingleCheck(const indicators::IndicatorMatcher &matcher, const SingleCheck &check,
                                        const indicators::CancellationToken &token) {
    switch (check.kind) {
    case CheckKind::Url:
        return matcher.checkDomain(check.value, token);
    case CheckKind::Process:
        return matcher.checkProcess(check.value);
    case CheckKind::Email:
        return matcher.checkEmail(check.value);
    case CheckKind::File:
        return matcher.checkFile(check.value);
    }
    return {};
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc == 1) {
        usage(argv[0]);
        return 0;
    }

    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help") {
            usage(argv[0]);
            return 0;
        }

        if (arg == "--json") {
            options.jsonOutput = true;
            continue;
        }

        if (arg == "--summary") {
            options.summary = true;
            continue;
        }

        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }

        if (arg == "--scan-processes") {
            options.scanProcesses = true;
            continue;
        }

        if (arg == "--no-unshorten") {
            options.noUnshorten = true;
            continue;
        }

        if (arg == "--iocs" || arg == "--config" || arg == "--candidates" || arg == "--proxy") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value" << std::endl;
                return 1;
            }
            const std::string value = argv[++i];
            if (arg == "--iocs") {
                options.bundles.push_back(value);
            } else if (arg == "--config") {
                options.configPath = value;
            } else if (arg == "--candidates") {
                options.candidateFiles.push_back(value);
            } else {
                options.proxy = value;
            }
            continue;
        }

        if (arg == "--check-url" || arg == "--check-process" || arg == "--check-email" || arg == "--check-file") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value" << std::endl;
                return 1;
            }
            CheckKind kind = CheckKind::Url;
            if (arg == "--check-process") {
                kind = CheckKind::Process;
            } else if (arg == "--check-email") {
                kind = CheckKind::Email;
            } else if (arg == "--check-file") {
                kind = CheckKind::File;
            }
            options.checks.push_back({kind, argv[++i]});
            continue;
        }

        if (arg == "--max-depth" || arg == "--timeout" || arg == "--deadline") {
            int value = 0;
            if (i + 1 >= argc || !parseInt(argv[i + 1], value) || value < 0) {
                std::cerr << arg << " requires a non-negative integer" << std::endl;
                return 1;
            }
            if (arg == "--timeout" && value == 0) {
                std::cerr << "--timeout requires a positive number of milliseconds" << std::endl;
                return 1;
            }
            ++i;
            if (arg == "--max-depth") {
                options.maxDepth = value;
            } else if (arg == "--timeout") {
                options.timeoutMs = value;
            } else {
                options.deadlineSeconds = value;
            }
            continue;
        }

        std::cerr << "Unknown argument: " << arg << "\n";
        usage(argv[0]);
        return 1;
    }

    if (options.bundles.empty()) {
        std::cerr << "At least one --iocs bundle is required" << std::endl;
        return 1;
    }

    indicators::MatcherConfig config;
    indicators::IndicatorSet indicatorSet;
    // Built inside the guarded block, loading external lists may throw.
    std::optional<indicators::IndicatorMatcher> matcher;
    try {
        if (options.configPath) {
            config = indicators::MatcherConfig::fromFile(*options.configPath);
        }
        if (options.maxDepth) {
            config.maxDepth = *options.maxDepth;
        }
        if (options.timeoutMs) {
            config.requestTimeout = std::chrono::milliseconds(*options.timeoutMs);
        }
        if (options.proxy) {
            config.setProxy(*options.proxy);
        }
        if (options.noUnshorten) {
            config.unshorten = false;
        }
        configureLogging(config.logLevel, options.verbose);

        for (const auto &bundle : options.bundles) {
            indicatorSet.loadBundle(bundle);
        }
        matcher.emplace(indicatorSet, config);
    } catch (const indicators::IndicatorError &ex) {
        std::cerr << "Failed to initialise: " << ex.what() << std::endl;
        return 1;
    }

    if (options.summary) {
        printSummary(indicatorSet.summary(), options.jsonOutput);
    }

    const auto token = options.deadlineSeconds
                           ? indicators::CancellationToken::withTimeout(std::chrono::seconds(*options.deadlineSeconds))
                           : indicators::CancellationToken();

    std::vector<ReportEntry> report;
    for (const auto &check : options.checks) {
        auto finding = runSingleCheck(*matcher, check, token);
        if (finding.matched) {
            report.push_back({"cli", std::move(finding), std::nullopt});
        }
    }

    std::vector<std::unique_ptr<indicators::ArtifactModule>> modules;
    for (const auto &path : options.candidateFiles) {
        modules.push_back(std::make_unique<indicators::CandidateFileModule>(path));
    }
    if (options.scanProcesses) {
        modules.push_back(std::make_unique<indicators::ProcessModule>());
    }

    // One task per module; they share the read-only matcher.
    std::vector<std::future<std::vector<indicators::ModuleDetection>>> tasks;
    for (auto &module : modules) {
        auto *current = module.get();
        tasks.push_back(std::async(std::launch::async, [current, &scanner = *matcher, token] {
            const auto records = current->run();
            return current->checkIndicators(scanner, records, token);
        }));
    }

    bool moduleFailed = false;
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        try {
            for (auto &detection : tasks[i].get()) {
                report.push_back(
                    {modules[i]->name(), std::move(detection.finding), modules[i]->serialize(detection.record)});
            }
        } catch (const std::exception &ex) {
            spdlog::error("{} failed: {}", modules[i]->name(), ex.what());
            moduleFailed = true;
        }
    }

    if (!options.checks.empty() || !modules.empty()) {
        printReport(report, options.jsonOutput);
    }

    if (!report.empty()) {
        return 2;
    }
    return moduleFailed ? 1 : 0;
}
