#include "IndicatorSuite/ProcessModule.hpp"

#include "IndicatorSuite/Errors.hpp"

#include <spdlog/spdlog.h>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace indicators {

namespace {

// Field 22 of /proc/<pid>/stat, counted after the parenthesised comm field.
constexpr std::size_t kStartTimeField = 19;

std::string slurp(const fs::path &path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return {};
    }
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

std::string stripWhitespace(const std::string &value) {
    const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) { return std::isspace(ch); });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) { return std::isspace(ch); });
    if (first == value.end()) {
        return {};
    }
    return std::string(first, last.base());
}

// "Key:\tvalue" lines of /proc/<pid>/status.
std::map<std::string, std::string> parseStatus(const std::string &content) {
    std::map<std::string, std::string> fields;
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            fields[line.substr(0, colon)] = stripWhitespace(line.substr(colon + 1));
        }
    }
    return fields;
}

// Arguments are separated by NUL bytes.
std::string joinArguments(std::string raw) {
    std::replace(raw.begin(), raw.end(), '\0', ' ');
    return stripWhitespace(raw);
}

int toInt(const std::string &value) {
    int result = 0;
    std::istringstream(value) >> result;
    return result;
}

std::string lookupUser(const std::string &uidLine) {
    uid_t uid = 0;
    if (!(std::istringstream(uidLine) >> uid)) {
        return {};
    }
    const passwd *entry = getpwuid(uid);
    return entry ? std::string(entry->pw_name) : std::to_string(uid);
}

std::string formatUtc(std::time_t when) {
    std::tm parts{};
    gmtime_r(&when, &parts);
    std::ostringstream out;
    out << std::put_time(&parts, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::string startTimeOf(const std::string &statContent, const std::optional<std::time_t> &booted) {
    const auto commEnd = statContent.rfind(')');
    const long ticks = sysconf(_SC_CLK_TCK);
    if (!booted || commEnd == std::string::npos || ticks <= 0) {
        return {};
    }
    std::istringstream fields(statContent.substr(commEnd + 1));
    std::string field;
    for (std::size_t i = 0; i <= kStartTimeField && fields >> field; ++i) {
        long long startTicks = 0;
        if (i == kStartTimeField && std::istringstream(field) >> startTicks) {
            return formatUtc(*booted + static_cast<std::time_t>(startTicks / ticks));
        }
    }
    return {};
}

bool isPidName(const std::string &name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char ch) { return std::isdigit(ch); });
}

} // namespace

ProcessModule::ProcessModule(std::string root) : procRoot(std::move(root)) {}

std::optional<std::time_t> ProcessModule::bootTime() const {
    std::istringstream lines(slurp(procRoot / "stat"));
    std::string line;
    while (std::getline(lines, line)) {
        long long seconds = 0;
        if (line.rfind("btime ", 0) == 0 && std::istringstream(line.substr(6)) >> seconds) {
            return static_cast<std::time_t>(seconds);
        }
    }
    return std::nullopt;
}

std::optional<ProcessInfo> ProcessModule::readProcess(const fs::path &dir,
                                                      const std::optional<std::time_t> &booted) const {
    const auto status = parseStatus(slurp(dir / "status"));
    if (status.empty()) {
        // Exited between listing and reading.
        return std::nullopt;
    }

    const auto field = [&status](const std::string &key) {
        const auto it = status.find(key);
        return it == status.end() ? std::string() : it->second;
    };

    ProcessInfo info;
    info.pid = toInt(dir.filename().string());
    info.parentPid = toInt(field("PPid"));
    info.name = field("Name");
    info.user = lookupUser(field("Uid"));
    info.cmdline = joinArguments(slurp(dir / "cmdline"));
    info.startTime = startTimeOf(slurp(dir / "stat"), booted);

    std::error_code ec;
    const auto exe = fs::read_symlink(dir / "exe", ec);
    if (!ec) {
        info.exePath = exe.string();
    }
    return info;
}

std::vector<ProcessInfo> ProcessModule::snapshotProcesses() const {
    std::error_code ec;
    fs::directory_iterator it(procRoot, ec);
    if (ec) {
        throw ModuleError("Unable to list " + procRoot.string() + ": " + ec.message());
    }

    const auto booted = bootTime();
    std::vector<ProcessInfo> processes;
    for (const auto &entry : it) {
        if (!isPidName(entry.path().filename().string()) || !entry.is_directory(ec)) {
            continue;
        }
        if (auto process = readProcess(entry.path(), booted)) {
            processes.push_back(std::move(*process));
        }
    }

    spdlog::debug("Collected {} processes from {}", processes.size(), procRoot.string());
    return processes;
}

std::vector<ArtifactRecord> ProcessModule::run() {
    std::vector<ArtifactRecord> records;
    for (auto &process : snapshotProcesses()) {
        ArtifactRecord record;
        record.kind = IndicatorKind::Process;
        record.value = process.exePath.empty() ? process.name : process.exePath;
        if (record.value.empty()) {
            continue;
        }
        record.timestamp = process.startTime;
        record.attributes = {
            {"pid", std::to_string(process.pid)},
            {"ppid", std::to_string(process.parentPid)},
            {"name", process.name},
            {"user", process.user},
            {"cmdline", process.cmdline},
        };
        records.push_back(std::move(record));
    }
    spdlog::info("Extracted a total of {} processes", records.size());
    return records;
}

TimelineEntry ProcessModule::serialize(const ArtifactRecord &record) const {
    const auto attribute = [&record](const std::string &key) {
        const auto it = record.attributes.find(key);
        return it == record.attributes.end() ? std::string() : it->second;
    };
    std::string data = "Process " + record.value + " (pid " + attribute("pid") + ", parent " + attribute("ppid");
    if (!attribute("user").empty()) {
        data += ", user " + attribute("user");
    }
    data += ")";
    return {record.timestamp, name(), "process", data};
}

} // namespace indicators
