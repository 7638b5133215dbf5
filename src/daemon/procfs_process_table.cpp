#include "daemon/procfs_process_table.hpp"

#include <cstdlib>
#include <sstream>
#include <vector>

#include <pwd.h>
#include <unistd.h>

#include "common/procfs.hpp"

namespace apptrail {

namespace {

// Index of starttime among the fields following the ")" of /proc/<pid>/stat
// (field 22 overall; the first field after ")" is field 3).
constexpr size_t kStartTimeIndex = 19;

std::string trimTrailingNewline(std::string value)
{
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

} // namespace

ProcfsProcessTable::ProcfsProcessTable(std::string procRoot)
    : m_procRoot(std::move(procRoot))
{
    const long ticks = sysconf(_SC_CLK_TCK);
    if (ticks > 0) {
        m_clockTicks = ticks;
    }
}

std::string ProcfsProcessTable::pidPath(ProcessId id, const char *entry) const
{
    return m_procRoot + "/" + std::to_string(id) + "/" + entry;
}

Snapshot ProcfsProcessTable::snapshot()
{
    Snapshot snapshot;
    for (const auto &name : procfs::listNumericEntries(m_procRoot)) {
        const ProcessId id = std::strtoll(name.c_str(), nullptr, 10);
        auto record = readRecord(id);
        if (!record) {
            // Exited while we were enumerating.
            continue;
        }
        snapshot.emplace(id, std::move(*record));
    }
    return snapshot;
}

std::optional<ProcessRecord> ProcfsProcessTable::readRecord(ProcessId id)
{
    const auto stat = procfs::readFile(pidPath(id, "stat"));
    if (!stat.isOk()) {
        return std::nullopt;
    }

    // comm may itself contain spaces and parentheses; it spans to the last ')'.
    const std::string &content = stat.value;
    const auto open = content.find('(');
    const auto close = content.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcessRecord record;
    record.id = id;
    record.name = content.substr(open + 1, close - open - 1);

    std::istringstream rest(content.substr(close + 1));
    std::vector<std::string> tokens;
    std::string token;
    while (rest >> token) {
        tokens.push_back(token);
    }
    if (tokens.size() > kStartTimeIndex) {
        const unsigned long long startTicks =
            std::strtoull(tokens[kStartTimeIndex].c_str(), nullptr, 10);
        const auto sinceBoot = std::chrono::milliseconds(
            static_cast<long long>(startTicks * 1000ULL / static_cast<unsigned long long>(m_clockTicks)));
        record.createdAt = bootTime()
            + std::chrono::duration_cast<std::chrono::system_clock::duration>(sinceBoot);
    }

    const auto exe = executablePath(id);
    if (exe.isOk()) {
        record.executablePath = exe.value;
    }
    record.owner = ownerOf(id);
    return record;
}

std::optional<std::string> ProcfsProcessTable::ownerOf(ProcessId id)
{
    const auto status = procfs::readFile(pidPath(id, "status"));
    if (!status.isOk()) {
        return std::nullopt;
    }

    std::istringstream lines(status.value);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind("Uid:", 0) != 0) {
            continue;
        }
        std::istringstream fields(line.substr(4));
        unsigned int uid = 0;
        if (!(fields >> uid)) {
            return std::nullopt;
        }
        return userNameForUid(uid);
    }
    return std::nullopt;
}

std::string ProcfsProcessTable::userNameForUid(unsigned int uid)
{
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    auto it = m_userNames.find(uid);
    if (it != m_userNames.end()) {
        return it->second;
    }

    std::string name = std::to_string(uid);
    passwd entry{};
    passwd *result = nullptr;
    std::vector<char> buffer(16384);
    if (getpwuid_r(uid, &entry, buffer.data(), buffer.size(), &result) == 0
        && result != nullptr && result->pw_name != nullptr) {
        name = result->pw_name;
    }
    m_userNames.emplace(uid, name);
    return name;
}

std::chrono::system_clock::time_point ProcfsProcessTable::bootTime()
{
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    if (m_bootTime) {
        return *m_bootTime;
    }

    std::chrono::system_clock::time_point boot{};
    const auto stat = procfs::readFile(m_procRoot + "/stat");
    if (stat.isOk()) {
        std::istringstream lines(stat.value);
        std::string line;
        while (std::getline(lines, line)) {
            if (line.rfind("btime ", 0) == 0) {
                const long long seconds = std::strtoll(line.c_str() + 6, nullptr, 10);
                boot = std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
                break;
            }
        }
    }
    m_bootTime = boot;
    return boot;
}

QueryResult<std::string> ProcfsProcessTable::processName(ProcessId id)
{
    auto comm = procfs::readFile(pidPath(id, "comm"));
    if (!comm.isOk()) {
        return comm;
    }
    std::string name = trimTrailingNewline(comm.value);
    if (name.empty()) {
        return QueryResult<std::string>::failure(QueryStatus::NotFound);
    }
    return QueryResult<std::string>::ok(std::move(name));
}

QueryResult<std::string> ProcfsProcessTable::executablePath(ProcessId id)
{
    return procfs::readLink(pidPath(id, "exe"));
}

QueryResult<std::vector<std::string>> ProcfsProcessTable::launchArguments(ProcessId id)
{
    const auto raw = procfs::readFile(pidPath(id, "cmdline"));
    if (!raw.isOk()) {
        return QueryResult<std::vector<std::string>>::failure(raw.status);
    }
    return QueryResult<std::vector<std::string>>::ok(procfs::splitNulSeparated(raw.value));
}

} // namespace apptrail
