#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "daemon/process_table.hpp"

namespace apptrail {

// Linux implementation reading /proc. The root is configurable so tests can
// point it at a synthetic tree.
class ProcfsProcessTable : public ProcessTable {
public:
    explicit ProcfsProcessTable(std::string procRoot = "/proc");

    Snapshot snapshot() override;
    QueryResult<std::string> processName(ProcessId id) override;
    QueryResult<std::string> executablePath(ProcessId id) override;
    QueryResult<std::vector<std::string>> launchArguments(ProcessId id) override;

private:
    std::string pidPath(ProcessId id, const char *entry) const;
    std::optional<ProcessRecord> readRecord(ProcessId id);
    std::optional<std::string> ownerOf(ProcessId id);
    std::string userNameForUid(unsigned int uid);
    std::chrono::system_clock::time_point bootTime();

    std::string m_procRoot;
    long m_clockTicks = 100;

    std::mutex m_cacheMutex;
    std::map<unsigned int, std::string> m_userNames;
    std::optional<std::chrono::system_clock::time_point> m_bootTime;
};

} // namespace apptrail
