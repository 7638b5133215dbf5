#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"
#include "common/query_result.hpp"

namespace apptrail {

// ProcessTable is the boundary to the OS process list. Every per-pid query is
// best-effort: the process may exit between enumeration and lookup.
class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    virtual Snapshot snapshot() = 0;
    virtual QueryResult<std::string> processName(ProcessId id) = 0;
    virtual QueryResult<std::string> executablePath(ProcessId id) = 0;
    virtual QueryResult<std::vector<std::string>> launchArguments(ProcessId id) = 0;
};

} // namespace apptrail
