#pragma once

#include <string>
#include <vector>

#include "common/query_result.hpp"

namespace apptrail::procfs {

// errno-to-status mapping shared by every /proc read: a vanished pid is
// NotFound, a protected one AccessDenied, anything else Unavailable.
QueryStatus statusFromErrno(int error);

// Read a whole (pseudo-)file. /proc files report size 0, so this reads until EOF.
QueryResult<std::string> readFile(const std::string &path);

// Resolve a symlink such as /proc/<pid>/exe.
QueryResult<std::string> readLink(const std::string &path);

// Split a NUL-separated buffer (cmdline, environ) into its arguments.
std::vector<std::string> splitNulSeparated(const std::string &raw);

// Names of all-digit entries of a directory; empty on error.
std::vector<std::string> listNumericEntries(const std::string &dir);

} // namespace apptrail::procfs
