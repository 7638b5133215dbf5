#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <QString>

namespace apptrail {

// Hour key ("yyyy-MM-dd HH:00:00") -> raw lines, in file order. Keys sort
// chronologically.
using HourGroups = std::map<std::string, std::vector<std::string>>;

struct ReplayState {
    std::optional<std::string> lastHour;
};

// active_window, heartbeat and the legacy "active" lines.
bool isActiveWindowClass(const std::string &eventType);

HourGroups groupLinesByHour(const std::vector<std::string> &lines);

/**
 * HourlyGrouper re-partitions a raw event log into hour blocks:
 *
 *   ===== 2025-10-29 19:00:00 =====
 *   <lines>
 *   ---------- hour boundary ----------
 *   ===== 2025-10-29 20:00:00 =====
 *
 * Incremental mode appends only completed hours newer than the persisted
 * state, so running it twice in the same hour writes nothing the second time.
 */
class HourlyGrouper
{
public:
    // Reads a plain or gzip-compressed (".gz") event log.
    static std::optional<std::vector<std::string>> readLogLines(const QString &path,
                                                                QString *error = nullptr);

    static bool writeHourlyLog(const HourGroups &groups, const QString &outPath,
                               QString *error = nullptr);

    // Returns the number of hours appended, or nullopt on a write failure.
    // state is updated only when at least one hour was written.
    static std::optional<int> appendNewHours(const HourGroups &groups,
                                             const QString &outPath,
                                             ReplayState &state,
                                             std::chrono::system_clock::time_point now,
                                             QString *error = nullptr);

    // A missing or unreadable state file means "nothing written yet".
    static ReplayState loadState(const QString &path);
    static bool saveState(const QString &path, const ReplayState &state,
                          QString *error = nullptr);
};

} // namespace apptrail
