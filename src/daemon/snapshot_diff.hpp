#pragma once

#include <vector>

#include "common/models.hpp"

namespace apptrail {

struct SnapshotDiff {
    // Both ascending by pid.
    std::vector<ProcessId> started;
    std::vector<ProcessId> stopped;
};

/**
 * Compare two process tables by pid only:
 * - started: pids in current but not in previous
 * - stopped: pids in previous but not in current
 *
 * A pid present in both is never reported, even if its name changed.
 */
SnapshotDiff diffSnapshots(const Snapshot &previous, const Snapshot &current);

// Pids present in both snapshots whose creation time differs, i.e. the id was
// recycled by an unrelated process between the two polls. Ascending.
std::vector<ProcessId> findReusedIds(const Snapshot &previous, const Snapshot &current);

} // namespace apptrail
