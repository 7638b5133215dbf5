#include "daemon/snapshot_diff.hpp"

namespace apptrail {

namespace {

std::vector<ProcessId> keysMissingFrom(const Snapshot &source, const Snapshot &other)
{
    std::vector<ProcessId> missing;
    for (const auto &[id, record] : source) {
        if (!other.contains(id)) {
            missing.push_back(id);
        }
    }
    return missing;
}

} // namespace

SnapshotDiff diffSnapshots(const Snapshot &previous, const Snapshot &current)
{
    // std::map iterates in key order, so both lists come out ascending.
    SnapshotDiff diff;
    diff.started = keysMissingFrom(current, previous);
    diff.stopped = keysMissingFrom(previous, current);
    return diff;
}

std::vector<ProcessId> findReusedIds(const Snapshot &previous, const Snapshot &current)
{
    std::vector<ProcessId> reused;
    for (const auto &[id, record] : current) {
        const auto it = previous.find(id);
        if (it == previous.end()) {
            continue;
        }
        if (it->second.createdAt != record.createdAt) {
            reused.push_back(id);
        }
    }
    return reused;
}

} // namespace apptrail
