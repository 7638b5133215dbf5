#pragma once

#include <map>
#include <optional>
#include <set>
#include <stop_token>
#include <string>

#include "common/models.hpp"
#include "daemon/monitor_context.hpp"
#include "daemon/process_classifier.hpp"

namespace apptrail {

ClassifierOptions classifierOptionsFrom(const MonitorConfig &config);

/**
 * ProcessMonitor turns successive process table snapshots into proc_start and
 * proc_stop events.
 *
 * The first poll only records the baseline (and writes the optional snapshot
 * dump); processes already running are not reported as started. A pid whose
 * creation time changed between polls is reported as a stop followed by a
 * start. Stops are written before starts within one poll.
 */
class ProcessMonitor
{
public:
    explicit ProcessMonitor(MonitorContext context);

    // stopToken only shortens the post-launch wait for browser titles.
    void pollOnce(std::stop_token stopToken = {});

    // Polls until stop is requested. Returns false if the loop crashed.
    bool run(std::stop_token stopToken);

    // "snapshot count=N" followed by one "proc" event per accepted process.
    void writeSnapshot(const Snapshot &snapshot, const TopLevelWindowSet &windows);

    std::optional<std::string> cachedExecutable(ProcessId id) const;
    bool isTrackedAsSuppressedChild(ProcessId id) const;

private:
    void handleStarted(const ProcessRecord &record, const TopLevelWindowSet &windows,
                       std::stop_token stopToken);
    void handleStopped(const ProcessRecord &record);
    void forget(ProcessId id);
    TopLevelWindowSet currentWindowSet();
    void write(EventType type, std::vector<EventField> fields);

    MonitorContext m_context;
    ProcessClassifier m_classifier;
    std::optional<Snapshot> m_previous;
    TopLevelWindowSet m_previousWindows;
    std::map<ProcessId, std::string> m_exeCache;
    // Browser helpers filtered at start; their launch arguments are gone by
    // the time they exit.
    std::set<ProcessId> m_suppressedChildren;
};

} // namespace apptrail
