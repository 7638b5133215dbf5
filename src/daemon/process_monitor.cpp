#include "daemon/process_monitor.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/browser_names.hpp"
#include "daemon/monitor_loop.hpp"
#include "daemon/snapshot_diff.hpp"

namespace apptrail {

ClassifierOptions classifierOptionsFrom(const MonitorConfig &config)
{
    ClassifierOptions options;
    options.includeSystem = config.includeSystem;
    options.guiOnly = config.guiOnly;
    options.ignoreNames = config.ignoreNames.value_or(defaultIgnoreNames());
    options.whitelist = config.whitelist;
    return options;
}

ProcessMonitor::ProcessMonitor(MonitorContext context)
    : m_context(context)
    , m_classifier(context.processes, classifierOptionsFrom(context.config))
{
}

std::optional<std::string> ProcessMonitor::cachedExecutable(ProcessId id) const
{
    const auto it = m_exeCache.find(id);
    if (it == m_exeCache.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ProcessMonitor::isTrackedAsSuppressedChild(ProcessId id) const
{
    return m_suppressedChildren.contains(id);
}

TopLevelWindowSet ProcessMonitor::currentWindowSet()
{
    if (!m_context.config.guiOnly) {
        return {};
    }
    return visibleTitledWindowPids(m_context.windows.topLevelWindows());
}

void ProcessMonitor::write(EventType type, std::vector<EventField> fields)
{
    MonitorEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.type = type;
    event.fields = std::move(fields);
    m_context.writer.append(event);
}

void ProcessMonitor::forget(ProcessId id)
{
    m_exeCache.erase(id);
    m_suppressedChildren.erase(id);
}

void ProcessMonitor::pollOnce(std::stop_token stopToken)
{
    Snapshot current = m_context.processes.snapshot();
    const TopLevelWindowSet windows = currentWindowSet();

    // The first poll only establishes the baseline.
    if (m_previous) {
        const SnapshotDiff diff = diffSnapshots(*m_previous, current);
        const std::vector<ProcessId> reused = findReusedIds(*m_previous, current);

        std::set<ProcessId> stopped(diff.stopped.begin(), diff.stopped.end());
        std::set<ProcessId> started(diff.started.begin(), diff.started.end());
        stopped.insert(reused.begin(), reused.end());
        started.insert(reused.begin(), reused.end());

        for (ProcessId id : stopped) {
            handleStopped(m_previous->at(id));
        }
        for (ProcessId id : started) {
            handleStarted(current.at(id), windows, stopToken);
        }
    }

    if (m_context.config.procSnapshot) {
        writeSnapshot(current, windows);
    }

    m_previous = std::move(current);
    m_previousWindows = windows;
}

void ProcessMonitor::handleStarted(const ProcessRecord &record,
                                   const TopLevelWindowSet &windows,
                                   std::stop_token stopToken)
{
    const ClassifierVerdict verdict = m_classifier.classify(record, windows);
    if (verdict != ClassifierVerdict::Accept) {
        m_exeCache.erase(record.id);
        if (verdict == ClassifierVerdict::SuppressedChild) {
            m_suppressedChildren.insert(record.id);
        }
        ATLOG_DEBUG(QStringLiteral("ProcessMonitor"),
                    QStringLiteral("ProcessMonitor::handleStarted"),
                    QStringLiteral("start_filtered"),
                    QString::fromStdString(toVerdictString(verdict)),
                    QStringLiteral("classifier"),
                    apptrail::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"pid", record.id}, {"name", record.name}}));
        return;
    }

    std::optional<std::string> exe = record.executablePath;
    if (!exe) {
        const auto path = m_context.processes.executablePath(record.id);
        if (path.isOk()) {
            exe = path.value;
        }
    }
    if (exe) {
        m_exeCache[record.id] = *exe;
    }

    std::vector<EventField> fields{
        {"pid", std::to_string(record.id)},
        {"name", record.name},
        {"exe", exe},
        {"user", record.owner},
        {"started_at", toLocalIso(record.createdAt)},
    };

    if (isKnownBrowser(record.name)) {
        // A freshly launched browser maps its first window a moment later.
        if (waitUnlessStopped(stopToken, m_context.config.browserTitleWait)) {
            const auto title = windowTitleForPid(m_context.windows.topLevelWindows(), record.id);
            if (title) {
                fields.push_back({"page", stripBrowserSuffix(*title)});
                fields.push_back({"title", title});
            }
        }
    }

    write(EventType::ProcStart, std::move(fields));
}

void ProcessMonitor::handleStopped(const ProcessRecord &record)
{
    if (m_suppressedChildren.contains(record.id)) {
        forget(record.id);
        return;
    }

    const ClassifierVerdict verdict = m_classifier.classifyExited(record, m_previousWindows);
    if (verdict != ClassifierVerdict::Accept) {
        forget(record.id);
        return;
    }

    std::optional<std::string> exe = cachedExecutable(record.id);
    if (!exe) {
        exe = record.executablePath;
    }
    if (!exe) {
        const auto path = m_context.processes.executablePath(record.id);
        if (path.isOk()) {
            exe = path.value;
        }
    }

    write(EventType::ProcStop, {
        {"pid", std::to_string(record.id)},
        {"name", record.name},
        {"exe", exe},
        {"user", record.owner},
    });
    forget(record.id);
}

void ProcessMonitor::writeSnapshot(const Snapshot &snapshot, const TopLevelWindowSet &windows)
{
    std::vector<const ProcessRecord *> accepted;
    for (const auto &[id, record] : snapshot) {
        if (m_classifier.classify(record, windows) == ClassifierVerdict::Accept) {
            accepted.push_back(&record);
        }
    }

    write(EventType::Snapshot, {{"count", std::to_string(accepted.size())}});
    for (const ProcessRecord *record : accepted) {
        write(EventType::SnapshotEntry, {
            {"pid", std::to_string(record->id)},
            {"name", record->name},
            {"user", record->owner},
        });
    }
}

bool ProcessMonitor::run(std::stop_token stopToken)
{
    return runMonitorLoop(m_context, "process",
                          {{"interval", formatSeconds(m_context.config.interval)},
                           {"gui_only", std::string(m_context.config.guiOnly ? "1" : "0")},
                           {"include_system",
                            std::string(m_context.config.includeSystem ? "1" : "0")}},
                          stopToken,
                          [this, stopToken] { pollOnce(stopToken); });
}

} // namespace apptrail
