#include "daemon/active_window_tracker.hpp"

#include "daemon/browser_names.hpp"
#include "daemon/monitor_loop.hpp"

namespace apptrail {

ActiveWindowTracker::ActiveWindowTracker(MonitorContext context)
    : m_context(context)
{
}

const std::optional<WindowObservation> &ActiveWindowTracker::lastObservation() const
{
    return m_lastObservation;
}

WindowObservation ActiveWindowTracker::observe()
{
    WindowObservation observation = m_context.windows.foregroundWindow();
    observation.processName.reset();
    if (observation.owningProcessId) {
        const auto name = m_context.processes.processName(*observation.owningProcessId);
        if (name.isOk()) {
            observation.processName = name.value;
        }
    }
    return observation;
}

MonitorEvent ActiveWindowTracker::buildEvent(EventType type,
                                             const WindowObservation &observation,
                                             std::chrono::system_clock::time_point now)
{
    MonitorEvent event;
    event.timestamp = now;
    event.type = type;

    std::optional<std::string> pid;
    std::optional<std::string> exe;
    if (observation.owningProcessId) {
        pid = std::to_string(*observation.owningProcessId);
        const auto path = m_context.processes.executablePath(*observation.owningProcessId);
        if (path.isOk()) {
            exe = path.value;
        }
    }

    event.fields.push_back({"pid", pid});
    event.fields.push_back({"name", observation.processName});
    event.fields.push_back({"exe", exe});
    if (observation.title && observation.processName
        && isKnownBrowser(*observation.processName)) {
        event.fields.push_back({"page", stripBrowserSuffix(*observation.title)});
    }
    event.fields.push_back({"title", observation.title});
    return event;
}

std::optional<EventType> ActiveWindowTracker::pollOnce(std::chrono::system_clock::time_point now)
{
    const WindowObservation observation = observe();

    std::optional<EventType> emitted;
    if (!m_lastObservation || observation != *m_lastObservation) {
        emitted = EventType::ActiveWindow;
    } else if (m_context.config.heartbeat.count() > 0 && m_lastEmission
               && now - *m_lastEmission >= m_context.config.heartbeat) {
        emitted = EventType::Heartbeat;
    }

    if (emitted) {
        m_context.writer.append(buildEvent(*emitted, observation, now));
        m_lastEmission = now;
    }
    m_lastObservation = observation;
    return emitted;
}

bool ActiveWindowTracker::run(std::stop_token stopToken)
{
    return runMonitorLoop(m_context, "active",
                          {{"interval", formatSeconds(m_context.config.interval)},
                           {"heartbeat", formatSeconds(m_context.config.heartbeat)}},
                          stopToken,
                          [this] { pollOnce(std::chrono::system_clock::now()); });
}

} // namespace apptrail
