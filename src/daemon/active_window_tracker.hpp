#pragma once

#include <chrono>
#include <optional>
#include <stop_token>

#include "common/models.hpp"
#include "daemon/monitor_context.hpp"

namespace apptrail {

/**
 * ActiveWindowTracker reports foreground window changes.
 *
 * A poll whose observation differs from the previous one emits active_window.
 * An unchanged observation emits heartbeat once the heartbeat interval has
 * passed since the last emitted event. Browser titles additionally carry the
 * page title with the browser suffix stripped.
 */
class ActiveWindowTracker
{
public:
    explicit ActiveWindowTracker(MonitorContext context);

    // Returns the type of the event written, if any.
    std::optional<EventType> pollOnce(std::chrono::system_clock::time_point now);

    // Polls until stop is requested. Returns false if the loop crashed.
    bool run(std::stop_token stopToken);

    const std::optional<WindowObservation> &lastObservation() const;

private:
    WindowObservation observe();
    MonitorEvent buildEvent(EventType type, const WindowObservation &observation,
                            std::chrono::system_clock::time_point now);

    MonitorContext m_context;
    std::optional<WindowObservation> m_lastObservation;
    std::optional<std::chrono::system_clock::time_point> m_lastEmission;
};

} // namespace apptrail
