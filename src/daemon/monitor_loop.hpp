#pragma once

#include <functional>
#include <stop_token>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/monitor_context.hpp"

namespace apptrail {

// Drives poll every config.interval until stop is requested, bracketed by
// monitor_start and monitor_stop markers. A std::exception escaping poll ends
// the loop with a monitor_crash marker instead of reaching the thread boundary.
// Returns true on a clean stop, false after a crash.
bool runMonitorLoop(MonitorContext &context,
                    const std::string &monitorName,
                    std::vector<EventField> startFields,
                    std::stop_token stopToken,
                    const std::function<void()> &poll);

std::string formatSeconds(std::chrono::milliseconds duration);

} // namespace apptrail
