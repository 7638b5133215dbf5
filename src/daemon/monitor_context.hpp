#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

#include "daemon/event_log.hpp"
#include "daemon/monitor_config.hpp"
#include "daemon/process_table.hpp"
#include "daemon/window_system.hpp"

namespace apptrail {

// Everything a monitor loop needs, handed over explicitly instead of living in
// globals. The referenced objects outlive every loop started with it.
struct MonitorContext {
    const MonitorConfig &config;
    EventWriter &writer;
    ProcessTable &processes;
    WindowSystem &windows;
};

// Sleeps for duration unless stop is requested first. Returns false when the
// wait ended because of the stop request.
inline bool waitUnlessStopped(std::stop_token stopToken, std::chrono::milliseconds duration)
{
    if (stopToken.stop_requested()) {
        return false;
    }
    if (duration.count() <= 0) {
        return true;
    }
    std::mutex mutex;
    std::condition_variable_any wakeup;
    std::unique_lock<std::mutex> lock(mutex);
    wakeup.wait_for(lock, stopToken, duration, [] { return false; });
    return !stopToken.stop_requested();
}

} // namespace apptrail
