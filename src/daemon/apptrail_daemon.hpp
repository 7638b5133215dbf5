#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include <QObject>

#include "daemon/active_window_tracker.hpp"
#include "daemon/event_log.hpp"
#include "daemon/monitor_config.hpp"
#include "daemon/process_monitor.hpp"
#include "daemon/process_table.hpp"
#include "daemon/window_system.hpp"

class QTimer;

namespace apptrail {

/**
 * AppTrailDaemon hosts the monitor loops:
 * - builds the event log, sink and OS adapters from MonitorConfig
 * - offers archives left by earlier runs to the sink
 * - runs one thread per monitor requested by the mode
 * - turns SIGINT/SIGTERM into a cooperative stop
 *
 * It is owned from main() and driven by Qt's event loop; finished() carries
 * the process exit code.
 */
class AppTrailDaemon : public QObject
{
    Q_OBJECT
public:
    explicit AppTrailDaemon(MonitorConfig config, QObject *parent = nullptr);
    AppTrailDaemon(MonitorConfig config,
                   std::unique_ptr<ProcessTable> processes,
                   std::unique_ptr<WindowSystem> windows,
                   std::unique_ptr<EventWriter> writer,
                   QObject *parent = nullptr);
    ~AppTrailDaemon() override;

    void start();

    // Stops every loop and waits for them to finish their current iteration.
    void requestStop();

    int runningLoops() const;

    // Routes SIGINT and SIGTERM to a flag polled by every daemon instance.
    static void installSignalHandlers();

signals:
    void finished(int exitCode);

private slots:
    void checkLoops();

private:
    void launch(std::function<bool(std::stop_token)> loop);

    MonitorConfig m_config;
    std::unique_ptr<ProcessTable> m_processes;
    std::unique_ptr<WindowSystem> m_windows;
    std::unique_ptr<EventWriter> m_writer;
    RotatingEventLog *m_eventLog = nullptr;

    std::unique_ptr<ActiveWindowTracker> m_tracker;
    std::unique_ptr<ProcessMonitor> m_monitor;
    std::vector<std::jthread> m_threads;
    std::atomic<int> m_running{0};
    std::atomic<int> m_crashed{0};
    bool m_finished = false;

    QTimer *m_timer = nullptr;
};

std::shared_ptr<SegmentSink> makeSegmentSink(const MonitorConfig &config);

} // namespace apptrail
