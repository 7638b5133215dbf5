#include "daemon/apptrail_daemon.hpp"

#include <csignal>

#include <QDebug>
#include <QTimer>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/procfs_process_table.hpp"
#include "daemon/x11_window_system.hpp"

namespace apptrail {

namespace {

constexpr int kLivenessIntervalMs = 200;

volatile std::sig_atomic_t g_stopSignal = 0;

void handleStopSignal(int)
{
    g_stopSignal = 1;
}

std::unique_ptr<EventWriter> makeEventLog(const MonitorConfig &config)
{
    RotationOptions rotation;
    rotation.trigger = config.rotation;
    rotation.maxBytes = config.maxBytes;
    rotation.backupCount = config.backupCount;
    rotation.compress = config.compress;

    auto log = std::make_unique<RotatingEventLog>(QString::fromStdString(config.logfile),
                                                  rotation, config.lineFormat,
                                                  makeSegmentSink(config));
    log->setConsoleEcho(config.echo);
    return log;
}

} // namespace

std::shared_ptr<SegmentSink> makeSegmentSink(const MonitorConfig &config)
{
    if (config.sink == SinkKind::Directory && !config.archiveDir.empty()) {
        return std::make_shared<DirectorySink>(QString::fromStdString(config.archiveDir));
    }
    return nullptr;
}

void AppTrailDaemon::installSignalHandlers()
{
    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);
}

AppTrailDaemon::AppTrailDaemon(MonitorConfig config, QObject *parent)
    : AppTrailDaemon(config,
                     std::make_unique<ProcfsProcessTable>(),
                     std::make_unique<X11WindowSystem>(),
                     makeEventLog(config),
                     parent)
{
}

AppTrailDaemon::AppTrailDaemon(MonitorConfig config,
                               std::unique_ptr<ProcessTable> processes,
                               std::unique_ptr<WindowSystem> windows,
                               std::unique_ptr<EventWriter> writer,
                               QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_processes(std::move(processes))
    , m_windows(std::move(windows))
    , m_writer(std::move(writer))
{
    m_eventLog = dynamic_cast<RotatingEventLog *>(m_writer.get());

    const MonitorContext context{m_config, *m_writer, *m_processes, *m_windows};
    if (m_config.mode == MonitorMode::Active || m_config.mode == MonitorMode::Both) {
        m_tracker = std::make_unique<ActiveWindowTracker>(context);
    }
    if (m_config.mode == MonitorMode::Process || m_config.mode == MonitorMode::Both) {
        m_monitor = std::make_unique<ProcessMonitor>(context);
    }
}

AppTrailDaemon::~AppTrailDaemon()
{
    requestStop();
}

int AppTrailDaemon::runningLoops() const
{
    return m_running.load();
}

void AppTrailDaemon::start()
{
    qInfo() << "apptrail: monitoring" << QString::fromStdString(toModeString(m_config.mode))
            << "into" << QString::fromStdString(m_config.logfile);

    ATLOG_INFO(QStringLiteral("AppTrailDaemon"),
               QStringLiteral("AppTrailDaemon::start"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("config"),
               apptrail::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"mode", toModeString(m_config.mode)},
                               {"logfile", m_config.logfile},
                               {"rotation", toRotationString(m_config.rotation)},
                               {"interval_ms", m_config.interval.count()}}));

    if (m_eventLog) {
        const int stored = m_eventLog->retryPendingArchives();
        if (stored > 0) {
            qInfo() << "apptrail: stored" << stored << "pending archive(s)";
        }
    }

    if (m_tracker) {
        launch([this](std::stop_token stopToken) { return m_tracker->run(stopToken); });
    }
    if (m_monitor) {
        launch([this](std::stop_token stopToken) { return m_monitor->run(stopToken); });
    }

    m_timer = new QTimer(this);
    m_timer->setInterval(kLivenessIntervalMs);
    connect(m_timer, &QTimer::timeout, this, &AppTrailDaemon::checkLoops);
    m_timer->start();
}

void AppTrailDaemon::launch(std::function<bool(std::stop_token)> loop)
{
    ++m_running;
    m_threads.emplace_back([this, loop = std::move(loop)](std::stop_token stopToken) {
        if (!loop(stopToken)) {
            ++m_crashed;
        }
        --m_running;
    });
}

void AppTrailDaemon::requestStop()
{
    for (auto &thread : m_threads) {
        thread.request_stop();
    }
    for (auto &thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_threads.clear();
}

void AppTrailDaemon::checkLoops()
{
    if (m_finished) {
        return;
    }

    if (g_stopSignal) {
        qInfo() << "apptrail: stop requested, finishing current poll";
        requestStop();
        m_finished = true;
        m_timer->stop();
        emit finished(m_crashed.load() > 0 ? 1 : 0);
        return;
    }

    if (m_running.load() == 0) {
        qWarning() << "apptrail: no monitor loop is running anymore";
        ATLOG_ERROR(QStringLiteral("AppTrailDaemon"),
                    QStringLiteral("AppTrailDaemon::checkLoops"),
                    QStringLiteral("all_loops_ended"),
                    QStringLiteral("monitor_crash"),
                    QStringLiteral("liveness_timer"),
                    apptrail::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"crashed", m_crashed.load()}}));
        requestStop();
        m_finished = true;
        m_timer->stop();
        emit finished(1);
    }
}

} // namespace apptrail
