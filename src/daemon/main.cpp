#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/apptrail_daemon.hpp"
#include "daemon/monitor_config.hpp"
#include "daemon/procfs_process_table.hpp"

namespace {

constexpr int kConfigErrorExitCode = 2;

int listProcessesOnce()
{
    apptrail::ProcfsProcessTable table;
    QTextStream out(stdout);
    for (const auto &[id, record] : table.snapshot()) {
        out << "PID: " << id << ", Name: " << QString::fromStdString(record.name) << '\n';
    }
    out.flush();
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("apptrail-daemon"));

    const apptrail::ConfigLoadResult loaded = apptrail::loadMonitorConfig(app.arguments());
    if (loaded.helpRequested) {
        QTextStream(stdout) << QString::fromStdString(loaded.helpText);
        return 0;
    }

    const apptrail::MonitorConfig &config = loaded.config;
    const bool trace = config.trace || qEnvironmentVariableIntValue("APPTRAIL_TRACE") == 1;
    apptrail::logging::initLogging(QStringLiteral("apptrail-daemon"), trace);

    for (const auto &warning : loaded.warnings) {
        qWarning().noquote() << "apptrail:" << QString::fromStdString(warning);
        ATLOG_WARN(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("config_warning"),
                   QString::fromStdString(warning),
                   QStringLiteral("loadMonitorConfig"),
                   apptrail::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    if (!loaded.errors.empty()) {
        for (const auto &error : loaded.errors) {
            qCritical().noquote() << "apptrail:" << QString::fromStdString(error);
            ATLOG_ERROR(QStringLiteral("main"),
                        QStringLiteral("main"),
                        QStringLiteral("config_error"),
                        QString::fromStdString(error),
                        QStringLiteral("loadMonitorConfig"),
                        apptrail::logging::defaultWho(),
                        QString(),
                        nlohmann::json::object());
        }
        return kConfigErrorExitCode;
    }

    if (config.listOnce) {
        return listProcessesOnce();
    }

    apptrail::AppTrailDaemon::installSignalHandlers();

    apptrail::AppTrailDaemon daemon(config);
    QObject::connect(&daemon, &apptrail::AppTrailDaemon::finished, &app, &QCoreApplication::exit,
                     Qt::QueuedConnection);
    daemon.start();

    return app.exec();
}
