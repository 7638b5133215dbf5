#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QTextStream>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "hourly/HourlyGrouper.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("apptrail-hourly"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Groups active-window lines of an event log by hour."));
    parser.addHelpOption();
    QCommandLineOption logfileOption(QStringList() << "logfile",
                                     "Input event log (plain or .gz).", "path",
                                     QStringLiteral("app-usage.log"));
    QCommandLineOption outOption(QStringList() << "out-log",
                                 "Output hourly grouped log.", "path",
                                 QStringLiteral("usage-hourly.log"));
    QCommandLineOption appendOption(QStringList() << "append",
                                    "Append only new completed hours using the state file.");
    QCommandLineOption stateOption(QStringList() << "state",
                                   "State file for append mode.", "path",
                                   QStringLiteral(".apptrail_hourly_state.json"));
    QCommandLineOption quietOption(QStringList() << "quiet", "Suppress console output.");
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose diagnostic trace logging.");
    parser.addOption(logfileOption);
    parser.addOption(outOption);
    parser.addOption(appendOption);
    parser.addOption(stateOption);
    parser.addOption(quietOption);
    parser.addOption(traceOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("APPTRAIL_TRACE") == 1;
    apptrail::logging::initLogging(QStringLiteral("apptrail-hourly"), trace);

    const QString logfile = parser.value(logfileOption);
    const QString outLog = parser.value(outOption);

    QString error;
    const auto lines = apptrail::HourlyGrouper::readLogLines(logfile, &error);
    if (!lines) {
        qCritical().noquote() << "apptrail-hourly:" << error;
        return 1;
    }
    const apptrail::HourGroups groups = apptrail::groupLinesByHour(*lines);

    QTextStream out(stdout);
    if (parser.isSet(appendOption)) {
        const QString statePath = parser.value(stateOption);
        apptrail::ReplayState state = apptrail::HourlyGrouper::loadState(statePath);
        const auto written = apptrail::HourlyGrouper::appendNewHours(
            groups, outLog, state, std::chrono::system_clock::now(), &error);
        if (!written) {
            qCritical().noquote() << "apptrail-hourly:" << error;
            return 1;
        }
        if (*written > 0 && !apptrail::HourlyGrouper::saveState(statePath, state, &error)) {
            qCritical().noquote() << "apptrail-hourly:" << error;
            return 1;
        }
        ATLOG_INFO(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("hours_appended"),
                   QStringLiteral("append_mode"),
                   QStringLiteral("HourlyGrouper::appendNewHours"),
                   apptrail::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"count", *written}, {"out", outLog.toStdString()}}));
        if (!parser.isSet(quietOption)) {
            out << "Appended " << *written << " hour(s) to " << outLog << '\n';
        }
        return 0;
    }

    if (!apptrail::HourlyGrouper::writeHourlyLog(groups, outLog, &error)) {
        qCritical().noquote() << "apptrail-hourly:" << error;
        return 1;
    }
    if (!parser.isSet(quietOption)) {
        out << "Wrote hourly log to " << outLog << '\n';
    }
    return 0;
}
