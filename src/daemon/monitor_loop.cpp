#include "daemon/monitor_loop.hpp"

#include <QDateTime>
#include <QString>

#include "common/logging.hpp"

namespace apptrail {

namespace {

void writeMarker(EventWriter &writer, EventType type, EventLevel level,
                 std::vector<EventField> fields)
{
    MonitorEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.level = level;
    event.type = type;
    event.fields = std::move(fields);
    writer.append(event);
}

} // namespace

std::string formatSeconds(std::chrono::milliseconds duration)
{
    return QString::number(static_cast<double>(duration.count()) / 1000.0).toStdString();
}

bool runMonitorLoop(MonitorContext &context,
                    const std::string &monitorName,
                    std::vector<EventField> startFields,
                    std::stop_token stopToken,
                    const std::function<void()> &poll)
{
    const QString component = QString::fromStdString(monitorName);
    const logging::MonitorScope scope(
        component,
        QStringLiteral("%1-%2").arg(component).arg(QDateTime::currentMSecsSinceEpoch()));
    try {
        std::vector<EventField> fields{{"monitor", monitorName}};
        fields.insert(fields.end(), startFields.begin(), startFields.end());
        writeMarker(context.writer, EventType::MonitorStart, EventLevel::Info, std::move(fields));

        ATLOG_INFO(component,
                   QStringLiteral("runMonitorLoop"),
                   QStringLiteral("monitor_started"),
                   QStringLiteral("daemon_start"),
                   QStringLiteral("polling_loop"),
                   apptrail::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"interval_ms", context.config.interval.count()}}));

        while (!stopToken.stop_requested()) {
            poll();
            if (!waitUnlessStopped(stopToken, context.config.interval)) {
                break;
            }
        }

        writeMarker(context.writer, EventType::MonitorStop, EventLevel::Info,
                    {{"monitor", monitorName}, {"reason", std::string("interrupt")}});
        ATLOG_INFO(component,
                   QStringLiteral("runMonitorLoop"),
                   QStringLiteral("monitor_stopped"),
                   QStringLiteral("interrupt"),
                   QStringLiteral("stop_token"),
                   apptrail::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return true;
    } catch (const std::exception &ex) {
        ATLOG_ERROR(component,
                    QStringLiteral("runMonitorLoop"),
                    QStringLiteral("monitor_crashed"),
                    QString::fromUtf8(ex.what()),
                    QStringLiteral("polling_loop"),
                    apptrail::logging::defaultWho(),
                    QString(),
                    nlohmann::json::object());
        try {
            writeMarker(context.writer, EventType::MonitorCrash, EventLevel::Error,
                        {{"monitor", monitorName}, {"cause", std::string(ex.what())}});
        } catch (const std::exception &markerError) {
            // The event log itself is failing; the diagnostic log is all that is left.
            ATLOG_ERROR(component,
                        QStringLiteral("runMonitorLoop"),
                        QStringLiteral("crash_marker_failed"),
                        QString::fromUtf8(markerError.what()),
                        QStringLiteral("event_log"),
                        apptrail::logging::defaultWho(),
                        QString(),
                        nlohmann::json::object());
        }
        return false;
    }
}

} // namespace apptrail
