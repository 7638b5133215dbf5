#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>
#include <map>
#include <memory>
#include <mutex>

namespace apptrail::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;
// Open diagnostic files keyed by path, guarded by g_logMutex.
std::map<QString, std::unique_ptr<QFile>> g_openFiles;

thread_local QString t_monitor;
thread_local QString t_runId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QFile *openFor(const QString &path)
{
    auto it = g_openFiles.find(path);
    if (it != g_openFiles.end() && it->second->isOpen()) {
        return it->second.get();
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return nullptr;
    }
    QFile *raw = file.get();
    g_openFiles[path] = std::move(file);
    return raw;
}

// Keeps one previous generation as <path>.1.
void rollOver(const QString &path)
{
    auto it = g_openFiles.find(path);
    if (it != g_openFiles.end()) {
        it->second->close();
        g_openFiles.erase(it);
    }
    const QString previous = path + QStringLiteral(".1");
    QFile::remove(previous);
    QFile::rename(path, previous);
}

void writeLine(const QString &path, const QByteArray &line)
{
    QFile *file = openFor(path);
    if (file && file->size() >= kMaxLogSizeBytes) {
        rollOver(path);
        file = openFor(path);
    }
    if (!file) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    if (file->write(line) < 0 || file->write("\n", 1) < 0 || !file->flush()) {
        std::fprintf(stderr, "%s\n", line.constData());
    }
}

} // namespace

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("APPTRAIL_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/apptrail/logs");
    }
    return home + QStringLiteral("/.local/share/apptrail/logs");
}

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_openFiles.clear();
    g_processName = processName;
    g_traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_traceEnabled;
}

MonitorScope::MonitorScope(const QString &monitorName, const QString &runId)
    : m_prevMonitor(t_monitor)
    , m_prevRunId(t_runId)
{
    t_monitor = monitorName;
    t_runId = runId;
}

MonitorScope::~MonitorScope()
{
    t_monitor = m_prevMonitor;
    t_runId = m_prevRunId;
}

QString currentMonitor()
{
    return t_monitor;
}

QString currentRunId()
{
    return t_runId;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("apptrail");
}

QString defaultWho()
{
    static const QString who = [] {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", processName.toStdString()},
        {"thread", t_monitor.isEmpty() ? std::string("main") : t_monitor.toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_runId : correlationId).toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(payload.dump());

    std::lock_guard<std::mutex> lock(g_logMutex);
    const QString base = logsDirPath() + QDir::separator()
        + (processName.isEmpty() ? QStringLiteral("apptrail") : processName);
    if (level != LogLevel::Debug || g_traceEnabled) {
        writeLine(base + QStringLiteral(".log"), line);
    }
    if (g_traceEnabled) {
        writeLine(base + QStringLiteral("-trace.log"), line);
    }
}

} // namespace apptrail::logging
