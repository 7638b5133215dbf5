#include "daemon/event_log.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

#include "common/json_utils.hpp"
#include "common/log_line.hpp"
#include "common/logging.hpp"
#include "daemon/segment_compressor.hpp"

namespace apptrail {

namespace {

// <log>.<yyyy-MM-dd_HH-mm-ss>[-n][.gz]: closed segments awaiting compression or the sink.
QRegularExpression pendingPattern(const QString &baseName)
{
    return QRegularExpression(QStringLiteral("^%1\\.\\d{4}-\\d{2}-\\d{2}_\\d{2}-\\d{2}-\\d{2}(-\\d+)?(\\.gz)?$")
                                  .arg(QRegularExpression::escape(baseName)));
}

// <log>.<yyyy-MM-dd_HH>[-n]: uncompressed hourly backups.
QRegularExpression hourStampedPattern(const QString &baseName)
{
    return QRegularExpression(QStringLiteral("^%1\\.\\d{4}-\\d{2}-\\d{2}_\\d{2}(-\\d+)?$")
                                  .arg(QRegularExpression::escape(baseName)));
}

QStringList matchingSiblings(const QString &path, const QRegularExpression &pattern)
{
    const QFileInfo info(path);
    QDir dir = info.absoluteDir();
    QStringList matches;
    for (const QString &name : dir.entryList(QDir::Files, QDir::Name)) {
        if (pattern.match(name).hasMatch()) {
            matches << dir.filePath(name);
        }
    }
    return matches;
}

std::chrono::system_clock::time_point toTimePoint(const QDateTime &dateTime)
{
    return std::chrono::system_clock::time_point(
        std::chrono::milliseconds(dateTime.toMSecsSinceEpoch()));
}

void logRotationProblem(const QString &what, const QString &path, const QString &detail)
{
    ATLOG_WARN(QStringLiteral("RotatingEventLog"),
               QStringLiteral("RotatingEventLog::rotate"),
               what,
               detail,
               QStringLiteral("rotation"),
               apptrail::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.toStdString()}}));
}

} // namespace

RotatingEventLog::RotatingEventLog(QString path,
                                   RotationOptions options,
                                   LineFormat format,
                                   std::shared_ptr<SegmentSink> sink)
    : m_path(std::move(path))
    , m_options(options)
    , m_format(format)
    , m_sink(std::move(sink))
{
}

RotatingEventLog::~RotatingEventLog()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.isOpen()) {
        m_file.close();
    }
}

QString RotatingEventLog::path() const
{
    return m_path;
}

void RotatingEventLog::setConsoleEcho(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_echo = enabled;
}

void RotatingEventLog::append(const MonitorEvent &event)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    MonitorEvent clamped = event;
    if (m_lastTimestamp && clamped.timestamp < *m_lastTimestamp) {
        clamped.timestamp = *m_lastTimestamp;
    }
    writeLocked(clamped.timestamp, formatEventLine(clamped, m_format));
    m_lastTimestamp = clamped.timestamp;
}

void RotatingEventLog::appendLine(const std::string &line)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto timestamp = std::chrono::system_clock::now();
    if (m_lastTimestamp) {
        timestamp = std::max(timestamp, *m_lastTimestamp);
    }
    writeLocked(timestamp, line);
    m_lastTimestamp = timestamp;
}

void RotatingEventLog::openLocked()
{
    const QFileInfo info(m_path);
    if (!QDir().mkpath(info.absolutePath())) {
        throw std::runtime_error("cannot create directory for " + m_path.toStdString());
    }

    m_file.setFileName(m_path);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        throw std::runtime_error("cannot open event log " + m_path.toStdString() + ": "
                                 + m_file.errorString().toStdString());
    }

    // A segment left by a previous run belongs to the hour it was last written in.
    if (!m_segmentHour && m_file.size() > 0) {
        m_segmentHour = floorToLocalHour(toTimePoint(QFileInfo(m_path).lastModified()));
    }
}

bool RotatingEventLog::rotationDueLocked(std::chrono::system_clock::time_point timestamp,
                                         qint64 lineBytes) const
{
    if (m_file.size() == 0) {
        return false;
    }
    switch (m_options.trigger) {
    case RotationTrigger::Size:
        return m_file.size() + lineBytes > m_options.maxBytes;
    case RotationTrigger::Hourly:
        return m_segmentHour.has_value() && floorToLocalHour(timestamp) != *m_segmentHour;
    case RotationTrigger::None:
        return false;
    }
    return false;
}

void RotatingEventLog::writeLocked(std::chrono::system_clock::time_point timestamp,
                                   const std::string &line)
{
    if (!m_file.isOpen()) {
        openLocked();
    }

    QByteArray bytes = QByteArray::fromStdString(line);
    bytes.append('\n');

    if (rotationDueLocked(timestamp, bytes.size())) {
        rotateLocked();
        if (!m_file.isOpen()) {
            openLocked();
        }
    }
    if (!m_segmentHour) {
        m_segmentHour = floorToLocalHour(timestamp);
    }

    if (m_file.write(bytes) != bytes.size() || !m_file.flush()) {
        throw std::runtime_error("write to event log " + m_path.toStdString() + " failed: "
                                 + m_file.errorString().toStdString());
    }

    if (m_echo) {
        fputs(bytes.constData(), stdout);
        fflush(stdout);
    }
}

void RotatingEventLog::rotateLocked()
{
    m_file.close();

    if (m_options.compress) {
        archiveCompressed();
    } else if (m_options.trigger == RotationTrigger::Hourly) {
        rotateHourStamped();
    } else {
        rotateNumbered();
    }
    m_segmentHour.reset();
}

void RotatingEventLog::rotateNumbered()
{
    if (m_options.backupCount <= 0) {
        QFile::remove(m_path);
        return;
    }

    QFile::remove(QStringLiteral("%1.%2").arg(m_path).arg(m_options.backupCount));
    for (int i = m_options.backupCount - 1; i >= 1; --i) {
        const QString from = QStringLiteral("%1.%2").arg(m_path).arg(i);
        if (QFile::exists(from)) {
            QFile::rename(from, QStringLiteral("%1.%2").arg(m_path).arg(i + 1));
        }
    }
    if (!QFile::rename(m_path, m_path + QStringLiteral(".1"))) {
        logRotationProblem(QStringLiteral("rotate_rename_failed"), m_path,
                           QStringLiteral("numbered_backup"));
    }
}

void RotatingEventLog::rotateHourStamped()
{
    const auto hour = m_segmentHour.value_or(floorToLocalHour(std::chrono::system_clock::now()));
    const QString target = uniqueArchiveName(
        m_path + QStringLiteral(".") + QString::fromStdString(formatLocal(hour, "%Y-%m-%d_%H")));
    if (!QFile::rename(m_path, target)) {
        logRotationProblem(QStringLiteral("rotate_rename_failed"), m_path,
                           QStringLiteral("hourly_backup"));
        return;
    }
    pruneHourStamped();
}

void RotatingEventLog::pruneHourStamped()
{
    QStringList backups = matchingSiblings(m_path, hourStampedPattern(QFileInfo(m_path).fileName()));
    const int keep = std::max(0, m_options.backupCount);
    // Names sort chronologically.
    while (backups.size() > keep) {
        QFile::remove(backups.takeFirst());
    }
}

QString RotatingEventLog::uniqueArchiveName(const QString &base) const
{
    QString candidate = base;
    for (int n = 1; QFile::exists(candidate) || QFile::exists(candidate + QStringLiteral(".gz")); ++n) {
        candidate = QStringLiteral("%1-%2").arg(base).arg(n);
    }
    return candidate;
}

void RotatingEventLog::archiveCompressed()
{
    const auto stampTime = m_lastTimestamp.value_or(std::chrono::system_clock::now());
    const QString closed = uniqueArchiveName(
        m_path + QStringLiteral(".")
        + QString::fromStdString(formatLocal(stampTime, "%Y-%m-%d_%H-%M-%S")));
    if (!QFile::rename(m_path, closed)) {
        // Keep appending to the same segment; the next write retries the rotation.
        logRotationProblem(QStringLiteral("rotate_rename_failed"), m_path,
                           QStringLiteral("compressed_archive"));
        return;
    }

    const QString archive = closed + QStringLiteral(".gz");
    QString error;
    if (!SegmentCompressor::compressFile(closed, archive, &error)) {
        // The uncompressed segment stays and is picked up by the startup sweep.
        logRotationProblem(QStringLiteral("compress_failed"), closed, error);
        return;
    }
    QFile::remove(closed);

    ATLOG_INFO(QStringLiteral("RotatingEventLog"),
               QStringLiteral("RotatingEventLog::archiveCompressed"),
               QStringLiteral("segment_rotated"),
               QString::fromStdString(toRotationString(m_options.trigger)),
               QStringLiteral("gzip"),
               apptrail::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"archive", archive.toStdString()}}));

    offerToSink(archive);
}

bool RotatingEventLog::offerToSink(const QString &archive)
{
    if (!m_sink) {
        return false;
    }
    if (!m_sink->store(archive)) {
        logRotationProblem(QStringLiteral("sink_rejected_segment"), archive,
                           QStringLiteral("kept_for_retry"));
        return false;
    }
    QFile::remove(archive);
    return true;
}

QStringList RotatingEventLog::pendingArchives() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return matchingSiblings(m_path, pendingPattern(QFileInfo(m_path).fileName()));
}

int RotatingEventLog::retryPendingArchives()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    int stored = 0;
    for (const QString &pending : matchingSiblings(m_path, pendingPattern(QFileInfo(m_path).fileName()))) {
        QString archive = pending;
        if (!pending.endsWith(QStringLiteral(".gz"))) {
            archive = pending + QStringLiteral(".gz");
            if (QFile::exists(archive)) {
                // Compressed before a crash but the original was never removed.
                QFile::remove(pending);
                continue;
            }
            QString error;
            if (!SegmentCompressor::compressFile(pending, archive, &error)) {
                logRotationProblem(QStringLiteral("compress_failed"), pending, error);
                continue;
            }
            QFile::remove(pending);
        }
        if (offerToSink(archive)) {
            ++stored;
        }
    }

    if (stored > 0) {
        ATLOG_INFO(QStringLiteral("RotatingEventLog"),
                   QStringLiteral("RotatingEventLog::retryPendingArchives"),
                   QStringLiteral("pending_archives_stored"),
                   QStringLiteral("startup_sweep"),
                   QStringLiteral("sink_store"),
                   apptrail::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"count", stored}}));
    }
    return stored;
}

} // namespace apptrail
