#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <QFile>
#include <QString>
#include <QStringList>

#include "common/enums.hpp"
#include "common/models.hpp"
#include "daemon/segment_sink.hpp"

namespace apptrail {

// Destination of monitor events. Implementations must accept concurrent
// append() calls from several monitor threads.
class EventWriter
{
public:
    virtual ~EventWriter() = default;

    virtual void append(const MonitorEvent &event) = 0;
};

struct RotationOptions {
    RotationTrigger trigger = RotationTrigger::Size;
    std::int64_t maxBytes = 1000000;
    int backupCount = 5;
    bool compress = true;
};

/**
 * RotatingEventLog owns the live segment of the event log.
 *
 * Every append clamps the timestamp so the log never goes backwards,
 * serializes the event, rotates if due and writes the line, all under one
 * mutex. A closed segment is either kept as a numbered/hour-stamped backup or
 * compressed and handed to the sink; archives the sink refused stay next to
 * the log until retryPendingArchives() succeeds.
 *
 * Write failures on the live segment throw std::runtime_error.
 */
class RotatingEventLog : public EventWriter
{
public:
    RotatingEventLog(QString path,
                     RotationOptions options,
                     LineFormat format = LineFormat::Text,
                     std::shared_ptr<SegmentSink> sink = nullptr);
    ~RotatingEventLog() override;

    RotatingEventLog(const RotatingEventLog &) = delete;
    RotatingEventLog &operator=(const RotatingEventLog &) = delete;

    void append(const MonitorEvent &event) override;

    // Appends a preformatted line, checking rotation against the current time.
    void appendLine(const std::string &line);

    // Compresses closed segments left uncompressed and re-offers every
    // pending archive to the sink. Returns the number stored.
    int retryPendingArchives();

    // Archives waiting next to the log (compressed or not).
    QStringList pendingArchives() const;

    void setConsoleEcho(bool enabled);

    QString path() const;

private:
    void writeLocked(std::chrono::system_clock::time_point timestamp, const std::string &line);
    void openLocked();
    bool rotationDueLocked(std::chrono::system_clock::time_point timestamp, qint64 lineBytes) const;
    void rotateLocked();
    void rotateNumbered();
    void rotateHourStamped();
    void archiveCompressed();
    bool offerToSink(const QString &archive);
    QString uniqueArchiveName(const QString &base) const;
    void pruneHourStamped();

    QString m_path;
    RotationOptions m_options;
    LineFormat m_format;
    std::shared_ptr<SegmentSink> m_sink;
    bool m_echo = false;

    mutable std::mutex m_mutex;
    QFile m_file;
    std::optional<std::chrono::system_clock::time_point> m_lastTimestamp;
    std::optional<std::chrono::system_clock::time_point> m_segmentHour;
};

} // namespace apptrail
