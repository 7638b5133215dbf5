#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <memory>
#include <set>
#include <thread>

#include "common/json_utils.hpp"
#include "common/log_line.hpp"
#include "daemon/event_log.hpp"
#include "daemon/segment_compressor.hpp"
#include "daemon/segment_sink.hpp"
#include "fakes.hpp"

using apptrail::EventType;
using apptrail::MonitorEvent;
using apptrail::RotatingEventLog;
using apptrail::RotationOptions;
using apptrail::RotationTrigger;

namespace {

const auto kStart = std::chrono::system_clock::time_point(std::chrono::seconds(1761766387));

MonitorEvent sequencedEvent(int sequence, std::chrono::system_clock::time_point timestamp)
{
    MonitorEvent event;
    event.timestamp = timestamp;
    event.type = EventType::ActiveWindow;
    event.fields = {{"pid", std::to_string(1000 + sequence)},
                    {"name", std::string("editor")},
                    {"seq", std::to_string(sequence)},
                    {"title", std::string("document ") + std::to_string(sequence)}};
    return event;
}

QStringList readLines(const QByteArray &content)
{
    QStringList lines;
    for (const QByteArray &line : content.split('\n')) {
        if (!line.isEmpty()) {
            lines << QString::fromUtf8(line);
        }
    }
    return lines;
}

QStringList readPlainFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return readLines(file.readAll());
}

int sequenceOf(const QString &line)
{
    const auto parsed = apptrail::parseLogLine(line.toStdString());
    if (!parsed || !parsed->fields.contains("seq") || !parsed->fields.at("seq")) {
        return -1;
    }
    return std::stoi(*parsed->fields.at("seq"));
}

} // namespace

class EventLogTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testAppendWritesFormattedLine();
    void testJsonLineFormat();
    void testSizeRotationLosesNothing();
    void testSinkFailureKeepsArchiveForRetry();
    void testRetryCompressesLeftoverSegment();
    void testNumberedBackups();
    void testHourlyRotation();
    void testTimestampsNeverGoBackwards();
    void testConcurrentAppends();
    void testDirectorySinkIsIdempotent();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QString m_caseDir;
    int m_caseIndex = 0;

    QString logPath() const;
};

void EventLogTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void EventLogTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void EventLogTests::init()
{
    m_caseDir = m_tempDir.filePath(QStringLiteral("case%1").arg(++m_caseIndex));
    QVERIFY(QDir().mkpath(m_caseDir));
}

QString EventLogTests::logPath() const
{
    return QDir(m_caseDir).filePath(QStringLiteral("app-usage.log"));
}

void EventLogTests::testAppendWritesFormattedLine()
{
    RotatingEventLog log(logPath(), RotationOptions{RotationTrigger::None, 0, 0, false});
    MonitorEvent event;
    event.timestamp = kStart;
    event.type = EventType::ProcStart;
    event.fields = {{"pid", std::string("42")}, {"name", std::string("my app")},
                    {"exe", std::nullopt}};
    log.append(event);

    const QStringList lines = readPlainFile(logPath());
    QCOMPARE(lines.size(), qsizetype(1));
    const QString expected = QString::fromStdString(apptrail::toLocalTimestamp(kStart))
        + QStringLiteral(" | INFO | proc_start pid=42 name=my\\sapp exe=?");
    QCOMPARE(lines.front(), expected);
}

void EventLogTests::testJsonLineFormat()
{
    RotatingEventLog log(logPath(), RotationOptions{RotationTrigger::None, 0, 0, false},
                         apptrail::LineFormat::Json);
    MonitorEvent event;
    event.timestamp = kStart;
    event.type = EventType::ActiveWindow;
    event.fields = {{"pid", std::string("7")}, {"page", std::string("Example")},
                    {"title", std::string("Example - Google Chrome")}, {"exe", std::nullopt}};
    log.append(event);

    const QStringList lines = readPlainFile(logPath());
    QCOMPARE(lines.size(), qsizetype(1));
    const int jsonStart = lines.front().indexOf('{');
    QVERIFY(jsonStart > 0);
    const auto json = nlohmann::json::parse(lines.front().mid(jsonStart).toStdString());
    QCOMPARE(QString::fromStdString(json.at("event_type").get<std::string>()),
             QStringLiteral("active_window"));
    QCOMPARE(QString::fromStdString(json.at("page_title").get<std::string>()),
             QStringLiteral("Example"));
    QCOMPARE(QString::fromStdString(json.at("window_title").get<std::string>()),
             QStringLiteral("Example - Google Chrome"));
    QVERIFY(json.at("exe").is_null());
}

void EventLogTests::testSizeRotationLosesNothing()
{
    const QString archiveDir = QDir(m_caseDir).filePath(QStringLiteral("archive"));
    auto sink = std::make_shared<apptrail::DirectorySink>(archiveDir);
    RotatingEventLog log(logPath(), RotationOptions{RotationTrigger::Size, 600, 5, true},
                         apptrail::LineFormat::Text, sink);

    constexpr int kEvents = 100;
    for (int i = 0; i < kEvents; ++i) {
        log.append(sequencedEvent(i, kStart + std::chrono::seconds(i)));
    }

    QVERIFY(log.pendingArchives().isEmpty());

    QStringList all = readPlainFile(logPath());
    const QStringList archives = QDir(archiveDir).entryList(QStringList() << "*.gz", QDir::Files);
    QVERIFY(archives.size() > 1);
    for (const QString &name : archives) {
        const auto content = apptrail::SegmentCompressor::readCompressedFile(
            QDir(archiveDir).filePath(name));
        QVERIFY(content.has_value());
        QVERIFY(content->size() <= 600);
        all << readLines(*content);
    }

    std::set<int> seen;
    for (const QString &line : all) {
        const int sequence = sequenceOf(line);
        QVERIFY(sequence >= 0);
        QVERIFY2(seen.insert(sequence).second, "duplicated line across segments");
    }
    QCOMPARE(static_cast<int>(seen.size()), kEvents);
    QCOMPARE(*seen.begin(), 0);
    QCOMPARE(*seen.rbegin(), kEvents - 1);
}

void EventLogTests::testSinkFailureKeepsArchiveForRetry()
{
    auto sink = std::make_shared<apptrail::testing::RecordingSink>();
    sink->accept = false;
    {
        RotatingEventLog log(logPath(), RotationOptions{RotationTrigger::Size, 200, 5, true},
                             apptrail::LineFormat::Text, sink);
        for (int i = 0; i < 10; ++i) {
            log.append(sequencedEvent(i, kStart + std::chrono::seconds(i)));
        }
        QVERIFY(!sink->offered.isEmpty());
        const QStringList pending = log.pendingArchives();
        QCOMPARE(pending.size(), sink->offered.size());
        for (const QString &path : pending) {
            QVERIFY(path.endsWith(QStringLiteral(".gz")));
        }
    }

    // Next start: the sink works again.
    sink->accept = true;
    sink->offered.clear();
    RotatingEventLog restarted(logPath(), RotationOptions{RotationTrigger::Size, 200, 5, true},
                               apptrail::LineFormat::Text, sink);
    const int stored = restarted.retryPendingArchives();
    QVERIFY(stored > 0);
    QCOMPARE(qsizetype(stored), sink->offered.size());
    QVERIFY(restarted.pendingArchives().isEmpty());
}

void EventLogTests::testRetryCompressesLeftoverSegment()
{
    const QString leftover = logPath() + QStringLiteral(".2025-10-29_19-00-00");
    QFile file(leftover);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("2025-10-29 19:00:00 | INFO | heartbeat pid=1\n");
    file.close();

    auto sink = std::make_shared<apptrail::testing::RecordingSink>();
    RotatingEventLog log(logPath(), RotationOptions{}, apptrail::LineFormat::Text, sink);
    QCOMPARE(log.retryPendingArchives(), 1);
    QCOMPARE(sink->offered.size(), qsizetype(1));
    QCOMPARE(sink->offered.front(), leftover + QStringLiteral(".gz"));
    QVERIFY(!QFile::exists(leftover));
}

void EventLogTests::testNumberedBackups()
{
    RotatingEventLog log(logPath(), RotationOptions{RotationTrigger::Size, 150, 2, false});
    for (int i = 0; i < 20; ++i) {
        log.append(sequencedEvent(i, kStart));
    }

    QVERIFY(QFile::exists(logPath() + QStringLiteral(".1")));
    QVERIFY(QFile::exists(logPath() + QStringLiteral(".2")));
    QVERIFY(!QFile::exists(logPath() + QStringLiteral(".3")));

    // The newest backup directly precedes the live segment.
    const QStringList live = readPlainFile(logPath());
    const QStringList newest = readPlainFile(logPath() + QStringLiteral(".1"));
    QVERIFY(!live.isEmpty());
    QVERIFY(!newest.isEmpty());
    QCOMPARE(sequenceOf(newest.back()) + 1, sequenceOf(live.front()));
}

void EventLogTests::testHourlyRotation()
{
    RotatingEventLog log(logPath(), RotationOptions{RotationTrigger::Hourly, 0, 3, false});
    const auto hour = apptrail::floorToLocalHour(kStart);
    log.append(sequencedEvent(0, hour + std::chrono::minutes(10)));
    log.append(sequencedEvent(1, hour + std::chrono::minutes(50)));
    log.append(sequencedEvent(2, hour + std::chrono::minutes(70)));

    const QString closed = logPath() + QStringLiteral(".")
        + QString::fromStdString(apptrail::formatLocal(hour, "%Y-%m-%d_%H"));
    const QStringList previousHour = readPlainFile(closed);
    QCOMPARE(previousHour.size(), qsizetype(2));
    QCOMPARE(sequenceOf(previousHour.back()), 1);

    const QStringList live = readPlainFile(logPath());
    QCOMPARE(live.size(), qsizetype(1));
    QCOMPARE(sequenceOf(live.front()), 2);
}

void EventLogTests::testTimestampsNeverGoBackwards()
{
    RotatingEventLog log(logPath(), RotationOptions{RotationTrigger::None, 0, 0, false});
    log.append(sequencedEvent(0, kStart + std::chrono::seconds(30)));
    log.append(sequencedEvent(1, kStart));

    const QStringList lines = readPlainFile(logPath());
    QCOMPARE(lines.size(), qsizetype(2));
    const auto first = apptrail::parseLogLine(lines[0].toStdString());
    const auto second = apptrail::parseLogLine(lines[1].toStdString());
    QVERIFY(first && second);
    QVERIFY(second->timestamp >= first->timestamp);
}

void EventLogTests::testConcurrentAppends()
{
    RotatingEventLog log(logPath(), RotationOptions{RotationTrigger::Size, 4096, 50, false});
    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;

    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&log, t] {
            for (int i = 0; i < kPerThread; ++i) {
                log.append(sequencedEvent(t * kPerThread + i, std::chrono::system_clock::now()));
            }
        });
    }
    for (auto &writer : writers) {
        writer.join();
    }

    QStringList all = readPlainFile(logPath());
    for (int n = 1; n <= 50; ++n) {
        all << readPlainFile(QStringLiteral("%1.%2").arg(logPath()).arg(n));
    }
    std::set<int> seen;
    for (const QString &line : all) {
        const int sequence = sequenceOf(line);
        QVERIFY2(sequence >= 0, "interleaved or truncated line");
        seen.insert(sequence);
    }
    QCOMPARE(static_cast<int>(seen.size()), kThreads * kPerThread);
}

void EventLogTests::testDirectorySinkIsIdempotent()
{
    const QString source = QDir(m_caseDir).filePath(QStringLiteral("segment.gz"));
    QFile file(source);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("archive-bytes");
    file.close();

    const QString destination = QDir(m_caseDir).filePath(QStringLiteral("store"));
    apptrail::DirectorySink sink(destination);
    QVERIFY(sink.store(source));
    QVERIFY(sink.store(source));

    const QStringList stored = QDir(destination).entryList(QDir::Files);
    QCOMPARE(stored, QStringList() << QStringLiteral("segment.gz"));
    QVERIFY(!sink.store(QDir(m_caseDir).filePath(QStringLiteral("missing.gz"))));
}

QTEST_MAIN(EventLogTests)
#include "test_event_log.moc"
