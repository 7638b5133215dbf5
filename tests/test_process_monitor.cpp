#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QTemporaryDir>

#include <stdexcept>
#include <thread>

#include "daemon/process_monitor.hpp"
#include "fakes.hpp"

using apptrail::EventType;
using apptrail::testing::FakeProcessTable;
using apptrail::testing::FakeWindowSystem;
using apptrail::testing::RecordingWriter;
using apptrail::testing::makeRecord;

namespace {

class ThrowingProcessTable : public FakeProcessTable
{
public:
    apptrail::Snapshot snapshot() override
    {
        throw std::runtime_error("proc unreadable");
    }
};

} // namespace

class ProcessMonitorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testBaselineIsNotReported();
    void testStartAndStopEvents();
    void testNoiseIsNotEmitted();
    void testStopPrefersCachedExecutable();
    void testSuppressedChildStopIsSuppressed();
    void testBrowserStartCarriesWindowTitle();
    void testBrowserTitleWaitStopsOnCancel();
    void testGuiOnlyUsesWindowSet();
    void testReusedPidIsStopThenStart();
    void testSnapshotDump();
    void testCrashIsReported();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    static apptrail::MonitorConfig fastConfig();
};

void ProcessMonitorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ProcessMonitorTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

apptrail::MonitorConfig ProcessMonitorTests::fastConfig()
{
    apptrail::MonitorConfig config;
    config.interval = std::chrono::milliseconds(10);
    config.browserTitleWait = std::chrono::milliseconds(0);
    return config;
}

void ProcessMonitorTests::testBaselineIsNotReported()
{
    FakeProcessTable processes;
    processes.add(makeRecord(100, "code"));
    FakeWindowSystem windows;
    RecordingWriter writer;
    const auto config = fastConfig();
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});

    monitor.pollOnce();
    monitor.pollOnce();
    QVERIFY(writer.events.empty());
}

void ProcessMonitorTests::testStartAndStopEvents()
{
    FakeProcessTable processes;
    processes.add(makeRecord(100, "code"));
    FakeWindowSystem windows;
    RecordingWriter writer;
    const auto config = fastConfig();
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});
    monitor.pollOnce();

    processes.add(makeRecord(200, "notes"));
    processes.exePaths[200] = "/usr/bin/notes";
    monitor.pollOnce();

    const auto starts = writer.ofType(EventType::ProcStart);
    QCOMPARE(starts.size(), size_t(1));
    QCOMPARE(starts.front().field("pid"), std::optional<std::string>("200"));
    QCOMPARE(starts.front().field("name"), std::optional<std::string>("notes"));
    QCOMPARE(starts.front().field("exe"), std::optional<std::string>("/usr/bin/notes"));
    QCOMPARE(starts.front().field("user"), std::optional<std::string>("alice"));
    QVERIFY(starts.front().field("started_at").has_value());
    QCOMPARE(monitor.cachedExecutable(200), std::optional<std::string>("/usr/bin/notes"));

    processes.remove(100);
    monitor.pollOnce();
    const auto stops = writer.ofType(EventType::ProcStop);
    QCOMPARE(stops.size(), size_t(1));
    QCOMPARE(stops.front().field("pid"), std::optional<std::string>("100"));
    // Exited before its path was ever resolved.
    QCOMPARE(stops.front().field("exe"), std::optional<std::string>());
}

void ProcessMonitorTests::testNoiseIsNotEmitted()
{
    FakeProcessTable processes;
    FakeWindowSystem windows;
    RecordingWriter writer;
    const auto config = fastConfig();
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});
    monitor.pollOnce();

    processes.add(makeRecord(300, "conhost.exe"));
    processes.add(makeRecord(301, "cron", std::string("root")));
    monitor.pollOnce();
    processes.remove(300);
    processes.remove(301);
    monitor.pollOnce();

    QVERIFY(writer.events.empty());
    QVERIFY(!monitor.cachedExecutable(300).has_value());
}

void ProcessMonitorTests::testStopPrefersCachedExecutable()
{
    FakeProcessTable processes;
    FakeWindowSystem windows;
    RecordingWriter writer;
    const auto config = fastConfig();
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});
    monitor.pollOnce();

    processes.add(makeRecord(400, "player"));
    processes.exePaths[400] = "/usr/bin/player";
    monitor.pollOnce();

    processes.remove(400);
    const int queriesBefore = processes.exeQueries;
    monitor.pollOnce();

    const auto stops = writer.ofType(EventType::ProcStop);
    QCOMPARE(stops.size(), size_t(1));
    QCOMPARE(stops.front().field("exe"), std::optional<std::string>("/usr/bin/player"));
    QCOMPARE(processes.exeQueries, queriesBefore);
    QVERIFY(!monitor.cachedExecutable(400).has_value());
}

void ProcessMonitorTests::testSuppressedChildStopIsSuppressed()
{
    FakeProcessTable processes;
    FakeWindowSystem windows;
    RecordingWriter writer;
    const auto config = fastConfig();
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});
    monitor.pollOnce();

    processes.add(makeRecord(500, "chrome"));
    processes.arguments[500] = {"chrome", "--type=gpu-process"};
    monitor.pollOnce();
    QVERIFY(monitor.isTrackedAsSuppressedChild(500));
    QVERIFY(writer.ofType(EventType::ProcStart).empty());

    processes.remove(500);
    monitor.pollOnce();
    QVERIFY(writer.ofType(EventType::ProcStop).empty());
    QVERIFY(!monitor.isTrackedAsSuppressedChild(500));
}

void ProcessMonitorTests::testBrowserStartCarriesWindowTitle()
{
    FakeProcessTable processes;
    FakeWindowSystem windows;
    RecordingWriter writer;
    const auto config = fastConfig();
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});
    monitor.pollOnce();

    processes.add(makeRecord(600, "chrome"));
    processes.arguments[600] = {"chrome"};
    windows.addWindow(600, "Example - Google Chrome");
    monitor.pollOnce();

    const auto starts = writer.ofType(EventType::ProcStart);
    QCOMPARE(starts.size(), size_t(1));
    QCOMPARE(starts.front().field("page"), std::optional<std::string>("Example"));
    QCOMPARE(starts.front().field("title"), std::optional<std::string>("Example - Google Chrome"));
}

void ProcessMonitorTests::testBrowserTitleWaitStopsOnCancel()
{
    FakeProcessTable processes;
    FakeWindowSystem windows;
    RecordingWriter writer;
    auto config = fastConfig();
    config.browserTitleWait = std::chrono::seconds(10);
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});
    monitor.pollOnce();

    processes.add(makeRecord(650, "chrome"));
    processes.arguments[650] = {"chrome"};
    windows.addWindow(650, "Example - Google Chrome");

    std::stop_source stop;
    stop.request_stop();
    QElapsedTimer timer;
    timer.start();
    monitor.pollOnce(stop.get_token());
    QVERIFY(timer.elapsed() < 5000);

    const auto starts = writer.ofType(EventType::ProcStart);
    QCOMPARE(starts.size(), size_t(1));
    QCOMPARE(starts.front().field("pid"), std::optional<std::string>("650"));
    QCOMPARE(starts.front().field("page"), std::optional<std::string>());
    QCOMPARE(starts.front().field("title"), std::optional<std::string>());
}

void ProcessMonitorTests::testGuiOnlyUsesWindowSet()
{
    FakeProcessTable processes;
    FakeWindowSystem windows;
    RecordingWriter writer;
    auto config = fastConfig();
    config.guiOnly = true;
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});
    monitor.pollOnce();

    processes.add(makeRecord(700, "daemonish"));
    processes.add(makeRecord(701, "editor"));
    windows.addWindow(701, "notes.txt");
    windows.addWindow(700, "", true);
    monitor.pollOnce();

    const auto starts = writer.ofType(EventType::ProcStart);
    QCOMPARE(starts.size(), size_t(1));
    QCOMPARE(starts.front().field("pid"), std::optional<std::string>("701"));
}

void ProcessMonitorTests::testReusedPidIsStopThenStart()
{
    FakeProcessTable processes;
    processes.add(makeRecord(800, "first"));
    FakeWindowSystem windows;
    RecordingWriter writer;
    const auto config = fastConfig();
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});
    monitor.pollOnce();

    auto replacement = makeRecord(800, "second");
    replacement.createdAt += std::chrono::minutes(1);
    processes.add(replacement);
    monitor.pollOnce();

    QCOMPARE(writer.events.size(), size_t(2));
    QCOMPARE(writer.events[0].type, EventType::ProcStop);
    QCOMPARE(writer.events[0].field("name"), std::optional<std::string>("first"));
    QCOMPARE(writer.events[1].type, EventType::ProcStart);
    QCOMPARE(writer.events[1].field("name"), std::optional<std::string>("second"));
}

void ProcessMonitorTests::testSnapshotDump()
{
    FakeProcessTable processes;
    processes.add(makeRecord(1, "init", std::string("root")));
    processes.add(makeRecord(900, "code"));
    processes.add(makeRecord(901, "notes"));
    FakeWindowSystem windows;
    RecordingWriter writer;
    auto config = fastConfig();
    config.procSnapshot = true;
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});
    monitor.pollOnce();

    QCOMPARE(writer.events.size(), size_t(3));
    QCOMPARE(writer.events[0].type, EventType::Snapshot);
    QCOMPARE(writer.events[0].field("count"), std::optional<std::string>("2"));
    QCOMPARE(writer.events[1].type, EventType::SnapshotEntry);
    QCOMPARE(writer.events[1].field("pid"), std::optional<std::string>("900"));
    QCOMPARE(writer.events[2].field("name"), std::optional<std::string>("notes"));

    processes.remove(901);
    processes.add(makeRecord(902, "player"));
    monitor.pollOnce();

    QCOMPARE(writer.ofType(EventType::Snapshot).size(), size_t(2));
    QCOMPARE(writer.events.size(), size_t(8));
    QCOMPARE(writer.events[3].type, EventType::ProcStop);
    QCOMPARE(writer.events[4].type, EventType::ProcStart);
    QCOMPARE(writer.events[5].type, EventType::Snapshot);
    QCOMPARE(writer.events[5].field("count"), std::optional<std::string>("2"));
    QCOMPARE(writer.events[6].field("pid"), std::optional<std::string>("900"));
    QCOMPARE(writer.events[7].field("pid"), std::optional<std::string>("902"));
    QCOMPARE(writer.events[7].field("name"), std::optional<std::string>("player"));
}

void ProcessMonitorTests::testCrashIsReported()
{
    ThrowingProcessTable processes;
    FakeWindowSystem windows;
    RecordingWriter writer;
    const auto config = fastConfig();
    apptrail::ProcessMonitor monitor({config, writer, processes, windows});

    std::stop_source stop;
    QVERIFY(!monitor.run(stop.get_token()));

    QCOMPARE(writer.events.size(), size_t(2));
    QCOMPARE(writer.events.front().type, EventType::MonitorStart);
    QCOMPARE(writer.events.back().type, EventType::MonitorCrash);
    QCOMPARE(writer.events.back().level, apptrail::EventLevel::Error);
    QCOMPARE(writer.events.back().field("cause"), std::optional<std::string>("proc unreadable"));
}

QTEST_MAIN(ProcessMonitorTests)
#include "test_process_monitor.moc"
