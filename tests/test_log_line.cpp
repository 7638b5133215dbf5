#include <QtTest/QtTest>

#include "common/json_utils.hpp"
#include "common/log_line.hpp"

using apptrail::parseLogLine;

class LogLineTests : public QObject
{
    Q_OBJECT
private slots:
    void testEscapedValuesRestoreExactly_data();
    void testEscapedValuesRestoreExactly();
    void testAbsentAndLiteralQuestionMark();
    void testKeyValueLine();
    void testStructuredLine();
    void testMixedFormsInOneStream();
    void testLegacyActiveLine();
    void testNonEventLinesAreRejected();
};

void LogLineTests::testEscapedValuesRestoreExactly_data()
{
    QTest::addColumn<QString>("value");

    QTest::newRow("spaces") << "Example - Google Chrome";
    QTest::newRow("backslash") << "C:\\Program Files\\app.exe";
    QTest::newRow("controls") << "tab\there\nnew\rline";
    QTest::newRow("escape-lookalike") << "literal \\s stays";
    QTest::newRow("equals") << "a=b c=d";
    QTest::newRow("question") << "what?";
    QTest::newRow("empty") << "";
}

void LogLineTests::testEscapedValuesRestoreExactly()
{
    QFETCH(QString, value);
    const std::string raw = value.toStdString();
    const std::string encoded = apptrail::escapeFieldValue(raw);
    QVERIFY(encoded.find(' ') == std::string::npos);
    QVERIFY(encoded.find('\n') == std::string::npos);
    QCOMPARE(apptrail::unescapeFieldValue(encoded), std::optional<std::string>(raw));
}

void LogLineTests::testAbsentAndLiteralQuestionMark()
{
    QCOMPARE(apptrail::escapeFieldValue(std::nullopt), std::string("?"));
    QCOMPARE(apptrail::escapeFieldValue(std::string("?")), std::string("\\?"));
    QCOMPARE(apptrail::unescapeFieldValue("?"), std::optional<std::string>());
    QCOMPARE(apptrail::unescapeFieldValue("\\?"), std::optional<std::string>("?"));
}

void LogLineTests::testKeyValueLine()
{
    const auto parsed = parseLogLine(
        "2025-10-29 19:33:07 | INFO | active_window pid=5576 name=code exe=? "
        "page=Example title=Example\\s-\\sGoogle\\sChrome");
    QVERIFY(parsed.has_value());
    QVERIFY(!parsed->structured);
    QCOMPARE(parsed->level, std::string("INFO"));
    QCOMPARE(parsed->eventType, std::string("active_window"));
    QCOMPARE(parsed->fields.at("pid"), std::optional<std::string>("5576"));
    QCOMPARE(parsed->fields.at("exe"), std::optional<std::string>());
    QCOMPARE(parsed->fields.at("title"), std::optional<std::string>("Example - Google Chrome"));
    QCOMPARE(apptrail::toLocalTimestamp(parsed->timestamp), std::string("2025-10-29 19:33:07"));
}

void LogLineTests::testStructuredLine()
{
    const auto parsed = parseLogLine(
        "2025-10-29 19:33:07 | WARNING | {\"event_type\":\"proc_start\",\"pid\":\"12\","
        "\"page_title\":\"Example\",\"window_title\":\"Example - Google Chrome\",\"exe\":null}");
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->structured);
    QCOMPARE(parsed->level, std::string("WARNING"));
    QCOMPARE(parsed->eventType, std::string("proc_start"));
    QCOMPARE(parsed->fields.at("page"), std::optional<std::string>("Example"));
    QCOMPARE(parsed->fields.at("title"), std::optional<std::string>("Example - Google Chrome"));
    QCOMPARE(parsed->fields.at("exe"), std::optional<std::string>());
}

void LogLineTests::testMixedFormsInOneStream()
{
    apptrail::MonitorEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.type = apptrail::EventType::Heartbeat;
    event.fields = {{"pid", std::string("1")}, {"title", std::string("a b")},
                    {"exe", std::nullopt}};

    for (auto format : {apptrail::LineFormat::Text, apptrail::LineFormat::Json}) {
        const auto parsed = parseLogLine(apptrail::formatEventLine(event, format));
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->structured, format == apptrail::LineFormat::Json);
        QCOMPARE(parsed->eventType, std::string("heartbeat"));
        QCOMPARE(parsed->fields.at("title"), std::optional<std::string>("a b"));
        QCOMPARE(parsed->fields.at("exe"), std::optional<std::string>());
    }
}

void LogLineTests::testLegacyActiveLine()
{
    const auto parsed = parseLogLine(
        "2025-10-29 19:33:07 | INFO | active pid=5576 name=Code.exe title=main ts=2025-10-29");
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->eventType, std::string("active"));
    QCOMPARE(parsed->fields.at("name"), std::optional<std::string>("Code.exe"));
}

void LogLineTests::testNonEventLinesAreRejected()
{
    QVERIFY(!parseLogLine("").has_value());
    QVERIFY(!parseLogLine("===== 2025-10-29 19:00:00 =====").has_value());
    QVERIFY(!parseLogLine("---------- hour boundary ----------").has_value());
    QVERIFY(!parseLogLine("2025-10-29 19:33:07 | INFO").has_value());
    QVERIFY(!parseLogLine("not a timestamp at all | INFO | active_window").has_value());
}

QTEST_MAIN(LogLineTests)
#include "test_log_line.moc"
