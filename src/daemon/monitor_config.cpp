#include "daemon/monitor_config.hpp"

#include <cmath>

#include <QCommandLineParser>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "daemon/browser_names.hpp"

namespace apptrail {

namespace {

std::optional<double> parseNumber(const std::string &value)
{
    try {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

std::optional<bool> parseBool(const std::string &value)
{
    const std::string lowered = toLowerAscii(value);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    return std::nullopt;
}

std::set<std::string> splitNames(const std::string &value)
{
    std::set<std::string> names;
    size_t start = 0;
    while (start <= value.size()) {
        const size_t comma = value.find(',', start);
        std::string name = value.substr(start, comma == std::string::npos ? std::string::npos
                                                                           : comma - start);
        while (!name.empty() && name.front() == ' ') {
            name.erase(name.begin());
        }
        while (!name.empty() && name.back() == ' ') {
            name.pop_back();
        }
        if (!name.empty()) {
            names.insert(toLowerAscii(name));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return names;
}

std::chrono::milliseconds secondsToMillis(double seconds)
{
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

// Applies one raw option value. source names the layer for messages.
class ConfigApplier
{
public:
    explicit ConfigApplier(ConfigLoadResult &result)
        : m_result(result)
    {
    }

    void apply(const std::string &key, const std::string &value, const std::string &source)
    {
        MonitorConfig &config = m_result.config;
        if (key == "interval") {
            const auto seconds = parseNumber(value);
            if (!seconds) {
                error(source, key, value);
                return;
            }
            if (*seconds < 0.1) {
                warn(source + ": interval " + value + "s below the 0.1s floor, using 0.1s");
                config.interval = kMinimumInterval;
                return;
            }
            config.interval = secondsToMillis(*seconds);
        } else if (key == "heartbeat") {
            const auto seconds = parseNumber(value);
            if (!seconds) {
                error(source, key, value);
                return;
            }
            config.heartbeat = *seconds <= 0 ? std::chrono::milliseconds(0) : secondsToMillis(*seconds);
        } else if (key == "mode") {
            const auto mode = parseModeString(value);
            if (!mode) {
                error(source, key, value);
                return;
            }
            config.mode = *mode;
        } else if (key == "rotation") {
            const auto rotation = parseRotationString(value);
            if (!rotation) {
                error(source, key, value);
                return;
            }
            config.rotation = *rotation;
        } else if (key == "line_format") {
            const auto format = parseLineFormatString(value);
            if (!format) {
                error(source, key, value);
                return;
            }
            config.lineFormat = *format;
        } else if (key == "sink") {
            const auto sink = parseSinkString(value);
            if (!sink) {
                // A bad sink only costs the upload; archives stay local.
                warn(source + ": unknown sink '" + value + "', archives stay local");
                config.sink = SinkKind::None;
                return;
            }
            config.sink = *sink;
        } else if (key == "max_bytes") {
            const auto bytes = parseNumber(value);
            if (!bytes || *bytes <= 0) {
                error(source, key, value);
                return;
            }
            config.maxBytes = static_cast<std::int64_t>(*bytes);
        } else if (key == "backup_count") {
            const auto count = parseNumber(value);
            if (!count || *count < 0) {
                error(source, key, value);
                return;
            }
            config.backupCount = static_cast<int>(*count);
        } else if (key == "browser_title_wait_ms") {
            const auto millis = parseNumber(value);
            if (!millis || *millis < 0) {
                error(source, key, value);
                return;
            }
            config.browserTitleWait = std::chrono::milliseconds(static_cast<long long>(*millis));
        } else if (key == "archive_dir") {
            config.archiveDir = value;
        } else if (key == "logfile") {
            if (value.empty()) {
                error(source, key, value);
                return;
            }
            config.logfile = value;
        } else if (key == "ignore") {
            config.ignoreNames = splitNames(value);
        } else if (key == "whitelist") {
            config.whitelist = splitNames(value);
        } else if (key == "gui_only" || key == "include_system" || key == "proc_snapshot"
                   || key == "compress" || key == "stdout" || key == "trace") {
            const auto flag = parseBool(value);
            if (!flag) {
                error(source, key, value);
                return;
            }
            flagFor(key) = *flag;
        } else {
            warn(source + ": unknown option '" + key + "' ignored");
        }
    }

private:
    bool &flagFor(const std::string &key)
    {
        MonitorConfig &config = m_result.config;
        if (key == "gui_only") {
            return config.guiOnly;
        }
        if (key == "include_system") {
            return config.includeSystem;
        }
        if (key == "proc_snapshot") {
            return config.procSnapshot;
        }
        if (key == "compress") {
            return config.compress;
        }
        if (key == "stdout") {
            return config.echo;
        }
        return config.trace;
    }

    void error(const std::string &source, const std::string &key, const std::string &value)
    {
        m_result.errors.push_back(source + ": invalid value '" + value + "' for " + key);
    }

    void warn(const std::string &message)
    {
        m_result.warnings.push_back(message);
    }

    ConfigLoadResult &m_result;
};

void applyEnvironment(ConfigApplier &applier)
{
    const std::pair<const char *, const char *> variables[] = {
        {"APPTRAIL_INTERVAL", "interval"},
        {"APPTRAIL_HEARTBEAT", "heartbeat"},
        {"APPTRAIL_MODE", "mode"},
        {"APPTRAIL_LOGFILE", "logfile"},
        {"APPTRAIL_ARCHIVE_DIR", "archive_dir"},
        {"APPTRAIL_TRACE", "trace"},
    };
    for (const auto &[variable, key] : variables) {
        if (qEnvironmentVariableIsSet(variable)) {
            applier.apply(key, qEnvironmentVariable(variable).toStdString(),
                          std::string("environment ") + variable);
        }
    }
}

std::string jsonScalarToString(const nlohmann::json &value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return value.dump();
}

void applyConfigFile(const std::string &path, ConfigApplier &applier, ConfigLoadResult &result)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        result.errors.push_back("cannot read config file " + path + ": "
                                + file.errorString().toStdString());
        return;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        result.errors.push_back("malformed config file " + path + ": " + ex.what());
        return;
    }
    if (!json.is_object()) {
        result.errors.push_back("config file " + path + " must contain a JSON object");
        return;
    }

    const std::string source = "config " + path;
    for (auto it = json.begin(); it != json.end(); ++it) {
        const nlohmann::json &value = it.value();
        if (value.is_array()) {
            std::string joined;
            for (const auto &item : value) {
                if (!item.is_string()) {
                    result.errors.push_back(source + ": " + it.key() + " must list names");
                    joined.clear();
                    break;
                }
                if (!joined.empty()) {
                    joined += ',';
                }
                joined += item.get<std::string>();
            }
            applier.apply(it.key(), joined, source);
        } else if (value.is_object() || value.is_null()) {
            result.errors.push_back(source + ": unsupported value for " + it.key());
        } else {
            applier.apply(it.key(), jsonScalarToString(value), source);
        }
    }
}

} // namespace

ConfigLoadResult loadMonitorConfig(const QStringList &arguments)
{
    ConfigLoadResult result;

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Records process launches and foreground windows."));
    const QCommandLineOption helpOption = parser.addHelpOption();

    const QCommandLineOption intervalOption(QStringList() << "interval",
                                            "Seconds between polls.", "seconds");
    const QCommandLineOption heartbeatOption(QStringList() << "heartbeat",
                                             "Seconds between heartbeats, 0 disables.", "seconds");
    const QCommandLineOption modeOption(QStringList() << "mode",
                                        "What to monitor: active, process or both.", "mode");
    const QCommandLineOption guiOnlyOption(QStringList() << "gui-only",
                                           "Only log processes owning a visible window.");
    const QCommandLineOption includeSystemOption(QStringList() << "include-system",
                                                 "Also log system processes.");
    const QCommandLineOption snapshotOption(QStringList() << "proc-snapshot",
                                            "Write a process snapshot at startup.");
    const QCommandLineOption ignoreOption(QStringList() << "ignore",
                                          "Comma-separated names replacing the ignore list.", "names");
    const QCommandLineOption whitelistOption(QStringList() << "whitelist",
                                             "Comma-separated names always logged.", "names");
    const QCommandLineOption rotationOption(QStringList() << "rotation",
                                            "Rotation trigger: size, hourly or none.", "trigger");
    const QCommandLineOption noRotateOption(QStringList() << "no-rotate",
                                            "Same as --rotation none.");
    const QCommandLineOption maxBytesOption(QStringList() << "max-bytes",
                                            "Segment size limit for size rotation.", "bytes");
    const QCommandLineOption backupCountOption(QStringList() << "backup-count",
                                               "Uncompressed backups to keep.", "count");
    const QCommandLineOption noCompressOption(QStringList() << "no-compress",
                                              "Keep closed segments uncompressed.");
    const QCommandLineOption sinkOption(QStringList() << "sink",
                                        "Archive destination: none or directory.", "kind");
    const QCommandLineOption archiveDirOption(QStringList() << "archive-dir",
                                              "Directory for the directory sink.", "dir");
    const QCommandLineOption lineFormatOption(QStringList() << "line-format",
                                              "Event message form: text or json.", "format");
    const QCommandLineOption stdoutOption(QStringList() << "stdout",
                                          "Echo every event line to stdout.");
    const QCommandLineOption logfileOption(QStringList() << "logfile",
                                           "Event log path.", "path");
    const QCommandLineOption titleWaitOption(QStringList() << "browser-title-wait-ms",
                                             "Delay before reading a new browser's title.", "ms");
    const QCommandLineOption listOnceOption(QStringList() << "list-once",
                                            "Print the process list and exit.");
    const QCommandLineOption traceOption(QStringList() << "trace",
                                         "Enable verbose diagnostic trace logging.");
    const QCommandLineOption configOption(QStringList() << "config",
                                          "JSON configuration file.", "file");

    parser.addOptions({intervalOption, heartbeatOption, modeOption, guiOnlyOption,
                       includeSystemOption, snapshotOption, ignoreOption, whitelistOption,
                       rotationOption, noRotateOption, maxBytesOption, backupCountOption,
                       noCompressOption, sinkOption, archiveDirOption, lineFormatOption,
                       stdoutOption, logfileOption, titleWaitOption, listOnceOption,
                       traceOption, configOption});

    if (!parser.parse(arguments)) {
        result.errors.push_back(parser.errorText().toStdString());
        return result;
    }
    if (parser.isSet(helpOption)) {
        result.helpRequested = true;
        result.helpText = parser.helpText().toStdString();
        return result;
    }

    ConfigApplier applier(result);
    applyEnvironment(applier);

    if (parser.isSet(configOption)) {
        result.config.configFile = parser.value(configOption).toStdString();
        applyConfigFile(result.config.configFile, applier, result);
    }

    const std::pair<const QCommandLineOption *, const char *> valued[] = {
        {&intervalOption, "interval"},
        {&heartbeatOption, "heartbeat"},
        {&modeOption, "mode"},
        {&ignoreOption, "ignore"},
        {&whitelistOption, "whitelist"},
        {&rotationOption, "rotation"},
        {&maxBytesOption, "max_bytes"},
        {&backupCountOption, "backup_count"},
        {&sinkOption, "sink"},
        {&archiveDirOption, "archive_dir"},
        {&lineFormatOption, "line_format"},
        {&logfileOption, "logfile"},
        {&titleWaitOption, "browser_title_wait_ms"},
    };
    for (const auto &[option, key] : valued) {
        if (parser.isSet(*option)) {
            applier.apply(key, parser.value(*option).toStdString(), "command line");
        }
    }

    MonitorConfig &config = result.config;
    if (parser.isSet(guiOnlyOption)) {
        config.guiOnly = true;
    }
    if (parser.isSet(includeSystemOption)) {
        config.includeSystem = true;
    }
    if (parser.isSet(snapshotOption)) {
        config.procSnapshot = true;
    }
    if (parser.isSet(noRotateOption)) {
        config.rotation = RotationTrigger::None;
    }
    if (parser.isSet(noCompressOption)) {
        config.compress = false;
    }
    if (parser.isSet(stdoutOption)) {
        config.echo = true;
    }
    if (parser.isSet(listOnceOption)) {
        config.listOnce = true;
    }
    if (parser.isSet(traceOption)) {
        config.trace = true;
    }

    if (config.sink == SinkKind::Directory && config.archiveDir.empty()) {
        result.warnings.push_back("sink=directory needs archive_dir; archives stay local");
        config.sink = SinkKind::None;
    }
    return result;
}

} // namespace apptrail
