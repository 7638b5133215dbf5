#include "hourly/HourlyGrouper.hpp"

#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/log_line.hpp"
#include "common/logging.hpp"
#include "daemon/segment_compressor.hpp"

namespace apptrail {

namespace {

constexpr const char *kBoundary = "---------- hour boundary ----------\n";

void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}

QByteArray renderBlocks(const HourGroups &groups, const std::vector<std::string> &hours)
{
    QByteArray out;
    for (size_t i = 0; i < hours.size(); ++i) {
        out += "===== " + QByteArray::fromStdString(hours[i]) + " =====\n";
        for (const auto &line : groups.at(hours[i])) {
            out += QByteArray::fromStdString(line);
            out += '\n';
        }
        if (i + 1 < hours.size()) {
            out += kBoundary;
        }
    }
    return out;
}

std::vector<std::string> splitLines(const QByteArray &content)
{
    std::vector<std::string> lines;
    for (const QByteArray &line : content.split('\n')) {
        if (!line.isEmpty()) {
            lines.push_back(line.toStdString());
        }
    }
    return lines;
}

bool isHourKey(const std::string &value)
{
    const auto parsed = fromLocalTimestamp(value);
    return parsed && value.size() == 19 && value.compare(13, 6, ":00:00") == 0;
}

} // namespace

bool isActiveWindowClass(const std::string &eventType)
{
    return eventType == "active_window" || eventType == "heartbeat" || eventType == "active";
}

HourGroups groupLinesByHour(const std::vector<std::string> &lines)
{
    HourGroups groups;
    for (const auto &raw : lines) {
        const auto parsed = parseLogLine(raw);
        if (!parsed || !isActiveWindowClass(parsed->eventType)) {
            continue;
        }
        std::string line = raw;
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        groups[toHourKey(parsed->timestamp)].push_back(std::move(line));
    }
    return groups;
}

std::optional<std::vector<std::string>> HourlyGrouper::readLogLines(const QString &path,
                                                                    QString *error)
{
    if (path.endsWith(QStringLiteral(".gz"))) {
        const auto content = SegmentCompressor::readCompressedFile(path);
        if (!content) {
            setError(error, QStringLiteral("cannot decompress %1").arg(path));
            return std::nullopt;
        }
        return splitLines(*content);
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, QStringLiteral("cannot read %1: %2").arg(path, file.errorString()));
        return std::nullopt;
    }
    return splitLines(file.readAll());
}

bool HourlyGrouper::writeHourlyLog(const HourGroups &groups, const QString &outPath,
                                   QString *error)
{
    std::vector<std::string> hours;
    for (const auto &[hour, lines] : groups) {
        hours.push_back(hour);
    }

    QSaveFile file(outPath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(error, QStringLiteral("cannot write %1: %2").arg(outPath, file.errorString()));
        return false;
    }
    file.write(renderBlocks(groups, hours));
    if (!file.commit()) {
        setError(error, QStringLiteral("cannot write %1: %2").arg(outPath, file.errorString()));
        return false;
    }
    return true;
}

std::optional<int> HourlyGrouper::appendNewHours(const HourGroups &groups,
                                                 const QString &outPath,
                                                 ReplayState &state,
                                                 std::chrono::system_clock::time_point now,
                                                 QString *error)
{
    // Keys compare chronologically as strings.
    const std::string currentHour = toHourKey(now);
    std::vector<std::string> toWrite;
    for (const auto &[hour, lines] : groups) {
        const bool afterLast = !state.lastHour || hour > *state.lastHour;
        if (afterLast && hour < currentHour) {
            toWrite.push_back(hour);
        }
    }
    if (toWrite.empty()) {
        return 0;
    }

    const QFileInfo existing(outPath);
    const qint64 originalSize = existing.exists() ? existing.size() : 0;
    QByteArray payload;
    if (originalSize > 0) {
        payload += kBoundary;
    }
    payload += renderBlocks(groups, toWrite);

    QFile file(outPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        setError(error, QStringLiteral("cannot append to %1: %2").arg(outPath, file.errorString()));
        return std::nullopt;
    }
    if (file.write(payload) != payload.size() || !file.flush()) {
        setError(error, QStringLiteral("cannot append to %1: %2").arg(outPath, file.errorString()));
        file.close();
        // The output must not keep a partial block that the state does not cover.
        if (!QFile::resize(outPath, originalSize)) {
            ATLOG_WARN(QStringLiteral("HourlyGrouper"),
                       QStringLiteral("HourlyGrouper::appendNewHours"),
                       QStringLiteral("append_rollback_failed"),
                       QStringLiteral("truncate_failed"),
                       QStringLiteral("qfile_resize"),
                       apptrail::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"path", outPath.toStdString()}, {"size", originalSize}}));
        }
        return std::nullopt;
    }

    state.lastHour = toWrite.back();
    return static_cast<int>(toWrite.size());
}

ReplayState HourlyGrouper::loadState(const QString &path)
{
    ReplayState state;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return state;
    }

    const auto json = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        ATLOG_WARN(QStringLiteral("HourlyGrouper"),
                   QStringLiteral("HourlyGrouper::loadState"),
                   QStringLiteral("state_unreadable"),
                   QStringLiteral("malformed_json"),
                   QStringLiteral("nlohmann_parse"),
                   apptrail::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", path.toStdString()}}));
        return state;
    }

    const auto lastHour = json.find("last_hour");
    if (lastHour != json.end() && lastHour->is_string() && isHourKey(lastHour->get<std::string>())) {
        state.lastHour = lastHour->get<std::string>();
    }
    return state;
}

bool HourlyGrouper::saveState(const QString &path, const ReplayState &state, QString *error)
{
    nlohmann::json json = nlohmann::json::object();
    if (state.lastHour) {
        json["last_hour"] = *state.lastHour;
    } else {
        json["last_hour"] = nullptr;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(error, QStringLiteral("cannot write %1: %2").arg(path, file.errorString()));
        return false;
    }
    file.write(QByteArray::fromStdString(json.dump(2)));
    if (!file.commit()) {
        setError(error, QStringLiteral("cannot write %1: %2").arg(path, file.errorString()));
        return false;
    }
    return true;
}

} // namespace apptrail
