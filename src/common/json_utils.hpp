#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace apptrail {

inline std::tm toLocalTm(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);
    return tm;
}

inline std::string formatLocal(std::chrono::system_clock::time_point timestamp,
                               const char *pattern)
{
    const std::tm tm = toLocalTm(timestamp);
    std::ostringstream out;
    out << std::put_time(&tm, pattern);
    return out.str();
}

// "2025-10-29 19:33:07", the leading column of every event line.
inline std::string toLocalTimestamp(std::chrono::system_clock::time_point timestamp)
{
    return formatLocal(timestamp, "%Y-%m-%d %H:%M:%S");
}

// Space-free variant used inside key=value fields (started_at).
inline std::string toLocalIso(std::chrono::system_clock::time_point timestamp)
{
    return formatLocal(timestamp, "%Y-%m-%dT%H:%M:%S");
}

inline std::string toHourKey(std::chrono::system_clock::time_point timestamp)
{
    return formatLocal(timestamp, "%Y-%m-%d %H:00:00");
}

inline std::optional<std::chrono::system_clock::time_point> fromLocalTimestamp(
    const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
    tm.tm_isdst = -1;
    const std::time_t time = std::mktime(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::chrono::system_clock::time_point floorToLocalHour(
    std::chrono::system_clock::time_point timestamp)
{
    std::tm tm = toLocalTm(timestamp);
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

inline std::string toEventTypeString(EventType type)
{
    switch (type) {
    case EventType::ProcStart:
        return "proc_start";
    case EventType::ProcStop:
        return "proc_stop";
    case EventType::ActiveWindow:
        return "active_window";
    case EventType::Heartbeat:
        return "heartbeat";
    case EventType::Snapshot:
        return "snapshot";
    case EventType::SnapshotEntry:
        return "proc";
    case EventType::MonitorStart:
        return "monitor_start";
    case EventType::MonitorStop:
        return "monitor_stop";
    case EventType::MonitorCrash:
        return "monitor_crash";
    }
    return "active_window";
}

inline std::string toLevelString(EventLevel level)
{
    switch (level) {
    case EventLevel::Info:
        return "INFO";
    case EventLevel::Warning:
        return "WARNING";
    case EventLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

inline std::string toModeString(MonitorMode mode)
{
    switch (mode) {
    case MonitorMode::Active:
        return "active";
    case MonitorMode::Process:
        return "process";
    case MonitorMode::Both:
        return "both";
    }
    return "active";
}

inline std::optional<MonitorMode> parseModeString(const std::string &value)
{
    if (value == "active") {
        return MonitorMode::Active;
    }
    if (value == "process") {
        return MonitorMode::Process;
    }
    if (value == "both") {
        return MonitorMode::Both;
    }
    return std::nullopt;
}

inline std::string toRotationString(RotationTrigger trigger)
{
    switch (trigger) {
    case RotationTrigger::Size:
        return "size";
    case RotationTrigger::Hourly:
        return "hourly";
    case RotationTrigger::None:
        return "none";
    }
    return "size";
}

inline std::optional<RotationTrigger> parseRotationString(const std::string &value)
{
    if (value == "size") {
        return RotationTrigger::Size;
    }
    if (value == "hourly") {
        return RotationTrigger::Hourly;
    }
    if (value == "none") {
        return RotationTrigger::None;
    }
    return std::nullopt;
}

inline std::optional<LineFormat> parseLineFormatString(const std::string &value)
{
    if (value == "text") {
        return LineFormat::Text;
    }
    if (value == "json") {
        return LineFormat::Json;
    }
    return std::nullopt;
}

inline std::optional<SinkKind> parseSinkString(const std::string &value)
{
    if (value == "none") {
        return SinkKind::None;
    }
    if (value == "directory") {
        return SinkKind::Directory;
    }
    return std::nullopt;
}

// Field names differ between the key=value and the JSON message forms for the
// two title fields only.
inline std::string toStructuredKey(const std::string &key)
{
    if (key == "page") {
        return "page_title";
    }
    if (key == "title") {
        return "window_title";
    }
    return key;
}

inline std::string fromStructuredKey(const std::string &key)
{
    if (key == "page_title") {
        return "page";
    }
    if (key == "window_title") {
        return "title";
    }
    return key;
}

inline nlohmann::json toJsonMessage(const MonitorEvent &event)
{
    nlohmann::json message = nlohmann::json::object();
    message["event_type"] = toEventTypeString(event.type);
    for (const auto &field : event.fields) {
        const std::string key = toStructuredKey(field.key);
        if (field.value.has_value()) {
            message[key] = *field.value;
        } else {
            message[key] = nullptr;
        }
    }
    return message;
}

} // namespace apptrail
