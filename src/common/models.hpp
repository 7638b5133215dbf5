#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace apptrail {

using ProcessId = std::int64_t;

struct ProcessRecord {
    ProcessId id = 0;
    std::string name;
    std::optional<std::string> executablePath;
    std::optional<std::string> owner;
    std::chrono::system_clock::time_point createdAt;
};

// Keyed by pid. std::map keeps iteration in ascending id order.
using Snapshot = std::map<ProcessId, ProcessRecord>;

struct WindowObservation {
    std::optional<ProcessId> owningProcessId;
    std::optional<std::string> processName;
    std::optional<std::string> title;

    bool operator==(const WindowObservation &other) const = default;
};

struct TopLevelWindow {
    unsigned long handle = 0;
    std::optional<ProcessId> owningProcessId;
    std::optional<std::string> title;
    bool visible = false;
};

using TopLevelWindowSet = std::set<ProcessId>;

struct EventField {
    std::string key;
    std::optional<std::string> value;

    bool operator==(const EventField &other) const = default;
};

struct MonitorEvent {
    std::chrono::system_clock::time_point timestamp;
    EventLevel level = EventLevel::Info;
    EventType type = EventType::ActiveWindow;
    std::vector<EventField> fields;

    std::optional<std::string> field(const std::string &key) const
    {
        for (const auto &f : fields) {
            if (f.key == key) {
                return f.value;
            }
        }
        return std::nullopt;
    }

    bool hasField(const std::string &key) const
    {
        for (const auto &f : fields) {
            if (f.key == key) {
                return true;
            }
        }
        return false;
    }
};

// A line read back from an event log, in either of the two message forms.
struct ParsedLogLine {
    std::chrono::system_clock::time_point timestamp;
    std::string level;
    std::string eventType;
    std::map<std::string, std::optional<std::string>> fields;
    bool structured = false;
};

} // namespace apptrail
