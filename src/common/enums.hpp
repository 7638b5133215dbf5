#pragma once

namespace apptrail {

enum class EventType {
    ProcStart,
    ProcStop,
    ActiveWindow,
    Heartbeat,
    Snapshot,
    SnapshotEntry,
    MonitorStart,
    MonitorStop,
    MonitorCrash
};

enum class EventLevel {
    Info,
    Warning,
    Error
};

enum class MonitorMode {
    Active,
    Process,
    Both
};

enum class RotationTrigger {
    Size,
    Hourly,
    None
};

enum class LineFormat {
    Text,
    Json
};

enum class SinkKind {
    None,
    Directory
};

} // namespace apptrail
