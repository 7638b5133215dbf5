#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <QStringList>

#include "common/enums.hpp"

namespace apptrail {

struct MonitorConfig {
    std::chrono::milliseconds interval{2000};
    // Zero disables heartbeats.
    std::chrono::milliseconds heartbeat{300000};
    MonitorMode mode = MonitorMode::Active;
    bool guiOnly = false;
    bool includeSystem = false;
    bool procSnapshot = false;
    // Unset means the built-in ignore list.
    std::optional<std::set<std::string>> ignoreNames;
    std::set<std::string> whitelist;

    RotationTrigger rotation = RotationTrigger::Size;
    std::int64_t maxBytes = 1000000;
    int backupCount = 5;
    bool compress = true;
    SinkKind sink = SinkKind::None;
    std::string archiveDir;

    LineFormat lineFormat = LineFormat::Text;
    bool echo = false;
    std::string logfile = "app-usage.log";
    std::chrono::milliseconds browserTitleWait{500};

    bool listOnce = false;
    bool trace = false;
    std::string configFile;
};

struct ConfigLoadResult {
    MonitorConfig config;
    // Any entry here aborts startup.
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    bool helpRequested = false;
    std::string helpText;
};

constexpr std::chrono::milliseconds kMinimumInterval{100};

// Layers, later wins: defaults, APPTRAIL_* environment, the JSON file named by
// --config, then the remaining command-line flags. arguments includes argv[0].
ConfigLoadResult loadMonitorConfig(const QStringList &arguments);

} // namespace apptrail
