#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace apptrail {

// WindowSystem is the boundary to the desktop's window manager.
// foregroundWindow() fills owningProcessId and title; the process name is
// resolved by the caller through the ProcessTable. Absent values are normal.
class WindowSystem {
public:
    virtual ~WindowSystem() = default;

    virtual WindowObservation foregroundWindow() = 0;

    // One enumeration of the top-level windows; callers filter the result.
    virtual std::vector<TopLevelWindow> topLevelWindows() = 0;
};

// Pids owning at least one visible top-level window with a non-empty title.
TopLevelWindowSet visibleTitledWindowPids(const std::vector<TopLevelWindow> &windows);

// Title of the first visible, titled window owned by pid.
std::optional<std::string> windowTitleForPid(const std::vector<TopLevelWindow> &windows,
                                             ProcessId pid);

} // namespace apptrail
