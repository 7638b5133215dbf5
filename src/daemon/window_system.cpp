#include "daemon/window_system.hpp"

#include <algorithm>

namespace apptrail {

namespace {

bool isVisibleAndTitled(const TopLevelWindow &window)
{
    return window.visible && window.title.has_value() && !window.title->empty();
}

} // namespace

TopLevelWindowSet visibleTitledWindowPids(const std::vector<TopLevelWindow> &windows)
{
    TopLevelWindowSet pids;
    for (const auto &window : windows) {
        if (isVisibleAndTitled(window) && window.owningProcessId.has_value()) {
            pids.insert(*window.owningProcessId);
        }
    }
    return pids;
}

std::optional<std::string> windowTitleForPid(const std::vector<TopLevelWindow> &windows,
                                             ProcessId pid)
{
    const auto it = std::find_if(windows.begin(), windows.end(),
                                 [pid](const TopLevelWindow &window) {
                                     return isVisibleAndTitled(window)
                                         && window.owningProcessId == pid;
                                 });
    if (it == windows.end()) {
        return std::nullopt;
    }
    return it->title;
}

} // namespace apptrail
