#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "daemon/window_system.hpp"

typedef struct _XDisplay Display;

namespace apptrail {

// EWMH window queries through Xlib (_NET_ACTIVE_WINDOW, _NET_CLIENT_LIST,
// _NET_WM_PID, _NET_WM_NAME). Without a reachable display every query returns
// absent values. Xlib calls are serialized because both trackers share one
// instance.
class X11WindowSystem : public WindowSystem {
public:
    X11WindowSystem();
    ~X11WindowSystem() override;

    X11WindowSystem(const X11WindowSystem &) = delete;
    X11WindowSystem &operator=(const X11WindowSystem &) = delete;

    bool isConnected() const;

    WindowObservation foregroundWindow() override;
    std::vector<TopLevelWindow> topLevelWindows() override;

private:
    std::vector<unsigned long> windowListProperty(unsigned long window, const char *atomName);
    std::optional<ProcessId> windowPid(unsigned long window);
    std::optional<std::string> windowTitle(unsigned long window);
    bool windowViewable(unsigned long window);

    std::mutex m_mutex;
    Display *m_display = nullptr;
};

} // namespace apptrail
