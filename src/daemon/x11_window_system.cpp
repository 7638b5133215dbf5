#include "daemon/x11_window_system.hpp"

#include "common/logging.hpp"

#include <nlohmann/json.hpp>

// Xlib defines macros such as None, Bool and Status; keep it after Qt and json.
#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>

namespace apptrail {

namespace {

constexpr long kMaxPropertyItems = 4096;

// Windows routinely vanish between listing and querying; the resulting
// BadWindow errors must not terminate the process.
int ignoreXError(Display *, XErrorEvent *)
{
    return 0;
}

} // namespace

X11WindowSystem::X11WindowSystem()
{
    XSetErrorHandler(ignoreXError);
    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        ATLOG_WARN(QStringLiteral("X11WindowSystem"),
                   QStringLiteral("X11WindowSystem"),
                   QStringLiteral("display_unavailable"),
                   QStringLiteral("no_x11_display"),
                   QStringLiteral("XOpenDisplay"),
                   apptrail::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"DISPLAY", qEnvironmentVariable("DISPLAY").toStdString()}}));
    }
}

X11WindowSystem::~X11WindowSystem()
{
    if (m_display) {
        XCloseDisplay(m_display);
    }
}

bool X11WindowSystem::isConnected() const
{
    return m_display != nullptr;
}

WindowObservation X11WindowSystem::foregroundWindow()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    WindowObservation observation;
    if (!m_display) {
        return observation;
    }

    const auto active = windowListProperty(DefaultRootWindow(m_display), "_NET_ACTIVE_WINDOW");
    if (active.empty() || active.front() == 0) {
        return observation;
    }

    const unsigned long window = active.front();
    observation.owningProcessId = windowPid(window);
    observation.title = windowTitle(window);
    return observation;
}

std::vector<TopLevelWindow> X11WindowSystem::topLevelWindows()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<TopLevelWindow> windows;
    if (!m_display) {
        return windows;
    }

    for (unsigned long handle : windowListProperty(DefaultRootWindow(m_display),
                                                   "_NET_CLIENT_LIST")) {
        TopLevelWindow window;
        window.handle = handle;
        window.owningProcessId = windowPid(handle);
        window.title = windowTitle(handle);
        window.visible = windowViewable(handle);
        windows.push_back(std::move(window));
    }
    return windows;
}

std::vector<unsigned long> X11WindowSystem::windowListProperty(unsigned long window,
                                                               const char *atomName)
{
    std::vector<unsigned long> values;
    const Atom atom = XInternAtom(m_display, atomName, True);
    if (atom == None) {
        return values;
    }

    Atom actualType = None;
    int actualFormat = 0;
    unsigned long itemCount = 0;
    unsigned long bytesAfter = 0;
    unsigned char *data = nullptr;
    const int status = XGetWindowProperty(m_display, window, atom, 0, kMaxPropertyItems, False,
                                          AnyPropertyType, &actualType, &actualFormat,
                                          &itemCount, &bytesAfter, &data);
    if (status != Success || !data) {
        return values;
    }

    if (actualFormat == 32) {
        // Format-32 properties are delivered as an array of long.
        const auto *items = reinterpret_cast<const unsigned long *>(data);
        values.assign(items, items + itemCount);
    }
    XFree(data);
    return values;
}

std::optional<ProcessId> X11WindowSystem::windowPid(unsigned long window)
{
    const auto values = windowListProperty(window, "_NET_WM_PID");
    if (values.empty() || values.front() == 0) {
        return std::nullopt;
    }
    return static_cast<ProcessId>(values.front());
}

std::optional<std::string> X11WindowSystem::windowTitle(unsigned long window)
{
    const Atom netWmName = XInternAtom(m_display, "_NET_WM_NAME", True);
    const Atom utf8String = XInternAtom(m_display, "UTF8_STRING", True);
    if (netWmName != None && utf8String != None) {
        Atom actualType = None;
        int actualFormat = 0;
        unsigned long itemCount = 0;
        unsigned long bytesAfter = 0;
        unsigned char *data = nullptr;
        const int status = XGetWindowProperty(m_display, window, netWmName, 0, kMaxPropertyItems,
                                              False, utf8String, &actualType, &actualFormat,
                                              &itemCount, &bytesAfter, &data);
        if (status == Success && data) {
            std::string title;
            if (actualFormat == 8 && itemCount > 0) {
                title.assign(reinterpret_cast<const char *>(data), itemCount);
            }
            XFree(data);
            if (!title.empty()) {
                return title;
            }
        }
    }

    // Legacy WM_NAME for clients that do not set the EWMH name.
    char *legacy = nullptr;
    if (XFetchName(m_display, window, &legacy) != 0 && legacy) {
        std::string title(legacy);
        XFree(legacy);
        if (!title.empty()) {
            return title;
        }
    }
    return std::nullopt;
}

bool X11WindowSystem::windowViewable(unsigned long window)
{
    XWindowAttributes attributes{};
    if (XGetWindowAttributes(m_display, window, &attributes) == 0) {
        return false;
    }
    return attributes.map_state == IsViewable;
}

} // namespace apptrail
