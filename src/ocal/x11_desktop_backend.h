#ifndef MARIONETTE_X11_DESKTOP_BACKEND_H
#define MARIONETTE_X11_DESKTOP_BACKEND_H

#ifndef _WIN32

#include "desktop_backend.h"
#include <mutex>

// Xlib is kept out of this header; it defines macros (None, Status, Bool)
// that collide with ordinary identifiers.
struct _XDisplay;

namespace marionette {
namespace ocal {

/**
 * @brief DesktopBackend for an X11 session with an EWMH window manager
 *
 * Windows are found through _NET_CLIENT_LIST and _NET_WM_PID, state changes
 * go through _NET_WM_STATE client messages and input is synthesized with the
 * XTest extension. The DISPLAY environment variable selects the server.
 */
class X11DesktopBackend : public DesktopBackend {
public:
    /**
     * @throws WindowOperationError if the display cannot be opened or XTest is missing
     */
    X11DesktopBackend();
    ~X11DesktopBackend() override;

    X11DesktopBackend(const X11DesktopBackend&) = delete;
    X11DesktopBackend& operator=(const X11DesktopBackend&) = delete;

    std::string name() const override { return "x11"; }

    ProcessId spawnProcess(const std::string& executablePath,
                           const std::vector<std::string>& arguments,
                           const std::string& workingDirectory) override;
    bool isProcessRunning(ProcessId pid) override;
    bool isProcessResponding(ProcessId pid) override;
    std::vector<ProcessInfo> listProcesses() override;
    bool killProcess(ProcessId pid, bool force) override;

    std::vector<WindowInfo> enumerateWindows(ProcessId pid) override;
    std::optional<WindowInfo> getWindowInfo(WindowHandle handle) override;
    WindowHandle foregroundWindow() override;
    bool activateWindow(WindowHandle handle) override;
    bool moveWindow(WindowHandle handle, int x, int y) override;
    bool resizeWindow(WindowHandle handle, int width, int height) override;
    bool maximizeWindow(WindowHandle handle) override;
    bool minimizeWindow(WindowHandle handle) override;
    bool restoreWindow(WindowHandle handle) override;
    bool closeWindow(WindowHandle handle) override;

    void click(const Point& screenPoint, MouseButton button, int clickCount) override;
    void moveMouse(const Point& screenPoint) override;
    void drag(const Point& from, const Point& to, MouseButton button) override;
    void typeText(const std::string& utf8Text) override;
    void pressKeys(const KeyCombo& combo) override;

    cv::Mat captureScreen(const Rectangle& region) override;
    Rectangle screenBounds() override;

private:
    // Every call below expects m_mutex to be held
    std::vector<unsigned long> clientWindows();
    bool readCardinal(unsigned long window, const char* property, unsigned long& value);
    std::vector<unsigned long> readAtomList(unsigned long window, const char* property);
    std::optional<WindowInfo> describeWindow(unsigned long window);
    bool sendWmMessage(unsigned long window, const char* messageType,
                       long data0, long data1 = 0, long data2 = 0, long data3 = 0);
    unsigned long atom(const char* name);
    void tapKeysym(unsigned long keysym);
    bool flushAndCheck();

    _XDisplay* m_display;
    unsigned long m_root;
    std::recursive_mutex m_mutex;
};

} // namespace ocal
} // namespace marionette

#endif // _WIN32

#endif // MARIONETTE_X11_DESKTOP_BACKEND_H
