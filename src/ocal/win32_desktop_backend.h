#ifndef MARIONETTE_WIN32_DESKTOP_BACKEND_H
#define MARIONETTE_WIN32_DESKTOP_BACKEND_H

#ifdef _WIN32

#include "desktop_backend.h"
#include <mutex>

namespace marionette {
namespace ocal {

/**
 * @brief DesktopBackend on top of user32/gdi32: EnumWindows, SendInput and BitBlt
 */
class Win32DesktopBackend : public DesktopBackend {
public:
    Win32DesktopBackend();
    ~Win32DesktopBackend() override = default;

    std::string name() const override { return "win32"; }

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
    // SendInput sequences from different threads must not interleave
    std::mutex m_inputMutex;
};

} // namespace ocal
} // namespace marionette

#endif // _WIN32

#endif // MARIONETTE_WIN32_DESKTOP_BACKEND_H
