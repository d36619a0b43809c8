#ifndef MARIONETTE_DESKTOP_BACKEND_H
#define MARIONETTE_DESKTOP_BACKEND_H

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>
#include <opencv2/core.hpp>
#include "key_combo.h"

namespace marionette {
namespace ocal {

// HWND on Windows, X11 Window id elsewhere; 0 is never a valid window
using WindowHandle = std::uint64_t;
constexpr WindowHandle INVALID_WINDOW_HANDLE = 0;

using ProcessId = std::uint32_t;

struct Point {
    int x;
    int y;

    Point(int px = 0, int py = 0) : x(px), y(py) {}
    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
};

/**
 * @brief Axis-aligned rectangle in screen (or image) pixels
 */
struct Rectangle {
    int x;
    int y;
    int width;
    int height;

    Rectangle(int px = 0, int py = 0, int w = 0, int h = 0)
        : x(px), y(py), width(w), height(h) {}

    int right() const { return x + width; }
    int bottom() const { return y + height; }
    bool empty() const { return width <= 0 || height <= 0; }
    long long area() const { return empty() ? 0 : static_cast<long long>(width) * height; }
    Point center() const { return Point(x + width / 2, y + height / 2); }

    bool contains(const Point& p) const {
        return p.x >= x && p.y >= y && p.x < right() && p.y < bottom();
    }

    Rectangle intersect(const Rectangle& other) const;

    bool operator==(const Rectangle& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rectangle& other) const { return !(*this == other); }

    cv::Rect toCvRect() const { return cv::Rect(x, y, width, height); }
    static Rectangle fromCvRect(const cv::Rect& r) { return Rectangle(r.x, r.y, r.width, r.height); }
    std::string toString() const;
};

struct WindowInfo {
    WindowHandle handle;
    std::string title;
    std::string className;
    Rectangle bounds;         // outer frame, screen coordinates
    Rectangle clientBounds;   // drawable area, screen coordinates
    bool isVisible;
    bool isMinimized;
    bool isMaximized;
    ProcessId processId;

    WindowInfo() : handle(INVALID_WINDOW_HANDLE), isVisible(false), isMinimized(false),
                   isMaximized(false), processId(0) {}
};

struct ProcessInfo {
    ProcessId processId;
    std::string name;             // executable file name, e.g. "gnome-calculator"
    std::string executablePath;   // may be empty when the OS denies access
    std::chrono::system_clock::time_point startTime;

    ProcessInfo() : processId(0) {}
};

enum class MouseButton {
    LEFT,
    RIGHT,
    MIDDLE
};

/**
 * @brief Everything the engine needs from the operating system.
 *
 * Implementations must be safe to call from several threads. Calls that
 * observe state (enumeration, info, capture) report a vanished window or
 * process through their return value; calls that act on the desktop return
 * false (or throw OperationError for input and capture) when the OS rejects
 * them. Nothing here waits for the effect of an action to become visible.
 */
class DesktopBackend {
public:
    virtual ~DesktopBackend() = default;

    virtual std::string name() const = 0;

    // Processes
    virtual ProcessId spawnProcess(const std::string& executablePath,
                                   const std::vector<std::string>& arguments,
                                   const std::string& workingDirectory) = 0;
    virtual bool isProcessRunning(ProcessId pid) = 0;
    virtual bool isProcessResponding(ProcessId pid) = 0;
    virtual std::vector<ProcessInfo> listProcesses() = 0;
    virtual bool killProcess(ProcessId pid, bool force) = 0;

    // Windows; enumerateWindows returns top-level windows of pid, topmost first
    virtual std::vector<WindowInfo> enumerateWindows(ProcessId pid) = 0;
    virtual std::optional<WindowInfo> getWindowInfo(WindowHandle handle) = 0;
    virtual WindowHandle foregroundWindow() = 0;
    virtual bool activateWindow(WindowHandle handle) = 0;
    virtual bool moveWindow(WindowHandle handle, int x, int y) = 0;
    virtual bool resizeWindow(WindowHandle handle, int width, int height) = 0;
    virtual bool maximizeWindow(WindowHandle handle) = 0;
    virtual bool minimizeWindow(WindowHandle handle) = 0;
    virtual bool restoreWindow(WindowHandle handle) = 0;
    virtual bool closeWindow(WindowHandle handle) = 0;

    // Input, screen coordinates
    virtual void click(const Point& screenPoint, MouseButton button, int clickCount) = 0;
    virtual void moveMouse(const Point& screenPoint) = 0;
    // Press at from, move there to to in small steps, release
    virtual void drag(const Point& from, const Point& to, MouseButton button) = 0;
    virtual void typeText(const std::string& utf8Text) = 0;
    virtual void pressKeys(const KeyCombo& combo) = 0;

    // Screen; returns a BGR CV_8UC3 image of the region
    virtual cv::Mat captureScreen(const Rectangle& region) = 0;
    virtual Rectangle screenBounds() = 0;
};

/**
 * @brief Backend for the platform the library was built for (Win32 or X11)
 * @throws WindowOperationError if the desktop session cannot be reached
 */
std::shared_ptr<DesktopBackend> createDefaultBackend();

} // namespace ocal
} // namespace marionette

#endif // MARIONETTE_DESKTOP_BACKEND_H
