#ifndef MARIONETTE_FAKE_DESKTOP_BACKEND_H
#define MARIONETTE_FAKE_DESKTOP_BACKEND_H

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <opencv2/core.hpp>
#include "common/error_handler.h"
#include "common/os_utils.h"
#include "ocal/desktop_backend.h"

namespace marionette {
namespace testing {

struct RecordedClick {
    ocal::Point point;
    ocal::MouseButton button;
    int count;
};

struct RecordedDrag {
    ocal::Point from;
    ocal::Point to;
    ocal::MouseButton button;
};

/**
 * @brief Scripted desktop: processes, windows and a screen image held in memory
 *
 * Spawned processes show one 400x300 window unless told otherwise. Closing
 * the last window of a process ends it, kills end it at once. The screen is
 * a mid-gray image tests can paint on.
 *
 * Screen captures and window geometry changes can be slowed down with
 * captureDelay and geometryDelay; the fake counts every time one of them
 * starts while the other kind is still running.
 */
class FakeDesktopBackend : public ocal::DesktopBackend {
public:
    enum class SpawnBehavior {
        SHOW_WINDOW,
        NO_WINDOW,
        EXIT_IMMEDIATELY
    };

    explicit FakeDesktopBackend(int screenWidth = 1280, int screenHeight = 800)
        : m_screen(screenHeight, screenWidth, CV_8UC3, cv::Scalar(128, 128, 128)),
          m_nextPid(1000), m_nextWindow(0x100), m_foreground(ocal::INVALID_WINDOW_HANDLE),
          m_nextWindowX(100),
          spawnBehavior(SpawnBehavior::SHOW_WINDOW), ignoreClose(false),
          ignoreActivation(false), ignoreGeometry(false),
          captureDelay(0), geometryDelay(0) {}

    std::string name() const override { return "fake"; }

    ocal::ProcessId spawnProcess(const std::string& executablePath,
                                 const std::vector<std::string>& arguments,
                                 const std::string&) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_spawned.push_back(executablePath);
        m_lastArguments = arguments;

        ocal::ProcessId pid = m_nextPid++;
        Process& process = m_processes[pid];
        process.info.processId = pid;
        process.info.name = os::PathUtils::getFileName(executablePath);
        process.info.executablePath = executablePath;
        process.info.startTime = std::chrono::system_clock::now();

        if (spawnBehavior == SpawnBehavior::EXIT_IMMEDIATELY) {
            process.running = false;
        } else if (spawnBehavior == SpawnBehavior::SHOW_WINDOW) {
            addWindowLocked(pid, process.info.name, ocal::Rectangle(m_nextWindowX, 100, 400, 300));
            m_nextWindowX += 20;
        }
        return pid;
    }

    bool isProcessRunning(ocal::ProcessId pid) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_processes.find(pid);
        return it != m_processes.end() && it->second.running;
    }

    bool isProcessResponding(ocal::ProcessId pid) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_processes.find(pid);
        return it != m_processes.end() && it->second.running && it->second.responding;
    }

    std::vector<ocal::ProcessInfo> listProcesses() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<ocal::ProcessInfo> processes;
        for (const auto& entry : m_processes) {
            if (entry.second.running) {
                processes.push_back(entry.second.info);
            }
        }
        return processes;
    }

    bool killProcess(ocal::ProcessId pid, bool force) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_processes.find(pid);
        if (it == m_processes.end() || !it->second.running) {
            return false;
        }
        ++m_killRequests;
        if (force || !ignoreClose) {
            endProcessLocked(pid);
        }
        return true;
    }

    std::vector<ocal::WindowInfo> enumerateWindows(ocal::ProcessId pid) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<ocal::WindowInfo> windows;
        for (ocal::WindowHandle handle : m_windowOrder) {
            const ocal::WindowInfo& info = m_windows.at(handle);
            if (info.processId == pid) {
                windows.push_back(info);
            }
        }
        return windows;
    }

    std::optional<ocal::WindowInfo> getWindowInfo(ocal::WindowHandle handle) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_windows.find(handle);
        if (it == m_windows.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    ocal::WindowHandle foregroundWindow() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_foreground;
    }

    bool activateWindow(ocal::WindowHandle handle) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_activationRequests;
        if (m_windows.count(handle) == 0) {
            return false;
        }
        if (!ignoreActivation) {
            m_foreground = handle;
        }
        return true;
    }

    bool moveWindow(ocal::WindowHandle handle, int x, int y) override {
        return mutateWindow(handle, [x, y](ocal::WindowInfo& info) {
            int dx = x - info.bounds.x;
            int dy = y - info.bounds.y;
            info.bounds.x += dx;
            info.bounds.y += dy;
            info.clientBounds.x += dx;
            info.clientBounds.y += dy;
        });
    }

    bool resizeWindow(ocal::WindowHandle handle, int width, int height) override {
        return mutateWindow(handle, [width, height](ocal::WindowInfo& info) {
            info.clientBounds.width = width;
            info.clientBounds.height = height;
            info.bounds.width = width + 2 * FRAME;
            info.bounds.height = height + FRAME + TITLE_BAR;
        });
    }

    bool maximizeWindow(ocal::WindowHandle handle) override {
        ocal::Rectangle screen = screenBounds();
        return mutateWindow(handle, [screen](ocal::WindowInfo& info) {
            info.bounds = screen;
            info.clientBounds = ocal::Rectangle(screen.x, screen.y + TITLE_BAR,
                                                screen.width, screen.height - TITLE_BAR);
            info.isMaximized = true;
            info.isMinimized = false;
            info.isVisible = true;
        });
    }

    bool minimizeWindow(ocal::WindowHandle handle) override {
        return mutateWindow(handle, [](ocal::WindowInfo& info) {
            info.isMinimized = true;
            info.isVisible = false;
        });
    }

    bool restoreWindow(ocal::WindowHandle handle) override {
        return mutateWindow(handle, [](ocal::WindowInfo& info) {
            info.isMinimized = false;
            info.isMaximized = false;
            info.isVisible = true;
        });
    }

    bool closeWindow(ocal::WindowHandle handle) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_windows.find(handle);
        if (it == m_windows.end()) {
            return false;
        }
        if (ignoreClose) {
            return true;
        }
        ocal::ProcessId owner = it->second.processId;
        removeWindowLocked(handle);
        bool hasWindows = std::any_of(m_windows.begin(), m_windows.end(),
            [owner](const std::pair<const ocal::WindowHandle, ocal::WindowInfo>& w) {
                return w.second.processId == owner;
            });
        if (!hasWindows) {
            m_processes[owner].running = false;
        }
        return true;
    }

    void click(const ocal::Point& screenPoint, ocal::MouseButton button, int clickCount) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_clicks.push_back(RecordedClick{screenPoint, button, clickCount});
    }

    void moveMouse(const ocal::Point& screenPoint) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pointerMoves.push_back(screenPoint);
    }

    void drag(const ocal::Point& from, const ocal::Point& to, ocal::MouseButton button) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_drags.push_back(RecordedDrag{from, to, button});
    }

    void typeText(const std::string& utf8Text) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_typed.push_back(utf8Text);
    }

    void pressKeys(const ocal::KeyCombo& combo) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pressed.push_back(combo.toString());
    }

    cv::Mat captureScreen(const ocal::Rectangle& region) override {
        Activity active(m_activeCaptures, m_activeGeometryChanges, m_overlaps);
        if (captureDelay.count() > 0) {
            std::this_thread::sleep_for(captureDelay);
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_captures;
        ocal::Rectangle clipped = region.intersect(ocal::Rectangle(0, 0, m_screen.cols, m_screen.rows));
        if (clipped.empty()) {
            throw OperationError("Capture region is off screen", region.toString());
        }
        return m_screen(clipped.toCvRect()).clone();
    }

    ocal::Rectangle screenBounds() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return ocal::Rectangle(0, 0, m_screen.cols, m_screen.rows);
    }

    // Scripting

    ocal::ProcessId addProcess(const std::string& name,
                               std::chrono::system_clock::time_point startTime = std::chrono::system_clock::now()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ocal::ProcessId pid = m_nextPid++;
        Process& process = m_processes[pid];
        process.info.processId = pid;
        process.info.name = name;
        process.info.executablePath = "/usr/bin/" + name;
        process.info.startTime = startTime;
        return pid;
    }

    ocal::WindowHandle addWindow(ocal::ProcessId pid, const std::string& title,
                                 const ocal::Rectangle& clientBounds) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return addWindowLocked(pid, title, clientBounds);
    }

    void removeWindow(ocal::WindowHandle handle) {
        std::lock_guard<std::mutex> lock(m_mutex);
        removeWindowLocked(handle);
    }

    void exitProcess(ocal::ProcessId pid) {
        std::lock_guard<std::mutex> lock(m_mutex);
        endProcessLocked(pid);
    }

    void setResponding(ocal::ProcessId pid, bool responding) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_processes[pid].responding = responding;
    }

    // Copy image onto the screen with its top-left corner at screen (x, y)
    void paint(const cv::Mat& image, int x, int y) {
        std::lock_guard<std::mutex> lock(m_mutex);
        image.copyTo(m_screen(cv::Rect(x, y, image.cols, image.rows)));
    }

    void fill(const ocal::Rectangle& region, const cv::Scalar& color) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_screen(region.toCvRect()).setTo(color);
    }

    std::vector<RecordedClick> clicks() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_clicks;
    }

    std::vector<ocal::Point> pointerMoves() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pointerMoves;
    }

    std::vector<RecordedDrag> drags() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_drags;
    }

    std::vector<std::string> typedText() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_typed;
    }

    std::vector<std::string> pressedKeys() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pressed;
    }

    std::vector<std::string> spawnedExecutables() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_spawned;
    }

    std::vector<std::string> lastSpawnArguments() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastArguments;
    }

    int captureCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_captures;
    }

    // Captures that ran while a geometry change was in progress, or the reverse
    int overlappingOperations() const {
        return m_overlaps.load();
    }

    int activationRequests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_activationRequests;
    }

    int killRequests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_killRequests;
    }

    static constexpr int FRAME = 4;
    static constexpr int TITLE_BAR = 26;

private:
    struct Process {
        ocal::ProcessInfo info;
        bool running = true;
        bool responding = true;
    };

    class Activity {
    public:
        Activity(std::atomic<int>& mine, const std::atomic<int>& other, std::atomic<int>& overlaps)
            : m_mine(mine) {
            ++m_mine;
            if (other.load() > 0) {
                ++overlaps;
            }
        }
        ~Activity() { --m_mine; }

        Activity(const Activity&) = delete;
        Activity& operator=(const Activity&) = delete;

    private:
        std::atomic<int>& m_mine;
    };

    template<typename Mutation>
    bool mutateWindow(ocal::WindowHandle handle, Mutation mutation) {
        Activity active(m_activeGeometryChanges, m_activeCaptures, m_overlaps);
        if (geometryDelay.count() > 0) {
            std::this_thread::sleep_for(geometryDelay);
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_windows.find(handle);
        if (it == m_windows.end()) {
            return false;
        }
        if (!ignoreGeometry) {
            mutation(it->second);
        }
        return true;
    }

    ocal::WindowHandle addWindowLocked(ocal::ProcessId pid, const std::string& title,
                                       const ocal::Rectangle& clientBounds) {
        ocal::WindowInfo info;
        info.handle = m_nextWindow++;
        info.title = title;
        info.className = "FakeWindow";
        info.clientBounds = clientBounds;
        info.bounds = ocal::Rectangle(clientBounds.x - FRAME, clientBounds.y - TITLE_BAR,
                                      clientBounds.width + 2 * FRAME, clientBounds.height + FRAME + TITLE_BAR);
        info.isVisible = true;
        info.processId = pid;
        m_windows[info.handle] = info;
        m_windowOrder.push_back(info.handle);
        return info.handle;
    }

    void removeWindowLocked(ocal::WindowHandle handle) {
        m_windows.erase(handle);
        m_windowOrder.erase(std::remove(m_windowOrder.begin(), m_windowOrder.end(), handle), m_windowOrder.end());
        if (m_foreground == handle) {
            m_foreground = ocal::INVALID_WINDOW_HANDLE;
        }
    }

    void endProcessLocked(ocal::ProcessId pid) {
        m_processes[pid].running = false;
        std::vector<ocal::WindowHandle> owned;
        for (const auto& entry : m_windows) {
            if (entry.second.processId == pid) {
                owned.push_back(entry.first);
            }
        }
        for (ocal::WindowHandle handle : owned) {
            removeWindowLocked(handle);
        }
    }

    mutable std::mutex m_mutex;
    cv::Mat m_screen;
    std::map<ocal::ProcessId, Process> m_processes;
    std::map<ocal::WindowHandle, ocal::WindowInfo> m_windows;
    std::vector<ocal::WindowHandle> m_windowOrder;
    ocal::ProcessId m_nextPid;
    ocal::WindowHandle m_nextWindow;
    ocal::WindowHandle m_foreground;
    int m_nextWindowX;

    std::vector<std::string> m_spawned;
    std::vector<std::string> m_lastArguments;
    std::vector<RecordedClick> m_clicks;
    std::vector<ocal::Point> m_pointerMoves;
    std::vector<RecordedDrag> m_drags;
    std::vector<std::string> m_typed;
    std::vector<std::string> m_pressed;
    int m_captures = 0;
    int m_activationRequests = 0;
    int m_killRequests = 0;
    std::atomic<int> m_activeCaptures{0};
    std::atomic<int> m_activeGeometryChanges{0};
    std::atomic<int> m_overlaps{0};

public:
    // Set before the calls they affect
    SpawnBehavior spawnBehavior;
    bool ignoreClose;
    bool ignoreActivation;
    bool ignoreGeometry;
    std::chrono::milliseconds captureDelay;
    std::chrono::milliseconds geometryDelay;
};

} // namespace testing
} // namespace marionette

#endif // MARIONETTE_FAKE_DESKTOP_BACKEND_H
