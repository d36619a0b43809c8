#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#undef ERROR  // Undefine the Windows ERROR macro to avoid conflicts

#include "win32_desktop_backend.h"
#include "process_operations.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include "../common/raii_wrappers.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <map>
#include <thread>
#include <chrono>

namespace marionette {
namespace ocal {

namespace {
    // Motion events between press and release; toolkits ignore a drag that jumps
    const int DRAG_STEPS = 10;

    HWND toHwnd(WindowHandle handle) {
        return reinterpret_cast<HWND>(static_cast<uintptr_t>(handle));
    }

    WindowHandle fromHwnd(HWND hwnd) {
        return static_cast<WindowHandle>(reinterpret_cast<uintptr_t>(hwnd));
    }

    std::string wideToUtf8(const std::wstring& wide) {
        if (wide.empty()) return "";
        int size = WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()),
                                       nullptr, 0, nullptr, nullptr);
        std::string utf8(static_cast<size_t>(size), '\0');
        WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()),
                            &utf8[0], size, nullptr, nullptr);
        return utf8;
    }

    std::wstring utf8ToWide(const std::string& utf8) {
        if (utf8.empty()) return L"";
        int size = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), static_cast<int>(utf8.size()),
                                       nullptr, 0);
        std::wstring wide(static_cast<size_t>(size), L'\0');
        MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), static_cast<int>(utf8.size()), &wide[0], size);
        return wide;
    }

    Rectangle fromRect(const RECT& rect) {
        return Rectangle(rect.left, rect.top, rect.right - rect.left, rect.bottom - rect.top);
    }

    WindowInfo describeWindow(HWND hwnd) {
        WindowInfo info;
        info.handle = fromHwnd(hwnd);

        wchar_t title[512];
        int titleLength = GetWindowTextW(hwnd, title, static_cast<int>(sizeof(title) / sizeof(wchar_t)));
        info.title = wideToUtf8(std::wstring(title, static_cast<size_t>(titleLength > 0 ? titleLength : 0)));

        wchar_t className[256];
        int classLength = GetClassNameW(hwnd, className, static_cast<int>(sizeof(className) / sizeof(wchar_t)));
        info.className = wideToUtf8(std::wstring(className, static_cast<size_t>(classLength > 0 ? classLength : 0)));

        RECT rect;
        if (GetWindowRect(hwnd, &rect)) {
            info.bounds = fromRect(rect);
        }

        RECT client;
        if (GetClientRect(hwnd, &client)) {
            POINT origin = {0, 0};
            ClientToScreen(hwnd, &origin);
            info.clientBounds = Rectangle(origin.x, origin.y, client.right - client.left,
                                          client.bottom - client.top);
        }

        info.isVisible = IsWindowVisible(hwnd) != FALSE;
        info.isMinimized = IsIconic(hwnd) != FALSE;
        info.isMaximized = IsZoomed(hwnd) != FALSE;

        DWORD processId = 0;
        GetWindowThreadProcessId(hwnd, &processId);
        info.processId = static_cast<ProcessId>(processId);
        return info;
    }

    struct EnumWindowsData {
        std::vector<WindowInfo>* windows;
        DWORD targetProcessId;
    };

    // EnumWindows walks top-level windows in Z order, topmost first
    BOOL CALLBACK enumWindowsProc(HWND hwnd, LPARAM lParam) {
        auto* data = reinterpret_cast<EnumWindowsData*>(lParam);

        DWORD processId = 0;
        GetWindowThreadProcessId(hwnd, &processId);
        if (processId != data->targetProcessId) {
            return TRUE;
        }

        // Skip owned tool windows and invisible helper windows
        LONG_PTR exStyle = GetWindowLongPtr(hwnd, GWL_EXSTYLE);
        if (exStyle & WS_EX_TOOLWINDOW) {
            return TRUE;
        }
        if (!IsWindowVisible(hwnd) && !IsIconic(hwnd)) {
            return TRUE;
        }

        data->windows->push_back(describeWindow(hwnd));
        return TRUE;
    }

    WORD virtualKeyFor(const std::string& name) {
        static const std::map<std::string, WORD> namedKeys = {
            {"enter", VK_RETURN}, {"tab", VK_TAB}, {"escape", VK_ESCAPE},
            {"space", VK_SPACE}, {"backspace", VK_BACK}, {"delete", VK_DELETE},
            {"insert", VK_INSERT}, {"home", VK_HOME}, {"end", VK_END},
            {"pageup", VK_PRIOR}, {"pagedown", VK_NEXT},
            {"up", VK_UP}, {"down", VK_DOWN}, {"left", VK_LEFT}, {"right", VK_RIGHT},
            {"f1", VK_F1}, {"f2", VK_F2}, {"f3", VK_F3}, {"f4", VK_F4},
            {"f5", VK_F5}, {"f6", VK_F6}, {"f7", VK_F7}, {"f8", VK_F8},
            {"f9", VK_F9}, {"f10", VK_F10}, {"f11", VK_F11}, {"f12", VK_F12}
        };
        auto it = namedKeys.find(name);
        return it != namedKeys.end() ? it->second : 0;
    }

    bool isExtendedKey(WORD vk) {
        switch (vk) {
            case VK_INSERT: case VK_DELETE: case VK_HOME: case VK_END:
            case VK_PRIOR: case VK_NEXT: case VK_UP: case VK_DOWN:
            case VK_LEFT: case VK_RIGHT: case VK_RCONTROL: case VK_RMENU:
            case VK_LWIN: case VK_RWIN:
                return true;
            default:
                return false;
        }
    }

    INPUT keyInput(WORD vk, bool isDown) {
        INPUT input = {};
        input.type = INPUT_KEYBOARD;
        input.ki.wVk = vk;
        input.ki.dwFlags = isDown ? 0 : KEYEVENTF_KEYUP;
        if (isExtendedKey(vk)) {
            input.ki.dwFlags |= KEYEVENTF_EXTENDEDKEY;
        }
        return input;
    }

    INPUT unicodeInput(wchar_t unit, bool isDown) {
        INPUT input = {};
        input.type = INPUT_KEYBOARD;
        input.ki.wScan = unit;
        input.ki.dwFlags = KEYEVENTF_UNICODE | (isDown ? 0 : KEYEVENTF_KEYUP);
        return input;
    }

    void sendInputs(std::vector<INPUT>& inputs, const std::string& what) {
        if (inputs.empty()) return;
        UINT sent = SendInput(static_cast<UINT>(inputs.size()), inputs.data(), sizeof(INPUT));
        if (sent != inputs.size()) {
            throw OperationError("SendInput rejected " + what,
                                 "error " + std::to_string(GetLastError()));
        }
    }

    WORD modifierKey(Modifier m) {
        switch (m) {
            case Modifier::CTRL: return VK_LCONTROL;
            case Modifier::SHIFT: return VK_LSHIFT;
            case Modifier::ALT: return VK_LMENU;
            case Modifier::META: return VK_LWIN;
        }
        return 0;
    }
}

Win32DesktopBackend::Win32DesktopBackend() {
    // Physical pixels everywhere, so captures line up with window rectangles
    SetProcessDPIAware();
    SLOG_INFO().message("Win32 desktop backend initialized");
}

ProcessId Win32DesktopBackend::spawnProcess(const std::string& executablePath,
                                            const std::vector<std::string>& arguments,
                                            const std::string& workingDirectory) {
    return process::spawn(executablePath, arguments, workingDirectory);
}

bool Win32DesktopBackend::isProcessRunning(ProcessId pid) {
    return process::isRunning(pid);
}

bool Win32DesktopBackend::isProcessResponding(ProcessId pid) {
    for (const auto& window : enumerateWindows(pid)) {
        DWORD_PTR result = 0;
        if (!SendMessageTimeoutW(toHwnd(window.handle), WM_NULL, 0, 0,
                                 SMTO_ABORTIFHUNG | SMTO_BLOCK, 1000, &result)) {
            return false;
        }
    }
    return true;
}

std::vector<ProcessInfo> Win32DesktopBackend::listProcesses() {
    return process::listProcesses();
}

bool Win32DesktopBackend::killProcess(ProcessId pid, bool force) {
    return process::terminate(pid, force);
}

std::vector<WindowInfo> Win32DesktopBackend::enumerateWindows(ProcessId pid) {
    std::vector<WindowInfo> windows;
    EnumWindowsData data{&windows, static_cast<DWORD>(pid)};
    EnumWindows(enumWindowsProc, reinterpret_cast<LPARAM>(&data));
    return windows;
}

std::optional<WindowInfo> Win32DesktopBackend::getWindowInfo(WindowHandle handle) {
    HWND hwnd = toHwnd(handle);
    if (!hwnd || !IsWindow(hwnd)) {
        return std::nullopt;
    }
    return describeWindow(hwnd);
}

WindowHandle Win32DesktopBackend::foregroundWindow() {
    return fromHwnd(GetForegroundWindow());
}

bool Win32DesktopBackend::activateWindow(WindowHandle handle) {
    HWND hwnd = toHwnd(handle);
    if (!hwnd || !IsWindow(hwnd)) return false;

    if (IsIconic(hwnd)) {
        ShowWindow(hwnd, SW_RESTORE);
    }

    if (SetForegroundWindow(hwnd)) {
        return true;
    }

    SetWindowPos(hwnd, HWND_TOP, 0, 0, 0, 0, SWP_NOMOVE | SWP_NOSIZE | SWP_SHOWWINDOW);

    // Foreground lock: borrow the input queue of the current foreground thread
    HWND foreground = GetForegroundWindow();
    if (foreground != hwnd) {
        DWORD foregroundThreadId = GetWindowThreadProcessId(foreground, nullptr);
        DWORD currentThreadId = GetCurrentThreadId();
        if (foregroundThreadId != currentThreadId) {
            AttachThreadInput(currentThreadId, foregroundThreadId, TRUE);
            BOOL result = SetForegroundWindow(hwnd);
            AttachThreadInput(currentThreadId, foregroundThreadId, FALSE);
            if (result) {
                SLOG_DEBUG().message("Window activated with thread attachment method");
                return true;
            }
        }
    }

    return BringWindowToTop(hwnd) != FALSE;
}

bool Win32DesktopBackend::moveWindow(WindowHandle handle, int x, int y) {
    return SetWindowPos(toHwnd(handle), nullptr, x, y, 0, 0,
                        SWP_NOSIZE | SWP_NOZORDER | SWP_NOACTIVATE) != FALSE;
}

bool Win32DesktopBackend::resizeWindow(WindowHandle handle, int width, int height) {
    return SetWindowPos(toHwnd(handle), nullptr, 0, 0, width, height,
                        SWP_NOMOVE | SWP_NOZORDER | SWP_NOACTIVATE) != FALSE;
}

bool Win32DesktopBackend::maximizeWindow(WindowHandle handle) {
    HWND hwnd = toHwnd(handle);
    if (!IsWindow(hwnd)) return false;
    ShowWindow(hwnd, SW_MAXIMIZE);
    return true;
}

bool Win32DesktopBackend::minimizeWindow(WindowHandle handle) {
    HWND hwnd = toHwnd(handle);
    if (!IsWindow(hwnd)) return false;
    ShowWindow(hwnd, SW_MINIMIZE);
    return true;
}

bool Win32DesktopBackend::restoreWindow(WindowHandle handle) {
    HWND hwnd = toHwnd(handle);
    if (!IsWindow(hwnd)) return false;
    ShowWindow(hwnd, SW_RESTORE);
    return true;
}

bool Win32DesktopBackend::closeWindow(WindowHandle handle) {
    return PostMessageW(toHwnd(handle), WM_CLOSE, 0, 0) != FALSE;
}

void Win32DesktopBackend::click(const Point& screenPoint, MouseButton button, int clickCount) {
    std::lock_guard<std::mutex> lock(m_inputMutex);

    if (!SetCursorPos(screenPoint.x, screenPoint.y)) {
        throw OperationError("SetCursorPos failed", "error " + std::to_string(GetLastError()),
                             "(" + std::to_string(screenPoint.x) + "," + std::to_string(screenPoint.y) + ")");
    }

    DWORD downFlag = MOUSEEVENTF_LEFTDOWN;
    DWORD upFlag = MOUSEEVENTF_LEFTUP;
    switch (button) {
        case MouseButton::RIGHT: downFlag = MOUSEEVENTF_RIGHTDOWN; upFlag = MOUSEEVENTF_RIGHTUP; break;
        case MouseButton::MIDDLE: downFlag = MOUSEEVENTF_MIDDLEDOWN; upFlag = MOUSEEVENTF_MIDDLEUP; break;
        case MouseButton::LEFT: break;
    }

    for (int i = 0; i < std::max(1, clickCount); ++i) {
        std::vector<INPUT> inputs(2);
        inputs[0].type = INPUT_MOUSE;
        inputs[0].mi.dwFlags = downFlag;
        inputs[1].type = INPUT_MOUSE;
        inputs[1].mi.dwFlags = upFlag;
        sendInputs(inputs, "mouse click");
    }
}

void Win32DesktopBackend::moveMouse(const Point& screenPoint) {
    std::lock_guard<std::mutex> lock(m_inputMutex);

    if (!SetCursorPos(screenPoint.x, screenPoint.y)) {
        throw OperationError("SetCursorPos failed", "error " + std::to_string(GetLastError()),
                             "(" + std::to_string(screenPoint.x) + "," + std::to_string(screenPoint.y) + ")");
    }
}

void Win32DesktopBackend::drag(const Point& from, const Point& to, MouseButton button) {
    std::lock_guard<std::mutex> lock(m_inputMutex);

    if (!SetCursorPos(from.x, from.y)) {
        throw OperationError("SetCursorPos failed", "error " + std::to_string(GetLastError()),
                             "(" + std::to_string(from.x) + "," + std::to_string(from.y) + ")");
    }

    DWORD downFlag = MOUSEEVENTF_LEFTDOWN;
    DWORD upFlag = MOUSEEVENTF_LEFTUP;
    switch (button) {
        case MouseButton::RIGHT: downFlag = MOUSEEVENTF_RIGHTDOWN; upFlag = MOUSEEVENTF_RIGHTUP; break;
        case MouseButton::MIDDLE: downFlag = MOUSEEVENTF_MIDDLEDOWN; upFlag = MOUSEEVENTF_MIDDLEUP; break;
        case MouseButton::LEFT: break;
    }

    // Absolute coordinates for MOUSEEVENTF_ABSOLUTE are normalized to 0..65535 over the virtual desktop
    int left = GetSystemMetrics(SM_XVIRTUALSCREEN);
    int top = GetSystemMetrics(SM_YVIRTUALSCREEN);
    int width = std::max(1, GetSystemMetrics(SM_CXVIRTUALSCREEN) - 1);
    int height = std::max(1, GetSystemMetrics(SM_CYVIRTUALSCREEN) - 1);

    std::vector<INPUT> inputs;
    INPUT press = {};
    press.type = INPUT_MOUSE;
    press.mi.dwFlags = downFlag;
    inputs.push_back(press);
    for (int step = 1; step <= DRAG_STEPS; ++step) {
        int x = from.x + (to.x - from.x) * step / DRAG_STEPS;
        int y = from.y + (to.y - from.y) * step / DRAG_STEPS;
        INPUT motion = {};
        motion.type = INPUT_MOUSE;
        motion.mi.dx = static_cast<LONG>((x - left) * 65535LL / width);
        motion.mi.dy = static_cast<LONG>((y - top) * 65535LL / height);
        motion.mi.dwFlags = MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE | MOUSEEVENTF_VIRTUALDESK;
        inputs.push_back(motion);
    }
    INPUT release = {};
    release.type = INPUT_MOUSE;
    release.mi.dwFlags = upFlag;
    inputs.push_back(release);
    sendInputs(inputs, "mouse drag");
}

void Win32DesktopBackend::typeText(const std::string& utf8Text) {
    std::lock_guard<std::mutex> lock(m_inputMutex);

    std::wstring wide = utf8ToWide(utf8Text);
    std::vector<INPUT> inputs;
    inputs.reserve(wide.size() * 2);
    for (wchar_t unit : wide) {
        if (unit == L'\n') {
            inputs.push_back(keyInput(VK_RETURN, true));
            inputs.push_back(keyInput(VK_RETURN, false));
            continue;
        }
        inputs.push_back(unicodeInput(unit, true));
        inputs.push_back(unicodeInput(unit, false));
    }
    sendInputs(inputs, "text input");
}

void Win32DesktopBackend::pressKeys(const KeyCombo& combo) {
    std::lock_guard<std::mutex> lock(m_inputMutex);

    WORD vk = 0;
    bool needsShift = false;
    if (combo.isNamedKey()) {
        vk = virtualKeyFor(combo.key);
    } else if (!combo.key.empty()) {
        SHORT scan = VkKeyScanW(static_cast<wchar_t>(static_cast<unsigned char>(combo.key[0])));
        if (scan != -1) {
            vk = LOBYTE(scan);
            needsShift = (HIBYTE(scan) & 1) != 0;
        }
    }
    if (vk == 0) {
        throw OperationError("Key cannot be produced on this keyboard layout", combo.key, combo.toString());
    }

    std::vector<WORD> held;
    for (Modifier m : combo.modifiers) {
        held.push_back(modifierKey(m));
    }
    if (needsShift && !combo.hasModifier(Modifier::SHIFT)) {
        held.push_back(VK_LSHIFT);
    }

    std::vector<INPUT> inputs;
    for (WORD m : held) inputs.push_back(keyInput(m, true));
    inputs.push_back(keyInput(vk, true));
    inputs.push_back(keyInput(vk, false));
    for (auto it = held.rbegin(); it != held.rend(); ++it) inputs.push_back(keyInput(*it, false));
    sendInputs(inputs, "key chord " + combo.toString());
}

cv::Mat Win32DesktopBackend::captureScreen(const Rectangle& region) {
    Rectangle area = region.intersect(screenBounds());
    if (area.empty()) {
        throw OperationError("Capture region lies outside the screen", region.toString());
    }

    raii::ScreenDC screen;
    if (!screen) {
        throw OperationError("GetDC failed for screen capture");
    }

    HDC memoryDC = CreateCompatibleDC(screen.get());
    if (!memoryDC) {
        throw OperationError("CreateCompatibleDC failed");
    }
    raii::ScopeGuard releaseMemoryDC([memoryDC]() { DeleteDC(memoryDC); });

    HBITMAP bitmap = CreateCompatibleBitmap(screen.get(), area.width, area.height);
    if (!bitmap) {
        throw OperationError("CreateCompatibleBitmap failed", area.toString());
    }
    raii::ScopeGuard releaseBitmap([bitmap]() { DeleteObject(bitmap); });

    HGDIOBJ previous = SelectObject(memoryDC, bitmap);
    raii::ScopeGuard restoreSelection([memoryDC, previous]() { SelectObject(memoryDC, previous); });

    if (!BitBlt(memoryDC, 0, 0, area.width, area.height, screen.get(), area.x, area.y,
                SRCCOPY | CAPTUREBLT)) {
        throw OperationError("BitBlt failed", "error " + std::to_string(GetLastError()));
    }

    BITMAPINFO bmi = {};
    bmi.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
    bmi.bmiHeader.biWidth = area.width;
    bmi.bmiHeader.biHeight = -area.height;  // top-down
    bmi.bmiHeader.biPlanes = 1;
    bmi.bmiHeader.biBitCount = 32;
    bmi.bmiHeader.biCompression = BI_RGB;

    cv::Mat bgra(area.height, area.width, CV_8UC4);
    if (!GetDIBits(memoryDC, bitmap, 0, static_cast<UINT>(area.height), bgra.data, &bmi, DIB_RGB_COLORS)) {
        throw OperationError("GetDIBits failed", area.toString());
    }

    cv::Mat bgr;
    cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
    return bgr;
}

Rectangle Win32DesktopBackend::screenBounds() {
    return Rectangle(GetSystemMetrics(SM_XVIRTUALSCREEN), GetSystemMetrics(SM_YVIRTUALSCREEN),
                     GetSystemMetrics(SM_CXVIRTUALSCREEN), GetSystemMetrics(SM_CYVIRTUALSCREEN));
}

} // namespace ocal
} // namespace marionette

#endif // _WIN32
