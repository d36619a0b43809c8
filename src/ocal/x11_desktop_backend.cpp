#ifndef _WIN32

#include "x11_desktop_backend.h"
#include "process_operations.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include "../common/os_utils.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <map>
#include <memory>

// X headers last: they define None, Status, Bool, True and False as macros
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/Xatom.h>
#include <X11/XKBlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace marionette {
namespace ocal {

namespace {
    const long NET_WM_STATE_REMOVE = 0;
    const long NET_WM_STATE_ADD = 1;
    // Source indication for EWMH requests: 2 = pager, honoured even under focus stealing prevention
    const long SOURCE_PAGER = 2;
    // Motion events between press and release; toolkits ignore a drag that jumps
    const int DRAG_STEPS = 10;

    // X errors arrive asynchronously; the handler records the last one and
    // flushAndCheck() turns it into a return value after XSync.
    std::atomic<int> g_lastXError{0};

    int recordXError(Display* display, XErrorEvent* event) {
        (void)display;
        g_lastXError = event->error_code;
        return 0;
    }

    struct XFreeDeleter {
        void operator()(unsigned char* data) const {
            if (data) XFree(data);
        }
    };
    using XPropertyData = std::unique_ptr<unsigned char, XFreeDeleter>;

    struct XImageDeleter {
        void operator()(XImage* image) const {
            if (image) XDestroyImage(image);
        }
    };

    // Decode UTF-8; malformed sequences become U+FFFD
    std::vector<unsigned long> decodeUtf8(const std::string& text) {
        std::vector<unsigned long> codepoints;
        size_t i = 0;
        while (i < text.size()) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            unsigned long cp = 0;
            size_t extra = 0;
            if (c < 0x80) { cp = c; extra = 0; }
            else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
            else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
            else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
            else { codepoints.push_back(0xFFFD); ++i; continue; }

            if (i + extra >= text.size()) {
                codepoints.push_back(0xFFFD);
                break;
            }
            bool valid = true;
            for (size_t k = 1; k <= extra; ++k) {
                unsigned char cc = static_cast<unsigned char>(text[i + k]);
                if ((cc & 0xC0) != 0x80) { valid = false; break; }
                cp = (cp << 6) | (cc & 0x3F);
            }
            if (!valid) {
                codepoints.push_back(0xFFFD);
                ++i;
                continue;
            }
            codepoints.push_back(cp);
            i += extra + 1;
        }
        return codepoints;
    }

    KeySym keysymForCodepoint(unsigned long cp) {
        switch (cp) {
            case '\n': case '\r': return XK_Return;
            case '\t': return XK_Tab;
            case '\b': return XK_BackSpace;
            default: break;
        }
        // Latin-1 keysyms are numerically equal to their code points
        if ((cp >= 0x20 && cp <= 0x7E) || (cp >= 0xA0 && cp <= 0xFF)) {
            return static_cast<KeySym>(cp);
        }
        return static_cast<KeySym>(0x01000000UL | cp);
    }

    KeySym keysymForKeyName(const std::string& key) {
        static const std::map<std::string, KeySym> namedKeys = {
            {"enter", XK_Return}, {"tab", XK_Tab}, {"escape", XK_Escape},
            {"space", XK_space}, {"backspace", XK_BackSpace}, {"delete", XK_Delete},
            {"insert", XK_Insert}, {"home", XK_Home}, {"end", XK_End},
            {"pageup", XK_Page_Up}, {"pagedown", XK_Page_Down},
            {"up", XK_Up}, {"down", XK_Down}, {"left", XK_Left}, {"right", XK_Right},
            {"f1", XK_F1}, {"f2", XK_F2}, {"f3", XK_F3}, {"f4", XK_F4},
            {"f5", XK_F5}, {"f6", XK_F6}, {"f7", XK_F7}, {"f8", XK_F8},
            {"f9", XK_F9}, {"f10", XK_F10}, {"f11", XK_F11}, {"f12", XK_F12}
        };
        auto it = namedKeys.find(key);
        if (it != namedKeys.end()) {
            return it->second;
        }
        if (key.size() == 1) {
            return keysymForCodepoint(static_cast<unsigned char>(key[0]));
        }
        return NoSymbol;
    }

    KeySym keysymForModifier(Modifier m) {
        switch (m) {
            case Modifier::CTRL: return XK_Control_L;
            case Modifier::SHIFT: return XK_Shift_L;
            case Modifier::ALT: return XK_Alt_L;
            case Modifier::META: return XK_Super_L;
        }
        return NoSymbol;
    }

    unsigned int xButton(MouseButton button) {
        switch (button) {
            case MouseButton::LEFT: return 1;
            case MouseButton::MIDDLE: return 2;
            case MouseButton::RIGHT: return 3;
        }
        return 1;
    }

    // Position of the lowest set bit and the width of a channel mask
    void maskShape(unsigned long mask, int& shift, int& bits) {
        shift = 0;
        bits = 0;
        if (mask == 0) return;
        while (!(mask & 1UL)) { mask >>= 1; ++shift; }
        while (mask & 1UL) { mask >>= 1; ++bits; }
    }

    unsigned char scaleChannel(unsigned long pixel, int shift, int bits) {
        if (bits == 0) return 0;
        unsigned long value = (pixel >> shift) & ((1UL << bits) - 1);
        if (bits >= 8) return static_cast<unsigned char>(value >> (bits - 8));
        return static_cast<unsigned char>((value * 255) / ((1UL << bits) - 1));
    }
}

X11DesktopBackend::X11DesktopBackend() : m_display(nullptr), m_root(0) {
    XInitThreads();

    std::string displayName = os::SystemInfo::getEnvironmentVariable("DISPLAY");
    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        throw WindowOperationError("Cannot open X display",
                                   displayName.empty() ? "DISPLAY is not set" : "DISPLAY=" + displayName);
    }

    int eventBase = 0, errorBase = 0, major = 0, minor = 0;
    if (!XTestQueryExtension(m_display, &eventBase, &errorBase, &major, &minor)) {
        XCloseDisplay(m_display);
        m_display = nullptr;
        throw WindowOperationError("X server lacks the XTEST extension", "DISPLAY=" + displayName);
    }

    XSetErrorHandler(recordXError);
    m_root = DefaultRootWindow(m_display);

    SLOG_INFO().message("X11 desktop backend initialized")
        .context("display", displayName)
        .context("xtest_version", std::to_string(major) + "." + std::to_string(minor));
}

X11DesktopBackend::~X11DesktopBackend() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_display) {
        XCloseDisplay(m_display);
        m_display = nullptr;
    }
}

unsigned long X11DesktopBackend::atom(const char* name) {
    return XInternAtom(m_display, name, False);
}

bool X11DesktopBackend::flushAndCheck() {
    XSync(m_display, False);
    int error = g_lastXError.exchange(0);
    if (error != 0) {
        SLOG_DEBUG().message("X request failed").context("error_code", error);
    }
    return error == 0;
}

std::vector<unsigned long> X11DesktopBackend::clientWindows() {
    std::vector<unsigned long> windows;

    // Stacking order lists bottom to top; fall back to mapping order
    for (const char* property : {"_NET_CLIENT_LIST_STACKING", "_NET_CLIENT_LIST"}) {
        Atom actualType = 0;
        int actualFormat = 0;
        unsigned long count = 0, bytesAfter = 0;
        unsigned char* raw = nullptr;
        int status = XGetWindowProperty(m_display, m_root, atom(property), 0, 1L << 16, False,
                                        XA_WINDOW, &actualType, &actualFormat, &count,
                                        &bytesAfter, &raw);
        XPropertyData data(raw);
        if (status != Success || actualFormat != 32 || !data || count == 0) {
            continue;
        }
        const unsigned long* ids = reinterpret_cast<const unsigned long*>(data.get());
        windows.assign(ids, ids + count);
        std::reverse(windows.begin(), windows.end());
        break;
    }
    return windows;
}

bool X11DesktopBackend::readCardinal(unsigned long window, const char* property, unsigned long& value) {
    Atom actualType = 0;
    int actualFormat = 0;
    unsigned long count = 0, bytesAfter = 0;
    unsigned char* raw = nullptr;
    int status = XGetWindowProperty(m_display, window, atom(property), 0, 1, False, XA_CARDINAL,
                                    &actualType, &actualFormat, &count, &bytesAfter, &raw);
    XPropertyData data(raw);
    if (status != Success || actualFormat != 32 || count == 0 || !data) {
        return false;
    }
    value = *reinterpret_cast<const unsigned long*>(data.get());
    return true;
}

std::vector<unsigned long> X11DesktopBackend::readAtomList(unsigned long window, const char* property) {
    std::vector<unsigned long> atoms;
    Atom actualType = 0;
    int actualFormat = 0;
    unsigned long count = 0, bytesAfter = 0;
    unsigned char* raw = nullptr;
    int status = XGetWindowProperty(m_display, window, atom(property), 0, 1024, False, XA_ATOM,
                                    &actualType, &actualFormat, &count, &bytesAfter, &raw);
    XPropertyData data(raw);
    if (status == Success && actualFormat == 32 && data) {
        const unsigned long* values = reinterpret_cast<const unsigned long*>(data.get());
        atoms.assign(values, values + count);
    }
    return atoms;
}

std::optional<WindowInfo> X11DesktopBackend::describeWindow(unsigned long window) {
    XWindowAttributes attributes;
    if (!XGetWindowAttributes(m_display, window, &attributes)) {
        g_lastXError = 0;
        return std::nullopt;
    }

    WindowInfo info;
    info.handle = static_cast<WindowHandle>(window);

    unsigned long pid = 0;
    if (readCardinal(window, "_NET_WM_PID", pid)) {
        info.processId = static_cast<ProcessId>(pid);
    }

    // Prefer the UTF-8 EWMH title over the legacy WM_NAME
    {
        Atom actualType = 0;
        int actualFormat = 0;
        unsigned long count = 0, bytesAfter = 0;
        unsigned char* raw = nullptr;
        int status = XGetWindowProperty(m_display, window, atom("_NET_WM_NAME"), 0, 1024, False,
                                        atom("UTF8_STRING"), &actualType, &actualFormat, &count,
                                        &bytesAfter, &raw);
        XPropertyData data(raw);
        if (status == Success && actualFormat == 8 && data && count > 0) {
            info.title.assign(reinterpret_cast<const char*>(data.get()), count);
        } else {
            char* name = nullptr;
            if (XFetchName(m_display, window, &name) && name) {
                info.title = name;
                XFree(name);
            }
        }
    }

    XClassHint classHint;
    if (XGetClassHint(m_display, window, &classHint)) {
        if (classHint.res_class) {
            info.className = classHint.res_class;
            XFree(classHint.res_class);
        }
        if (classHint.res_name) {
            XFree(classHint.res_name);
        }
    }

    int screenX = 0, screenY = 0;
    Window child = 0;
    XTranslateCoordinates(m_display, window, m_root, 0, 0, &screenX, &screenY, &child);
    info.clientBounds = Rectangle(screenX, screenY, attributes.width, attributes.height);

    // Decorations drawn by the window manager, if it publishes them
    info.bounds = info.clientBounds;
    Atom actualType = 0;
    int actualFormat = 0;
    unsigned long count = 0, bytesAfter = 0;
    unsigned char* raw = nullptr;
    int status = XGetWindowProperty(m_display, window, atom("_NET_FRAME_EXTENTS"), 0, 4, False,
                                    XA_CARDINAL, &actualType, &actualFormat, &count,
                                    &bytesAfter, &raw);
    XPropertyData extents(raw);
    if (status == Success && actualFormat == 32 && count == 4 && extents) {
        const unsigned long* e = reinterpret_cast<const unsigned long*>(extents.get());
        int left = static_cast<int>(e[0]), right = static_cast<int>(e[1]);
        int top = static_cast<int>(e[2]), bottom = static_cast<int>(e[3]);
        info.bounds = Rectangle(screenX - left, screenY - top,
                                attributes.width + left + right, attributes.height + top + bottom);
    }

    unsigned long hidden = atom("_NET_WM_STATE_HIDDEN");
    unsigned long maxVert = atom("_NET_WM_STATE_MAXIMIZED_VERT");
    unsigned long maxHorz = atom("_NET_WM_STATE_MAXIMIZED_HORZ");
    bool vert = false, horz = false;
    for (unsigned long state : readAtomList(window, "_NET_WM_STATE")) {
        if (state == hidden) info.isMinimized = true;
        if (state == maxVert) vert = true;
        if (state == maxHorz) horz = true;
    }
    info.isMaximized = vert && horz;
    info.isVisible = attributes.map_state == IsViewable && !info.isMinimized;

    // Iconified without EWMH state (bare window managers)
    if (attributes.map_state != IsViewable && !info.isMinimized) {
        info.isMinimized = attributes.map_state == IsUnmapped &&
                           !readAtomList(window, "WM_STATE").empty();
    }

    g_lastXError = 0;
    return info;
}

bool X11DesktopBackend::sendWmMessage(unsigned long window, const char* messageType,
                                      long data0, long data1, long data2, long data3) {
    XEvent event;
    std::memset(&event, 0, sizeof(event));
    event.xclient.type = ClientMessage;
    event.xclient.send_event = True;
    event.xclient.display = m_display;
    event.xclient.window = window;
    event.xclient.message_type = atom(messageType);
    event.xclient.format = 32;
    event.xclient.data.l[0] = data0;
    event.xclient.data.l[1] = data1;
    event.xclient.data.l[2] = data2;
    event.xclient.data.l[3] = data3;
    event.xclient.data.l[4] = 0;

    Status sent = XSendEvent(m_display, m_root, False,
                             SubstructureRedirectMask | SubstructureNotifyMask, &event);
    return sent != 0 && flushAndCheck();
}

ProcessId X11DesktopBackend::spawnProcess(const std::string& executablePath,
                                          const std::vector<std::string>& arguments,
                                          const std::string& workingDirectory) {
    return process::spawn(executablePath, arguments, workingDirectory);
}

bool X11DesktopBackend::isProcessRunning(ProcessId pid) {
    return process::isRunning(pid);
}

bool X11DesktopBackend::isProcessResponding(ProcessId pid) {
    return process::isRunning(pid) && !process::isStopped(pid);
}

std::vector<ProcessInfo> X11DesktopBackend::listProcesses() {
    return process::listProcesses();
}

bool X11DesktopBackend::killProcess(ProcessId pid, bool force) {
    return process::terminate(pid, force);
}

std::vector<WindowInfo> X11DesktopBackend::enumerateWindows(ProcessId pid) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    std::vector<WindowInfo> windows;
    for (unsigned long window : clientWindows()) {
        unsigned long windowPid = 0;
        if (!readCardinal(window, "_NET_WM_PID", windowPid) ||
            static_cast<ProcessId>(windowPid) != pid) {
            continue;
        }
        auto info = describeWindow(window);
        if (info) {
            windows.push_back(*info);
        }
    }
    g_lastXError = 0;
    return windows;
}

std::optional<WindowInfo> X11DesktopBackend::getWindowInfo(WindowHandle handle) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (handle == INVALID_WINDOW_HANDLE) {
        return std::nullopt;
    }
    XSync(m_display, False);
    g_lastXError = 0;
    return describeWindow(static_cast<unsigned long>(handle));
}

WindowHandle X11DesktopBackend::foregroundWindow() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    Atom actualType = 0;
    int actualFormat = 0;
    unsigned long count = 0, bytesAfter = 0;
    unsigned char* raw = nullptr;
    int status = XGetWindowProperty(m_display, m_root, atom("_NET_ACTIVE_WINDOW"), 0, 1, False,
                                    XA_WINDOW, &actualType, &actualFormat, &count, &bytesAfter, &raw);
    XPropertyData data(raw);
    if (status == Success && actualFormat == 32 && count == 1 && data) {
        return static_cast<WindowHandle>(*reinterpret_cast<const unsigned long*>(data.get()));
    }

    Window focused = 0;
    int revert = 0;
    XGetInputFocus(m_display, &focused, &revert);
    return focused > 1 ? static_cast<WindowHandle>(focused) : INVALID_WINDOW_HANDLE;
}

bool X11DesktopBackend::activateWindow(WindowHandle handle) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Window window = static_cast<Window>(handle);

    XMapRaised(m_display, window);
    if (!flushAndCheck()) {
        return false;
    }
    return sendWmMessage(window, "_NET_ACTIVE_WINDOW", SOURCE_PAGER, CurrentTime, 0);
}

bool X11DesktopBackend::moveWindow(WindowHandle handle, int x, int y) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    XMoveWindow(m_display, static_cast<Window>(handle), x, y);
    return flushAndCheck();
}

bool X11DesktopBackend::resizeWindow(WindowHandle handle, int width, int height) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (width <= 0 || height <= 0) {
        return false;
    }
    XResizeWindow(m_display, static_cast<Window>(handle),
                  static_cast<unsigned int>(width), static_cast<unsigned int>(height));
    return flushAndCheck();
}

bool X11DesktopBackend::maximizeWindow(WindowHandle handle) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return sendWmMessage(static_cast<Window>(handle), "_NET_WM_STATE", NET_WM_STATE_ADD,
                         static_cast<long>(atom("_NET_WM_STATE_MAXIMIZED_VERT")),
                         static_cast<long>(atom("_NET_WM_STATE_MAXIMIZED_HORZ")), SOURCE_PAGER);
}

bool X11DesktopBackend::minimizeWindow(WindowHandle handle) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!XIconifyWindow(m_display, static_cast<Window>(handle), DefaultScreen(m_display))) {
        return false;
    }
    return flushAndCheck();
}

bool X11DesktopBackend::restoreWindow(WindowHandle handle) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Window window = static_cast<Window>(handle);

    bool ok = sendWmMessage(window, "_NET_WM_STATE", NET_WM_STATE_REMOVE,
                            static_cast<long>(atom("_NET_WM_STATE_MAXIMIZED_VERT")),
                            static_cast<long>(atom("_NET_WM_STATE_MAXIMIZED_HORZ")), SOURCE_PAGER);
    ok = sendWmMessage(window, "_NET_WM_STATE", NET_WM_STATE_REMOVE,
                       static_cast<long>(atom("_NET_WM_STATE_HIDDEN")), 0, SOURCE_PAGER) && ok;
    return activateWindow(handle) && ok;
}

bool X11DesktopBackend::closeWindow(WindowHandle handle) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return sendWmMessage(static_cast<Window>(handle), "_NET_CLOSE_WINDOW", CurrentTime, SOURCE_PAGER);
}

void X11DesktopBackend::click(const Point& screenPoint, MouseButton button, int clickCount) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    XTestFakeMotionEvent(m_display, -1, screenPoint.x, screenPoint.y, CurrentTime);
    unsigned int xbutton = xButton(button);
    for (int i = 0; i < std::max(1, clickCount); ++i) {
        XTestFakeButtonEvent(m_display, xbutton, True, CurrentTime);
        XTestFakeButtonEvent(m_display, xbutton, False, CurrentTime);
    }
    if (!flushAndCheck()) {
        throw OperationError("X server rejected synthesized click", "",
                             "(" + std::to_string(screenPoint.x) + "," + std::to_string(screenPoint.y) + ")");
    }
}

void X11DesktopBackend::moveMouse(const Point& screenPoint) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    XTestFakeMotionEvent(m_display, -1, screenPoint.x, screenPoint.y, CurrentTime);
    if (!flushAndCheck()) {
        throw OperationError("X server rejected synthesized pointer motion", "",
                             "(" + std::to_string(screenPoint.x) + "," + std::to_string(screenPoint.y) + ")");
    }
}

void X11DesktopBackend::drag(const Point& from, const Point& to, MouseButton button) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    unsigned int xbutton = xButton(button);
    XTestFakeMotionEvent(m_display, -1, from.x, from.y, CurrentTime);
    XTestFakeButtonEvent(m_display, xbutton, True, CurrentTime);
    for (int step = 1; step <= DRAG_STEPS; ++step) {
        int x = from.x + (to.x - from.x) * step / DRAG_STEPS;
        int y = from.y + (to.y - from.y) * step / DRAG_STEPS;
        XTestFakeMotionEvent(m_display, -1, x, y, CurrentTime);
        XFlush(m_display);
    }
    XTestFakeButtonEvent(m_display, xbutton, False, CurrentTime);
    if (!flushAndCheck()) {
        throw OperationError("X server rejected synthesized drag", "",
                             "(" + std::to_string(from.x) + "," + std::to_string(from.y) + ") to (" +
                             std::to_string(to.x) + "," + std::to_string(to.y) + ")");
    }
}

void X11DesktopBackend::tapKeysym(unsigned long keysym) {
    KeyCode keycode = XKeysymToKeycode(m_display, static_cast<KeySym>(keysym));
    if (keycode == 0) {
        char hex[24];
        std::snprintf(hex, sizeof(hex), "keysym 0x%lx", keysym);
        throw OperationError("Character cannot be typed with the current keymap", hex);
    }

    bool needsShift = false;
    if (XkbKeycodeToKeysym(m_display, keycode, 0, 0) != static_cast<KeySym>(keysym) &&
        XkbKeycodeToKeysym(m_display, keycode, 0, 1) == static_cast<KeySym>(keysym)) {
        needsShift = true;
    }

    KeyCode shift = XKeysymToKeycode(m_display, XK_Shift_L);
    if (needsShift) XTestFakeKeyEvent(m_display, shift, True, CurrentTime);
    XTestFakeKeyEvent(m_display, keycode, True, CurrentTime);
    XTestFakeKeyEvent(m_display, keycode, False, CurrentTime);
    if (needsShift) XTestFakeKeyEvent(m_display, shift, False, CurrentTime);
}

void X11DesktopBackend::typeText(const std::string& utf8Text) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    for (unsigned long cp : decodeUtf8(utf8Text)) {
        tapKeysym(keysymForCodepoint(cp));
        XSync(m_display, False);
    }
    if (!flushAndCheck()) {
        throw OperationError("X server rejected synthesized key events", utf8Text);
    }
}

void X11DesktopBackend::pressKeys(const KeyCombo& combo) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    KeySym keysym = keysymForKeyName(combo.key);
    KeyCode keycode = keysym == NoSymbol ? 0 : XKeysymToKeycode(m_display, keysym);
    if (keycode == 0) {
        throw OperationError("Key cannot be produced with the current keymap", combo.key, combo.toString());
    }

    std::vector<KeyCode> held;
    for (Modifier m : combo.modifiers) {
        KeyCode modifier = XKeysymToKeycode(m_display, keysymForModifier(m));
        if (modifier != 0) held.push_back(modifier);
    }
    if (!combo.isNamedKey() && !combo.hasModifier(Modifier::SHIFT) &&
        XkbKeycodeToKeysym(m_display, keycode, 0, 0) != keysym &&
        XkbKeycodeToKeysym(m_display, keycode, 0, 1) == keysym) {
        held.push_back(XKeysymToKeycode(m_display, XK_Shift_L));
    }

    for (KeyCode k : held) XTestFakeKeyEvent(m_display, k, True, CurrentTime);
    XTestFakeKeyEvent(m_display, keycode, True, CurrentTime);
    XTestFakeKeyEvent(m_display, keycode, False, CurrentTime);
    for (auto it = held.rbegin(); it != held.rend(); ++it) XTestFakeKeyEvent(m_display, *it, False, CurrentTime);

    if (!flushAndCheck()) {
        throw OperationError("X server rejected synthesized key chord", combo.toString());
    }
}

cv::Mat X11DesktopBackend::captureScreen(const Rectangle& region) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    Rectangle area = region.intersect(screenBounds());
    if (area.empty()) {
        throw OperationError("Capture region lies outside the screen", region.toString());
    }

    std::unique_ptr<XImage, XImageDeleter> image(
        XGetImage(m_display, m_root, area.x, area.y,
                  static_cast<unsigned int>(area.width), static_cast<unsigned int>(area.height),
                  AllPlanes, ZPixmap));
    g_lastXError = 0;
    if (!image) {
        throw OperationError("XGetImage failed", area.toString());
    }

    cv::Mat bgr;
    if (image->bits_per_pixel == 32 && image->byte_order == LSBFirst &&
        image->red_mask == 0xFF0000 && image->green_mask == 0xFF00 && image->blue_mask == 0xFF) {
        cv::Mat bgra(area.height, area.width, CV_8UC4, image->data,
                     static_cast<size_t>(image->bytes_per_line));
        cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
        return bgr;
    }

    int redShift, redBits, greenShift, greenBits, blueShift, blueBits;
    maskShape(image->red_mask, redShift, redBits);
    maskShape(image->green_mask, greenShift, greenBits);
    maskShape(image->blue_mask, blueShift, blueBits);

    bgr.create(area.height, area.width, CV_8UC3);
    for (int y = 0; y < area.height; ++y) {
        cv::Vec3b* row = bgr.ptr<cv::Vec3b>(y);
        for (int x = 0; x < area.width; ++x) {
            unsigned long pixel = XGetPixel(image.get(), x, y);
            row[x] = cv::Vec3b(scaleChannel(pixel, blueShift, blueBits),
                               scaleChannel(pixel, greenShift, greenBits),
                               scaleChannel(pixel, redShift, redBits));
        }
    }
    return bgr;
}

Rectangle X11DesktopBackend::screenBounds() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    int screen = DefaultScreen(m_display);
    return Rectangle(0, 0, DisplayWidth(m_display, screen), DisplayHeight(m_display, screen));
}

} // namespace ocal
} // namespace marionette

#endif // _WIN32
