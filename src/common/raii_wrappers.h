#ifndef MARIONETTE_RAII_WRAPPERS_H
#define MARIONETTE_RAII_WRAPPERS_H

#include <functional>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace marionette {
namespace raii {

/**
 * @brief Owns an OS handle and releases it with the supplied deleter
 *
 * Used for POSIX file descriptors (HandleWrapper<int, -1>) and X11
 * resources where a dedicated type would add nothing.
 */
template<typename HandleType, HandleType InvalidValue>
class HandleWrapper {
public:
    using Deleter = std::function<void(HandleType)>;

    HandleWrapper() : m_handle(InvalidValue), m_deleter(nullptr) {}

    HandleWrapper(HandleType handle, Deleter deleter)
        : m_handle(handle), m_deleter(std::move(deleter)) {
        if (!m_deleter) {
            throw std::invalid_argument("Deleter function cannot be null");
        }
    }

    HandleWrapper(HandleWrapper&& other) noexcept
        : m_handle(other.m_handle), m_deleter(std::move(other.m_deleter)) {
        other.m_handle = InvalidValue;
    }

    HandleWrapper& operator=(HandleWrapper&& other) noexcept {
        if (this != &other) {
            reset();
            m_handle = other.m_handle;
            m_deleter = std::move(other.m_deleter);
            other.m_handle = InvalidValue;
        }
        return *this;
    }

    HandleWrapper(const HandleWrapper&) = delete;
    HandleWrapper& operator=(const HandleWrapper&) = delete;

    ~HandleWrapper() {
        reset();
    }

    void reset() {
        if (m_handle != InvalidValue && m_deleter) {
            m_deleter(m_handle);
        }
        m_handle = InvalidValue;
    }

    HandleType release() noexcept {
        HandleType temp = m_handle;
        m_handle = InvalidValue;
        return temp;
    }

    HandleType get() const noexcept { return m_handle; }
    bool isValid() const noexcept { return m_handle != InvalidValue; }
    explicit operator bool() const noexcept { return isValid(); }

private:
    HandleType m_handle;
    Deleter m_deleter;
};

/**
 * @brief Runs a cleanup action at scope exit unless dismissed
 */
class ScopeGuard {
public:
    explicit ScopeGuard(std::function<void()> onExit)
        : m_onExit(std::move(onExit)), m_active(true) {}

    ~ScopeGuard() {
        if (m_active && m_onExit) {
            m_onExit();
        }
    }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    void dismiss() noexcept { m_active = false; }

private:
    std::function<void()> m_onExit;
    bool m_active;
};

#ifdef _WIN32

/**
 * @brief Kernel HANDLE closed with CloseHandle (process, thread, pipe)
 */
class KernelHandle {
public:
    KernelHandle() : m_handle(nullptr) {}
    explicit KernelHandle(HANDLE handle) : m_handle(handle) {}

    ~KernelHandle() { reset(); }

    KernelHandle(KernelHandle&& other) noexcept : m_handle(other.m_handle) {
        other.m_handle = nullptr;
    }

    KernelHandle& operator=(KernelHandle&& other) noexcept {
        if (this != &other) {
            reset();
            m_handle = other.m_handle;
            other.m_handle = nullptr;
        }
        return *this;
    }

    KernelHandle(const KernelHandle&) = delete;
    KernelHandle& operator=(const KernelHandle&) = delete;

    void reset(HANDLE handle = nullptr) {
        if (m_handle != nullptr && m_handle != INVALID_HANDLE_VALUE) {
            ::CloseHandle(m_handle);
        }
        m_handle = handle;
    }

    HANDLE get() const noexcept { return m_handle; }
    HANDLE* out() noexcept { reset(); return &m_handle; }

    bool isValid() const noexcept {
        return m_handle != nullptr && m_handle != INVALID_HANDLE_VALUE;
    }

    explicit operator bool() const noexcept { return isValid(); }

private:
    HANDLE m_handle;
};

/**
 * @brief Screen device context from GetDC, released with ReleaseDC
 */
class ScreenDC {
public:
    explicit ScreenDC(HWND hwnd = nullptr) : m_hwnd(hwnd), m_hdc(::GetDC(hwnd)) {}
    ~ScreenDC() {
        if (m_hdc) {
            ::ReleaseDC(m_hwnd, m_hdc);
        }
    }

    ScreenDC(const ScreenDC&) = delete;
    ScreenDC& operator=(const ScreenDC&) = delete;

    HDC get() const noexcept { return m_hdc; }
    explicit operator bool() const noexcept { return m_hdc != nullptr; }

private:
    HWND m_hwnd;
    HDC m_hdc;
};

#endif // _WIN32

} // namespace raii
} // namespace marionette

#endif // MARIONETTE_RAII_WRAPPERS_H
