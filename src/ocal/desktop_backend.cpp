#include "desktop_backend.h"
#include <algorithm>
#include <sstream>

#ifdef _WIN32
#include "win32_desktop_backend.h"
#else
#include "x11_desktop_backend.h"
#endif

namespace marionette {
namespace ocal {

Rectangle Rectangle::intersect(const Rectangle& other) const {
    int left = std::max(x, other.x);
    int top = std::max(y, other.y);
    int r = std::min(right(), other.right());
    int b = std::min(bottom(), other.bottom());
    if (r <= left || b <= top) {
        return Rectangle(left, top, 0, 0);
    }
    return Rectangle(left, top, r - left, b - top);
}

std::string Rectangle::toString() const {
    std::ostringstream ss;
    ss << "(" << x << "," << y << " " << width << "x" << height << ")";
    return ss.str();
}

std::shared_ptr<DesktopBackend> createDefaultBackend() {
#ifdef _WIN32
    return std::make_shared<Win32DesktopBackend>();
#else
    return std::make_shared<X11DesktopBackend>();
#endif
}

} // namespace ocal
} // namespace marionette
