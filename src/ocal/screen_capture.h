#ifndef MARIONETTE_SCREEN_CAPTURE_H
#define MARIONETTE_SCREEN_CAPTURE_H

#include <memory>
#include <mutex>
#include <shared_mutex>
#include "desktop_backend.h"

namespace marionette {
namespace ocal {

/**
 * @brief Screen grabs that never observe a window mid-move or mid-resize
 *
 * Captures take the lock shared, so any number may run at once. Geometry
 * changes hold quiesce() for their duration, which excludes all captures.
 */
class ScreenCapture {
public:
    explicit ScreenCapture(std::shared_ptr<DesktopBackend> backend);

    // BGR image of region; throws OperationError when the grab fails
    cv::Mat capture(const Rectangle& region);
    cv::Mat captureScreen();

    std::unique_lock<std::shared_mutex> quiesce();

    DesktopBackend& backend() { return *m_backend; }

private:
    std::shared_ptr<DesktopBackend> m_backend;
    std::shared_mutex m_quiescence;
};

} // namespace ocal
} // namespace marionette

#endif // MARIONETTE_SCREEN_CAPTURE_H
