#include "screen_capture.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include <stdexcept>

namespace marionette {
namespace ocal {

ScreenCapture::ScreenCapture(std::shared_ptr<DesktopBackend> backend)
    : m_backend(std::move(backend)) {
    if (!m_backend) {
        throw std::invalid_argument("ScreenCapture requires a desktop backend");
    }
}

cv::Mat ScreenCapture::capture(const Rectangle& region) {
    std::shared_lock<std::shared_mutex> lock(m_quiescence);
    SCOPED_TIMER("screen_capture");

    cv::Mat image = m_backend->captureScreen(region);
    if (image.empty()) {
        throw OperationError("Screen capture returned no pixels", region.toString());
    }
    return image;
}

cv::Mat ScreenCapture::captureScreen() {
    return capture(m_backend->screenBounds());
}

std::unique_lock<std::shared_mutex> ScreenCapture::quiesce() {
    return std::unique_lock<std::shared_mutex>(m_quiescence);
}

} // namespace ocal
} // namespace marionette
