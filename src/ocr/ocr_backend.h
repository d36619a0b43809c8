#ifndef MARIONETTE_OCR_BACKEND_H
#define MARIONETTE_OCR_BACKEND_H

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "../ocal/desktop_backend.h"

namespace marionette {
namespace ocr {

struct OcrWord {
    std::string text;
    ocal::Rectangle bounds;   // pixels of the image handed to the backend
    double confidence;        // [0, 1]
    int lineId;               // words sharing a lineId form one text line

    OcrWord() : confidence(0.0), lineId(0) {}
    OcrWord(std::string t, ocal::Rectangle b, double c, int line)
        : text(std::move(t)), bounds(b), confidence(c), lineId(line) {}
};

/**
 * @brief Text recognizer the OCR engine delegates to
 *
 * recognize() reports words in reading order. Failures of the recognizer
 * itself (missing executable, crash) are OcrError; an image without text is
 * an empty vector.
 */
class OcrBackend {
public:
    virtual ~OcrBackend() = default;

    virtual std::string name() const = 0;
    virtual std::vector<OcrWord> recognize(const cv::Mat& image, const std::string& language) = 0;
};

} // namespace ocr
} // namespace marionette

#endif // MARIONETTE_OCR_BACKEND_H
