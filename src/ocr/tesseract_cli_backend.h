#ifndef MARIONETTE_TESSERACT_CLI_BACKEND_H
#define MARIONETTE_TESSERACT_CLI_BACKEND_H

#include <atomic>
#include "ocr_backend.h"

namespace marionette {
namespace ocr {

/**
 * @brief Runs the tesseract executable on a temporary PNG and parses its TSV output
 *
 * Invocation: tesseract <image> stdout -l <lang> --psm 6 tsv
 */
class TesseractCliBackend : public OcrBackend {
public:
    TesseractCliBackend(std::string executable = "tesseract",
                        int timeoutMs = 15000,
                        std::string tempDirectory = "");

    std::string name() const override { return "tesseract-cli"; }

    /**
     * @throws OcrError if tesseract cannot be run, times out or exits non-zero
     */
    std::vector<OcrWord> recognize(const cv::Mat& image, const std::string& language) override;

    /**
     * @brief Word rows (level 5) of tesseract TSV output; rows with
     * confidence -1 or blank text are skipped. Confidence is scaled to [0, 1].
     */
    static std::vector<OcrWord> parseTsv(const std::string& tsv);

private:
    std::string m_executable;
    int m_timeoutMs;
    std::string m_tempDirectory;
    std::atomic<unsigned> m_sequence;
};

} // namespace ocr
} // namespace marionette

#endif // MARIONETTE_TESSERACT_CLI_BACKEND_H
