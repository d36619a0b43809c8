#include "tesseract_cli_backend.h"
#include "../ocal/system_command.h"
#include "../common/error_handler.h"
#include "../common/os_utils.h"
#include "../common/raii_wrappers.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cstdio>
#include <sstream>

namespace marionette {
namespace ocr {

namespace {
    const int TSV_COLUMNS = 12;
    const int WORD_LEVEL = 5;

    bool parseInt(const std::string& field, int& value) {
        try {
            size_t used = 0;
            value = std::stoi(field, &used);
            return used == field.size();
        } catch (const std::exception&) {
            return false;
        }
    }

    bool parseDouble(const std::string& field, double& value) {
        try {
            size_t used = 0;
            value = std::stod(field, &used);
            return used == field.size();
        } catch (const std::exception&) {
            return false;
        }
    }
}

TesseractCliBackend::TesseractCliBackend(std::string executable, int timeoutMs, std::string tempDirectory)
    : m_executable(std::move(executable)),
      m_timeoutMs(timeoutMs > 0 ? timeoutMs : 15000),
      m_tempDirectory(tempDirectory.empty() ? os::SystemInfo::getTempDirectory() : std::move(tempDirectory)),
      m_sequence(0) {}

std::vector<OcrWord> TesseractCliBackend::parseTsv(const std::string& tsv) {
    std::vector<OcrWord> words;
    std::istringstream stream(tsv);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // level page block par line word left top width height conf text
        std::vector<std::string> fields = utils::StringUtils::split(line, "\t");
        if (fields.size() < TSV_COLUMNS - 1) {
            continue;
        }

        int level = 0;
        if (!parseInt(fields[0], level) || level != WORD_LEVEL) {
            continue;  // header row or block/paragraph/line summary
        }

        int block = 0, paragraph = 0, lineNum = 0, left = 0, top = 0, width = 0, height = 0;
        double confidence = -1.0;
        if (!parseInt(fields[2], block) || !parseInt(fields[3], paragraph) ||
            !parseInt(fields[4], lineNum) || !parseInt(fields[6], left) ||
            !parseInt(fields[7], top) || !parseInt(fields[8], width) ||
            !parseInt(fields[9], height) || !parseDouble(fields[10], confidence)) {
            continue;
        }

        // Text may itself contain tabs in theory; everything after column 11 belongs to it
        std::string text;
        for (size_t i = TSV_COLUMNS - 1; i < fields.size(); ++i) {
            if (i > static_cast<size_t>(TSV_COLUMNS - 1)) text += "\t";
            text += fields[i];
        }
        text = utils::StringUtils::trim(text);
        if (confidence < 0.0 || text.empty()) {
            continue;
        }

        int lineId = block * 1000000 + paragraph * 1000 + lineNum;
        words.emplace_back(text, ocal::Rectangle(left, top, width, height),
                           std::min(1.0, confidence / 100.0), lineId);
    }
    return words;
}

std::vector<OcrWord> TesseractCliBackend::recognize(const cv::Mat& image, const std::string& language) {
    if (image.empty()) {
        throw OcrError("Cannot recognize text in an empty image");
    }

    std::string imagePath = os::PathUtils::join(
        m_tempDirectory,
        "marionette_ocr_" + std::to_string(os::SystemInfo::getCurrentProcessId()) + "_" +
        std::to_string(m_sequence.fetch_add(1)) + ".png");

    if (!cv::imwrite(imagePath, image)) {
        throw OcrError("Failed to write OCR input image", imagePath);
    }
    raii::ScopeGuard removeImage([imagePath]() { std::remove(imagePath.c_str()); });

    std::vector<std::string> arguments = {imagePath, "stdout", "-l", language.empty() ? "eng" : language,
                                          "--psm", "6", "tsv"};
    ocal::system::CommandResult result = ocal::system::runProcess(m_executable, arguments, m_timeoutMs);

    if (!result.started) {
        throw OcrError("Tesseract could not be started", result.error, m_executable);
    }
    if (result.timedOut) {
        throw OcrError("Tesseract timed out", result.error, m_executable);
    }
    if (result.exitCode != 0) {
        throw OcrError("Tesseract failed with exit code " + std::to_string(result.exitCode),
                       utils::StringUtils::trim(result.error), m_executable);
    }

    std::vector<OcrWord> words = parseTsv(result.output);
    SLOG_DEBUG().message("Tesseract recognition finished")
        .context("words", words.size())
        .context("language", language)
        .context("execution_time_ms", result.executionTimeMs);
    return words;
}

} // namespace ocr
} // namespace marionette
