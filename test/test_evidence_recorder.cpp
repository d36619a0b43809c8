#include <filesystem>
#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include "test_harness.h"
#include "common/file_utils.h"
#include "common/os_utils.h"
#include "evidence/evidence_recorder.h"

using namespace marionette;
using namespace marionette::evidence;

namespace {
    std::string scratchDirectory() {
        return os::PathUtils::join(os::SystemInfo::getTempDirectory(),
            "marionette_evidence_test_" + std::to_string(os::SystemInfo::getCurrentProcessId()));
    }

    void removeScratch() {
        std::error_code ec;
        std::filesystem::remove_all(scratchDirectory(), ec);
    }

    VerificationRecord verification(const std::string& description, bool passed) {
        VerificationRecord record;
        record.description = description;
        record.passed = passed;
        record.application = "calc";
        record.operation = "assertVisibleText";
        return record;
    }
}

void testSaveScreenshot() {
    std::cout << "[TEST] Screenshots written as PNG\n";
    removeScratch();

    EvidenceRecorder recorder(os::PathUtils::join(scratchDirectory(), "screenshots"));
    cv::Mat image(60, 80, CV_8UC3, cv::Scalar(10, 200, 30));

    std::string first = recorder.saveScreenshot("step 1/login screen!", image);
    std::string second = recorder.saveScreenshot("step 1/login screen!", image);

    CHECK(!first.empty());
    CHECK(first != second);
    CHECK(utils::FileUtils::fileExists(first));
    CHECK(utils::FileUtils::fileExists(second));

    std::string name = os::PathUtils::getFileName(first);
    CHECK(name.find("step_1_login_screen.png") != std::string::npos);
    CHECK(name.find('/') == std::string::npos);

    cv::Mat decoded = cv::imread(first, cv::IMREAD_COLOR);
    CHECK_EQ(decoded.cols, 80);
    CHECK_EQ(decoded.rows, 60);

    CHECK_EQ(recorder.screenshots().size(), 2u);
    CHECK_EQ(recorder.screenshots()[0].label, std::string("step 1/login screen!"));
    CHECK_EQ(recorder.lastScreenshotPath(), second);

    CHECK_EQ(recorder.saveScreenshot("empty", cv::Mat()), std::string(""));
    CHECK_EQ(recorder.screenshots().size(), 2u);

    removeScratch();
    std::cout << "[OK] Screenshots written as PNG\n\n";
}

void testRecordsAndSummary() {
    std::cout << "[TEST] OCR text, verifications and summary\n";

    EvidenceRecorder recorder(scratchDirectory());
    recorder.recordOcr("display", "0");
    recorder.recordOcr("display", "579");
    recorder.recordOcr("title", "Calculator");

    recorder.recordVerification(verification("display shows 579", true));
    recorder.recordVerification(verification("title visible", true));
    VerificationRecord failed = verification("memory indicator visible", false);
    failed.details = "Timed out after 3 attempts";
    failed.evidencePath = "evidence/memory.png";
    recorder.recordVerification(failed);

    std::map<std::string, std::vector<std::string>> texts = recorder.ocrTexts();
    CHECK_EQ(texts["display"].size(), 2u);
    CHECK_EQ(texts["display"][1], std::string("579"));

    nlohmann::json report = recorder.toJson();
    CHECK_EQ(report["summary"]["total"].get<int>(), 3);
    CHECK_EQ(report["summary"]["passed"].get<int>(), 2);
    CHECK_EQ(report["summary"]["failed"].get<int>(), 1);
    CHECK_EQ(report["verifications"][2]["evidence_path"].get<std::string>(), std::string("evidence/memory.png"));
    CHECK_EQ(report["verifications"][2]["passed"].get<bool>(), false);
    CHECK_EQ(report["ocr"]["title"][0].get<std::string>(), std::string("Calculator"));
    CHECK(report["screenshots"].is_array());

    std::cout << "[OK] OCR text, verifications and summary\n\n";
}

void testWriteJsonAndClear() {
    std::cout << "[TEST] Evidence report written to disk\n";
    removeScratch();

    EvidenceRecorder recorder(scratchDirectory());
    recorder.recordVerification(verification("window focused", true));

    std::string path = os::PathUtils::join(scratchDirectory(), "report.json");
    CHECK(recorder.writeJson(path));

    nlohmann::json loaded;
    CHECK(utils::FileUtils::loadJsonFromFile(path, loaded));
    CHECK_EQ(loaded["summary"]["total"].get<int>(), 1);
    CHECK_EQ(loaded["verifications"][0]["description"].get<std::string>(), std::string("window focused"));

    recorder.clear();
    CHECK(recorder.verifications().empty());
    CHECK(recorder.screenshots().empty());
    CHECK(recorder.ocrTexts().empty());
    CHECK_EQ(recorder.lastScreenshotPath(), std::string(""));
    CHECK_EQ(recorder.toJson()["summary"]["total"].get<int>(), 0);

    removeScratch();
    std::cout << "[OK] Evidence report written to disk\n\n";
}

int main() {
    return marionette::testing::runTests("Marionette Evidence Recorder Test Suite", {
        {"save screenshot", testSaveScreenshot},
        {"records and summary", testRecordsAndSummary},
        {"write json and clear", testWriteJsonAndClear},
    });
}
