#include <iostream>
#include <memory>
#include "test_harness.h"
#include "common/error_handler.h"
#include "ocr/ocr_engine.h"
#include "ocr/tesseract_cli_backend.h"
#include "support/scripted_ocr_backend.h"

using namespace marionette;
using namespace marionette::ocr;

namespace {
    OcrSettings rawSettings() {
        OcrSettings settings;
        settings.preprocessing = false;
        settings.minConfidence = 0.7;
        return settings;
    }

    cv::Mat blankImage(int width = 400, int height = 120) {
        return cv::Mat(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
    }

    const char* SAMPLE_TSV =
        "level\tpage_num\tblock_num\tpar_num\tline_num\tword_num\tleft\ttop\twidth\theight\tconf\ttext\n"
        "1\t1\t0\t0\t0\t0\t0\t0\t200\t60\t-1\t\n"
        "2\t1\t1\t0\t0\t0\t10\t10\t120\t50\t-1\t\n"
        "4\t1\t1\t1\t1\t0\t10\t10\t120\t20\t-1\t\n"
        "5\t1\t1\t1\t1\t1\t10\t10\t50\t20\t96.5\tHello\n"
        "5\t1\t1\t1\t1\t2\t70\t10\t60\t20\t91\tWorld\n"
        "4\t1\t1\t1\t2\t0\t10\t40\t30\t20\t-1\t\n"
        "5\t1\t1\t1\t2\t1\t10\t40\t30\t20\t88.25\t579\r\n"
        "5\t1\t1\t1\t2\t2\t50\t40\t5\t20\t-1\t \n"
        "5\t1\t1\t1\t2\t3\t60\t40\t5\t20\t42\t   \n";
}

void testParseTsv() {
    std::cout << "[TEST] Tesseract TSV word rows\n";

    std::vector<OcrWord> words = TesseractCliBackend::parseTsv(SAMPLE_TSV);
    CHECK_EQ(words.size(), 3u);

    CHECK_EQ(words[0].text, std::string("Hello"));
    CHECK_NEAR(words[0].confidence, 0.965, 1e-9);
    CHECK(words[0].bounds == ocal::Rectangle(10, 10, 50, 20));

    CHECK_EQ(words[1].text, std::string("World"));
    CHECK_EQ(words[0].lineId, words[1].lineId);

    CHECK_EQ(words[2].text, std::string("579"));
    CHECK_NEAR(words[2].confidence, 0.8825, 1e-9);
    CHECK(words[2].lineId != words[0].lineId);

    CHECK(TesseractCliBackend::parseTsv("").empty());
    CHECK(TesseractCliBackend::parseTsv("garbage\nmore garbage\n").empty());

    std::cout << "[OK] Tesseract TSV word rows\n\n";
}

void testMissingTesseract() {
    std::cout << "[TEST] Missing tesseract executable\n";

    TesseractCliBackend backend("/nonexistent/marionette/tesseract", 2000);
    CHECK_THROWS(backend.recognize(blankImage(), "eng"), OcrError);
    CHECK_THROWS(backend.recognize(cv::Mat(), "eng"), OcrError);

    std::cout << "[OK] Missing tesseract executable\n\n";
}

void testExtractText() {
    std::cout << "[TEST] Text extraction\n";

    auto backend = std::make_shared<testing::ScriptedOcrBackend>();
    OcrEngine engine(backend, rawSettings());

    backend->enqueueLine({"579"}, 0.93);
    OcrResult result = engine.extractText(blankImage());
    CHECK_EQ(result.text, std::string("579"));
    CHECK_NEAR(result.confidence, 0.93, 1e-9);
    CHECK(!result.lowConfidence);
    CHECK(result.sourceRegion == ocal::Rectangle(0, 0, 400, 120));
    CHECK_EQ(backend->lastLanguage(), std::string("eng"));

    std::vector<OcrWord> twoLines = {
        OcrWord("File", ocal::Rectangle(5, 5, 30, 15), 0.9, 1),
        OcrWord("Edit", ocal::Rectangle(45, 5, 30, 15), 0.8, 1),
        OcrWord("Hello", ocal::Rectangle(5, 40, 50, 15), 0.95, 2),
        OcrWord("World", ocal::Rectangle(65, 40, 50, 15), 0.75, 2),
    };
    backend->enqueue(twoLines);
    result = engine.extractText(blankImage(), "deu");
    CHECK_EQ(result.text, std::string("File Edit\nHello World"));
    CHECK_NEAR(result.confidence, 0.85, 1e-9);
    CHECK_EQ(backend->lastLanguage(), std::string("deu"));

    backend->enqueue({});
    result = engine.extractText(blankImage());
    CHECK(result.empty());
    CHECK_NEAR(result.confidence, 0.0, 1e-9);
    CHECK(result.lowConfidence);

    CHECK_THROWS(engine.extractText(cv::Mat()), OcrError);

    std::cout << "[OK] Text extraction\n\n";
}

void testLowConfidence() {
    std::cout << "[TEST] Low-confidence text is flagged, not dropped\n";

    auto backend = std::make_shared<testing::ScriptedOcrBackend>();
    OcrEngine engine(backend, rawSettings());

    backend->enqueueLine({"Welcome"}, 0.5);
    OcrResult result = engine.extractText(blankImage());
    CHECK_EQ(result.text, std::string("Welcome"));
    CHECK(result.lowConfidence);

    // Same words, lower bar
    CHECK(!engine.extractText(blankImage(), "", 0.4).lowConfidence);

    CHECK(!engine.containsText(blankImage(), "welcome"));
    CHECK(engine.containsText(blankImage(), "welcome", 0.4));

    std::cout << "[OK] Low-confidence text is flagged, not dropped\n\n";
}

void testContainment() {
    std::cout << "[TEST] Case-insensitive, whitespace-tolerant containment\n";

    auto backend = std::make_shared<testing::ScriptedOcrBackend>();
    OcrEngine engine(backend, rawSettings());

    backend->enqueueLine({"Setup", "COMPLETE"}, 0.9);
    OcrResult result = engine.extractText(blankImage());
    CHECK(engine.resultContains(result, "setup   complete"));
    CHECK(engine.resultContains(result, "COMPLETE"));
    CHECK(!engine.resultContains(result, "failed"));
    CHECK(engine.containsText(blankImage(), "Setup Complete"));

    std::cout << "[OK] Containment\n\n";
}

void testFindTextPosition() {
    std::cout << "[TEST] Text position from word boxes\n";

    auto backend = std::make_shared<testing::ScriptedOcrBackend>();
    OcrEngine engine(backend, rawSettings());

    backend->enqueue({
        OcrWord("File", ocal::Rectangle(4, 4, 30, 16), 0.9, 1),
        OcrWord("Save", ocal::Rectangle(10, 40, 48, 20), 0.9, 2),
        OcrWord("As", ocal::Rectangle(66, 40, 24, 20), 0.9, 2),
        OcrWord("Cancel", ocal::Rectangle(120, 40, 60, 20), 0.9, 2),
    });

    std::optional<ocal::Rectangle> saveAs = engine.findTextPosition(blankImage(), "save as");
    CHECK(saveAs.has_value());
    CHECK(*saveAs == ocal::Rectangle(10, 40, 80, 20));

    std::optional<ocal::Rectangle> cancel = engine.findTextPosition(blankImage(), "Cancel");
    CHECK(cancel.has_value());
    CHECK(*cancel == ocal::Rectangle(120, 40, 60, 20));

    // Words on different lines never combine
    CHECK(!engine.findTextPosition(blankImage(), "File Save").has_value());
    CHECK(!engine.findTextPosition(blankImage(), "Open").has_value());
    CHECK(!engine.findTextPosition(blankImage(), "   ").has_value());

    std::cout << "[OK] Text position from word boxes\n\n";
}

void testPreprocessingRescalesBounds() {
    std::cout << "[TEST] Preprocessing upscales, bounds come back in input pixels\n";

    auto backend = std::make_shared<testing::ScriptedOcrBackend>();
    OcrSettings settings;
    settings.preprocessing = true;
    settings.scaleFactor = 2.0;
    OcrEngine engine(backend, settings);

    backend->enqueue({OcrWord("Total", ocal::Rectangle(20, 20, 100, 40), 0.9, 1)});
    OcrResult result = engine.extractText(blankImage(200, 60));

    CHECK(backend->lastImageSize() == cv::Size(400, 120));
    CHECK_EQ(result.words.size(), 1u);
    CHECK(result.words[0].bounds == ocal::Rectangle(10, 10, 50, 20));

    cv::Mat processed = engine.preprocess(blankImage(200, 60));
    CHECK_EQ(processed.channels(), 1);
    CHECK_EQ(processed.cols, 400);

    std::cout << "[OK] Preprocessing rescales bounds\n\n";
}

void testRegions() {
    std::cout << "[TEST] Named regions\n";

    auto backend = std::make_shared<testing::ScriptedOcrBackend>();
    OcrEngine engine(backend, rawSettings());

    backend->enqueue({OcrWord("579", ocal::Rectangle(150, 8, 36, 20), 0.93, 1)});
    std::map<std::string, OcrResult> results = engine.extractTextFromRegions(
        blankImage(), {{"display", ocal::Rectangle(100, 50, 200, 40)}});

    CHECK_EQ(results.size(), 1u);
    const OcrResult& display = results.at("display");
    CHECK_EQ(display.text, std::string("579"));
    CHECK(display.sourceRegion == ocal::Rectangle(100, 50, 200, 40));
    CHECK(display.words[0].bounds == ocal::Rectangle(250, 58, 36, 20));
    CHECK(backend->lastImageSize() == cv::Size(200, 40));

    CHECK_THROWS(engine.extractTextFromRegions(blankImage(), {{"offscreen", ocal::Rectangle(900, 900, 10, 10)}}),
                 OcrError);

    std::cout << "[OK] Named regions\n\n";
}

void testBackendFailure() {
    std::cout << "[TEST] Backend failures surface as OcrError\n";

    auto backend = std::make_shared<testing::ScriptedOcrBackend>();
    OcrEngine engine(backend, rawSettings());

    backend->failNextCall();
    CHECK_THROWS(engine.extractText(blankImage()), OcrError);

    backend->failNextCall();
    CHECK_THROWS(engine.containsText(blankImage(), "anything"), OcrError);

    std::cout << "[OK] Backend failures surface as OcrError\n\n";
}

void testConstruction() {
    std::cout << "[TEST] Engine settings validation\n";

    CHECK_THROWS(OcrEngine(nullptr), OcrError);

    OcrSettings badScale;
    badScale.scaleFactor = 0.0;
    CHECK_THROWS(OcrEngine(std::make_shared<testing::ScriptedOcrBackend>(), badScale), OcrError);

    OcrSettings badConfidence;
    badConfidence.minConfidence = 70.0;
    CHECK_THROWS(OcrEngine(std::make_shared<testing::ScriptedOcrBackend>(), badConfidence), OcrError);

    std::cout << "[OK] Engine settings validation\n\n";
}

int main() {
    return marionette::testing::runTests("Marionette OCR Engine Test Suite", {
        {"parse tsv", testParseTsv},
        {"missing tesseract", testMissingTesseract},
        {"extract text", testExtractText},
        {"low confidence", testLowConfidence},
        {"containment", testContainment},
        {"find text position", testFindTextPosition},
        {"preprocessing", testPreprocessingRescalesBounds},
        {"regions", testRegions},
        {"backend failure", testBackendFailure},
        {"construction", testConstruction},
    });
}
