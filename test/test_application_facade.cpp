#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <opencv2/core.hpp>
#include "test_harness.h"
#include "support/fake_desktop_backend.h"
#include "support/scripted_ocr_backend.h"
#include "common/error_handler.h"
#include "common/file_utils.h"
#include "common/os_utils.h"
#include "facade/application_facade.h"
#include "facade/scenario_context.h"
#include "ocal/screen_capture.h"

using namespace marionette;
using namespace marionette::facade;
using marionette::testing::FakeDesktopBackend;
using marionette::testing::ScriptedOcrBackend;
using namespace std::chrono_literals;

namespace {
    const std::string SHELL = "/bin/sh";

    // Client area of the first window the fake desktop opens
    const ocal::Rectangle CLIENT(100, 100, 400, 300);

    cv::Mat texturedPatch(int width, int height, uint64_t seed) {
        cv::Mat patch(height, width, CV_8UC3);
        cv::RNG rng(seed);
        rng.fill(patch, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));
        return patch;
    }

    struct Fixture {
        std::string evidenceDirectory;
        std::shared_ptr<FakeDesktopBackend> desktop;
        std::shared_ptr<ScriptedOcrBackend> ocrBackend;
        std::shared_ptr<registry::ApplicationRegistry> registry;
        std::shared_ptr<vision::TemplateCache> templates;
        std::shared_ptr<evidence::EvidenceRecorder> recorder;
        std::unique_ptr<ApplicationFacade> facade;

        Fixture()
            : evidenceDirectory(os::PathUtils::join(os::SystemInfo::getTempDirectory(),
                  "marionette_facade_test_" + std::to_string(os::SystemInfo::getCurrentProcessId()))),
              desktop(std::make_shared<FakeDesktopBackend>()),
              ocrBackend(std::make_shared<ScriptedOcrBackend>()) {
            registry::RegistrySettings settings;
            settings.launchTimeout = 300ms;
            settings.terminateGrace = 200ms;
            settings.focusTimeout = 300ms;
            settings.pollInterval = 10ms;
            settings.geometryTimeout = 150ms;
            settings.geometryPollInterval = 10ms;

            ocr::OcrSettings ocrSettings;
            ocrSettings.preprocessing = false;
            ocrSettings.minConfidence = 0.7;

            registry = std::make_shared<registry::ApplicationRegistry>(
                desktop, std::make_shared<ocal::ScreenCapture>(desktop), settings);
            templates = std::make_shared<vision::TemplateCache>();
            recorder = std::make_shared<evidence::EvidenceRecorder>(evidenceDirectory);
            facade = std::make_unique<ApplicationFacade>(
                registry, templates, std::make_shared<vision::ImageMatcher>(0.8),
                std::make_shared<ocr::OcrEngine>(ocrBackend, ocrSettings), recorder,
                sync::WaitPolicy(300ms, 20ms));
        }

        ~Fixture() {
            facade.reset();
            registry.reset();
            std::error_code ec;
            std::filesystem::remove_all(evidenceDirectory, ec);
        }
    };
}

void testClickAtClientPoint() {
    std::cout << "[TEST] Clicks map client points to the screen\n";
    Fixture f;
    registry::ManagedApplication app = f.registry->launch(SHELL, {}, "calc");

    f.facade->click("calc", ocal::Point(10, 20));
    f.facade->doubleClick("calc", ocal::Point(0, 0));
    f.facade->rightClick("calc", ocal::Point(399, 299));

    std::vector<testing::RecordedClick> clicks = f.desktop->clicks();
    CHECK_EQ(clicks.size(), 3u);
    CHECK(clicks[0].point == ocal::Point(110, 120));
    CHECK(clicks[0].button == ocal::MouseButton::LEFT);
    CHECK_EQ(clicks[0].count, 1);
    CHECK(clicks[1].point == ocal::Point(100, 100));
    CHECK_EQ(clicks[1].count, 2);
    CHECK(clicks[2].point == ocal::Point(499, 399));
    CHECK(clicks[2].button == ocal::MouseButton::RIGHT);

    // Input goes to the application's window
    CHECK_EQ(f.desktop->foregroundWindow(), app.primaryWindow);

    CHECK_THROWS(f.facade->click("calc", ocal::Point(400, 10)), WindowOperationError);
    CHECK_THROWS(f.facade->click("calc", ocal::Point(-1, 10)), WindowOperationError);
    CHECK_EQ(f.desktop->clicks().size(), 3u);

    std::cout << "[OK] Clicks map client points to the screen\n\n";
}

void testClickOnTemplate() {
    std::cout << "[TEST] Click on a located template\n";
    Fixture f;
    f.registry->launch(SHELL, {}, "calc");

    cv::Mat button = texturedPatch(40, 30, 7);
    f.desktop->paint(button, 300, 250);
    f.templates->put("equals_button.png", button);

    f.facade->click("calc", "equals_button.png");

    std::vector<testing::RecordedClick> clicks = f.desktop->clicks();
    CHECK_EQ(clicks.size(), 1u);
    CHECK(clicks[0].point == ocal::Point(320, 265));

    // Missing target: nothing is clicked
    f.templates->put("missing_button.png", texturedPatch(40, 30, 99));
    CHECK_THROWS(f.facade->click("calc", "missing_button.png", sync::WaitPolicy(100ms, 20ms)), TimeoutError);
    CHECK_EQ(f.desktop->clicks().size(), 1u);

    CHECK_THROWS(f.facade->click("calc", "no/such/file.png"), ImageMatchError);

    std::cout << "[OK] Click on a located template\n\n";
}

void testKeyboardInput() {
    std::cout << "[TEST] Typing and key chords\n";
    Fixture f;
    f.registry->launch(SHELL, {}, "notepad");

    f.facade->typeText("notepad", "Hello, World");
    f.facade->pressKey("notepad", "Control+s");

    CHECK_EQ(f.desktop->typedText().size(), 1u);
    CHECK_EQ(f.desktop->typedText()[0], std::string("Hello, World"));
    CHECK_EQ(f.desktop->pressedKeys().size(), 1u);
    CHECK_EQ(f.desktop->pressedKeys()[0], std::string("ctrl+s"));

    CHECK_THROWS(f.facade->pressKey("notepad", "ctrl+nosuchkey"), std::invalid_argument);
    CHECK_EQ(f.desktop->pressedKeys().size(), 1u);

    std::cout << "[OK] Typing and key chords\n\n";
}

void testAssertVisibleText() {
    std::cout << "[TEST] assertVisibleText polls OCR until the text shows\n";
    Fixture f;
    f.registry->launch(SHELL, {}, "calc");

    f.ocrBackend->enqueueLine({"0"}, 0.9);
    f.ocrBackend->enqueueLine({"0"}, 0.9);
    f.ocrBackend->enqueueLine({"579"}, 0.93);

    f.facade->assertVisibleText("calc", "579");
    CHECK_EQ(f.ocrBackend->calls(), 3);
    CHECK(f.ocrBackend->lastImageSize() == cv::Size(CLIENT.width, CLIENT.height));

    std::vector<evidence::VerificationRecord> records = f.recorder->verifications();
    CHECK_EQ(records.size(), 1u);
    CHECK(records[0].passed);
    CHECK_EQ(records[0].application, std::string("calc"));
    CHECK_EQ(records[0].operation, std::string("assertVisibleText"));
    CHECK_EQ(f.recorder->ocrTexts()["calc"].back(), std::string("579"));
    CHECK(f.recorder->screenshots().empty());

    std::cout << "[OK] assertVisibleText passed after " << f.ocrBackend->calls() << " reads\n\n";
}

void testAssertVisibleTextFailure() {
    std::cout << "[TEST] assertVisibleText failure carries evidence\n";
    Fixture f;
    f.registry->launch(SHELL, {}, "calc");
    f.ocrBackend->enqueueLine({"Welc"}, 0.9);

    bool thrown = false;
    try {
        f.facade->assertVisibleText("calc", "Welcome", sync::WaitPolicy(100ms, 20ms));
    } catch (const TimeoutError& e) {
        thrown = true;
        std::string message = e.what();
        CHECK(message.find("[calc] assertVisibleText") != std::string::npos);
        CHECK(e.lastObservedState().find("Welc") != std::string::npos);
        CHECK(e.attempts() >= 2);
        CHECK(!e.evidencePath().empty());
        CHECK(utils::FileUtils::fileExists(e.evidencePath()));
    }
    CHECK(thrown);

    std::vector<evidence::VerificationRecord> records = f.recorder->verifications();
    CHECK_EQ(records.size(), 1u);
    CHECK(!records[0].passed);
    CHECK(!records[0].evidencePath.empty());
    CHECK_EQ(f.recorder->screenshots().size(), 1u);

    // Text read with low confidence does not count
    f.ocrBackend->enqueueLine({"Welcome"}, 0.4);
    CHECK_THROWS(f.facade->assertVisibleText("calc", "Welcome", sync::WaitPolicy(100ms, 20ms)), TimeoutError);

    std::cout << "[OK] assertVisibleText failure carries evidence\n\n";
}

void testOcrFailurePropagates() {
    std::cout << "[TEST] A broken OCR backend fails the assertion at once\n";
    Fixture f;
    f.registry->launch(SHELL, {}, "calc");
    f.ocrBackend->failNextCall();

    CHECK_THROWS(f.facade->assertVisibleText("calc", "579", sync::WaitPolicy(5000ms, 20ms)), OcrError);
    CHECK_EQ(f.ocrBackend->calls(), 1);
    CHECK_EQ(f.recorder->verifications().size(), 1u);
    CHECK(!f.recorder->verifications()[0].passed);

    std::cout << "[OK] A broken OCR backend fails the assertion at once\n\n";
}

void testImageAssertions() {
    std::cout << "[TEST] assertImagePresent and assertImageAbsent\n";
    Fixture f;
    f.registry->launch(SHELL, {}, "calc");

    cv::Mat spinner = texturedPatch(32, 32, 21);
    f.templates->put("spinner.png", spinner);

    f.facade->assertImageAbsent("calc", "spinner.png");
    CHECK_THROWS(f.facade->assertImagePresent("calc", "spinner.png", sync::WaitPolicy(100ms, 20ms)), TimeoutError);

    f.desktop->paint(spinner, 200, 200);
    f.facade->assertImagePresent("calc", "spinner.png");
    CHECK_THROWS(f.facade->assertImageAbsent("calc", "spinner.png", sync::WaitPolicy(100ms, 20ms)), TimeoutError);

    // The spinner goes away while the assertion waits
    std::thread loader([&f]() {
        std::this_thread::sleep_for(100ms);
        f.desktop->fill(ocal::Rectangle(200, 200, 32, 32), cv::Scalar(128, 128, 128));
    });
    f.facade->assertImageAbsent("calc", "spinner.png", sync::WaitPolicy(3000ms, 20ms));
    loader.join();

    std::vector<evidence::VerificationRecord> records = f.recorder->verifications();
    CHECK_EQ(records.size(), 5u);
    CHECK(records[0].passed);
    CHECK(!records[1].passed);
    CHECK(records[2].passed);
    CHECK(!records[3].passed);
    CHECK(records[4].passed);

    std::cout << "[OK] assertImagePresent and assertImageAbsent\n\n";
}

void testScreenshotsAndReadText() {
    std::cout << "[TEST] Screenshots and text reads of the client area\n";
    Fixture f;
    f.registry->launch(SHELL, {}, "calc");

    cv::Mat shot = f.facade->captureScreenshot("calc");
    CHECK_EQ(shot.cols, CLIENT.width);
    CHECK_EQ(shot.rows, CLIENT.height);

    std::string path = f.facade->saveScreenshot("calc", "after login");
    CHECK(!path.empty());
    CHECK(utils::FileUtils::fileExists(path));
    CHECK(path.find("after_login") != std::string::npos);
    CHECK_EQ(f.recorder->lastScreenshotPath(), path);

    f.ocrBackend->enqueueLine({"File", "Edit"}, 0.95);
    ocr::OcrResult menu = f.facade->readText("calc", ocal::Rectangle(0, 0, 120, 40));
    CHECK_EQ(menu.text, std::string("File Edit"));
    CHECK(f.ocrBackend->lastImageSize() == cv::Size(120, 40));

    ocr::OcrResult whole = f.facade->readText("calc");
    CHECK_EQ(whole.text, std::string("File Edit"));
    CHECK(f.ocrBackend->lastImageSize() == cv::Size(CLIENT.width, CLIENT.height));

    std::cout << "[OK] Screenshots and text reads of the client area\n\n";
}

void testWaitForText() {
    std::cout << "[TEST] waitForText returns the matching read\n";
    Fixture f;
    f.registry->launch(SHELL, {}, "installer");

    f.ocrBackend->enqueueLine({"Installing..."}, 0.9);
    f.ocrBackend->enqueueLine({"Setup", "complete"}, 0.9);

    ocr::OcrResult result = f.facade->waitForText("installer", "setup COMPLETE");
    CHECK_EQ(result.text, std::string("Setup complete"));
    CHECK(!result.lowConfidence);
    CHECK_EQ(result.words.size(), 2u);

    std::cout << "[OK] waitForText returns the matching read\n\n";
}

void testUnavailableApplication() {
    std::cout << "[TEST] Operations on missing applications fail fast\n";
    Fixture f;
    registry::ManagedApplication app = f.registry->launch(SHELL, {}, "calc");

    CHECK_THROWS(f.facade->click("unknown", ocal::Point(1, 1)), NotFoundError);
    CHECK_THROWS(f.facade->typeText("unknown", "x"), NotFoundError);

    f.registry->minimize("calc");
    CHECK_THROWS(f.facade->captureScreenshot("calc"), WindowOperationError);
    f.registry->restore("calc");

    f.desktop->exitProcess(app.processId);
    auto start = std::chrono::steady_clock::now();
    CHECK_THROWS(f.facade->assertVisibleText("calc", "579", sync::WaitPolicy(5000ms, 20ms)), NotFoundError);
    CHECK(std::chrono::steady_clock::now() - start < 1000ms);
    CHECK_THROWS(f.facade->click("calc", ocal::Point(1, 1)), NotFoundError);
    CHECK(f.desktop->clicks().empty());

    std::cout << "[OK] Operations on missing applications fail fast\n\n";
}

void testTransientWindowStates() {
    std::cout << "[TEST] Verifications wait out a minimized window\n";
    Fixture f;
    registry::ManagedApplication app = f.registry->launch(SHELL, {}, "calc");
    f.ocrBackend->enqueueLine({"579"}, 0.95);

    f.registry->minimize("calc");
    std::string minimizedState;
    try {
        f.facade->assertVisibleText("calc", "579", sync::WaitPolicy(100ms, 20ms));
    } catch (const TimeoutError& e) {
        minimizedState = e.lastObservedState();
    }
    CHECK(minimizedState.find("minimized") != std::string::npos);
    CHECK_EQ(f.ocrBackend->calls(), 0);

    // Restored by someone else while the assertion polls
    std::thread restorer([&f, &app]() {
        std::this_thread::sleep_for(100ms);
        f.desktop->restoreWindow(app.primaryWindow);
    });
    std::string failure;
    try {
        f.facade->assertVisibleText("calc", "579", sync::WaitPolicy(3000ms, 20ms));
    } catch (const std::exception& e) {
        failure = e.what();
    }
    restorer.join();

    CHECK_EQ(failure, std::string(""));
    CHECK_EQ(f.ocrBackend->calls(), 1);
    std::vector<evidence::VerificationRecord> records = f.recorder->verifications();
    CHECK_EQ(records.size(), 2u);
    CHECK(!records[0].passed);
    CHECK(records[1].passed);

    std::cout << "[OK] Verifications wait out a minimized window\n\n";
}

void testCancelledVerification() {
    std::cout << "[TEST] A cancelled wait ends early\n";
    Fixture f;
    f.registry->launch(SHELL, {}, "calc");
    f.ocrBackend->enqueueLine({"0"}, 0.9);

    sync::CancellationToken token;
    std::thread canceller([&token]() {
        std::this_thread::sleep_for(100ms);
        token.cancel();
    });
    bool cancelled = false;
    auto start = std::chrono::steady_clock::now();
    try {
        f.facade->assertVisibleText("calc", "579", sync::WaitPolicy(10000ms, 20ms), &token);
    } catch (const TimeoutError& e) {
        cancelled = std::string(e.what()).find("cancelled") != std::string::npos;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    CHECK(cancelled);
    CHECK(elapsed < 2000ms);
    CHECK_EQ(f.recorder->verifications().size(), 1u);
    CHECK(!f.recorder->verifications()[0].passed);

    // Already cancelled: the click target is never searched for
    f.templates->put("equals_button.png", texturedPatch(40, 30, 7));
    f.desktop->paint(texturedPatch(40, 30, 7), 300, 250);
    CHECK_THROWS(f.facade->click("calc", "equals_button.png", sync::WaitPolicy(10000ms, 20ms), &token),
                 TimeoutError);
    CHECK(f.desktop->clicks().empty());

    std::cout << "[OK] A cancelled wait ends early\n\n";
}

void testHoverAndDrag() {
    std::cout << "[TEST] Hover and drag send pointer input once\n";
    Fixture f;
    registry::ManagedApplication app = f.registry->launch(SHELL, {}, "paint");

    f.facade->hover("paint", ocal::Point(10, 20));
    f.facade->drag("paint", ocal::Point(0, 0), ocal::Point(50, 60));

    std::vector<ocal::Point> moves = f.desktop->pointerMoves();
    CHECK_EQ(moves.size(), 1u);
    CHECK(moves[0] == ocal::Point(110, 120));

    std::vector<testing::RecordedDrag> drags = f.desktop->drags();
    CHECK_EQ(drags.size(), 1u);
    CHECK(drags[0].from == ocal::Point(100, 100));
    CHECK(drags[0].to == ocal::Point(150, 160));
    CHECK(drags[0].button == ocal::MouseButton::LEFT);
    CHECK_EQ(f.desktop->foregroundWindow(), app.primaryWindow);
    CHECK(f.desktop->clicks().empty());

    // Both ends must lie inside the client area
    CHECK_THROWS(f.facade->drag("paint", ocal::Point(10, 10), ocal::Point(400, 10)), WindowOperationError);
    CHECK_THROWS(f.facade->hover("paint", ocal::Point(-5, 10)), WindowOperationError);
    CHECK_THROWS(f.facade->hover("unknown", ocal::Point(1, 1)), NotFoundError);
    CHECK_EQ(f.desktop->drags().size(), 1u);
    CHECK_EQ(f.desktop->pointerMoves().size(), 1u);

    std::cout << "[OK] Hover and drag send pointer input once\n\n";
}

void testWaitForScreenStability() {
    std::cout << "[TEST] waitForScreenStability waits for the window to settle\n";
    Fixture f;
    f.registry->launch(SHELL, {}, "installer");

    // A still window settles after the quiet period
    auto start = std::chrono::steady_clock::now();
    f.facade->waitForScreenStability("installer", 100ms, sync::WaitPolicy(3000ms, 20ms));
    CHECK(std::chrono::steady_clock::now() - start >= 100ms);

    // Repainted every 20 ms for a while, then left alone
    std::atomic<bool> paintingFinished(false);
    std::thread animation([&f, &paintingFinished]() {
        for (int frame = 0; frame < 10; ++frame) {
            f.desktop->paint(texturedPatch(CLIENT.width, CLIENT.height, 100 + frame), CLIENT.x, CLIENT.y);
            std::this_thread::sleep_for(20ms);
        }
        paintingFinished = true;
    });
    std::string failure;
    try {
        f.facade->waitForScreenStability("installer", 150ms, sync::WaitPolicy(3000ms, 20ms));
    } catch (const std::exception& e) {
        failure = e.what();
    }
    bool settledAfterAnimation = paintingFinished.load();
    animation.join();

    CHECK_EQ(failure, std::string(""));
    CHECK(settledAfterAnimation);

    // Never settles
    std::atomic<bool> animating(true);
    std::thread spinner([&f, &animating]() {
        for (int frame = 0; animating; ++frame) {
            f.desktop->paint(texturedPatch(CLIENT.width, CLIENT.height, 200 + frame), CLIENT.x, CLIENT.y);
            std::this_thread::sleep_for(10ms);
        }
    });
    bool timedOut = false;
    try {
        f.facade->waitForScreenStability("installer", 200ms, sync::WaitPolicy(400ms, 20ms));
    } catch (const TimeoutError&) {
        timedOut = true;
    }
    animating = false;
    spinner.join();
    CHECK(timedOut);

    std::vector<evidence::VerificationRecord> records = f.recorder->verifications();
    CHECK_EQ(records.size(), 3u);
    CHECK(records[1].passed);
    CHECK(!records[2].passed);
    CHECK_EQ(records[2].operation, std::string("waitForScreenStability"));

    std::cout << "[OK] waitForScreenStability waits for the window to settle\n\n";
}

void testScenarioCleanupCancelsWaits() {
    std::cout << "[TEST] Scenario cleanup from another thread ends a blocked step\n";
    Fixture f;
    f.ocrBackend->enqueueLine({"0"}, 0.9);

    ScenarioContext scenario(*f.facade, "stuck step");
    ocal::ProcessId pid = scenario.launch(SHELL, {}, "calc").processId;

    std::atomic<bool> stepCancelled(false);
    std::atomic<bool> stepFailedOtherwise(false);
    std::thread step([&scenario, &stepCancelled, &stepFailedOtherwise]() {
        try {
            scenario.assertVisibleText("579", sync::WaitPolicy(10000ms, 20ms));
        } catch (const TimeoutError&) {
            stepCancelled = true;
        } catch (const std::exception&) {
            stepFailedOtherwise = true;
        }
    });

    // Wait until the step is polling
    auto deadline = std::chrono::steady_clock::now() + 2000ms;
    while (f.ocrBackend->calls() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }

    auto start = std::chrono::steady_clock::now();
    scenario.cleanup();
    auto elapsed = std::chrono::steady_clock::now() - start;
    step.join();

    CHECK(stepCancelled.load());
    CHECK(!stepFailedOtherwise.load());
    CHECK(elapsed < 2000ms);
    CHECK(scenario.isCancelled());
    CHECK(!f.desktop->isProcessRunning(pid));
    CHECK(f.registry->registeredNames().empty());

    std::cout << "[OK] Scenario cleanup from another thread ends a blocked step\n\n";
}

void testScenarioContext() {
    std::cout << "[TEST] Scenario context owns its applications\n";
    Fixture f;

    ocal::ProcessId first = 0;
    ocal::ProcessId second = 0;
    {
        ScenarioContext scenario(*f.facade, "add two numbers");
        CHECK(!scenario.hasDefaultApplication());
        CHECK_THROWS(scenario.application(), NotFoundError);

        first = scenario.launch(SHELL, {}, "calc").processId;
        second = scenario.launch(SHELL, {}, "notepad").processId;
        CHECK_EQ(scenario.application(), std::string("calc"));
        CHECK_EQ(scenario.application("notepad"), std::string("notepad"));

        f.ocrBackend->enqueueLine({"579"}, 0.95);
        scenario.click(ocal::Point(5, 5));
        scenario.typeText("123+456");
        scenario.pressKey("enter");
        scenario.assertVisibleText("579");

        scenario.setDefaultApplication("notepad");
        scenario.typeText("notes");
        CHECK_EQ(f.desktop->typedText().size(), 2u);
    }
    CHECK(!f.desktop->isProcessRunning(first));
    CHECK(!f.desktop->isProcessRunning(second));
    CHECK(f.registry->registeredNames().empty());

    std::cout << "[OK] Scenario context owns its applications\n\n";
}

int main() {
    return marionette::testing::runTests("Marionette Application Facade Test Suite", {
        {"click at client point", testClickAtClientPoint},
        {"click on template", testClickOnTemplate},
        {"keyboard input", testKeyboardInput},
        {"assertVisibleText", testAssertVisibleText},
        {"assertVisibleText failure", testAssertVisibleTextFailure},
        {"OCR failure", testOcrFailurePropagates},
        {"image assertions", testImageAssertions},
        {"screenshots and readText", testScreenshotsAndReadText},
        {"waitForText", testWaitForText},
        {"unavailable application", testUnavailableApplication},
        {"transient window states", testTransientWindowStates},
        {"cancelled verification", testCancelledVerification},
        {"hover and drag", testHoverAndDrag},
        {"screen stability", testWaitForScreenStability},
        {"scenario context", testScenarioContext},
        {"scenario cleanup cancels waits", testScenarioCleanupCancelsWaits},
    });
}
