#include <iostream>
#include <memory>
#include <stdexcept>
#include "test_harness.h"
#include "common/error_handler.h"
#include "common/structured_logger.h"

using namespace marionette;
using namespace std::chrono_literals;

void testExceptionHierarchy() {
    std::cout << "[TEST] Exception types and retry classification\n";

    NotFoundError missing("No application registered as 'calc'");
    CHECK_EQ(std::string(missing.what()), std::string("No application registered as 'calc'"));
    CHECK(missing.type() == ErrorType::NOT_FOUND_ERROR);
    CHECK(missing.isFatal());

    CHECK(!OperationError("EnumWindows failed").isFatal());
    CHECK(OcrError("tesseract not found").isFatal());
    CHECK(OperationError("transient").getErrorInfo().severity == ErrorSeverity::MEDIUM);

    TimeoutError timeout("Text '579' not visible", 7, 3000ms, "read '57'", "evidence/fail.png", "calc");
    CHECK(!timeout.isFatal());
    CHECK_EQ(timeout.attempts(), 7);
    CHECK(timeout.elapsed() == 3000ms);
    CHECK_EQ(timeout.lastObservedState(), std::string("read '57'"));
    CHECK_EQ(timeout.evidencePath(), std::string("evidence/fail.png"));
    CHECK_EQ(timeout.getErrorInfo().context, std::string("calc"));

    // Every typed error is catchable as the common base
    CHECK_THROWS(throw LaunchError("spawn failed"), MarionetteException);
    CHECK_THROWS(throw ImageMatchError("empty template"), MarionetteException);

    std::cout << "[OK] Exception types and retry classification\n\n";
}

void testHistoryAndLogging() {
    std::cout << "[TEST] Error history and structured log output\n";

    auto& handler = ErrorHandler::getInstance();
    handler.clearErrorHistory();

    auto sink = std::make_shared<MemoryLogSink>();
    StructuredLogger::getInstance().addSink(sink);

    MARIONETTE_HANDLE_ERROR(ErrorType::OCR_ERROR, ErrorSeverity::HIGH,
                            "tesseract exited with status 1", "stderr: bad image", "ocr.extract");
    handler.handleException(NotFoundError("No application registered as 'calc'"), "registry.resolve");
    handler.handleException(std::runtime_error("boom"), "facade.click");

    CHECK_EQ(handler.errorCount(ErrorType::OCR_ERROR), 1u);
    CHECK_EQ(handler.errorCount(ErrorType::NOT_FOUND_ERROR), 1u);
    CHECK_EQ(handler.errorCount(ErrorType::UNKNOWN_ERROR), 1u);
    CHECK_EQ(handler.errorCount(ErrorType::TIMEOUT_ERROR), 0u);

    std::vector<ErrorInfo> recent = handler.getRecentErrors(2);
    CHECK_EQ(recent.size(), 2u);
    CHECK_EQ(recent[0].context, std::string("registry.resolve"));
    CHECK_EQ(recent[1].message, std::string("boom"));

    std::vector<LogEntry> entries = sink->entries();
    CHECK_EQ(entries.size(), 3u);
    CHECK(entries[0].level == LogLevel::ERROR_LEVEL);
    CHECK_EQ(entries[0].message, std::string("[OCR] tesseract exited with status 1"));
    CHECK_EQ(entries[0].context["error_type"].get<std::string>(), std::string("OCR"));
    CHECK_EQ(entries[0].context["details"].get<std::string>(), std::string("stderr: bad image"));
    CHECK_EQ(entries[0].context["where"].get<std::string>(), std::string("ocr.extract"));
    CHECK(!entries[1].context.contains("details"));

    handler.clearErrorHistory();
    CHECK(handler.getRecentErrors().empty());

    StructuredLogger::getInstance().removeSink(sink);
    std::cout << "[OK] Error history and structured log output\n\n";
}

void testRecordAndRethrow() {
    std::cout << "[TEST] Record and rethrow keeps the original type\n";

    auto& handler = ErrorHandler::getInstance();
    handler.clearErrorHistory();

    bool caughtTyped = false;
    try {
        MARIONETTE_RECORD_AND_RETHROW(throw LaunchError("process exited early", "status 127"), "registry.launch");
    } catch (const LaunchError& e) {
        caughtTyped = true;
        CHECK_EQ(e.getErrorInfo().details, std::string("status 127"));
    }
    CHECK(caughtTyped);

    std::vector<ErrorInfo> recent = handler.getRecentErrors();
    CHECK_EQ(recent.size(), 1u);
    CHECK(recent[0].type == ErrorType::LAUNCH_ERROR);
    CHECK_EQ(recent[0].context, std::string("registry.launch"));

    handler.clearErrorHistory();
    std::cout << "[OK] Record and rethrow keeps the original type\n\n";
}

int main() {
    int result = marionette::testing::runTests("Marionette Error Handler Test Suite", {
        {"exception hierarchy", testExceptionHierarchy},
        {"history and logging", testHistoryAndLogging},
        {"record and rethrow", testRecordAndRethrow},
    });
    StructuredLogger::getInstance().shutdown();
    return result;
}
