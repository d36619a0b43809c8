#include "application_facade.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include "../ocal/key_combo.h"
#include <sstream>
#include <stdexcept>

namespace marionette {
namespace facade {

namespace {
    const size_t MAX_OBSERVED_TEXT = 160;

    std::string abbreviate(const std::string& text) {
        std::string flat;
        for (char c : text) {
            flat.push_back(c == '\n' ? ' ' : c);
        }
        if (flat.size() > MAX_OBSERVED_TEXT) {
            flat = flat.substr(0, MAX_OBSERVED_TEXT) + "...";
        }
        return flat;
    }

    std::string describeText(const ocr::OcrResult& result) {
        std::ostringstream ss;
        ss.precision(2);
        ss << "text '" << abbreviate(result.text) << "' confidence " << std::fixed << result.confidence;
        if (result.lowConfidence) {
            ss << " (low)";
        }
        return ss.str();
    }

    std::string failureContext(const std::string& application, const std::string& operation,
                               const std::string& description) {
        return "[" + application + "] " + operation + ": " + description;
    }
}

ApplicationFacade::ApplicationFacade(std::shared_ptr<registry::ApplicationRegistry> registry,
                                     std::shared_ptr<vision::TemplateCache> templates,
                                     std::shared_ptr<vision::ImageMatcher> matcher,
                                     std::shared_ptr<ocr::OcrEngine> ocr,
                                     std::shared_ptr<evidence::EvidenceRecorder> recorder,
                                     sync::WaitPolicy defaultPolicy)
    : m_registry(std::move(registry)), m_templates(std::move(templates)),
      m_matcher(std::move(matcher)), m_ocr(std::move(ocr)),
      m_recorder(std::move(recorder)), m_defaultPolicy(std::move(defaultPolicy)) {
    if (!m_registry || !m_templates || !m_matcher || !m_ocr || !m_recorder) {
        throw std::invalid_argument("ApplicationFacade requires all engine components");
    }
}

sync::WaitPolicy ApplicationFacade::effectivePolicy(const std::optional<sync::WaitPolicy>& policy) const {
    return policy ? *policy : m_defaultPolicy;
}

ApplicationFacade::WindowCapture ApplicationFacade::captureWindow(const std::string& application) {
    ocal::WindowInfo window = m_registry->primaryWindowInfo(application);
    if (window.isMinimized) {
        throw WindowOperationError("Window is minimized", window.title, application);
    }

    WindowCapture shot;
    shot.region = window.clientBounds.intersect(m_registry->backend().screenBounds());
    if (shot.region.empty()) {
        throw WindowOperationError("Window is not on screen", window.clientBounds.toString(), application);
    }
    shot.clientOffset = ocal::Point(shot.region.x - window.clientBounds.x,
                                    shot.region.y - window.clientBounds.y);
    shot.image = m_registry->capture().capture(shot.region);
    return shot;
}

ocal::Point ApplicationFacade::toScreen(const std::string& application, const ocal::Point& clientPoint) {
    ocal::WindowInfo window = m_registry->primaryWindowInfo(application);
    const ocal::Rectangle& client = window.clientBounds;
    if (!ocal::Rectangle(0, 0, client.width, client.height).contains(clientPoint)) {
        throw WindowOperationError("Point lies outside the window",
                                   "(" + std::to_string(clientPoint.x) + "," + std::to_string(clientPoint.y) +
                                   ") in " + client.toString(), application);
    }
    return ocal::Point(client.x + clientPoint.x, client.y + clientPoint.y);
}

ApplicationFacade::Observation ApplicationFacade::observe(const std::string& application, const Check& check,
                                                          const sync::WaitPolicy& policy,
                                                          const sync::CancellationToken* cancellation) {
    Observation observation;
    observation.result = sync::awaitCondition(sync::Probe([&]() {
        try {
            observation.lastCapture = captureWindow(application);
        } catch (const WindowOperationError& e) {
            // Minimized, off screen or between windows; the next poll looks again
            return sync::ProbeResult(false, e.what());
        }
        return check(observation.lastCapture);
    }), policy, cancellation);
    return observation;
}

std::string ApplicationFacade::saveFailureEvidence(const std::string& application, const std::string& operation,
                                                   const Observation& observation) {
    if (observation.lastCapture.image.empty()) {
        return m_recorder->lastScreenshotPath();
    }
    return m_recorder->saveScreenshot(application + "_" + operation + "_failed", observation.lastCapture.image);
}

void ApplicationFacade::verify(const std::string& application, const std::string& operation,
                               const std::string& description, const Check& check,
                               const sync::WaitPolicy& policy,
                               const sync::CancellationToken* cancellation) {
    evidence::VerificationRecord record;
    record.description = description;
    record.application = application;
    record.operation = operation;

    Observation observation;
    try {
        observation = observe(application, check, policy, cancellation);
    } catch (const MarionetteException& e) {
        record.passed = false;
        record.details = e.what();
        record.evidencePath = m_recorder->lastScreenshotPath();
        m_recorder->recordVerification(record);
        throw;
    }

    const sync::WaitResult& result = observation.result;
    record.passed = result.satisfied;
    record.details = result.lastObservedState + " (" + std::to_string(result.attempts) + " attempts, " +
                     std::to_string(result.elapsed.count()) + " ms)";
    if (!result.satisfied) {
        record.evidencePath = saveFailureEvidence(application, operation, observation);
    }
    m_recorder->recordVerification(record);

    MARIONETTE_RECORD_AND_RETHROW(
        result.throwIfFailed(failureContext(application, operation, description), record.evidencePath),
        application);
}

void ApplicationFacade::sendClick(const std::string& application, const ocal::Point& screenPoint,
                                  ocal::MouseButton button, int count, const std::string& operation) {
    m_registry->focus(application);
    m_registry->backend().click(screenPoint, button, count);
    SLOG_INFO().message("Clicked")
        .application(application)
        .context("operation", operation)
        .context("x", screenPoint.x)
        .context("y", screenPoint.y);
}

void ApplicationFacade::clickPoint(const std::string& application, const ocal::Point& point,
                                   ocal::MouseButton button, int count, const std::string& operation) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    m_registry->resolve(application);
    sendClick(application, toScreen(application, point), button, count, operation);
}

void ApplicationFacade::clickTemplate(const std::string& application, const std::string& templatePath,
                                      const std::optional<sync::WaitPolicy>& policy,
                                      const sync::CancellationToken* cancellation,
                                      ocal::MouseButton button, int count, const std::string& operation) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    m_registry->resolve(application);
    vision::TemplatePtr templ = m_templates->load(templatePath);

    vision::MatchResult match;
    Observation observation = observe(application, [&](const WindowCapture& shot) {
        match = m_matcher->findBestMatch(shot.image, *templ);
        return sync::ProbeResult(match.found, match.toString());
    }, effectivePolicy(policy), cancellation);

    if (!observation.result.satisfied) {
        std::string evidencePath = saveFailureEvidence(application, operation, observation);
        MARIONETTE_RECORD_AND_RETHROW(
            observation.result.throwIfFailed(
                failureContext(application, operation, "locate " + templatePath), evidencePath),
            application);
    }

    // Matched in capture coordinates; the capture shows observation.lastCapture.region
    ocal::Point center = match.bounds.center();
    const ocal::Rectangle& region = observation.lastCapture.region;
    sendClick(application, ocal::Point(region.x + center.x, region.y + center.y), button, count, operation);
}

void ApplicationFacade::click(const std::string& application, const ocal::Point& point) {
    clickPoint(application, point, ocal::MouseButton::LEFT, 1, "click");
}

void ApplicationFacade::click(const std::string& application, const std::string& templatePath,
                              const std::optional<sync::WaitPolicy>& policy,
                              const sync::CancellationToken* cancellation) {
    clickTemplate(application, templatePath, policy, cancellation, ocal::MouseButton::LEFT, 1, "click");
}

void ApplicationFacade::doubleClick(const std::string& application, const ocal::Point& point) {
    clickPoint(application, point, ocal::MouseButton::LEFT, 2, "doubleClick");
}

void ApplicationFacade::doubleClick(const std::string& application, const std::string& templatePath,
                                    const std::optional<sync::WaitPolicy>& policy,
                                    const sync::CancellationToken* cancellation) {
    clickTemplate(application, templatePath, policy, cancellation, ocal::MouseButton::LEFT, 2, "doubleClick");
}

void ApplicationFacade::rightClick(const std::string& application, const ocal::Point& point) {
    clickPoint(application, point, ocal::MouseButton::RIGHT, 1, "rightClick");
}

void ApplicationFacade::rightClick(const std::string& application, const std::string& templatePath,
                                   const std::optional<sync::WaitPolicy>& policy,
                                   const sync::CancellationToken* cancellation) {
    clickTemplate(application, templatePath, policy, cancellation, ocal::MouseButton::RIGHT, 1, "rightClick");
}

void ApplicationFacade::hover(const std::string& application, const ocal::Point& point) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    m_registry->resolve(application);
    ocal::Point target = toScreen(application, point);
    m_registry->focus(application);
    m_registry->backend().moveMouse(target);
    SLOG_INFO().message("Pointer moved")
        .application(application)
        .context("x", target.x)
        .context("y", target.y);
}

void ApplicationFacade::drag(const std::string& application, const ocal::Point& from, const ocal::Point& to) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    m_registry->resolve(application);
    ocal::Point start = toScreen(application, from);
    ocal::Point end = toScreen(application, to);
    m_registry->focus(application);
    m_registry->backend().drag(start, end, ocal::MouseButton::LEFT);
    SLOG_INFO().message("Dragged")
        .application(application)
        .context("from_x", start.x)
        .context("from_y", start.y)
        .context("to_x", end.x)
        .context("to_y", end.y);
}

void ApplicationFacade::typeText(const std::string& application, const std::string& text) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    m_registry->resolve(application);
    m_registry->focus(application);
    m_registry->backend().typeText(text);
    SLOG_INFO().message("Typed text")
        .application(application)
        .context("characters", text.size());
}

void ApplicationFacade::pressKey(const std::string& application, const std::string& keyCombo) {
    ocal::KeyCombo combo = ocal::parseKeyCombo(keyCombo);

    registry::ApplicationLock lock = m_registry->lockApplication(application);
    m_registry->resolve(application);
    m_registry->focus(application);
    m_registry->backend().pressKeys(combo);
    SLOG_INFO().message("Pressed keys")
        .application(application)
        .context("keys", combo.toString());
}

cv::Mat ApplicationFacade::captureScreenshot(const std::string& application) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    return captureWindow(application).image;
}

std::string ApplicationFacade::saveScreenshot(const std::string& application, const std::string& label) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    cv::Mat image = captureWindow(application).image;
    return m_recorder->saveScreenshot(label.empty() ? application : label, image);
}

ocr::OcrResult ApplicationFacade::awaitText(const std::string& application, const std::string& operation,
                                            const std::string& expected, const sync::WaitPolicy& policy,
                                            const sync::CancellationToken* cancellation) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    m_registry->resolve(application);

    ocr::OcrResult last;
    bool haveText = false;
    try {
        verify(application, operation, "text '" + expected + "' visible", [&](const WindowCapture& shot) {
            last = m_ocr->extractText(shot.image);
            haveText = true;
            bool found = !last.lowConfidence && m_ocr->resultContains(last, expected);
            return sync::ProbeResult(found, describeText(last));
        }, policy, cancellation);
    } catch (const MarionetteException&) {
        if (haveText) {
            m_recorder->recordOcr(application, last.text);
        }
        throw;
    }
    m_recorder->recordOcr(application, last.text);
    return last;
}

void ApplicationFacade::assertVisibleText(const std::string& application, const std::string& expected,
                                          const std::optional<sync::WaitPolicy>& policy,
                                          const sync::CancellationToken* cancellation) {
    awaitText(application, "assertVisibleText", expected, effectivePolicy(policy), cancellation);
}

ocr::OcrResult ApplicationFacade::waitForText(const std::string& application, const std::string& expected,
                                              const std::optional<sync::WaitPolicy>& policy,
                                              const sync::CancellationToken* cancellation) {
    return awaitText(application, "waitForText", expected, effectivePolicy(policy), cancellation);
}

void ApplicationFacade::assertImagePresent(const std::string& application, const std::string& templatePath,
                                           const std::optional<sync::WaitPolicy>& policy,
                                           const sync::CancellationToken* cancellation) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    m_registry->resolve(application);
    vision::TemplatePtr templ = m_templates->load(templatePath);

    verify(application, "assertImagePresent", "image '" + templatePath + "' present",
           [&](const WindowCapture& shot) {
               vision::MatchResult match = m_matcher->findBestMatch(shot.image, *templ);
               return sync::ProbeResult(match.found, match.toString());
           }, effectivePolicy(policy), cancellation);
}

void ApplicationFacade::assertImageAbsent(const std::string& application, const std::string& templatePath,
                                          const std::optional<sync::WaitPolicy>& policy,
                                          const sync::CancellationToken* cancellation) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    m_registry->resolve(application);
    vision::TemplatePtr templ = m_templates->load(templatePath);

    verify(application, "assertImageAbsent", "image '" + templatePath + "' absent",
           [&](const WindowCapture& shot) {
               vision::MatchResult match = m_matcher->findBestMatch(shot.image, *templ);
               return sync::ProbeResult(!match.found, match.toString());
           }, effectivePolicy(policy), cancellation);
}

void ApplicationFacade::waitForScreenStability(const std::string& application, std::chrono::milliseconds stableFor,
                                               const std::optional<sync::WaitPolicy>& policy,
                                               const sync::CancellationToken* cancellation) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    m_registry->resolve(application);

    cv::Mat previous;
    std::chrono::steady_clock::time_point lastChange = std::chrono::steady_clock::now();
    verify(application, "waitForScreenStability",
           "screen unchanged for " + std::to_string(stableFor.count()) + " ms",
           [&](const WindowCapture& shot) {
               auto now = std::chrono::steady_clock::now();
               // A resized window counts as a change
               double similarity = 0.0;
               if (!previous.empty() && previous.size() == shot.image.size()) {
                   similarity = m_matcher->compare(previous, shot.image);
               }
               if (previous.empty() || similarity < STABLE_SIMILARITY) {
                   lastChange = now;
               }
               previous = shot.image;

               auto quiet = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastChange);
               std::ostringstream state;
               state.precision(3);
               state << "unchanged for " << quiet.count() << " ms, similarity " << std::fixed << similarity;
               return sync::ProbeResult(quiet >= stableFor, state.str());
           }, effectivePolicy(policy), cancellation);
}

ocr::OcrResult ApplicationFacade::readText(const std::string& application,
                                           const std::optional<ocal::Rectangle>& region) {
    registry::ApplicationLock lock = m_registry->lockApplication(application);
    WindowCapture shot = captureWindow(application);

    ocr::OcrResult result;
    std::string label = application;
    if (region) {
        ocal::Rectangle inImage(region->x - shot.clientOffset.x, region->y - shot.clientOffset.y,
                                region->width, region->height);
        std::map<std::string, ocal::Rectangle> regions{{region->toString(), inImage}};
        result = m_ocr->extractTextFromRegions(shot.image, regions).begin()->second;
        label += " " + region->toString();
    } else {
        result = m_ocr->extractText(shot.image);
    }

    m_recorder->recordOcr(label, result.text);
    SLOG_DEBUG().message("Text read")
        .application(application)
        .context("characters", result.text.size())
        .context("confidence", result.confidence);
    return result;
}

} // namespace facade
} // namespace marionette
