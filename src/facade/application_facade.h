#ifndef MARIONETTE_APPLICATION_FACADE_H
#define MARIONETTE_APPLICATION_FACADE_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <opencv2/core.hpp>
#include "../evidence/evidence_recorder.h"
#include "../ocr/ocr_engine.h"
#include "../registry/application_registry.h"
#include "../sync/wait_condition.h"
#include "../vision/image_matcher.h"
#include "../vision/template_cache.h"

namespace marionette {
namespace facade {

/**
 * @brief The operations test steps perform on a managed application
 *
 * Every call names its application, fails with NotFoundError straight away
 * when the name is unknown or the process is gone, and holds the
 * application's lock until it returns. Input (click, hover, drag, type, key)
 * is sent exactly once. Verifications and the search for a click target are
 * polled with the given policy (the facade default when omitted) and end
 * early when the optional cancellation token fires. A window that is
 * minimized or off screen while polling counts as "not yet". Every
 * verification outcome lands in the evidence recorder.
 *
 * Points are relative to the top-left corner of the window's client area.
 */
class ApplicationFacade {
public:
    ApplicationFacade(std::shared_ptr<registry::ApplicationRegistry> registry,
                      std::shared_ptr<vision::TemplateCache> templates,
                      std::shared_ptr<vision::ImageMatcher> matcher,
                      std::shared_ptr<ocr::OcrEngine> ocr,
                      std::shared_ptr<evidence::EvidenceRecorder> recorder,
                      sync::WaitPolicy defaultPolicy = sync::WaitPolicy());

    void click(const std::string& application, const ocal::Point& point);
    void click(const std::string& application, const std::string& templatePath,
               const std::optional<sync::WaitPolicy>& policy = std::nullopt,
               const sync::CancellationToken* cancellation = nullptr);
    void doubleClick(const std::string& application, const ocal::Point& point);
    void doubleClick(const std::string& application, const std::string& templatePath,
                     const std::optional<sync::WaitPolicy>& policy = std::nullopt,
                     const sync::CancellationToken* cancellation = nullptr);
    void rightClick(const std::string& application, const ocal::Point& point);
    void rightClick(const std::string& application, const std::string& templatePath,
                    const std::optional<sync::WaitPolicy>& policy = std::nullopt,
                    const sync::CancellationToken* cancellation = nullptr);

    // Moves the pointer without pressing a button, e.g. to raise a tooltip
    void hover(const std::string& application, const ocal::Point& point);

    // Press the left button at from, move to to, release; both points in the same window
    void drag(const std::string& application, const ocal::Point& from, const ocal::Point& to);

    void typeText(const std::string& application, const std::string& text);

    // keyCombo such as "ctrl+s", "alt+F4", "Enter"; std::invalid_argument if malformed
    void pressKey(const std::string& application, const std::string& keyCombo);

    // BGR image of the window's client area
    cv::Mat captureScreenshot(const std::string& application);

    /**
     * @brief Capture the window and store it as evidence
     * @return Path of the PNG file, empty if it could not be written
     */
    std::string saveScreenshot(const std::string& application, const std::string& label = "");

    /**
     * @throws TimeoutError when the text is not readable before the policy runs out
     */
    void assertVisibleText(const std::string& application, const std::string& expected,
                           const std::optional<sync::WaitPolicy>& policy = std::nullopt,
                           const sync::CancellationToken* cancellation = nullptr);
    void assertImagePresent(const std::string& application, const std::string& templatePath,
                            const std::optional<sync::WaitPolicy>& policy = std::nullopt,
                            const sync::CancellationToken* cancellation = nullptr);
    // Waits for the image to disappear
    void assertImageAbsent(const std::string& application, const std::string& templatePath,
                           const std::optional<sync::WaitPolicy>& policy = std::nullopt,
                           const sync::CancellationToken* cancellation = nullptr);

    /**
     * @brief Wait until the client area stops changing
     *
     * Satisfied once consecutive captures have stayed at least
     * STABLE_SIMILARITY alike for stableFor. Sends no input.
     * @throws TimeoutError when the window keeps changing until the policy runs out
     */
    void waitForScreenStability(const std::string& application, std::chrono::milliseconds stableFor,
                                const std::optional<sync::WaitPolicy>& policy = std::nullopt,
                                const sync::CancellationToken* cancellation = nullptr);

    // One OCR pass over the client area, or over region (client coordinates) of it
    ocr::OcrResult readText(const std::string& application,
                            const std::optional<ocal::Rectangle>& region = std::nullopt);

    // The first OCR result containing expected; TimeoutError otherwise
    ocr::OcrResult waitForText(const std::string& application, const std::string& expected,
                               const std::optional<sync::WaitPolicy>& policy = std::nullopt,
                               const sync::CancellationToken* cancellation = nullptr);

    static constexpr double STABLE_SIMILARITY = 0.98;

    registry::ApplicationRegistry& registry() { return *m_registry; }
    evidence::EvidenceRecorder& recorder() { return *m_recorder; }
    const sync::WaitPolicy& defaultPolicy() const { return m_defaultPolicy; }

private:
    struct WindowCapture {
        cv::Mat image;
        ocal::Rectangle region;   // screen rectangle the image shows
        ocal::Point clientOffset; // client-area position of the image's top-left pixel
    };

    struct Observation {
        sync::WaitResult result;
        WindowCapture lastCapture;
    };

    using Check = std::function<sync::ProbeResult(const WindowCapture&)>;

    std::shared_ptr<registry::ApplicationRegistry> m_registry;
    std::shared_ptr<vision::TemplateCache> m_templates;
    std::shared_ptr<vision::ImageMatcher> m_matcher;
    std::shared_ptr<ocr::OcrEngine> m_ocr;
    std::shared_ptr<evidence::EvidenceRecorder> m_recorder;
    sync::WaitPolicy m_defaultPolicy;

    sync::WaitPolicy effectivePolicy(const std::optional<sync::WaitPolicy>& policy) const;
    WindowCapture captureWindow(const std::string& application);
    ocal::Point toScreen(const std::string& application, const ocal::Point& clientPoint);

    Observation observe(const std::string& application, const Check& check, const sync::WaitPolicy& policy,
                        const sync::CancellationToken* cancellation);
    std::string saveFailureEvidence(const std::string& application, const std::string& operation,
                                    const Observation& observation);
    void verify(const std::string& application, const std::string& operation,
                const std::string& description, const Check& check, const sync::WaitPolicy& policy,
                const sync::CancellationToken* cancellation);

    ocr::OcrResult awaitText(const std::string& application, const std::string& operation,
                             const std::string& expected, const sync::WaitPolicy& policy,
                             const sync::CancellationToken* cancellation);

    void clickPoint(const std::string& application, const ocal::Point& point,
                    ocal::MouseButton button, int count, const std::string& operation);
    void clickTemplate(const std::string& application, const std::string& templatePath,
                       const std::optional<sync::WaitPolicy>& policy,
                       const sync::CancellationToken* cancellation,
                       ocal::MouseButton button, int count, const std::string& operation);
    void sendClick(const std::string& application, const ocal::Point& screenPoint,
                   ocal::MouseButton button, int count, const std::string& operation);
};

} // namespace facade
} // namespace marionette

#endif // MARIONETTE_APPLICATION_FACADE_H
