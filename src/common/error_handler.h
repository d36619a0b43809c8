#ifndef MARIONETTE_ERROR_HANDLER_H
#define MARIONETTE_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <vector>
#include <chrono>
#include <mutex>

namespace marionette {

enum class ErrorType {
    NOT_FOUND_ERROR,
    LAUNCH_ERROR,
    REGISTRATION_ERROR,
    TIMEOUT_ERROR,
    WINDOW_OPERATION_ERROR,
    IMAGE_MATCH_ERROR,
    OCR_ERROR,
    CONFIGURATION_ERROR,
    OS_OPERATION_ERROR,
    UNKNOWN_ERROR
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : type(t), severity(s), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

std::string errorTypeToString(ErrorType type);
std::string errorSeverityToString(ErrorSeverity severity);

class MarionetteException : public std::exception {
public:
    explicit MarionetteException(const ErrorInfo& error) : m_errorInfo(error) {}

    const char* what() const noexcept override {
        return m_errorInfo.message.c_str();
    }

    const ErrorInfo& getErrorInfo() const { return m_errorInfo; }
    ErrorType type() const { return m_errorInfo.type; }

    /**
     * @brief Whether a wait loop must stop on this error instead of polling again.
     *
     * Only OS_OPERATION_ERROR (a transient OS hiccup) and TIMEOUT_ERROR from a
     * nested wait are retried.
     */
    bool isFatal() const {
        return m_errorInfo.type != ErrorType::OS_OPERATION_ERROR &&
               m_errorInfo.type != ErrorType::TIMEOUT_ERROR;
    }

private:
    ErrorInfo m_errorInfo;
};

// Unknown logical name, or the registered process has exited
class NotFoundError : public MarionetteException {
public:
    explicit NotFoundError(const std::string& message, const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::NOT_FOUND_ERROR, ErrorSeverity::HIGH,
                                        message, "", context)) {}
};

class LaunchError : public MarionetteException {
public:
    LaunchError(const std::string& message, const std::string& details = "",
                const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::LAUNCH_ERROR, ErrorSeverity::HIGH,
                                        message, details, context)) {}
};

class RegistrationError : public MarionetteException {
public:
    RegistrationError(const std::string& message, const std::string& details = "",
                      const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::REGISTRATION_ERROR, ErrorSeverity::HIGH,
                                        message, details, context)) {}
};

class WindowOperationError : public MarionetteException {
public:
    WindowOperationError(const std::string& message, const std::string& details = "",
                         const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::WINDOW_OPERATION_ERROR, ErrorSeverity::HIGH,
                                        message, details, context)) {}
};

class ImageMatchError : public MarionetteException {
public:
    ImageMatchError(const std::string& message, const std::string& details = "",
                    const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::IMAGE_MATCH_ERROR, ErrorSeverity::HIGH,
                                        message, details, context)) {}
};

class OcrError : public MarionetteException {
public:
    OcrError(const std::string& message, const std::string& details = "",
             const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::OCR_ERROR, ErrorSeverity::HIGH,
                                        message, details, context)) {}
};

class ConfigurationError : public MarionetteException {
public:
    ConfigurationError(const std::string& message, const std::string& details = "")
        : MarionetteException(ErrorInfo(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                                        message, details)) {}
};

// Transient OS failure; wait loops treat it as "not yet"
class OperationError : public MarionetteException {
public:
    OperationError(const std::string& message, const std::string& details = "",
                   const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::OS_OPERATION_ERROR, ErrorSeverity::MEDIUM,
                                        message, details, context)) {}
};

/**
 * @brief A bounded wait ran out of time.
 *
 * Carries the diagnostics of the wait so the caller can report what was last seen.
 */
class TimeoutError : public MarionetteException {
public:
    TimeoutError(const std::string& message,
                 int attempts,
                 std::chrono::milliseconds elapsed,
                 const std::string& lastObservedState = "",
                 const std::string& evidencePath = "",
                 const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::TIMEOUT_ERROR, ErrorSeverity::HIGH,
                                        message, lastObservedState, context)),
          m_attempts(attempts), m_elapsed(elapsed),
          m_lastObservedState(lastObservedState), m_evidencePath(evidencePath) {}

    int attempts() const { return m_attempts; }
    std::chrono::milliseconds elapsed() const { return m_elapsed; }
    const std::string& lastObservedState() const { return m_lastObservedState; }
    const std::string& evidencePath() const { return m_evidencePath; }

private:
    int m_attempts;
    std::chrono::milliseconds m_elapsed;
    std::string m_lastObservedState;
    std::string m_evidencePath;
};

/**
 * @brief Central error log: keeps a bounded history and reports through the structured logger
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void handleError(const ErrorInfo& error);
    void handleException(const std::exception& e, const std::string& context = "");

    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    size_t errorCount(ErrorType type) const;
    void clearErrorHistory();

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error);

    mutable std::mutex m_mutex;
    std::vector<ErrorInfo> m_errorHistory;
};

#define MARIONETTE_HANDLE_ERROR(type, severity, message, details, context) \
    marionette::ErrorHandler::getInstance().handleError( \
        marionette::ErrorInfo(type, severity, message, details, context))

// Records the exception and rethrows it unchanged
#define MARIONETTE_RECORD_AND_RETHROW(code, context) \
    try { \
        code; \
    } catch (const std::exception& e) { \
        marionette::ErrorHandler::getInstance().handleException(e, context); \
        throw; \
    }

} // namespace marionette

#endif // MARIONETTE_ERROR_HANDLER_H
