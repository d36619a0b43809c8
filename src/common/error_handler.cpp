#include "error_handler.h"
#include "structured_logger.h"
#include <algorithm>
#include <thread>

namespace marionette {

namespace {
    const size_t MAX_ERROR_HISTORY = 1000;
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::handleError(const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errorHistory.push_back(error);
        if (m_errorHistory.size() > MAX_ERROR_HISTORY) {
            m_errorHistory.erase(m_errorHistory.begin());
        }
    }
    logError(error);
}

void ErrorHandler::handleException(const std::exception& e, const std::string& context) {
    const auto* engineError = dynamic_cast<const MarionetteException*>(&e);
    if (engineError) {
        ErrorInfo info = engineError->getErrorInfo();
        if (info.context.empty()) {
            info.context = context;
        }
        handleError(info);
    } else {
        handleError(ErrorInfo(ErrorType::UNKNOWN_ERROR, ErrorSeverity::HIGH,
                              e.what(), "", context));
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    LogEntry entry;
    entry.timestamp = error.timestamp;
    entry.thread_id = std::this_thread::get_id();
    entry.message = "[" + errorTypeToString(error.type) + "] " + error.message;
    entry.context["error_type"] = errorTypeToString(error.type);
    entry.context["severity"] = errorSeverityToString(error.severity);
    if (!error.details.empty()) {
        entry.context["details"] = error.details;
    }
    if (!error.context.empty()) {
        entry.context["where"] = error.context;
    }

    switch (error.severity) {
        case ErrorSeverity::LOW: entry.level = LogLevel::DEBUG; break;
        case ErrorSeverity::MEDIUM: entry.level = LogLevel::WARNING; break;
        case ErrorSeverity::HIGH: entry.level = LogLevel::ERROR_LEVEL; break;
        case ErrorSeverity::CRITICAL: entry.level = LogLevel::CRITICAL; break;
    }

    StructuredLogger::getInstance().log(entry);
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t start = (m_errorHistory.size() > count) ? m_errorHistory.size() - count : 0;
    return std::vector<ErrorInfo>(m_errorHistory.begin() + static_cast<std::ptrdiff_t>(start),
                                  m_errorHistory.end());
}

size_t ErrorHandler::errorCount(ErrorType type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_errorHistory.begin(), m_errorHistory.end(),
        [type](const ErrorInfo& e) { return e.type == type; }));
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorHistory.clear();
}

std::string errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::NOT_FOUND_ERROR: return "NOT_FOUND";
        case ErrorType::LAUNCH_ERROR: return "LAUNCH";
        case ErrorType::REGISTRATION_ERROR: return "REGISTRATION";
        case ErrorType::TIMEOUT_ERROR: return "TIMEOUT";
        case ErrorType::WINDOW_OPERATION_ERROR: return "WINDOW_OPERATION";
        case ErrorType::IMAGE_MATCH_ERROR: return "IMAGE_MATCH";
        case ErrorType::OCR_ERROR: return "OCR";
        case ErrorType::CONFIGURATION_ERROR: return "CONFIGURATION";
        case ErrorType::OS_OPERATION_ERROR: return "OS_OPERATION";
        case ErrorType::UNKNOWN_ERROR: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

std::string errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

} // namespace marionette
