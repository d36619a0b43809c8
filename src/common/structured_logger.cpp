#include "structured_logger.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <exception>

#ifdef _WIN32
#include <windows.h>
#endif

namespace marionette {

namespace fs = std::filesystem;

namespace {
    std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t);
#else
        localtime_r(&time_t, &tm_buf);
#endif
        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    std::string threadIdToString(std::thread::id id) {
        std::stringstream ss;
        ss << id;
        return ss.str();
    }
}

std::string logLevelToString(::LogLevel level) {
    switch (level) {
        case ::LogLevel::DEBUG: return "DEBUG";
        case ::LogLevel::INFO: return "INFO";
        case ::LogLevel::WARNING: return "WARNING";
        case ::LogLevel::ERROR_LEVEL: return "ERROR";
        case ::LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

::LogLevel parseLogLevel(const std::string& name, ::LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug" || lower == "trace") return ::LogLevel::DEBUG;
    if (lower == "info") return ::LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return ::LogLevel::WARNING;
    if (lower == "error") return ::LogLevel::ERROR_LEVEL;
    if (lower == "critical" || lower == "fatal") return ::LogLevel::CRITICAL;
    return fallback;
}

// JsonLogFormatter
std::string JsonLogFormatter::format(const LogEntry& entry) {
    nlohmann::json log_json;

    log_json["timestamp"] = formatTimestamp(entry.timestamp);
    log_json["level"] = logLevelToString(entry.level);
    log_json["message"] = entry.message;
    log_json["thread"] = threadIdToString(entry.thread_id);

    if (!entry.application.empty()) {
        log_json["application"] = entry.application;
    }

    if (!entry.file.empty()) {
        log_json["source"]["file"] = fs::path(entry.file).filename().string();
        log_json["source"]["line"] = entry.line;
    }

    if (!entry.operation_name.empty()) {
        log_json["operation"] = entry.operation_name;
        log_json["duration_ms"] = entry.duration.count() / 1000000.0;
    }

    if (!entry.context.empty()) {
        log_json["context"] = entry.context;
    }

    return log_json.dump() + "\n";
}

// TextLogFormatter
std::string TextLogFormatter::format(const LogEntry& entry) {
    std::stringstream ss;

    ss << "[" << formatTimestamp(entry.timestamp) << "] ";
    ss << "[" << std::setw(8) << logLevelToString(entry.level) << "] ";

    std::string thread_str = threadIdToString(entry.thread_id);
    if (thread_str.length() > 6) {
        thread_str = thread_str.substr(thread_str.length() - 6);
    }
    ss << "[" << std::setw(6) << thread_str << "] ";

    if (!entry.application.empty()) {
        ss << "[" << entry.application << "] ";
    }

    ss << entry.message;

    if (!entry.file.empty() && (entry.level >= ::LogLevel::ERROR_LEVEL)) {
        fs::path file_path(entry.file);
        ss << " (" << file_path.filename().string() << ":" << entry.line << ")";
    }

    if (!entry.operation_name.empty()) {
        ss << " [" << entry.operation_name << ": "
           << std::fixed << std::setprecision(2)
           << (entry.duration.count() / 1000000.0) << "ms]";
    }

    if (!entry.context.empty()) {
        ss << " " << entry.context.dump();
    }

    ss << "\n";
    return ss.str();
}

// ConsoleLogSink
ConsoleLogSink::ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter)
    : m_formatter(std::move(formatter)) {}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string formatted = m_formatter->format(entry);

    if (entry.level >= ::LogLevel::ERROR_LEVEL) {
        #ifdef _WIN32
        HANDLE hConsole = GetStdHandle(STD_ERROR_HANDLE);
        SetConsoleTextAttribute(hConsole, FOREGROUND_RED | FOREGROUND_INTENSITY);
        #endif

        std::cerr << formatted;

        #ifdef _WIN32
        SetConsoleTextAttribute(hConsole, FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
        #endif
    } else {
        std::cout << formatted;
    }
}

void ConsoleLogSink::flush() {
    std::cout.flush();
    std::cerr.flush();
}

// RotatingFileLogSink
RotatingFileLogSink::RotatingFileLogSink(const Config& config,
                                         std::shared_ptr<ILogFormatter> formatter)
    : m_config(config), m_formatter(std::move(formatter)), m_current_size(0) {
    fs::path parent = fs::path(m_config.base_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }
    openNewFile();
}

RotatingFileLogSink::~RotatingFileLogSink() {
    if (m_file && m_file->is_open()) {
        m_file->close();
    }
}

void RotatingFileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_file || !m_file->is_open()) {
        openNewFile();
    }

    std::string formatted = m_formatter->format(entry);
    *m_file << formatted;
    m_current_size += formatted.size();

    rotateIfNeeded();
}

void RotatingFileLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file && m_file->is_open()) {
        m_file->flush();
    }
}

void RotatingFileLogSink::rotateIfNeeded() {
    if (m_current_size < m_config.max_file_size) {
        return;
    }

    m_file->close();

    std::error_code ec;
    const int keep = static_cast<int>(m_config.max_files);
    for (int i = keep - 1; i >= 1; --i) {
        std::string old_name = generateFileName(i);
        if (!fs::exists(old_name, ec)) {
            continue;
        }
        if (i == keep - 1) {
            fs::remove(old_name, ec);  // oldest
        } else {
            fs::rename(old_name, generateFileName(i + 1), ec);
        }
    }

    if (keep > 1) {
        fs::rename(m_config.base_path, generateFileName(1), ec);
    } else {
        fs::remove(m_config.base_path, ec);
    }

    openNewFile();
}

void RotatingFileLogSink::openNewFile() {
    m_file = std::make_unique<std::ofstream>(m_config.base_path, std::ios::app);
    std::error_code ec;
    auto size = fs::file_size(m_config.base_path, ec);
    m_current_size = ec ? 0 : static_cast<size_t>(size);
}

std::string RotatingFileLogSink::generateFileName(int index) const {
    if (index == 0) {
        return m_config.base_path;
    }

    fs::path p(m_config.base_path);
    std::string stem = p.stem().string();
    std::string ext = p.extension().string();

    return (p.parent_path() / (stem + "." + std::to_string(index) + ext)).string();
}

// MemoryLogSink
MemoryLogSink::MemoryLogSink(size_t capacity) : m_capacity(capacity) {}

void MemoryLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.size() >= m_capacity && !m_entries.empty()) {
        m_entries.erase(m_entries.begin());
    }
    m_entries.push_back(entry);
}

std::vector<LogEntry> MemoryLogSink::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

void MemoryLogSink::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

// PerformanceTracker
double PerformanceTracker::MetricsSnapshot::getAverageDurationMs() const {
    if (count == 0) return 0.0;
    return (total_duration_ns / count) / 1000000.0;
}

nlohmann::json PerformanceTracker::MetricsSnapshot::toJson() const {
    nlohmann::json j;
    j["count"] = count;
    j["errors"] = errors;
    j["average_ms"] = getAverageDurationMs();
    j["min_ms"] = count == 0 ? 0.0 : min_duration_ns / 1000000.0;
    j["max_ms"] = max_duration_ns / 1000000.0;
    j["total_ms"] = total_duration_ns / 1000000.0;
    return j;
}

void PerformanceTracker::recordOperation(const std::string& operation,
                                         std::chrono::nanoseconds duration,
                                         bool success) {
    Metrics* metrics = nullptr;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto& slot = m_metrics[operation];
        if (!slot) {
            slot = std::make_unique<Metrics>();
        }
        metrics = slot.get();
    }

    uint64_t dur = static_cast<uint64_t>(duration.count());
    metrics->count++;
    metrics->total_duration_ns += dur;

    uint64_t current_min = metrics->min_duration_ns.load();
    while (dur < current_min &&
           !metrics->min_duration_ns.compare_exchange_weak(current_min, dur)) {}

    uint64_t current_max = metrics->max_duration_ns.load();
    while (dur > current_max &&
           !metrics->max_duration_ns.compare_exchange_weak(current_max, dur)) {}

    if (!success) {
        metrics->errors++;
    }
}

PerformanceTracker::MetricsSnapshot PerformanceTracker::getMetrics(const std::string& operation) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    MetricsSnapshot result;
    auto it = m_metrics.find(operation);
    if (it != m_metrics.end() && it->second) {
        result.count = it->second->count.load();
        result.total_duration_ns = it->second->total_duration_ns.load();
        result.min_duration_ns = it->second->min_duration_ns.load();
        result.max_duration_ns = it->second->max_duration_ns.load();
        result.errors = it->second->errors.load();
    }
    return result;
}

std::unordered_map<std::string, PerformanceTracker::MetricsSnapshot>
PerformanceTracker::getAllMetrics() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::unordered_map<std::string, MetricsSnapshot> result;
    for (const auto& [op, metrics] : m_metrics) {
        if (!metrics) continue;
        MetricsSnapshot m;
        m.count = metrics->count.load();
        m.total_duration_ns = metrics->total_duration_ns.load();
        m.min_duration_ns = metrics->min_duration_ns.load();
        m.max_duration_ns = metrics->max_duration_ns.load();
        m.errors = metrics->errors.load();
        result[op] = m;
    }
    return result;
}

nlohmann::json PerformanceTracker::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [op, m] : getAllMetrics()) {
        j[op] = m.toJson();
    }
    return j;
}

void PerformanceTracker::reset() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_metrics.clear();
}

// ScopedTimer
ScopedTimer::ScopedTimer(const std::string& operation_name)
    : m_operation_name(operation_name)
    , m_start(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    if (m_operation_name.empty()) {
        return;
    }
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - m_start);
    // A timer running during stack unwinding counts as a failed operation
    bool success = std::uncaught_exceptions() == 0;
    StructuredLogger::getInstance().logPerformance(m_operation_name, duration, success);
}

// StructuredLogger
StructuredLogger& StructuredLogger::getInstance() {
    static StructuredLogger instance;
    return instance;
}

StructuredLogger::StructuredLogger()
    : m_min_level(::LogLevel::INFO)
    , m_slow_threshold(1000)
    , m_async_enabled(false)
    , m_log_queue(ASYNC_QUEUE_CAPACITY) {
    addSink(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>()));
}

StructuredLogger::~StructuredLogger() {
    shutdown();
}

void StructuredLogger::setLogLevel(::LogLevel level) {
    m_min_level = level;
}

::LogLevel StructuredLogger::getLogLevel() const {
    return m_min_level.load();
}

void StructuredLogger::addSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.erase(std::remove(m_sinks.begin(), m_sinks.end(), sink), m_sinks.end());
}

void StructuredLogger::clearSinks() {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
    m_sinks.clear();
}

void StructuredLogger::setSlowOperationThreshold(std::chrono::milliseconds threshold) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_slow_threshold = threshold;
}

void StructuredLogger::setAsyncLogging(bool async) {
    if (m_async_enabled == async) return;

    if (async) {
        m_log_queue.reopen();
        m_async_enabled = true;
        m_logging_thread = std::thread(&StructuredLogger::asyncLoggingLoop, this);
    } else {
        m_async_enabled = false;
        if (m_logging_thread.joinable()) {
            m_logging_thread.join();
        }
        // Records pushed while the writer was stopping
        std::vector<LogEntry> rest;
        m_log_queue.drain(rest, std::chrono::milliseconds(0));
        for (const auto& entry : rest) {
            processLogEntry(entry);
        }
        m_log_queue.markIdle();
    }
}

void StructuredLogger::log(const LogEntry& entry) {
    if (m_shutdown) return;
    if (entry.level < m_min_level.load()) return;

    if (m_async_enabled && m_log_queue.push(entry)) {
        return;
    }
    processLogEntry(entry);
}

void StructuredLogger::logPerformance(const std::string& operation,
                                      std::chrono::nanoseconds duration,
                                      bool success) {
    m_performance_tracker.recordOperation(operation, duration, success);

    std::chrono::milliseconds threshold;
    {
        std::lock_guard<std::mutex> lock(m_config_mutex);
        threshold = m_slow_threshold;
    }

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = duration > threshold ? ::LogLevel::WARNING : ::LogLevel::DEBUG;
    entry.message = duration > threshold ? "Slow operation" : "Operation timing";
    entry.operation_name = operation;
    entry.duration = duration;
    entry.thread_id = std::this_thread::get_id();
    if (!success) {
        entry.context["success"] = false;
    }

    log(entry);
}

void StructuredLogger::shutdown() {
    if (m_async_enabled) {
        m_log_queue.waitUntilDrained(std::chrono::seconds(2));
        m_async_enabled = false;
        m_log_queue.close();
        if (m_logging_thread.joinable()) {
            m_logging_thread.join();
        }
    }

    m_shutdown = true;

    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void StructuredLogger::flush() {
    if (m_async_enabled) {
        m_log_queue.waitUntilDrained(std::chrono::seconds(5));
    }

    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void StructuredLogger::asyncLoggingLoop() {
    std::vector<LogEntry> batch;
    while (m_log_queue.drain(batch, std::chrono::milliseconds(100))) {
        if (batch.empty()) {
            if (!m_async_enabled) break;
            continue;
        }

        reportDroppedEntries();
        {
            std::lock_guard<std::mutex> lock(m_config_mutex);
            for (const auto& entry : batch) {
                for (auto& sink : m_sinks) {
                    sink->write(entry);
                }
            }
        }
        batch.clear();
    }
    m_log_queue.markIdle();
}

void StructuredLogger::reportDroppedEntries() {
    size_t dropped = m_log_queue.takeDroppedCount();
    if (dropped == 0) {
        return;
    }

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = ::LogLevel::WARNING;
    entry.message = "Log records dropped, sinks could not keep up";
    entry.thread_id = std::this_thread::get_id();
    entry.context["dropped"] = dropped;
    processLogEntry(entry);
}

void StructuredLogger::processLogEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->write(entry);
    }
}

// LogBuilder
StructuredLogger::LogBuilder::LogBuilder(StructuredLogger* logger, ::LogLevel level)
    : m_logger(logger) {
    m_entry.level = level;
    m_entry.timestamp = std::chrono::system_clock::now();
    m_entry.thread_id = std::this_thread::get_id();
}

StructuredLogger::LogBuilder::LogBuilder(LogBuilder&& other) noexcept
    : m_logger(other.m_logger), m_entry(std::move(other.m_entry)) {
    other.m_logger = nullptr;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::message(const std::string& msg) {
    m_entry.message = msg;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::application(const std::string& logicalName) {
    m_entry.application = logicalName;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::context(const std::string& key, const nlohmann::json& value) {
    m_entry.context[key] = value;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::file(const char* file, int line) {
    m_entry.file = file;
    m_entry.line = line;
    return *this;
}

StructuredLogger::LogBuilder::~LogBuilder() {
    if (m_logger) {
        m_logger->log(m_entry);
    }
}

void configureLogging(const LoggingSettings& settings) {
    auto& logger = StructuredLogger::getInstance();
    logger.setLogLevel(settings.level);
    logger.setSlowOperationThreshold(settings.slowOperationThreshold);
    logger.clearSinks();

    std::shared_ptr<ILogFormatter> formatter;
    if (settings.json) {
        formatter = std::make_shared<JsonLogFormatter>();
    } else {
        formatter = std::make_shared<TextLogFormatter>();
    }

    if (settings.console) {
        logger.addSink(std::make_shared<ConsoleLogSink>(formatter));
    }

    if (!settings.file.empty()) {
        RotatingFileLogSink::Config config;
        config.base_path = settings.file;
        config.max_file_size = settings.maxFileSizeMb * 1024 * 1024;
        config.max_files = settings.maxFiles;
        logger.addSink(std::make_shared<RotatingFileLogSink>(config, formatter));
    }

    logger.setAsyncLogging(settings.async);
}

} // namespace marionette
