#ifndef MARIONETTE_STRUCTURED_LOGGER_H
#define MARIONETTE_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <atomic>
#include <unordered_map>
#include <thread>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>
#include "thread_safe_queue.h"

// LogLevel enum for structured logging
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,  // Avoids the Windows ERROR macro
    CRITICAL
};

namespace marionette {

/**
 * @brief One log record; context holds the structured fields
 *
 * application is the logical name of the automated application the record
 * is about, empty for engine-wide records.
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string application;
    std::string file;
    int line;
    std::thread::id thread_id;
    nlohmann::json context;

    std::chrono::nanoseconds duration;
    std::string operation_name;

    LogEntry() : level(LogLevel::INFO), line(0), duration(0) {}
};

std::string logLevelToString(LogLevel level);

/**
 * @brief Parse "debug", "info", "warning"/"warn", "error", "critical"
 * @return the parsed level, or fallback for unknown names
 */
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Writes INFO and below to stdout, ERROR and above to stderr
 */
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    std::mutex m_mutex;
};

/**
 * @brief File sink that rolls app.log -> app.1.log -> ... once max_file_size is reached
 */
class RotatingFileLogSink : public ILogSink {
public:
    struct Config {
        std::string base_path;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
    };

    RotatingFileLogSink(const Config& config, std::shared_ptr<ILogFormatter> formatter);
    ~RotatingFileLogSink();

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    Config m_config;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::unique_ptr<std::ofstream> m_file;
    std::mutex m_mutex;
    size_t m_current_size;

    void rotateIfNeeded();
    void openNewFile();
    std::string generateFileName(int index = 0) const;
};

/**
 * @brief In-memory sink, used by tests and by callers that want to inspect recent output
 */
class MemoryLogSink : public ILogSink {
public:
    explicit MemoryLogSink(size_t capacity = 1000);
    void write(const LogEntry& entry) override;
    void flush() override {}

    std::vector<LogEntry> entries() const;
    void clear();

private:
    size_t m_capacity;
    mutable std::mutex m_mutex;
    std::vector<LogEntry> m_entries;
};

/**
 * @brief Aggregated timings per operation name (image_match, ocr_extract_text, launch, ...)
 *
 * The engine copies toJson() into the evidence report.
 */
class PerformanceTracker {
public:
    struct Metrics {
        std::atomic<uint64_t> count{0};
        std::atomic<uint64_t> total_duration_ns{0};
        std::atomic<uint64_t> min_duration_ns{UINT64_MAX};
        std::atomic<uint64_t> max_duration_ns{0};
        std::atomic<uint64_t> errors{0};
    };

    struct MetricsSnapshot {
        uint64_t count = 0;
        uint64_t total_duration_ns = 0;
        uint64_t min_duration_ns = UINT64_MAX;
        uint64_t max_duration_ns = 0;
        uint64_t errors = 0;

        double getAverageDurationMs() const;
        nlohmann::json toJson() const;
    };

    void recordOperation(const std::string& operation,
                         std::chrono::nanoseconds duration,
                         bool success = true);

    MetricsSnapshot getMetrics(const std::string& operation) const;
    std::unordered_map<std::string, MetricsSnapshot> getAllMetrics() const;
    nlohmann::json toJson() const;
    void reset();

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<Metrics>> m_metrics;
};

/**
 * @brief RAII timer reporting to the logger's PerformanceTracker on destruction
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string m_operation_name;
    std::chrono::steady_clock::time_point m_start;
};

/**
 * @brief Process-wide structured logger
 *
 * In async mode records go through a bounded queue to one writer thread.
 * If the sinks cannot keep up the oldest queued records are discarded and
 * a warning with the count is written once the writer catches up.
 */
class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();
    void setAsyncLogging(bool async);
    // Timed operations slower than this are logged as WARNING
    void setSlowOperationThreshold(std::chrono::milliseconds threshold);

    void log(const LogEntry& entry);

    void logPerformance(const std::string& operation,
                        std::chrono::nanoseconds duration,
                        bool success = true);

    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);
        LogBuilder(LogBuilder&& other) noexcept;
        LogBuilder(const LogBuilder&) = delete;
        LogBuilder& operator=(const LogBuilder&) = delete;

        LogBuilder& message(const std::string& msg);
        LogBuilder& application(const std::string& logicalName);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& file(const char* file, int line);

        ~LogBuilder();  // Logs on destruction

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    PerformanceTracker& getPerformanceTracker() { return m_performance_tracker; }

    void shutdown();

    // Waits for queued records to reach the sinks, then flushes them
    void flush();

private:
    StructuredLogger();
    ~StructuredLogger();

    std::atomic<LogLevel> m_min_level;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    std::mutex m_config_mutex;
    std::chrono::milliseconds m_slow_threshold;

    static constexpr size_t ASYNC_QUEUE_CAPACITY = 10000;

    std::atomic<bool> m_async_enabled;
    ThreadSafeQueue<LogEntry> m_log_queue;
    std::thread m_logging_thread;
    std::atomic<bool> m_shutdown{false};

    PerformanceTracker m_performance_tracker;

    void asyncLoggingLoop();
    void processLogEntry(const LogEntry& entry);
    void reportDroppedEntries();
};

/**
 * @brief Logging section of the engine configuration
 */
struct LoggingSettings {
    LogLevel level = LogLevel::INFO;
    std::string file;            // empty: console only
    size_t maxFileSizeMb = 10;
    size_t maxFiles = 5;
    bool json = false;
    bool console = true;
    bool async = false;
    std::chrono::milliseconds slowOperationThreshold{1000};
};

// Replaces the logger's sinks according to settings
void configureLogging(const LoggingSettings& settings);

#define SLOG_DEBUG() marionette::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define SLOG_INFO() marionette::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define SLOG_WARNING() marionette::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define SLOG_ERROR() marionette::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define SLOG_CRITICAL() marionette::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

#define MARIONETTE_TIMER_CAT2(a, b) a##b
#define MARIONETTE_TIMER_CAT(a, b) MARIONETTE_TIMER_CAT2(a, b)
#define SCOPED_TIMER(operation) \
    marionette::ScopedTimer MARIONETTE_TIMER_CAT(_scoped_timer_, __LINE__)(operation)

} // namespace marionette

#endif // MARIONETTE_STRUCTURED_LOGGER_H
