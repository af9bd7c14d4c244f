/**
 * Logger.h
 *
 * Process-wide diagnostic log.
 *
 * Lines go to the console (tagged "[WARNING] ...") and, when a log
 * directory is configured, to a dated file:
 *   <logDirectory>/unifiedscan_YYYYMMDD.log
 *   2026-01-31 14:02:11 [thread] [WARNING] FileScanner: message
 *
 * Logging never throws.
 */

#pragma once

#include <ctime>
#include <string>
#include <mutex>
#include <atomic>

namespace UnifiedScan {

    enum class LogLevel { TRACE, INFO, WARNING, FAILURE, CRITICAL };

    struct LoggerConfig {
        LogLevel minLevel = LogLevel::INFO;
        bool toConsole = true;
        std::wstring logDirectory;      // empty: console only
    };

    class Logger {
    public:
        static Logger& GetInstance();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void Configure(const LoggerConfig& config);
        LoggerConfig GetConfig() const;

        bool IsEnabled(LogLevel level) const;

        void Write(LogLevel level, const std::string& component, const std::string& message);
        void Write(LogLevel level, const std::string& component, const std::wstring& message);

        static const char* LevelTag(LogLevel level);
        static bool ParseLevel(const std::string& text, LogLevel& level);

    private:
        Logger() = default;
        ~Logger() = default;

        void WriteToFile(const std::string& line, const std::tm& localTime);

        mutable std::mutex m_mutex;
        LoggerConfig m_config;
        std::atomic<int> m_minLevel{ static_cast<int>(LogLevel::INFO) };
        bool m_fileErrorReported = false;
    };

    // Shorthands used across the engine
    void LogTrace(const std::string& component, const std::wstring& message);
    void LogInfo(const std::string& component, const std::wstring& message);
    void LogWarning(const std::string& component, const std::wstring& message);
    void LogError(const std::string& component, const std::wstring& message);

} // namespace UnifiedScan
