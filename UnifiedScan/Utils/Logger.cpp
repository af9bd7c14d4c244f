/**
 * Logger.cpp - Console and daily file log
 */

#include "Logger.h"
#include "StringUtils.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace UnifiedScan {

    namespace {

        std::tm LocalTime(std::time_t t) {
            std::tm result{};
#ifdef _WIN32
            localtime_s(&result, &t);
#else
            localtime_r(&t, &result);
#endif
            return result;
        }

    } // namespace

    Logger& Logger::GetInstance() {
        static Logger instance;
        return instance;
    }

    void Logger::Configure(const LoggerConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        m_minLevel = static_cast<int>(config.minLevel);
        m_fileErrorReported = false;

        if (!m_config.logDirectory.empty()) {
            std::error_code ec;
            fs::create_directories(fs::path(m_config.logDirectory), ec);
        }
    }

    LoggerConfig Logger::GetConfig() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    bool Logger::IsEnabled(LogLevel level) const {
        return static_cast<int>(level) >= m_minLevel.load();
    }

    const char* Logger::LevelTag(LogLevel level) {
        switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::FAILURE:  return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    bool Logger::ParseLevel(const std::string& text, LogLevel& level) {
        std::string value = Utils::ToLower(Utils::Trim(text));
        if (value == "trace" || value == "debug") level = LogLevel::TRACE;
        else if (value == "info") level = LogLevel::INFO;
        else if (value == "warning" || value == "warn") level = LogLevel::WARNING;
        else if (value == "error") level = LogLevel::FAILURE;
        else if (value == "critical") level = LogLevel::CRITICAL;
        else return false;
        return true;
    }

    void Logger::Write(LogLevel level, const std::string& component, const std::wstring& message) {
        if (!IsEnabled(level)) return;
        Write(level, component, Utils::ToUtf8(message));
    }

    void Logger::Write(LogLevel level, const std::string& component, const std::string& message) {
        if (!IsEnabled(level)) return;

        auto now = std::chrono::system_clock::now();
        std::tm localTime = LocalTime(std::chrono::system_clock::to_time_t(now));

        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_config.toConsole) {
            std::cerr << "[" << LevelTag(level) << "] " << component << ": " << message << "\n";
        }

        if (!m_config.logDirectory.empty()) {
            std::ostringstream line;
            line << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S")
                << " [" << std::this_thread::get_id() << "]"
                << " [" << LevelTag(level) << "] "
                << component << ": " << message << "\n";
            WriteToFile(line.str(), localTime);
        }
    }

    void Logger::WriteToFile(const std::string& line, const std::tm& localTime) {
        std::ostringstream name;
        name << "unifiedscan_" << std::put_time(&localTime, "%Y%m%d") << ".log";
        fs::path filePath = fs::path(m_config.logDirectory) / name.str();

        std::ofstream file(filePath, std::ios::app);
        if (file.is_open()) {
            file << line;
            return;
        }

        if (!m_fileErrorReported) {
            m_fileErrorReported = true;
            std::cerr << "[WARNING] Logger: cannot open log file " << filePath.string() << "\n";
        }
    }

    void LogTrace(const std::string& component, const std::wstring& message) {
        Logger::GetInstance().Write(LogLevel::TRACE, component, message);
    }

    void LogInfo(const std::string& component, const std::wstring& message) {
        Logger::GetInstance().Write(LogLevel::INFO, component, message);
    }

    void LogWarning(const std::string& component, const std::wstring& message) {
        Logger::GetInstance().Write(LogLevel::WARNING, component, message);
    }

    void LogError(const std::string& component, const std::wstring& message) {
        Logger::GetInstance().Write(LogLevel::FAILURE, component, message);
    }

} // namespace UnifiedScan
