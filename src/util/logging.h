// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

#ifndef ANTIQUITY_UTIL_LOGGING_H
#define ANTIQUITY_UTIL_LOGGING_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <memory>
#include <cstdint>

/**
 * Bitcoin Core-style logging system
 *
 * Features:
 * - Log categories (CONSENSUS, MINING, ENTROPY, etc.)
 * - Log levels (ERROR, WARN, INFO, DEBUG)
 * - Thread-safe logging
 * - File and console output
 * - Log rotation
 */

/**
 * Log categories
 */
enum class LogCategory : uint32_t {
    NONE = 0,
    CONSENSUS = (1 << 0),     // Block window, sealing, rewards
    MINING = (1 << 1),        // Proof submission
    VALIDATION = (1 << 2),    // Hardware sanity checks
    ENTROPY = (1 << 3),       // Anti-emulation and deep entropy scoring
    STORAGE = (1 << 4),       // Hardware binding store
    CONFIG = (1 << 5),        // Configuration loading
    ALL = 0xFFFFFFFF          // All categories
};

/**
 * Log levels
 * Note: Using LVL_ prefix to avoid conflicts with Windows ERROR macro
 */
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

/**
 * Logging configuration
 */
class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    // Enable/disable categories
    void EnableCategory(LogCategory category);
    void DisableCategory(LogCategory category);
    bool IsCategoryEnabled(LogCategory category) const;

    // Set log level
    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;

    // File logging
    void SetLogFile(const std::string& path);
    std::string GetLogFile() const;
    bool IsFileLoggingEnabled() const;

    // Console logging
    void SetConsoleLogging(bool enable);
    bool IsConsoleLoggingEnabled() const { return m_consoleLogging; }

    // Log rotation
    void SetMaxLogSize(size_t maxSize);
    size_t GetMaxLogSize() const;
    void SetMaxLogFiles(size_t maxFiles);
    size_t GetMaxLogFiles() const;

private:
    CLoggingConfig();
    ~CLoggingConfig() = default;

    std::atomic<uint32_t> m_enabledCategories{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> m_logLevel{LogLevel::LVL_INFO};
    std::string m_logFile;
    std::atomic<bool> m_consoleLogging{true};
    size_t m_maxLogSize{10 * 1024 * 1024};  // 10 MB default
    size_t m_maxLogFiles{10};
    mutable std::mutex m_configMutex;
};

/**
 * Main logging class
 */
class CLogger {
public:
    static CLogger& GetInstance();

    // Initialize logging system
    bool Initialize(const std::string& datadir);

    // Shutdown logging system
    void Shutdown();

    // Log a message
    void Log(LogCategory category, LogLevel level, const std::string& message);

    // Convenience methods (Bitcoin Core style)
    void LogPrint(LogCategory category, LogLevel level, const std::string& str);
    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...);

private:
    CLogger();
    ~CLogger();

    // Rotate log file if needed
    void RotateLogIfNeeded();

    // Write to file
    void WriteToFile(const std::string& message);

    // Write to console
    void WriteToConsole(LogLevel level, const std::string& message);

    // Format log message (not FormatMessage to avoid Windows API conflict)
    std::string FormatLogMsg(LogCategory category, LogLevel level, const std::string& message);

    std::unique_ptr<std::ofstream> m_logFile;
    std::string m_logPath;
    std::mutex m_logMutex;
    std::atomic<bool> m_initialized{false};
    size_t m_currentLogSize{0};
};

// Convenience macros (Bitcoin Core style)
// Note: Using LVL_ prefix internally to avoid Windows ERROR macro conflict
#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

// Category-specific macros (with format string)
#define LogPrintConsensus(level, format, ...) LogPrintf(CONSENSUS, level, format, ##__VA_ARGS__)
#define LogPrintMining(level, format, ...) LogPrintf(MINING, level, format, ##__VA_ARGS__)
#define LogPrintValidation(level, format, ...) LogPrintf(VALIDATION, level, format, ##__VA_ARGS__)
#define LogPrintEntropy(level, format, ...) LogPrintf(ENTROPY, level, format, ##__VA_ARGS__)
#define LogPrintStorage(level, format, ...) LogPrintf(STORAGE, level, format, ##__VA_ARGS__)
#define LogPrintConfig(level, format, ...) LogPrintf(CONFIG, level, format, ##__VA_ARGS__)

#endif // ANTIQUITY_UTIL_LOGGING_H
