#pragma once

#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace ncf {

/**
 * @brief Log severities
 *
 * CRITICAL is the alert severity: every CRITICAL line is also handed to
 * the alert handler, if one is installed.
 */
enum class LogLevel {
    TRACE    = 0,
    DEBUG    = 1,
    INFO     = 2,
    WARN     = 3,
    ERROR    = 4,
    CRITICAL = 5,
    NONE     = 6
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Lines go to the console (ERROR and above on stderr) and optionally to an
 * append-mode file. The file is rotated to `<path>.1` once it passes the
 * configured size, and reopen() lets logrotate move it underneath us.
 */
class Logger {
public:
    using AlertHandler = std::function<void(const std::string& component,
                                            const std::string& msg)>;

    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    void setConsoleOutput(bool enabled);

    /// Open path for appending; false (and file output off) on failure.
    bool setFileOutput(const std::string& path);
    /// Close and reopen the current log file.
    bool reopen();
    /// Rotate once the file grows past bytes; 0 disables rotation.
    void setMaxFileBytes(uint64_t bytes);

    void setAlertHandler(AlertHandler handler);

    void log(LogLevel level, const std::string& component, const std::string& msg);

    static LogLevel levelFromString(const std::string& s);
    static const char* levelToString(LogLevel level);

private:
    Logger() = default;

    std::string formatMessage(LogLevel level, const std::string& component,
                              const std::string& msg) const;
    bool openLocked();
    void rotateLocked();

    LogLevel level_ = LogLevel::INFO;
    bool console_enabled_ = true;
    std::string file_path_;
    std::ofstream file_;
    uint64_t file_bytes_ = 0;
    uint64_t max_file_bytes_ = 0;
    AlertHandler alert_handler_;
    mutable std::mutex mtx_;
};

} // namespace ncf

// Message expressions are only evaluated when the level is enabled.
#define NCF_LOG_AT(level, component, msg) \
    do { \
        if (ncf::Logger::instance().enabled(level)) \
            ncf::Logger::instance().log(level, component, msg); \
    } while (0)

#define NCF_LOG_TRACE(component, msg)    NCF_LOG_AT(ncf::LogLevel::TRACE, component, msg)
#define NCF_LOG_DEBUG(component, msg)    NCF_LOG_AT(ncf::LogLevel::DEBUG, component, msg)
#define NCF_LOG_INFO(component, msg)     NCF_LOG_AT(ncf::LogLevel::INFO, component, msg)
#define NCF_LOG_WARN(component, msg)     NCF_LOG_AT(ncf::LogLevel::WARN, component, msg)
#define NCF_LOG_ERROR(component, msg)    NCF_LOG_AT(ncf::LogLevel::ERROR, component, msg)
#define NCF_LOG_CRITICAL(component, msg) NCF_LOG_AT(ncf::LogLevel::CRITICAL, component, msg)
