#include "ncf_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ncf {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mtx_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return level_;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return level != LogLevel::NONE && level >= level_;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mtx_);
    console_enabled_ = enabled;
}

bool Logger::setFileOutput(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx_);
    file_path_ = path;
    return openLocked();
}

bool Logger::reopen() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (file_path_.empty()) return false;
    return openLocked();
}

void Logger::setMaxFileBytes(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mtx_);
    max_file_bytes_ = bytes;
}

void Logger::setAlertHandler(AlertHandler handler) {
    std::lock_guard<std::mutex> lock(mtx_);
    alert_handler_ = std::move(handler);
}

bool Logger::openLocked() {
    if (file_.is_open()) file_.close();
    file_bytes_ = 0;
    if (file_path_.empty()) return false;

    file_.open(file_path_, std::ios::app);
    if (!file_.is_open()) {
        file_path_.clear();
        return false;
    }
    file_.seekp(0, std::ios::end);
    auto pos = file_.tellp();
    if (pos > 0) file_bytes_ = static_cast<uint64_t>(pos);
    return true;
}

void Logger::rotateLocked() {
    file_.close();
    std::string old = file_path_ + ".1";
    std::remove(old.c_str());
    std::rename(file_path_.c_str(), old.c_str());
    openLocked();
}

void Logger::log(LogLevel level, const std::string& component, const std::string& msg) {
    AlertHandler alert;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level == LogLevel::NONE || level < level_) return;

        std::string line = formatMessage(level, component, msg);

        if (console_enabled_) {
            std::ostream& out = level >= LogLevel::ERROR ? std::cerr : std::cout;
            out << line << std::endl;
        }

        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
            file_bytes_ += line.size() + 1;
            if (max_file_bytes_ > 0 && file_bytes_ >= max_file_bytes_) {
                rotateLocked();
            }
        }

        if (level == LogLevel::CRITICAL) alert = alert_handler_;
    }
    // Handler runs unlocked so it may log itself.
    if (alert) alert(component, msg);
}

LogLevel Logger::levelFromString(const std::string& s) {
    if (s == "trace") return LogLevel::TRACE;
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "info")  return LogLevel::INFO;
    if (s == "warn" || s == "warning") return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    if (s == "critical" || s == "alert") return LogLevel::CRITICAL;
    if (s == "none")  return LogLevel::NONE;
    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO ";
        case LogLevel::WARN:     return "WARN ";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT ";
        default:                 return "?????";
    }
}

std::string Logger::formatMessage(LogLevel level, const std::string& component,
                                  const std::string& msg) const {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << " [" << levelToString(level) << "] [" << component << "] " << msg;
    return oss.str();
}

} // namespace ncf
