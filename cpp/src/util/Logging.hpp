#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fcs {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline LogLevel parseLogLevel(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "debug") return LogLevel::Debug;
    if (value == "info") return LogLevel::Info;
    if (value == "warn" || value == "warning") return LogLevel::Warn;
    if (value == "error") return LogLevel::Error;
    throw std::runtime_error("Unsupported log level: " + value);
}

class Logger {
  public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    // Appends to `path` in addition to std::clog. An empty path or "-" closes the file sink.
    bool setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
        if (path.empty() || path == "-") {
            return true;
        }
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void log(LogLevel level, const std::string& msg) {
        if (level < level_) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm = *std::localtime(&time);
        std::ostringstream oss;
        oss << "[" << std::put_time(&tm, "%F %T") << "]" << levelToString(level) << ": " << msg;
        std::clog << oss.str() << std::endl;
        if (file_.is_open()) {
            file_ << oss.str() << '\n';
            file_.flush();
        }
    }

  private:
    LogLevel level_{LogLevel::Info};
    std::mutex mutex_;
    std::ofstream file_;

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:
                return "[DEBUG]";
            case LogLevel::Info:
                return "[INFO ]";
            case LogLevel::Warn:
                return "[WARN ]";
            case LogLevel::Error:
                return "[ERROR]";
        }
        return "[INFO ]";
    }
};

inline void logInfo(const std::string& msg) { Logger::instance().log(LogLevel::Info, msg); }
inline void logWarn(const std::string& msg) { Logger::instance().log(LogLevel::Warn, msg); }
inline void logError(const std::string& msg) { Logger::instance().log(LogLevel::Error, msg); }
inline void logDebug(const std::string& msg) { Logger::instance().log(LogLevel::Debug, msg); }

}  // namespace fcs
