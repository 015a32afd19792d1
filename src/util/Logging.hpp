#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace xdrtraj {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

class Logger {
  public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void log(LogLevel level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) {
            return;
        }
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm = *std::localtime(&time);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%F %T");
        std::clog << "[" << oss.str() << "][xdrtraj]" << levelToString(level) << ": " << msg << std::endl;
    }

  private:
    LogLevel level_{LogLevel::Info};
    mutable std::mutex mutex_;

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
            case LogLevel::Off:
                break;
        }
        return "[INFO ]";
    }
};

inline void logInfo(const std::string& msg) { Logger::instance().log(LogLevel::Info, msg); }
inline void logWarn(const std::string& msg) { Logger::instance().log(LogLevel::Warn, msg); }
inline void logError(const std::string& msg) { Logger::instance().log(LogLevel::Error, msg); }
inline void logDebug(const std::string& msg) { Logger::instance().log(LogLevel::Debug, msg); }

}  // namespace xdrtraj
