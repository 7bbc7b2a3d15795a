#pragma once
#include <functional>
#include <iostream>
#include <mutex>
#include <string>

namespace mtfcast {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

// Static logger shared by the engine, the stores and the CLI.
// A callback, when installed, receives every message at or above the minimum level.
class SimpleLogger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static void Log(const std::string& message) {
        Write(LogLevel::Info, message);
    }

    static void Debug(const std::string& message) { Write(LogLevel::Debug, message); }
    static void Info(const std::string& message) { Write(LogLevel::Info, message); }
    static void Warn(const std::string& message) { Write(LogLevel::Warn, message); }
    static void Error(const std::string& message) { Write(LogLevel::Error, message); }

    static void SetCallback(LogCallback cb) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(cb);
    }

    static void ClearCallback() {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = nullptr;
    }

    static void SetMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    static const char* LevelName(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warn: return "WARN";
            case LogLevel::Error: return "ERROR";
        }
        return "INFO";
    }

private:
    // The callback runs outside the lock so it may log itself.
    static void Write(LogLevel level, const std::string& message) {
        LogCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }
            callback = callback_;
        }
        if (callback) {
            callback(level, message);
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
        out << "[mtfcast] " << LevelName(level) << ": " << message << std::endl;
    }

    static inline LogCallback callback_ = nullptr;
    static inline LogLevel min_level_ = LogLevel::Info;
    static inline std::mutex mutex_;
};

} // namespace mtfcast
