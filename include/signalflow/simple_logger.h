#pragma once
#include <functional>
#include <mutex>
#include <string>

namespace signalflow {

enum class LogLevel {
    Info = 0,
    Warning = 1,
    Error = 2,
    Silent = 3
};

// Process-wide logger. Basket runs log from worker threads, so the sink is
// guarded by a mutex.
class SimpleLogger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static void Log(const std::string& message) {
        Write(LogLevel::Info, message);
    }

    static void Warn(const std::string& message) {
        Write(LogLevel::Warning, message);
    }

    static void Error(const std::string& message) {
        Write(LogLevel::Error, message);
    }

    static void SetCallback(LogCallback cb);
    static void ClearCallback();

    static void SetLevel(LogLevel level);
    static LogLevel GetLevel();

private:
    static void Write(LogLevel level, const std::string& message);

    static inline LogCallback callback_ = nullptr;
    static inline LogLevel level_ = LogLevel::Info;
    static inline std::mutex mutex_;
};

} // namespace signalflow
