#include "signalflow/simple_logger.h"

#include <iostream>

namespace signalflow {

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR ";
        default:                return "";
    }
}

} // namespace

void SimpleLogger::SetCallback(LogCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(cb);
}

void SimpleLogger::ClearCallback() {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = nullptr;
}

void SimpleLogger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel SimpleLogger::GetLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void SimpleLogger::Write(LogLevel level, const std::string& message) {
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(level_)) {
            return;
        }
        if (!callback_) {
            auto& stream = (level == LogLevel::Info) ? std::cout : std::cerr;
            stream << "[signalflow] " << level_tag(level) << message << std::endl;
            return;
        }
        callback = callback_;
    }
    // Invoked unlocked so the callback may log or change the level.
    callback(level, message);
}

} // namespace signalflow
