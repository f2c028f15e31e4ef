#pragma once

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>

namespace harmonicflow {

enum class LogLevel : int { off = 0, warn = 1, info = 2, debug = 3, trace = 4 };

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Direct fprintf to stderr (or callback)
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Optional callback for host language log capture
    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    static long elapsedMs();

    static std::atomic<int> level_;
    static std::chrono::steady_clock::time_point startTime_;
    static LogCallback callback_;
    static void* callbackUserData_;
};

} // namespace harmonicflow

// --- Macros ---

#define HF_WARN(fmt, ...) \
    do { if (harmonicflow::Logger::getLevel() >= harmonicflow::LogLevel::warn) \
        harmonicflow::Logger::log(harmonicflow::LogLevel::warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define HF_INFO(fmt, ...) \
    do { if (harmonicflow::Logger::getLevel() >= harmonicflow::LogLevel::info) \
        harmonicflow::Logger::log(harmonicflow::LogLevel::info, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define HF_DEBUG(fmt, ...) \
    do { if (harmonicflow::Logger::getLevel() >= harmonicflow::LogLevel::debug) \
        harmonicflow::Logger::log(harmonicflow::LogLevel::debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define HF_TRACE(fmt, ...) \
    do { if (harmonicflow::Logger::getLevel() >= harmonicflow::LogLevel::trace) \
        harmonicflow::Logger::log(harmonicflow::LogLevel::trace, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)
