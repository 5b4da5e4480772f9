#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "spdlog/spdlog.h"

struct LogSettings {
    std::string consoleLevel = "info";
    std::string filePath;              // empty disables the rotating file sink
    std::size_t rotationSize = 1024 * 1024 * 5;
    std::size_t maxFiles = 3;
};

class SafeLogger {
    static std::shared_ptr<spdlog::logger> instance;
    static std::mutex mtx;

public:
    // Builds the logger once; later calls are ignored until reset().
    static void initialize(const LogSettings& settings = LogSettings());
    static void reset();

    static std::shared_ptr<spdlog::logger>& get() {
        if (!instance) initialize();
        return instance;
    }
};

#define VRLOG_TRACE(...)   SafeLogger::get()->trace(__VA_ARGS__)
#define VRLOG_DEBUG(...)   SafeLogger::get()->debug(__VA_ARGS__)
#define VRLOG_INFO(...)    SafeLogger::get()->info(__VA_ARGS__)
#define VRLOG_WARN(...)    SafeLogger::get()->warn(__VA_ARGS__)
#define VRLOG_ERROR(...)   SafeLogger::get()->error(__VA_ARGS__)
#define VRLOG_CRITICAL(...) SafeLogger::get()->critical(__VA_ARGS__)
