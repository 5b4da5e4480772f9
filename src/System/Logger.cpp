#include "System/Logger.hpp"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include <vector>

std::shared_ptr<spdlog::logger> SafeLogger::instance = nullptr;
std::mutex SafeLogger::mtx;

void SafeLogger::initialize(const LogSettings& settings) {
    std::lock_guard lock(mtx);
    if (instance) return;

    // stdout is reserved for command results
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(spdlog::level::from_str(settings.consoleLevel));

    std::vector<spdlog::sink_ptr> sinks{console};
    if (!settings.filePath.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            settings.filePath, settings.rotationSize, settings.maxFiles);
        file->set_level(spdlog::level::trace);
        sinks.push_back(file);
    }

    instance = std::make_shared<spdlog::logger>("virtrecon", sinks.begin(), sinks.end());
    instance->set_level(spdlog::level::trace);
    instance->flush_on(spdlog::level::info);
    spdlog::set_default_logger(instance);
}

void SafeLogger::reset() {
    std::lock_guard lock(mtx);
    instance.reset();
}
