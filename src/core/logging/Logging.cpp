#include "core/logging/Logging.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tasker {
namespace core {
namespace logging {

namespace {
std::mutex registryMutex;
}

void initializeLogging(const config::LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(registryMutex);
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Консольный приёмник
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(config.level);
        consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(consoleSink);

        // Файловый приёмник
        if (config.logToFile) {
            std::filesystem::create_directories(config.directory);
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (std::filesystem::path(config.directory) / "tasker.log").string(),
                config.maxFileSize, config.maxFiles);
            fileSink->set_level(spdlog::level::debug);
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(fileSink);
        }

        auto logger = std::make_shared<spdlog::logger>("tasker", sinks.begin(), sinks.end());
        logger->set_level(config.level);

        // Логгеры компонентов пересоздаются поверх новых приёмников
        spdlog::drop_all();
        spdlog::set_default_logger(logger);
        spdlog::set_level(config.level);

        spdlog::info("Logging system initialized (level={}, file={})",
                     spdlog::level::to_string_view(config.level), config.logToFile);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    if (auto logger = spdlog::get(name)) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(registryMutex);
    if (auto logger = spdlog::get(name)) {
        return logger;
    }

    auto defaultLogger = spdlog::default_logger();
    const auto& sinks = defaultLogger->sinks();
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(defaultLogger->level());
    spdlog::register_logger(logger);
    return logger;
}

} // namespace logging
} // namespace core
} // namespace tasker
